/**
 * @file config_macros.h
 * @brief Helper macros for ConfigManager getter/setter deduplication
 *
 * Each macro expands to one ConfigManager member definition backed by a
 * plain field.
 */

#ifndef CONFIG_MACROS_H
#define CONFIG_MACROS_H

/**
 * @brief String getter
 * @param method_name Public method name (e.g., SerialPort)
 * @param field Member holding the value (e.g., serial_port)
 */
#define CONFIG_STRING_GETTER(method_name, field) \
    std::string ConfigManager::get##method_name() const { \
        return field; \
    }

/**
 * @brief String setter
 */
#define CONFIG_STRING_SETTER(method_name, field) \
    void ConfigManager::set##method_name(const std::string& value) { \
        field = value; \
    }

/**
 * @brief Integer getter
 * @param method_name Public method name (e.g., Baud)
 * @param type Return type (e.g., int, unsigned long)
 * @param field Member holding the value
 */
#define CONFIG_INT_GETTER(method_name, type, field) \
    type ConfigManager::get##method_name() const { \
        return field; \
    }

/**
 * @brief Integer setter
 */
#define CONFIG_INT_SETTER(method_name, type, field) \
    void ConfigManager::set##method_name(type value) { \
        field = value; \
    }

/**
 * @brief Integer setter with a lower bound; smaller values are raised to it
 * @param min_value Smallest accepted value
 */
#define CONFIG_INT_SETTER_MIN(method_name, type, field, min_value) \
    void ConfigManager::set##method_name(type value) { \
        if (value < (min_value)) { \
            MK_LOGW(TAG, #method_name " %ld below minimum, using %ld", \
                    static_cast<long>(value), static_cast<long>(min_value)); \
            value = (min_value); \
        } \
        field = value; \
    }

/**
 * @brief Boolean getter
 */
#define CONFIG_BOOL_GETTER(method_name, field) \
    bool ConfigManager::get##method_name() const { \
        return field; \
    }

/**
 * @brief Boolean setter
 */
#define CONFIG_BOOL_SETTER(method_name, field) \
    void ConfigManager::set##method_name(bool value) { \
        field = value; \
    }

#endif // CONFIG_MACROS_H
