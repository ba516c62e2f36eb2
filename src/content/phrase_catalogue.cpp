/**
 * @file phrase_catalogue.cpp
 * @brief Catalogue validation and JSON loading
 */

#include "phrase_catalogue.h"
#include "../debug/log_system.h"

#include <ArduinoJson.h>
#include <fstream>
#include <set>
#include <sstream>
#include <utility>

static const char* TAG = "CATALOGUE";

static bool isBlank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n\v\f") == std::string::npos;
}

static void setError(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
}

PhraseCatalogue::PhraseCatalogue(std::vector<Category> categories)
    : _categories(std::move(categories)) {}

size_t PhraseCatalogue::totalPhraseCount() const {
    size_t total = 0;
    for (const Category& category : _categories) {
        total += category.phrases.size();
    }
    return total;
}

bool PhraseCatalogue::build(std::vector<Category> categories, PhraseCatalogue* out, std::string* error) {
    if (categories.empty()) {
        setError(error, "catalogue has no categories");
        return false;
    }

    std::set<std::string> names;
    for (size_t i = 0; i < categories.size(); i++) {
        const Category& category = categories[i];
        if (isBlank(category.name)) {
            setError(error, "category #" + std::to_string(i + 1) + " has no name");
            return false;
        }
        if (!names.insert(category.name).second) {
            setError(error, "duplicate category '" + category.name + "'");
            return false;
        }
        if (category.phrases.empty()) {
            setError(error, "category '" + category.name + "' has no phrases");
            return false;
        }
        for (size_t p = 0; p < category.phrases.size(); p++) {
            if (isBlank(category.phrases[p])) {
                setError(error, "category '" + category.name + "' phrase #" +
                                std::to_string(p + 1) + " is blank");
                return false;
            }
        }
    }

    if (out) {
        *out = PhraseCatalogue(std::move(categories));
    }
    return true;
}

bool PhraseCatalogue::loadFromJson(const std::string& json, PhraseCatalogue* out, std::string* error) {
    JsonDocument doc;
    DeserializationError parse_error = deserializeJson(doc, json);
    if (parse_error) {
        setError(error, std::string("invalid catalogue JSON: ") + parse_error.c_str());
        return false;
    }

    JsonArrayConst list = doc["categories"].as<JsonArrayConst>();
    if (list.isNull()) {
        setError(error, "catalogue JSON has no \"categories\" array");
        return false;
    }

    std::vector<Category> categories;
    for (JsonVariantConst item : list) {
        if (!item.is<JsonObjectConst>()) {
            setError(error, "catalogue JSON has a category that is not an object");
            return false;
        }
        JsonObjectConst entry = item.as<JsonObjectConst>();
        Category category;
        if (entry["name"].is<const char*>()) {
            category.name = entry["name"].as<const char*>();
        }
        JsonArrayConst phrases = entry["phrases"].as<JsonArrayConst>();
        for (JsonVariantConst phrase : phrases) {
            if (!phrase.is<const char*>()) {
                setError(error, "category '" + category.name + "' has a non-string phrase");
                return false;
            }
            category.phrases.emplace_back(phrase.as<const char*>());
        }
        categories.push_back(std::move(category));
    }

    return build(std::move(categories), out, error);
}

bool PhraseCatalogue::loadFromFile(const std::string& path, PhraseCatalogue* out, std::string* error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        setError(error, "cannot open catalogue file " + path);
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    if (!loadFromJson(buffer.str(), out, error)) {
        return false;
    }
    MK_LOGI(TAG, "Loaded catalogue from %s", path.c_str());
    return true;
}
