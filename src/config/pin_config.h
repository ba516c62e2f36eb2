/**
 * @file pin_config.h
 * @brief Button GPIO defaults
 *
 * Line offsets are BCM numbers on the Raspberry Pi header, which is what
 * /dev/gpiochip0 exposes on every Pi model up to the 4 (the 5 exposes the
 * header on gpiochip4).
 *
 * Default wiring:
 *   GPIO17 (pin 11) - mode button, other leg to GND (pin 9)
 *   GPIO27 (pin 13) - weather button, other leg to GND (pin 14)
 */

#ifndef PIN_CONFIG_H
#define PIN_CONFIG_H

#define DEFAULT_GPIO_CHIP "/dev/gpiochip0"
#define DEFAULT_BUTTON_PIN 17
#define DEFAULT_WEATHER_PIN 27

// Valid BCM line range on the 40-pin header
#define MIN_GPIO_LINE 0
#define MAX_GPIO_LINE 27

#endif // PIN_CONFIG_H
