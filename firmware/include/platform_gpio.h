#pragma once
#include <stdint.h>
#include <stdbool.h>

// =====================================================
// Platform GPIO Abstraction
// =====================================================
// Output-only GPIO access for pattern-driven pins, so the
// board layer can move between the Arduino core and
// STM32 HAL GPIO without touching the sequencer.
//
// Usage:
//   - Include this header instead of Arduino.h for GPIO
//   - Configure each pin once with platform_gpio_pin_mode()
//   - Drive it with platform_gpio_write()
// =====================================================

// Output drive modes
typedef enum {
    PLATFORM_GPIO_MODE_OUTPUT,
    PLATFORM_GPIO_MODE_OUTPUT_OD  // Open-drain output (relay drivers, sinking LEDs)
} platform_gpio_mode_t;

// GPIO pin states
typedef enum {
    PLATFORM_GPIO_LOW = 0,
    PLATFORM_GPIO_HIGH = 1
} platform_gpio_state_t;

// Configure a GPIO pin as output
// pin: Platform-specific pin identifier (e.g., PA5 for Arduino, GPIO_PIN_5 for HAL)
// mode: Push-pull or open-drain
void platform_gpio_pin_mode(uint32_t pin, platform_gpio_mode_t mode);

// Write GPIO pin state
// pin: Platform-specific pin identifier
// state: HIGH or LOW
void platform_gpio_write(uint32_t pin, platform_gpio_state_t state);
