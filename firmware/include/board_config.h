#pragma once
// =====================================================
// Board Configuration
// =====================================================
// Central location for pin definitions and sequencer
// timing. Override any value via build flags:
//   -DSTATUS_LED0_PIN=PA5 -DSEQUENCER_STEP_MS=125
// =====================================================

#include <stdint.h>

// For Arduino builds, include Arduino.h to get pin definitions (PA5, PA6, etc.)
#ifdef ARDUINO
#include <Arduino.h>
#endif

// =====================================================
// Status LED Pins
// =====================================================
// LED 0: SOS beacon
// LED 1: message channel (HELLO. by default, MORSE command)

#ifndef STATUS_LED0_PIN
#ifdef PA5
#define STATUS_LED0_PIN PA5   // Arduino: PA5 (D13)
#else
#define STATUS_LED0_PIN 13    // Generic: GPIO 13
#endif
#endif

#ifndef STATUS_LED1_PIN
#ifdef PA6
#define STATUS_LED1_PIN PA6   // Arduino: PA6 (D12)
#else
#define STATUS_LED1_PIN 12    // Generic: GPIO 12
#endif
#endif

// 1 when the LEDs are wired between VCC and the pin
#ifndef STATUS_LED_ACTIVE_LOW
#define STATUS_LED_ACTIVE_LOW 0
#endif

// =====================================================
// Sequencer Timing
// =====================================================

// Length of one pattern step (one Morse dot)
#ifndef SEQUENCER_STEP_MS
#define SEQUENCER_STEP_MS 250
#endif

// Pause before the demo messages repeat
#ifndef SEQUENCER_IDLE_PAUSE_MS
#define SEQUENCER_IDLE_PAUSE_MS 1000
#endif

// =====================================================
// USB Serial
// =====================================================

#ifndef USB_SERIAL_BAUD
#define USB_SERIAL_BAUD 115200
#endif
