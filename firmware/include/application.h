#pragma once
// =====================================================
// Application Class
// =====================================================
// Owns the status LEDs, their sequencers and the USB
// command handler, and turns elapsed time into steps.
//
// LED 0 repeats SOS, LED 1 repeats "HELLO." until the
// host takes over with MORSE / BLINK / DEMO OFF.
//
// Usage:
//   Application app;
//   app.init();
//   while (true) { app.loop(); }
// =====================================================

#include <stdint.h>
#include <stddef.h>
#include "gpio_output_pin.h"
#include "sequencer.h"
#include "usb_serial.h"

class Application {
public:
    Application();

    // Initialize all components (call once at startup)
    void init();

    // Main loop iteration (call repeatedly)
    void loop();

    // =====================================================
    // Component Access (for testing/debugging)
    // =====================================================

    Sequencer& getSosSequencer() { return _sosSeq; }
    Sequencer& getMessageSequencer() { return _messageSeq; }

private:
    static constexpr size_t LED_COUNT = 2;
    static constexpr size_t SOS_QUEUE_LEN = 1;
    static constexpr size_t MESSAGE_QUEUE_LEN = 16;

    bool allIdle() const;
    void refillDemo(uint32_t nowMs);
    void stepAll();

    GpioOutputPin _led0Pin;
    GpioOutputPin _led1Pin;
    StaticSequencer<SOS_QUEUE_LEN> _sosSeq;
    StaticSequencer<MESSAGE_QUEUE_LEN> _messageSeq;
    Sequencer* const _leds[LED_COUNT];
    UsbCommandHandler _usb;

    uint32_t _lastStepMs;
    uint32_t _idleSinceMs;
    bool _pausing;
    bool _ledFault[LED_COUNT];
};
