#include "application.h"
#include "board_config.h"
#include "fw_config.h"
#include "morse_text.h"
#include "patterns.h"
#include "platform_serial.h"
#include "platform_timing.h"

static const char DEMO_MESSAGE[] = "HELLO.";

Application::Application()
    : _led0Pin(STATUS_LED0_PIN)
    , _led1Pin(STATUS_LED1_PIN)
    , _sosSeq(_led0Pin, STATUS_LED_ACTIVE_LOW != 0)
    , _messageSeq(_led1Pin, STATUS_LED_ACTIVE_LOW != 0)
    , _leds{ &_sosSeq, &_messageSeq }
    , _lastStepMs(0)
    , _idleSinceMs(0)
    , _pausing(false)
    , _ledFault{ false, false }
{
}

void Application::init() {
    platform_timing_init();

    // The sequencers tried to park their pins before the pins
    // were configured; park them again now that they are
    _led0Pin.begin();
    _led1Pin.begin();
    _sosSeq.clear();
    _messageSeq.clear();

    _usb.begin(USB_SERIAL_BAUD);

    platform_serial_print("{\"event\":\"boot\",\"name\":\"");
    platform_serial_print(FW_NAME);
    platform_serial_print("\",\"fw\":\"");
    platform_serial_print(FW_VERSION_STRING);
    platform_serial_print("\",\"step_ms\":");
    platform_serial_print((uint32_t)SEQUENCER_STEP_MS);
    platform_serial_println("}");
    platform_serial_flush();

    _lastStepMs = platform_millis();
}

void Application::loop() {
    uint32_t nowMs = platform_millis();

    // Process USB commands
    _usb.poll(_leds, LED_COUNT);

    if (_usb.demoEnabled()) {
        refillDemo(nowMs);
    } else {
        _pausing = false;
    }

    if (nowMs - _lastStepMs >= SEQUENCER_STEP_MS) {
        _lastStepMs += SEQUENCER_STEP_MS;
        stepAll();
    }

    platform_delay_ms(1);
}

bool Application::allIdle() const {
    for (size_t i = 0; i < LED_COUNT; i++) {
        if (!_leds[i]->idle()) {
            return false;
        }
    }
    return true;
}

void Application::refillDemo(uint32_t nowMs) {
    if (!allIdle()) {
        _pausing = false;
        return;
    }

    if (!_pausing) {
        _pausing = true;
        _idleSinceMs = nowMs;
        return;
    }

    if (nowMs - _idleSinceMs < SEQUENCER_IDLE_PAUSE_MS) {
        return;
    }

    _pausing = false;
    _sosSeq.enqueue(patterns::morse::SOS);
    enqueueMorseText(_messageSeq, DEMO_MESSAGE);
}

void Application::stepAll() {
    for (size_t i = 0; i < LED_COUNT; i++) {
        PinStatus status = _leds[i]->tryStep();
        bool fault = (status != PIN_OK);

        // Report each fault once; the sequence keeps running regardless
        if (fault && !_ledFault[i]) {
            platform_serial_print("{\"event\":\"error\",\"msg\":\"led write failed\",\"led\":");
            platform_serial_print((uint32_t)i);
            platform_serial_print(",\"code\":");
            platform_serial_print((int)status);
            platform_serial_println("}");
            platform_serial_flush();
        }
        _ledFault[i] = fault;
    }
}
