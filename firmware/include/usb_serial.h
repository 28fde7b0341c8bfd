#pragma once
#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#include "sequencer.h"

// Line-based USB serial command handler for the LED sequencers
// Usage:
//   UsbCommandHandler usb;
//   usb.begin(115200);
//   Call usb.poll(leds, ledCount) inside loop()
//
// Commands (case-insensitive command word, JSON replies):
//   HELLO
//   STATUS
//   MORSE <led> <text...>
//   BLINK <led> <SHORT|MEDIUM|LONG|QUARTER>
//   STOP <led>
//   DEMO <ON|OFF>
class UsbCommandHandler {
public:
    // Initialize serial (adjust baud if needed)
    void begin(unsigned long baud = 115200);

    // Call periodically to process input and output responses
    void poll(Sequencer* const leds[], size_t ledCount);

    // Whether the automatic demo refill is enabled (DEMO ON/OFF)
    bool demoEnabled() const { return _demoEnabled; }

private:
    static constexpr size_t CMD_BUF_SIZE = 128;
    char _buf[CMD_BUF_SIZE];
    size_t _len = 0;
    bool _discarding = false;  // inside a line that overflowed _buf
    bool _demoEnabled = true;

    void handleLine(Sequencer* const leds[], size_t ledCount, const char* line);

    // commands
    void cmdHello();
    void cmdStatus(Sequencer* const leds[], size_t ledCount);
    void cmdMorse(Sequencer& seq, const char* text);
    void cmdBlink(Sequencer& seq, const char* name);
    void cmdStop(Sequencer& seq);
    void cmdDemo(const char* mode);

    // utils
    Sequencer* ledFromToken(Sequencer* const leds[], size_t ledCount, const char* tok);
    void printError(const char* msg);
};
