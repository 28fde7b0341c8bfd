#pragma once
// =====================================================
// Output Pin Interface
// =====================================================
// A single on/off output (LED, relay, ...) driven by the
// Sequencer. Implementations report failures through the
// returned status; the Sequencer only tests it against
// PIN_OK and never looks at the value itself.
//
// Implementations:
// - GpioOutputPin: platform_gpio backed board pin
// - MockOutputPin: native unit tests
// =====================================================

#include <stdint.h>

// PIN_OK on success, otherwise a driver-defined error code
typedef int32_t PinStatus;

constexpr PinStatus PIN_OK = 0;
constexpr PinStatus PIN_ERR_NOT_CONFIGURED = -1;

struct IOutputPin {
    virtual ~IOutputPin() = default;

    // Drive the physical line high / low
    virtual PinStatus setHigh() = 0;
    virtual PinStatus setLow() = 0;
};
