#pragma once
#include <stdint.h>
#include <stdbool.h>

#include "i_output_pin.h"
#include "platform_gpio.h"

// =====================================================
// GPIO Output Pin
// =====================================================
// IOutputPin on top of platform_gpio. The pin must be
// configured with begin() before it can be driven;
// until then every write fails with PIN_ERR_NOT_CONFIGURED.
// =====================================================

class GpioOutputPin : public IOutputPin {
public:
    explicit GpioOutputPin(uint32_t pin,
                           platform_gpio_mode_t mode = PLATFORM_GPIO_MODE_OUTPUT);

    // Configure the pin as output (call once at startup)
    void begin();

    PinStatus setHigh() override;
    PinStatus setLow() override;

    uint32_t pin() const { return _pin; }

private:
    PinStatus write(platform_gpio_state_t state);

    uint32_t _pin;
    platform_gpio_mode_t _mode;
    bool _initialized;
};
