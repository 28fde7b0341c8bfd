#include "gpio_output_pin.h"

GpioOutputPin::GpioOutputPin(uint32_t pin, platform_gpio_mode_t mode)
    : _pin(pin)
    , _mode(mode)
    , _initialized(false)
{
}

void GpioOutputPin::begin() {
    platform_gpio_pin_mode(_pin, _mode);
    _initialized = true;
}

PinStatus GpioOutputPin::setHigh() {
    return write(PLATFORM_GPIO_HIGH);
}

PinStatus GpioOutputPin::setLow() {
    return write(PLATFORM_GPIO_LOW);
}

PinStatus GpioOutputPin::write(platform_gpio_state_t state) {
    if (!_initialized) {
        return PIN_ERR_NOT_CONFIGURED;
    }
    platform_gpio_write(_pin, state);
    return PIN_OK;
}
