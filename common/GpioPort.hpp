#ifndef GPIOPORT_HPP
#define GPIOPORT_HPP

#include <cstdint>

enum class PinMode { Input, Output };

// Minimal GPIO surface used by the sensors. Levels are 0/1; negative return
// values are library error codes (PI_BAD_GPIO etc. for pigpio).
class GpioPort {
public:
    virtual ~GpioPort() = default;

    virtual int setMode(unsigned pin, PinMode mode) = 0;
    virtual int read(unsigned pin) = 0;
    virtual int write(unsigned pin, bool level) = 0;

    // Microsecond tick, wraps every ~72 minutes
    virtual uint32_t tick() = 0;
    virtual void delayMicros(uint32_t us) = 0;
};

#endif // GPIOPORT_HPP
