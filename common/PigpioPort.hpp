#ifndef PIGPIOPORT_HPP
#define PIGPIOPORT_HPP

#include "GpioPort.hpp"

// GpioPort backed by pigpio. Owns the library session: initialise() wraps
// gpioInitialise() and the destructor calls gpioTerminate().
class PigpioPort : public GpioPort {
public:
    PigpioPort() = default;
    ~PigpioPort() override;

    PigpioPort(const PigpioPort&) = delete;
    PigpioPort& operator=(const PigpioPort&) = delete;

    // Returns the pigpio version, or a negative error code.
    int initialise();
    void terminate();

    int setMode(unsigned pin, PinMode mode) override;
    int read(unsigned pin) override;
    int write(unsigned pin, bool level) override;
    uint32_t tick() override;
    void delayMicros(uint32_t us) override;

private:
    bool initialised_ = false;
};

#endif // PIGPIOPORT_HPP
