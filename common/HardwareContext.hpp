#ifndef HARDWARECONTEXT_HPP
#define HARDWARECONTEXT_HPP

#include "GpioPort.hpp"

struct PinMap {
    unsigned pir;
    unsigned trig;
    unsigned echo;
    unsigned buzzer;
};

PinMap defaultPinMap();

// Owns the configuration of the four sensor/alarm lines for the lifetime of
// the monitor. Outputs are driven low and every line is returned to input
// mode on release(), which the destructor also runs.
class HardwareContext {
public:
    HardwareContext(GpioPort& port, const PinMap& pins);
    ~HardwareContext();

    HardwareContext(const HardwareContext&) = delete;
    HardwareContext& operator=(const HardwareContext&) = delete;

    bool acquire();
    void release();

    bool acquired() const { return acquired_; }
    GpioPort& port() { return port_; }
    const PinMap& pins() const { return pins_; }

private:
    bool fail(const char* name, unsigned pin);

    GpioPort& port_;
    PinMap pins_;
    bool acquired_ = false;
};

#endif // HARDWARECONTEXT_HPP
