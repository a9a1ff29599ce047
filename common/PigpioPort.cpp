#include "PigpioPort.hpp"

#include <pigpio.h>
#include <syslog.h>

PigpioPort::~PigpioPort() {
    terminate();
}

int PigpioPort::initialise() {
    int version = gpioInitialise();
    if (version < 0) {
        syslog(LOG_ERR, "pigpio initialisation failed (%d)", version);
        return version;
    }
    initialised_ = true;
    syslog(LOG_INFO, "pigpio %d initialised", version);
    return version;
}

void PigpioPort::terminate() {
    if (!initialised_) return;
    gpioTerminate();
    initialised_ = false;
    syslog(LOG_INFO, "pigpio terminated");
}

int PigpioPort::setMode(unsigned pin, PinMode mode) {
    return gpioSetMode(pin, mode == PinMode::Output ? PI_OUTPUT : PI_INPUT);
}

int PigpioPort::read(unsigned pin) {
    return gpioRead(pin);
}

int PigpioPort::write(unsigned pin, bool level) {
    return gpioWrite(pin, level ? PI_HIGH : PI_LOW);
}

uint32_t PigpioPort::tick() {
    return gpioTick();
}

void PigpioPort::delayMicros(uint32_t us) {
    gpioDelay(us);
}
