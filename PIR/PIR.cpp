#include "PIR.hpp"
#include "../common/GpioPort.hpp"

#include <iostream>
#include <syslog.h>

bool setupPIR(GpioPort& gpio, unsigned pin) {
    return gpio.setMode(pin, PinMode::Input) >= 0;
}

bool readPIR(GpioPort& gpio, unsigned pin) {
    int level = gpio.read(pin);
    if (level < 0) {
        std::cerr << "[PIR] Read failed on GPIO " << pin << " (" << level << ")\n";
        syslog(LOG_WARNING, "PIR read failed on GPIO %u (%d)", pin, level);
        return false;
    }
    return level != 0;
}
