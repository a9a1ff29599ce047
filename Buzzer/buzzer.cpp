#include "buzzer.hpp"
#include "../common/GpioPort.hpp"

#include <iostream>
#include <syslog.h>

bool setupBuzzer(GpioPort& gpio, unsigned pin) {
    if (gpio.setMode(pin, PinMode::Output) < 0) return false;
    return setBuzzer(gpio, pin, false);
}

bool setBuzzer(GpioPort& gpio, unsigned pin, bool on) {
    int ret = gpio.write(pin, on);
    if (ret < 0) {
        std::cerr << "[BUZZER] Write failed on GPIO " << pin << " (" << ret << ")\n";
        syslog(LOG_ERR, "Buzzer write failed on GPIO %u (%d)", pin, ret);
        return false;
    }
    return true;
}
