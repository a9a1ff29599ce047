#include "HardwareContext.hpp"
#include "SensorData.hpp"
#include "../Buzzer/buzzer.hpp"
#include "../HCSR04/hcsr04.hpp"
#include "../PIR/PIR.hpp"

#include <iostream>
#include <syslog.h>

PinMap defaultPinMap() {
    return PinMap{PIR_GPIO, TRIG_GPIO, ECHO_GPIO, BUZZER_GPIO};
}

HardwareContext::HardwareContext(GpioPort& port, const PinMap& pins)
    : port_(port), pins_(pins) {}

HardwareContext::~HardwareContext() {
    release();
}

bool HardwareContext::fail(const char* name, unsigned pin) {
    std::cerr << "[HW] Failed to configure " << name << " on GPIO " << pin << "\n";
    syslog(LOG_ERR, "Failed to configure %s on GPIO %u", name, pin);
    release();
    return false;
}

bool HardwareContext::acquire() {
    if (acquired_) return true;

    // Mark acquired up front so a partial setup is still reset by release()
    acquired_ = true;

    if (!setupPIR(port_, pins_.pir))
        return fail("PIR", pins_.pir);
    if (!setupHCSR04(port_, pins_.trig, pins_.echo))
        return fail("HC-SR04", pins_.trig);
    if (!setupBuzzer(port_, pins_.buzzer))
        return fail("buzzer", pins_.buzzer);

    std::cout << "[HW] PIR=" << pins_.pir << " TRIG=" << pins_.trig
              << " ECHO=" << pins_.echo << " BUZZER=" << pins_.buzzer << "\n";
    syslog(LOG_INFO, "GPIO lines configured");
    return true;
}

void HardwareContext::release() {
    if (!acquired_) return;
    acquired_ = false;

    // Outputs low first, then every line back to input (safe state)
    if (port_.write(pins_.buzzer, false) < 0)
        syslog(LOG_ERR, "Failed to switch buzzer off on release");
    if (port_.write(pins_.trig, false) < 0)
        syslog(LOG_ERR, "Failed to drive TRIG low on release");

    for (unsigned pin : {pins_.buzzer, pins_.trig, pins_.echo, pins_.pir}) {
        if (port_.setMode(pin, PinMode::Input) < 0)
            syslog(LOG_ERR, "Failed to return GPIO %u to input", pin);
    }

    std::cout << "[HW] GPIO lines released\n";
    syslog(LOG_INFO, "GPIO lines released");
}
