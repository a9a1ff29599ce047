#include "hcsr04.hpp"
#include "../common/GpioPort.hpp"

#include <iostream>

namespace {

// Polls (1us apart) until the echo line reaches `level`. Returns false on deadline or
// read fault; `edgeTick` receives the tick of the transition.
bool waitForLevel(GpioPort& gpio, unsigned pin, int level, uint32_t startTick,
                  uint32_t timeoutUs, uint32_t& edgeTick) {
    while (true) {
        int value = gpio.read(pin);
        uint32_t now = gpio.tick();
        if (value < 0) {
            std::cerr << "[HCSR04] Echo read failed (" << value << ")\n";
            return false;
        }
        if (value == level) {
            edgeTick = now;
            return true;
        }
        // unsigned subtraction survives tick wrap-around
        if (now - startTick >= timeoutUs) return false;
        gpio.delayMicros(1);
    }
}

} // namespace

bool setupHCSR04(GpioPort& gpio, unsigned trigPin, unsigned echoPin) {
    if (gpio.setMode(trigPin, PinMode::Output) < 0) return false;
    if (gpio.setMode(echoPin, PinMode::Input) < 0) return false;
    return gpio.write(trigPin, false) >= 0;
}

float echoToCentimeters(uint32_t pulseUs) {
    return pulseUs * SPEED_OF_SOUND_CM_US / 2.0f;
}

DistanceReading measureDistance(GpioPort& gpio, unsigned trigPin, unsigned echoPin,
                                uint32_t timeoutUs) {
    DistanceReading reading;

    // A pulse still in flight would be timed as this measurement's echo
    uint32_t idle = 0;
    if (!waitForLevel(gpio, echoPin, 0, gpio.tick(), timeoutUs, idle)) {
        std::cerr << "[HCSR04] Echo line busy, skipping measurement\n";
        return reading;
    }

    // 10us trigger pulse
    bool triggered = gpio.write(trigPin, false) >= 0;
    gpio.delayMicros(TRIG_SETTLE_US);
    triggered = triggered && gpio.write(trigPin, true) >= 0;
    gpio.delayMicros(TRIG_PULSE_US);
    triggered = gpio.write(trigPin, false) >= 0 && triggered;
    if (!triggered) {
        std::cerr << "[HCSR04] Trigger write failed on GPIO " << trigPin << "\n";
        return reading;
    }

    uint32_t rise = 0, fall = 0;
    if (!waitForLevel(gpio, echoPin, 1, gpio.tick(), timeoutUs, rise))
        return reading;
    if (!waitForLevel(gpio, echoPin, 0, rise, timeoutUs, fall))
        return reading;

    reading.cm = echoToCentimeters(fall - rise);
    reading.timedOut = false;
    return reading;
}
