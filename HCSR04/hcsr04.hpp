#ifndef HCSR04_HPP
#define HCSR04_HPP

#include "../common/SensorData.hpp"

#include <cstdint>

class GpioPort;

bool setupHCSR04(GpioPort& gpio, unsigned trigPin, unsigned echoPin);

// Round-trip echo time to one-way distance.
float echoToCentimeters(uint32_t pulseUs);

// Fires a trigger pulse and times the echo. Each wait (rising edge, then
// falling edge) is bounded by timeoutUs; on expiry the reading is
// NO_OBJECT_DISTANCE_CM with timedOut set.
DistanceReading measureDistance(GpioPort& gpio, unsigned trigPin, unsigned echoPin,
                                uint32_t timeoutUs = ECHO_TIMEOUT_US);

#endif // HCSR04_HPP
