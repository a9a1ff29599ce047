#ifndef SENSORDATA_HPP
#define SENSORDATA_HPP

#include <cstdint>
#include <limits>

// BCM pin map (see README wiring table)
constexpr unsigned PIR_GPIO    = 17;
constexpr unsigned TRIG_GPIO   = 23;
constexpr unsigned ECHO_GPIO   = 24;
constexpr unsigned BUZZER_GPIO = 27;

// Thresholds and timing
constexpr float DISTANCE_THRESHOLD_CM = 30.0f;
constexpr int   LOOP_INTERVAL_MS      = 500;
constexpr int   CYCLE_LOG_EVERY       = 10;

// HC-SR04
constexpr uint32_t TRIG_SETTLE_US       = 2;
constexpr uint32_t TRIG_PULSE_US        = 10;
constexpr uint32_t ECHO_TIMEOUT_US      = 30000;   // ~5 m round trip
constexpr float    SPEED_OF_SOUND_CM_US = 0.0343f; // 343 m/s

// Returned when no echo arrives in time; compares >= any threshold
constexpr float NO_OBJECT_DISTANCE_CM = std::numeric_limits<float>::infinity();

struct DistanceReading {
    float cm = NO_OBJECT_DISTANCE_CM;
    bool timedOut = true;
};

#endif // SENSORDATA_HPP
