#ifndef MONITORLOOP_HPP
#define MONITORLOOP_HPP

#include "../common/CycleStats.hpp"
#include "../common/HardwareContext.hpp"
#include "../common/SensorData.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>

class GpioPort;

enum class AlertStatus { Monitoring, MotionDetected, ObjectTooClose };

// alert = motion OR distance < threshold. Motion takes precedence in the
// reported status when both hold.
AlertStatus evaluateAlert(bool motion, float distanceCm, float thresholdCm);

inline bool isAlert(AlertStatus status) { return status != AlertStatus::Monitoring; }

const char* statusMessage(AlertStatus status);

struct MonitorConfig {
    float thresholdCm = DISTANCE_THRESHOLD_CM;
    std::chrono::milliseconds interval{LOOP_INTERVAL_MS};
    uint32_t echoTimeoutUs = ECHO_TIMEOUT_US;
    int logEvery = CYCLE_LOG_EVERY;
};

class MonitorLoop {
public:
    MonitorLoop(GpioPort& gpio, const PinMap& pins, const MonitorConfig& config,
                std::ostream& out = std::cout);

    bool readMotion();
    DistanceReading readDistance();

    // Drives the buzzer to match the alert state and prints the status line.
    AlertStatus evaluateAndAct(bool motion, const DistanceReading& distance);

    // One full cycle: sample both sensors, then evaluateAndAct().
    AlertStatus step();

    // Cycles until `stop` is set, then forces the buzzer off.
    void run(const std::atomic<bool>& stop);

    void silence();

    bool alerting() const { return alerting_; }
    uint64_t cycles() const { return cycles_; }
    const CycleStats& stats() const { return stats_; }

private:
    void logCycle(bool motion, const DistanceReading& distance, AlertStatus status);

    GpioPort& gpio_;
    const PinMap pins_;
    const MonitorConfig config_;
    std::ostream& out_;

    bool alerting_ = false;
    uint64_t cycles_ = 0;
    CycleStats stats_;
};

#endif // MONITORLOOP_HPP
