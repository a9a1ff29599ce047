#include "MonitorLoop.hpp"
#include "../Buzzer/buzzer.hpp"
#include "../HCSR04/hcsr04.hpp"
#include "../PIR/PIR.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <syslog.h>
#include <thread>
#include <time.h>

AlertStatus evaluateAlert(bool motion, float distanceCm, float thresholdCm) {
    if (motion) return AlertStatus::MotionDetected;
    if (distanceCm < thresholdCm) return AlertStatus::ObjectTooClose;
    return AlertStatus::Monitoring;
}

const char* statusMessage(AlertStatus status) {
    switch (status) {
    case AlertStatus::MotionDetected: return "Motion Detected!";
    case AlertStatus::ObjectTooClose: return "Object too close!";
    case AlertStatus::Monitoring:     break;
    }
    return "Monitoring...";
}

MonitorLoop::MonitorLoop(GpioPort& gpio, const PinMap& pins, const MonitorConfig& config,
                         std::ostream& out)
    : gpio_(gpio), pins_(pins), config_(config), out_(out) {}

bool MonitorLoop::readMotion() {
    return readPIR(gpio_, pins_.pir);
}

DistanceReading MonitorLoop::readDistance() {
    return measureDistance(gpio_, pins_.trig, pins_.echo, config_.echoTimeoutUs);
}

AlertStatus MonitorLoop::evaluateAndAct(bool motion, const DistanceReading& distance) {
    AlertStatus status = evaluateAlert(motion, distance.cm, config_.thresholdCm);
    bool alert = isAlert(status);

    if (!setBuzzer(gpio_, pins_.buzzer, alert))
        out_ << "[MONITOR] Buzzer could not be switched " << (alert ? "on" : "off") << "\n";

    if (alert != alerting_) {
        syslog(LOG_NOTICE, alert ? "ALERTING: %s" : "MONITORING (%s)", statusMessage(status));
        alerting_ = alert;
    }

    auto now = std::chrono::system_clock::now();
    std::time_t now_time = std::chrono::system_clock::to_time_t(now);
    out_ << "[" << std::put_time(std::localtime(&now_time), "%H:%M:%S") << "] "
         << (alert ? "[ALERT] " : "[OK] ") << statusMessage(status) << "\n";

    return status;
}

AlertStatus MonitorLoop::step() {
    timespec start{}, end{};
    clock_gettime(CLOCK_MONOTONIC, &start);

    bool motion = readMotion();
    DistanceReading distance = readDistance();
    AlertStatus status = evaluateAndAct(motion, distance);

    clock_gettime(CLOCK_MONOTONIC, &end);
    uint64_t exec_time = (end.tv_sec - start.tv_sec) * 1000000ULL +
                         (end.tv_nsec - start.tv_nsec) / 1000;
    stats_.update(exec_time);

    logCycle(motion, distance, status);
    cycles_++;
    return status;
}

void MonitorLoop::logCycle(bool motion, const DistanceReading& distance, AlertStatus status) {
    if (config_.logEvery <= 0 || cycles_ % static_cast<uint64_t>(config_.logEvery) != 0) return;

    std::ostringstream dist;
    if (distance.timedOut)
        dist << "out of range";
    else
        dist << std::fixed << std::setprecision(2) << distance.cm << "cm";

    out_ << "[CYCLE " << cycles_ << "] Motion=" << (motion ? "true" : "false")
         << " | Distance=" << dist.str()
         << " | Alert=" << (isAlert(status) ? "true" : "false") << "\n";

    out_ << "[WCET] Avg: " << stats_.average() << " us, Min: " << stats_.min_us
         << " us, Max: " << stats_.max_us << " us, Jitter: " << stats_.jitter() << " us\n";
}

void MonitorLoop::run(const std::atomic<bool>& stop) {
    syslog(LOG_INFO, "Monitor loop started (threshold %.1f cm)", config_.thresholdCm);

    while (!stop.load()) {
        step();
        if (stop.load()) break;
        std::this_thread::sleep_for(config_.interval);
    }

    silence();
    syslog(LOG_INFO, "Monitor loop stopped after %llu cycles",
           static_cast<unsigned long long>(cycles_));
}

void MonitorLoop::silence() {
    if (!setBuzzer(gpio_, pins_.buzzer, false))
        out_ << "[MONITOR] Buzzer could not be switched off\n";
    alerting_ = false;
}
