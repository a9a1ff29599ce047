#include <iostream>
#include <string>
#include <syslog.h>

#include "common/HardwareContext.hpp"
#include "common/PigpioPort.hpp"
#include "common/SensorData.hpp"
#include "common/Signals.hpp"
#include "display/StatusDisplay.hpp"
#include "monitor/MonitorLoop.hpp"

int main() {
    openlog("home_sentry", LOG_PID | LOG_CONS, LOG_USER);
    showStartup();

    PigpioPort gpio;
    int version = gpio.initialise();
    if (version < 0) {
        std::cerr << "pigpio initialization failed! (" << version << ")\n";
        showError("INIT_ERROR", "pigpio initialisation failed (" + std::to_string(version) +
                                "), run as root and check no other pigpio daemon is running");
        closelog();
        return 1;
    }

    // Replaces the handlers pigpio just installed
    if (!installSignalHandlers()) {
        showError("INIT_ERROR", "could not install signal handlers");
        closelog();
        return 1;
    }

    {
        HardwareContext hardware(gpio, defaultPinMap());
        if (!hardware.acquire()) {
            showError("GPIO_ERROR", "could not configure sensor/buzzer lines");
            gpio.terminate();
            closelog();
            return 1;
        }

        MonitorConfig config;
        std::cout << "[SYSTEM] Threshold " << config.thresholdCm << " cm, interval "
                  << config.interval.count() << " ms\n"
                  << "[SYSTEM] Press Ctrl+C to stop\n";

        MonitorLoop monitor(hardware.port(), hardware.pins(), config);
        monitor.run(terminateProgram);

        std::cout << "\n[SYSTEM] Termination requested after " << monitor.cycles()
                  << " cycles\n";
        hardware.release();
    }

    gpio.terminate();
    showShutdown();
    syslog(LOG_INFO, "Home sentry stopped");
    closelog();
    return 0;
}
