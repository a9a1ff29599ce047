#include "StatusDisplay.hpp"

namespace {

const std::string RULE(50, '=');

void header(std::ostream& out, const char* title) {
    out << RULE << "\n  " << title << "\n" << RULE << "\n\n";
}

} // namespace

void showStartup(std::ostream& out) {
    header(out, "HOME SENTRY - RASPBERRY PI");
    out << "STATUS: System starting\n\n"
        << "Initializing sensors and alert system...\n\n"
        << RULE << std::endl;
}

void showShutdown(std::ostream& out) {
    header(out, "HOME SENTRY - RASPBERRY PI");
    out << "STATUS: System stopped\n\n"
        << "Buzzer off, GPIO lines released.\n\n"
        << RULE << std::endl;
}

void showError(const std::string& code, const std::string& description, std::ostream& out) {
    header(out, "HOME SENTRY - ERROR");
    out << "ERROR CODE: " << code << "\n"
        << "DESCRIPTION: " << description << "\n\n"
        << "System will shut down. Please check connections.\n\n"
        << RULE << std::endl;
}
