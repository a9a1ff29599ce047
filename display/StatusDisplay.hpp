#ifndef STATUSDISPLAY_HPP
#define STATUSDISPLAY_HPP

#include <iostream>
#include <string>

// Framed console banners for the HDMI panel the Pi boots into.
void showStartup(std::ostream& out = std::cout);
void showShutdown(std::ostream& out = std::cout);
void showError(const std::string& code, const std::string& description,
               std::ostream& out = std::cout);

#endif // STATUSDISPLAY_HPP
