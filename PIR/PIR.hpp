#ifndef PIR_HPP
#define PIR_HPP

class GpioPort;

bool setupPIR(GpioPort& gpio, unsigned pin);

// Instantaneous level of the PIR output. A failed read counts as no motion.
bool readPIR(GpioPort& gpio, unsigned pin);

#endif // PIR_HPP
