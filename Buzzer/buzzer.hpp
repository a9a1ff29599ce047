#ifndef BUZZER_HPP
#define BUZZER_HPP

class GpioPort;

bool setupBuzzer(GpioPort& gpio, unsigned pin);
bool setBuzzer(GpioPort& gpio, unsigned pin, bool on);

#endif // BUZZER_HPP
