#include "../common/HardwareContext.hpp"
#include "../display/StatusDisplay.hpp"
#include "FakeGpio.hpp"

#include <gtest/gtest.h>

#include <sstream>

TEST(HardwareContextTest, DefaultPinMapUsesWiringTable) {
    PinMap pins = defaultPinMap();
    EXPECT_EQ(pins.pir, 17u);
    EXPECT_EQ(pins.trig, 23u);
    EXPECT_EQ(pins.echo, 24u);
    EXPECT_EQ(pins.buzzer, 27u);
}

TEST(HardwareContextTest, AcquireConfiguresLines) {
    FakeGpio gpio;
    HardwareContext hardware(gpio, defaultPinMap());

    ASSERT_TRUE(hardware.acquire());
    EXPECT_TRUE(hardware.acquired());
    EXPECT_EQ(gpio.modes[PIR_GPIO], PinMode::Input);
    EXPECT_EQ(gpio.modes[TRIG_GPIO], PinMode::Output);
    EXPECT_EQ(gpio.modes[ECHO_GPIO], PinMode::Input);
    EXPECT_EQ(gpio.modes[BUZZER_GPIO], PinMode::Output);
    EXPECT_FALSE(gpio.outputs[TRIG_GPIO]);
    EXPECT_FALSE(gpio.buzzerOn());
}

TEST(HardwareContextTest, DestructorSilencesBuzzerAndReleasesLines) {
    FakeGpio gpio;
    {
        HardwareContext hardware(gpio, defaultPinMap());
        ASSERT_TRUE(hardware.acquire());
        gpio.write(BUZZER_GPIO, true);
        ASSERT_TRUE(gpio.buzzerOn());
    }
    EXPECT_FALSE(gpio.buzzerOn());
    for (unsigned pin : {PIR_GPIO, TRIG_GPIO, ECHO_GPIO, BUZZER_GPIO})
        EXPECT_EQ(gpio.modes[pin], PinMode::Input) << pin;
}

TEST(HardwareContextTest, ReleaseIsIdempotent) {
    FakeGpio gpio;
    HardwareContext hardware(gpio, defaultPinMap());
    ASSERT_TRUE(hardware.acquire());

    hardware.release();
    size_t writes = gpio.buzzerWrites.size();
    hardware.release();

    EXPECT_FALSE(hardware.acquired());
    EXPECT_EQ(gpio.buzzerWrites.size(), writes);
}

TEST(HardwareContextTest, BusyPinFailsAcquireAndResetsLines) {
    FakeGpio gpio;
    gpio.failingModePins.insert(BUZZER_GPIO);
    HardwareContext hardware(gpio, defaultPinMap());

    EXPECT_FALSE(hardware.acquire());
    EXPECT_FALSE(hardware.acquired());
    EXPECT_EQ(gpio.modes[TRIG_GPIO], PinMode::Input);
    EXPECT_FALSE(gpio.outputs[TRIG_GPIO]);
}

TEST(StatusDisplayTest, ErrorBannerCarriesCodeAndDescription) {
    std::ostringstream out;
    showError("GPIO_ERROR", "pin busy", out);
    EXPECT_NE(out.str().find("ERROR CODE: GPIO_ERROR"), std::string::npos);
    EXPECT_NE(out.str().find("DESCRIPTION: pin busy"), std::string::npos);
}

TEST(StatusDisplayTest, StartupAndShutdownBanners) {
    std::ostringstream out;
    showStartup(out);
    EXPECT_NE(out.str().find("STATUS: System starting"), std::string::npos);

    out.str("");
    showShutdown(out);
    EXPECT_NE(out.str().find("STATUS: System stopped"), std::string::npos);
}
