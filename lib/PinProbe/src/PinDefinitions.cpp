#include "PinDefinitions.h"

// ESP32-S3-DevKitC-1. GPIO 19/20 carry USB, 26..37 the flash and PSRAM.
const PinDef kPinDefinitions[] = {
    {"USB_DM", 19, PinGroup::Reserved},
    {"USB_DP", 20, PinGroup::Reserved},

    // ADC1 channels
    {"ADC0", 1, PinGroup::Adc},
    {"ADC1", 3, PinGroup::Adc},
    {"ADC2", 4, PinGroup::Adc},
    {"ADC3", 5, PinGroup::Adc},

    // LEDC channels, two per timer
    {"PWM0_A", 6, PinGroup::Pwm},
    {"PWM0_B", 7, PinGroup::Pwm},
    {"PWM1_A", 15, PinGroup::Pwm},
    {"PWM1_B", 16, PinGroup::Pwm},
    {"PWM2_A", kPinNotAssigned, PinGroup::Pwm},
    {"PWM2_B", kPinNotAssigned, PinGroup::Pwm},

    {"I2C0_SDA", 8, PinGroup::I2c},
    {"I2C0_SCL", 9, PinGroup::I2c},

    {"SPI0_CS", 10, PinGroup::Spi},
    {"SPI0_MOSI", 11, PinGroup::Spi},
    {"SPI0_SCK", 12, PinGroup::Spi},
    {"SPI0_MISO", 13, PinGroup::Spi},

    {"UART1_TX", 17, PinGroup::Uart},
    {"UART1_RX", 18, PinGroup::Uart},

    {"BUTTON", 0, PinGroup::Inputs},
    {"IN_A", 14, PinGroup::Inputs},
    {"IN_B", 21, PinGroup::Inputs},

    {"LED", 2, PinGroup::Outputs},
    {"OUT_A", 38, PinGroup::Outputs},
    {"OUT_B", 39, PinGroup::Outputs},
    {"OUT_C", kPinNotAssigned, PinGroup::Outputs},

    {"C1_IN_A", 41, PinGroup::C1Inputs},
    {"C1_OUT_A", 40, PinGroup::C1Outputs},
    {"C1_LED", 47, PinGroup::C1Outputs},
};

const size_t kPinDefinitionCount = sizeof(kPinDefinitions) / sizeof(kPinDefinitions[0]);
