// Serial console examples:
//   help
//   pin alias=LED toggle
//   sample_adc channel=1 interval=500     (send '~' to stop)
//   set_pwm alias=PWM0_B freq=1000 duty=25
//   spi_xfer bytes="9f 00 00 00"

#include <Arduino.h>

#include "Core1Task.h"
#include "Esp32Board.h"
#include "Esp32Serial.h"
#include "Esp32Timers.h"
#include "PinDefinitions.h"
#include "PinProbe.h"
#include "ProbeCommands.h"

static Esp32UsbSerial gPort;
static FreeRtosLock gTransportLock;
static FreeRtosLock gQueueLock;
static Esp32SpinDelay gSpin;
static Esp32CountDown gCountDown;
static Esp32Board gBoard;

static ByteTransport gTransport(gPort, gTransportLock, gSpin);
static ResourceTable gPins(kPinDefinitions, kPinDefinitionCount);
static CoreQueue gCoreQueue(gQueueLock);
static Device gDevice(gBoard, gTransport, gPins, gCountDown, gCoreQueue);
static CommandRegistry gCommands;
static PinProbe gProbe(gDevice, gCommands);
static ServiceTicker gTicker(gTransport);
static Core1Task gCore1(gCoreQueue, gPins, gBoard);

static void serialFatal(const char *message) {
  Serial.printf("FATAL: %s\r\n", message);
  Serial.flush();
  delay(500);
}

void setup() {
  Serial.begin(PINPROBE_SERIAL_BAUD);
  setFatalHandler(serialFatal);

  registerBuiltinCommands(gCommands);
  gProbe.begin();
  if (!gTicker.start(kServicePeriodMs)) {
    probeFatal("service timer failed to start");
  }
  ProbeError err;
  if (!gCore1.start(err)) {
    char msg[96];
    err.format(msg, sizeof(msg));
    probeFatal("core 1: %s", msg);
  }
}

void loop() { gProbe.update(); }
