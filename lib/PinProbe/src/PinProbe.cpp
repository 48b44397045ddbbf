#include "PinProbe.h"

#include "ProbeLog.h"

static const uint32_t kHostWaitBlinkMs = 80;

std::atomic<bool> PinProbe::sLive(false);

PinProbe::PinProbe(Device &device, const CommandRegistry &registry)
    : device_(device), dispatcher_(registry) {}

PinProbe::~PinProbe() {
  if (started_) {
    probeLog().attach(nullptr);
    sLive.store(false);
  }
}

void PinProbe::begin() {
  if (started_) {
    probeFatal("PinProbe already started");
  }
  if (sLive.exchange(true)) {
    probeFatal("another PinProbe is already running");
  }
  started_ = true;
  probeLog().attach(&device_.transport());

  ProbeError err;
  if (!device_.begin(err)) {
    char msg[96];
    err.format(msg, sizeof(msg));
    probeFatal("device setup failed: %s", msg);
  }
}

void PinProbe::greet() {
  ByteTransport &out = device_.transport();
  Board &board = device_.board();
  out.println();
  out.println("========= PinProbe =========");
  out.printf("Timer: %.3fs, CPU: %u MHz\r\n", static_cast<double>(board.micros()) / 1000000.0,
             static_cast<unsigned>(board.cpuFreqMHz()));
  out.println("Type \"help\" for the command list");
  DigitalPin *led = device_.statusLed();
  if (led) {
    device_.writeOutput(*led, true);
  }
  PINPROBE_LOGI("host connected");
  greeted_ = true;
}

void PinProbe::reportError(const ProbeError &err) {
  char msg[96];
  err.format(msg, sizeof(msg));
  device_.transport().printf("Err: %s\r\n", msg);
  PINPROBE_LOGD("command failed (%s)", errorCodeName(err.code));
}

void PinProbe::update() {
  ByteTransport &out = device_.transport();
  if (!out.isConnected()) {
    greeted_ = false;
    DigitalPin *led = device_.statusLed();
    if (led) {
      device_.writeOutput(*led, !led->level);
    }
    device_.board().delayMs(kHostWaitBlinkMs);
    out.poll();
    return;
  }
  if (!greeted_) {
    greet();
  }

  out.printf("\r\n| Temp: %.1fC | Enter Command >>>\r\n", device_.board().chipTemperatureC());
  lineBuffer_.clear();
  size_t len = 0;
  ProbeError err;
  if (!out.readLineBlocking(lineBuffer_.receiveRegion(), lineBuffer_.available() - 1, &len,
                            err)) {
    reportError(err);
    return;
  }
  lineBuffer_.advance(len);
  lineBuffer_.addSingle('\0');
  runLine(static_cast<const char *>(static_cast<const void *>(lineBuffer_.data())));
  lineBuffer_.clear();
}

void PinProbe::runLine(const char *line) {
  ByteTransport &out = device_.transport();
  Board &board = device_.board();
  out.println(">> Received Command:");
  out.printf(">> '%s'\r\n", line);
  out.println();
  out.println("======== RUNNING =========");

  const uint32_t start = board.micros();
  out.clearInterrupt();
  ProbeError err;
  if (!dispatcher_.execute(line, device_, err)) {
    reportError(err);
  }
  out.disarmInterrupt();
  const uint32_t elapsedUs = board.micros() - start;

  out.printf("\r\n===== DONE in %.3fms =====\r\n", static_cast<double>(elapsedUs) / 1000.0);
  if (!out.flush(err)) {
    PINPROBE_LOGD("output not drained (%s)", errorCodeName(err.code));
  }
}
