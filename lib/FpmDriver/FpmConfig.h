#ifndef FPM_CONFIG_H
#define FPM_CONFIG_H
#include <cstdint>
#include <cstddef>
#include "FpmStatus.h"

// Per-connection settings. Everything the driver needs to know about the
// sensor is carried here; nothing is read from globals.
struct FpmConfig {
  static const uint32_t DEFAULT_ADDRESS = 0xFFFFFFFF;
  static const uint32_t DEFAULT_PASSWORD = 0x00000000;
  static const uint32_t DEFAULT_BAUDRATE = 57600;
  static const uint16_t MAX_PAYLOAD = 256;
  static const uint32_t DEFAULT_TIMEOUT_MS = 1000;
  static const uint8_t MAX_SCANS = 6;

  FpmSensorModel model;
  uint32_t address;
  uint32_t password;
  uint32_t baudRate;
  uint16_t maxPayload;          // largest payload a single packet may carry
  uint32_t commandTimeoutMs;    // per read
  uint8_t requiredScans;        // impressions merged into one template
  uint16_t captureAttempts;     // GenImage tries while no finger is present
  bool liftBetweenScans;        // require NoFinger before the next impression
  uint16_t liftAttempts;
  uint16_t templateSize;        // upper bound for UpChar data
  uint32_t imageSize;           // upper bound for UpImage data

  FpmConfig()
    : model(FpmSensorModel::R30x),
      address(DEFAULT_ADDRESS),
      password(DEFAULT_PASSWORD),
      baudRate(DEFAULT_BAUDRATE),
      maxPayload(MAX_PAYLOAD),
      commandTimeoutMs(DEFAULT_TIMEOUT_MS),
      requiredScans(2),
      captureAttempts(50),
      liftBetweenScans(false),
      liftAttempts(50),
      templateSize(512),
      imageSize(36864) {}

  static FpmConfig forModel(FpmSensorModel model) {
    FpmConfig config;
    config.model = model;
    if (model == FpmSensorModel::R503) {
      config.requiredScans = 4;
      config.templateSize = 1536;
      config.imageSize = 192 * 192 / 2;
    }
    return config;
  }
};
#endif // FPM_CONFIG_H
