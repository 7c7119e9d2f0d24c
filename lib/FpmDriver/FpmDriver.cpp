#include "FpmDriver.h"
#include <Adafruit_Fingerprint.h>
#include <mbedtls/sha256.h>
#include <cstring>

static const char* const TAG = "fpm";

// SetSysPara register numbers
static const uint8_t REG_BAUD = 4;
static const uint8_t REG_SECURITY = 5;
static const uint8_t REG_PACKET_SIZE = 6;

static uint16_t readU16(const std::vector<uint8_t>& data, size_t offset) {
  return (uint16_t)((data[offset] << 8) | data[offset + 1]);
}

FpmDriver::FpmDriver(FpmTransport* transport, const FpmConfig& config)
  : _config(config),
    _protocol(transport, config, FpmStatusTable::forModel(config.model)),
    _registry(&_protocol),
    _initialized(false) {}

FpmDriver::FpmDriver(FpmTransport* transport, const FpmConfig& config,
                     const FpmStatusTable& statuses)
  : _config(config),
    _protocol(transport, config, statuses),
    _registry(&_protocol),
    _initialized(false) {}

void FpmDriver::_putU32(std::vector<uint8_t>& out, uint32_t value) {
  out.push_back((value >> 24) & 0xFF);
  out.push_back((value >> 16) & 0xFF);
  out.push_back((value >> 8) & 0xFF);
  out.push_back(value & 0xFF);
}

FpmInitError FpmDriver::begin() {
  FPM_LOGI(TAG, "Fingerprint sensor checking (%s, address 0x%08lX)...",
           fpmModelToString(_config.model), (unsigned long)_config.address);
  _initialized = false;

  FpmResult result = verifyPassword();
  if (!result.exchanged()) {
    FPM_LOGE(TAG, "Fingerprint sensor not detected: %s", fpmErrorToString(result.error));
    return FpmInitError::NoResponse;
  }
  if (!result.ok()) {
    FPM_LOGE(TAG, "Password rejected: %s", fpmOutcomeToString(result.outcome));
    return FpmInitError::WrongPassword;
  }

  FpmParameters parameters;
  result = readParameters(&parameters);
  if (!result.exchanged()) {
    FPM_LOGE(TAG, "Reading parameters failed: %s", fpmErrorToString(result.error));
    return FpmInitError::NoResponse;
  }
  if (!result.ok()) {
    FPM_LOGE(TAG, "Reading parameters failed: %s", fpmOutcomeToString(result.outcome));
    return FpmInitError::ParameterReadFailed;
  }

  _parameters = parameters;
  _registry.setCapacity(parameters.capacity);
  _protocol.setDataPacketSize(parameters.packetSize);
  _initialized = true;

  FPM_LOGI(TAG, "Fingerprint sensor detected!");
  FPM_LOGI(TAG, "Sys ID: 0x%04X", parameters.systemId);
  FPM_LOGI(TAG, "Capacity: %u", parameters.capacity);
  FPM_LOGI(TAG, "Security level: %u", parameters.securityLevel);
  FPM_LOGI(TAG, "Packet len: %u", parameters.packetSize);
  if (parameters.baudRate != _config.baudRate) {
    FPM_LOGW(TAG, "Sensor reports %lu baud, configured for %lu", (unsigned long)parameters.baudRate,
             (unsigned long)_config.baudRate);
  }
  return FpmInitError::None;
}

FpmResult FpmDriver::verifyPassword() {
  std::vector<uint8_t> params;
  _putU32(params, _config.password);
  return _protocol.execute(FpmCommand::VfyPwd, params);
}

FpmResult FpmDriver::readParameters(FpmParameters* parameters) {
  FpmCommandResult result = _protocol.execute(FpmCommand::ReadSysPara);
  if (!result.ok()) {
    return result;
  }
  const std::vector<uint8_t>& p = result.params;
  parameters->statusRegister = readU16(p, 0);
  parameters->systemId = readU16(p, 2);
  parameters->capacity = readU16(p, 4);
  parameters->securityLevel = readU16(p, 6);
  parameters->address = ((uint32_t)p[8] << 24) | ((uint32_t)p[9] << 16) | ((uint32_t)p[10] << 8) | p[11];
  uint16_t sizeCode = readU16(p, 12);
  parameters->packetSize = sizeCode <= 3 ? (uint16_t)(32 << sizeCode) : 0;
  parameters->baudRate = (uint32_t)readU16(p, 14) * 9600;
  return result;
}

FpmEnrollment FpmDriver::enrollment() {
  return FpmEnrollment(&_protocol, &_registry, _config);
}

FpmEnrollOutcome FpmDriver::enroll(int slot) {
  FpmEnrollOutcome outcome;
  if (!_initialized) {
    FPM_LOGE(TAG, "enroll: driver not initialized");
    outcome.slot = (uint16_t)slot;
    outcome.failure = FpmEnrollFailure::TransportFailure;
    outcome.last = FpmResult(FpmError::NotInitialized);
    return outcome;
  }
  FPM_LOGI(TAG, "---- Enrolling slot %d ----", slot);
  FpmEnrollment session = enrollment();
  if (session.start(slot)) {
    outcome = session.run();
  } else {
    outcome = session.outcome();
  }
  if (outcome.done) {
    FPM_LOGI(TAG, "Enrollment successful, slot %u", outcome.slot);
  } else {
    FPM_LOGW(TAG, "Enrollment failed: %s", fpmEnrollFailureToString(outcome.failure));
  }
  return outcome;
}

FpmResult FpmDriver::captureFeatures(uint8_t buffer) {
  if (!_initialized) {
    return FpmResult(FpmError::NotInitialized);
  }
  FpmResult result;
  uint16_t attempts = 0;
  while (true) {
    result = _protocol.execute(FpmCommand::GenImage);
    if (!result.exchanged() || result.outcome != FpmOutcome::NoFinger) {
      break;
    }
    if (++attempts >= _config.captureAttempts) {
      FPM_LOGW(TAG, "Timeout waiting for finger");
      return result;
    }
  }
  if (!result.ok()) {
    return result;
  }
  std::vector<uint8_t> params(1, buffer);
  return _protocol.execute(FpmCommand::GenChar, params);
}

FpmResult FpmDriver::matchFinger(FpmMatch* match) {
  *match = FpmMatch();
  FpmResult result = captureFeatures(CAPTURE_BUFFER);
  if (!result.ok()) {
    return result;
  }
  return _registry.search(CAPTURE_BUFFER, match);
}

FpmResult FpmDriver::deleteTemplate(int slot) {
  if (!_initialized) {
    return FpmResult(FpmError::NotInitialized);
  }
  return _registry.deleteOne(slot);
}

FpmResult FpmDriver::deleteAll() {
  if (!_initialized) {
    return FpmResult(FpmError::NotInitialized);
  }
  return _registry.deleteAll();
}

FpmResult FpmDriver::templateCount(uint16_t* count) {
  if (!_initialized) {
    return FpmResult(FpmError::NotInitialized);
  }
  return _registry.count(count);
}

FpmResult FpmDriver::compareBuffers(uint16_t* score) {
  if (!_initialized) {
    return FpmResult(FpmError::NotInitialized);
  }
  FpmCommandResult result = _protocol.execute(FpmCommand::Match);
  if (result.ok()) {
    *score = readU16(result.params, 0);
    FPM_LOGI(TAG, "Buffers match, score %u", *score);
  }
  return result;
}

FpmResult FpmDriver::matchTemplate(const std::vector<uint8_t>& stored, uint16_t* score) {
  FPM_LOGI(TAG, "---- Matching Fingerprint ----");
  FpmResult result = captureFeatures(CAPTURE_BUFFER);
  if (!result.ok()) {
    return result;
  }
  result = downloadTemplate(REFERENCE_BUFFER, stored);
  if (!result.ok()) {
    FPM_LOGW(TAG, "Failed to upload template");
    return result;
  }
  return compareBuffers(score);
}

FpmResult FpmDriver::loadTemplate(int slot, uint8_t buffer) {
  if (!_initialized) {
    return FpmResult(FpmError::NotInitialized);
  }
  return _registry.load(slot, buffer);
}

FpmResult FpmDriver::uploadTemplate(uint8_t buffer, std::vector<uint8_t>& templateData) {
  if (!_initialized) {
    return FpmResult(FpmError::NotInitialized);
  }
  std::vector<uint8_t> params(1, buffer);
  FpmCommandResult result = _protocol.execute(FpmCommand::UpChar, params);
  if (result.ok()) {
    templateData.swap(result.data);
    FPM_LOGD(TAG, "Template from buffer %u: %u bytes", buffer, (unsigned)templateData.size());
    FPM_LOG_HEX(FpmLogLevel::Debug, TAG, "first bytes", templateData.empty() ? nullptr : &templateData[0],
                templateData.size() < 32 ? templateData.size() : 32);
  }
  return result;
}

FpmResult FpmDriver::downloadTemplate(uint8_t buffer, const std::vector<uint8_t>& templateData) {
  if (!_initialized) {
    return FpmResult(FpmError::NotInitialized);
  }
  FPM_LOGD(TAG, "Uploading %u bytes to CharBuffer%u", (unsigned)templateData.size(), buffer);
  std::vector<uint8_t> params(1, buffer);
  return _protocol.executeUpload(FpmCommand::DownChar, params, templateData, _config.commandTimeoutMs);
}

FpmResult FpmDriver::uploadImage(std::vector<uint8_t>& image) {
  if (!_initialized) {
    return FpmResult(FpmError::NotInitialized);
  }
  FpmCommandResult result = _protocol.execute(FpmCommand::UpImage);
  if (result.ok()) {
    image.swap(result.data);
  }
  return result;
}

FpmResult FpmDriver::templateDigest(int slot, uint8_t hashOutput[HASH_SIZE]) {
  FpmResult result = loadTemplate(slot, CAPTURE_BUFFER);
  if (!result.ok()) {
    return result;
  }
  std::vector<uint8_t> templateData;
  result = uploadTemplate(CAPTURE_BUFFER, templateData);
  if (!result.ok()) {
    return result;
  }

  // Hash the template data using SHA-256
  mbedtls_sha256_context sha_ctx;
  mbedtls_sha256_init(&sha_ctx);
  mbedtls_sha256_starts_ret(&sha_ctx, 0); // 0 for SHA256
  mbedtls_sha256_update_ret(&sha_ctx, templateData.empty() ? nullptr : &templateData[0],
                            templateData.size());
  mbedtls_sha256_finish_ret(&sha_ctx, hashOutput);
  mbedtls_sha256_free(&sha_ctx);

  FPM_LOG_HEX(FpmLogLevel::Debug, TAG, "template SHA-256", hashOutput, HASH_SIZE);
  return result;
}

bool FpmDriver::digestEquals(const uint8_t hash1[HASH_SIZE], const uint8_t hash2[HASH_SIZE]) {
  return (memcmp(hash1, hash2, HASH_SIZE) == 0);
}

FpmResult FpmDriver::setPassword(uint32_t password) {
  if (!_initialized) {
    return FpmResult(FpmError::NotInitialized);
  }
  std::vector<uint8_t> params;
  _putU32(params, password);
  FpmResult result = _protocol.execute(FpmCommand::SetPwd, params);
  if (result.ok()) {
    _config.password = password;
  }
  return result;
}

FpmResult FpmDriver::setAddress(uint32_t address) {
  if (!_initialized) {
    return FpmResult(FpmError::NotInitialized);
  }
  std::vector<uint8_t> params;
  _putU32(params, address);
  // the sensor answers from its new address
  FpmResult result = _protocol.executeReplyingFrom(FpmCommand::SetAddr, params, address);
  if (result.ok()) {
    _config.address = address;
    _parameters.address = address;
    FPM_LOGI(TAG, "Device address now 0x%08lX", (unsigned long)address);
  }
  return result;
}

FpmResult FpmDriver::_setRegister(uint8_t reg, uint8_t value) {
  if (!_initialized) {
    return FpmResult(FpmError::NotInitialized);
  }
  std::vector<uint8_t> params;
  params.push_back(reg);
  params.push_back(value);
  return _protocol.execute(FpmCommand::SetSysPara, params);
}

FpmResult FpmDriver::setBaudRate(uint32_t baudRate) {
  if (baudRate % 9600 != 0 || baudRate / 9600 < 1 || baudRate / 9600 > 12) {
    FPM_LOGE(TAG, "Unsupported baud rate %lu", (unsigned long)baudRate);
    return FpmResult(FINGERPRINT_INVALIDREG, FpmOutcome::InvalidRegister);
  }
  FpmResult result = _setRegister(REG_BAUD, (uint8_t)(baudRate / 9600));
  if (result.ok()) {
    // the link must be reopened at the new rate by the caller
    _config.baudRate = baudRate;
    _parameters.baudRate = baudRate;
    FPM_LOGI(TAG, "Baud rate set to %lu", (unsigned long)baudRate);
  }
  return result;
}

FpmResult FpmDriver::setSecurityLevel(uint8_t level) {
  if (level < 1 || level > 5) {
    FPM_LOGE(TAG, "Unsupported security level %u", level);
    return FpmResult(FINGERPRINT_INVALIDREG, FpmOutcome::InvalidRegister);
  }
  FpmResult result = _setRegister(REG_SECURITY, level);
  if (result.ok()) {
    _parameters.securityLevel = level;
  }
  return result;
}

FpmResult FpmDriver::setPacketSize(uint16_t packetSize) {
  uint8_t code = 0;
  switch (packetSize) {
    case 32: code = 0; break;
    case 64: code = 1; break;
    case 128: code = 2; break;
    case 256: code = 3; break;
    default:
      FPM_LOGE(TAG, "Unsupported packet size %u", packetSize);
      return FpmResult(FINGERPRINT_INVALIDREG, FpmOutcome::InvalidRegister);
  }
  FpmResult result = _setRegister(REG_PACKET_SIZE, code);
  if (result.ok()) {
    _protocol.setDataPacketSize(packetSize);
    _parameters.packetSize = packetSize;
  }
  return result;
}

FpmResult FpmDriver::resync() {
  FPM_LOGD(TAG, "Resynchronising link");
  _protocol.discardInput();
  FpmParameters parameters;
  FpmResult result = readParameters(&parameters);
  if (result.ok() && _initialized) {
    _parameters = parameters;
  }
  return result;
}

const char* fpmInitErrorToString(FpmInitError error) {
  switch (error) {
    case FpmInitError::None: return "none";
    case FpmInitError::NoResponse: return "no response";
    case FpmInitError::WrongPassword: return "wrong password";
    case FpmInitError::ParameterReadFailed: return "parameter read failed";
  }
  return "unknown";
}
