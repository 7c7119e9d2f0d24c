#ifndef FPM_DRIVER_H
#define FPM_DRIVER_H
#include <cstddef>
#include <cstdint>
#include <vector>
#include "FpmCommand.h"
#include "FpmConfig.h"
#include "FpmEnroll.h"
#include "FpmLog.h"
#include "FpmPacket.h"
#include "FpmProtocol.h"
#include "FpmRegistry.h"
#include "FpmStatus.h"
#include "FpmTransport.h"

enum class FpmInitError : uint8_t {
  None = 0,
  NoResponse,
  WrongPassword,
  ParameterReadFailed
};

// System parameters as reported by ReadSysPara.
struct FpmParameters {
  uint16_t statusRegister;
  uint16_t systemId;
  uint16_t capacity;
  uint16_t securityLevel;
  uint32_t address;
  uint16_t packetSize;   // bytes per data packet
  uint32_t baudRate;     // bits per second

  FpmParameters()
    : statusRegister(0), systemId(0), capacity(0), securityLevel(0),
      address(0), packetSize(0), baudRate(0) {}
};

// Host-facing driver for one fingerprint module on one serial link.
class FpmDriver {
  public:
    static const uint16_t HASH_SIZE = 32; // SHA-256 digest size in bytes
    static const uint8_t CAPTURE_BUFFER = 1;
    static const uint8_t REFERENCE_BUFFER = 2;

    explicit FpmDriver(FpmTransport* transport, const FpmConfig& config = FpmConfig());
    FpmDriver(FpmTransport* transport, const FpmConfig& config, const FpmStatusTable& statuses);

    // Verifies the password and reads the system parameters. Must succeed
    // before any other operation except resync().
    FpmInitError begin();
    bool initialized() const { return _initialized; }
    const FpmParameters& parameters() const { return _parameters; }
    const FpmConfig& config() const { return _config; }

    FpmResult verifyPassword();
    FpmResult readParameters(FpmParameters* parameters);

    FpmEnrollOutcome enroll(int slot);
    // A fresh session for callers that want to drive enrollment step by step.
    FpmEnrollment enrollment();

    FpmResult matchFinger(FpmMatch* match);
    FpmResult deleteTemplate(int slot);
    FpmResult deleteAll();
    FpmResult templateCount(uint16_t* count);

    // GenImage until a finger is present (bounded by captureAttempts), then
    // GenChar into `buffer`.
    FpmResult captureFeatures(uint8_t buffer);
    FpmResult compareBuffers(uint16_t* score);
    // Captures the current finger and compares it against a template kept by the host.
    FpmResult matchTemplate(const std::vector<uint8_t>& stored, uint16_t* score);

    FpmResult loadTemplate(int slot, uint8_t buffer);
    FpmResult uploadTemplate(uint8_t buffer, std::vector<uint8_t>& templateData);
    FpmResult downloadTemplate(uint8_t buffer, const std::vector<uint8_t>& templateData);
    FpmResult uploadImage(std::vector<uint8_t>& image);

    FpmResult templateDigest(int slot, uint8_t hashOutput[HASH_SIZE]);
    static bool digestEquals(const uint8_t hash1[HASH_SIZE], const uint8_t hash2[HASH_SIZE]);

    FpmResult setPassword(uint32_t password);
    FpmResult setAddress(uint32_t address);
    FpmResult setBaudRate(uint32_t baudRate);
    FpmResult setSecurityLevel(uint8_t level);
    FpmResult setPacketSize(uint16_t packetSize);

    // Drops stale input and issues a status read, for use after an exchange
    // was abandoned.
    FpmResult resync();

    FpmTemplateRegistry& registry() { return _registry; }
    FpmProtocol& protocol() { return _protocol; }
  private:
    FpmConfig _config;
    FpmProtocol _protocol;
    FpmTemplateRegistry _registry;
    FpmParameters _parameters;
    bool _initialized;

    // _registry points into this object
    FpmDriver(const FpmDriver&);
    FpmDriver& operator=(const FpmDriver&);

    FpmResult _setRegister(uint8_t reg, uint8_t value);
    static void _putU32(std::vector<uint8_t>& out, uint32_t value);
};

const char* fpmInitErrorToString(FpmInitError error);
#endif // FPM_DRIVER_H
