#ifndef FPM_TRANSPORT_H
#define FPM_TRANSPORT_H
#include <Arduino.h>
#include <cstddef>
#include <cstdint>
#include "FpmStatus.h"

// Byte link to the sensor. Owned by the caller and lent to the driver; the
// driver never opens or closes it.
class FpmTransport {
  public:
    virtual ~FpmTransport() {}

    // Returns FpmError::None or FpmError::IoError.
    virtual FpmError write(const uint8_t* data, size_t size) = 0;
    // Fills exactly `size` bytes or fails with Timeout / IoError.
    virtual FpmError readExact(uint8_t* data, size_t size, uint32_t timeoutMs) = 0;
    // Drops anything already received but not yet read.
    virtual void discardInput() {}
};

// Transport over an Arduino Stream such as HardwareSerial. The stream must
// already be started at the sensor's baud rate.
class FpmStreamTransport : public FpmTransport {
  public:
    explicit FpmStreamTransport(Stream* serial);

    FpmError write(const uint8_t* data, size_t size) override;
    FpmError readExact(uint8_t* data, size_t size, uint32_t timeoutMs) override;
    void discardInput() override;
  private:
    Stream* _serial;
    int16_t _readByte(uint32_t deadline);
};
#endif // FPM_TRANSPORT_H
