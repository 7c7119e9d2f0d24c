#include "FpmTransport.h"
#include "FpmLog.h"

static const char* const TAG = "fpm.uart";

FpmStreamTransport::FpmStreamTransport(Stream* serial) {
  _serial = serial;
}

FpmError FpmStreamTransport::write(const uint8_t* data, size_t size) {
  if (!_serial) {
    FPM_LOGE(TAG, "Serial not set");
    return FpmError::IoError;
  }
  size_t written = _serial->write(data, size);
  _serial->flush();
  if (written != size) {
    FPM_LOGE(TAG, "Short write: %u of %u bytes", (unsigned)written, (unsigned)size);
    return FpmError::IoError;
  }
  return FpmError::None;
}

// One byte, or -1 once millis() passes the deadline.
int16_t FpmStreamTransport::_readByte(uint32_t deadline) {
  while (!_serial->available()) {
    if ((int32_t)(millis() - deadline) >= 0) {
      return -1;
    }
    yield();
  }
  return _serial->read();
}

FpmError FpmStreamTransport::readExact(uint8_t* data, size_t size, uint32_t timeoutMs) {
  if (!_serial) {
    FPM_LOGE(TAG, "Serial not set");
    return FpmError::IoError;
  }
  uint32_t deadline = millis() + timeoutMs;
  for (size_t i = 0; i < size; i++) {
    int16_t b = _readByte(deadline);
    if (b < 0) {
      FPM_LOGD(TAG, "Timeout after %u of %u bytes", (unsigned)i, (unsigned)size);
      return FpmError::Timeout;
    }
    data[i] = (uint8_t)b;
  }
  return FpmError::None;
}

void FpmStreamTransport::discardInput() {
  if (!_serial) {
    return;
  }
  size_t dropped = 0;
  while (_serial->available()) {
    _serial->read();
    dropped++;
  }
  if (dropped > 0) {
    FPM_LOGD(TAG, "Discarded %u stale bytes", (unsigned)dropped);
  }
}
