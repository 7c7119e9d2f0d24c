#include "FpmPacket.h"
#include <Adafruit_Fingerprint.h>

FpmPacketCodec::FpmPacketCodec(uint32_t address, uint16_t maxPayload) {
  _address = address;
  _maxPayload = maxPayload;
}

uint16_t FpmPacketCodec::_readU16(const uint8_t* p) {
  return (uint16_t)((p[0] << 8) | p[1]);
}

uint16_t FpmPacketCodec::checksum(uint8_t kind, uint16_t length, const uint8_t* payload, size_t size) {
  uint16_t sum = kind;
  sum += (length >> 8) & 0xFF;
  sum += length & 0xFF;
  for (size_t i = 0; i < size; i++) {
    sum += payload[i];
  }
  return sum;
}

bool FpmPacketCodec::validKind(uint8_t kind) {
  return kind == FINGERPRINT_COMMANDPACKET || kind == FINGERPRINT_DATAPACKET ||
         kind == FINGERPRINT_ACKPACKET || kind == FINGERPRINT_ENDDATAPACKET;
}

FpmError FpmPacketCodec::encode(FpmPacketKind kind, const uint8_t* payload, size_t size,
                                std::vector<uint8_t>& out) const {
  if (size > _maxPayload || size + CHECKSUM_SIZE > 0xFFFF) {
    return FpmError::PayloadTooLarge;
  }
  uint16_t length = (uint16_t)(size + CHECKSUM_SIZE);
  uint8_t kindByte = static_cast<uint8_t>(kind);

  out.clear();
  out.reserve(HEADER_SIZE + size + CHECKSUM_SIZE);
  out.push_back((START_CODE >> 8) & 0xFF);
  out.push_back(START_CODE & 0xFF);
  out.push_back((_address >> 24) & 0xFF);
  out.push_back((_address >> 16) & 0xFF);
  out.push_back((_address >> 8) & 0xFF);
  out.push_back(_address & 0xFF);
  out.push_back(kindByte);
  out.push_back((length >> 8) & 0xFF);
  out.push_back(length & 0xFF);
  if (size > 0) {
    out.insert(out.end(), payload, payload + size);
  }
  uint16_t sum = checksum(kindByte, length, payload, size);
  out.push_back((sum >> 8) & 0xFF);
  out.push_back(sum & 0xFF);
  return FpmError::None;
}

FpmError FpmPacketCodec::encode(FpmPacketKind kind, const std::vector<uint8_t>& payload,
                                std::vector<uint8_t>& out) const {
  return encode(kind, payload.empty() ? nullptr : &payload[0], payload.size(), out);
}

// Start code and address must match exactly. A buffer too short to hold the
// start code cannot begin with it.
bool FpmPacketCodec::_matchesPrefix(const uint8_t* bytes, size_t size, FpmError& error) const {
  const uint8_t expected[6] = {
    (START_CODE >> 8) & 0xFF, START_CODE & 0xFF,
    (uint8_t)((_address >> 24) & 0xFF), (uint8_t)((_address >> 16) & 0xFF),
    (uint8_t)((_address >> 8) & 0xFF), (uint8_t)(_address & 0xFF)
  };
  if (size < 2) {
    error = FpmError::FramingError;
    return false;
  }
  size_t n = size < sizeof(expected) ? size : sizeof(expected);
  for (size_t i = 0; i < n; i++) {
    if (bytes[i] != expected[i]) {
      error = FpmError::FramingError;
      return false;
    }
  }
  if (size < sizeof(expected)) {
    error = FpmError::Truncated;
    return false;
  }
  return true;
}

FpmError FpmPacketCodec::decodeHeader(const uint8_t* header, uint16_t& remaining) const {
  FpmError error = FpmError::None;
  if (!_matchesPrefix(header, HEADER_SIZE, error)) {
    return error;
  }
  uint16_t length = _readU16(header + 7);
  if (length < CHECKSUM_SIZE) {
    return FpmError::FramingError;
  }
  if (length - CHECKSUM_SIZE > _maxPayload) {
    return FpmError::PayloadTooLarge;
  }
  remaining = length;
  return FpmError::None;
}

FpmError FpmPacketCodec::decode(const uint8_t* bytes, size_t size, FpmPacket& packet) const {
  FpmError error = FpmError::None;
  if (!_matchesPrefix(bytes, size, error)) {
    return error;
  }
  if (size < HEADER_SIZE + CHECKSUM_SIZE) {
    return FpmError::Truncated;
  }

  uint8_t kind = bytes[6];
  uint16_t declared = _readU16(bytes + 7);
  size_t actual = size - HEADER_SIZE;
  const uint8_t* payload = bytes + HEADER_SIZE;

  if (declared != actual) {
    // The checksum covers the length field, so a frame that is otherwise
    // consistent with its own size has a damaged length.
    if (actual <= 0xFFFF) {
      uint16_t sum = checksum(kind, (uint16_t)actual, payload, actual - CHECKSUM_SIZE);
      if (sum == _readU16(bytes + size - CHECKSUM_SIZE)) {
        return FpmError::ChecksumMismatch;
      }
    }
    return declared > actual ? FpmError::Truncated : FpmError::FramingError;
  }

  size_t payloadSize = actual - CHECKSUM_SIZE;
  uint16_t sum = checksum(kind, declared, payload, payloadSize);
  if (sum != _readU16(bytes + size - CHECKSUM_SIZE)) {
    return FpmError::ChecksumMismatch;
  }
  if (payloadSize > _maxPayload) {
    return FpmError::PayloadTooLarge;
  }
  if (!validKind(kind)) {
    return FpmError::FramingError;
  }

  packet.kind = static_cast<FpmPacketKind>(kind);
  packet.payload.assign(payload, payload + payloadSize);
  return FpmError::None;
}

FpmError FpmPacketCodec::decode(const std::vector<uint8_t>& bytes, FpmPacket& packet) const {
  return decode(bytes.empty() ? nullptr : &bytes[0], bytes.size(), packet);
}
