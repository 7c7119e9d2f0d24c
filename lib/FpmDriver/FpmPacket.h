#ifndef FPM_PACKET_H
#define FPM_PACKET_H
#include <cstddef>
#include <cstdint>
#include <vector>
#include "FpmStatus.h"

enum class FpmPacketKind : uint8_t {
  Command = 0x01,
  Data = 0x02,
  Ack = 0x07,
  EndData = 0x08
};

struct FpmPacket {
  FpmPacketKind kind;
  std::vector<uint8_t> payload;

  FpmPacket() : kind(FpmPacketKind::Ack) {}
  FpmPacket(FpmPacketKind k, const std::vector<uint8_t>& p) : kind(k), payload(p) {}
};

// Frames and unframes packets for one device address.
//
// Wire layout, multi-byte fields big-endian:
//   start code (2) | address (4) | kind (1) | length (2) | payload | checksum (2)
// length counts payload plus checksum. The checksum is the 16-bit sum of the
// kind byte, both length bytes and every payload byte.
class FpmPacketCodec {
  public:
    static const uint16_t START_CODE = 0xEF01;
    static const size_t HEADER_SIZE = 9;
    static const size_t CHECKSUM_SIZE = 2;

    FpmPacketCodec(uint32_t address, uint16_t maxPayload);

    FpmError encode(FpmPacketKind kind, const uint8_t* payload, size_t size,
                    std::vector<uint8_t>& out) const;
    FpmError encode(FpmPacketKind kind, const std::vector<uint8_t>& payload,
                    std::vector<uint8_t>& out) const;

    // All-or-nothing: `packet` is only written when FpmError::None is returned.
    FpmError decode(const uint8_t* bytes, size_t size, FpmPacket& packet) const;
    FpmError decode(const std::vector<uint8_t>& bytes, FpmPacket& packet) const;

    // Validates the first HEADER_SIZE bytes of an inbound frame and yields the
    // number of bytes that follow (payload plus checksum).
    FpmError decodeHeader(const uint8_t* header, uint16_t& remaining) const;

    static uint16_t checksum(uint8_t kind, uint16_t length, const uint8_t* payload, size_t size);
    static bool validKind(uint8_t kind);

    uint32_t address() const { return _address; }
    void setAddress(uint32_t address) { _address = address; }
    uint16_t maxPayload() const { return _maxPayload; }
    void setMaxPayload(uint16_t maxPayload) { _maxPayload = maxPayload; }
  private:
    uint32_t _address;
    uint16_t _maxPayload;

    bool _matchesPrefix(const uint8_t* bytes, size_t size, FpmError& error) const;
    static uint16_t _readU16(const uint8_t* p);
};
#endif // FPM_PACKET_H
