#ifndef FPM_SCRIPTED_TRANSPORT_H
#define FPM_SCRIPTED_TRANSPORT_H
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <vector>
#include "FpmPacket.h"
#include "FpmTransport.h"

// Stands in for the sensor end of the serial link. Replies are framed with
// the production codec and replayed byte by byte; everything the driver
// writes is kept for inspection.
class ScriptedTransport : public FpmTransport {
  public:
    explicit ScriptedTransport(uint32_t address = 0xFFFFFFFF)
      : _codec(address, 1024), _holding(false), _reads(0), _discards(0),
        _writeError(FpmError::None) {}

    FpmError write(const uint8_t* data, size_t size) override {
      if (_writeError != FpmError::None) {
        return _writeError;
      }
      _written.insert(_written.end(), data, data + size);
      return FpmError::None;
    }

    FpmError readExact(uint8_t* data, size_t size, uint32_t timeoutMs) override {
      (void)timeoutMs;
      size_t index = _reads++;
      std::map<size_t, FpmError>::const_iterator injected = _readErrors.find(index);
      if (injected != _readErrors.end()) {
        return injected->second;
      }
      if (_inbound.size() < size) {
        _inbound.clear();
        return FpmError::Timeout;
      }
      for (size_t i = 0; i < size; i++) {
        data[i] = _inbound.front();
        _inbound.pop_front();
      }
      return FpmError::None;
    }

    void discardInput() override {
      _discards++;
      _inbound.clear();
      _inbound.insert(_inbound.end(), _held.begin(), _held.end());
      _held.clear();
    }

    void queueRaw(const std::vector<uint8_t>& bytes) {
      std::deque<uint8_t>& target = _holding ? _held : _inbound;
      target.insert(target.end(), bytes.begin(), bytes.end());
    }

    // While set, queued bytes only arrive after the next discardInput(),
    // the way a reply follows a flushed line.
    void holdUntilDiscard(bool hold) { _holding = hold; }

    void queuePacket(FpmPacketKind kind, const std::vector<uint8_t>& payload) {
      std::vector<uint8_t> frame;
      _codec.encode(kind, payload, frame);
      queueRaw(frame);
    }

    void queueAck(uint8_t status, const std::vector<uint8_t>& extra = std::vector<uint8_t>()) {
      std::vector<uint8_t> payload(1, status);
      payload.insert(payload.end(), extra.begin(), extra.end());
      queuePacket(FpmPacketKind::Ack, payload);
    }

    void queueData(const std::vector<uint8_t>& payload) {
      queuePacket(FpmPacketKind::Data, payload);
    }

    void queueEndData(const std::vector<uint8_t>& payload) {
      queuePacket(FpmPacketKind::EndData, payload);
    }

    // The read with this index (0-based, counting every readExact call)
    // fails with `error` instead of returning bytes.
    void failRead(size_t index, FpmError error) { _readErrors[index] = error; }
    void failWrites(FpmError error) { _writeError = error; }
    void setAddress(uint32_t address) { _codec.setAddress(address); }

    const std::vector<uint8_t>& written() const { return _written; }
    void clearWritten() { _written.clear(); }
    size_t pending() const { return _inbound.size(); }
    size_t reads() const { return _reads; }
    size_t discards() const { return _discards; }

    // Splits the written byte stream back into packets. Frames are trusted;
    // the driver under test produced them.
    std::vector<FpmPacket> sentPackets() const {
      std::vector<FpmPacket> packets;
      size_t pos = 0;
      while (pos + 9 <= _written.size()) {
        uint16_t length = (uint16_t)((_written[pos + 7] << 8) | _written[pos + 8]);
        size_t end = pos + 9 + length;
        if (end > _written.size() || length < 2) {
          break;
        }
        FpmPacket packet;
        packet.kind = static_cast<FpmPacketKind>(_written[pos + 6]);
        packet.payload.assign(_written.begin() + pos + 9, _written.begin() + end - 2);
        packets.push_back(packet);
        pos = end;
      }
      return packets;
    }

    std::vector<uint8_t> sentOpcodes() const {
      std::vector<uint8_t> opcodes;
      std::vector<FpmPacket> packets = sentPackets();
      for (size_t i = 0; i < packets.size(); i++) {
        if (packets[i].kind == FpmPacketKind::Command && !packets[i].payload.empty()) {
          opcodes.push_back(packets[i].payload[0]);
        }
      }
      return opcodes;
    }

    // Parameter bytes of the n-th command packet written.
    std::vector<uint8_t> sentParams(size_t n) const {
      std::vector<FpmPacket> packets = sentPackets();
      size_t seen = 0;
      for (size_t i = 0; i < packets.size(); i++) {
        if (packets[i].kind != FpmPacketKind::Command || packets[i].payload.empty()) {
          continue;
        }
        if (seen++ == n) {
          return std::vector<uint8_t>(packets[i].payload.begin() + 1, packets[i].payload.end());
        }
      }
      return std::vector<uint8_t>();
    }
  private:
    FpmPacketCodec _codec;
    std::deque<uint8_t> _inbound;
    std::deque<uint8_t> _held;
    bool _holding;
    std::vector<uint8_t> _written;
    std::map<size_t, FpmError> _readErrors;
    size_t _reads;
    size_t _discards;
    FpmError _writeError;
};
#endif // FPM_SCRIPTED_TRANSPORT_H
