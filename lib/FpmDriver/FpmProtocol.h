#ifndef FPM_PROTOCOL_H
#define FPM_PROTOCOL_H
#include <cstddef>
#include <cstdint>
#include <vector>
#include "FpmCommand.h"
#include "FpmConfig.h"
#include "FpmPacket.h"
#include "FpmStatus.h"
#include "FpmTransport.h"

struct FpmCommandResult : public FpmResult {
  std::vector<uint8_t> params;  // acknowledge bytes after the confirmation code
  std::vector<uint8_t> data;    // data packet payloads, in arrival order

  FpmCommandResult() {}
  FpmCommandResult(FpmError e) : FpmResult(e) {}
};

// Runs one command exchange at a time over a borrowed transport: send the
// command packet, read the acknowledge, then move whatever data the command
// declares. Nothing is retried here; negative confirmation codes come back as
// outcomes and link failures as errors.
class FpmProtocol {
  public:
    static const uint16_t DEFAULT_DATA_PACKET_SIZE = 128;

    FpmProtocol(FpmTransport* transport, const FpmConfig& config, const FpmStatusTable& statuses);

    FpmCommandResult execute(FpmCommand command, const std::vector<uint8_t>& params,
                             uint32_t timeoutMs);
    FpmCommandResult execute(FpmCommand command, const std::vector<uint8_t>& params);
    FpmCommandResult execute(FpmCommand command);

    // Sends `command` framed for the current address but accepts the reply
    // only from `replyAddress`, which becomes the current address when the
    // command succeeds. SetAddr answers this way.
    FpmCommandResult executeReplyingFrom(FpmCommand command, const std::vector<uint8_t>& params,
                                         uint32_t replyAddress);

    // For AckThenUpload commands: after a positive acknowledge `data` is
    // streamed to the sensor in data packets, the last one marked end-of-data.
    FpmCommandResult executeUpload(FpmCommand command, const std::vector<uint8_t>& params,
                                   const std::vector<uint8_t>& data, uint32_t timeoutMs);

    void discardInput();

    const FpmStatusTable& statuses() const { return _statuses; }
    uint32_t address() const { return _codec.address(); }
    void setAddress(uint32_t address) { _codec.setAddress(address); }
    uint16_t dataPacketSize() const { return _dataPacketSize; }
    void setDataPacketSize(uint16_t size);
  private:
    FpmTransport* _transport;
    FpmPacketCodec _codec;
    FpmStatusTable _statuses;
    uint32_t _timeoutMs;
    uint16_t _dataPacketSize;
    uint16_t _templateLimit;
    uint32_t _imageLimit;
    uint32_t _replyAddress;
    bool _redirectReply;

    FpmError _send(FpmPacketKind kind, const uint8_t* payload, size_t size);
    FpmError _receive(FpmPacket& packet, uint32_t timeoutMs);
    FpmCommandResult _sendCommand(const FpmCommandSpec* spec, const std::vector<uint8_t>& params,
                                  uint32_t timeoutMs);
    FpmError _receiveData(const FpmCommandSpec* spec, std::vector<uint8_t>& data, uint32_t timeoutMs);
    size_t _dataLimit(const FpmCommandSpec* spec) const;
};
#endif // FPM_PROTOCOL_H
