#include "FpmProtocol.h"
#include "FpmLog.h"

static const char* const TAG = "fpm.proto";

FpmProtocol::FpmProtocol(FpmTransport* transport, const FpmConfig& config,
                         const FpmStatusTable& statuses)
  : _transport(transport),
    _codec(config.address, config.maxPayload),
    _statuses(statuses),
    _timeoutMs(config.commandTimeoutMs),
    _dataPacketSize(DEFAULT_DATA_PACKET_SIZE),
    _templateLimit(config.templateSize),
    _imageLimit(config.imageSize),
    _replyAddress(config.address),
    _redirectReply(false) {
  setDataPacketSize(DEFAULT_DATA_PACKET_SIZE);
}

void FpmProtocol::setDataPacketSize(uint16_t size) {
  if (size == 0) {
    FPM_LOGW(TAG, "Ignoring zero data packet size");
    return;
  }
  if (size > _codec.maxPayload()) {
    FPM_LOGW(TAG, "Data packet size %u capped to %u", size, _codec.maxPayload());
    size = _codec.maxPayload();
  }
  _dataPacketSize = size;
}

void FpmProtocol::discardInput() {
  if (_transport) {
    _transport->discardInput();
  }
}

size_t FpmProtocol::_dataLimit(const FpmCommandSpec* spec) const {
  switch (spec->limit) {
    case FpmDataLimit::Template: return _templateLimit;
    case FpmDataLimit::Image: return _imageLimit;
    default: return 0;
  }
}

FpmError FpmProtocol::_send(FpmPacketKind kind, const uint8_t* payload, size_t size) {
  std::vector<uint8_t> frame;
  FpmError error = _codec.encode(kind, payload, size, frame);
  if (error != FpmError::None) {
    FPM_LOGE(TAG, "Cannot frame %u byte payload: %s", (unsigned)size, fpmErrorToString(error));
    return error;
  }
  FPM_LOG_HEX(FpmLogLevel::Verbose, TAG, "tx", &frame[0], frame.size());
  return _transport->write(&frame[0], frame.size());
}

// Reads the fixed header first so the length is known, then the rest of the
// frame. A bad header means the rest of the packet cannot be located, so any
// pending input is dropped.
FpmError FpmProtocol::_receive(FpmPacket& packet, uint32_t timeoutMs) {
  std::vector<uint8_t> frame(FpmPacketCodec::HEADER_SIZE);
  FpmError error = _transport->readExact(&frame[0], frame.size(), timeoutMs);
  if (error != FpmError::None) {
    return error;
  }

  uint16_t remaining = 0;
  error = _codec.decodeHeader(&frame[0], remaining);
  if (error != FpmError::None) {
    FPM_LOG_HEX(FpmLogLevel::Debug, TAG, "bad header", &frame[0], frame.size());
    _transport->discardInput();
    return error;
  }

  frame.resize(FpmPacketCodec::HEADER_SIZE + remaining);
  error = _transport->readExact(&frame[FpmPacketCodec::HEADER_SIZE], remaining, timeoutMs);
  if (error != FpmError::None) {
    return error;
  }
  FPM_LOG_HEX(FpmLogLevel::Verbose, TAG, "rx", &frame[0], frame.size());
  return _codec.decode(frame, packet);
}

FpmCommandResult FpmProtocol::_sendCommand(const FpmCommandSpec* spec,
                                           const std::vector<uint8_t>& params,
                                           uint32_t timeoutMs) {
  if (!_transport) {
    FPM_LOGE(TAG, "Transport not set");
    return FpmCommandResult(FpmError::IoError);
  }
  if (params.size() != spec->paramSize) {
    FPM_LOGW(TAG, "%s expects %u parameter bytes, got %u", spec->name, spec->paramSize,
             (unsigned)params.size());
  }

  std::vector<uint8_t> payload;
  payload.reserve(1 + params.size());
  payload.push_back(static_cast<uint8_t>(spec->command));
  payload.insert(payload.end(), params.begin(), params.end());

  FPM_LOGD(TAG, ">>> %s", spec->name);
  FpmError error = _send(FpmPacketKind::Command, &payload[0], payload.size());
  if (error != FpmError::None) {
    FPM_LOGE(TAG, "%s: send failed: %s", spec->name, fpmErrorToString(error));
    return FpmCommandResult(error);
  }
  if (_redirectReply) {
    _codec.setAddress(_replyAddress);
  }

  FpmPacket ack;
  error = _receive(ack, timeoutMs);
  if (error != FpmError::None) {
    FPM_LOGE(TAG, "%s: no acknowledge: %s", spec->name, fpmErrorToString(error));
    return FpmCommandResult(error);
  }
  if (ack.kind != FpmPacketKind::Ack || ack.payload.empty()) {
    FPM_LOGE(TAG, "%s: expected acknowledge, got kind 0x%02X with %u bytes", spec->name,
             static_cast<uint8_t>(ack.kind), (unsigned)ack.payload.size());
    return FpmCommandResult(FpmError::UnexpectedPacket);
  }

  FpmCommandResult result;
  result.status = ack.payload[0];
  result.outcome = _statuses.outcomeFor(result.status);
  result.params.assign(ack.payload.begin() + 1, ack.payload.end());

  if (result.outcome != FpmOutcome::Success) {
    FPM_LOGD(TAG, "<<< %s: 0x%02X %s", spec->name, result.status, fpmOutcomeToString(result.outcome));
    return result;
  }
  if (result.params.size() < spec->ackExtra) {
    FPM_LOGE(TAG, "%s: acknowledge carries %u bytes, expected %u", spec->name,
             (unsigned)result.params.size(), spec->ackExtra);
    return FpmCommandResult(FpmError::UnexpectedPacket);
  }
  FPM_LOGD(TAG, "<<< %s: ok", spec->name);
  return result;
}

FpmError FpmProtocol::_receiveData(const FpmCommandSpec* spec, std::vector<uint8_t>& data,
                                   uint32_t timeoutMs) {
  size_t limit = _dataLimit(spec);
  int packetCount = 0;
  while (true) {
    FpmPacket packet;
    FpmError error = _receive(packet, timeoutMs);
    if (error != FpmError::None) {
      FPM_LOGE(TAG, "%s: data packet #%d failed after %u bytes: %s", spec->name, packetCount + 1,
               (unsigned)data.size(), fpmErrorToString(error));
      data.clear();
      return error;
    }
    if (packet.kind != FpmPacketKind::Data && packet.kind != FpmPacketKind::EndData) {
      FPM_LOGE(TAG, "%s: unexpected packet kind 0x%02X in data stream", spec->name,
               static_cast<uint8_t>(packet.kind));
      data.clear();
      return FpmError::UnexpectedPacket;
    }
    packetCount++;
    if (limit > 0 && data.size() + packet.payload.size() > limit) {
      FPM_LOGE(TAG, "%s: data exceeds %u bytes", spec->name, (unsigned)limit);
      data.clear();
      _transport->discardInput();
      return FpmError::PayloadTooLarge;
    }
    data.insert(data.end(), packet.payload.begin(), packet.payload.end());
    if (packet.kind == FpmPacketKind::EndData) {
      FPM_LOGD(TAG, "%s: %u bytes in %d packets", spec->name, (unsigned)data.size(), packetCount);
      return FpmError::None;
    }
  }
}

FpmCommandResult FpmProtocol::execute(FpmCommand command, const std::vector<uint8_t>& params,
                                      uint32_t timeoutMs) {
  const FpmCommandSpec* spec = fpmCommandSpec(command);
  if (spec->shape == FpmResponseShape::AckThenUpload) {
    FPM_LOGE(TAG, "%s needs data, use executeUpload", spec->name);
    return FpmCommandResult(FpmError::UnexpectedPacket);
  }

  FpmCommandResult result = _sendCommand(spec, params, timeoutMs);
  if (!result.ok() || spec->shape != FpmResponseShape::AckThenData) {
    return result;
  }

  FpmError error = _receiveData(spec, result.data, timeoutMs);
  if (error != FpmError::None) {
    return FpmCommandResult(error);
  }
  return result;
}

FpmCommandResult FpmProtocol::execute(FpmCommand command, const std::vector<uint8_t>& params) {
  return execute(command, params, _timeoutMs);
}

FpmCommandResult FpmProtocol::execute(FpmCommand command) {
  return execute(command, std::vector<uint8_t>(), _timeoutMs);
}

FpmCommandResult FpmProtocol::executeReplyingFrom(FpmCommand command,
                                                  const std::vector<uint8_t>& params,
                                                  uint32_t replyAddress) {
  uint32_t previous = _codec.address();
  _replyAddress = replyAddress;
  _redirectReply = true;
  FpmCommandResult result = execute(command, params, _timeoutMs);
  _redirectReply = false;
  if (!result.ok()) {
    _codec.setAddress(previous);
  }
  return result;
}

FpmCommandResult FpmProtocol::executeUpload(FpmCommand command, const std::vector<uint8_t>& params,
                                            const std::vector<uint8_t>& data, uint32_t timeoutMs) {
  const FpmCommandSpec* spec = fpmCommandSpec(command);
  if (spec->shape != FpmResponseShape::AckThenUpload) {
    FPM_LOGE(TAG, "%s does not accept data", spec->name);
    return FpmCommandResult(FpmError::UnexpectedPacket);
  }
  size_t limit = _dataLimit(spec);
  if (data.empty() || (limit > 0 && data.size() > limit)) {
    FPM_LOGE(TAG, "%s: %u bytes of data, limit %u", spec->name, (unsigned)data.size(),
             (unsigned)limit);
    return FpmCommandResult(FpmError::PayloadTooLarge);
  }

  FpmCommandResult result = _sendCommand(spec, params, timeoutMs);
  if (!result.ok()) {
    return result;
  }

  size_t sent = 0;
  while (sent < data.size()) {
    size_t chunk = data.size() - sent;
    if (chunk > _dataPacketSize) {
      chunk = _dataPacketSize;
    }
    bool last = sent + chunk >= data.size();
    FpmError error = _send(last ? FpmPacketKind::EndData : FpmPacketKind::Data, &data[sent], chunk);
    if (error != FpmError::None) {
      FPM_LOGE(TAG, "%s: data send failed at %u/%u: %s", spec->name, (unsigned)sent,
               (unsigned)data.size(), fpmErrorToString(error));
      return FpmCommandResult(error);
    }
    sent += chunk;
  }
  FPM_LOGD(TAG, "%s: sent %u bytes", spec->name, (unsigned)sent);
  return result;
}
