#include "FpmEnroll.h"
#include "FpmLog.h"
#include <Adafruit_Fingerprint.h>

static const char* const TAG = "fpm.enroll";

FpmEnrollment::FpmEnrollment(FpmProtocol* protocol, FpmTemplateRegistry* registry,
                             const FpmConfig& config)
  : _protocol(protocol),
    _registry(registry),
    _requiredScans(config.requiredScans),
    _captureAttempts(config.captureAttempts),
    _liftBetweenScans(config.liftBetweenScans),
    _liftAttempts(config.liftAttempts),
    _state(FpmEnrollState::Idle),
    _failure(FpmEnrollFailure::None),
    _slot(0),
    _scans(0),
    _featureBuffer(0),
    _attempts(0) {}

bool FpmEnrollment::start(int slot) {
  if (_state != FpmEnrollState::Idle) {
    FPM_LOGW(TAG, "Session already started");
    return false;
  }
  _slot = slot;
  if (_requiredScans < 1 || _requiredScans > FpmConfig::MAX_SCANS) {
    FPM_LOGE(TAG, "Unsupported scan count %u", _requiredScans);
    _fail(FpmEnrollFailure::InvalidRequest);
    return false;
  }
  if (!_registry->validSlot(slot)) {
    FPM_LOGE(TAG, "Slot %d outside library (capacity %u)", slot, _registry->capacity());
    _last = FpmResult(FINGERPRINT_BADLOCATION, FpmOutcome::IdOutOfRange);
    _fail(FpmEnrollFailure::StorageRejected);
    return false;
  }
  FPM_LOGI(TAG, "Enrolling slot %d, %u scans", slot, _requiredScans);
  _state = FpmEnrollState::Capturing;
  return true;
}

FpmEnrollStep FpmEnrollment::_report(FpmEnrollEvent event) const {
  FpmEnrollStep step;
  step.event = event;
  step.state = _state;
  step.scansCompleted = _scans;
  step.attempt = _attempts;
  return step;
}

FpmEnrollStep FpmEnrollment::_advance(FpmEnrollEvent event, FpmEnrollState next) {
  FPM_LOGD(TAG, "%s -> %s", fpmEnrollStateToString(_state), fpmEnrollStateToString(next));
  FpmEnrollStep step = _report(event);
  _state = next;
  _attempts = 0;
  step.state = next;
  return step;
}

FpmEnrollStep FpmEnrollment::_fail(FpmEnrollFailure failure) {
  FPM_LOGW(TAG, "Failed in %s: %s (%s)", fpmEnrollStateToString(_state),
           fpmEnrollFailureToString(failure),
           _last.exchanged() ? fpmOutcomeToString(_last.outcome) : fpmErrorToString(_last.error));
  _state = FpmEnrollState::Failed;
  _failure = failure;
  return _report(FpmEnrollEvent::Failed);
}

FpmEnrollStep FpmEnrollment::_capture() {
  _last = _protocol->execute(FpmCommand::GenImage);
  if (!_last.exchanged()) {
    return _fail(FpmEnrollFailure::TransportFailure);
  }
  switch (_last.outcome) {
    case FpmOutcome::Success:
      FPM_LOGI(TAG, "Image %u/%u taken", _scans + 1, _requiredScans);
      return _advance(FpmEnrollEvent::ImageCaptured, FpmEnrollState::Extracting);
    case FpmOutcome::NoFinger:
      _attempts++;
      if (_attempts >= _captureAttempts) {
        FPM_LOGW(TAG, "No finger after %u attempts", _attempts);
        return _fail(FpmEnrollFailure::Timeout);
      }
      return _report(FpmEnrollEvent::FingerNeeded);
    case FpmOutcome::ImagingFailed:
      return _fail(FpmEnrollFailure::ImagingFailed);
    default:
      return _fail(FpmEnrollFailure::DeviceError);
  }
}

FpmEnrollStep FpmEnrollment::_extract() {
  uint8_t buffer = _scans + 1;
  std::vector<uint8_t> params(1, buffer);
  _last = _protocol->execute(FpmCommand::GenChar, params);
  if (!_last.exchanged()) {
    return _fail(FpmEnrollFailure::TransportFailure);
  }
  switch (_last.outcome) {
    case FpmOutcome::Success:
      break;
    case FpmOutcome::ImageMessy:
    case FpmOutcome::TooFewFeatures:
    case FpmOutcome::InvalidImage:
    case FpmOutcome::ImageTooDry:
    case FpmOutcome::ImageTooWet:
      return _fail(FpmEnrollFailure::PoorQuality);
    default:
      return _fail(FpmEnrollFailure::DeviceError);
  }

  _scans++;
  _featureBuffer = buffer;
  FPM_LOGI(TAG, "Features %u/%u in buffer %u", _scans, _requiredScans, buffer);
  if (_scans >= _requiredScans) {
    return _advance(FpmEnrollEvent::FeaturesExtracted, FpmEnrollState::Merging);
  }
  return _advance(FpmEnrollEvent::FeaturesExtracted,
                  _liftBetweenScans ? FpmEnrollState::Lifting : FpmEnrollState::Capturing);
}

FpmEnrollStep FpmEnrollment::_lift() {
  _last = _protocol->execute(FpmCommand::GenImage);
  if (!_last.exchanged()) {
    return _fail(FpmEnrollFailure::TransportFailure);
  }
  switch (_last.outcome) {
    case FpmOutcome::NoFinger:
      return _advance(FpmEnrollEvent::FingerLifted, FpmEnrollState::Capturing);
    case FpmOutcome::Success:
    case FpmOutcome::ImagingFailed:
      // finger still on the window
      _attempts++;
      if (_attempts >= _liftAttempts) {
        FPM_LOGW(TAG, "Finger not lifted after %u attempts", _attempts);
        return _fail(FpmEnrollFailure::Timeout);
      }
      return _report(FpmEnrollEvent::LiftFinger);
    default:
      return _fail(FpmEnrollFailure::DeviceError);
  }
}

FpmEnrollStep FpmEnrollment::_merge() {
  _last = _protocol->execute(FpmCommand::RegModel);
  if (!_last.exchanged()) {
    return _fail(FpmEnrollFailure::TransportFailure);
  }
  switch (_last.outcome) {
    case FpmOutcome::Success:
      return _advance(FpmEnrollEvent::ModelMerged, FpmEnrollState::Storing);
    case FpmOutcome::FailToMerge:
    case FpmOutcome::FingersMismatch:
      return _fail(FpmEnrollFailure::FingersMismatch);
    default:
      return _fail(FpmEnrollFailure::DeviceError);
  }
}

FpmEnrollStep FpmEnrollment::_store() {
  _last = _registry->store(1, _slot);
  if (!_last.exchanged()) {
    return _fail(FpmEnrollFailure::TransportFailure);
  }
  switch (_last.outcome) {
    case FpmOutcome::Success:
      FPM_LOGI(TAG, "Stored in slot %d", _slot);
      return _advance(FpmEnrollEvent::ModelStored, FpmEnrollState::Done);
    case FpmOutcome::IdOutOfRange:
    case FpmOutcome::LibraryFull:
      return _fail(FpmEnrollFailure::StorageRejected);
    default:
      return _fail(FpmEnrollFailure::DeviceError);
  }
}

FpmEnrollStep FpmEnrollment::step() {
  switch (_state) {
    case FpmEnrollState::Capturing: return _capture();
    case FpmEnrollState::Extracting: return _extract();
    case FpmEnrollState::Lifting: return _lift();
    case FpmEnrollState::Merging: return _merge();
    case FpmEnrollState::Storing: return _store();
    case FpmEnrollState::Idle:
      FPM_LOGW(TAG, "step() before start()");
      return _report(FpmEnrollEvent::None);
    case FpmEnrollState::Done:
    case FpmEnrollState::Failed:
      break;
  }
  return _report(FpmEnrollEvent::None);
}

FpmEnrollOutcome FpmEnrollment::run() {
  while (_state != FpmEnrollState::Idle && !finished()) {
    step();
  }
  return outcome();
}

void FpmEnrollment::cancel() {
  if (finished()) {
    return;
  }
  FPM_LOGI(TAG, "Cancelled in %s", fpmEnrollStateToString(_state));
  _state = FpmEnrollState::Failed;
  _failure = FpmEnrollFailure::Cancelled;
}

FpmEnrollOutcome FpmEnrollment::outcome() const {
  FpmEnrollOutcome outcome;
  outcome.done = _state == FpmEnrollState::Done;
  outcome.slot = (uint16_t)_slot;
  outcome.failure = _failure;
  outcome.last = _last;
  return outcome;
}

const char* fpmEnrollStateToString(FpmEnrollState state) {
  switch (state) {
    case FpmEnrollState::Idle: return "Idle";
    case FpmEnrollState::Capturing: return "Capturing";
    case FpmEnrollState::Extracting: return "Extracting";
    case FpmEnrollState::Lifting: return "Lifting";
    case FpmEnrollState::Merging: return "Merging";
    case FpmEnrollState::Storing: return "Storing";
    case FpmEnrollState::Done: return "Done";
    case FpmEnrollState::Failed: return "Failed";
  }
  return "Unknown";
}

const char* fpmEnrollFailureToString(FpmEnrollFailure failure) {
  switch (failure) {
    case FpmEnrollFailure::None: return "none";
    case FpmEnrollFailure::Timeout: return "timeout";
    case FpmEnrollFailure::ImagingFailed: return "imaging failed";
    case FpmEnrollFailure::PoorQuality: return "poor quality";
    case FpmEnrollFailure::FingersMismatch: return "fingers mismatch";
    case FpmEnrollFailure::StorageRejected: return "storage rejected";
    case FpmEnrollFailure::DeviceError: return "device error";
    case FpmEnrollFailure::TransportFailure: return "transport failure";
    case FpmEnrollFailure::InvalidRequest: return "invalid request";
    case FpmEnrollFailure::Cancelled: return "cancelled";
  }
  return "unknown";
}
