#ifndef FPM_ENROLL_H
#define FPM_ENROLL_H
#include <cstdint>
#include "FpmConfig.h"
#include "FpmProtocol.h"
#include "FpmRegistry.h"
#include "FpmStatus.h"

enum class FpmEnrollState : uint8_t {
  Idle = 0,
  Capturing,
  Extracting,
  Lifting,
  Merging,
  Storing,
  Done,
  Failed
};

enum class FpmEnrollFailure : uint8_t {
  None = 0,
  Timeout,
  ImagingFailed,
  PoorQuality,
  FingersMismatch,
  StorageRejected,
  DeviceError,
  TransportFailure,
  InvalidRequest,
  Cancelled
};

enum class FpmEnrollEvent : uint8_t {
  None = 0,
  FingerNeeded,
  ImageCaptured,
  FeaturesExtracted,
  LiftFinger,
  FingerLifted,
  ModelMerged,
  ModelStored,
  Failed
};

// What one step() did. `attempt` counts GenImage tries in the current
// Capturing or Lifting phase.
struct FpmEnrollStep {
  FpmEnrollEvent event;
  FpmEnrollState state;
  uint8_t scansCompleted;
  uint16_t attempt;

  FpmEnrollStep()
    : event(FpmEnrollEvent::None), state(FpmEnrollState::Idle), scansCompleted(0), attempt(0) {}
};

struct FpmEnrollOutcome {
  bool done;
  uint16_t slot;
  FpmEnrollFailure failure;
  FpmResult last;       // final exchange, keeps the sensor's reason on failure

  FpmEnrollOutcome() : done(false), slot(0), failure(FpmEnrollFailure::None) {}
};

// One enrollment session:
//
//   Idle -> Capturing -> Extracting -> (Lifting) -> Capturing ... -> Merging -> Storing -> Done
//
// with Failed reachable from every non-terminal state. Each step() issues at
// most one command. A NoFinger answer keeps the machine in Capturing until
// captureAttempts is used up.
class FpmEnrollment {
  public:
    FpmEnrollment(FpmProtocol* protocol, FpmTemplateRegistry* registry, const FpmConfig& config);

    // Idle -> Capturing. Returns false when the request is rejected up front;
    // the session is then already Failed.
    bool start(int slot);
    FpmEnrollStep step();
    // Steps until Done or Failed.
    FpmEnrollOutcome run();
    // Cooperative abort between steps.
    void cancel();

    FpmEnrollState state() const { return _state; }
    FpmEnrollFailure failure() const { return _failure; }
    bool finished() const { return _state == FpmEnrollState::Done || _state == FpmEnrollState::Failed; }
    uint8_t scansCompleted() const { return _scans; }
    uint8_t requiredScans() const { return _requiredScans; }
    uint8_t lastFeatureBuffer() const { return _featureBuffer; }
    const FpmResult& lastResult() const { return _last; }
    FpmEnrollOutcome outcome() const;
  private:
    FpmProtocol* _protocol;
    FpmTemplateRegistry* _registry;
    uint8_t _requiredScans;
    uint16_t _captureAttempts;
    bool _liftBetweenScans;
    uint16_t _liftAttempts;

    FpmEnrollState _state;
    FpmEnrollFailure _failure;
    int _slot;
    uint8_t _scans;
    uint8_t _featureBuffer;
    uint16_t _attempts;
    FpmResult _last;

    FpmEnrollStep _capture();
    FpmEnrollStep _extract();
    FpmEnrollStep _lift();
    FpmEnrollStep _merge();
    FpmEnrollStep _store();
    FpmEnrollStep _advance(FpmEnrollEvent event, FpmEnrollState next);
    FpmEnrollStep _fail(FpmEnrollFailure failure);
    FpmEnrollStep _report(FpmEnrollEvent event) const;
};

const char* fpmEnrollStateToString(FpmEnrollState state);
const char* fpmEnrollFailureToString(FpmEnrollFailure failure);
#endif // FPM_ENROLL_H
