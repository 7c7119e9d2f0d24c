#ifndef FPM_STATUS_H
#define FPM_STATUS_H
#include <cstdint>

// Link-level failures: the exchange itself did not complete.
enum class FpmError : uint8_t {
  None = 0,
  IoError,
  Timeout,
  FramingError,
  Truncated,
  ChecksumMismatch,
  PayloadTooLarge,
  UnexpectedPacket,
  NotInitialized
};

// What the sensor reported in the confirmation byte of an acknowledge packet.
enum class FpmOutcome : uint8_t {
  Success = 0,
  PacketReceiveError,
  NoFinger,
  ImagingFailed,
  ImageTooDry,
  ImageTooWet,
  ImageMessy,
  TooFewFeatures,
  FingersMismatch,
  NotFound,
  FailToMerge,
  IdOutOfRange,
  TemplateReadFailed,
  TemplateUploadFailed,
  DataReceiveFailed,
  ImageUploadFailed,
  DeleteFailed,
  ClearFailed,
  WrongPassword,
  InvalidImage,
  FlashError,
  UndefinedError,
  InvalidRegister,
  BadRegisterConfig,
  BadNotepadPage,
  CommunicationError,
  LibraryFull,
  AddressIncorrect,
  PasswordRequired,
  TemplateEmpty,
  LibraryEmpty,
  DeviceTimeout,
  AlreadyExists,
  SensorAbnormal,
  UnknownDeviceError
};

enum class FpmSensorModel : uint8_t {
  R30x = 0,
  AS608,
  R503
};

// Result of one exchange. `status` is the raw confirmation byte and is only
// meaningful when the exchange completed.
struct FpmResult {
  FpmError error;
  uint8_t status;
  FpmOutcome outcome;

  FpmResult() : error(FpmError::None), status(0), outcome(FpmOutcome::Success) {}
  FpmResult(FpmError e) : error(e), status(0), outcome(FpmOutcome::CommunicationError) {}
  FpmResult(uint8_t s, FpmOutcome o) : error(FpmError::None), status(s), outcome(o) {}

  bool exchanged() const { return error == FpmError::None; }
  bool ok() const { return error == FpmError::None && outcome == FpmOutcome::Success; }
};

// Maps sensor confirmation bytes to outcomes. Bytes with no entry resolve to
// UnknownDeviceError.
class FpmStatusTable {
  public:
    FpmStatusTable();
    static FpmStatusTable forModel(FpmSensorModel model);

    void set(uint8_t status, FpmOutcome outcome);
    void clear(uint8_t status);
    FpmOutcome outcomeFor(uint8_t status) const;
    bool defines(uint8_t status) const;
  private:
    static const uint8_t UNMAPPED = 0xFF;
    uint8_t _entries[256];
};

const char* fpmErrorToString(FpmError error);
const char* fpmOutcomeToString(FpmOutcome outcome);
const char* fpmModelToString(FpmSensorModel model);
#endif // FPM_STATUS_H
