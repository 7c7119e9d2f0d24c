#include "FpmStatus.h"
#include <Adafruit_Fingerprint.h>
#include <cstring>

// Confirmation codes the Adafruit header does not name.
static const uint8_t STATUS_TOO_DRY = 0x04;
static const uint8_t STATUS_TOO_WET = 0x05;
static const uint8_t STATUS_UNDEFINED = 0x19;
static const uint8_t STATUS_BAD_REG_CONFIG = 0x1B;
static const uint8_t STATUS_BAD_NOTEPAD = 0x1C;
static const uint8_t STATUS_COMM_PORT = 0x1D;
static const uint8_t STATUS_LIBRARY_FULL = 0x1F;
static const uint8_t STATUS_TEMPLATE_EMPTY = 0x22;
static const uint8_t STATUS_LIBRARY_EMPTY = 0x24;
static const uint8_t STATUS_DEVICE_TIMEOUT = 0x26;
static const uint8_t STATUS_ALREADY_EXISTS = 0x27;
static const uint8_t STATUS_SENSOR_ABNORMAL = 0x29;

FpmStatusTable::FpmStatusTable() {
  memset(_entries, UNMAPPED, sizeof(_entries));
}

FpmStatusTable FpmStatusTable::forModel(FpmSensorModel model) {
  FpmStatusTable table;
  table.set(FINGERPRINT_OK, FpmOutcome::Success);
  table.set(FINGERPRINT_PACKETRECIEVEERR, FpmOutcome::PacketReceiveError);
  table.set(FINGERPRINT_NOFINGER, FpmOutcome::NoFinger);
  table.set(FINGERPRINT_IMAGEFAIL, FpmOutcome::ImagingFailed);
  table.set(STATUS_TOO_DRY, FpmOutcome::ImageTooDry);
  table.set(STATUS_TOO_WET, FpmOutcome::ImageTooWet);
  table.set(FINGERPRINT_IMAGEMESS, FpmOutcome::ImageMessy);
  table.set(FINGERPRINT_FEATUREFAIL, FpmOutcome::TooFewFeatures);
  table.set(FINGERPRINT_NOMATCH, FpmOutcome::FingersMismatch);
  table.set(FINGERPRINT_NOTFOUND, FpmOutcome::NotFound);
  table.set(FINGERPRINT_ENROLLMISMATCH, FpmOutcome::FailToMerge);
  table.set(FINGERPRINT_BADLOCATION, FpmOutcome::IdOutOfRange);
  table.set(FINGERPRINT_DBREADFAIL, FpmOutcome::TemplateReadFailed);
  table.set(FINGERPRINT_UPLOADFEATUREFAIL, FpmOutcome::TemplateUploadFailed);
  table.set(FINGERPRINT_PACKETRESPONSEFAIL, FpmOutcome::DataReceiveFailed);
  table.set(FINGERPRINT_UPLOADFAIL, FpmOutcome::ImageUploadFailed);
  table.set(FINGERPRINT_DELETEFAIL, FpmOutcome::DeleteFailed);
  table.set(FINGERPRINT_DBCLEARFAIL, FpmOutcome::ClearFailed);
  table.set(FINGERPRINT_PASSFAIL, FpmOutcome::WrongPassword);
  table.set(FINGERPRINT_INVALIDIMAGE, FpmOutcome::InvalidImage);
  table.set(FINGERPRINT_FLASHERR, FpmOutcome::FlashError);
  table.set(STATUS_UNDEFINED, FpmOutcome::UndefinedError);
  table.set(FINGERPRINT_INVALIDREG, FpmOutcome::InvalidRegister);
  table.set(STATUS_BAD_REG_CONFIG, FpmOutcome::BadRegisterConfig);
  table.set(STATUS_BAD_NOTEPAD, FpmOutcome::BadNotepadPage);
  table.set(STATUS_COMM_PORT, FpmOutcome::CommunicationError);

  if (model == FpmSensorModel::R503) {
    table.set(STATUS_LIBRARY_FULL, FpmOutcome::LibraryFull);
    table.set(FINGERPRINT_ADDRCODE, FpmOutcome::AddressIncorrect);
    table.set(FINGERPRINT_PASSVERIFY, FpmOutcome::PasswordRequired);
    table.set(STATUS_TEMPLATE_EMPTY, FpmOutcome::TemplateEmpty);
    table.set(STATUS_LIBRARY_EMPTY, FpmOutcome::LibraryEmpty);
    table.set(STATUS_DEVICE_TIMEOUT, FpmOutcome::DeviceTimeout);
    table.set(STATUS_ALREADY_EXISTS, FpmOutcome::AlreadyExists);
    table.set(STATUS_SENSOR_ABNORMAL, FpmOutcome::SensorAbnormal);
  }
  return table;
}

void FpmStatusTable::set(uint8_t status, FpmOutcome outcome) {
  _entries[status] = static_cast<uint8_t>(outcome);
}

void FpmStatusTable::clear(uint8_t status) {
  _entries[status] = UNMAPPED;
}

FpmOutcome FpmStatusTable::outcomeFor(uint8_t status) const {
  if (_entries[status] == UNMAPPED) {
    return FpmOutcome::UnknownDeviceError;
  }
  return static_cast<FpmOutcome>(_entries[status]);
}

bool FpmStatusTable::defines(uint8_t status) const {
  return _entries[status] != UNMAPPED;
}

const char* fpmErrorToString(FpmError error) {
  switch (error) {
    case FpmError::None: return "none";
    case FpmError::IoError: return "io error";
    case FpmError::Timeout: return "timeout";
    case FpmError::FramingError: return "framing error";
    case FpmError::Truncated: return "truncated packet";
    case FpmError::ChecksumMismatch: return "checksum mismatch";
    case FpmError::PayloadTooLarge: return "payload too large";
    case FpmError::UnexpectedPacket: return "unexpected packet";
    case FpmError::NotInitialized: return "driver not initialized";
  }
  return "unknown";
}

const char* fpmOutcomeToString(FpmOutcome outcome) {
  switch (outcome) {
    case FpmOutcome::Success: return "success";
    case FpmOutcome::PacketReceiveError: return "packet receive error";
    case FpmOutcome::NoFinger: return "no finger detected";
    case FpmOutcome::ImagingFailed: return "imaging failed";
    case FpmOutcome::ImageTooDry: return "image too dry";
    case FpmOutcome::ImageTooWet: return "image too wet";
    case FpmOutcome::ImageMessy: return "image too messy";
    case FpmOutcome::TooFewFeatures: return "too few feature points";
    case FpmOutcome::FingersMismatch: return "fingers mismatch";
    case FpmOutcome::NotFound: return "not found";
    case FpmOutcome::FailToMerge: return "fail to merge";
    case FpmOutcome::IdOutOfRange: return "id out of range";
    case FpmOutcome::TemplateReadFailed: return "template read failed";
    case FpmOutcome::TemplateUploadFailed: return "template upload failed";
    case FpmOutcome::DataReceiveFailed: return "data receive failed";
    case FpmOutcome::ImageUploadFailed: return "image upload failed";
    case FpmOutcome::DeleteFailed: return "delete failed";
    case FpmOutcome::ClearFailed: return "clear failed";
    case FpmOutcome::WrongPassword: return "wrong password";
    case FpmOutcome::InvalidImage: return "invalid image";
    case FpmOutcome::FlashError: return "flash error";
    case FpmOutcome::UndefinedError: return "undefined error";
    case FpmOutcome::InvalidRegister: return "invalid register";
    case FpmOutcome::BadRegisterConfig: return "bad register config";
    case FpmOutcome::BadNotepadPage: return "bad notepad page";
    case FpmOutcome::CommunicationError: return "communication error";
    case FpmOutcome::LibraryFull: return "library full";
    case FpmOutcome::AddressIncorrect: return "address incorrect";
    case FpmOutcome::PasswordRequired: return "password required";
    case FpmOutcome::TemplateEmpty: return "template empty";
    case FpmOutcome::LibraryEmpty: return "library empty";
    case FpmOutcome::DeviceTimeout: return "device timeout";
    case FpmOutcome::AlreadyExists: return "already exists";
    case FpmOutcome::SensorAbnormal: return "sensor abnormal";
    case FpmOutcome::UnknownDeviceError: return "unknown device error";
  }
  return "unknown device error";
}

const char* fpmModelToString(FpmSensorModel model) {
  switch (model) {
    case FpmSensorModel::R30x: return "R30x";
    case FpmSensorModel::AS608: return "AS608";
    case FpmSensorModel::R503: return "R503";
  }
  return "unknown";
}
