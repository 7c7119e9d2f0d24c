#ifndef FPM_COMMAND_H
#define FPM_COMMAND_H
#include <cstddef>
#include <cstdint>
#include <Adafruit_Fingerprint.h>

// Opcodes the Adafruit header names are taken from it; the rest follow the
// module datasheet.
enum class FpmCommand : uint8_t {
  GenImage = FINGERPRINT_GETIMAGE,
  GenChar = FINGERPRINT_IMAGE2TZ,
  Match = 0x03,
  Search = FINGERPRINT_SEARCH,
  RegModel = FINGERPRINT_REGMODEL,
  Store = FINGERPRINT_STORE,
  LoadChar = FINGERPRINT_LOAD,
  UpChar = FINGERPRINT_UPLOAD,
  DownChar = 0x09,
  UpImage = 0x0A,
  DownImage = 0x0B,
  DeleteChar = FINGERPRINT_DELETE,
  Empty = FINGERPRINT_EMPTY,
  SetSysPara = 0x0E,
  ReadSysPara = FINGERPRINT_READSYSPARAM,
  SetPwd = FINGERPRINT_SETPASSWORD,
  VfyPwd = FINGERPRINT_VERIFYPASSWORD,
  SetAddr = 0x15,
  HiSpeedSearch = FINGERPRINT_HISPEEDSEARCH,
  TemplateCount = FINGERPRINT_TEMPLATECOUNT
};

// What the sensor sends back after the acknowledge packet.
enum class FpmResponseShape : uint8_t {
  AckOnly = 0,
  AckThenData,    // data packets closed by an end-of-data packet
  AckThenUpload   // host streams data packets, sensor sends nothing more
};

// Which bound from FpmConfig limits an AckThenData response.
enum class FpmDataLimit : uint8_t {
  None = 0,
  Template,
  Image
};

struct FpmCommandSpec {
  FpmCommand command;
  const char* name;
  uint8_t paramSize;     // request bytes after the opcode
  uint8_t ackExtra;      // acknowledge bytes after the confirmation code
  FpmResponseShape shape;
  FpmDataLimit limit;
};

// Never returns null; every FpmCommand has an entry.
const FpmCommandSpec* fpmCommandSpec(FpmCommand command);
const char* fpmCommandName(FpmCommand command);
#endif // FPM_COMMAND_H
