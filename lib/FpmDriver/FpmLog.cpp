#include "FpmLog.h"
#include <cstdarg>
#include <cstdio>

Print* FpmLog::_out = nullptr;
FpmLogLevel FpmLog::_level = FpmLogLevel::None;

static char levelLetter(FpmLogLevel level) {
  switch (level) {
    case FpmLogLevel::Error: return 'E';
    case FpmLogLevel::Warn: return 'W';
    case FpmLogLevel::Info: return 'I';
    case FpmLogLevel::Debug: return 'D';
    case FpmLogLevel::Verbose: return 'V';
    default: return '?';
  }
}

void FpmLog::begin(Print* out, FpmLogLevel level) {
  _out = out;
  _level = level;
}

void FpmLog::end() {
  _out = nullptr;
  _level = FpmLogLevel::None;
}

bool FpmLog::enabled(FpmLogLevel level) {
  return _out != nullptr && level != FpmLogLevel::None &&
         static_cast<uint8_t>(level) <= static_cast<uint8_t>(_level);
}

void FpmLog::write(FpmLogLevel level, const char* tag, const char* format, ...) {
  if (!enabled(level)) {
    return;
  }
  char line[LINE_SIZE];
  int used = snprintf(line, sizeof(line), "[%c][%s] ", levelLetter(level), tag);
  if (used < 0) {
    return;
  }
  if (static_cast<size_t>(used) < sizeof(line)) {
    va_list args;
    va_start(args, format);
    vsnprintf(line + used, sizeof(line) - used, format, args);
    va_end(args);
  }
  _out->println(line);
}

void FpmLog::hex(FpmLogLevel level, const char* tag, const char* label,
                 const uint8_t* data, size_t size) {
  if (!enabled(level)) {
    return;
  }
  char line[LINE_SIZE];
  int used = snprintf(line, sizeof(line), "[%c][%s] %s (%u):", levelLetter(level), tag, label,
                      static_cast<unsigned>(size));
  if (used < 0) {
    return;
  }
  size_t pos = static_cast<size_t>(used);
  for (size_t i = 0; i < size; i++) {
    // 3 chars per byte plus the "..." marker and terminator
    if (pos + 3 + 4 >= sizeof(line)) {
      snprintf(line + pos, sizeof(line) - pos, " ...");
      break;
    }
    pos += snprintf(line + pos, sizeof(line) - pos, " %02X", data[i]);
  }
  _out->println(line);
}
