#ifndef FPM_LOG_H
#define FPM_LOG_H
#include <Arduino.h>
#include <cstddef>
#include <cstdint>

enum class FpmLogLevel : uint8_t {
  None = 0,
  Error,
  Warn,
  Info,
  Debug,
  Verbose
};

// Debug output for the driver, written to any Arduino Print (usually Serial).
// Nothing is printed until begin() installs a sink.
class FpmLog {
  public:
    static const size_t LINE_SIZE = 160;

    static void begin(Print* out, FpmLogLevel level = FpmLogLevel::Info);
    static void end();
    static bool enabled(FpmLogLevel level);
    static void write(FpmLogLevel level, const char* tag, const char* format, ...)
      __attribute__((format(printf, 3, 4)));
    static void hex(FpmLogLevel level, const char* tag, const char* label,
                    const uint8_t* data, size_t size);
  private:
    static Print* _out;
    static FpmLogLevel _level;
};

#define FPM_LOGE(tag, ...) FpmLog::write(FpmLogLevel::Error, tag, __VA_ARGS__)
#define FPM_LOGW(tag, ...) FpmLog::write(FpmLogLevel::Warn, tag, __VA_ARGS__)
#define FPM_LOGI(tag, ...) FpmLog::write(FpmLogLevel::Info, tag, __VA_ARGS__)
#define FPM_LOGD(tag, ...) FpmLog::write(FpmLogLevel::Debug, tag, __VA_ARGS__)
#define FPM_LOGV(tag, ...) FpmLog::write(FpmLogLevel::Verbose, tag, __VA_ARGS__)
#define FPM_LOG_HEX(level, tag, label, data, size) FpmLog::hex(level, tag, label, data, size)
#endif // FPM_LOG_H
