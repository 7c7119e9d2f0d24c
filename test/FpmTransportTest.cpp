#include <gtest/gtest.h>
#include <deque>
#include <string>
#include <vector>
#include "FpmLog.h"
#include "FpmTransport.h"

namespace {

// In-memory Stream: bytes written go to `tx`, reads come from `rx`.
class LoopStream : public Stream {
  public:
    LoopStream() : writeLimit(-1), flushes(0) {}

    int available() override { return (int)rx.size(); }
    int read() override {
      if (rx.empty()) {
        return -1;
      }
      int b = rx.front();
      rx.pop_front();
      return b;
    }
    int peek() override { return rx.empty() ? -1 : rx.front(); }
    void flush() override { flushes++; }
    size_t write(uint8_t b) override {
      if (writeLimit >= 0 && (int)tx.size() >= writeLimit) {
        return 0;
      }
      tx.push_back(b);
      return 1;
    }
    using Print::write;

    std::deque<uint8_t> rx;
    std::vector<uint8_t> tx;
    int writeLimit;
    int flushes;
};

class CapturePrint : public Print {
  public:
    size_t write(uint8_t b) override {
      text += (char)b;
      return 1;
    }
    using Print::write;

    std::string text;
};

}  // namespace

TEST(FpmStreamTransport, WritesAndFlushes) {
  LoopStream stream;
  FpmStreamTransport transport(&stream);
  const uint8_t frame[] = {0xEF, 0x01, 0x02};

  EXPECT_EQ(FpmError::None, transport.write(frame, sizeof(frame)));
  EXPECT_EQ(std::vector<uint8_t>(frame, frame + 3), stream.tx);
  EXPECT_EQ(1, stream.flushes);
}

TEST(FpmStreamTransport, ShortWriteIsAnIoError) {
  LoopStream stream;
  stream.writeLimit = 2;
  FpmStreamTransport transport(&stream);
  const uint8_t frame[] = {0xEF, 0x01, 0x02};
  EXPECT_EQ(FpmError::IoError, transport.write(frame, sizeof(frame)));
}

TEST(FpmStreamTransport, ReadsExactlyTheRequestedBytes) {
  LoopStream stream;
  for (uint8_t b = 1; b <= 5; b++) {
    stream.rx.push_back(b);
  }
  FpmStreamTransport transport(&stream);

  uint8_t buffer[3] = {0, 0, 0};
  ASSERT_EQ(FpmError::None, transport.readExact(buffer, 3, 100));
  EXPECT_EQ(1, buffer[0]);
  EXPECT_EQ(3, buffer[2]);
  EXPECT_EQ(2u, stream.rx.size());
}

TEST(FpmStreamTransport, MissingBytesTimeOut) {
  LoopStream stream;
  stream.rx.push_back(0xEF);
  FpmStreamTransport transport(&stream);

  uint8_t buffer[2];
  EXPECT_EQ(FpmError::Timeout, transport.readExact(buffer, 2, 0));
}

TEST(FpmStreamTransport, DiscardDrainsInput) {
  LoopStream stream;
  stream.rx.assign(7, 0x55);
  FpmStreamTransport transport(&stream);
  transport.discardInput();
  EXPECT_TRUE(stream.rx.empty());
}

TEST(FpmStreamTransport, NullStreamIsAnIoError) {
  FpmStreamTransport transport(nullptr);
  uint8_t b = 0;
  EXPECT_EQ(FpmError::IoError, transport.write(&b, 1));
  EXPECT_EQ(FpmError::IoError, transport.readExact(&b, 1, 10));
  transport.discardInput();
}

TEST(FpmLog, FormatsLevelAndTag) {
  CapturePrint sink;
  FpmLog::begin(&sink, FpmLogLevel::Info);
  FPM_LOGI("fpm.test", "slot %d", 7);
  FPM_LOGD("fpm.test", "hidden");
  FpmLog::end();

  EXPECT_NE(std::string::npos, sink.text.find("[I][fpm.test] slot 7"));
  EXPECT_EQ(std::string::npos, sink.text.find("hidden"));
}

TEST(FpmLog, SilentWithoutSink) {
  FpmLog::end();
  EXPECT_FALSE(FpmLog::enabled(FpmLogLevel::Error));
  FPM_LOGE("fpm.test", "dropped");
}

TEST(FpmLog, HexDumpIsBounded) {
  CapturePrint sink;
  FpmLog::begin(&sink, FpmLogLevel::Verbose);
  const uint8_t small[] = {0xEF, 0x01};
  FPM_LOG_HEX(FpmLogLevel::Verbose, "fpm.test", "tx", small, sizeof(small));
  std::vector<uint8_t> big(200, 0xAB);
  FPM_LOG_HEX(FpmLogLevel::Verbose, "fpm.test", "rx", &big[0], big.size());
  FpmLog::end();

  EXPECT_NE(std::string::npos, sink.text.find("[V][fpm.test] tx (2): EF 01"));
  EXPECT_NE(std::string::npos, sink.text.find("rx (200):"));
  EXPECT_NE(std::string::npos, sink.text.find(" ..."));
}
