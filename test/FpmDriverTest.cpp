#include <gtest/gtest.h>
#include <cstring>
#include <type_traits>
#include <vector>
#include "FpmDriver.h"
#include "ScriptedTransport.h"

namespace {

// ReadSysPara acknowledge body: status register, system id, capacity,
// security level, address, packet size code, baud multiplier.
std::vector<uint8_t> sysParams(uint16_t capacity, uint8_t sizeCode = 2, uint8_t baud = 6) {
  const uint8_t body[] = {
    0x00, 0x00,
    0x00, 0x09,
    (uint8_t)(capacity >> 8), (uint8_t)(capacity & 0xFF),
    0x00, 0x03,
    0xFF, 0xFF, 0xFF, 0xFF,
    0x00, sizeCode,
    0x00, baud
  };
  return std::vector<uint8_t>(body, body + sizeof(body));
}

class FpmDriverTest : public ::testing::Test {
  protected:
    FpmDriverTest() : driver(&transport) {}

    void startDriver(uint16_t capacity = 200) {
      transport.queueAck(0x00);
      transport.queueAck(0x00, sysParams(capacity));
      ASSERT_EQ(FpmInitError::None, driver.begin());
      transport.clearWritten();
    }

    ScriptedTransport transport;
    FpmDriver driver;
};

}  // namespace

TEST_F(FpmDriverTest, BeginVerifiesPasswordThenReadsParameters) {
  transport.queueAck(0x00);
  transport.queueAck(0x00, sysParams(300, 3, 12));

  ASSERT_EQ(FpmInitError::None, driver.begin());

  EXPECT_TRUE(driver.initialized());
  const uint8_t opcodes[] = {0x13, 0x0F};
  EXPECT_EQ(std::vector<uint8_t>(opcodes, opcodes + 2), transport.sentOpcodes());
  EXPECT_EQ(std::vector<uint8_t>(4, 0x00), transport.sentParams(0));

  const FpmParameters& p = driver.parameters();
  EXPECT_EQ(0x0009, p.systemId);
  EXPECT_EQ(300, p.capacity);
  EXPECT_EQ(3, p.securityLevel);
  EXPECT_EQ(0xFFFFFFFFu, p.address);
  EXPECT_EQ(256, p.packetSize);
  EXPECT_EQ(115200u, p.baudRate);
  EXPECT_EQ(300, driver.registry().capacity());
  EXPECT_EQ(256, driver.protocol().dataPacketSize());
}

TEST_F(FpmDriverTest, BeginWithoutSensorIsNoResponse) {
  EXPECT_EQ(FpmInitError::NoResponse, driver.begin());
  EXPECT_FALSE(driver.initialized());
}

TEST_F(FpmDriverTest, BeginWithWrongPassword) {
  transport.queueAck(0x13);
  EXPECT_EQ(FpmInitError::WrongPassword, driver.begin());
  EXPECT_FALSE(driver.initialized());
  EXPECT_EQ(1u, transport.sentOpcodes().size());
}

TEST_F(FpmDriverTest, BeginWhenParametersAreRefused) {
  transport.queueAck(0x00);
  transport.queueAck(0x01);
  EXPECT_EQ(FpmInitError::ParameterReadFailed, driver.begin());
  EXPECT_FALSE(driver.initialized());
}

TEST_F(FpmDriverTest, BeginSendsConfiguredPassword) {
  FpmConfig config;
  config.password = 0x01020304;
  FpmDriver locked(&transport, config);
  transport.queueAck(0x00);
  transport.queueAck(0x00, sysParams(100));

  ASSERT_EQ(FpmInitError::None, locked.begin());
  EXPECT_EQ((std::vector<uint8_t>{0x01, 0x02, 0x03, 0x04}), transport.sentParams(0));
}

TEST_F(FpmDriverTest, OperationsRequireBegin) {
  uint16_t count = 0;
  FpmMatch match;
  EXPECT_EQ(FpmError::NotInitialized, driver.templateCount(&count).error);
  EXPECT_EQ(FpmError::NotInitialized, driver.deleteTemplate(1).error);
  EXPECT_EQ(FpmError::NotInitialized, driver.deleteAll().error);
  EXPECT_EQ(FpmError::NotInitialized, driver.matchFinger(&match).error);
  EXPECT_EQ(FpmError::NotInitialized, driver.setSecurityLevel(3).error);
  EXPECT_EQ(FpmEnrollFailure::TransportFailure, driver.enroll(1).failure);
  EXPECT_TRUE(transport.written().empty());
}

TEST_F(FpmDriverTest, MatchFingerCapturesThenSearchesLibrary) {
  startDriver(200);
  transport.queueAck(0x02);  // no finger yet
  transport.queueAck(0x00);
  transport.queueAck(0x00);
  transport.queueAck(0x00, std::vector<uint8_t>{0x00, 0x05, 0x00, 0x64});

  FpmMatch match;
  ASSERT_TRUE(driver.matchFinger(&match).ok());

  EXPECT_TRUE(match.found);
  EXPECT_EQ(5, match.slot);
  EXPECT_EQ(100, match.confidence);
  const uint8_t opcodes[] = {0x01, 0x01, 0x02, 0x04};
  EXPECT_EQ(std::vector<uint8_t>(opcodes, opcodes + 4), transport.sentOpcodes());
  EXPECT_EQ((std::vector<uint8_t>{0x01, 0x00, 0x00, 0x00, 0xC8}), transport.sentParams(3));
}

TEST_F(FpmDriverTest, MatchFingerMissIsNotFound) {
  startDriver();
  transport.queueAck(0x00);
  transport.queueAck(0x00);
  transport.queueAck(0x09);

  FpmMatch match;
  FpmResult result = driver.matchFinger(&match);
  EXPECT_TRUE(result.exchanged());
  EXPECT_EQ(FpmOutcome::NotFound, result.outcome);
  EXPECT_FALSE(match.found);
}

TEST_F(FpmDriverTest, EnrollRunsWholeSession) {
  startDriver();
  for (int i = 0; i < 6; i++) {
    transport.queueAck(0x00);
  }
  FpmEnrollOutcome outcome = driver.enroll(3);
  EXPECT_TRUE(outcome.done);
  EXPECT_EQ(3, outcome.slot);
}

TEST_F(FpmDriverTest, EnrollBeyondCapacityIsRejected) {
  startDriver(10);
  FpmEnrollOutcome outcome = driver.enroll(10);
  EXPECT_FALSE(outcome.done);
  EXPECT_EQ(FpmEnrollFailure::StorageRejected, outcome.failure);
  EXPECT_TRUE(transport.written().empty());
}

TEST_F(FpmDriverTest, DeleteAllThenCountIsZero) {
  startDriver();
  transport.queueAck(0x00);
  transport.queueAck(0x00, std::vector<uint8_t>{0x00, 0x00});

  ASSERT_TRUE(driver.deleteAll().ok());
  uint16_t count = 42;
  ASSERT_TRUE(driver.templateCount(&count).ok());
  EXPECT_EQ(0, count);
}

TEST_F(FpmDriverTest, DeleteOutsideCapacityFailsFast) {
  startDriver(10);
  EXPECT_EQ(FpmOutcome::IdOutOfRange, driver.deleteTemplate(10).outcome);
  EXPECT_EQ(FpmOutcome::IdOutOfRange, driver.deleteTemplate(-1).outcome);
  EXPECT_TRUE(transport.written().empty());
}

TEST_F(FpmDriverTest, CompareBuffersReturnsScore) {
  startDriver();
  transport.queueAck(0x00, std::vector<uint8_t>{0x01, 0x2C});
  uint16_t score = 0;
  ASSERT_TRUE(driver.compareBuffers(&score).ok());
  EXPECT_EQ(300, score);

  transport.queueAck(0x08, std::vector<uint8_t>{0x00, 0x00});
  EXPECT_EQ(FpmOutcome::FingersMismatch, driver.compareBuffers(&score).outcome);
}

TEST_F(FpmDriverTest, TemplateRoundTripThroughHost) {
  startDriver();
  transport.queueAck(0x00);
  transport.queueData(std::vector<uint8_t>(128, 0xA5));
  transport.queueEndData(std::vector<uint8_t>(64, 0x5A));

  std::vector<uint8_t> stored;
  ASSERT_TRUE(driver.uploadTemplate(1, stored).ok());
  ASSERT_EQ(192u, stored.size());
  EXPECT_EQ(0xA5, stored[0]);
  EXPECT_EQ(0x5A, stored[191]);

  transport.clearWritten();
  transport.queueAck(0x00);
  ASSERT_TRUE(driver.downloadTemplate(2, stored).ok());
  std::vector<FpmPacket> sent = transport.sentPackets();
  ASSERT_EQ(3u, sent.size());
  EXPECT_EQ((std::vector<uint8_t>{0x09, 0x02}), sent[0].payload);
  EXPECT_EQ(FpmPacketKind::EndData, sent[2].kind);
}

TEST_F(FpmDriverTest, MatchTemplateComparesAgainstHostCopy) {
  startDriver();
  transport.queueAck(0x00);  // GenImage
  transport.queueAck(0x00);  // GenChar 1
  transport.queueAck(0x00);  // DownChar 2
  transport.queueAck(0x00, std::vector<uint8_t>{0x00, 0x50});

  uint16_t score = 0;
  ASSERT_TRUE(driver.matchTemplate(std::vector<uint8_t>(100, 0x33), &score).ok());
  EXPECT_EQ(80, score);
  const uint8_t opcodes[] = {0x01, 0x02, 0x09, 0x03};
  EXPECT_EQ(std::vector<uint8_t>(opcodes, opcodes + 4), transport.sentOpcodes());
}

TEST_F(FpmDriverTest, TemplateDigestHashesUploadedBytes) {
  startDriver();
  transport.queueAck(0x00);  // LoadChar
  transport.queueAck(0x00);  // UpChar
  transport.queueEndData(std::vector<uint8_t>{'a', 'b', 'c'});

  uint8_t digest[FpmDriver::HASH_SIZE];
  ASSERT_TRUE(driver.templateDigest(4, digest).ok());

  const uint8_t expected[32] = {
    0xBA, 0x78, 0x16, 0xBF, 0x8F, 0x01, 0xCF, 0xEA, 0x41, 0x41, 0x40, 0xDE, 0x5D, 0xAE, 0x22, 0x23,
    0xB0, 0x03, 0x61, 0xA3, 0x96, 0x17, 0x7A, 0x9C, 0xB4, 0x10, 0xFF, 0x61, 0xF2, 0x00, 0x15, 0xAD
  };
  EXPECT_TRUE(FpmDriver::digestEquals(expected, digest));
  EXPECT_EQ((std::vector<uint8_t>{0x01, 0x00, 0x04}), transport.sentParams(0));

  uint8_t other[32];
  memcpy(other, expected, sizeof(other));
  other[31] ^= 0x01;
  EXPECT_FALSE(FpmDriver::digestEquals(other, digest));
}

TEST_F(FpmDriverTest, TemplateDigestStopsWhenSlotIsEmpty) {
  startDriver();
  transport.queueAck(0x0C);
  uint8_t digest[FpmDriver::HASH_SIZE];
  EXPECT_EQ(FpmOutcome::TemplateReadFailed, driver.templateDigest(4, digest).outcome);
  EXPECT_EQ(1u, transport.sentOpcodes().size());
}

TEST_F(FpmDriverTest, UploadImageCollectsData) {
  startDriver();
  transport.queueAck(0x00);
  transport.queueData(std::vector<uint8_t>(128, 0x10));
  transport.queueEndData(std::vector<uint8_t>(128, 0x20));
  std::vector<uint8_t> image;
  ASSERT_TRUE(driver.uploadImage(image).ok());
  EXPECT_EQ(256u, image.size());
}

TEST_F(FpmDriverTest, SetAddressRetargetsLaterFrames) {
  startDriver();
  // the acknowledge already comes from the new address
  transport.setAddress(0x0A0B0C0D);
  transport.queueAck(0x00);
  FpmResult result = driver.setAddress(0x0A0B0C0D);
  ASSERT_TRUE(result.ok()) << "error=" << fpmErrorToString(result.error);
  EXPECT_EQ((std::vector<uint8_t>{0x0A, 0x0B, 0x0C, 0x0D}), transport.sentParams(0));
  // the command itself still went to the old address
  EXPECT_EQ(0xFF, transport.written()[2]);
  EXPECT_EQ(0xFF, transport.written()[5]);
  EXPECT_EQ(0x0A0B0C0Du, driver.protocol().address());
  EXPECT_EQ(0x0A0B0C0Du, driver.parameters().address);

  transport.clearWritten();
  transport.queueAck(0x00, std::vector<uint8_t>{0x00, 0x01});
  uint16_t count = 0;
  ASSERT_TRUE(driver.templateCount(&count).ok());
  EXPECT_EQ(0x0A, transport.written()[2]);
  EXPECT_EQ(0x0D, transport.written()[5]);
}

TEST_F(FpmDriverTest, SetAddressWithoutReplyKeepsOldAddress) {
  startDriver();
  FpmResult result = driver.setAddress(0x0A0B0C0D);
  EXPECT_EQ(FpmError::Timeout, result.error);
  EXPECT_EQ(0xFFFFFFFFu, driver.protocol().address());
  EXPECT_EQ(0xFFFFFFFFu, driver.parameters().address);
}

TEST_F(FpmDriverTest, SetAddressReplyFromOldAddressIsRejected) {
  startDriver();
  transport.queueAck(0x00);
  FpmResult result = driver.setAddress(0x0A0B0C0D);
  EXPECT_EQ(FpmError::FramingError, result.error);
  EXPECT_EQ(0xFFFFFFFFu, driver.protocol().address());

  // later exchanges still use the old address
  transport.queueAck(0x00, std::vector<uint8_t>{0x00, 0x02});
  uint16_t count = 0;
  ASSERT_TRUE(driver.templateCount(&count).ok());
  EXPECT_EQ(2, count);
}

TEST(FpmDriver, IsNotCopyable) {
  EXPECT_FALSE(std::is_copy_constructible<FpmDriver>::value);
  EXPECT_FALSE(std::is_copy_assignable<FpmDriver>::value);
}

TEST_F(FpmDriverTest, SetPasswordIsUsedForLaterVerification) {
  startDriver();
  transport.queueAck(0x00);
  ASSERT_TRUE(driver.setPassword(0x0000BEEF).ok());
  EXPECT_EQ((std::vector<uint8_t>{0x00, 0x00, 0xBE, 0xEF}), transport.sentParams(0));

  transport.queueAck(0x00);
  ASSERT_TRUE(driver.verifyPassword().ok());
  EXPECT_EQ((std::vector<uint8_t>{0x00, 0x00, 0xBE, 0xEF}), transport.sentParams(1));
}

TEST_F(FpmDriverTest, SystemRegistersAreWrittenWithDeviceCodes) {
  startDriver();
  transport.queueAck(0x00);
  transport.queueAck(0x00);
  transport.queueAck(0x00);

  ASSERT_TRUE(driver.setBaudRate(115200).ok());
  ASSERT_TRUE(driver.setSecurityLevel(5).ok());
  ASSERT_TRUE(driver.setPacketSize(64).ok());

  EXPECT_EQ((std::vector<uint8_t>{0x04, 12}), transport.sentParams(0));
  EXPECT_EQ((std::vector<uint8_t>{0x05, 5}), transport.sentParams(1));
  EXPECT_EQ((std::vector<uint8_t>{0x06, 1}), transport.sentParams(2));
  EXPECT_EQ(64, driver.protocol().dataPacketSize());
  EXPECT_EQ(115200u, driver.parameters().baudRate);
}

TEST_F(FpmDriverTest, UnsupportedRegisterValuesAreRefusedLocally) {
  startDriver();
  EXPECT_EQ(FpmOutcome::InvalidRegister, driver.setBaudRate(14400).outcome);
  EXPECT_EQ(FpmOutcome::InvalidRegister, driver.setBaudRate(0).outcome);
  EXPECT_EQ(FpmOutcome::InvalidRegister, driver.setBaudRate(9600 * 13).outcome);
  EXPECT_EQ(FpmOutcome::InvalidRegister, driver.setSecurityLevel(0).outcome);
  EXPECT_EQ(FpmOutcome::InvalidRegister, driver.setSecurityLevel(6).outcome);
  EXPECT_EQ(FpmOutcome::InvalidRegister, driver.setPacketSize(100).outcome);
  EXPECT_TRUE(transport.written().empty());
}

TEST_F(FpmDriverTest, ResyncDropsStaleInputAndReadsStatus) {
  startDriver();
  transport.queueRaw(std::vector<uint8_t>(5, 0x77));
  transport.holdUntilDiscard(true);
  transport.queueAck(0x00, sysParams(200));
  transport.holdUntilDiscard(false);
  size_t discards = transport.discards();

  ASSERT_TRUE(driver.resync().ok());
  EXPECT_EQ(discards + 1, transport.discards());
  EXPECT_EQ(0u, transport.pending());
  EXPECT_EQ(std::vector<uint8_t>(1, 0x0F), transport.sentOpcodes());
}

TEST_F(FpmDriverTest, ResyncWithSilentSensorTimesOut) {
  startDriver();
  EXPECT_EQ(FpmError::Timeout, driver.resync().error);
  EXPECT_TRUE(driver.initialized());
}

TEST_F(FpmDriverTest, R503SearchOnEmptyTemplateIsNotFound) {
  FpmDriver grow(&transport, FpmConfig::forModel(FpmSensorModel::R503));
  transport.queueAck(0x00);
  transport.queueAck(0x00, sysParams(200));
  ASSERT_EQ(FpmInitError::None, grow.begin());

  transport.queueAck(0x00);
  transport.queueAck(0x00);
  transport.queueAck(0x22);
  FpmMatch match;
  FpmResult result = grow.matchFinger(&match);
  EXPECT_EQ(FpmOutcome::NotFound, result.outcome);
  EXPECT_EQ(0x22, result.status);
}

TEST(FpmInitErrorStrings, NamesAreStable) {
  EXPECT_STREQ("wrong password", fpmInitErrorToString(FpmInitError::WrongPassword));
}
