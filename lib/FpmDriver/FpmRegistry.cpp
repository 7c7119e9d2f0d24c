#include "FpmRegistry.h"
#include "FpmLog.h"
#include <Adafruit_Fingerprint.h>

static const char* const TAG = "fpm.lib";

FpmTemplateRegistry::FpmTemplateRegistry(FpmProtocol* protocol) {
  _protocol = protocol;
  _capacity = 0;
}

void FpmTemplateRegistry::_putU16(std::vector<uint8_t>& out, uint16_t value) {
  out.push_back((value >> 8) & 0xFF);
  out.push_back(value & 0xFF);
}

// Until the capacity is known only the 16-bit wire range is enforced.
bool FpmTemplateRegistry::validSlot(int slot) const {
  if (slot < 0 || slot > 0xFFFF) {
    return false;
  }
  return _capacity == 0 || slot < _capacity;
}

FpmResult FpmTemplateRegistry::count(uint16_t* count) {
  FpmCommandResult result = _protocol->execute(FpmCommand::TemplateCount);
  if (result.ok()) {
    *count = (uint16_t)((result.params[0] << 8) | result.params[1]);
    FPM_LOGD(TAG, "Template count: %u", *count);
  }
  return result;
}

FpmResult FpmTemplateRegistry::_search(FpmCommand command, uint8_t featureBuffer, FpmMatch* match) {
  *match = FpmMatch();
  std::vector<uint8_t> params;
  params.push_back(featureBuffer);
  _putU16(params, 0);
  _putU16(params, _capacity == 0 ? 0xFFFF : _capacity);

  FpmCommandResult result = _protocol->execute(command, params);
  if (!result.exchanged()) {
    return result;
  }
  switch (result.outcome) {
    case FpmOutcome::Success:
      match->found = true;
      match->slot = (uint16_t)((result.params[0] << 8) | result.params[1]);
      match->confidence = (uint16_t)((result.params[2] << 8) | result.params[3]);
      FPM_LOGI(TAG, "Found slot %u, confidence %u", match->slot, match->confidence);
      return result;
    case FpmOutcome::NotFound:
    case FpmOutcome::TemplateEmpty:
    case FpmOutcome::LibraryEmpty:
      FPM_LOGI(TAG, "No match (%s)", fpmOutcomeToString(result.outcome));
      return FpmResult(result.status, FpmOutcome::NotFound);
    default:
      FPM_LOGW(TAG, "%s failed: %s", fpmCommandName(command), fpmOutcomeToString(result.outcome));
      return result;
  }
}

FpmResult FpmTemplateRegistry::search(uint8_t featureBuffer, FpmMatch* match) {
  return _search(FpmCommand::Search, featureBuffer, match);
}

FpmResult FpmTemplateRegistry::fastSearch(uint8_t featureBuffer, FpmMatch* match) {
  return _search(FpmCommand::HiSpeedSearch, featureBuffer, match);
}

FpmResult FpmTemplateRegistry::deleteOne(int slot) {
  if (!validSlot(slot)) {
    FPM_LOGW(TAG, "Delete: slot %d outside 0..%u", slot, _capacity);
    return FpmResult(FINGERPRINT_BADLOCATION, FpmOutcome::IdOutOfRange);
  }
  std::vector<uint8_t> params;
  _putU16(params, (uint16_t)slot);
  _putU16(params, 1);
  FpmResult result = _protocol->execute(FpmCommand::DeleteChar, params);
  if (result.ok()) {
    FPM_LOGI(TAG, "Deleted slot %d", slot);
  }
  return result;
}

FpmResult FpmTemplateRegistry::deleteAll() {
  FpmResult result = _protocol->execute(FpmCommand::Empty);
  if (result.ok()) {
    FPM_LOGI(TAG, "Library emptied");
  }
  return result;
}

FpmResult FpmTemplateRegistry::store(uint8_t featureBuffer, int slot) {
  if (!validSlot(slot)) {
    FPM_LOGW(TAG, "Store: slot %d outside 0..%u", slot, _capacity);
    return FpmResult(FINGERPRINT_BADLOCATION, FpmOutcome::IdOutOfRange);
  }
  std::vector<uint8_t> params;
  params.push_back(featureBuffer);
  _putU16(params, (uint16_t)slot);
  return _protocol->execute(FpmCommand::Store, params);
}

FpmResult FpmTemplateRegistry::load(int slot, uint8_t featureBuffer) {
  if (!validSlot(slot)) {
    FPM_LOGW(TAG, "Load: slot %d outside 0..%u", slot, _capacity);
    return FpmResult(FINGERPRINT_BADLOCATION, FpmOutcome::IdOutOfRange);
  }
  std::vector<uint8_t> params;
  params.push_back(featureBuffer);
  _putU16(params, (uint16_t)slot);
  return _protocol->execute(FpmCommand::LoadChar, params);
}
