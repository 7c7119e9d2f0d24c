#ifndef FPM_REGISTRY_H
#define FPM_REGISTRY_H
#include <cstdint>
#include <vector>
#include "FpmProtocol.h"
#include "FpmStatus.h"

struct FpmMatch {
  bool found;
  uint16_t slot;
  uint16_t confidence;

  FpmMatch() : found(false), slot(0), confidence(0) {}
};

// Queries and edits of the sensor's template library. The sensor is the only
// source of truth; nothing about slot contents is remembered here.
class FpmTemplateRegistry {
  public:
    explicit FpmTemplateRegistry(FpmProtocol* protocol);

    void setCapacity(uint16_t capacity) { _capacity = capacity; }
    uint16_t capacity() const { return _capacity; }
    bool validSlot(int slot) const;

    FpmResult count(uint16_t* count);
    // A miss (not found, empty template or empty library) comes back as
    // exchanged() with outcome NotFound and match->found == false.
    FpmResult search(uint8_t featureBuffer, FpmMatch* match);
    FpmResult fastSearch(uint8_t featureBuffer, FpmMatch* match);
    FpmResult deleteOne(int slot);
    FpmResult deleteAll();
    FpmResult store(uint8_t featureBuffer, int slot);
    FpmResult load(int slot, uint8_t featureBuffer);
  private:
    FpmProtocol* _protocol;
    uint16_t _capacity;

    FpmResult _search(FpmCommand command, uint8_t featureBuffer, FpmMatch* match);
    static void _putU16(std::vector<uint8_t>& out, uint16_t value);
};
#endif // FPM_REGISTRY_H
