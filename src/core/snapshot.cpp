#include "slingnet/core/snapshot.h"

namespace slingnet {

const char* snapshot_type_to_string(SnapshotType t) {
  switch (t) {
    case SnapshotType::Energy: return "ENERGY";
    case SnapshotType::RoundSub: return "ROUND_SUB";
    case SnapshotType::Round: return "ROUND";
    case SnapshotType::Final: return "FINAL";
  }
  return "FINAL";
}

} // namespace slingnet
