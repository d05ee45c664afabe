#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "WorkState.hpp"

namespace mmig {

// One asset as reported by a source listing.
struct SourceItem {
  std::string source_id;
  std::string name;
  int64_t     size = 0;
  int64_t     created_at = 0;
};

// One row of the work_items table.
struct WorkItem {
  std::string source_id;
  std::string name;
  int64_t     size = 0;
  int64_t     source_created_at = 0;
  WorkState   state = WorkState::Discovered;

  std::optional<std::string> lease_owner;
  std::optional<int64_t>     lease_expires_at;
  int64_t                    attempt_count = 0;
  bool                       terminal = false;

  std::optional<std::string> content_ref;
  std::optional<std::string> content_hash;
  std::optional<std::string> destination_id;
  std::optional<std::string> last_error;

  int64_t created_at = 0;
  int64_t updated_at = 0;
};

// Fields a commit may set. Unset content fields keep their stored value;
// last_error is replaced (cleared when unset).
struct ItemUpdate {
  std::optional<std::string> content_ref;
  std::optional<std::string> content_hash;
  std::optional<std::string> destination_id;
  std::optional<std::string> last_error;
};

// One row of item_history.
struct HistoryEntry {
  int64_t                  id = 0;
  std::string              source_id;
  TransitionKind           kind = TransitionKind::Register;
  std::optional<WorkState> from;
  WorkState                to = WorkState::Discovered;
  int64_t                  at = 0;
  std::string              actor;
  std::string              details;
};

} // namespace mmig
