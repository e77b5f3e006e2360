#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/state_machine.hpp"

namespace sessionkeeper::db::model {

/*
  Persistent session row.

  IMPORTANT:
  - This is the authoritative state machine record.
  - Only metadata lives here; the live driver handle never does.
  - Timestamps are unix milliseconds.
*/

struct SessionRecord {
  std::string id;
  std::string owner;
  std::string target_url;

  // Absent until the job produces its first checkpoint.
  std::optional<std::string> resume_token;

  sessionkeeper::model::SessionStatus status = sessionkeeper::model::SessionStatus::kUnspecified;

  uint64_t created_at_ms        = 0;
  uint64_t last_active_at_ms    = 0;
  uint64_t status_changed_at_ms = 0;
};

} // namespace sessionkeeper::db::model
