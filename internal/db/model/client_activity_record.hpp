#pragma once

#include <cstdint>
#include <string>

namespace slotkeeper::db::model {

struct ClientActivityRecord {
  std::string project_id;
  std::string client_id;
  uint64_t    last_message_at_ms = 0;
};

} // namespace slotkeeper::db::model
