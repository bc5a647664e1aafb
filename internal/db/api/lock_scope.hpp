#pragma once

#include <compare>
#include <string>

namespace slotkeeper::db {

/*
  A named set of rows a transaction locks before reading them.

  Client scope: every queued_messages row of (project, client), whatever its
  status. Terminal and superseded rows are part of the scope so a late
  ClaimWinner still sees every newer item.

  Calendar scope: every bookings row of (project, specialist, date).

  Scopes order by Key(); callers locking several scopes take them in that
  order.
*/

enum class LockScopeKind {
  kClient,
  kCalendar,
};

struct LockScope {
  LockScopeKind kind = LockScopeKind::kClient;
  std::string   project_id;
  std::string   subject;  // client id or specialist
  std::string   date;     // calendar scopes only

  static LockScope Client(std::string project_id, std::string client_id) {
    return {LockScopeKind::kClient, std::move(project_id), std::move(client_id), {}};
  }

  static LockScope Calendar(std::string project_id, std::string specialist, std::string date) {
    return {LockScopeKind::kCalendar, std::move(project_id), std::move(specialist), std::move(date)};
  }

  std::string Key() const {
    const char* prefix = kind == LockScopeKind::kClient ? "client" : "calendar";
    return std::string(prefix) + '\x1f' + project_id + '\x1f' + subject + '\x1f' + date;
  }

  bool operator==(const LockScope& other) const {
    return Key() == other.Key();
  }

  std::strong_ordering operator<=>(const LockScope& other) const {
    return Key() <=> other.Key();
  }
};

} // namespace slotkeeper::db
