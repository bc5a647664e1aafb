#pragma once

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"

namespace slotkeeper::db {

inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = context + ": " + result.message;
  if (IsStoreUnavailable(result.code)) {
    throw util::StoreUnavailable(message);
  }
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
    case ErrorCode::ConstraintViolation:
      throw util::AlreadyExists(message);
    case ErrorCode::Conflict:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

inline void Commit(Transaction& tx) {
  try {
    tx.Commit();
  } catch (const std::runtime_error& e) {
    throw util::StoreUnavailable(std::string("commit: ") + e.what());
  }
}

/*
  Runs fn(tx) inside one transaction holding every scope in `scopes`.

  Scopes are sorted and deduplicated first so concurrent callers always
  lock in the same order. The transaction commits only when fn returns;
  an exception from fn rolls it back.
*/
template <typename Fn>
auto WithScopes(Repository& repo, std::vector<LockScope> scopes, Fn&& fn) -> decltype(fn(std::declval<Transaction&>())) {
  std::sort(scopes.begin(), scopes.end());
  scopes.erase(std::unique(scopes.begin(), scopes.end()), scopes.end());

  std::unique_ptr<Transaction> tx;
  try {
    tx = repo.Begin();
  } catch (const std::runtime_error& e) {
    throw util::StoreUnavailable(std::string("begin transaction: ") + e.what());
  }

  for (const auto& scope : scopes) {
    ThrowIfDbError(repo.AcquireScope(*tx, scope), "acquire scope");
  }

  if constexpr (std::is_void_v<decltype(fn(*tx))>) {
    fn(*tx);
    Commit(*tx);
  } else {
    auto result = fn(*tx);
    Commit(*tx);
    return result;
  }
}

template <typename Fn>
auto WithClientLock(Repository& repo, const std::string& project_id, const std::string& client_id, Fn&& fn) {
  return WithScopes(repo, {LockScope::Client(project_id, client_id)}, std::forward<Fn>(fn));
}

// Unlocked read-only transaction; rolled back on scope exit.
template <typename Fn>
auto ReadOnly(Repository& repo, Fn&& fn) {
  std::unique_ptr<Transaction> tx;
  try {
    tx = repo.Begin();
  } catch (const std::runtime_error& e) {
    throw util::StoreUnavailable(std::string("begin transaction: ") + e.what());
  }
  return fn(*tx);
}

} // namespace slotkeeper::db
