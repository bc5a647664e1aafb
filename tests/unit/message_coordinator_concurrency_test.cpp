#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/message_coordinator.hpp"
#include "internal/db/memory/memory_repository.hpp"

namespace {

using slotkeeper::core::ClaimOutcome;
using slotkeeper::core::InboundEvent;
using slotkeeper::core::MessageCoordinator;
using slotkeeper::db::memory::MemoryRepository;
using slotkeeper::db::model::QueuedMessageRecord;

// Webhooks of one client arrive on parallel workers, then every worker runs its turn.
void TestExactlyOneWinnerPerBurst() {
  auto repository  = std::make_shared<MemoryRepository>();
  auto coordinator = std::make_shared<MessageCoordinator>(repository);

  constexpr int kWorkers = 16;

  std::vector<std::string> ids(kWorkers);
  std::vector<std::thread> submitters;
  for (int i = 0; i < kWorkers; ++i) {
    submitters.emplace_back([&, i] {
      auto item = coordinator->Submit(InboundEvent{"salon", "c1", "m" + std::to_string(i)});
      assert(item.has_value());
      ids[static_cast<size_t>(i)] = item->id;
    });
  }
  for (auto& thread : submitters) thread.join();

  std::atomic<int>         wins{0};
  std::mutex               mutex;
  std::vector<std::string> winners;
  std::vector<std::thread> threads;

  for (int i = 0; i < kWorkers; ++i) {
    threads.emplace_back([&, i] {
      const auto& id = ids[static_cast<size_t>(i)];
      if (!coordinator->BeginTurn(id)) return;
      std::this_thread::yield();
      if (coordinator->ClaimWinner(id) == ClaimOutcome::kWin) {
        ++wins;
        std::lock_guard lock(mutex);
        winners.push_back(id);
      }
    });
  }
  for (auto& thread : threads) thread.join();

  assert(wins == 1);

  auto tx   = repository->Begin();
  auto rows = repository->ListClientMessages(*tx, "salon", "c1");
  tx->Commit();
  assert(rows.size() == kWorkers);

  // the winner is the newest row, and its text carries every message
  const QueuedMessageRecord* latest = &rows.front();
  for (const auto& row : rows) {
    if (slotkeeper::db::model::IsNewer(row, *latest)) latest = &row;
  }
  assert(latest->id == winners.front());
  for (int i = 0; i < kWorkers; ++i) {
    assert(latest->aggregated_text.find("m" + std::to_string(i)) != std::string::npos);
  }
}

// Concurrent claims on the same set of items never produce two winners.
void TestConcurrentClaimsOnSameItems() {
  auto repository  = std::make_shared<MemoryRepository>();
  auto coordinator = std::make_shared<MessageCoordinator>(repository);

  std::vector<std::string> ids;
  for (int i = 0; i < 4; ++i) {
    auto item = coordinator->Submit(InboundEvent{"salon", "c9", "m" + std::to_string(i)});
    ids.push_back(item->id);
  }

  std::atomic<int>         wins{0};
  std::vector<std::thread> threads;
  for (int round = 0; round < 3; ++round) {
    for (const auto& id : ids) {
      threads.emplace_back([&, id] {
        if (coordinator->ClaimWinner(id) == ClaimOutcome::kWin) ++wins;
      });
    }
  }
  for (auto& thread : threads) thread.join();

  assert(wins == 1);
}

// Different clients never block each other's outcome.
void TestClientsAreIndependent() {
  auto repository  = std::make_shared<MemoryRepository>();
  auto coordinator = std::make_shared<MessageCoordinator>(repository);

  constexpr int kClients = 8;

  std::atomic<int>         wins{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kClients; ++i) {
    threads.emplace_back([&, i] {
      auto item = coordinator->Submit(InboundEvent{"salon", "client-" + std::to_string(i), "hi"});
      coordinator->BeginTurn(item->id);
      if (coordinator->ClaimWinner(item->id) == ClaimOutcome::kWin) ++wins;
    });
  }
  for (auto& thread : threads) thread.join();

  assert(wins == kClients);
}

} // namespace

int main() {
  TestExactlyOneWinnerPerBurst();
  TestConcurrentClaimsOnSameItems();
  TestClientsAreIndependent();

  std::cout << "slotkeeper_unit_message_coordinator_concurrency: pass\n";
  return 0;
}
