#include <atomic>
#include <cassert>
#include <climits>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/slot_allocator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/mirror/memory_mirror.hpp"
#include "internal/util/errors.hpp"

namespace {

using slotkeeper::core::BookingDetails;
using slotkeeper::core::SlotAllocator;
using slotkeeper::db::memory::MemoryRepository;
using slotkeeper::mirror::MemoryMirror;
using slotkeeper::mirror::MirrorRecord;
using slotkeeper::mirror::MirrorScheduler;
using slotkeeper::model::BookingStatus;
using slotkeeper::model::CivilDate;
using slotkeeper::model::ProjectRegistry;
using slotkeeper::model::ProjectSettings;
using slotkeeper::model::TimeOfDay;

const CivilDate kDay = CivilDate::Parse("2026-03-02", 0);

// ReadSlot fails as if the mirror host were down.
class UnreachableMirror : public MemoryMirror {
 public:
  std::optional<MirrorRecord> ReadSlot(const std::string&, const std::string&, const CivilDate&, TimeOfDay) override {
    throw slotkeeper::util::MirrorSyncError("mirror offline");
  }
};

struct Fixture {
  std::shared_ptr<MemoryRepository> repository = std::make_shared<MemoryRepository>();
  std::shared_ptr<MemoryMirror>     mirror     = std::make_shared<MemoryMirror>();
  std::shared_ptr<MirrorScheduler>  scheduler  = std::make_shared<MirrorScheduler>();
  std::shared_ptr<SlotAllocator>    allocator;

  explicit Fixture(std::shared_ptr<MemoryMirror> custom_mirror = nullptr) {
    if (custom_mirror) mirror = std::move(custom_mirror);

    ProjectSettings settings;
    settings.project_id   = "salon";
    settings.slot_minutes = 30;
    settings.work_start   = TimeOfDay{9 * 60};
    settings.work_end     = TimeOfDay{18 * 60};
    settings.specialists  = {"Anna", "Boris"};
    settings.services     = {{"Haircut", 60}};

    auto projects = std::make_shared<const ProjectRegistry>(std::vector<ProjectSettings>{settings});
    allocator     = std::make_shared<SlotAllocator>(repository, projects, mirror, scheduler);
  }
};

BookingDetails Client(const std::string& id) {
  return {id, "Name " + id, "+100" + id, "Haircut"};
}

TimeOfDay At(const char* text) {
  return TimeOfDay::Parse(text);
}

template <typename Error, typename Fn>
void ExpectThrows(Fn&& fn) {
  bool threw = false;
  try {
    fn();
  } catch (const Error&) {
    threw = true;
  }
  assert(threw);
}

void TestAllocateRemovesSlotsFromAvailability() {
  Fixture f;
  const auto before = f.allocator->GetAvailableSlots("salon", "Anna", kDay, 1);
  assert(before.size() == 18);

  const auto booking = f.allocator->Allocate("salon", "Anna", kDay, At("10:00"), 2, Client("c1"));
  assert(booking.status == BookingStatus::kActive);
  assert(booking.date == "2026-03-02");
  assert(booking.revision == 1);
  assert(!booking.mirror_synced);

  const auto after = f.allocator->GetAvailableSlots("salon", "Anna", kDay, 1);
  assert(after.size() == 16);
  for (const auto& slot : after) {
    assert(slot.minutes != 600 && slot.minutes != 630);
  }

  // another specialist is unaffected
  assert(f.allocator->GetAvailableSlots("salon", "Boris", kDay, 1).size() == 18);
  assert(f.scheduler->Pending() == 1);
}

void TestOverlappingAllocationConflicts() {
  Fixture f;
  f.allocator->Allocate("salon", "Anna", kDay, At("10:00"), 2, Client("c1"));

  ExpectThrows<slotkeeper::util::ConflictError>(
      [&] { f.allocator->Allocate("salon", "Anna", kDay, At("10:30"), 1, Client("c2")); });
  ExpectThrows<slotkeeper::util::ConflictError>(
      [&] { f.allocator->Allocate("salon", "Anna", kDay, At("09:30"), 2, Client("c2")); });

  // back-to-back is fine
  f.allocator->Allocate("salon", "Anna", kDay, At("11:00"), 1, Client("c2"));
  f.allocator->Allocate("salon", "Anna", kDay, At("09:30"), 1, Client("c3"));
}

void TestValidationRejectsBadRequests() {
  Fixture f;
  using slotkeeper::util::ValidationError;

  ExpectThrows<ValidationError>([&] { f.allocator->Allocate("salon", "Anna", kDay, At("10:15"), 1, Client("c1")); });
  ExpectThrows<ValidationError>([&] { f.allocator->Allocate("salon", "Anna", kDay, At("08:30"), 1, Client("c1")); });
  ExpectThrows<ValidationError>([&] { f.allocator->Allocate("salon", "Anna", kDay, At("17:30"), 2, Client("c1")); });
  ExpectThrows<ValidationError>([&] { f.allocator->Allocate("salon", "Anna", kDay, At("10:00"), 0, Client("c1")); });
  ExpectThrows<ValidationError>([&] { f.allocator->Allocate("salon", "Olga", kDay, At("10:00"), 1, Client("c1")); });
  ExpectThrows<ValidationError>([&] { f.allocator->Allocate("spa", "Anna", kDay, At("10:00"), 1, Client("c1")); });
  ExpectThrows<ValidationError>([&] { f.allocator->Allocate("salon", "Anna", kDay, At("10:00"), 1, Client("")); });
  ExpectThrows<ValidationError>([&] { f.allocator->GetAvailableSlots("salon", "Anna", kDay, 0); });

  assert(f.scheduler->Pending() == 0);
}

void TestDurationLongerThanTheDayIsRejected() {
  Fixture f;
  using slotkeeper::util::ValidationError;

  ExpectThrows<ValidationError>([&] { f.allocator->Allocate("salon", "Anna", kDay, At("10:00"), INT_MAX, Client("c1")); });
  ExpectThrows<ValidationError>([&] { f.allocator->Allocate("salon", "Anna", kDay, At("09:00"), 19, Client("c1")); });
  ExpectThrows<ValidationError>([&] { f.allocator->GetAvailableSlots("salon", "Anna", kDay, INT_MAX); });
  ExpectThrows<ValidationError>([&] { f.allocator->GetAvailableSlots("salon", "Anna", kDay, 19); });
  assert(f.allocator->Stats("salon").active == 0);

  // the whole day is still bookable
  assert((f.allocator->GetAvailableSlots("salon", "Anna", kDay, 18) == std::vector<TimeOfDay>{At("09:00")}));
  auto booking = f.allocator->Allocate("salon", "Anna", kDay, At("09:00"), 18, Client("c1"));
  ExpectThrows<ValidationError>([&] { f.allocator->Change(booking.id, "Anna", kDay, At("09:00"), INT_MAX); });
  const auto stored = f.allocator->ClientBookings("salon", "c1");
  assert(stored.size() == 1 && stored.front().duration_slots == 18);
}

void TestMirrorRowBlocksAllocation() {
  Fixture f;
  f.mirror->SetSlot("salon", "Anna", kDay, At("14:00"), MirrorRecord{"walk-in", "Walk In", "Haircut"});

  ExpectThrows<slotkeeper::util::ConflictError>(
      [&] { f.allocator->Allocate("salon", "Anna", kDay, At("13:30"), 2, Client("c1")); });
  assert(f.allocator->ClientBookings("salon", "c1").empty());
}

void TestMirrorOutageFallsBackToStore() {
  Fixture f(std::make_shared<UnreachableMirror>());
  const auto booking = f.allocator->Allocate("salon", "Anna", kDay, At("12:00"), 1, Client("c1"));
  assert(booking.status == BookingStatus::kActive);

  ExpectThrows<slotkeeper::util::ConflictError>(
      [&] { f.allocator->Allocate("salon", "Anna", kDay, At("12:00"), 1, Client("c2")); });
}

void TestCancelFreesSlotAndIsNotRepeatable() {
  Fixture f;
  const auto booking   = f.allocator->Allocate("salon", "Anna", kDay, At("10:00"), 1, Client("c1"));
  const auto cancelled = f.allocator->Cancel(booking.id);
  assert(cancelled.status == BookingStatus::kCancelled);
  assert(cancelled.revision == 2);
  assert(!cancelled.mirror_synced);

  f.allocator->Allocate("salon", "Anna", kDay, At("10:00"), 1, Client("c2"));

  ExpectThrows<slotkeeper::util::InvalidState>([&] { f.allocator->Cancel(booking.id); });
  ExpectThrows<slotkeeper::util::NotFound>([&] { f.allocator->Cancel("missing"); });

  auto task = f.scheduler->Dequeue();  // allocate c1
  task      = f.scheduler->Dequeue();  // cancel c1
  assert(task && task->clear.has_value() && !task->set.has_value());
  assert(task->clear->start.minutes == 600);
}

void TestChangeMovesBooking() {
  Fixture f;
  const auto booking = f.allocator->Allocate("salon", "Anna", kDay, At("10:00"), 2, Client("c1"));

  // shifting by one slot overlaps the booking's own rows
  const auto shifted = f.allocator->Change(booking.id, "Anna", kDay, At("10:30"), 2);
  assert(shifted.id == booking.id);
  assert(shifted.start_minute == 630);
  assert(shifted.revision == 2);
  assert(shifted.client_name == "Name c1");

  const auto next_day = kDay.AddDays(1);
  const auto moved    = f.allocator->Change(booking.id, "Boris", next_day, At("15:00"), 1, Client("c1"));
  assert(moved.specialist == "Boris");
  assert(moved.date == next_day.ToIso());
  assert(moved.revision == 3);

  assert(f.allocator->GetAvailableSlots("salon", "Anna", kDay, 1).size() == 18);
  assert(f.allocator->GetAvailableSlots("salon", "Boris", next_day, 1).size() == 17);

  f.scheduler->Dequeue();
  f.scheduler->Dequeue();
  auto task = f.scheduler->Dequeue();
  assert(task && task->clear && task->set);
  assert(task->clear->specialist == "Anna" && task->set->specialist == "Boris");
  assert(task->revision == 3);
}

void TestChangeRejectsTakenSlotAndCancelledBooking() {
  Fixture f;
  const auto first  = f.allocator->Allocate("salon", "Anna", kDay, At("10:00"), 1, Client("c1"));
  const auto second = f.allocator->Allocate("salon", "Anna", kDay, At("11:00"), 1, Client("c2"));

  ExpectThrows<slotkeeper::util::ConflictError>([&] { f.allocator->Change(first.id, "Anna", kDay, At("11:00"), 1); });

  f.allocator->Cancel(second.id);
  ExpectThrows<slotkeeper::util::InvalidState>([&] { f.allocator->Change(second.id, "Anna", kDay, At("12:00"), 1); });

  // the freed slot is usable by the first booking now
  const auto moved = f.allocator->Change(first.id, "Anna", kDay, At("11:00"), 1);
  assert(moved.start_minute == 660);
}

void TestClientBookingsAndStats() {
  Fixture f;
  const auto later   = f.allocator->Allocate("salon", "Anna", kDay.AddDays(1), At("09:00"), 1, Client("c1"));
  const auto earlier = f.allocator->Allocate("salon", "Boris", kDay, At("16:00"), 1, Client("c1"));
  const auto gone    = f.allocator->Allocate("salon", "Anna", kDay, At("09:00"), 1, Client("c1"));
  f.allocator->Allocate("salon", "Anna", kDay, At("12:00"), 1, Client("c2"));
  f.allocator->Cancel(gone.id);

  const auto mine = f.allocator->ClientBookings("salon", "c1");
  assert(mine.size() == 2);
  assert(mine[0].id == earlier.id);
  assert(mine[1].id == later.id);

  const auto stats = f.allocator->Stats("salon");
  assert(stats.total == 4);
  assert(stats.active == 3);
  assert(stats.cancelled == 1);
}

void TestConcurrentAllocationsOfOneSlot() {
  Fixture f;
  constexpr int kThreads = 8;

  std::atomic<int>         won{0};
  std::atomic<int>         lost{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      try {
        f.allocator->Allocate("salon", "Anna", kDay, At("15:00"), 2, Client("c" + std::to_string(i)));
        ++won;
      } catch (const slotkeeper::util::ConflictError&) {
        ++lost;
      }
    });
  }
  for (auto& thread : threads) thread.join();

  assert(won == 1);
  assert(lost == kThreads - 1);
  assert(f.allocator->Stats("salon").active == 1);
}

} // namespace

int main() {
  TestAllocateRemovesSlotsFromAvailability();
  TestOverlappingAllocationConflicts();
  TestValidationRejectsBadRequests();
  TestDurationLongerThanTheDayIsRejected();
  TestMirrorRowBlocksAllocation();
  TestMirrorOutageFallsBackToStore();
  TestCancelFreesSlotAndIsNotRepeatable();
  TestChangeMovesBooking();
  TestChangeRejectsTakenSlotAndCancelledBooking();
  TestClientBookingsAndStats();
  TestConcurrentAllocationsOfOneSlot();

  std::cout << "slotkeeper_unit_slot_allocator: pass\n";
  return 0;
}
