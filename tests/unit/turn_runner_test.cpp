#include <atomic>
#include <cassert>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/turn_runner.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/mirror/memory_mirror.hpp"

namespace {

using slotkeeper::core::BookingDirective;
using slotkeeper::core::ClaimOutcome;
using slotkeeper::core::DirectiveAction;
using slotkeeper::core::DirectiveExecutor;
using slotkeeper::core::InboundEvent;
using slotkeeper::core::MessageCoordinator;
using slotkeeper::core::ReplyChannel;
using slotkeeper::core::SlotAllocator;
using slotkeeper::core::TurnOutcome;
using slotkeeper::core::TurnProcessor;
using slotkeeper::core::TurnReply;
using slotkeeper::core::TurnRunner;
using slotkeeper::db::memory::MemoryRepository;
using slotkeeper::db::model::QueuedMessageRecord;
using slotkeeper::mirror::MemoryMirror;
using slotkeeper::mirror::MirrorScheduler;
using slotkeeper::model::CivilDate;
using slotkeeper::model::MessageStatus;
using slotkeeper::model::ProjectRegistry;
using slotkeeper::model::ProjectSettings;

class ScriptedProcessor : public TurnProcessor {
 public:
  std::function<TurnReply(const QueuedMessageRecord&)> script;
  std::vector<std::string>                             seen;

  TurnReply Process(const QueuedMessageRecord& item) override {
    seen.push_back(item.aggregated_text);
    return script(item);
  }
};

class RecordingChannel : public ReplyChannel {
 public:
  struct Delivery {
    std::string client_id;
    std::string text;
  };
  std::vector<Delivery> deliveries;

  void Deliver(const std::string&, const std::string& client_id, const std::string& text) override {
    deliveries.push_back({client_id, text});
  }
};

struct Fixture {
  std::shared_ptr<MemoryRepository>      repository = std::make_shared<MemoryRepository>();
  std::shared_ptr<std::atomic<uint64_t>> clock      = std::make_shared<std::atomic<uint64_t>>(5'000'000);
  std::shared_ptr<MessageCoordinator>    coordinator =
      std::make_shared<MessageCoordinator>(repository, [c = clock] { return c->fetch_add(1); });
  std::shared_ptr<SlotAllocator>     allocator;
  std::shared_ptr<ScriptedProcessor> processor = std::make_shared<ScriptedProcessor>();
  std::shared_ptr<RecordingChannel>  channel   = std::make_shared<RecordingChannel>();
  std::shared_ptr<TurnRunner>        runner;

  Fixture() {
    ProjectSettings settings;
    settings.project_id  = "salon";
    settings.specialists = {"Anna"};
    settings.services    = {{"Haircut", 60}};
    auto projects       = std::make_shared<const ProjectRegistry>(std::vector<ProjectSettings>{settings});

    allocator = std::make_shared<SlotAllocator>(repository, projects, std::make_shared<MemoryMirror>(),
                                                std::make_shared<MirrorScheduler>());
    auto executor =
        std::make_shared<DirectiveExecutor>(allocator, [] { return CivilDate{2026, 3, 1}; });
    runner = std::make_shared<TurnRunner>(coordinator, executor, processor, channel);
  }

  MessageStatus StatusOf(const std::string& id) {
    auto tx     = repository->Begin();
    auto record = repository->GetQueuedMessage(*tx, id);
    tx->Commit();
    assert(record.has_value());
    return record->status;
  }
};

InboundEvent Event(const std::string& client, const std::string& text) {
  return InboundEvent{"salon", client, text, false, 0};
}

BookingDirective Haircut(const std::string& time) {
  BookingDirective directive;
  directive.action      = DirectiveAction::kActivate;
  directive.specialist  = "Anna";
  directive.date        = "02.03";
  directive.time        = time;
  directive.service     = "Haircut";
  directive.client_name = "Client";
  return directive;
}

void TestReplyDeliveredOnWin() {
  Fixture f;
  f.processor->script = [](const QueuedMessageRecord& item) { return TurnReply{"echo: " + item.aggregated_text, {}}; };

  auto result = f.runner->Run(Event("c1", "hello"));
  assert(result.outcome == TurnOutcome::kDelivered);
  assert(!result.directive.has_value());
  assert(f.channel->deliveries.size() == 1);
  assert(f.channel->deliveries[0].client_id == "c1");
  assert(f.channel->deliveries[0].text == "echo: hello");
  assert(f.StatusOf(result.item_id) == MessageStatus::kCompleted);
}

void TestRedeliveryIsSkipped() {
  Fixture f;
  f.processor->script = [](const QueuedMessageRecord&) { return TurnReply{"never", {}}; };

  auto result = f.runner->Run(InboundEvent{"salon", "c1", "hello", true, 0});
  assert(result.outcome == TurnOutcome::kSkipped);
  assert(result.item_id.empty());
  assert(f.processor->seen.empty());
  assert(f.channel->deliveries.empty());
}

void TestNewerMessageDuringProcessingSuppressesReply() {
  Fixture f;
  std::string newer_id;
  f.processor->script = [&](const QueuedMessageRecord&) {
    auto newer = f.coordinator->Submit(Event("c1", "and a beard trim"));
    newer_id   = newer->id;
    return TurnReply{"stale reply", {}};
  };

  auto result = f.runner->Run(Event("c1", "haircut please"));
  assert(result.outcome == TurnOutcome::kSuperseded);
  assert(f.channel->deliveries.empty());
  assert(f.StatusOf(result.item_id) == MessageStatus::kSuperseded);

  auto started = f.coordinator->BeginTurn(newer_id);
  assert(started && started->aggregated_text == "haircut please and a beard trim");
  assert(f.coordinator->ClaimWinner(newer_id) == ClaimOutcome::kWin);
}

void TestProcessorFailureCancelsItem() {
  Fixture f;
  f.processor->script = [](const QueuedMessageRecord&) -> TurnReply { throw std::runtime_error("model timeout"); };

  auto result = f.runner->Run(Event("c1", "hello"));
  assert(result.outcome == TurnOutcome::kFailed);
  assert(f.channel->deliveries.empty());
  assert(f.StatusOf(result.item_id) == MessageStatus::kCancelled);

  // the failed text is not folded into the next turn
  f.processor->script = [](const QueuedMessageRecord& item) { return TurnReply{item.aggregated_text, {}}; };
  auto next = f.runner->Run(Event("c1", "are you there?"));
  assert(next.outcome == TurnOutcome::kDelivered);
  assert(f.channel->deliveries.back().text == "are you there?");
}

void TestDirectiveExecutedBeforeDelivery() {
  Fixture f;
  f.processor->script = [](const QueuedMessageRecord&) { return TurnReply{"booked you in", Haircut("10:00")}; };

  auto result = f.runner->Run(Event("c1", "book me at ten"));
  assert(result.outcome == TurnOutcome::kDelivered);
  assert(result.directive && result.directive->success);

  auto bookings = f.allocator->ClientBookings("salon", "c1");
  assert(bookings.size() == 1);
  assert(bookings[0].date == "2026-03-02");
  assert(bookings[0].duration_slots == 2);

  // a rejected directive still delivers the reply
  auto taken = f.runner->Run(Event("c2", "me too at ten"));
  assert(taken.outcome == TurnOutcome::kDelivered);
  assert(taken.directive && !taken.directive->success);
  assert(f.allocator->ClientBookings("salon", "c2").empty());
}

void TestDirectiveOfLosingTurnStillApplies() {
  Fixture f;
  f.processor->script = [&](const QueuedMessageRecord&) {
    f.coordinator->Submit(Event("c1", "thanks"));
    return TurnReply{"booked", Haircut("12:00")};
  };

  auto result = f.runner->Run(Event("c1", "noon please"));
  assert(result.outcome == TurnOutcome::kSuperseded);
  assert(result.directive && result.directive->success);
  assert(f.channel->deliveries.empty());
  assert(f.allocator->ClientBookings("salon", "c1").size() == 1);
}

} // namespace

int main() {
  TestReplyDeliveredOnWin();
  TestRedeliveryIsSkipped();
  TestNewerMessageDuringProcessingSuppressesReply();
  TestProcessorFailureCancelsItem();
  TestDirectiveExecutedBeforeDelivery();
  TestDirectiveOfLosingTurnStillApplies();

  std::cout << "slotkeeper_unit_turn_runner: pass\n";
  return 0;
}
