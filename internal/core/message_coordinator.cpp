#include "internal/core/message_coordinator.hpp"

#include <algorithm>

#include "internal/db/scoped_tx.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace slotkeeper::core {

using slotkeeper::model::MessageStatus;
using namespace slotkeeper::observability;

namespace {

void Transition(db::model::QueuedMessageRecord& record, MessageStatus to, uint64_t now) {
  if (!model::CanTransition(record.status, to)) {
    throw util::InvalidState("queued message " + record.id + " cannot move from " +
                             std::string(model::ToString(record.status)) + " to " + std::string(model::ToString(to)));
  }
  record.status        = to;
  record.updated_at_ms = now;
}

// PENDING rows pass through PROCESSING so the transition table is honoured.
void WalkTo(db::model::QueuedMessageRecord& record, MessageStatus to, uint64_t now) {
  if (record.status == MessageStatus::kPending && to != MessageStatus::kProcessing &&
      to != MessageStatus::kSuperseded) {
    Transition(record, MessageStatus::kProcessing, now);
  }
  Transition(record, to, now);
}

bool IsOpen(const db::model::QueuedMessageRecord& record) {
  return !model::IsTerminal(record.status);
}

db::model::QueuedMessageRecord* FindById(std::vector<db::model::QueuedMessageRecord>& rows, const std::string& id) {
  auto it = std::find_if(rows.begin(), rows.end(), [&](const auto& row) { return row.id == id; });
  return it == rows.end() ? nullptr : &*it;
}

} // namespace

MessageCoordinator::MessageCoordinator(std::shared_ptr<db::Repository> repository, util::NowMillisFn now)
    : repository_(std::move(repository)), now_(std::move(now)) {
}

db::model::QueuedMessageRecord MessageCoordinator::Lookup(const std::string& item_id) {
  auto record =
      db::ReadOnly(*repository_, [&](db::Transaction& tx) { return repository_->GetQueuedMessage(tx, item_id); });
  if (!record) throw util::NotFound("queued message not found: " + item_id);
  return *record;
}

std::optional<db::model::QueuedMessageRecord> MessageCoordinator::Submit(const InboundEvent& event) {
  if (event.project_id.empty() || event.client_id.empty()) {
    throw util::ValidationError("project_id and client_id are required");
  }

  if (event.retry && event.delivery_count == 0) {
    LogInfo("redelivered event skipped", {StringField("project_id", event.project_id),
                                          StringField("client_id", event.client_id)});
    return std::nullopt;
  }

  auto item = db::WithClientLock(*repository_, event.project_id, event.client_id, [&](db::Transaction& tx) {
    const auto now  = now_();
    auto       rows = repository_->ListClientMessages(tx, event.project_id, event.client_id);

    std::string aggregated;
    uint64_t    newest = 0;
    for (auto& row : rows) {
      newest = std::max(newest, row.created_at_ms);
      if (!IsOpen(row)) continue;

      if (!aggregated.empty()) aggregated += ' ';
      aggregated += row.aggregated_text;

      Transition(row, MessageStatus::kSuperseded, now);
      db::ThrowIfDbError(repository_->UpdateQueuedMessage(tx, row), "supersede queued message");
    }
    if (!aggregated.empty()) aggregated += ' ';
    aggregated += event.text;

    db::model::QueuedMessageRecord record;
    record.id              = util::NewId();
    record.project_id      = event.project_id;
    record.client_id       = event.client_id;
    record.original_text   = event.text;
    record.aggregated_text = std::move(aggregated);
    record.status          = MessageStatus::kPending;
    record.created_at_ms   = std::max(now, newest);
    record.updated_at_ms   = now;
    record.retry_count     = event.retry ? event.delivery_count : 0;
    db::ThrowIfDbError(repository_->InsertQueuedMessage(tx, record), "insert queued message");

    db::ThrowIfDbError(repository_->TouchClientActivity(tx, {event.project_id, event.client_id, now}),
                       "touch client activity");
    return record;
  });

  LogDebug("message queued", {StringField("item_id", item.id), StringField("client_id", item.client_id),
                              IntField("sequence", static_cast<int64_t>(item.sequence))});
  return item;
}

std::optional<db::model::QueuedMessageRecord> MessageCoordinator::BeginTurn(const std::string& item_id) {
  const auto snapshot = Lookup(item_id);

  return db::WithClientLock(
      *repository_, snapshot.project_id, snapshot.client_id,
      [&](db::Transaction& tx) -> std::optional<db::model::QueuedMessageRecord> {
        auto record = repository_->GetQueuedMessage(tx, item_id);
        if (!record) throw util::NotFound("queued message not found: " + item_id);

        switch (record->status) {
          case MessageStatus::kPending:
            Transition(*record, MessageStatus::kProcessing, now_());
            db::ThrowIfDbError(repository_->UpdateQueuedMessage(tx, *record), "begin turn");
            return record;
          case MessageStatus::kProcessing:
            return record;
          case MessageStatus::kSuperseded:
            return std::nullopt;
          case MessageStatus::kCompleted:
          case MessageStatus::kCancelled:
          default:
            throw util::InvalidState("queued message " + item_id + " is already " +
                                     std::string(model::ToString(record->status)));
        }
      });
}

ClaimOutcome MessageCoordinator::ClaimWinner(const std::string& item_id) {
  const auto snapshot = Lookup(item_id);

  const auto outcome = db::WithClientLock(*repository_, snapshot.project_id, snapshot.client_id,
                                          [&](db::Transaction& tx) {
    const auto now  = now_();
    auto       rows = repository_->ListClientMessages(tx, snapshot.project_id, snapshot.client_id);

    auto* self = FindById(rows, item_id);
    if (!self) throw util::NotFound("queued message not found: " + item_id);

    const db::model::QueuedMessageRecord* latest = nullptr;
    for (const auto& row : rows) {
      if (row.status == MessageStatus::kCancelled) continue;
      if (!latest || db::model::IsNewer(row, *latest)) latest = &row;
    }

    if (latest && latest->id == item_id && IsOpen(*self)) {
      for (auto& row : rows) {
        if (row.id == item_id || !IsOpen(row)) continue;
        Transition(row, MessageStatus::kSuperseded, now);
        db::ThrowIfDbError(repository_->UpdateQueuedMessage(tx, row), "supersede queued message");
      }
      WalkTo(*self, MessageStatus::kCompleted, now);
      db::ThrowIfDbError(repository_->UpdateQueuedMessage(tx, *self), "complete queued message");
      return ClaimOutcome::kWin;
    }

    if (IsOpen(*self)) {
      Transition(*self, MessageStatus::kSuperseded, now);
      db::ThrowIfDbError(repository_->UpdateQueuedMessage(tx, *self), "supersede queued message");
    }
    return ClaimOutcome::kLose;
  });

  LogInfo(outcome == ClaimOutcome::kWin ? "claim won" : "claim lost",
          {StringField("item_id", item_id), StringField("client_id", snapshot.client_id)});
  return outcome;
}

void MessageCoordinator::MarkFailed(const std::string& item_id) {
  const auto snapshot = Lookup(item_id);

  const bool cancelled = db::WithClientLock(*repository_, snapshot.project_id, snapshot.client_id,
                                            [&](db::Transaction& tx) {
    auto record = repository_->GetQueuedMessage(tx, item_id);
    if (!record) throw util::NotFound("queued message not found: " + item_id);
    if (!IsOpen(*record)) return false;

    WalkTo(*record, MessageStatus::kCancelled, now_());
    db::ThrowIfDbError(repository_->UpdateQueuedMessage(tx, *record), "cancel queued message");
    return true;
  });

  if (cancelled) {
    LogWarn("turn failed", {StringField("item_id", item_id), StringField("client_id", snapshot.client_id)});
  }
}

std::map<MessageStatus, uint64_t> MessageCoordinator::QueueStats(const std::string& project_id) {
  return db::ReadOnly(*repository_,
                      [&](db::Transaction& tx) { return repository_->CountMessagesByStatus(tx, project_id); });
}

std::vector<db::model::ClientActivityRecord> MessageCoordinator::InactiveClients(uint32_t hours) {
  const uint64_t now    = now_();
  const uint64_t window = static_cast<uint64_t>(hours) * 3600ULL * 1000ULL;
  const uint64_t cutoff = now > window ? now - window : 0;

  return db::ReadOnly(*repository_,
                      [&](db::Transaction& tx) { return repository_->ListClientsInactiveSince(tx, cutoff); });
}

} // namespace slotkeeper::core
