#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/message_coordinator.hpp"
#include "internal/core/slot_allocator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/mirror/booking_mirror.hpp"
#include "internal/mirror/mirror_reconciler.hpp"
#include "internal/mirror/mirror_scheduler.hpp"
#include "internal/mirror/mirror_worker.hpp"
#include "internal/mirror/reconcile_worker.hpp"
#include "internal/model/project.hpp"
#include "internal/service/booking_service.hpp"
#include "internal/service/conversation_service.hpp"

namespace slotkeeper::factory {

/*
  Application

  Owns all long-lived singletons used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>               repository;
  std::shared_ptr<const model::ProjectRegistry> projects;
  std::shared_ptr<mirror::BookingMirror>        booking_mirror;

  std::shared_ptr<mirror::MirrorScheduler>  mirror_scheduler;
  std::shared_ptr<mirror::MirrorWorker>     mirror_worker;
  std::shared_ptr<mirror::MirrorReconciler> reconciler;
  // null when reconciliation is disabled
  std::shared_ptr<mirror::ReconcileWorker> reconcile_worker;

  std::shared_ptr<core::MessageCoordinator> coordinator;
  std::shared_ptr<core::SlotAllocator>      allocator;

  std::shared_ptr<service::ConversationService> conversation_service;
  std::shared_ptr<service::BookingService>      booking_service;

  // Background workers. Stop() drains pending mirror writes.
  void Start();
  void Stop();
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and mirror types.
*/
Application Build(const slotkeeper::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository>        BuildRepository(const slotkeeper::runtime::config::RuntimeConfig& config);
std::shared_ptr<mirror::BookingMirror> BuildMirror(const slotkeeper::runtime::config::RuntimeConfig& config);

} // namespace slotkeeper::factory
