#pragma once

#include <cstdint>
#include <memory>

namespace slotkeeper::core { class MessageCoordinator; }
namespace slotkeeper::core { class SlotAllocator; }
namespace slotkeeper::mirror { class MirrorReconciler; }
namespace slotkeeper::db { class Repository; }

namespace slotkeeper::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<slotkeeper::core::MessageCoordinator> coordinator;
  std::shared_ptr<slotkeeper::core::SlotAllocator>      allocator;
  std::shared_ptr<slotkeeper::mirror::MirrorReconciler> reconciler;
  std::shared_ptr<slotkeeper::db::Repository>           repository;

  uint32_t archive_after_hours    = 24;
  uint32_t reconcile_horizon_days = 14;
};

}
