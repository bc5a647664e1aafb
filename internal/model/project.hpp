#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/calendar.hpp"

namespace slotkeeper::model {

struct ServiceDefinition {
  std::string name;
  int         duration_minutes = 0;
};

/*
  Per-project scheduling settings.

  Only listed specialists can be booked; ProjectRegistry rejects an empty list.
*/
struct ProjectSettings {
  std::string                    project_id;
  int                            slot_minutes = 30;
  TimeOfDay                      work_start{9 * 60};
  TimeOfDay                      work_end{18 * 60};
  std::vector<std::string>       specialists;
  std::vector<ServiceDefinition> services;

  bool HasSpecialist(const std::string& name) const;

  // Whole slots needed for a duration, rounded up. Never less than one.
  int SlotsForMinutes(int minutes) const;

  // Case-insensitive lookup, duration converted to slots.
  std::optional<int> ServiceSlots(const std::string& service_name) const;
};

class ProjectRegistry {
 public:
  ProjectRegistry() = default;
  explicit ProjectRegistry(std::vector<ProjectSettings> projects);

  void Add(ProjectSettings settings);

  // Throws ValidationError for unknown projects.
  const ProjectSettings& Get(const std::string& project_id) const;
  bool                   Contains(const std::string& project_id) const;

  std::vector<ProjectSettings> All() const;

 private:
  std::unordered_map<std::string, ProjectSettings> projects_;
};

} // namespace slotkeeper::model
