#include "internal/model/project.hpp"

#include <algorithm>
#include <cctype>

#include "internal/util/errors.hpp"

namespace slotkeeper::model {

namespace {

std::string Lower(const std::string& value) {
  std::string out = value;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

bool ProjectSettings::HasSpecialist(const std::string& name) const {
  return std::find(specialists.begin(), specialists.end(), name) != specialists.end();
}

int ProjectSettings::SlotsForMinutes(int minutes) const {
  if (minutes <= 0 || slot_minutes <= 0) {
    return 1;
  }
  return (minutes + slot_minutes - 1) / slot_minutes;
}

std::optional<int> ProjectSettings::ServiceSlots(const std::string& service_name) const {
  const auto wanted = Lower(service_name);
  for (const auto& service : services) {
    if (Lower(service.name) == wanted) {
      return SlotsForMinutes(service.duration_minutes);
    }
  }
  return std::nullopt;
}

ProjectRegistry::ProjectRegistry(std::vector<ProjectSettings> projects) {
  for (auto& project : projects) {
    Add(std::move(project));
  }
}

void ProjectRegistry::Add(ProjectSettings settings) {
  if (settings.project_id.empty()) {
    throw util::ValidationError("project settings: project_id is required");
  }
  if (settings.slot_minutes <= 0) {
    throw util::ValidationError("project settings: slot_minutes must be positive for project " + settings.project_id);
  }
  if (settings.work_end <= settings.work_start) {
    throw util::ValidationError("project settings: work_end must be after work_start for project " + settings.project_id);
  }
  // reconcile sweeps walk this list; a project without one would never be swept
  if (settings.specialists.empty()) {
    throw util::ValidationError("project settings: at least one specialist is required for project " + settings.project_id);
  }
  for (const auto& name : settings.specialists) {
    if (name.empty()) {
      throw util::ValidationError("project settings: empty specialist name in project " + settings.project_id);
    }
  }
  auto key = settings.project_id;
  projects_[key] = std::move(settings);
}

const ProjectSettings& ProjectRegistry::Get(const std::string& project_id) const {
  const auto it = projects_.find(project_id);
  if (it == projects_.end()) {
    throw util::ValidationError("unknown project '" + project_id + "'");
  }
  return it->second;
}

bool ProjectRegistry::Contains(const std::string& project_id) const {
  return projects_.contains(project_id);
}

std::vector<ProjectSettings> ProjectRegistry::All() const {
  std::vector<ProjectSettings> out;
  out.reserve(projects_.size());
  for (const auto& [_, settings] : projects_) {
    out.push_back(settings);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.project_id < b.project_id; });
  return out;
}

} // namespace slotkeeper::model
