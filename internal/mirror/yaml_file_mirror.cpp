#include "internal/mirror/yaml_file_mirror.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

#include "internal/util/errors.hpp"

namespace slotkeeper::mirror {

namespace {

MirrorRecord ToRecord(const YAML::Node& node) {
  MirrorRecord record;
  if (node.IsScalar()) {
    // hand-edited rows may carry only the client id
    record.client_id = node.Scalar();
    return record;
  }
  record.client_id   = node["client_id"].as<std::string>("");
  record.client_name = node["client_name"].as<std::string>("");
  record.service     = node["service"].as<std::string>("");
  return record;
}

YAML::Node ToNode(const MirrorRecord& record) {
  YAML::Node node;
  node["client_id"]   = record.client_id;
  node["client_name"] = record.client_name;
  node["service"]     = record.service;
  return node;
}

// Undefined node when any level is missing; never inserts.
YAML::Node DayNode(const YAML::Node& root, const std::string& project_id, const std::string& specialist,
                   const model::CivilDate& date) {
  YAML::Node node = root;
  for (const auto& key : {project_id, specialist, date.ToIso()}) {
    if (!node.IsMap()) return YAML::Node(YAML::NodeType::Undefined);
    YAML::Node child = node[key];
    if (!child) return YAML::Node(YAML::NodeType::Undefined);
    node.reset(child);
  }
  return node;
}

} // namespace

YamlFileMirror::YamlFileMirror(std::string path) : path_(std::move(path)) {
}

YAML::Node YamlFileMirror::Load() const {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    return YAML::Node(YAML::NodeType::Map);
  }

  try {
    auto root = YAML::LoadFile(path_);
    if (root.IsNull()) return YAML::Node(YAML::NodeType::Map);
    if (!root.IsMap()) throw util::MirrorSyncError("mirror file root is not a map: " + path_);
    return root;
  } catch (const YAML::Exception& e) {
    throw util::MirrorSyncError("mirror file unreadable: " + std::string(e.what()));
  }
}

void YamlFileMirror::Store(const YAML::Node& root) const {
  const auto tmp = path_ + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) throw util::MirrorSyncError("cannot open mirror file for writing: " + tmp);

    YAML::Emitter emitter;
    emitter << root;
    out << emitter.c_str() << '\n';
    if (!out) throw util::MirrorSyncError("mirror file write failed: " + tmp);
  }

  std::error_code ec;
  std::filesystem::rename(tmp, path_, ec);
  if (ec) throw util::MirrorSyncError("mirror file rename failed: " + ec.message());
}

void YamlFileMirror::SetSlot(const std::string& project_id, const std::string& specialist,
                             const model::CivilDate& date, model::TimeOfDay time, const MirrorRecord& record) {
  std::lock_guard lock(mutex_);
  auto root = Load();
  root[project_id][specialist][date.ToIso()][time.ToString()] = ToNode(record);
  Store(root);
}

void YamlFileMirror::ClearSlot(const std::string& project_id, const std::string& specialist,
                               const model::CivilDate& date, model::TimeOfDay time) {
  std::lock_guard lock(mutex_);
  auto root = Load();

  auto day = DayNode(root, project_id, specialist, date);
  if (!day.IsMap() || !day[time.ToString()]) return;

  day.remove(time.ToString());
  Store(root);
}

std::optional<MirrorRecord> YamlFileMirror::ReadSlot(const std::string& project_id, const std::string& specialist,
                                                     const model::CivilDate& date, model::TimeOfDay time) {
  std::lock_guard lock(mutex_);
  const auto root = Load();

  const auto day = DayNode(root, project_id, specialist, date);
  if (!day.IsMap()) return std::nullopt;

  const YAML::Node slot = day[time.ToString()];
  if (!slot || slot.IsNull()) return std::nullopt;

  try {
    auto record = ToRecord(slot);
    if (record.client_id.empty()) return std::nullopt;
    return record;
  } catch (const YAML::Exception& e) {
    throw util::MirrorSyncError("mirror row malformed: " + std::string(e.what()));
  }
}

std::vector<MirrorRow> YamlFileMirror::ReadDay(const std::string& project_id, const std::string& specialist,
                                               const model::CivilDate& date) {
  std::lock_guard lock(mutex_);
  const auto root = Load();

  std::vector<MirrorRow> rows;
  const auto day = DayNode(root, project_id, specialist, date);
  if (!day.IsMap()) return rows;

  try {
    for (const auto& entry : day) {
      auto time = model::TimeOfDay::TryParse(entry.first.Scalar());
      if (!time || entry.second.IsNull()) continue;

      auto record = ToRecord(entry.second);
      if (record.client_id.empty()) continue;
      rows.push_back({*time, std::move(record)});
    }
  } catch (const YAML::Exception& e) {
    throw util::MirrorSyncError("mirror day malformed: " + std::string(e.what()));
  }

  std::sort(rows.begin(), rows.end(), [](const MirrorRow& a, const MirrorRow& b) { return a.time < b.time; });
  return rows;
}

} // namespace slotkeeper::mirror
