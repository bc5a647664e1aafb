#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace slotkeeper::config {

using slotkeeper::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars carry the non-specific "!" tag
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  RuntimeConfig config;
  if (yaml.IsNull()) {
    ConfigLoader::ApplyDefaults(config);
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address("0.0.0.0:50051");
  }

  if (config.database().backend_case() == slotkeeper::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }
  if (config.database().has_postgres() && config.database().postgres().pool_size() == 0) {
    config.mutable_database()->mutable_postgres()->set_pool_size(4);
  }

  if (config.mirror().backend_case() == slotkeeper::runtime::config::MirrorConfig::BACKEND_NOT_SET) {
    config.mutable_mirror()->mutable_memory();
  }

  auto* reconciliation = config.mutable_reconciliation();
  if (!reconciliation->has_interval()) {
    reconciliation->mutable_interval()->set_seconds(60);
  }
  if (reconciliation->horizon_days() == 0) {
    reconciliation->set_horizon_days(14);
  }
  if (!reconciliation->has_grace_period()) {
    reconciliation->mutable_grace_period()->set_seconds(120);
  }

  if (config.coordinator().archive_after_hours() == 0) {
    config.mutable_coordinator()->set_archive_after_hours(24);
  }
}

model::ProjectRegistry ConfigLoader::BuildProjects(const RuntimeConfig& config) {
  model::ProjectRegistry registry;

  for (const auto& project : config.projects()) {
    if (project.project_id().empty()) {
      throw util::ValidationError("project config: project_id is required");
    }
    if (registry.Contains(project.project_id())) {
      throw util::ValidationError("project config: duplicate project " + project.project_id());
    }

    model::ProjectSettings settings;
    settings.project_id = project.project_id();
    if (project.slot_minutes() != 0) {
      settings.slot_minutes = static_cast<int>(project.slot_minutes());
    }
    if (!project.work_start().empty()) {
      auto start = model::TimeOfDay::TryParse(project.work_start());
      if (!start) {
        throw util::ValidationError("project config: bad work_start " + project.work_start());
      }
      settings.work_start = *start;
    }
    if (!project.work_end().empty()) {
      auto end = model::TimeOfDay::TryParse(project.work_end());
      if (!end) {
        throw util::ValidationError("project config: bad work_end " + project.work_end());
      }
      settings.work_end = *end;
    }
    if (settings.work_end <= settings.work_start) {
      throw util::ValidationError("project config: work_end must be after work_start for " + project.project_id());
    }

    settings.specialists.assign(project.specialists().begin(), project.specialists().end());
    for (const auto& service : project.services()) {
      if (service.name().empty() || service.duration_minutes() == 0) {
        throw util::ValidationError("project config: service needs a name and a duration in " + project.project_id());
      }
      settings.services.push_back({service.name(), static_cast<int>(service.duration_minutes())});
    }

    registry.Add(std::move(settings));
  }

  return registry;
}

} // namespace slotkeeper::config
