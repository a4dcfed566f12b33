#include "app_config.h"

#include <cstdlib>
#include <limits>

#include <nlohmann/json.hpp>

#include "file_utils.h"

namespace {
using json = nlohmann::json;

bool ReadStringField(const json& j, const char* key, std::string* out, std::string* error) {
  if (!j.contains(key)) {
    return true;
  }
  const json& value = j.at(key);
  if (!value.is_string()) {
    if (error) {
      *error = std::string("expected string for '") + key + "'";
    }
    return false;
  }
  if (out) {
    *out = value.get<std::string>();
  }
  return true;
}

bool ReadIntField(const json& j, const char* key, int* out, std::string* error) {
  if (!j.contains(key)) {
    return true;
  }
  const json& value = j.at(key);
  if (!value.is_number_integer()) {
    if (error) {
      *error = std::string("expected integer for '") + key + "'";
    }
    return false;
  }
  const bool in_range =
      value.is_number_unsigned()
          ? value.get<unsigned long long>() <=
                static_cast<unsigned long long>(std::numeric_limits<int>::max())
          : value.get<long long>() >= std::numeric_limits<int>::min() &&
                value.get<long long>() <= std::numeric_limits<int>::max();
  if (!in_range) {
    if (error) {
      *error = std::string("value out of range for '") + key + "'";
    }
    return false;
  }
  if (out) {
    *out = value.get<int>();
  }
  return true;
}

bool ReadBoolField(const json& j, const char* key, bool* out, std::string* error) {
  if (!j.contains(key)) {
    return true;
  }
  const json& value = j.at(key);
  if (!value.is_boolean()) {
    if (error) {
      *error = std::string("expected boolean for '") + key + "'";
    }
    return false;
  }
  if (out) {
    *out = value.get<bool>();
  }
  return true;
}

bool ReadSteps(const json& j, const char* key, std::vector<ConfiguredStep>* out,
               std::string* error) {
  if (!j.contains(key)) {
    return true;
  }
  const json& value = j.at(key);
  if (!value.is_array()) {
    if (error) {
      *error = std::string("expected array for '") + key + "'";
    }
    return false;
  }
  std::vector<ConfiguredStep> steps;
  for (const auto& item : value) {
    if (!item.is_object()) {
      if (error) {
        *error = std::string("expected objects in '") + key + "'";
      }
      return false;
    }
    ConfiguredStep step;
    if (!ReadStringField(item, "dir", &step.dir, error) ||
        !ReadStringField(item, "command", &step.command, error)) {
      return false;
    }
    steps.push_back(step);
  }
  if (out) {
    *out = steps;
  }
  return true;
}

json StepsToJson(const std::vector<ConfiguredStep>& steps) {
  json arr = json::array();
  for (const auto& step : steps) {
    json entry;
    entry["dir"] = step.dir;
    entry["command"] = step.command;
    arr.push_back(entry);
  }
  return arr;
}
}  // namespace

AppConfig::AppConfig() {
  mesh_steps = {
      {"2.meshing_MheadBL", "blockMesh"},
      {"2.meshing_MheadBL", "snappyHexMesh -overwrite"},
  };
}

bool LoadAppConfigFromString(const std::string& content, AppConfig* config, std::string* error) {
  if (!config) {
    if (error) {
      *error = "missing config output";
    }
    return false;
  }
  json root;
  try {
    root = json::parse(content);
  } catch (const json::parse_error& e) {
    if (error) {
      *error = std::string("invalid json: ") + e.what();
    }
    return false;
  }
  if (!root.is_object()) {
    if (error) {
      *error = "config root must be an object";
    }
    return false;
  }

  AppConfig parsed;
  if (!ReadIntField(root, "schema_version", &parsed.schema_version, error) ||
      !ReadStringField(root, "temp_root", &parsed.temp_root, error) ||
      !ReadStringField(root, "template_path", &parsed.template_path, error) ||
      !ReadIntField(root, "retention_days", &parsed.retention_days, error) ||
      !ReadIntField(root, "job_history_cap", &parsed.job_history_cap, error) ||
      !ReadIntField(root, "cancel_grace_ms", &parsed.cancel_grace_ms, error) ||
      !ReadIntField(root, "loader_workers", &parsed.loader_workers, error) ||
      !ReadBoolField(root, "log_echo", &parsed.log_echo, error) ||
      !ReadSteps(root, "mesh_steps", &parsed.mesh_steps, error)) {
    return false;
  }
  if (root.contains("solver")) {
    const json& solver = root.at("solver");
    if (!solver.is_object()) {
      if (error) {
        *error = "expected object for 'solver'";
      }
      return false;
    }
    if (!ReadStringField(solver, "subdir", &parsed.solver_subdir, error) ||
        !ReadIntField(solver, "processes", &parsed.solver_processes, error) ||
        !ReadBoolField(solver, "use_hostfile", &parsed.solver_use_hostfile, error) ||
        !ReadStringField(solver, "application", &parsed.solver_application, error)) {
      return false;
    }
  }
  if (parsed.schema_version != 1) {
    if (error) {
      *error = "unsupported schema_version: " + std::to_string(parsed.schema_version);
    }
    return false;
  }
  if (!ValidateAppConfig(parsed, error)) {
    return false;
  }
  *config = parsed;
  return true;
}

bool LoadAppConfigFromFile(const std::filesystem::path& path, AppConfig* config,
                           std::string* error) {
  std::string content;
  if (!ReadFileToString(path, &content, error)) {
    return false;
  }
  return LoadAppConfigFromString(content, config, error);
}

std::string SerializeAppConfig(const AppConfig& config, int indent) {
  json root;
  root["schema_version"] = config.schema_version;
  root["temp_root"] = config.temp_root;
  root["template_path"] = config.template_path;
  root["retention_days"] = config.retention_days;
  root["job_history_cap"] = config.job_history_cap;
  root["cancel_grace_ms"] = config.cancel_grace_ms;
  root["loader_workers"] = config.loader_workers;
  root["log_echo"] = config.log_echo;
  root["mesh_steps"] = StepsToJson(config.mesh_steps);

  json solver;
  solver["subdir"] = config.solver_subdir;
  solver["processes"] = config.solver_processes;
  solver["use_hostfile"] = config.solver_use_hostfile;
  solver["application"] = config.solver_application;
  root["solver"] = solver;
  return root.dump(indent);
}

bool SaveAppConfigToFile(const std::filesystem::path& path, const AppConfig& config,
                         std::string* error) {
  return WriteStringToFile(path, SerializeAppConfig(config) + "\n", error);
}

bool ValidateAppConfig(const AppConfig& config, std::string* error) {
  auto fail = [error](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (config.retention_days < 0) {
    return fail("retention_days must be >= 0");
  }
  if (config.job_history_cap < 1) {
    return fail("job_history_cap must be >= 1");
  }
  if (config.cancel_grace_ms < 0) {
    return fail("cancel_grace_ms must be >= 0");
  }
  if (config.loader_workers < 1 || config.loader_workers > 64) {
    return fail("loader_workers must be in [1, 64]");
  }
  if (config.solver_processes < 1) {
    return fail("solver.processes must be >= 1");
  }
  for (const auto& step : config.mesh_steps) {
    if (step.command.empty()) {
      return fail("mesh_steps entries need a command");
    }
    if (std::filesystem::path(step.dir).is_absolute()) {
      return fail("mesh_steps dir must be case-relative: " + step.dir);
    }
  }
  if (std::filesystem::path(config.solver_subdir).is_absolute()) {
    return fail("solver.subdir must be case-relative");
  }
  return true;
}

std::filesystem::path DefaultTempRoot() {
  const char* xdg = std::getenv("XDG_DATA_HOME");
  if (xdg && *xdg) {
    return std::filesystem::path(xdg) / "caseflow" / "temp";
  }
  const char* home = std::getenv("HOME");
  if (home && *home) {
    return std::filesystem::path(home) / ".local" / "caseflow" / "temp";
  }
  std::error_code ec;
  std::filesystem::path tmp = std::filesystem::temp_directory_path(ec);
  if (ec) {
    tmp = "/tmp";
  }
  return tmp / "caseflow";
}

std::filesystem::path FindBaseTemplate(const std::filesystem::path& exec_path) {
  std::vector<std::filesystem::path> roots;
  std::error_code ec;
  const std::filesystem::path cwd = std::filesystem::current_path(ec);
  if (!ec) {
    roots.push_back(cwd);
  }
  if (!exec_path.empty()) {
    roots.push_back(std::filesystem::absolute(exec_path, ec).parent_path());
  }

  for (const auto& base : roots) {
    std::filesystem::path cur = base;
    for (int i = 0; i < 6; ++i) {
      std::filesystem::path candidate = cur / "config" / "basecase";
      if (std::filesystem::is_directory(candidate, ec)) {
        return candidate;
      }
      if (!cur.has_parent_path() || cur.parent_path() == cur) {
        break;
      }
      cur = cur.parent_path();
    }
  }
  return {};
}

std::filesystem::path ResolveTempRoot(const AppConfig& config) {
  if (!config.temp_root.empty()) {
    return std::filesystem::path(config.temp_root);
  }
  return DefaultTempRoot();
}
