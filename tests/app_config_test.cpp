#include "app_config.h"
#include "string_utils.h"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

namespace {
bool Check(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << message << "\n";
  }
  return condition;
}
}  // namespace

int main() {
  AppConfig defaults;
  std::string error;
  if (!Check(defaults.retention_days == 7 && defaults.job_history_cap == 50 &&
                 defaults.cancel_grace_ms == 5000 && defaults.mesh_steps.size() == 2,
             "unexpected defaults")) {
    return 1;
  }
  if (!Check(ValidateAppConfig(defaults, &error), "defaults do not validate: " + error)) {
    return 1;
  }

  AppConfig config;
  const std::string text =
      "{\"schema_version\": 1, \"temp_root\": \"/var/tmp/cf\", \"retention_days\": 3,"
      " \"mesh_steps\": [{\"dir\": \"mesh\", \"command\": \"blockMesh\"}],"
      " \"solver\": {\"processes\": 8, \"use_hostfile\": true}}";
  if (!Check(LoadAppConfigFromString(text, &config, &error), "valid config rejected: " + error)) {
    return 1;
  }
  if (!Check(config.temp_root == "/var/tmp/cf" && config.retention_days == 3 &&
                 config.mesh_steps.size() == 1 && config.mesh_steps[0].dir == "mesh" &&
                 config.solver_processes == 8 && config.solver_use_hostfile &&
                 config.solver_subdir == "5.CHTFCase",
             "config fields were not applied")) {
    return 1;
  }

  const std::filesystem::path path = std::filesystem::temp_directory_path() /
                                     ("caseflow_config_" + caseflow::GenerateRandomTag(8)) /
                                     "caseflow.json";
  if (!Check(SaveAppConfigToFile(path, config, &error), "save failed: " + error)) {
    return 1;
  }
  AppConfig reloaded;
  if (!Check(LoadAppConfigFromFile(path, &reloaded, &error), "reload failed: " + error)) {
    return 1;
  }
  if (!Check(SerializeAppConfig(reloaded) == SerializeAppConfig(config),
             "config changed across save and load")) {
    return 1;
  }
  std::error_code ec;
  std::filesystem::remove_all(path.parent_path(), ec);

  AppConfig untouched;
  untouched.retention_days = 11;
  if (!Check(!LoadAppConfigFromString("{\"retention_days\": \"seven\"}", &untouched, &error) &&
                 error.find("retention_days") != std::string::npos,
             "type errors should name the field")) {
    return 1;
  }
  if (!Check(untouched.retention_days == 11, "failed load modified the output")) {
    return 1;
  }
  if (!Check(!LoadAppConfigFromString("{\"cancel_grace_ms\": -1}", &untouched, &error),
             "negative grace period accepted")) {
    return 1;
  }
  // Integers that do not fit an int are rejected by name instead of wrapping.
  if (!Check(!LoadAppConfigFromString("{\"cancel_grace_ms\": 1000000000000}", &untouched,
                                      &error) &&
                 error.find("cancel_grace_ms") != std::string::npos,
             "oversized grace period accepted")) {
    return 1;
  }
  if (!Check(!LoadAppConfigFromString("{\"retention_days\": -3000000000}", &untouched, &error) &&
                 error.find("retention_days") != std::string::npos,
             "undersized retention accepted")) {
    return 1;
  }
  if (!Check(untouched.retention_days == 11 &&
                 untouched.cancel_grace_ms == AppConfig().cancel_grace_ms,
             "out of range load modified the output")) {
    return 1;
  }
  if (!Check(!LoadAppConfigFromString("{\"schema_version\": 2}", &untouched, &error),
             "unknown schema version accepted")) {
    return 1;
  }
  if (!Check(!LoadAppConfigFromString("{\"mesh_steps\": [{\"dir\": \"/abs\", \"command\": \"x\"}]}",
                                      &untouched, &error),
             "absolute step directory accepted")) {
    return 1;
  }
  if (!Check(!LoadAppConfigFromString("[]", &untouched, &error), "array root accepted")) {
    return 1;
  }

  setenv("XDG_DATA_HOME", "/data/xdg", 1);
  if (!Check(DefaultTempRoot() == std::filesystem::path("/data/xdg/caseflow/temp"),
             "XDG_DATA_HOME not honored")) {
    return 1;
  }
  unsetenv("XDG_DATA_HOME");
  setenv("HOME", "/home/tester", 1);
  if (!Check(DefaultTempRoot() == std::filesystem::path("/home/tester/.local/caseflow/temp"),
             "HOME fallback is wrong")) {
    return 1;
  }
  AppConfig explicit_root;
  explicit_root.temp_root = "/scratch/cases";
  if (!Check(ResolveTempRoot(explicit_root) == std::filesystem::path("/scratch/cases"),
             "configured temp root ignored")) {
    return 1;
  }
  return 0;
}
