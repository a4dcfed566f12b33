#ifndef APP_CONFIG_H
#define APP_CONFIG_H

#include <filesystem>
#include <string>
#include <vector>

// One command of a multi-step job, run through /bin/sh in a case subdirectory.
struct ConfiguredStep {
  std::string dir;      // Case-relative working directory ("" = case root).
  std::string command;  // Shell command line.
};

struct AppConfig {
  int schema_version = 1;

  std::string temp_root;      // Empty: DefaultTempRoot().
  std::string template_path;  // Empty: FindBaseTemplate() next to the executable.
  int retention_days = 7;
  int job_history_cap = 50;
  int cancel_grace_ms = 5000;
  int loader_workers = 2;
  bool log_echo = false;

  std::vector<ConfiguredStep> mesh_steps;

  std::string solver_subdir = "5.CHTFCase";
  int solver_processes = 1;
  bool solver_use_hostfile = false;
  std::string solver_application = "chtMultiRegionFoam";

  AppConfig();
};

bool LoadAppConfigFromFile(const std::filesystem::path& path,
                           AppConfig* config,
                           std::string* error);
bool LoadAppConfigFromString(const std::string& content,
                             AppConfig* config,
                             std::string* error);
bool SaveAppConfigToFile(const std::filesystem::path& path,
                         const AppConfig& config,
                         std::string* error);
std::string SerializeAppConfig(const AppConfig& config, int indent = 2);

bool ValidateAppConfig(const AppConfig& config, std::string* error);

// $XDG_DATA_HOME/caseflow/temp, else ~/.local/caseflow/temp.
std::filesystem::path DefaultTempRoot();
// Walks up from the working directory and the executable looking for config/basecase.
std::filesystem::path FindBaseTemplate(const std::filesystem::path& exec_path);

std::filesystem::path ResolveTempRoot(const AppConfig& config);

#endif  // APP_CONFIG_H
