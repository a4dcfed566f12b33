#ifndef RUN_SCRIPT_H
#define RUN_SCRIPT_H

#include <filesystem>
#include <string>
#include <vector>

#include "case_error.h"
#include "job_types.h"

struct RunScriptOptions {
  int processes = 1;
  bool use_hostfile = false;  // --hostfile system/hosts instead of localhost.
  std::string application;    // Replaces getApplication.
};

// Turns Allclean/Allrun text into plain command lines.
std::vector<std::string> ParseRunScript(const std::string& text, const RunScriptOptions& options);

// "application <name>;" from system/controlDict, or fallback.
std::string ReadApplicationName(const std::filesystem::path& case_subdir,
                                const std::string& fallback);

// Allclean followed by Allrun from case_root/subdir as /bin/sh steps run in
// that subdirectory and logged to <subdir>/log.solver. Fails with
// InvalidCase when Allrun is missing or both scripts yield no commands.
bool BuildScriptCommand(const std::filesystem::path& case_root, const std::string& subdir,
                        const RunScriptOptions& options, CommandSpec* spec, CaseError* error);

#endif  // RUN_SCRIPT_H
