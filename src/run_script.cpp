#include "run_script.h"

#include <sstream>

#include "file_utils.h"
#include "string_utils.h"

namespace {
const char* const kSkipPrefixes[] = {
    "#!",
    "cd \"${0%/*}\"",
    ". ${WM_PROJECT_DIR",
};

void ReplaceAll(std::string* text, const std::string& from, const std::string& to) {
  if (from.empty()) {
    return;
  }
  size_t pos = 0;
  while ((pos = text->find(from, pos)) != std::string::npos) {
    text->replace(pos, from.size(), to);
    pos += to.size();
  }
}

std::string StripAfter(const std::string& line, size_t pos) {
  return pos == std::string::npos ? line : caseflow::Trim(line.substr(0, pos));
}

// Position of "> /dev/null" (any spacing after '>').
size_t FindDevNull(const std::string& line) {
  size_t pos = 0;
  while ((pos = line.find('>', pos)) != std::string::npos) {
    size_t next = pos + 1;
    while (next < line.size() && (line[next] == ' ' || line[next] == '\t')) {
      ++next;
    }
    if (line.compare(next, 9, "/dev/null") == 0) {
      return pos;
    }
    pos = next;
  }
  return std::string::npos;
}

std::string HostOptions(bool use_hostfile) {
  return use_hostfile ? "--hostfile system/hosts" : "--host localhost --oversubscribe";
}
}  // namespace

std::vector<std::string> ParseRunScript(const std::string& text, const RunScriptOptions& options) {
  std::vector<std::string> commands;
  const std::string procs = std::to_string(options.processes < 1 ? 1 : options.processes);
  std::istringstream stream(text);
  std::string raw;
  while (std::getline(stream, raw)) {
    std::string line = caseflow::Trim(raw);
    if (line.empty() || line[0] == '#') {
      continue;
    }
    bool skip = false;
    for (const char* prefix : kSkipPrefixes) {
      if (caseflow::StartsWith(line, prefix)) {
        skip = true;
        break;
      }
    }
    if (skip) {
      continue;
    }

    line = StripAfter(line, FindDevNull(line));
    line = StripAfter(line, line.find('#'));
    if (line.empty()) {
      continue;
    }

    if (caseflow::StartsWith(line, "runApplication ")) {
      line = caseflow::Trim(line.substr(15));
      if (caseflow::StartsWith(line, "-s ")) {
        std::istringstream parts(line);
        std::string flag;
        std::string suffix;
        parts >> flag >> suffix;
        std::string rest;
        std::getline(parts, rest);
        line = caseflow::Trim(rest);
        if (line.empty()) {
          continue;
        }
      }
    }

    if (caseflow::StartsWith(line, "runParallel ")) {
      const std::string app_and_args = caseflow::Trim(line.substr(12));
      line = "mpirun -np " + procs + " " + HostOptions(options.use_hostfile) + " " +
             app_and_args + " -parallel";
    }

    ReplaceAll(&line, "`getNumberOfProcessors`", procs);
    ReplaceAll(&line, "$(getNumberOfProcessors)", procs);
    if (!options.application.empty()) {
      ReplaceAll(&line, "`getApplication`", options.application);
      ReplaceAll(&line, "$(getApplication)", options.application);
    }

    if (line.find("mpirun") != std::string::npos) {
      if (options.use_hostfile) {
        ReplaceAll(&line, "--host localhost --oversubscribe", HostOptions(true));
      } else {
        ReplaceAll(&line, "--hostfile system/hosts", HostOptions(false));
      }
    }
    commands.push_back(line);
  }
  return commands;
}

std::string ReadApplicationName(const std::filesystem::path& case_subdir,
                                const std::string& fallback) {
  std::string text;
  if (!ReadFileToString(case_subdir / "system" / "controlDict", &text, nullptr)) {
    return fallback;
  }
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    const std::vector<std::string> tokens = caseflow::SplitWhitespace(line);
    if (tokens.size() >= 2 && tokens[0] == "application") {
      std::string name = tokens[1];
      if (!name.empty() && name.back() == ';') {
        name.pop_back();
      }
      if (!name.empty()) {
        return name;
      }
    }
  }
  return fallback;
}

bool BuildScriptCommand(const std::filesystem::path& case_root, const std::string& subdir,
                        const RunScriptOptions& options, CommandSpec* spec, CaseError* error) {
  const std::filesystem::path dir = case_root / subdir;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(dir / "Allrun", ec)) {
    if (error) {
      *error = MakeError(ErrorKind::InvalidCase, "Allrun not found in " + dir.string());
    }
    return false;
  }

  RunScriptOptions resolved = options;
  resolved.application = ReadApplicationName(dir, options.application);

  std::vector<std::string> commands;
  for (const char* script : {"Allclean", "Allrun"}) {
    std::string text;
    if (!std::filesystem::is_regular_file(dir / script, ec)) {
      continue;
    }
    std::string message;
    if (!ReadFileToString(dir / script, &text, &message)) {
      if (error) {
        *error = MakeError(ErrorKind::IO, message);
      }
      return false;
    }
    const std::vector<std::string> parsed = ParseRunScript(text, resolved);
    commands.insert(commands.end(), parsed.begin(), parsed.end());
  }
  if (commands.empty()) {
    if (error) {
      *error = MakeError(ErrorKind::InvalidCase,
                         "Allclean/Allrun are empty in " + dir.string());
    }
    return false;
  }

  CommandSpec built;
  const std::string log_name = (std::filesystem::path(subdir) / "log.solver").string();
  for (const std::string& command : commands) {
    built.steps.push_back(ShellStep(command, subdir, log_name));
  }
  if (spec) {
    *spec = built;
  }
  return true;
}
