#include "run_script.h"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "file_utils.h"
#include "string_utils.h"

namespace {
bool Check(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << message << "\n";
  }
  return condition;
}

bool Write(const std::filesystem::path& path, const std::string& content) {
  std::string error;
  if (!WriteStringToFile(path, content, &error)) {
    std::cerr << error << "\n";
    return false;
  }
  return true;
}
}  // namespace

int main() {
  RunScriptOptions options;
  options.processes = 4;
  options.application = "chtMultiRegionFoam";

  const std::string allrun =
      "#!/bin/sh\n"
      "cd \"${0%/*}\" || exit 1\n"
      ". ${WM_PROJECT_DIR:?}/bin/tools/RunFunctions\n"
      "\n"
      "# prepare regions\n"
      "runApplication -s fluid foamDictionary system/fluid/fvSchemes\n"
      "runApplication decomposePar -allRegions > /dev/null 2>&1\n"
      "runParallel $(getApplication)\n"
      "mpirun -np `getNumberOfProcessors` --hostfile system/hosts foamRun -parallel # solve\n"
      "runApplication -s log\n";

  std::vector<std::string> commands = ParseRunScript(allrun, options);
  const std::vector<std::string> expected = {
      "foamDictionary system/fluid/fvSchemes",
      "decomposePar -allRegions",
      "mpirun -np 4 --host localhost --oversubscribe chtMultiRegionFoam -parallel",
      "mpirun -np 4 --host localhost --oversubscribe foamRun -parallel",
  };
  if (!Check(commands == expected, "local script translation is wrong")) {
    for (const auto& c : commands) {
      std::cerr << "  " << c << "\n";
    }
    return 1;
  }

  options.use_hostfile = true;
  commands = ParseRunScript(allrun, options);
  if (!Check(commands.size() == 4 &&
                 commands[2] == "mpirun -np 4 --hostfile system/hosts chtMultiRegionFoam -parallel" &&
                 commands[3] == "mpirun -np 4 --hostfile system/hosts foamRun -parallel",
             "hostfile translation is wrong")) {
    return 1;
  }

  // Case directory with Allclean + Allrun + controlDict.
  const std::filesystem::path root =
      std::filesystem::temp_directory_path() / ("caseflow_run_script_" + caseflow::GenerateRandomTag(8));
  const std::string subdir = "5.CHTFCase";
  const std::filesystem::path dir = root / subdir;
  if (!Write(dir / "Allclean", "#!/bin/sh\nrm -rf processor*\n") ||
      !Write(dir / "Allrun", "#!/bin/sh\nrunParallel `getApplication`\n") ||
      !Write(dir / "system" / "controlDict",
             "FoamFile\n{\n}\napplication     buoyantFoam;\nstartFrom latestTime;\n")) {
    return 1;
  }
  if (!Check(ReadApplicationName(dir, "fallback") == "buoyantFoam", "controlDict lookup failed")) {
    return 1;
  }
  if (!Check(ReadApplicationName(root, "fallback") == "fallback", "missing controlDict fallback")) {
    return 1;
  }

  options.use_hostfile = false;
  options.processes = 2;
  CommandSpec spec;
  CaseError error;
  if (!Check(BuildScriptCommand(root, subdir, options, &spec, &error), DescribeError(error))) {
    return 1;
  }
  if (!Check(spec.steps.size() == 2, "expected Allclean and Allrun steps")) {
    return 1;
  }
  const CommandStep& clean = spec.steps[0];
  const CommandStep& run = spec.steps[1];
  if (!Check(clean.argv.size() == 3 && clean.argv[0] == "/bin/sh" && clean.argv[2] == "rm -rf processor*",
             "Allclean step is wrong")) {
    return 1;
  }
  if (!Check(run.argv.size() == 3 &&
                 run.argv[2] == "mpirun -np 2 --host localhost --oversubscribe buoyantFoam -parallel",
             "Allrun step is wrong")) {
    return 1;
  }
  const std::string log_name = (std::filesystem::path(subdir) / "log.solver").string();
  if (!Check(run.working_subdir == subdir && run.log_name == log_name &&
                 clean.log_name == log_name,
             "steps are not scoped to the solver directory")) {
    return 1;
  }

  // Missing Allrun and empty scripts.
  std::error_code ec;
  std::filesystem::remove(dir / "Allrun", ec);
  if (!Check(!BuildScriptCommand(root, subdir, options, &spec, &error) &&
                 error.kind == ErrorKind::InvalidCase,
             "missing Allrun was accepted")) {
    return 1;
  }
  if (!Write(dir / "Allrun", "#!/bin/sh\n# nothing\n") ||
      !Write(dir / "Allclean", "#!/bin/sh\n")) {
    return 1;
  }
  if (!Check(!BuildScriptCommand(root, subdir, options, &spec, &error) &&
                 error.kind == ErrorKind::InvalidCase,
             "empty scripts were accepted")) {
    return 1;
  }

  std::filesystem::remove_all(root, ec);
  return 0;
}
