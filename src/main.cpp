#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "app_config.h"
#include "async_loader.h"
#include "case_error.h"
#include "event_dispatcher.h"
#include "execution_controller.h"
#include "job_registry.h"
#include "log_service.h"
#include "run_script.h"
#include "service_registry.h"
#include "session_manager.h"
#include "stl_reader.h"
#include "temp_case_janitor.h"

namespace {
std::atomic<bool> g_interrupted{false};

void HandleInterrupt(int) {
  g_interrupted.store(true);
}

void PrintUsage() {
  std::cout
      << "Usage: caseflow [case_path] [options]\n"
      << "Without case_path a temporary case is created from the base template.\n"
      << "Optional: --config <file> (load JSON configuration)\n"
      << "Optional: --dump-config <file> (write the effective configuration and exit)\n"
      << "Optional: --template <dir> (base case template)\n"
      << "Optional: --temp-root <dir> (where temporary cases live)\n"
      << "Optional: --retention-days N (temp case retention, default 7)\n"
      << "Optional: --mesh \"cmd\" (mesh step run in the case; repeatable)\n"
      << "Optional: --mesh-default (run the configured mesh steps)\n"
      << "Optional: --solve \"cmd\" (solver step run in the case; repeatable)\n"
      << "Optional: --solve-script <subdir> (run Allclean/Allrun of a case subdirectory)\n"
      << "Optional: --inspect-stl <file> (decode an STL file and print a summary)\n"
      << "Optional: --save-as <dir> (save the case after the jobs finish)\n"
      << "Optional: --log-echo (mirror the log to stderr)\n";
}

struct CliOptions {
  std::string case_path;
  std::string config_path;
  std::string dump_config_path;
  std::string template_path;
  std::string temp_root;
  int retention_days = -1;
  std::vector<std::string> mesh_commands;
  bool mesh_default = false;
  std::vector<std::string> solve_commands;
  std::string solve_script;
  std::vector<std::string> inspect_stl;
  std::string save_as;
  bool log_echo = false;
};

bool ParseInt(const std::string& text, int* out) {
  try {
    size_t consumed = 0;
    const int value = std::stoi(text, &consumed);
    if (consumed != text.size()) {
      return false;
    }
    *out = value;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

bool ParseArgs(int argc, char** argv, CliOptions* opts, std::string* error) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto next = [&](std::string* out) {
      if (i + 1 >= argc) {
        *error = arg + " requires a value";
        return false;
      }
      *out = argv[++i];
      return true;
    };
    std::string value;
    if (arg == "--config") {
      if (!next(&opts->config_path)) {
        return false;
      }
    } else if (arg == "--dump-config") {
      if (!next(&opts->dump_config_path)) {
        return false;
      }
    } else if (arg == "--template") {
      if (!next(&opts->template_path)) {
        return false;
      }
    } else if (arg == "--temp-root") {
      if (!next(&opts->temp_root)) {
        return false;
      }
    } else if (arg == "--retention-days") {
      if (!next(&value)) {
        return false;
      }
      if (!ParseInt(value, &opts->retention_days) || opts->retention_days < 0) {
        *error = "--retention-days expects a non-negative integer";
        return false;
      }
    } else if (arg == "--mesh") {
      if (!next(&value)) {
        return false;
      }
      opts->mesh_commands.push_back(value);
    } else if (arg == "--mesh-default") {
      opts->mesh_default = true;
    } else if (arg == "--solve") {
      if (!next(&value)) {
        return false;
      }
      opts->solve_commands.push_back(value);
    } else if (arg == "--solve-script") {
      if (!next(&opts->solve_script)) {
        return false;
      }
    } else if (arg == "--inspect-stl") {
      if (!next(&value)) {
        return false;
      }
      opts->inspect_stl.push_back(value);
    } else if (arg == "--save-as") {
      if (!next(&opts->save_as)) {
        return false;
      }
    } else if (arg == "--log-echo") {
      opts->log_echo = true;
    } else if (!arg.empty() && arg[0] == '-') {
      *error = "unknown option: " + arg;
      return false;
    } else if (opts->case_path.empty()) {
      opts->case_path = arg;
    } else {
      *error = "only one case path may be given";
      return false;
    }
  }
  return true;
}

bool EnvFlag(const char* name) {
  const char* value = std::getenv(name);
  return value && *value && std::string(value) != "0";
}

// Exit status for a finished job, shell style.
int ExitStatusFor(const Job& job) {
  switch (job.state) {
    case JobState::Succeeded:
      return 0;
    case JobState::Cancelled:
      return 130;
    case JobState::Failed:
      if (job.exit_code && *job.exit_code != 0) {
        return *job.exit_code;
      }
      return 1;
    default:
      return 1;
  }
}

// Launches one job and pumps the dispatcher until it is terminal.
int RunHeadlessJob(ServiceRegistry& services, CaseSession& session, JobKind kind,
                   const CommandSpec& spec) {
  auto& controller = services.Resolve<ExecutionController>();
  auto& dispatcher = services.Resolve<EventDispatcher>();
  auto& log = services.Resolve<LogService>();

  LaunchResult launch = controller.Launch(session, kind, spec);
  if (!launch.ok) {
    std::cerr << "error: " << DescribeError(launch.error) << "\n";
    return 1;
  }

  bool finished = false;
  const int token = controller.Subscribe(launch.job.id, [&](const JobEvent& event) {
    if (event.kind == JobEventKind::Progress) {
      std::cout << event.progress.text << "\n";
      return;
    }
    if (IsTerminal(event.state)) {
      finished = true;
    }
  });

  bool cancel_sent = false;
  while (!finished) {
    dispatcher.WaitAndDrain(std::chrono::milliseconds(100));
    if (g_interrupted.load() && !cancel_sent) {
      cancel_sent = true;
      log.Warning("job", "interrupted, cancelling job " + std::to_string(launch.job.id));
      controller.Cancel(launch.job.id);
    }
  }
  controller.Unsubscribe(token);
  std::cout.flush();

  std::optional<Job> job = services.Resolve<JobRegistry>().Find(launch.job.id);
  if (!job) {
    return 1;
  }
  std::cerr << JobKindToken(job->kind) << " job " << job->id << ": " << JobStateToken(job->state);
  if (!job->error.ok()) {
    std::cerr << " (" << DescribeError(job->error) << ")";
  }
  std::cerr << "\n";
  return ExitStatusFor(*job);
}

int InspectStl(ServiceRegistry& services, const std::vector<std::string>& paths) {
  auto& loader = services.Resolve<AsyncLoader>();
  auto& dispatcher = services.Resolve<EventDispatcher>();
  size_t delivered = 0;
  int status = 0;
  loader.SetObserver([&](const LoadOutcome& outcome) {
    ++delivered;
    if (outcome.state != LoadState::Completed) {
      std::cerr << outcome.path.string() << ": " << LoadStateToken(outcome.state);
      if (!outcome.error.ok()) {
        std::cerr << " (" << DescribeError(outcome.error) << ")";
      }
      std::cerr << "\n";
      status = 1;
      return;
    }
    const StlMesh* mesh = outcome.Value<StlMesh>();
    if (!mesh) {
      status = 1;
      return;
    }
    std::cout << outcome.path.string() << ": " << (mesh->binary ? "binary" : "ascii")
              << " solid '" << mesh->solid_name << "', " << mesh->TriangleCount()
              << " triangles, bounds [" << mesh->min[0] << ", " << mesh->min[1] << ", "
              << mesh->min[2] << "] - [" << mesh->max[0] << ", " << mesh->max[1] << ", "
              << mesh->max[2] << "]\n";
  });

  std::function<bool(const std::string&, StlMesh*, std::string*)> decode =
      [](const std::string& bytes, StlMesh* mesh, std::string* error) {
        StlReadResult result = DecodeStl(bytes);
        if (!result.ok) {
          *error = result.error;
          return false;
        }
        *mesh = std::move(result.mesh);
        return true;
      };
  for (const auto& path : paths) {
    loader.LoadAs<StlMesh>(path, decode);
  }
  dispatcher.PumpUntil([&] { return delivered == paths.size(); }, std::chrono::minutes(10));
  loader.SetObserver(nullptr);
  return delivered == paths.size() ? status : 1;
}

void RegisterServices(ServiceRegistry& services, const AppConfig& config) {
  auto& log = services.Emplace<LogService>();
  log.SetEcho(config.log_echo);
  services.Register<AppConfig>(std::make_shared<AppConfig>(config));
  auto& dispatcher = services.Emplace<EventDispatcher>(&log);
  auto& registry =
      services.Emplace<JobRegistry>(static_cast<size_t>(config.job_history_cap));
  auto& controller = services.Emplace<ExecutionController>(
      registry, dispatcher, &log, std::chrono::milliseconds(config.cancel_grace_ms));
  services.Emplace<TempCaseJanitor>(&log);
  services.Emplace<AsyncLoader>(dispatcher, config.loader_workers, &log);
  services.Emplace<SessionManager>(
      controller, &log, std::chrono::milliseconds(config.cancel_grace_ms + 2000));
  services.Seal();
}

}  // namespace

int main(int argc, char** argv) {
  CliOptions opts;
  std::string error;
  if (argc > 1 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h")) {
    PrintUsage();
    return 0;
  }
  if (!ParseArgs(argc, argv, &opts, &error)) {
    std::cerr << error << "\n";
    PrintUsage();
    return 1;
  }

  AppConfig config;
  if (!opts.config_path.empty() && !LoadAppConfigFromFile(opts.config_path, &config, &error)) {
    std::cerr << "config error: " << error << "\n";
    return 1;
  }
  if (!opts.template_path.empty()) {
    config.template_path = opts.template_path;
  }
  if (!opts.temp_root.empty()) {
    config.temp_root = opts.temp_root;
  }
  if (opts.retention_days >= 0) {
    config.retention_days = opts.retention_days;
  }
  if (opts.log_echo || EnvFlag("CASEFLOW_LOG_ECHO")) {
    config.log_echo = true;
  }
  if (!ValidateAppConfig(config, &error)) {
    std::cerr << "config error: " << error << "\n";
    return 1;
  }
  if (!opts.dump_config_path.empty()) {
    if (!SaveAppConfigToFile(opts.dump_config_path, config, &error)) {
      std::cerr << "config error: " << error << "\n";
      return 1;
    }
    std::cout << "wrote " << opts.dump_config_path << "\n";
    return 0;
  }

  ServiceRegistry services;
  int status = 0;
  try {
    RegisterServices(services, config);
    auto& log = services.Resolve<LogService>();
    auto& dispatcher = services.Resolve<EventDispatcher>();
    auto& sessions = services.Resolve<SessionManager>();

    std::signal(SIGINT, HandleInterrupt);
    std::signal(SIGTERM, HandleInterrupt);

    const std::filesystem::path temp_root = ResolveTempRoot(config);
    std::filesystem::path base_template = config.template_path;
    if (base_template.empty()) {
      base_template = FindBaseTemplate(argc > 0 ? argv[0] : "");
    }

    CaseError case_error;
    if (!sessions.OpenOrCreate(opts.case_path, base_template, temp_root, &case_error)) {
      std::cerr << "error: " << DescribeError(case_error) << "\n";
      services.Reset();
      return 1;
    }
    CaseSession& session = *sessions.Current();
    std::cerr << "case: " << session.Path().string()
              << (session.IsTemporary() ? " (temporary)" : "") << "\n";

    bool janitor_done = false;
    auto& janitor = services.Resolve<TempCaseJanitor>();
    janitor.StartBackgroundSweep(
        sessions.JanitorOptionsFor(temp_root, RetentionFromDays(config.retention_days)),
        dispatcher, [&](const JanitorReport& report) {
          janitor_done = true;
          if (report.removed > 0 || report.failed > 0) {
            log.Info("janitor", "removed " + std::to_string(report.removed) +
                                    " expired temp case(s), " + std::to_string(report.failed) +
                                    " failed");
          }
        });

    if (!opts.inspect_stl.empty()) {
      status = InspectStl(services, opts.inspect_stl);
    }

    bool ran_jobs = false;
    CommandSpec mesh;
    if (opts.mesh_default) {
      for (const auto& step : config.mesh_steps) {
        mesh.steps.push_back(ShellStep(step.command, step.dir, "log.mesh"));
      }
    }
    for (const auto& command : opts.mesh_commands) {
      mesh.steps.push_back(ShellStep(command, "", "log.mesh"));
    }
    if (status == 0 && !mesh.steps.empty()) {
      ran_jobs = true;
      status = RunHeadlessJob(services, session, JobKind::MeshGeneration, mesh);
    }

    CommandSpec solve;
    for (const auto& command : opts.solve_commands) {
      solve.steps.push_back(ShellStep(command, "", "log.solver"));
    }
    if (status == 0 && !opts.solve_script.empty()) {
      RunScriptOptions script_options;
      script_options.processes = config.solver_processes;
      script_options.use_hostfile = config.solver_use_hostfile;
      script_options.application = config.solver_application;
      CommandSpec scripted;
      if (!BuildScriptCommand(session.Path(), opts.solve_script, script_options, &scripted,
                              &case_error)) {
        std::cerr << "error: " << DescribeError(case_error) << "\n";
        status = 1;
      } else {
        solve.steps.insert(solve.steps.end(), scripted.steps.begin(), scripted.steps.end());
      }
    }
    if (status == 0 && !solve.steps.empty()) {
      ran_jobs = true;
      status = RunHeadlessJob(services, session, JobKind::SolverRun, solve);
    }

    if (status == 0 && !opts.save_as.empty()) {
      if (!session.SaveAs(opts.save_as, &case_error)) {
        std::cerr << "error: " << DescribeError(case_error) << "\n";
        status = 1;
      } else {
        std::cerr << "saved case to " << session.Path().string() << "\n";
      }
    }

    dispatcher.PumpUntil([&] { return janitor_done; }, std::chrono::seconds(30));
    janitor.Wait();
    dispatcher.Drain();

    if (ran_jobs && session.IsTemporary()) {
      // Keep the results; the janitor removes the directory once it expires.
      std::unique_ptr<CaseSession> kept = sessions.Release();
      std::cerr << "temporary case kept at " << kept->Path().string() << "\n";
    } else {
      sessions.Close();
    }
    services.Reset();
  } catch (const ConfigurationError& e) {
    std::cerr << "fatal configuration error: " << e.what() << "\n";
    return 2;
  }
  return status;
}
