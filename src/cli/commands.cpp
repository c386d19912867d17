#include "tunnels/cli/commands.hpp"

#include "tunnels/common/fs.hpp"
#include "tunnels/config/config.hpp"
#include "tunnels/observability/factory.hpp"
#include "tunnels/observability/global.hpp"
#include "tunnels/output/render.hpp"
#include "tunnels/process/procfs.hpp"
#include "tunnels/tunnel/lifecycle.hpp"
#include "tunnels/tunnel/process.hpp"
#include "tunnels/tunnel/status.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

namespace tunnels::cli {

namespace {

constexpr const char *RESET = "\033[0m";
constexpr const char *BOLD = "\033[1m";
constexpr const char *DIM = "\033[2m";
constexpr const char *RED = "\033[31m";
constexpr const char *GREEN = "\033[32m";
constexpr const char *YELLOW = "\033[33m";
constexpr const char *CYAN = "\033[36m";

constexpr auto kLiveRefresh = std::chrono::seconds(4);

std::atomic<bool> g_interrupted{false};

void handle_interrupt(int) { g_interrupted.store(true); }

struct GlobalOptions {
  bool verbose = false;
};

bool color_enabled() {
  const char *no_color = std::getenv("NO_COLOR");
  if (no_color != nullptr && *no_color != '\0') {
    return false;
  }
  return isatty(STDOUT_FILENO) != 0;
}

std::string paint(const char *color, const std::string &text) {
  if (!color_enabled()) {
    return text;
  }
  return std::string(color) + text + RESET;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
    if (common::starts_with(args[i], long_name + "=")) {
      out_value = args[i].substr(long_name.size() + 1);
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

/// Every occurrence of a repeatable option, in order.
std::vector<std::string> take_all_options(std::vector<std::string> &args,
                                          const std::string &long_name,
                                          const std::string &short_name) {
  std::vector<std::string> values;
  std::string value;
  while (take_option(args, long_name, short_name, value)) {
    values.push_back(value);
  }
  return values;
}

bool take_flag(std::vector<std::string> &args, const std::string &name,
               const std::string &short_name = "") {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name || (!short_name.empty() && args[i] == short_name)) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, GlobalOptions &options,
                          std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    if (args[i] == "--verbose") {
      options.verbose = true;
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

void flush_observer() {
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
}

int usage_error(const std::string &message) {
  std::cerr << paint(RED, "Error: " + message) << "\n";
  std::cerr << "Run 'tunnels help' for usage.\n";
  return kExitUsage;
}

int exit_code_for(const common::ErrorKind kind) {
  return kind == common::ErrorKind::Usage ? kExitUsage : kExitError;
}

int report_failure(const common::Status &status) {
  observability::record_error(std::string(common::error_kind_name(status.kind())),
                              status.error());
  flush_observer();
  std::cerr << paint(RED, status.error()) << "\n";
  return exit_code_for(status.kind());
}

bool reject_leftovers(const std::vector<std::string> &args, int &code) {
  if (args.empty()) {
    return false;
  }
  code = usage_error("unexpected argument(s): " + common::join(args, " "));
  return true;
}

/// Load configuration and install the observer it selects.
common::Result<config::Config> load_and_observe(const GlobalOptions &globals) {
  if (globals.verbose) {
    observability::set_global_observer(observability::create_observer("log"));
  }
  std::vector<std::string> warnings;
  auto loaded = config::load_config(warnings);
  if (!loaded.ok()) {
    return loaded;
  }
  const auto &cfg = loaded.value();
  observability::set_global_observer(
      observability::create_observer(globals.verbose ? "log" : cfg.observability.backend));

  for (const auto &warning : warnings) {
    std::cerr << paint(YELLOW, "Warning: " + warning) << "\n";
  }
  return loaded;
}

tunnel::Selector parse_selector(std::vector<std::string> &args) {
  tunnel::Selector selector;
  selector.names = take_all_options(args, "--name", "-n");
  std::string group;
  if (take_option(args, "--group", "-g", group)) {
    selector.group = group;
  }
  selector.all = take_flag(args, "--all", "-a");
  return selector;
}

void print_warnings(const std::vector<std::string> &warnings) {
  for (const auto &warning : warnings) {
    std::cout << paint(YELLOW, warning) << "\n";
  }
}

const char *summary_color(const tunnel::BatchClassification classification) {
  switch (classification) {
  case tunnel::BatchClassification::FullSuccess:
    return GREEN;
  case tunnel::BatchClassification::TotalFailure:
    return RED;
  case tunnel::BatchClassification::Empty:
  case tunnel::BatchClassification::PartialSuccess:
    break;
  }
  return YELLOW;
}

void print_start_item(const tunnel::BatchItem<tunnel::StartOutcome> &item) {
  switch (item.outcome) {
  case tunnel::StartOutcome::Started:
    std::cout << paint(GREEN, "Started tunnel '" + item.tunnel + "' using " + item.launcher)
              << "\n";
    break;
  case tunnel::StartOutcome::AlreadyRunning:
    std::cout << paint(YELLOW, "Tunnel '" + item.tunnel + "' is already running") << "\n";
    break;
  case tunnel::StartOutcome::Failed:
    std::cout << paint(RED, "Failed to start tunnel '" + item.tunnel + "': " + item.message)
              << "\n";
    break;
  }
}

void print_stop_item(const tunnel::BatchItem<tunnel::StopOutcome> &item) {
  switch (item.outcome) {
  case tunnel::StopOutcome::Stopped:
    std::cout << paint(GREEN, "Stopped tunnel '" + item.tunnel + "'") << "\n";
    break;
  case tunnel::StopOutcome::ForceKilled:
    std::cout << paint(YELLOW, "Killed tunnel '" + item.tunnel + "' after it ignored SIGTERM")
              << "\n";
    break;
  case tunnel::StopOutcome::NotRunning:
    std::cout << paint(YELLOW, "Tunnel '" + item.tunnel + "' is not running") << "\n";
    break;
  case tunnel::StopOutcome::AlreadyStopped:
    std::cout << paint(YELLOW, "Tunnel '" + item.tunnel + "' was already stopped") << "\n";
    break;
  case tunnel::StopOutcome::Failed:
    std::cout << paint(RED, "Failed to stop tunnel '" + item.tunnel + "': " + item.message)
              << "\n";
    break;
  }
}

int run_start(std::vector<std::string> args, const GlobalOptions &globals) {
  const auto selector = parse_selector(args);
  const bool no_autossh = take_flag(args, "--no-autossh");
  if (int code = 0; reject_leftovers(args, code)) {
    return code;
  }

  auto cfg = load_and_observe(globals);
  if (!cfg.ok()) {
    return report_failure(cfg.status());
  }

  process::ProcfsInspector inspector;
  tunnel::PosixProcessControl control;
  tunnel::PathExecutableLocator locator;
  tunnel::LifecycleController controller(cfg.value().tunnels, inspector, control, locator);

  const auto selected = controller.select(selector);
  if (!selected.ok()) {
    return usage_error(selected.error());
  }

  const auto report = controller.start(selected.value(), cfg.value().autossh && !no_autossh);
  print_warnings(report.warnings);
  for (const auto &item : report.items) {
    print_start_item(item);
  }
  std::cout << paint(summary_color(report.classification()), tunnel::summarize(report)) << "\n";
  flush_observer();
  return kExitOk;
}

int run_stop(std::vector<std::string> args, const GlobalOptions &globals) {
  const auto selector = parse_selector(args);
  if (int code = 0; reject_leftovers(args, code)) {
    return code;
  }

  auto cfg = load_and_observe(globals);
  if (!cfg.ok()) {
    return report_failure(cfg.status());
  }

  process::ProcfsInspector inspector;
  tunnel::PosixProcessControl control;
  tunnel::PathExecutableLocator locator;
  tunnel::LifecycleController controller(cfg.value().tunnels, inspector, control, locator);

  const auto selected = controller.select(selector);
  if (!selected.ok()) {
    return usage_error(selected.error());
  }

  const auto report = controller.stop(selected.value());
  print_warnings(report.warnings);
  for (const auto &item : report.items) {
    print_stop_item(item);
  }
  std::cout << paint(summary_color(report.classification()), tunnel::summarize(report)) << "\n";
  flush_observer();
  return kExitOk;
}

int run_status(std::vector<std::string> args, const GlobalOptions &globals) {
  const bool live = take_flag(args, "--live", "-l");
  output::RenderOptions options;
  std::string format;
  if (take_option(args, "--format", "-f", format)) {
    const auto parsed = output::parse_output_format(format);
    if (!parsed.has_value()) {
      return usage_error("unknown output format: " + format +
                         " (expected panel, table, json, yaml or toml)");
    }
    options.format = *parsed;
  }
  options.columns = take_all_options(args, "--column", "-c");
  if (int code = 0; reject_leftovers(args, code)) {
    return code;
  }

  // Columns are checked against the record shape even when nothing is configured.
  const std::vector<output::Record> shape = {tunnel::to_record(tunnel::StatusEntry{})};
  if (const auto checked = output::select_columns(shape, options.columns); !checked.ok()) {
    return usage_error(checked.error());
  }

  auto cfg = load_and_observe(globals);
  if (!cfg.ok()) {
    return report_failure(cfg.status());
  }

  const bool structured = options.format == output::OutputFormat::Json ||
                          options.format == output::OutputFormat::Yaml ||
                          options.format == output::OutputFormat::Toml;
  options.color = !structured && color_enabled();

  process::ProcfsInspector inspector;
  const auto render_once = [&]() -> common::Result<std::string> {
    const auto entries = tunnel::snapshot(cfg.value().tunnels, inspector);
    return output::render(tunnel::to_records(entries), options);
  };

  if (!live) {
    const auto rendered = render_once();
    if (!rendered.ok()) {
      return usage_error(rendered.error());
    }
    std::cout << rendered.value();
    return kExitOk;
  }

  g_interrupted.store(false);
  std::signal(SIGINT, handle_interrupt);
  std::signal(SIGTERM, handle_interrupt);
  while (!g_interrupted.load()) {
    const auto rendered = render_once();
    if (!rendered.ok()) {
      return usage_error(rendered.error());
    }
    std::cout << "\033[2J\033[H" << rendered.value() << std::flush;

    const auto deadline = std::chrono::steady_clock::now() + kLiveRefresh;
    while (!g_interrupted.load() && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  }
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  return kExitOk;
}

int run_config_path() {
  auto path_result = config::config_path();
  if (!path_result.ok()) {
    return report_failure(path_result.status());
  }
  std::cout << path_result.value().string() << "\n";
  return kExitOk;
}

} // namespace

std::string version_string() {
#ifdef TUNNELS_VERSION
  return std::string("tunnels ") + TUNNELS_VERSION;
#else
  return "tunnels 0.1.0";
#endif
}

void print_help() {
  std::cout << "\n";
  std::cout << BOLD << CYAN << "  tunnels" << RESET << DIM << " - manage named SSH tunnels"
            << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "tunnels [--config PATH] [--verbose] <command> [options]\n\n";

  std::cout << BOLD << "  COMMANDS" << RESET << "\n";
  std::cout << "  " << GREEN << "start" << RESET << DIM << "          Start tunnels selected by --name, --group or --all" << RESET << "\n";
  std::cout << "  " << GREEN << "stop" << RESET << DIM << "           Stop tunnels selected by --name, --group or --all" << RESET << "\n";
  std::cout << "  " << GREEN << "status" << RESET << DIM << "         Get the current status of the configured tunnels" << RESET << "\n";
  std::cout << "  " << GREEN << "config-path" << RESET << DIM << "    Print the configuration file location" << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "        Show version" << RESET << "\n\n";

  std::cout << BOLD << "  SELECTION" << RESET << DIM << " (start, stop)" << RESET << "\n";
  std::cout << "  " << YELLOW << "-n, --name NAME" << RESET << DIM << "   Tunnel name, repeatable" << RESET << "\n";
  std::cout << "  " << YELLOW << "-g, --group GROUP" << RESET << DIM << " Every tunnel in a group" << RESET << "\n";
  std::cout << "  " << YELLOW << "-a, --all" << RESET << DIM << "         Every configured tunnel" << RESET << "\n";
  std::cout << "  " << YELLOW << "--no-autossh" << RESET << DIM << "      Start with plain ssh" << RESET << "\n\n";

  std::cout << BOLD << "  STATUS" << RESET << "\n";
  std::cout << "  " << YELLOW << "-l, --live" << RESET << DIM << "        Live status view that updates every 4 seconds" << RESET << "\n";
  std::cout << "  " << YELLOW << "-f, --format FMT" << RESET << DIM << "  panel, table, json, yaml or toml" << RESET << "\n";
  std::cout << "  " << YELLOW << "-c, --column COL" << RESET << DIM << "  name, group, hostname, pid, status, connections" << RESET << "\n";
  std::cout << "\n";
}

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return kExitOk;
  }
  return run_cli(collect_args(argc - 1, argv + 1));
}

int run_cli(std::vector<std::string> args) {
  GlobalOptions globals;
  std::string global_error;
  if (!apply_global_options(args, globals, global_error)) {
    return usage_error(global_error);
  }

  if (args.empty()) {
    print_help();
    return kExitOk;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return kExitOk;
  }
  if (subcommand == "--version" || subcommand == "-v" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return kExitOk;
  }
  if (subcommand == "config-path") {
    return run_config_path();
  }
  if (subcommand == "start") {
    return run_start(std::move(args), globals);
  }
  if (subcommand == "stop") {
    return run_stop(std::move(args), globals);
  }
  if (subcommand == "status") {
    return run_status(std::move(args), globals);
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return kExitUsage;
}

} // namespace tunnels::cli
