#include "xstory/log.h"
#include "xstory/paths.h"
#include "xstoryctl/cli_api.h"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace {
struct ParsedArgs {
  CommonOptions common;
  std::optional<fs::path> target;
  std::optional<std::string> name;
  bool ci = false;
  bool init_db = false;
  bool force = false;
  bool fix = false;
  bool verbose = false;
  std::string unknown;
};

ParsedArgs parse_args(int argc, char** argv, int start) {
  ParsedArgs out;
  for (int i = start; i < argc; ++i) {
    const std::string arg = argv[i];
    if ((arg == "--target" || arg == "-t") && i + 1 < argc) {
      out.target = fs::path(argv[++i]);
    } else if ((arg == "--name" || arg == "-n") && i + 1 < argc) {
      out.name = std::string(argv[++i]);
    } else if (arg == "--source" && i + 1 < argc) {
      out.common.source_override = fs::path(argv[++i]);
    } else if (arg == "--config" && i + 1 < argc) {
      out.common.config_override = fs::path(argv[++i]);
    } else if (arg == "--ci") {
      out.ci = true;
    } else if (arg == "--init-db") {
      out.init_db = true;
    } else if (arg == "--force") {
      out.force = true;
    } else if (arg == "--fix") {
      out.fix = true;
    } else if (arg == "--verbose" || arg == "-v") {
      out.verbose = true;
    } else if (out.unknown.empty()) {
      out.unknown = arg;
    }
  }
  return out;
}

int missing_target(const std::string& command) {
  std::cerr << command << ": --target is required\n";
  print_usage();
  return 1;
}
} // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string command = argv[1];
  if (command == "--help" || command == "-h" || command == "help") {
    print_usage();
    return 0;
  }

  const ParsedArgs args = parse_args(argc, argv, 2);
  if (!args.unknown.empty()) {
    std::cerr << "unknown argument: " << args.unknown << "\n";
    print_usage();
    return 1;
  }

  const char* argv0 = argc > 0 ? argv[0] : nullptr;
  const auto paths = xstory::resolve_paths(argv0, args.common.source_override, args.common.config_override);
  xstory::log::init("xstoryctl", paths.logs_dir);
  xstory::log::install_crash_handlers();
  xstory::log::set_console_level(args.verbose ? xstory::log::Level::Info : xstory::log::Level::Warn);
  xstory::log::info("command: " + command);

  int rc = 1;
  if (command == "install") {
    if (!args.target) return missing_target(command);
    InstallOptions opts;
    opts.ci = args.ci;
    opts.init_db = args.init_db;
    opts.force = args.force;
    rc = cmd_install(paths, *args.target, opts);
  } else if (command == "sync-workflows") {
    if (!args.target) return missing_target(command);
    rc = cmd_sync_workflows(paths, *args.target);
  } else if (command == "init-db") {
    if (!args.target) return missing_target(command);
    rc = cmd_init_db(paths, *args.target, args.force);
  } else if (command == "diagnose") {
    if (!args.target) return missing_target(command);
    DiagnoseOptions opts;
    opts.ci = args.ci;
    opts.fix = args.fix;
    rc = cmd_diagnose(paths, *args.target, opts);
  } else if (command == "register") {
    if (!args.target) return missing_target(command);
    rc = cmd_register(paths, *args.target, args.name);
  } else if (command == "unregister") {
    if (!args.target) return missing_target(command);
    rc = cmd_unregister(paths, *args.target);
  } else if (command == "list-dependents") {
    rc = cmd_list_dependents(paths);
  } else if (command == "update-all") {
    rc = cmd_update_all(paths);
  } else {
    std::cerr << "unknown command: " << command << "\n";
    print_usage();
  }

  if (rc != 0 && !xstory::log::current_log_file().empty()) {
    std::cerr << "Details: " << xstory::log::current_log_file().string() << "\n";
  }
  xstory::log::shutdown();
  return rc;
}
