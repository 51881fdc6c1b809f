#include "Check.h"
#include "KeycodeTable.h"
#include "Layout.h"
#include "engine.h"
#include "logger.h"

#include <boost/program_options.hpp>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

using namespace std;

namespace po = boost::program_options;

struct CommandLine
{
  string configPath = "keys.yaml";
  bool check = false;
  bool window = false;
  optional<string> windowColor;
  optional<string> logLevel;
  string logFile;
  bool help = false;
};

static po::options_description
describeOptions(CommandLine& cli)
{
  po::options_description options("Options");
  // clang-format off
  options.add_options()
    ("config-path", po::value(&cli.configPath)->value_name("path"),
     "layout file (default keys.yaml)")
    ("check", po::bool_switch(&cli.check),
     "validate the layout and print a report")
    ("window", po::bool_switch(&cli.window),
     "draw in a normal window instead of an overlay")
    ("window-color", po::value<string>()->value_name("#color"),
     "window background (default #000000FF)")
    ("log-level", po::value<string>()->value_name("level"),
     "trace, debug, info, warn, error, critical, off")
    ("log-file", po::value(&cli.logFile)->value_name("path"),
     "also log to a rotating file")
    ("help,h", po::bool_switch(&cli.help), "show this help");
  // clang-format on
  return options;
}

static void
usage(const char* program, const po::options_description& options)
{
  cout << "Usage: " << program << " [options]\n\n" << options;
}

// Throws po::error on unknown flags, missing values and stray arguments.
static void
parseArgs(int argc, char** argv, const po::options_description& options, CommandLine& cli)
{
  po::variables_map vm;
  po::store(po::command_line_parser(argc, argv).options(options).run(), vm);
  po::notify(vm);
  if (vm.count("window-color")) {
    cli.windowColor = vm["window-color"].as<string>();
  }
  if (vm.count("log-level")) {
    cli.logLevel = vm["log-level"].as<string>();
  }
}

static spdlog::level::level_enum
resolveLevel(const CommandLine& cli)
{
  string name;
  if (cli.logLevel.has_value()) {
    name = *cli.logLevel;
  } else if (const char* env = getenv("KBDOSD_LOG_LEVEL")) {
    name = env;
  } else {
    return logLevel();
  }
  auto level = spdlog::level::from_str(name);
  // from_str maps anything unknown to off.
  if (level == spdlog::level::off && name != "off") {
    cerr << "unknown log level '" << name << "', using info\n";
    return spdlog::level::info;
  }
  return level;
}

int
main(int argc, char** argv)
{
  CommandLine cli;
  auto options = describeOptions(cli);
  try {
    parseArgs(argc, argv, options, cli);
  } catch (const po::error& e) {
    cerr << e.what() << "\n";
    usage(argv[0], options);
    return 1;
  }
  if (cli.help) {
    usage(argv[0], options);
    return 0;
  }

  try {
    configureLogging(resolveLevel(cli), cli.logFile);
  } catch (const spdlog::spdlog_ex& e) {
    cerr << "cannot open log file: " << e.what() << "\n";
    return 1;
  }
  auto logger = makeLogger("Main");

  try {
    const auto& keycodes = KeycodeTable::instance();
    auto layout = loadLayout(cli.configPath, keycodes);

    if (cli.check) {
      return runCheck(cli.configPath, layout, cout);
    }

    for (const auto& problem : validateLayout(layout)) {
      logger->warn(problem);
    }

    EngineOptions options;
    options.windowMode = cli.window;
    if (cli.windowColor.has_value()) {
      try {
        options.windowColor = parseColor(*cli.windowColor);
      } catch (const invalid_argument& e) {
        logger->error("--window-color: {}; using #000000FF", e.what());
      }
    }

    Engine::installSignalHandlers();
    Engine engine(layout, options);
    engine.wire();
    engine.loop();
  } catch (const LayoutError& e) {
    logger->error(e.what());
    return 1;
  } catch (const SessionError& e) {
    logger->critical("display session failed: {}", e.what());
    return 1;
  } catch (const BufferError& e) {
    logger->critical("buffer allocation failed: {}", e.what());
    return 1;
  } catch (const exception& e) {
    logger->critical(e.what());
    return 1;
  }
  logger->info("exiting");
  return 0;
}
