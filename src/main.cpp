#include "app/bootstrap.hpp"
#include "cli/event_reader.hpp"
#include "config/config.hpp"
#include "logger/logger.hpp"
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_set>
#include <boost/log/trivial.hpp>

struct ProgramOptions {
  std::string config_path;
  std::string input_path;
  std::optional<std::string> log_level;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -c <config> [-i <events.json>] [-l <level>]\n"
        << "Required arguments:\n"
        << "  -c, --config     INI configuration file\n"
        << "Optional arguments:\n"
        << "  -i, --input      Newline-delimited JSON events (default: stdin)\n"
        << "  -l, --log-level  trace, debug, info, warning, error or fatal\n"
        << "Example: " << program_name << " -c honeyvault.ini -i cowrie.json\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> flags = {
    "-c", "--config",
    "-i", "--input",
    "-l", "--log-level"
  };

  ProgramOptions options;

  if (argc % 2 == 0) {
    std::cerr << "Error: Missing value for argument: " << argv[argc - 1] << '\n';
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    if (flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    if (flag == "-c" || flag == "--config") {
      options.config_path = value;
    } else if (flag == "-i" || flag == "--input") {
      options.input_path = value;
    } else if (flag == "-l" || flag == "--log-level") {
      options.log_level = value;
    }
  }

  if (options.config_path.empty()) {
    std::cerr << "Error: A configuration file is required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_sink(const ProgramOptions& options) {
  hvault::config::Config config;
  try {
    config = hvault::config::load_config(options.config_path);
    if (options.log_level) {
      config.logging.level = hvault::logging::parse_severity(*options.log_level);
    }
    hvault::logging::init_logging(config.logging);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  }

  std::ifstream file;
  if (!options.input_path.empty()) {
    file.open(options.input_path);
    if (!file) {
      BOOST_LOG_TRIVIAL(error) << "Main: Cannot open input file: " << options.input_path;
      return false;
    }
  }
  std::istream& input = options.input_path.empty() ? std::cin : file;

  try {
    hvault::app::Bootstrap sink(config);
    if (!sink.start()) {
      BOOST_LOG_TRIVIAL(error) << "Main: Failed to start sink";
      return false;
    }

    hvault::cli::EventReader reader(input, [&sink](hvault::output::Record entry) {
      sink.submit(std::move(entry));
    });
    reader.run();

    return sink.shutdown();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Main: Failed to run sink: " << e.what();
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 2;
  } else if (!run_sink(options)) {
    return 1;
  }
  return 0;
}
