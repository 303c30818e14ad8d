#include "core/engine.h"
#include "core/journal.h"
#include "core/replay.h"
#include "core/sessions.h"
#include "util/config.h"
#include "util/symbols.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <format>
#include <iostream>

namespace fs = std::filesystem;

inline void init_logging() {
  auto pwd = fs::current_path().generic_string();
  auto log_name = std::format("{}/logs/{:%F_%R}.log", pwd, SysClock::now());
  auto link_name = pwd + "/logs/output.log";

  fs::remove(link_name);
  fs::create_symlink(log_name, link_name);

  auto file_logger = spdlog::basic_logger_mt("file_logger", log_name);
  spdlog::set_default_logger(file_logger);

  auto level = config.debug_en ? spdlog::level::debug : spdlog::level::info;
  spdlog::set_level(level);
  spdlog::flush_on(level);

  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
}

inline void ensure_directories_exist(const std::vector<std::string>& dirs) {
  for (const auto& dir : dirs) {
    fs::path path{dir};
    if (fs::exists(path))
      continue;
    if (fs::create_directories(path))
      std::cout << "Created: " << dir << '\n';
    else
      std::cerr << "Failed to create: " << dir << '\n';
  }
}

int main(int argc, char* argv[]) {
  config.read_args(argc, argv);
  ensure_directories_exist({"logs", "private", config.data_dir});
  init_logging();
  config.update();

  {
    Symbols symbols;
    ReplaySource source{config.data_dir};
    if (!source.has_data()) {
      std::cerr << "[exit] no candle data in " << config.data_dir << std::endl;
      return 1;
    }

    try {
      SessionHours hours{config.sessions_config};
      VariationResolver resolver{config.sessions_config.variations,
                                 source.offered()};
      ProposalJournal journal;

      Engine engine{symbols, source, hours, resolver, journal};
      engine.run();

      std::cout << std::format("[exit] {} cycles, {} proposals\n",
                               engine.cycles(), journal.submitted());
    } catch (const std::invalid_argument& ex) {
      spdlog::error("[config] {}", ex.what());
      std::cerr << "[config] " << ex.what() << std::endl;
      return 1;
    }
  }

  std::cout << "[exit] main" << std::endl;
  return 0;
}
