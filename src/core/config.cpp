#include "util/config.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <argparse/argparse.hpp>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <glaze/glaze.hpp>
#include <iostream>
#include <thread>

namespace fs = std::filesystem;

template <typename T>
T read(const char* path) {
  T t{};

  if (!fs::exists(path)) {
    spdlog::info("[config] {} not found, using defaults", path);
    return t;
  }

  auto ec = glz::read_file_json(t, path, std::string{});
  if (ec)
    std::cerr << std::format("[config] {} error {}\n", path,
                             glz::format_error(ec));

  if (T::debug) {
    std::ofstream log{"logs/configs.log", std::ios::app};
    std::string buffer;
    auto _ = glz::write<glz::opts{.prettify = true}>(t, buffer);
    log << std::format("\"{}\": {}\n", T::name, buffer.c_str());
  }

  return t;
}

void Config::update() {
  fs::remove("logs/configs.log");

  gap_config = read<GapConfig>("private/gaps.json");
  zone_config = read<ZoneConfig>("private/zones.json");
  structure_config = read<StructureConfig>("private/structure.json");
  liquidity_config = read<LiquidityConfig>("private/liquidity.json");
  coordinator_config = read<CoordinatorConfig>("private/coordinator.json");
  signal_config = read<SignalConfig>("private/signal.json");
  cache_config = read<CacheConfig>("private/cache.json");
  sessions_config = read<SessionsConfig>("private/sessions.json");

  if (zone_config.min_run == 0) {
    spdlog::warn("[config] zone min_run of 0, using 1");
    zone_config.min_run = 1;
  }
  if (structure_config.swing_window == 0) {
    spdlog::warn("[config] structure swing_window of 0, using 1");
    structure_config.swing_window = 1;
  }
  if (liquidity_config.swing_window == 0) {
    spdlog::warn("[config] liquidity swing_window of 0, using 1");
    liquidity_config.swing_window = 1;
  }
}

void Config::read_args(int argc, char* argv[]) {
  argparse::ArgumentParser program("smctracker");

  program.add_argument("-d", "--debug")
      .default_value(false)
      .implicit_value(true)
      .help("Enable debug");

  program.add_argument("--data")
      .help("Directory holding the candle files to replay")
      .default_value(std::string{"data"});

  program.add_argument("-s", "--speed")
      .help("Speed of continuous replay")
      .default_value(0.0)
      .scan<'g', double>();

  program.add_argument("-n", "--cycles")
      .help("Stop after this many cycles, 0 runs until interrupted")
      .default_value(size_t{0})
      .scan<'u', size_t>();

  auto def_nthreads = static_cast<size_t>(std::thread::hardware_concurrency());
  program.add_argument("--nthreads")
      .help("Max number of concurrent threads")
      .default_value(def_nthreads)
      .scan<'u', size_t>();

  try {
    program.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << "\n" << program << "\n";
    std::exit(1);
  }

  debug_en = program.get<bool>("--debug");
  data_dir = program.get<std::string>("--data");
  speed = program.get<double>("--speed");
  max_cycles = program.get<size_t>("--cycles");
  n_concurrency = std::max<size_t>(1, program.get<size_t>("--nthreads"));
}
