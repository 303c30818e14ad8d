#include "core/replay.h"
#include "util/config.h"
#include "util/format.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

void write_candles(const std::string& filename, const CandleStore& data);
CandleStore read_candles(const std::string& filename);

inline auto& cache_config = config.cache_config;

std::string series_key(const std::string& id, Horizon h) {
  return id + "_" + to_str(h);
}

static CandleStore load_json_dir(const std::string& dir) {
  CandleStore store;

  std::error_code ec;
  for (auto& entry : fs::directory_iterator(dir, ec)) {
    auto path = entry.path();
    if (path.extension() != ".json")
      continue;

    auto key = path.stem().string();
    auto known = std::ranges::any_of(horizons, [&](Horizon h) {
      auto suffix = "_" + to_str(h);
      return key.size() > suffix.size() && key.ends_with(suffix);
    });
    if (!known)
      continue;

    std::ifstream in{path};
    std::stringstream buffer;
    buffer << in.rdbuf();

    auto candles = read_candles_json(buffer.str());
    if (candles.empty()) {
      spdlog::warn("[replay] no candles in {}", path.string());
      continue;
    }

    spdlog::info("[replay] {} candles from {}", candles.size(), path.string());
    store.try_emplace(key, std::move(candles));
  }

  if (ec)
    spdlog::error("[replay] cannot list {}: {}", dir, ec.message());
  return store;
}

ReplaySource::ReplaySource(const std::string& dir) noexcept {
  auto cache_fname = dir + "/replay_candles.bin";

  if (fs::exists(cache_fname)) {
    store = read_candles(cache_fname);
    if (store.empty())
      spdlog::error("[replay] error reading from {}", cache_fname);
    else
      spdlog::info("[replay] read from {}", cache_fname);
  }

  if (store.empty()) {
    store = load_json_dir(dir);
    if (!store.empty())
      write_candles(cache_fname, store);
  }

  init_clock();
}

ReplaySource::ReplaySource(CandleStore store) noexcept
    : store{std::move(store)} {
  init_clock();
}

void ReplaySource::init_clock() {
  ids.clear();
  clock = end = {};

  bool first = true;
  for (auto& [key, tl] : store) {
    for (auto h : horizons) {
      auto suffix = "_" + to_str(h);
      if (!key.ends_with(suffix) || key.size() <= suffix.size() ||
          tl.candles.empty())
        continue;

      auto id = key.substr(0, key.size() - suffix.size());
      if (std::ranges::find(ids, id) == ids.end())
        ids.push_back(id);

      auto n = cache_config.n_candles(h);
      auto ready = tl.candles[std::min(n, tl.candles.size()) - 1].time() +
                   duration_of(h);
      auto last = tl.candles.back().time() + duration_of(h);

      clock = first ? ready : std::max(clock, ready);
      end = first ? last : std::max(end, last);
      first = false;
    }
  }

  std::ranges::sort(ids);
  spdlog::info("[replay] {} series for {} ids, {} -> {}", store.size(),
               ids.size(), datetime_to_string(clock), datetime_to_string(end));
}

std::vector<Candle> ReplaySource::get_candles(const std::string& id,
                                              Horizon horizon,
                                              size_t count) {
  auto it = store.find(series_key(id, horizon));
  if (it == store.end()) {
    spdlog::warn("[replay] no time series for {} {}", id, to_str(horizon));
    return {};
  }

  auto& candles = it->second.candles;
  auto closed = std::ranges::partition_point(candles, [&](const Candle& c) {
    return c.time() + duration_of(horizon) <= clock;
  });

  auto n = static_cast<size_t>(closed - candles.begin());
  auto first = candles.begin() + (n > count ? n - count : 0);
  return {first, closed};
}

bool ReplaySource::advance() {
  clock += duration_of(NARROWEST);
  return clock <= end;
}
