#include "core/replay.h"
#include "ind/candle.h"
#include "util/times.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <glaze/glaze.hpp>

#include <cereal/archives/binary.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/unordered_map.hpp>
#include <cereal/types/vector.hpp>

namespace cereal {
template <class Archive>
void save(Archive& ar, const Candle& c) {
  std::int64_t secs = c.time().time_since_epoch().count();
  ar(secs, c.open, c.high, c.low, c.close, c.volume);
}

template <class Archive>
void load(Archive& ar, Candle& c) {
  std::int64_t secs;
  ar(secs, c.open, c.high, c.low, c.close, c.volume);
  c.datetime = SysTimePoint{std::chrono::seconds{secs}};
}

template <class Archive>
void serialize(Archive& ar, Timeline& t) {
  ar(t.candles);
}
}  // namespace cereal

void write_candles(const std::string& filename, const CandleStore& data) {
  std::ofstream ofs(filename, std::ios::binary);
  cereal::BinaryOutputArchive oarchive(ofs);
  oarchive(data);
}

CandleStore read_candles(const std::string& filename) {
  CandleStore data;
  try {
    std::ifstream ifs(filename, std::ios::binary);
    cereal::BinaryInputArchive iarchive(ifs);
    iarchive(data);
  } catch (const cereal::Exception& ex) {
    spdlog::error("[replay] {} unreadable: {}", filename, ex.what());
    return {};
  }
  return data;
}

struct CandleRow {
  std::string datetime;
  double open = 0.0;
  double high = 0.0;
  double low = 0.0;
  double close = 0.0;
  double volume = 0.0;
};

struct CandlesFile {
  std::vector<CandleRow> values;
};

std::vector<Candle> read_candles_json(const std::string& str) {
  constexpr auto opts = glz::opts{
      .error_on_unknown_keys = false,
  };

  CandlesFile file;
  auto ec = glz::read<opts>(file, str);
  if (ec) {
    spdlog::error("[replay] candles json error: {}", glz::format_error(ec, str));
    return {};
  }

  std::vector<Candle> candles;
  candles.reserve(file.values.size());
  for (auto& row : file.values) {
    auto tp = row.datetime.size() > 10 ? datetime_to_sys(row.datetime)
                                       : datetime_to_sys(row.datetime, "%F");
    if (!tp) {
      spdlog::warn("[replay] dropping candle at '{}'", row.datetime);
      continue;
    }
    candles.push_back(
        Candle{*tp, row.open, row.high, row.low, row.close, row.volume});
  }

  std::ranges::sort(candles, {}, &Candle::datetime);
  return candles;
}
