#include "util/times.h"

#include <spdlog/spdlog.h>
#include <format>
#include <sstream>
#include <stdexcept>

using namespace std::chrono;

std::optional<SysTimePoint> datetime_to_sys(std::string_view datetime,
                                            std::string_view fmt) {
  if (datetime.empty()) {
    spdlog::error("[time] empty datetime string");
    return std::nullopt;
  }

  std::istringstream in{std::string(datetime)};
  in.exceptions(std::ios::failbit | std::ios::badbit);

  sys_seconds tp;
  try {
    in >> parse(std::string(fmt), tp);
  } catch (const std::ios_base::failure& ex) {
    spdlog::error("[time] cannot parse {}: {}", datetime, ex.what());
    return std::nullopt;
  }

  return tp;
}

std::string datetime_to_string(SysTimePoint tp) {
  return std::format("{:%F %T}", tp);
}

minutes time_of_day(SysTimePoint tp) {
  return duration_cast<minutes>(tp - floor<days>(tp));
}

minutes parse_hhmm(std::string_view hhmm) {
  auto colon = hhmm.find(':');
  if (colon == std::string_view::npos)
    throw std::invalid_argument(std::format("bad time of day '{}'", hhmm));

  auto h = std::stoi(std::string{hhmm.substr(0, colon)});
  auto m = std::stoi(std::string{hhmm.substr(colon + 1)});
  if (h < 0 || h > 24 || m < 0 || m > 59)
    throw std::invalid_argument(std::format("bad time of day '{}'", hhmm));

  return hours{h} + minutes{m};
}
