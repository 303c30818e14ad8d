#include "core/sessions.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

using namespace std::chrono;

static minutes minute_of_week(SysTimePoint tp) {
  auto day = floor<days>(tp);
  auto iso = weekday{day}.iso_encoding();
  return days{iso - 1} + time_of_day(tp);
}

// Half-open [from, to) on a circular range
static bool within(minutes t, minutes from, minutes to) {
  if (from <= to)
    return t >= from && t < to;
  return t >= from || t < to;
}

SessionHours::Window SessionHours::to_window(const Session& s) {
  if (s.open_day < 1 || s.open_day > 7 || s.close_day < 1 || s.close_day > 7)
    throw std::invalid_argument("session days must be ISO weekdays 1-7");

  return Window{
      .open = days{s.open_day - 1} + parse_hhmm(s.open),
      .close = days{s.close_day - 1} + parse_hhmm(s.close),
      .break_start = parse_hhmm(s.break_start),
      .break_end = parse_hhmm(s.break_end),
  };
}

SessionHours::SessionHours(const SessionsConfig& cfg)
    : fallback{to_window(cfg.fallback)} {
  for (auto& s : cfg.sessions)
    windows.emplace(s.symbol, to_window(s));
  spdlog::info("[init] {} symbol sessions", windows.size());
}

bool SessionHours::is_open(const std::string& symbol, SysTimePoint now) const {
  auto it = windows.find(symbol);
  auto& w = it != windows.end() ? it->second : fallback;

  if (!within(minute_of_week(now), w.open, w.close))
    return false;

  if (w.break_start != w.break_end &&
      within(time_of_day(now), w.break_start, w.break_end))
    return false;

  return true;
}

static std::string lower(std::string s) {
  std::ranges::transform(s, s.begin(),
                         [](unsigned char c) { return std::tolower(c); });
  return s;
}

VariationResolver::VariationResolver(
    const std::map<std::string, std::vector<std::string>>& variations,
    const std::vector<std::string>& offered) noexcept {
  for (auto& [symbol, names] : variations) {
    for (auto& name : names) {
      auto it = std::ranges::find_if(offered, [&](const std::string& o) {
        return lower(o) == lower(name);
      });
      if (it != offered.end()) {
        resolved.emplace(symbol, *it);
        spdlog::debug("[init] {} resolved to {}", symbol, *it);
        break;
      }
    }
  }
}

std::string VariationResolver::resolve(const std::string& symbol) const {
  auto it = resolved.find(symbol);
  return it != resolved.end() ? it->second : symbol;
}
