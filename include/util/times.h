#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

using SysClock = std::chrono::system_clock;
using SysTimePoint = std::chrono::sys_time<std::chrono::seconds>;

using seconds = std::chrono::seconds;
using minutes = std::chrono::minutes;
using hours = std::chrono::hours;
using days = std::chrono::days;

inline constexpr minutes M_1{1}, M_5{5}, M_15{15}, H_1{hours{1}},
    H_4{hours{4}};

// Ordered widest first
enum class Horizon : size_t {
  H4,
  H1,
  M15,
  M5,
};

inline constexpr size_t N_HORIZONS = 4;

inline constexpr std::array<Horizon, N_HORIZONS> horizons = {
    Horizon::H4, Horizon::H1, Horizon::M15, Horizon::M5};

inline constexpr Horizon WIDEST = Horizon::H4;
inline constexpr Horizon SECOND = Horizon::H1;
inline constexpr Horizon NARROWEST = Horizon::M5;

constexpr size_t idx(Horizon h) {
  return static_cast<size_t>(h);
}

constexpr minutes duration_of(Horizon h) {
  switch (h) {
    case Horizon::H4:
      return H_4;
    case Horizon::H1:
      return H_1;
    case Horizon::M15:
      return M_15;
    default:
      return M_5;
  }
}

template <typename T>
struct PerHorizon {
  std::array<T, N_HORIZONS> arr{};

  T& operator[](Horizon h) { return arr[idx(h)]; }
  const T& operator[](Horizon h) const { return arr[idx(h)]; }

  auto begin() { return arr.begin(); }
  auto begin() const { return arr.begin(); }

  auto end() { return arr.end(); }
  auto end() const { return arr.end(); }
};

// Empty when the string does not match fmt
std::optional<SysTimePoint> datetime_to_sys(std::string_view datetime,
                                            std::string_view fmt = "%F %T");

std::string datetime_to_string(SysTimePoint tp);

// Minutes elapsed since 00:00 of the given day
minutes time_of_day(SysTimePoint tp);

// Parses "HH:MM"
minutes parse_hhmm(std::string_view hhmm);
