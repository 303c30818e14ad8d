#pragma once

#include <concepts>
#include <cstddef>
#include <format>
#include <string>

enum class Horizon : size_t;
enum class Direction;
enum class Trend;
enum class Side;
enum class StructureEventType;
enum class SourceKind;
enum class TargetKind;
enum class Bias;
enum class BiasTier;
enum class OrderKind;
enum class Rejection;
struct Candle;

template <typename T>
std::string to_str(const T& t);

template <typename Str>
  requires std::constructible_from<std::string, Str>
std::string to_str(const Str& str) {
  return std::string{str};
}

template <>
std::string to_str(const double& v);
template <>
std::string to_str(const size_t& v);
template <>
std::string to_str(const Horizon& h);
template <>
std::string to_str(const Direction& d);
template <>
std::string to_str(const Trend& t);
template <>
std::string to_str(const Side& s);
template <>
std::string to_str(const StructureEventType& t);
template <>
std::string to_str(const SourceKind& k);
template <>
std::string to_str(const TargetKind& k);
template <>
std::string to_str(const Bias& b);
template <>
std::string to_str(const BiasTier& t);
template <>
std::string to_str(const OrderKind& k);
template <>
std::string to_str(const Rejection& r);
template <>
std::string to_str(const Candle& c);

inline std::string join(auto start, auto end, std::string sep = ", ") {
  std::string result;

  for (auto it = start; it != end; it++) {
    result += to_str(*it);

    auto _end = end;
    if (it != --_end)
      result += sep;
  }

  return result;
}
