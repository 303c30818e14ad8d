#include "util/format.h"
#include "ind/candle.h"
#include "ind/liquidity.h"
#include "ind/structure.h"
#include "risk/target.h"
#include "sig/bias.h"
#include "sig/confluence.h"
#include "sig/signal_types.h"
#include "util/times.h"

#include <string>

template <>
std::string to_str(const double& v) {
  return std::format("{:.5f}", v);
}

template <>
std::string to_str(const size_t& v) {
  return std::to_string(v);
}

template <>
std::string to_str(const Horizon& h) {
  switch (h) {
    case Horizon::H4:
      return "H4";
    case Horizon::H1:
      return "H1";
    case Horizon::M15:
      return "M15";
    default:
      return "M5";
  }
}

template <>
std::string to_str(const Direction& d) {
  return d == Direction::Bullish ? "bullish" : "bearish";
}

template <>
std::string to_str(const Trend& t) {
  switch (t) {
    case Trend::Uptrend:
      return "uptrend";
    case Trend::Downtrend:
      return "downtrend";
    default:
      return "ranging";
  }
}

template <>
std::string to_str(const Side& s) {
  return s == Side::Upper ? "upper" : "lower";
}

template <>
std::string to_str(const StructureEventType& t) {
  return t == StructureEventType::Break ? "break" : "shift";
}

template <>
std::string to_str(const SourceKind& k) {
  switch (k) {
    case SourceKind::Gap:
      return "gap";
    case SourceKind::Zone:
      return "zone";
    default:
      return "flipped";
  }
}

template <>
std::string to_str(const TargetKind& k) {
  switch (k) {
    case TargetKind::Gap:
      return "gap";
    case TargetKind::Zone:
      return "zone";
    default:
      return "liquidity";
  }
}

template <>
std::string to_str(const Bias& b) {
  switch (b) {
    case Bias::Bullish:
      return "bullish";
    case Bias::Bearish:
      return "bearish";
    default:
      return "neutral";
  }
}

template <>
std::string to_str(const BiasTier& t) {
  switch (t) {
    case BiasTier::Aligned:
      return "aligned";
    case BiasTier::WidestPriority:
      return "widest";
    case BiasTier::Fallback:
      return "fallback";
    default:
      return "neutral";
  }
}

template <>
std::string to_str(const OrderKind& k) {
  switch (k) {
    case OrderKind::LimitAbove:
      return "limit_above";
    case OrderKind::LimitBelow:
      return "limit_below";
    case OrderKind::StopAbove:
      return "stop_above";
    default:
      return "stop_below";
  }
}

template <>
std::string to_str(const Rejection& r) {
  switch (r) {
    case Rejection::None:
      return "none";
    case Rejection::NoData:
      return "no data";
    case Rejection::NeutralBias:
      return "neutral bias";
    case Rejection::NoCandidate:
      return "no candidate zone";
    case Rejection::NoTarget:
      return "no target";
    case Rejection::InvalidRisk:
      return "invalid risk";
    case Rejection::RewardRisk:
      return "reward/risk below minimum";
    default:
      return "low confidence";
  }
}

template <>
std::string to_str(const Candle& candle) {
  auto& [_, open, high, low, close, volume] = candle;
  return std::format("{} {:.5f} {:.5f} {:.5f} {:.5f} {}",  //
                     datetime_to_string(candle.time()), open, high, low, close,
                     volume);
}
