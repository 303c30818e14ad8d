#include "core/engine.h"
#include "mt/sleeper.h"
#include "mt/thread_pool.h"
#include "sig/synthesizer.h"
#include "util/config.h"
#include "util/format.h"

#include <spdlog/spdlog.h>
#include <atomic>
#include <vector>

inline auto& cache_config = config.cache_config;
inline auto& liquidity_config = config.liquidity_config;

SymbolState::SymbolState(const SymbolInfo& si, std::string broker_id) noexcept
    : si{si},
      broker_id{std::move(broker_id)},
      coordinator{si.symbol},
      sweeps{liquidity_config.sweep_log_cap} {}

Engine::Engine(const Symbols& symbols,
               CandleSource& source,
               const MarketHours& hours,
               const SymbolResolver& resolver,
               ProposalSink& sink) noexcept
    : source{source}, hours{hours}, sink{sink} {
  for (auto& si : symbols) {
    auto id = resolver.resolve(si.symbol);
    states.try_emplace(si.symbol, si, id);
    spdlog::info("[engine] tracking {} as {}", si.symbol, id);
  }
}

const SymbolState* Engine::state(const std::string& symbol) const {
  auto it = states.find(symbol);
  return it == states.end() ? nullptr : &it->second;
}

void Engine::refresh(SymbolState& state, SysTimePoint now) {
  auto& symbol = state.si.symbol;

  for (auto h : horizons) {
    if (!state.coordinator.due(h, now))
      continue;

    auto count = cache_config.n_candles(h);
    CandleSeries series{
        .symbol = symbol,
        .horizon = h,
        .point = state.si.point,
        .candles = source.get_candles(state.broker_id, h, count),
    };

    if (series.size() < count) {
      spdlog::info("[cache] {} {} insufficient data ({} < {})", symbol,
                   to_str(h), series.size(), count);
      state.coordinator.invalidate(h);
      continue;
    }

    try {
      validate(series);
    } catch (const InvalidSeries& ex) {
      spdlog::error("[engine] {}", ex.what());
      state.coordinator.invalidate(h);
      continue;
    }

    state.coordinator.update(series, now);

    if (auto f = state.coordinator.findings(h, now))
      for (auto& sweep : f->get().liquidity.sweeps)
        state.sweeps.append(sweep);
  }
}

Decision Engine::evaluate(SymbolState& state, SysTimePoint now) {
  auto& symbol = state.si.symbol;

  refresh(state, now);

  auto price = state.coordinator.last_price(now);
  if (!price) {
    spdlog::info("[signal] {} no signal: {}", symbol, to_str(Rejection::NoData));
    return Decision{Rejection::NoData, std::nullopt};
  }

  auto snapshot = state.coordinator.snapshot(now);
  auto assessment = assess(snapshot, *price);

  auto bias = assessment.bias.bias;
  if (state.last_bias != bias) {
    spdlog::info("[bias] {} {} -> {} ({})", symbol,
                 state.last_bias ? to_str(*state.last_bias) : "none",
                 to_str(bias), to_str(assessment.bias.tier));
    state.last_bias = bias;
  }

  auto decision = synthesize(symbol, assessment, snapshot, state.sweeps,
                             state.si.point, now);
  if (decision.proposal)
    sink.submit(*decision.proposal);
  return decision;
}

size_t Engine::cycle() {
  auto now = source.now();
  n_cycles++;

  std::vector<SymbolState*> open;
  for (auto& [symbol, state] : states) {
    if (hours.is_open(symbol, now))
      open.push_back(&state);
    else
      spdlog::debug("[engine] {} closed at {}", symbol, datetime_to_string(now));
  }

  std::atomic<size_t> n_proposals{0};
  auto func = [&, this](SymbolState*&& state) {
    try {
      if (evaluate(*state, now).emitted())
        n_proposals++;
    } catch (const std::exception& ex) {
      spdlog::error("[engine] {} evaluation failed: {}", state->si.symbol,
                    ex.what());
    }
    return true;
  };

  {
    thread_pool<SymbolState*> pool{config.n_concurrency, func, std::move(open)};
  }

  spdlog::info("[engine] cycle {} at {}: {} proposals", n_cycles,
               datetime_to_string(now), n_proposals.load());
  return n_proposals;
}

void Engine::run() {
  while (!sleeper.should_shutdown()) {
    cycle();

    if (config.max_cycles && n_cycles >= config.max_cycles)
      break;

    if (!source.advance()) {
      spdlog::info("[engine] source exhausted after {} cycles", n_cycles);
      break;
    }

    if (!sleeper.sleep_for(config.update_interval()))
      break;
  }
}
