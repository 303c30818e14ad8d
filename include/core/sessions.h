#pragma once

#include "core/collaborators.h"
#include "util/config.h"

#include <map>
#include <string>
#include <vector>

class SessionHours : public MarketHours {
  struct Window {
    minutes open;
    minutes close;
    minutes break_start;
    minutes break_end;
  };

  Window fallback;
  std::map<std::string, Window> windows;

  static Window to_window(const Session& s);

 public:
  SessionHours(const SessionsConfig& cfg);

  bool is_open(const std::string& symbol, SysTimePoint now) const override;
};

class VariationResolver : public SymbolResolver {
  std::map<std::string, std::string> resolved;

 public:
  VariationResolver(const std::map<std::string, std::vector<std::string>>& variations,
                    const std::vector<std::string>& offered) noexcept;

  std::string resolve(const std::string& symbol) const override;
};
