#include "util/symbols.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

Symbols::Symbols() noexcept {
  std::ifstream file("private/symbols.csv");
  if (!file) {
    spdlog::error("[init] cannot open private/symbols.csv");
    return;
  }

  std::string line;
  std::getline(file, line);

  while (std::getline(file, line)) {
    std::istringstream ss(line);
    std::string symbol, point_str, digits_str;

    if (std::getline(ss, symbol, ',') && std::getline(ss, point_str, ',') &&
        std::getline(ss, digits_str, ',')) {
      try {
        arr.emplace_back(symbol, std::stod(point_str), std::stoi(digits_str));
      } catch (const std::logic_error& ex) {
        spdlog::warn("[init] bad symbol line '{}': {}", line, ex.what());
      }
    }
  }

  spdlog::info("[init] {} symbols", arr.size());
}
