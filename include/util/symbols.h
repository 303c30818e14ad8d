#pragma once

#include <string>
#include <vector>

struct SymbolInfo {
  std::string symbol;
  double point = 0.00001;
  int digits = 5;
};

struct Symbols {
  std::vector<SymbolInfo> arr;

  Symbols() noexcept;
  Symbols(std::vector<SymbolInfo> arr) noexcept : arr{std::move(arr)} {}

  auto size() const { return arr.size(); }

  auto operator[](int x) const { return arr[x]; }
  auto operator[](int x) { return arr[x]; }

  auto begin() { return arr.begin(); }
  auto begin() const { return arr.begin(); }

  auto end() { return arr.end(); }
  auto end() const { return arr.end(); }
};
