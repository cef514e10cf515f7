#pragma once

#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <variant>

#include <fmt/format.h>
#include <fmt/ostream.h>

template<class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};

enum class DataKind { Null, Bool, Int, Decimal, Text };

struct Data {
  using MyData = std::variant<std::nullptr_t, bool, int64_t, double, std::string>;

  Data() = default;

  Data(std::nullptr_t) : mData{nullptr} {
  }

  Data(bool data) : mData{data} {
  }

  Data(int data) : mData{static_cast<int64_t>(data)} {
  }

  Data(int64_t data) : mData{data} {
  }

  Data(double data) : mData{data} {
  }

  Data(char const *data) : mData{std::string{data}} {
  }

  Data(std::string data) : mData{std::move(data)} {
  }

  template<typename F>
  constexpr decltype(auto) get_value(F &&callback) const {
    return std::visit(std::forward<F>(callback), mData);
  }

  DataKind get_kind() const { return static_cast<DataKind>(mData.index()); }

  bool is_null() const { return std::get_if<std::nullptr_t>(&mData) != nullptr; }

  std::optional<bool> get_bool() const {
    if (auto *value = std::get_if<bool>(&mData); value != nullptr) {
      return {*value};
    }

    return get_int().and_then(
      [](auto value) { return std::optional{static_cast<bool>(value)}; });
  }

  std::optional<int64_t> get_int() const {
    if (auto *value = std::get_if<int64_t>(&mData); value != nullptr) {
      return {*value};
    }

    return {};
  }

  std::optional<double> get_decimal() const {
    if (auto *value = std::get_if<double>(&mData); value != nullptr) {
      return {*value};
    }

    return {};
  }

  std::optional<std::string> get_text() const {
    if (auto *value = std::get_if<std::string>(&mData); value != nullptr) {
      return {*value};
    }

    return {};
  }

  bool operator==(Data const &other) const { return mData == other.mData; }

private:
  MyData mData{nullptr};
};

inline std::ostream &operator<<(std::ostream &out, Data const &value) {
  value.get_value(overloaded{
    [&](std::nullptr_t) { out << "null"; },
    [&](bool arg) { out << (arg ? "true" : "false"); },
    [&](int64_t arg) { out << arg; },
    [&](double arg) { out << arg; },
    [&](std::string const &arg) { out << std::quoted(arg); }
  });

  return out;
}

inline std::string to_string(Data const &value) {
  std::ostringstream o;

  o << value;

  return o.str();
}

template<>
struct fmt::formatter<Data> : fmt::ostream_formatter {
};
