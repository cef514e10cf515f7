#pragma once

#include "document/Data.hpp"

#include <cstdint>
#include <iomanip>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <fmt/ostream.h>

inline std::string const DefaultVersionField = "migration_version";

/*
  A document is an identifier plus an unordered set of named values. The
  version marker is a regular integer field whose name is chosen by the
  caller; an absent or non integer marker reads as version 0.
*/
struct Document {
  using Fields = std::map<std::string, Data, std::less<> >;

  Document() = default;

  explicit Document(std::string id) : mId{std::move(id)} {
  }

  Document(std::string id, Fields fields)
    : mId{std::move(id)}, mFields{std::move(fields)} {
  }

  std::string const &get_id() const { return mId; }

  Fields const &get_fields() const { return mFields; }

  bool contains(std::string_view name) const {
    return mFields.find(name) != mFields.end();
  }

  std::optional<Data> get(std::string_view name) const {
    if (auto it = mFields.find(name); it != mFields.end()) {
      return {it->second};
    }

    return {};
  }

  Data const &operator[](std::string_view name) const {
    auto it = mFields.find(name);

    if (it == mFields.end()) {
      throw std::runtime_error(
        fmt::format("Field '{}' not available in document '{}'", name, mId));
    }

    return it->second;
  }

  Data &operator[](std::string_view name) {
    auto it = mFields.find(name);

    if (it == mFields.end()) {
      it = mFields.emplace(std::string{name}, Data{}).first;
    }

    return it->second;
  }

  Document &set(std::string_view name, Data value) {
    (*this)[name] = std::move(value);

    return *this;
  }

  bool erase(std::string_view name) {
    if (auto it = mFields.find(name); it != mFields.end()) {
      mFields.erase(it);

      return true;
    }

    return false;
  }

  int64_t get_version(std::string_view field = DefaultVersionField) const {
    if (auto it = mFields.find(field); it != mFields.end()) {
      return it->second.get_int().value_or(0);
    }

    return 0;
  }

  void set_version(int64_t version,
                   std::string_view field = DefaultVersionField) {
    (*this)[field] = version;
  }

  std::string to_string() const {
    std::ostringstream o;

    o << "{" << std::quoted("_id") << ":" << std::quoted(mId);

    for (auto const &[name, value]: mFields) {
      o << ", " << std::quoted(name) << ":" << value;
    }

    o << "}";

    return o.str();
  }

  bool operator==(Document const &other) const {
    return mId == other.mId and mFields == other.mFields;
  }

  friend std::ostream &operator<<(std::ostream &out, Document const &value) {
    out << value.to_string();

    return out;
  }

private:
  std::string mId;
  Fields mFields;
};

template<>
struct fmt::formatter<Document> : fmt::ostream_formatter {
};
