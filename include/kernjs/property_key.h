#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include "value.h"

namespace kernjs {

// A property name: a string or a symbol. Numbers never appear here; they
// are canonicalized to their Number::toString form first.
class PropertyKey {
public:
  PropertyKey(const std::string& name) : key_(name) {}
  PropertyKey(std::string&& name) : key_(std::move(name)) {}
  PropertyKey(const char* name) : key_(std::string(name)) {}
  PropertyKey(const Symbol& symbol) : key_(symbol) {}

  static PropertyKey fromNumber(double number) { return PropertyKey(numberToString(number)); }
  static PropertyKey fromIndex(uint32_t index) { return PropertyKey(std::to_string(index)); }

  bool isSymbol() const { return std::holds_alternative<Symbol>(key_); }
  bool isString() const { return std::holds_alternative<std::string>(key_); }
  const std::string& name() const { return std::get<std::string>(key_); }
  const Symbol& symbol() const { return std::get<Symbol>(key_); }

  // The index when this key is the canonical string of an integer in
  // [0, 2^32 - 2].
  std::optional<uint32_t> arrayIndex() const;
  bool isArrayIndex() const { return arrayIndex().has_value(); }

  Value toValue() const;
  std::string toDisplayString() const;

  bool operator==(const PropertyKey& other) const;
  bool operator!=(const PropertyKey& other) const { return !(*this == other); }

  struct Hash {
    size_t operator()(const PropertyKey& key) const;
  };

private:
  std::variant<std::string, Symbol> key_;
};

}  // namespace kernjs
