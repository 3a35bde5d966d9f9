#include "kernjs/property_key.h"

namespace kernjs {

std::optional<uint32_t> PropertyKey::arrayIndex() const {
  if (!isString()) return std::nullopt;
  const std::string& s = name();
  if (s.empty() || s.size() > 10) return std::nullopt;
  if (s.size() > 1 && s[0] == '0') return std::nullopt;

  uint64_t value = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return std::nullopt;
    value = value * 10 + static_cast<uint64_t>(c - '0');
  }
  if (value > 4294967294ull) return std::nullopt;
  return static_cast<uint32_t>(value);
}

Value PropertyKey::toValue() const {
  if (isSymbol()) return Value(symbol());
  return Value(name());
}

std::string PropertyKey::toDisplayString() const {
  if (isSymbol()) return "Symbol(" + symbol().description + ")";
  return name();
}

bool PropertyKey::operator==(const PropertyKey& other) const {
  if (key_.index() != other.key_.index()) return false;
  if (isSymbol()) return symbol() == other.symbol();
  return name() == other.name();
}

size_t PropertyKey::Hash::operator()(const PropertyKey& key) const {
  if (key.isSymbol()) {
    return std::hash<size_t>()(key.symbol().id) ^ 0x9e3779b97f4a7c15ull;
  }
  return std::hash<std::string>()(key.name());
}

}  // namespace kernjs
