#include "kernjs/value.h"
#include "kernjs/object.h"
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace kernjs {

// Initialize static member for Symbol IDs
size_t Symbol::nextId = 0;

bool Value::isCallable() const {
  if (auto* obj = std::get_if<std::shared_ptr<Object>>(&data)) {
    return (*obj)->isCallable();
  }
  return false;
}

bool Value::toBool() const {
  return std::visit([](auto&& arg) -> bool {
    using T = std::decay_t<decltype(arg)>;
    if constexpr (std::is_same_v<T, Undefined>) {
      return false;
    } else if constexpr (std::is_same_v<T, Null>) {
      return false;
    } else if constexpr (std::is_same_v<T, bool>) {
      return arg;
    } else if constexpr (std::is_same_v<T, double>) {
      return arg != 0.0 && !std::isnan(arg);
    } else if constexpr (std::is_same_v<T, BigInt>) {
      return arg.value != 0;
    } else if constexpr (std::is_same_v<T, Symbol>) {
      return true;  // Symbols are always truthy
    } else if constexpr (std::is_same_v<T, std::string>) {
      return !arg.empty();
    } else {
      return true;
    }
  }, data);
}

double Value::toNumber() const {
  return std::visit([](auto&& arg) -> double {
    using T = std::decay_t<decltype(arg)>;
    if constexpr (std::is_same_v<T, Undefined>) {
      return std::numeric_limits<double>::quiet_NaN();
    } else if constexpr (std::is_same_v<T, Null>) {
      return 0.0;
    } else if constexpr (std::is_same_v<T, bool>) {
      return arg ? 1.0 : 0.0;
    } else if constexpr (std::is_same_v<T, double>) {
      return arg;
    } else if constexpr (std::is_same_v<T, BigInt>) {
      return bigint::toDouble(arg.value);
    } else if constexpr (std::is_same_v<T, std::string>) {
      return stringToNumber(arg);
    } else {
      return std::numeric_limits<double>::quiet_NaN();
    }
  }, data);
}

std::string Value::toString() const {
  return std::visit([](auto&& arg) -> std::string {
    using T = std::decay_t<decltype(arg)>;
    if constexpr (std::is_same_v<T, Undefined>) {
      return "undefined";
    } else if constexpr (std::is_same_v<T, Null>) {
      return "null";
    } else if constexpr (std::is_same_v<T, bool>) {
      return arg ? "true" : "false";
    } else if constexpr (std::is_same_v<T, double>) {
      return numberToString(arg);
    } else if constexpr (std::is_same_v<T, BigInt>) {
      return bigint::toString(arg.value);
    } else if constexpr (std::is_same_v<T, Symbol>) {
      return "Symbol(" + arg.description + ")";
    } else if constexpr (std::is_same_v<T, std::string>) {
      return arg;
    } else {
      return std::string("[object ") + arg->className() + "]";
    }
  }, data);
}

std::string Value::toDisplayString() const {
  if (isBigInt()) {
    return bigint::toString(asBigInt().value) + "n";
  }
  if (isString()) {
    return "\"" + asString() + "\"";
  }
  return toString();
}

const char* typeName(ValueType type) {
  switch (type) {
    case ValueType::Undefined: return "undefined";
    case ValueType::Null: return "null";
    case ValueType::Boolean: return "boolean";
    case ValueType::Number: return "number";
    case ValueType::BigInt: return "bigint";
    case ValueType::Symbol: return "symbol";
    case ValueType::String: return "string";
    case ValueType::Object: return "object";
  }
  return "undefined";
}

// Number::toString(10): shortest round-trip digits, laid out in fixed or
// exponent form depending on the decimal exponent.
std::string numberToString(double value) {
  if (std::isnan(value)) return "NaN";
  if (value == 0.0) return "0";
  if (std::isinf(value)) return value < 0 ? "-Infinity" : "Infinity";

  std::string sign;
  if (value < 0) {
    sign = "-";
    value = -value;
  }

  char buf[64];
  auto result = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::scientific);
  std::string sci(buf, result.ptr);

  // sci looks like "d.ddde[+-]xx"
  size_t ePos = sci.find('e');
  std::string digits;
  for (size_t i = 0; i < ePos; i++) {
    if (sci[i] != '.') digits.push_back(sci[i]);
  }
  int exponent = std::atoi(sci.c_str() + ePos + 1);

  int k = static_cast<int>(digits.size());
  int n = exponent + 1;

  std::string out;
  if (k <= n && n <= 21) {
    out = digits + std::string(static_cast<size_t>(n - k), '0');
  } else if (0 < n && n <= 21) {
    out = digits.substr(0, static_cast<size_t>(n)) + "." + digits.substr(static_cast<size_t>(n));
  } else if (-6 < n && n <= 0) {
    out = "0." + std::string(static_cast<size_t>(-n), '0') + digits;
  } else {
    int e = n - 1;
    std::string expPart = (e >= 0 ? "+" : "-") + std::to_string(e >= 0 ? e : -e);
    if (k == 1) {
      out = digits + "e" + expPart;
    } else {
      out = digits.substr(0, 1) + "." + digits.substr(1) + "e" + expPart;
    }
  }
  return sign + out;
}

double stringToNumber(const std::string& str) {
  size_t start = 0;
  size_t end = str.size();
  while (start < end && std::isspace(static_cast<unsigned char>(str[start]))) start++;
  while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) end--;
  if (start == end) {
    return 0.0;
  }

  std::string s = str.substr(start, end - start);
  if (s == "Infinity" || s == "+Infinity") return std::numeric_limits<double>::infinity();
  if (s == "-Infinity") return -std::numeric_limits<double>::infinity();

  if (s.size() > 2 && s[0] == '0') {
    int base = 0;
    char p = s[1];
    if (p == 'x' || p == 'X') base = 16;
    else if (p == 'o' || p == 'O') base = 8;
    else if (p == 'b' || p == 'B') base = 2;
    if (base != 0) {
      double result = 0.0;
      for (size_t i = 2; i < s.size(); i++) {
        int d = bigint::digitValue(s[i]);
        if (d < 0 || d >= base) return std::numeric_limits<double>::quiet_NaN();
        result = result * base + d;
      }
      return result;
    }
  }

  // StrDecimalLiteral: digits, optional fraction, optional exponent.
  size_t i = 0;
  if (s[i] == '+' || s[i] == '-') i++;
  bool sawDigit = false;
  while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { i++; sawDigit = true; }
  if (i < s.size() && s[i] == '.') {
    i++;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { i++; sawDigit = true; }
  }
  if (!sawDigit) return std::numeric_limits<double>::quiet_NaN();
  if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
    i++;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) i++;
    bool sawExpDigit = false;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { i++; sawExpDigit = true; }
    if (!sawExpDigit) return std::numeric_limits<double>::quiet_NaN();
  }
  if (i != s.size()) return std::numeric_limits<double>::quiet_NaN();

  return std::strtod(s.c_str(), nullptr);
}

uint32_t toUint32(double value) {
  if (!std::isfinite(value) || value == 0.0) return 0;
  double truncated = std::trunc(value);
  double modulo = std::fmod(truncated, 4294967296.0);
  if (modulo < 0) modulo += 4294967296.0;
  return static_cast<uint32_t>(modulo);
}

bool sameValue(const Value& a, const Value& b) {
  if (a.isNumber() && b.isNumber()) {
    double x = a.asNumber();
    double y = b.asNumber();
    if (std::isnan(x) && std::isnan(y)) return true;
    if (x == 0.0 && y == 0.0) return std::signbit(x) == std::signbit(y);
    return x == y;
  }
  return strictEquals(a, b);
}

bool strictEquals(const Value& a, const Value& b) {
  if (a.data.index() != b.data.index()) return false;
  return std::visit([&b](auto&& arg) -> bool {
    using T = std::decay_t<decltype(arg)>;
    if constexpr (std::is_same_v<T, Undefined> || std::is_same_v<T, Null>) {
      return true;
    } else if constexpr (std::is_same_v<T, BigInt>) {
      return arg.value == std::get<BigInt>(b.data).value;
    } else {
      return arg == std::get<T>(b.data);
    }
  }, a.data);
}

}  // namespace kernjs
