#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <variant>
#include "bigint.h"

namespace kernjs {

class Object;

struct Undefined {};
struct Null {};

struct BigInt {
  bigint::BigIntValue value;
  BigInt() : value(0) {}
  BigInt(const bigint::BigIntValue& v) : value(v) {}
  BigInt(int64_t v) : value(v) {}
};

struct Symbol {
  static size_t nextId;
  size_t id;
  std::string description;

  Symbol(const std::string& desc = "") : id(nextId++), description(desc) {}

  bool operator==(const Symbol& other) const { return id == other.id; }
  bool operator!=(const Symbol& other) const { return id != other.id; }
};

enum class ValueType {
  Undefined,
  Null,
  Boolean,
  Number,
  BigInt,
  Symbol,
  String,
  Object
};

struct Value {
  std::variant<
    Undefined,
    Null,
    bool,
    double,
    BigInt,
    Symbol,
    std::string,
    std::shared_ptr<Object>
  > data;

  Value() : data(Undefined{}) {}
  Value(Undefined u) : data(u) {}
  Value(Null n) : data(n) {}
  Value(bool b) : data(b) {}
  Value(double d) : data(d) {}
  Value(int i) : data(static_cast<double>(i)) {}
  Value(uint32_t i) : data(static_cast<double>(i)) {}
  Value(BigInt bi) : data(std::move(bi)) {}
  Value(Symbol sym) : data(std::move(sym)) {}
  Value(const std::string& s) : data(s) {}
  Value(std::string&& s) : data(std::move(s)) {}
  Value(const char* s) : data(std::string(s)) {}

  // Any object kind (functions, arrays, ...) converts to a plain object reference.
  template <typename T, typename = std::enable_if_t<std::is_base_of_v<Object, T>>>
  Value(std::shared_ptr<T> o) {
    if (o) {
      data = std::shared_ptr<Object>(std::move(o));
    } else {
      data = Undefined{};
    }
  }

  bool isUndefined() const { return std::holds_alternative<Undefined>(data); }
  bool isNull() const { return std::holds_alternative<Null>(data); }
  bool isNullOrUndefined() const { return isUndefined() || isNull(); }
  bool isBool() const { return std::holds_alternative<bool>(data); }
  bool isNumber() const { return std::holds_alternative<double>(data); }
  bool isBigInt() const { return std::holds_alternative<BigInt>(data); }
  bool isSymbol() const { return std::holds_alternative<Symbol>(data); }
  bool isString() const { return std::holds_alternative<std::string>(data); }
  bool isObject() const { return std::holds_alternative<std::shared_ptr<Object>>(data); }
  bool isPrimitive() const { return !isObject(); }

  ValueType type() const { return static_cast<ValueType>(data.index()); }

  bool asBool() const { return std::get<bool>(data); }
  double asNumber() const { return std::get<double>(data); }
  const BigInt& asBigInt() const { return std::get<BigInt>(data); }
  const Symbol& asSymbol() const { return std::get<Symbol>(data); }
  const std::string& asString() const { return std::get<std::string>(data); }
  const std::shared_ptr<Object>& asObject() const { return std::get<std::shared_ptr<Object>>(data); }

  // Object of kind T, or nullptr when this is not such an object.
  template <typename T>
  std::shared_ptr<T> tryCast() const {
    if (auto* obj = std::get_if<std::shared_ptr<Object>>(&data)) {
      return std::dynamic_pointer_cast<T>(*obj);
    }
    return nullptr;
  }

  bool isCallable() const;

  // Primitive coercions. Objects are not converted through their methods
  // here; Engine::toPrimitive does that.
  bool toBool() const;
  double toNumber() const;
  std::string toString() const;
  // Display string for diagnostics - BigInt shows "42n" suffix
  std::string toDisplayString() const;
};

const char* typeName(ValueType type);

std::string numberToString(double value);
double stringToNumber(const std::string& str);
uint32_t toUint32(double value);

bool sameValue(const Value& a, const Value& b);
bool strictEquals(const Value& a, const Value& b);

}  // namespace kernjs
