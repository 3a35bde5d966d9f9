#pragma once

#include <cstdint>
#include <optional>
#include "value.h"

namespace kernjs {

enum class PropertyFlag : uint8_t {
  None = 0,
  Writable = 1 << 0,
  Enumerable = 1 << 1,
  Configurable = 1 << 2,
  AllFlags = Writable | Enumerable | Configurable,
  OnlyWritable = Writable,
  NonEnumerable = Writable | Configurable,
  NonWritable = Enumerable | Configurable
};

inline PropertyFlag operator|(PropertyFlag a, PropertyFlag b) {
  return static_cast<PropertyFlag>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline bool hasFlag(PropertyFlag flags, PropertyFlag flag) {
  return (static_cast<uint8_t>(flags) & static_cast<uint8_t>(flag)) != 0;
}

/**
 * One property's attributes. Every field carries its own presence bit so a
 * descriptor can describe a partial update (as passed to
 * defineOwnProperty) as well as a complete stored property.
 *
 * A descriptor is a data descriptor (value/writable), an accessor
 * descriptor (get/set) or a generic one (neither pair present). Setting a
 * field of one pair clears the other pair.
 */
class PropertyDescriptor {
public:
  PropertyDescriptor() = default;
  PropertyDescriptor(Value value, PropertyFlag flags);

  static PropertyDescriptor data(Value value, bool writable, bool enumerable, bool configurable);
  static PropertyDescriptor accessor(Value getter, Value setter, bool enumerable, bool configurable);

  bool isDataDescriptor() const { return value_.has_value() || writable_.has_value(); }
  bool isAccessorDescriptor() const { return get_.has_value() || set_.has_value(); }
  bool isGenericDescriptor() const { return !isDataDescriptor() && !isAccessorDescriptor(); }
  bool isEmpty() const { return isGenericDescriptor() && !enumerable_ && !configurable_; }

  bool hasValue() const { return value_.has_value(); }
  bool hasWritable() const { return writable_.has_value(); }
  bool hasGet() const { return get_.has_value(); }
  bool hasSet() const { return set_.has_value(); }
  bool hasEnumerable() const { return enumerable_.has_value(); }
  bool hasConfigurable() const { return configurable_.has_value(); }

  // Absent fields read as their defaults (undefined / false).
  Value value() const { return value_.value_or(Value()); }
  bool writable() const { return writable_.value_or(false); }
  Value getter() const { return get_.value_or(Value()); }
  Value setter() const { return set_.value_or(Value()); }
  bool enumerable() const { return enumerable_.value_or(false); }
  bool configurable() const { return configurable_.value_or(false); }

  void setValue(Value value);
  void setWritable(bool writable);
  void setGetter(Value getter);
  void setSetter(Value setter);
  void setEnumerable(bool enumerable) { enumerable_ = enumerable; }
  void setConfigurable(bool configurable) { configurable_ = configurable; }

  // CompletePropertyDescriptor: fill every absent field of the
  // descriptor's kind with its default. Generic descriptors become data.
  void complete();

private:
  void clearAccessor() { get_.reset(); set_.reset(); }
  void clearData() { value_.reset(); writable_.reset(); }

  std::optional<Value> value_;
  std::optional<bool> writable_;
  std::optional<Value> get_;
  std::optional<Value> set_;
  std::optional<bool> enumerable_;
  std::optional<bool> configurable_;
};

}  // namespace kernjs
