#include "kernjs/property_descriptor.h"

namespace kernjs {

PropertyDescriptor::PropertyDescriptor(Value value, PropertyFlag flags)
  : value_(std::move(value)),
    writable_(hasFlag(flags, PropertyFlag::Writable)),
    enumerable_(hasFlag(flags, PropertyFlag::Enumerable)),
    configurable_(hasFlag(flags, PropertyFlag::Configurable)) {}

PropertyDescriptor PropertyDescriptor::data(Value value, bool writable, bool enumerable, bool configurable) {
  PropertyDescriptor desc;
  desc.value_ = std::move(value);
  desc.writable_ = writable;
  desc.enumerable_ = enumerable;
  desc.configurable_ = configurable;
  return desc;
}

PropertyDescriptor PropertyDescriptor::accessor(Value getter, Value setter, bool enumerable, bool configurable) {
  PropertyDescriptor desc;
  desc.get_ = std::move(getter);
  desc.set_ = std::move(setter);
  desc.enumerable_ = enumerable;
  desc.configurable_ = configurable;
  return desc;
}

void PropertyDescriptor::setValue(Value value) {
  clearAccessor();
  value_ = std::move(value);
}

void PropertyDescriptor::setWritable(bool writable) {
  clearAccessor();
  writable_ = writable;
}

void PropertyDescriptor::setGetter(Value getter) {
  clearData();
  get_ = std::move(getter);
}

void PropertyDescriptor::setSetter(Value setter) {
  clearData();
  set_ = std::move(setter);
}

void PropertyDescriptor::complete() {
  if (isGenericDescriptor() || isDataDescriptor()) {
    if (!value_) value_ = Value();
    if (!writable_) writable_ = false;
  } else {
    if (!get_) get_ = Value();
    if (!set_) set_ = Value();
  }
  if (!enumerable_) enumerable_ = false;
  if (!configurable_) configurable_ = false;
}

}  // namespace kernjs
