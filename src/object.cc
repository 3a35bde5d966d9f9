#include "kernjs/object.h"
#include "kernjs/engine.h"
#include "kernjs/function.h"

namespace kernjs {

namespace {

// True when every field present in @p desc is also present in @p current
// with the same value, so applying it would change nothing.
bool describesSameProperty(const PropertyDescriptor& desc, const PropertyDescriptor& current) {
  if (desc.hasValue() && (!current.hasValue() || !sameValue(desc.value(), current.value()))) {
    return false;
  }
  if (desc.hasWritable() && (!current.hasWritable() || desc.writable() != current.writable())) {
    return false;
  }
  if (desc.hasGet() && (!current.hasGet() || !sameValue(desc.getter(), current.getter()))) {
    return false;
  }
  if (desc.hasSet() && (!current.hasSet() || !sameValue(desc.setter(), current.setter()))) {
    return false;
  }
  if (desc.hasEnumerable() && desc.enumerable() != current.enumerable()) {
    return false;
  }
  if (desc.hasConfigurable() && desc.configurable() != current.configurable()) {
    return false;
  }
  return true;
}

}  // namespace

Object::Object(Engine& engine, std::shared_ptr<Object> prototype,
               std::unique_ptr<PropertyStorage> storage)
  : engine_(engine),
    prototype_(std::move(prototype)),
    storage_(storage ? std::move(storage) : std::make_unique<OrderedPropertyStorage>()) {}

bool Object::setPrototypeOf(std::shared_ptr<Object> prototype) {
  if (prototype == prototype_) {
    return true;
  }
  if (!extensible_) {
    return false;
  }
  for (auto p = prototype; p; p = p->getPrototypeOf()) {
    if (p.get() == this) {
      return false;
    }
  }
  prototype_ = std::move(prototype);
  return true;
}

bool Object::preventExtensions() {
  extensible_ = false;
  return true;
}

std::optional<PropertyDescriptor> Object::getOwnProperty(const PropertyKey& key) const {
  if (const PropertyDescriptor* desc = storage_->find(key)) {
    return *desc;
  }
  return std::nullopt;
}

bool Object::defineOwnProperty(const PropertyKey& key, const PropertyDescriptor& desc,
                               bool throwOnFailure) {
  return ordinaryDefineOwnProperty(key, desc, throwOnFailure);
}

bool Object::ordinaryDefineOwnProperty(const PropertyKey& key, const PropertyDescriptor& desc,
                                       bool throwOnFailure) {
  return validateAndApplyPropertyDescriptor(key, desc, storage_->find(key), throwOnFailure);
}

bool Object::validateAndApplyPropertyDescriptor(const PropertyKey& key,
                                                const PropertyDescriptor& desc,
                                                const PropertyDescriptor* current,
                                                bool throwOnFailure, bool apply) {
  if (!current) {
    if (!extensible_) {
      return reject(throwOnFailure,
                    "Cannot define property " + key.toDisplayString() + ", object is not extensible");
    }
    if (apply) {
      PropertyDescriptor created = desc;
      created.complete();
      storage_->put(key, std::move(created));
    }
    return true;
  }

  if (describesSameProperty(desc, *current)) {
    return true;
  }

  const std::string redefine = "Cannot redefine property: " + key.toDisplayString();

  if (!current->configurable()) {
    if (desc.hasConfigurable() && desc.configurable()) {
      return reject(throwOnFailure, redefine);
    }
    if (desc.hasEnumerable() && desc.enumerable() != current->enumerable()) {
      return reject(throwOnFailure, redefine);
    }
  }

  PropertyDescriptor merged = *current;

  if (desc.isGenericDescriptor()) {
    // Only enumerable/configurable change; nothing more to validate.
  } else if (current->isDataDescriptor() != desc.isDataDescriptor()) {
    if (!current->configurable()) {
      return reject(throwOnFailure, redefine);
    }
    // Switching kind keeps the shared attributes and resets the new pair.
    if (current->isDataDescriptor()) {
      merged = PropertyDescriptor::accessor(Value(), Value(), current->enumerable(),
                                            current->configurable());
    } else {
      merged = PropertyDescriptor::data(Value(), false, current->enumerable(),
                                        current->configurable());
    }
  } else if (current->isDataDescriptor()) {
    if (!current->configurable() && !current->writable()) {
      if (desc.hasWritable() && desc.writable()) {
        return reject(throwOnFailure, redefine);
      }
      if (desc.hasValue() && !sameValue(desc.value(), current->value())) {
        return reject(throwOnFailure, "Cannot assign to read only property " + key.toDisplayString());
      }
    }
  } else if (!current->configurable()) {
    if (desc.hasSet() && !sameValue(desc.setter(), current->setter())) {
      return reject(throwOnFailure, redefine);
    }
    if (desc.hasGet() && !sameValue(desc.getter(), current->getter())) {
      return reject(throwOnFailure, redefine);
    }
  }

  if (!apply) {
    return true;
  }

  if (desc.hasValue()) merged.setValue(desc.value());
  if (desc.hasWritable()) merged.setWritable(desc.writable());
  if (desc.hasGet()) merged.setGetter(desc.getter());
  if (desc.hasSet()) merged.setSetter(desc.setter());
  if (desc.hasEnumerable()) merged.setEnumerable(desc.enumerable());
  if (desc.hasConfigurable()) merged.setConfigurable(desc.configurable());

  storage_->put(key, std::move(merged));
  return true;
}

bool Object::hasProperty(const PropertyKey& key) const {
  if (getOwnProperty(key)) {
    return true;
  }
  return prototype_ && prototype_->hasProperty(key);
}

Value Object::get(const PropertyKey& key) {
  return get(key, Value(shared_from_this()));
}

Value Object::get(const PropertyKey& key, const Value& receiver) {
  auto desc = getOwnProperty(key);
  if (!desc) {
    if (prototype_) {
      return prototype_->get(key, receiver);
    }
    return Value();
  }
  if (desc->isDataDescriptor()) {
    return desc->value();
  }
  auto getter = desc->getter().tryCast<Function>();
  if (!getter) {
    return Value();
  }
  return getter->call(receiver, {});
}

bool Object::set(const PropertyKey& key, const Value& value, const Value& receiver) {
  auto ownDesc = getOwnProperty(key);
  if (!ownDesc) {
    if (prototype_) {
      return prototype_->set(key, value, receiver);
    }
    ownDesc = PropertyDescriptor::data(Value(), true, true, true);
  }

  if (ownDesc->isDataDescriptor()) {
    if (!ownDesc->writable() || !receiver.isObject()) {
      return false;
    }
    const auto& target = receiver.asObject();
    if (auto existing = target->getOwnProperty(key)) {
      if (existing->isAccessorDescriptor() || !existing->writable()) {
        return false;
      }
      PropertyDescriptor update;
      update.setValue(value);
      return target->defineOwnProperty(key, update, false);
    }
    return target->defineOwnProperty(key, PropertyDescriptor::data(value, true, true, true), false);
  }

  auto setter = ownDesc->setter().tryCast<Function>();
  if (!setter) {
    return false;
  }
  setter->call(receiver, {value});
  return true;
}

bool Object::put(const PropertyKey& key, const Value& value, bool throwOnFailure) {
  if (set(key, value, Value(shared_from_this()))) {
    return true;
  }
  return reject(throwOnFailure, "Cannot assign to read only property " + key.toDisplayString() +
                                    " of " + className());
}

bool Object::deleteProperty(const PropertyKey& key, bool throwOnFailure) {
  auto desc = getOwnProperty(key);
  if (!desc) {
    return true;
  }
  if (desc->configurable()) {
    storage_->remove(key);
    return true;
  }
  return reject(throwOnFailure, "Cannot delete property " + key.toDisplayString() + " of " +
                                    className());
}

std::vector<PropertyKey> Object::ownPropertyKeys() const {
  return storage_->keys();
}

std::vector<std::pair<PropertyKey, PropertyDescriptor>> Object::getOwnProperties() const {
  std::vector<std::pair<PropertyKey, PropertyDescriptor>> result;
  for (auto& key : ownPropertyKeys()) {
    if (auto desc = getOwnProperty(key)) {
      result.emplace_back(key, std::move(*desc));
    }
  }
  return result;
}

void Object::createDataPropertyOrThrow(const PropertyKey& key, const Value& value) {
  defineOwnProperty(key, PropertyDescriptor::data(value, true, true, true), true);
}

void Object::fastAddProperty(const PropertyKey& key, Value value, PropertyFlag flags) {
  storage_->put(key, PropertyDescriptor(std::move(value), flags));
}

void Object::fastAddProperty(const PropertyKey& key, PropertyDescriptor desc) {
  desc.complete();
  storage_->put(key, std::move(desc));
}

bool Object::reject(bool throwOnFailure, const std::string& message) const {
  if (throwOnFailure) {
    engine_.throwTypeError(message);
  }
  return false;
}

}  // namespace kernjs
