#include "kernjs/environment.h"
#include "kernjs/engine.h"
#include <stdexcept>

namespace kernjs {

EnvironmentRecord::EnvironmentRecord(Engine& engine, std::shared_ptr<EnvironmentRecord> outer)
  : engine_(engine), outer_(std::move(outer)) {}

// DeclarativeEnvironment

DeclarativeEnvironment::DeclarativeEnvironment(Engine& engine,
                                               std::shared_ptr<EnvironmentRecord> outer)
  : EnvironmentRecord(engine, std::move(outer)) {}

bool DeclarativeEnvironment::hasBinding(const std::string& name) const {
  return bindings_.count(name) > 0;
}

void DeclarativeEnvironment::createMutableBinding(const std::string& name, bool deletable) {
  if (hasBinding(name)) {
    throw std::logic_error("Binding already exists: " + name);
  }
  Binding binding;
  binding.isMutable = true;
  binding.initialized = true;
  binding.deletable = deletable;
  bindings_.emplace(name, std::move(binding));
}

void DeclarativeEnvironment::createImmutableBinding(const std::string& name, bool strict) {
  if (hasBinding(name)) {
    throw std::logic_error("Binding already exists: " + name);
  }
  Binding binding;
  binding.isMutable = false;
  binding.initialized = false;
  binding.strict = strict;
  bindings_.emplace(name, std::move(binding));
}

void DeclarativeEnvironment::initializeBinding(const std::string& name, const Value& value) {
  Binding& binding = lookup(name);
  binding.value = value;
  binding.initialized = true;
}

bool DeclarativeEnvironment::isInitialized(const std::string& name) const {
  auto it = bindings_.find(name);
  return it != bindings_.end() && it->second.initialized;
}

bool DeclarativeEnvironment::isMutable(const std::string& name) const {
  auto it = bindings_.find(name);
  return it != bindings_.end() && it->second.isMutable;
}

void DeclarativeEnvironment::setMutableBinding(const std::string& name, const Value& value,
                                               bool strict) {
  auto it = bindings_.find(name);
  if (it == bindings_.end()) {
    if (strict) {
      engine_.throwReferenceError(name + " is not defined");
    }
    createMutableBinding(name, true);
    bindings_[name].value = value;
    return;
  }

  Binding& binding = it->second;
  if (binding.isMutable) {
    binding.value = value;
    return;
  }
  if (!binding.initialized) {
    engine_.throwReferenceError("Cannot access '" + name + "' before initialization");
  }
  if (strict || binding.strict) {
    engine_.throwTypeError("Assignment to constant variable '" + name + "'");
  }
}

Value DeclarativeEnvironment::getBindingValue(const std::string& name, bool strict) {
  const Binding& binding = lookup(name);
  if (!binding.initialized) {
    if (strict) {
      engine_.throwReferenceError("Cannot access '" + name + "' before initialization");
    }
    return Value();
  }
  return binding.value;
}

bool DeclarativeEnvironment::deleteBinding(const std::string& name) {
  auto it = bindings_.find(name);
  if (it == bindings_.end()) {
    return true;
  }
  if (!it->second.deletable) {
    return false;
  }
  bindings_.erase(it);
  return true;
}

DeclarativeEnvironment::Binding& DeclarativeEnvironment::lookup(const std::string& name) {
  auto it = bindings_.find(name);
  if (it == bindings_.end()) {
    throw std::logic_error("No binding for " + name);
  }
  return it->second;
}

// ObjectEnvironment

ObjectEnvironment::ObjectEnvironment(Engine& engine, std::shared_ptr<Object> bindingObject,
                                     std::shared_ptr<EnvironmentRecord> outer, bool provideThis)
  : EnvironmentRecord(engine, std::move(outer)),
    bindingObject_(std::move(bindingObject)),
    provideThis_(provideThis) {}

bool ObjectEnvironment::hasBinding(const std::string& name) const {
  return bindingObject_->hasProperty(name);
}

void ObjectEnvironment::createMutableBinding(const std::string& name, bool deletable) {
  bindingObject_->defineOwnProperty(name, PropertyDescriptor::data(Value(), true, true, deletable),
                                    true);
}

void ObjectEnvironment::setMutableBinding(const std::string& name, const Value& value,
                                          bool strict) {
  bindingObject_->put(name, value, strict);
}

Value ObjectEnvironment::getBindingValue(const std::string& name, bool strict) {
  if (!bindingObject_->hasProperty(name)) {
    if (strict) {
      engine_.throwReferenceError(name + " is not defined");
    }
    return Value();
  }
  return bindingObject_->get(name);
}

bool ObjectEnvironment::deleteBinding(const std::string& name) {
  return bindingObject_->deleteProperty(name, false);
}

Value ObjectEnvironment::implicitThisValue() const {
  return provideThis_ ? Value(bindingObject_) : Value();
}

}  // namespace kernjs
