#include "kernjs/arguments_object.h"
#include "kernjs/engine.h"
#include "kernjs/environment.h"
#include "kernjs/function.h"
#include <algorithm>
#include <unordered_set>

namespace kernjs {

std::shared_ptr<ArgumentsObject> ArgumentsObject::create(
    Engine& engine, std::shared_ptr<Function> callee, const std::vector<Value>& args,
    const std::vector<std::string>& mappedNames, std::shared_ptr<DeclarativeEnvironment> env,
    bool strict) {
  auto arguments = std::make_shared<ArgumentsObject>(engine, engine.objectPrototype(), nullptr);

  arguments->fastAddProperty("length", Value(static_cast<uint32_t>(args.size())),
                             PropertyFlag::NonEnumerable);
  for (size_t i = 0; i < args.size(); ++i) {
    arguments->fastAddProperty(PropertyKey::fromIndex(static_cast<uint32_t>(i)), args[i],
                               PropertyFlag::AllFlags);
  }

  // Walk backwards so that, for a repeated name, the last index wins.
  size_t mapped = std::min(args.size(), mappedNames.size());
  std::unordered_set<std::string> seen;
  for (size_t i = mapped; i-- > 0;) {
    const std::string& name = mappedNames[i];
    if (seen.insert(name).second) {
      arguments->parameterMap_.emplace(static_cast<uint32_t>(i), name);
    }
  }
  // Unmapped objects must not reference the environment that binds them.
  if (!arguments->parameterMap_.empty()) {
    arguments->env_ = std::move(env);
  }

  if (strict) {
    const auto& thrower = engine.throwTypeErrorFunction();
    arguments->fastAddProperty("callee", PropertyDescriptor::accessor(thrower, thrower, false, false));
    arguments->fastAddProperty("caller", PropertyDescriptor::accessor(thrower, thrower, false, false));
  } else {
    arguments->fastAddProperty("callee", Value(callee), PropertyFlag::NonEnumerable);
  }
  return arguments;
}

ArgumentsObject::ArgumentsObject(Engine& engine, std::shared_ptr<Object> prototype,
                                 std::shared_ptr<DeclarativeEnvironment> env)
  : Object(engine, std::move(prototype)), env_(std::move(env)) {}

const std::string* ArgumentsObject::mappedName(const PropertyKey& key) const {
  if (parameterMap_.empty()) {
    return nullptr;
  }
  auto index = key.arrayIndex();
  if (!index) {
    return nullptr;
  }
  auto it = parameterMap_.find(*index);
  return it == parameterMap_.end() ? nullptr : &it->second;
}

std::optional<PropertyDescriptor> ArgumentsObject::getOwnProperty(const PropertyKey& key) const {
  auto desc = Object::getOwnProperty(key);
  if (!desc) {
    return desc;
  }
  if (const std::string* name = mappedName(key)) {
    desc->setValue(env_->getBindingValue(*name, false));
  }
  return desc;
}

Value ArgumentsObject::get(const PropertyKey& key, const Value& receiver) {
  if (const std::string* name = mappedName(key)) {
    return env_->getBindingValue(*name, false);
  }
  return Object::get(key, receiver);
}

bool ArgumentsObject::defineOwnProperty(const PropertyKey& key, const PropertyDescriptor& desc,
                                        bool throwOnFailure) {
  const std::string* name = mappedName(key);
  if (!name) {
    return ordinaryDefineOwnProperty(key, desc, throwOnFailure);
  }

  // Freezing a mapped index captures the binding's current value.
  PropertyDescriptor effective = desc;
  if (desc.isDataDescriptor() && !desc.hasValue() && desc.hasWritable() && !desc.writable()) {
    effective.setValue(env_->getBindingValue(*name, false));
  }
  if (!ordinaryDefineOwnProperty(key, effective, throwOnFailure)) {
    return false;
  }

  uint32_t index = *key.arrayIndex();
  if (desc.isAccessorDescriptor()) {
    parameterMap_.erase(index);
  } else {
    if (desc.hasValue()) {
      env_->setMutableBinding(*name, desc.value(), false);
    }
    if (desc.hasWritable() && !desc.writable()) {
      parameterMap_.erase(index);
    }
  }
  return true;
}

bool ArgumentsObject::deleteProperty(const PropertyKey& key, bool throwOnFailure) {
  bool mapped = isMapped(key);
  if (!Object::deleteProperty(key, throwOnFailure)) {
    return false;
  }
  if (mapped) {
    parameterMap_.erase(*key.arrayIndex());
  }
  return true;
}

}  // namespace kernjs
