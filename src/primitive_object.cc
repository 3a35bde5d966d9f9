#include "kernjs/primitive_object.h"
#include "kernjs/engine.h"

namespace kernjs {

StringObject::StringObject(Engine& engine, std::shared_ptr<Object> prototype,
                           const std::string& value)
  : PrimitiveObject(engine, std::move(prototype), Value(value)) {
  fastAddProperty("length", Value(static_cast<uint32_t>(value.size())), PropertyFlag::None);
}

std::optional<PropertyDescriptor> StringObject::characterAt(const PropertyKey& key) const {
  auto index = key.arrayIndex();
  const std::string& str = primitiveValue().asString();
  if (!index || *index >= str.size()) {
    return std::nullopt;
  }
  return PropertyDescriptor::data(Value(std::string(1, str[*index])), false, true, false);
}

std::optional<PropertyDescriptor> StringObject::getOwnProperty(const PropertyKey& key) const {
  if (auto desc = Object::getOwnProperty(key)) {
    return desc;
  }
  return characterAt(key);
}

bool StringObject::defineOwnProperty(const PropertyKey& key, const PropertyDescriptor& desc,
                                     bool throwOnFailure) {
  if (auto character = characterAt(key)) {
    // Only a no-op redefinition is compatible with a frozen character.
    return validateAndApplyPropertyDescriptor(key, desc, &*character, throwOnFailure, false);
  }
  return ordinaryDefineOwnProperty(key, desc, throwOnFailure);
}

std::vector<PropertyKey> StringObject::ownPropertyKeys() const {
  const std::string& str = primitiveValue().asString();
  std::vector<PropertyKey> keys;
  keys.reserve(str.size());
  for (uint32_t i = 0; i < str.size(); ++i) {
    keys.push_back(PropertyKey::fromIndex(i));
  }
  // Stored index keys are all past the string, so they follow in order.
  for (auto& key : Object::ownPropertyKeys()) {
    keys.push_back(std::move(key));
  }
  return keys;
}

}  // namespace kernjs
