#pragma once

#include <optional>
#include <vector>
#include "property_descriptor.h"
#include "value.h"

namespace kernjs {

class Engine;
class Object;

// ToPropertyDescriptor / FromPropertyDescriptor
PropertyDescriptor toPropertyDescriptor(Engine& engine, const Value& attributes);
Value fromPropertyDescriptor(Engine& engine, const std::optional<PropertyDescriptor>& desc);

// Object static methods
Value Object_defineProperty(Engine& engine, const Value& thisArg, const std::vector<Value>& args);
Value Object_defineProperties(Engine& engine, const Value& thisArg, const std::vector<Value>& args);
Value Object_getOwnPropertyDescriptor(Engine& engine, const Value& thisArg, const std::vector<Value>& args);
Value Object_getPrototypeOf(Engine& engine, const Value& thisArg, const std::vector<Value>& args);
Value Object_setPrototypeOf(Engine& engine, const Value& thisArg, const std::vector<Value>& args);
Value Object_keys(Engine& engine, const Value& thisArg, const std::vector<Value>& args);
Value Object_preventExtensions(Engine& engine, const Value& thisArg, const std::vector<Value>& args);
Value Object_isExtensible(Engine& engine, const Value& thisArg, const std::vector<Value>& args);

// Object.prototype methods
Value ObjectPrototype_hasOwnProperty(Engine& engine, const Value& thisArg, const std::vector<Value>& args);
Value ObjectPrototype_toString(Engine& engine, const Value& thisArg, const std::vector<Value>& args);
Value ObjectPrototype_valueOf(Engine& engine, const Value& thisArg, const std::vector<Value>& args);

// Installs the global Object constructor and Object.prototype methods.
void installObjectBuiltins(Engine& engine);

}  // namespace kernjs
