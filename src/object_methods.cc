#include "kernjs/object_methods.h"
#include "kernjs/engine.h"
#include "kernjs/symbols.h"
#include <utility>

namespace kernjs {

namespace {

Value argumentAt(const std::vector<Value>& args, size_t index) {
  return index < args.size() ? args[index] : Value();
}

std::shared_ptr<Object> requireObject(Engine& engine, const Value& value, const char* method) {
  if (!value.isObject()) {
    engine.throwTypeError(std::string(method) + " called on non-object");
  }
  return value.asObject();
}

void defineMethod(Engine& engine, Object& target, const std::string& name, uint32_t length,
                  NativeCallback callback) {
  target.fastAddProperty(name, Value(engine.createNativeFunction(name, length, std::move(callback))),
                         PropertyFlag::NonEnumerable);
}

}  // namespace

PropertyDescriptor toPropertyDescriptor(Engine& engine, const Value& attributes) {
  if (!attributes.isObject()) {
    engine.throwTypeError("Property description must be an object: " +
                          attributes.toDisplayString());
  }
  const auto& obj = attributes.asObject();

  PropertyDescriptor desc;
  if (obj->hasProperty("enumerable")) {
    desc.setEnumerable(obj->get("enumerable").toBool());
  }
  if (obj->hasProperty("configurable")) {
    desc.setConfigurable(obj->get("configurable").toBool());
  }
  if (obj->hasProperty("value")) {
    desc.setValue(obj->get("value"));
  }
  if (obj->hasProperty("writable")) {
    desc.setWritable(obj->get("writable").toBool());
  }

  bool hasData = desc.isDataDescriptor();
  bool hasAccessor = false;
  if (obj->hasProperty("get")) {
    Value getter = obj->get("get");
    if (!getter.isUndefined() && !getter.isCallable()) {
      engine.throwTypeError("Getter must be a function: " + getter.toDisplayString());
    }
    hasAccessor = true;
    if (!hasData) desc.setGetter(getter);
  }
  if (obj->hasProperty("set")) {
    Value setter = obj->get("set");
    if (!setter.isUndefined() && !setter.isCallable()) {
      engine.throwTypeError("Setter must be a function: " + setter.toDisplayString());
    }
    hasAccessor = true;
    if (!hasData) desc.setSetter(setter);
  }
  if (hasData && hasAccessor) {
    engine.throwTypeError(
        "Invalid property descriptor. Cannot both specify accessors and a value or writable attribute");
  }
  return desc;
}

Value fromPropertyDescriptor(Engine& engine, const std::optional<PropertyDescriptor>& desc) {
  if (!desc) {
    return Value();
  }
  auto obj = engine.createObject();
  if (desc->isDataDescriptor()) {
    obj->createDataPropertyOrThrow("value", desc->value());
    obj->createDataPropertyOrThrow("writable", Value(desc->writable()));
  } else {
    obj->createDataPropertyOrThrow("get", desc->getter());
    obj->createDataPropertyOrThrow("set", desc->setter());
  }
  obj->createDataPropertyOrThrow("enumerable", Value(desc->enumerable()));
  obj->createDataPropertyOrThrow("configurable", Value(desc->configurable()));
  return Value(obj);
}

Value Object_defineProperty(Engine& engine, const Value&, const std::vector<Value>& args) {
  auto target = requireObject(engine, argumentAt(args, 0), "Object.defineProperty");
  PropertyKey key = engine.toPropertyKey(argumentAt(args, 1));
  PropertyDescriptor desc = toPropertyDescriptor(engine, argumentAt(args, 2));
  target->defineOwnProperty(key, desc, true);
  return Value(target);
}

Value Object_defineProperties(Engine& engine, const Value&, const std::vector<Value>& args) {
  auto target = requireObject(engine, argumentAt(args, 0), "Object.defineProperties");
  auto props = engine.toObject(argumentAt(args, 1));

  // Every descriptor is read before any is applied.
  std::vector<std::pair<PropertyKey, PropertyDescriptor>> descriptors;
  for (const auto& key : props->ownPropertyKeys()) {
    auto propDesc = props->getOwnProperty(key);
    if (propDesc && propDesc->enumerable()) {
      descriptors.emplace_back(key, toPropertyDescriptor(engine, props->get(key)));
    }
  }
  for (const auto& [key, desc] : descriptors) {
    target->defineOwnProperty(key, desc, true);
  }
  return Value(target);
}

Value Object_getOwnPropertyDescriptor(Engine& engine, const Value&, const std::vector<Value>& args) {
  auto obj = engine.toObject(argumentAt(args, 0));
  PropertyKey key = engine.toPropertyKey(argumentAt(args, 1));
  return fromPropertyDescriptor(engine, obj->getOwnProperty(key));
}

Value Object_getPrototypeOf(Engine& engine, const Value&, const std::vector<Value>& args) {
  auto obj = engine.toObject(argumentAt(args, 0));
  const auto& proto = obj->getPrototypeOf();
  return proto ? Value(proto) : Value(Null{});
}

Value Object_setPrototypeOf(Engine& engine, const Value&, const std::vector<Value>& args) {
  Value target = argumentAt(args, 0);
  Value proto = argumentAt(args, 1);
  if (target.isNullOrUndefined()) {
    engine.throwTypeError("Object.setPrototypeOf called on null or undefined");
  }
  if (!proto.isObject() && !proto.isNull()) {
    engine.throwTypeError("Object prototype may only be an Object or null: " +
                          proto.toDisplayString());
  }
  if (!target.isObject()) {
    return target;
  }
  const auto& obj = target.asObject();
  if (!obj->setPrototypeOf(proto.isObject() ? proto.asObject() : nullptr)) {
    engine.throwTypeError(obj->isExtensible() ? "Cyclic __proto__ value"
                                              : std::string("#<") + obj->className() +
                                                    "> is not extensible");
  }
  return target;
}

Value Object_keys(Engine& engine, const Value&, const std::vector<Value>& args) {
  auto obj = engine.toObject(argumentAt(args, 0));
  std::vector<Value> keys;
  for (const auto& key : obj->ownPropertyKeys()) {
    if (key.isSymbol()) {
      continue;
    }
    auto desc = obj->getOwnProperty(key);
    if (desc && desc->enumerable()) {
      keys.emplace_back(key.name());
    }
  }
  return Value(engine.createArray(keys));
}

Value Object_preventExtensions(Engine&, const Value&, const std::vector<Value>& args) {
  Value target = argumentAt(args, 0);
  if (target.isObject()) {
    target.asObject()->preventExtensions();
  }
  return target;
}

Value Object_isExtensible(Engine&, const Value&, const std::vector<Value>& args) {
  Value target = argumentAt(args, 0);
  return Value(target.isObject() && target.asObject()->isExtensible());
}

Value ObjectPrototype_hasOwnProperty(Engine& engine, const Value& thisArg,
                                     const std::vector<Value>& args) {
  PropertyKey key = engine.toPropertyKey(argumentAt(args, 0));
  auto obj = engine.toObject(thisArg);
  return Value(obj->hasOwnProperty(key));
}

Value ObjectPrototype_toString(Engine& engine, const Value& thisArg, const std::vector<Value>&) {
  if (thisArg.isUndefined()) {
    return Value("[object Undefined]");
  }
  if (thisArg.isNull()) {
    return Value("[object Null]");
  }
  auto obj = engine.toObject(thisArg);
  Value tag = obj->get(WellKnownSymbols::toStringTag());
  if (tag.isString()) {
    return Value("[object " + tag.asString() + "]");
  }
  return Value(std::string("[object ") + obj->className() + "]");
}

Value ObjectPrototype_valueOf(Engine& engine, const Value& thisArg, const std::vector<Value>&) {
  return Value(engine.toObject(thisArg));
}

void installObjectBuiltins(Engine& engine) {
  auto toObjectOrNew = [](Engine& engine, const std::vector<Value>& args) {
    Value value = argumentAt(args, 0);
    if (value.isNullOrUndefined()) {
      return engine.createObject();
    }
    return engine.toObject(value);
  };

  auto ctor = engine.createNativeFunction(
      "Object", 1,
      [toObjectOrNew](Engine& engine, const Value&, const std::vector<Value>& args) {
        return Value(toObjectOrNew(engine, args));
      },
      [toObjectOrNew](Engine& engine, const std::vector<Value>& args, std::shared_ptr<Object>) {
        return toObjectOrNew(engine, args);
      });

  const auto& objectPrototype = engine.objectPrototype();
  ctor->fastAddProperty("prototype", Value(objectPrototype), PropertyFlag::None);
  objectPrototype->fastAddProperty("constructor", Value(ctor), PropertyFlag::NonEnumerable);

  defineMethod(engine, *ctor, "defineProperty", 3, Object_defineProperty);
  defineMethod(engine, *ctor, "defineProperties", 2, Object_defineProperties);
  defineMethod(engine, *ctor, "getOwnPropertyDescriptor", 2, Object_getOwnPropertyDescriptor);
  defineMethod(engine, *ctor, "getPrototypeOf", 1, Object_getPrototypeOf);
  defineMethod(engine, *ctor, "setPrototypeOf", 2, Object_setPrototypeOf);
  defineMethod(engine, *ctor, "keys", 1, Object_keys);
  defineMethod(engine, *ctor, "preventExtensions", 1, Object_preventExtensions);
  defineMethod(engine, *ctor, "isExtensible", 1, Object_isExtensible);

  defineMethod(engine, *objectPrototype, "hasOwnProperty", 1, ObjectPrototype_hasOwnProperty);
  defineMethod(engine, *objectPrototype, "toString", 0, ObjectPrototype_toString);
  defineMethod(engine, *objectPrototype, "valueOf", 0, ObjectPrototype_valueOf);

  engine.globalObject()->fastAddProperty("Object", Value(ctor), PropertyFlag::NonEnumerable);
}

}  // namespace kernjs
