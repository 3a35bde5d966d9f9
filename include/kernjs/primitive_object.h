#pragma once

#include <memory>
#include <optional>
#include <vector>
#include "object.h"

namespace kernjs {

// Wrapper object produced by ToObject for a primitive.
class PrimitiveObject : public Object {
public:
  PrimitiveObject(Engine& engine, std::shared_ptr<Object> prototype, Value primitive)
    : Object(engine, std::move(prototype)), primitive_(std::move(primitive)) {}

  const Value& primitiveValue() const { return primitive_; }

private:
  Value primitive_;
};

class BooleanObject : public PrimitiveObject {
public:
  using PrimitiveObject::PrimitiveObject;
  const char* className() const override { return "Boolean"; }
};

class NumberObject : public PrimitiveObject {
public:
  using PrimitiveObject::PrimitiveObject;
  const char* className() const override { return "Number"; }
};

class SymbolObject : public PrimitiveObject {
public:
  using PrimitiveObject::PrimitiveObject;
  const char* className() const override { return "Symbol"; }
};

class BigIntObject : public PrimitiveObject {
public:
  using PrimitiveObject::PrimitiveObject;
  const char* className() const override { return "BigInt"; }
};

/**
 * String wrapper. Each character is a read-only, enumerable,
 * non-configurable index property that is never stored.
 */
class StringObject : public PrimitiveObject {
public:
  StringObject(Engine& engine, std::shared_ptr<Object> prototype, const std::string& value);

  const char* className() const override { return "String"; }

  std::optional<PropertyDescriptor> getOwnProperty(const PropertyKey& key) const override;
  bool defineOwnProperty(const PropertyKey& key, const PropertyDescriptor& desc,
                         bool throwOnFailure) override;
  std::vector<PropertyKey> ownPropertyKeys() const override;

private:
  std::optional<PropertyDescriptor> characterAt(const PropertyKey& key) const;
};

}  // namespace kernjs
