#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "property_descriptor.h"
#include "property_key.h"
#include "property_storage.h"
#include "value.h"

namespace kernjs {

class Engine;

/**
 * @brief Ordinary object: own properties, prototype link and extensible flag.
 *
 * The property operations below are the ordinary algorithms. Exotic kinds
 * (arrays, arguments objects, string wrappers) override the virtual ones.
 *
 * Operations taking a @p throwOnFailure flag run the same validation in both
 * modes: with the flag set a failure raises a TypeError, otherwise it is
 * reported as a false return.
 */
class Object : public std::enable_shared_from_this<Object> {
public:
  Object(Engine& engine, std::shared_ptr<Object> prototype,
         std::unique_ptr<PropertyStorage> storage = nullptr);
  virtual ~Object() = default;

  Object(const Object&) = delete;
  Object& operator=(const Object&) = delete;

  Engine& engine() const { return engine_; }

  // Name used in diagnostics and Object.prototype.toString style output.
  virtual const char* className() const { return "Object"; }
  virtual bool isCallable() const { return false; }

  const std::shared_ptr<Object>& getPrototypeOf() const { return prototype_; }
  // Fails on a non-extensible object (unless unchanged) and when the new
  // chain would contain this object.
  bool setPrototypeOf(std::shared_ptr<Object> prototype);

  bool isExtensible() const { return extensible_; }
  virtual bool preventExtensions();

  virtual std::optional<PropertyDescriptor> getOwnProperty(const PropertyKey& key) const;
  virtual bool defineOwnProperty(const PropertyKey& key, const PropertyDescriptor& desc,
                                 bool throwOnFailure);
  virtual bool hasProperty(const PropertyKey& key) const;
  bool hasOwnProperty(const PropertyKey& key) const { return getOwnProperty(key).has_value(); }

  virtual Value get(const PropertyKey& key, const Value& receiver);
  Value get(const PropertyKey& key);

  virtual bool set(const PropertyKey& key, const Value& value, const Value& receiver);
  // Assignment: set with this object as receiver.
  bool put(const PropertyKey& key, const Value& value, bool throwOnFailure);

  virtual bool deleteProperty(const PropertyKey& key, bool throwOnFailure);

  virtual std::vector<PropertyKey> ownPropertyKeys() const;
  std::vector<std::pair<PropertyKey, PropertyDescriptor>> getOwnProperties() const;

  // Defines {value, writable, enumerable, configurable: true}; throws on failure.
  void createDataPropertyOrThrow(const PropertyKey& key, const Value& value);
  // Installs a property without validation. Only for freshly allocated objects.
  void fastAddProperty(const PropertyKey& key, Value value, PropertyFlag flags);
  void fastAddProperty(const PropertyKey& key, PropertyDescriptor desc);

protected:
  bool ordinaryDefineOwnProperty(const PropertyKey& key, const PropertyDescriptor& desc,
                                 bool throwOnFailure);
  // Checks @p desc against @p current (nullptr when absent) and, when
  // @p apply is set, stores the merged property.
  bool validateAndApplyPropertyDescriptor(const PropertyKey& key, const PropertyDescriptor& desc,
                                          const PropertyDescriptor* current, bool throwOnFailure,
                                          bool apply = true);
  bool reject(bool throwOnFailure, const std::string& message) const;

  PropertyStorage& storage() { return *storage_; }
  const PropertyStorage& storage() const { return *storage_; }

  Engine& engine_;

private:
  std::shared_ptr<Object> prototype_;
  std::unique_ptr<PropertyStorage> storage_;
  bool extensible_ = true;
};

using ObjectPtr = std::shared_ptr<Object>;

}  // namespace kernjs
