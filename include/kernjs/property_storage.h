#pragma once

#include <memory>
#include <optional>
#include <vector>
#include "property_map.h"

namespace kernjs {

// Backing store for an object's own properties. Objects never touch a map
// directly; exotic kinds and the constructor slot plug in here.
class PropertyStorage {
public:
  virtual ~PropertyStorage() = default;

  virtual const PropertyDescriptor* find(const PropertyKey& key) const = 0;
  virtual void put(const PropertyKey& key, PropertyDescriptor desc) = 0;
  virtual bool remove(const PropertyKey& key) = 0;
  // Keys in enumeration order.
  virtual std::vector<PropertyKey> keys() const = 0;
};

class OrderedPropertyStorage : public PropertyStorage {
public:
  const PropertyDescriptor* find(const PropertyKey& key) const override;
  void put(const PropertyKey& key, PropertyDescriptor desc) override;
  bool remove(const PropertyKey& key) override;
  std::vector<PropertyKey> keys() const override;

private:
  PropertyMap properties_;
};

// Keeps one reserved key in a dedicated slot and forwards every other key to
// the backing storage. Used for the "constructor" property of function
// prototype objects, which is almost never touched after creation.
//
// The slot is reported first among string keys, which is where a property
// installed before any other would enumerate. Once the slot is removed the
// reserved key is retired and later definitions go to the backing storage,
// so a re-added property enumerates after existing ones.
class ConstructorSlotStorage : public PropertyStorage {
public:
  ConstructorSlotStorage(PropertyKey reservedKey, PropertyDescriptor slot,
                         std::unique_ptr<PropertyStorage> backing = nullptr);

  const PropertyDescriptor* find(const PropertyKey& key) const override;
  void put(const PropertyKey& key, PropertyDescriptor desc) override;
  bool remove(const PropertyKey& key) override;
  std::vector<PropertyKey> keys() const override;

private:
  bool isReserved(const PropertyKey& key) const { return slot_.has_value() && key == reservedKey_; }

  PropertyKey reservedKey_;
  std::optional<PropertyDescriptor> slot_;
  std::unique_ptr<PropertyStorage> backing_;
};

}  // namespace kernjs
