#include "kernjs/property_storage.h"
#include <algorithm>

namespace kernjs {

std::vector<PropertyKey> enumerationOrder(const std::vector<PropertyKey>& insertionOrder) {
  std::vector<std::pair<uint32_t, const PropertyKey*>> indices;
  std::vector<PropertyKey> strings;
  std::vector<PropertyKey> symbols;

  for (const auto& key : insertionOrder) {
    if (key.isSymbol()) {
      symbols.push_back(key);
    } else if (auto index = key.arrayIndex()) {
      indices.emplace_back(*index, &key);
    } else {
      strings.push_back(key);
    }
  }

  std::sort(indices.begin(), indices.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });

  std::vector<PropertyKey> result;
  result.reserve(insertionOrder.size());
  for (const auto& [index, key] : indices) {
    result.push_back(*key);
  }
  result.insert(result.end(), strings.begin(), strings.end());
  result.insert(result.end(), symbols.begin(), symbols.end());
  return result;
}

// OrderedPropertyStorage

const PropertyDescriptor* OrderedPropertyStorage::find(const PropertyKey& key) const {
  auto it = properties_.find(key);
  if (it == properties_.end()) {
    return nullptr;
  }
  return &it->second;
}

void OrderedPropertyStorage::put(const PropertyKey& key, PropertyDescriptor desc) {
  properties_[key] = std::move(desc);
}

bool OrderedPropertyStorage::remove(const PropertyKey& key) {
  return properties_.erase(key) > 0;
}

std::vector<PropertyKey> OrderedPropertyStorage::keys() const {
  return enumerationOrder(properties_.orderedKeys());
}

// ConstructorSlotStorage

ConstructorSlotStorage::ConstructorSlotStorage(PropertyKey reservedKey, PropertyDescriptor slot,
                                               std::unique_ptr<PropertyStorage> backing)
  : reservedKey_(std::move(reservedKey)),
    slot_(std::move(slot)),
    backing_(backing ? std::move(backing) : std::make_unique<OrderedPropertyStorage>()) {}

const PropertyDescriptor* ConstructorSlotStorage::find(const PropertyKey& key) const {
  if (isReserved(key)) {
    return &*slot_;
  }
  return backing_->find(key);
}

void ConstructorSlotStorage::put(const PropertyKey& key, PropertyDescriptor desc) {
  if (isReserved(key)) {
    slot_ = std::move(desc);
    return;
  }
  backing_->put(key, std::move(desc));
}

bool ConstructorSlotStorage::remove(const PropertyKey& key) {
  if (isReserved(key)) {
    slot_.reset();
    return true;
  }
  return backing_->remove(key);
}

std::vector<PropertyKey> ConstructorSlotStorage::keys() const {
  std::vector<PropertyKey> backingKeys = backing_->keys();
  if (!slot_) {
    return backingKeys;
  }

  // The reserved key is a plain string key: it goes after the array
  // indices and ahead of every other string key.
  auto firstNonIndex = std::find_if(backingKeys.begin(), backingKeys.end(),
                                    [](const PropertyKey& key) { return !key.isArrayIndex(); });
  backingKeys.insert(firstNonIndex, reservedKey_);
  return backingKeys;
}

}  // namespace kernjs
