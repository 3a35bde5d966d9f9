#pragma once

#include <algorithm>
#include <unordered_map>
#include <vector>
#include "property_descriptor.h"
#include "property_key.h"

namespace kernjs {

// Hash map that remembers insertion order. orderedKeys() yields keys in
// insertion order; a key that is erased and inserted again moves to the end.
template <typename K, typename V, typename Hash = std::hash<K>>
class OrderedMap {
 public:
  using map_type = std::unordered_map<K, V, Hash>;
  using const_iterator = typename map_type::const_iterator;

  V& operator[](const K& key) {
    auto [it, inserted] = map_.try_emplace(key);
    if (inserted) {
      order_.push_back(key);
    }
    return it->second;
  }

  const_iterator find(const K& key) const { return map_.find(key); }
  const_iterator end() const { return map_.end(); }

  size_t erase(const K& key) {
    if (map_.erase(key) == 0) {
      return 0;
    }
    order_.erase(std::find(order_.begin(), order_.end(), key));
    return 1;
  }

  const std::vector<K>& orderedKeys() const { return order_; }

 private:
  map_type map_;
  std::vector<K> order_;
};

using PropertyMap = OrderedMap<PropertyKey, PropertyDescriptor, PropertyKey::Hash>;

// Own-property enumeration order: array indices ascending, then string keys
// in insertion order, then symbols in insertion order.
std::vector<PropertyKey> enumerationOrder(const std::vector<PropertyKey>& insertionOrder);

}  // namespace kernjs
