#include "kernjs/array_object.h"
#include "kernjs/engine.h"
#include <algorithm>
#include <functional>

namespace kernjs {

namespace {

const PropertyKey& lengthKey() {
  static const PropertyKey key("length");
  return key;
}

}  // namespace

ArrayObject::ArrayObject(Engine& engine, std::shared_ptr<Object> prototype)
  : Object(engine, std::move(prototype)) {
  fastAddProperty(lengthKey(), Value(0), PropertyFlag::OnlyWritable);
}

uint32_t ArrayObject::length() const {
  const PropertyDescriptor* desc = storage().find(lengthKey());
  return toUint32(desc->value().asNumber());
}

bool ArrayObject::defineOwnProperty(const PropertyKey& key, const PropertyDescriptor& desc,
                                    bool throwOnFailure) {
  if (key == lengthKey()) {
    return defineLength(desc, throwOnFailure);
  }
  if (auto index = key.arrayIndex()) {
    return defineIndex(*index, key, desc, throwOnFailure);
  }
  return ordinaryDefineOwnProperty(key, desc, throwOnFailure);
}

bool ArrayObject::defineLength(const PropertyDescriptor& desc, bool throwOnFailure) {
  if (!desc.hasValue()) {
    return ordinaryDefineOwnProperty(lengthKey(), desc, throwOnFailure);
  }

  uint32_t newLen = engine_.toUint32(desc.value());
  if (static_cast<double>(newLen) != engine_.toNumber(desc.value())) {
    engine_.throwRangeError("Invalid array length");
  }

  PropertyDescriptor newLenDesc = desc;
  newLenDesc.setValue(Value(newLen));

  uint32_t oldLen = length();
  if (newLen >= oldLen) {
    return ordinaryDefineOwnProperty(lengthKey(), newLenDesc, throwOnFailure);
  }

  if (!storage().find(lengthKey())->writable()) {
    return reject(throwOnFailure, "Cannot assign to read only property 'length' of Array");
  }

  // A request to make length read-only is applied after the deletions.
  bool newWritable = !newLenDesc.hasWritable() || newLenDesc.writable();
  if (!newWritable) {
    newLenDesc.setWritable(true);
  }
  if (!ordinaryDefineOwnProperty(lengthKey(), newLenDesc, throwOnFailure)) {
    return false;
  }

  std::vector<uint32_t> doomed;
  for (const auto& key : storage().keys()) {
    auto index = key.arrayIndex();
    if (index && *index >= newLen) {
      doomed.push_back(*index);
    }
  }
  std::sort(doomed.begin(), doomed.end(), std::greater<uint32_t>());

  for (uint32_t index : doomed) {
    if (!deleteProperty(PropertyKey::fromIndex(index), false)) {
      PropertyDescriptor truncated;
      truncated.setValue(Value(index + 1));
      if (!newWritable) {
        truncated.setWritable(false);
      }
      ordinaryDefineOwnProperty(lengthKey(), truncated, false);
      return reject(throwOnFailure,
                    "Cannot delete property '" + std::to_string(index) + "' of Array");
    }
  }

  if (!newWritable) {
    PropertyDescriptor readOnly;
    readOnly.setWritable(false);
    ordinaryDefineOwnProperty(lengthKey(), readOnly, false);
  }
  return true;
}

bool ArrayObject::defineIndex(uint32_t index, const PropertyKey& key,
                              const PropertyDescriptor& desc, bool throwOnFailure) {
  const PropertyDescriptor* lengthDesc = storage().find(lengthKey());
  uint32_t oldLen = toUint32(lengthDesc->value().asNumber());
  if (index >= oldLen && !lengthDesc->writable()) {
    return reject(throwOnFailure, "Cannot add property " + std::to_string(index) +
                                      ", array length is not writable");
  }
  if (!ordinaryDefineOwnProperty(key, desc, throwOnFailure)) {
    return false;
  }
  if (index >= oldLen) {
    PropertyDescriptor grown;
    grown.setValue(Value(index + 1));
    ordinaryDefineOwnProperty(lengthKey(), grown, false);
  }
  return true;
}

}  // namespace kernjs
