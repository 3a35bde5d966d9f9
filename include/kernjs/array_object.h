#pragma once

#include <memory>
#include <vector>
#include "object.h"

namespace kernjs {

/**
 * Array exotic object. "length" is an own data property (non-enumerable,
 * non-configurable) that always exceeds every own array index.
 */
class ArrayObject : public Object {
public:
  ArrayObject(Engine& engine, std::shared_ptr<Object> prototype);

  const char* className() const override { return "Array"; }

  bool defineOwnProperty(const PropertyKey& key, const PropertyDescriptor& desc,
                         bool throwOnFailure) override;

  uint32_t length() const;

private:
  bool defineLength(const PropertyDescriptor& desc, bool throwOnFailure);
  bool defineIndex(uint32_t index, const PropertyKey& key, const PropertyDescriptor& desc,
                   bool throwOnFailure);
};

}  // namespace kernjs
