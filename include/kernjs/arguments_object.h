#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "object.h"

namespace kernjs {

class DeclarativeEnvironment;
class Function;

/**
 * The `arguments` object of a function invocation.
 *
 * Mapped indices alias a parameter binding in the function's environment:
 * reads report the binding, value writes go to the binding. Deleting the
 * index, redefining it as an accessor or making it non-writable removes
 * the alias.
 */
class ArgumentsObject : public Object {
public:
  // mappedNames[i] is the parameter aliased by index i; pass an empty list
  // for unmapped (strict) arguments objects.
  static std::shared_ptr<ArgumentsObject> create(Engine& engine,
                                                 std::shared_ptr<Function> callee,
                                                 const std::vector<Value>& args,
                                                 const std::vector<std::string>& mappedNames,
                                                 std::shared_ptr<DeclarativeEnvironment> env,
                                                 bool strict);

  ArgumentsObject(Engine& engine, std::shared_ptr<Object> prototype,
                  std::shared_ptr<DeclarativeEnvironment> env);

  const char* className() const override { return "Arguments"; }

  std::optional<PropertyDescriptor> getOwnProperty(const PropertyKey& key) const override;
  bool defineOwnProperty(const PropertyKey& key, const PropertyDescriptor& desc,
                         bool throwOnFailure) override;
  using Object::get;
  Value get(const PropertyKey& key, const Value& receiver) override;
  bool deleteProperty(const PropertyKey& key, bool throwOnFailure) override;

  bool isMapped(const PropertyKey& key) const { return mappedName(key) != nullptr; }

private:
  const std::string* mappedName(const PropertyKey& key) const;

  std::shared_ptr<DeclarativeEnvironment> env_;
  std::unordered_map<uint32_t, std::string> parameterMap_;
};

}  // namespace kernjs
