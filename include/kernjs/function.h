#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "completion.h"
#include "environment.h"
#include "function_declaration.h"
#include "object.h"

namespace kernjs {

class DeclarativeEnvironment;

/**
 * @brief Callable object.
 *
 * call() never sees break/continue completions; construct() is only
 * available when isConstructor() is true and raises TypeError otherwise.
 */
class Function : public Object {
public:
  Function(Engine& engine, std::shared_ptr<Object> prototype,
           std::unique_ptr<PropertyStorage> storage = nullptr);

  const char* className() const override { return "Function"; }
  bool isCallable() const override { return true; }

  virtual bool isConstructor() const { return false; }
  virtual bool isStrict() const { return false; }

  virtual Value call(const Value& thisArg, const std::vector<Value>& args) = 0;
  // newTarget defaults to this function.
  virtual std::shared_ptr<Object> construct(const std::vector<Value>& args,
                                            std::shared_ptr<Object> newTarget = nullptr);

  // Own "name" / "length" data values, or ""/0 when missing.
  std::string name() const;
  uint32_t length() const;

protected:
  void installNameAndLength(const std::string& name, uint32_t length);
  // "caller" and "arguments" accessors that raise TypeError on get and set.
  void installPoisonedAccessors();
};

using FunctionPtr = std::shared_ptr<Function>;

/**
 * Function created from a FunctionDeclaration. Owns a "prototype" object
 * whose "constructor" lives in a ConstructorSlotStorage slot.
 */
class ScriptFunction : public Function {
public:
  static std::shared_ptr<ScriptFunction> create(Engine& engine,
                                                FunctionDeclarationPtr declaration,
                                                std::shared_ptr<EnvironmentRecord> scope,
                                                bool strict);

  ScriptFunction(Engine& engine, FunctionDeclarationPtr declaration,
                 std::shared_ptr<EnvironmentRecord> scope, bool strict);

  bool isConstructor() const override { return true; }
  bool isStrict() const override { return strict_; }

  Value call(const Value& thisArg, const std::vector<Value>& args) override;
  std::shared_ptr<Object> construct(const std::vector<Value>& args,
                                    std::shared_ptr<Object> newTarget = nullptr) override;

  // Runs the body and returns its completion as is, without converting
  // throw completions to exceptions.
  Completion callWithCompletion(const Value& thisArg, const std::vector<Value>& args);

  const FunctionDeclaration& declaration() const { return *declaration_; }
  const std::shared_ptr<EnvironmentRecord>& scope() const { return scope_; }

private:
  Value resolveThisBinding(const Value& thisArg) const;
  void instantiateDeclarations(const std::shared_ptr<DeclarativeEnvironment>& env,
                               const std::vector<Value>& args);
  bool hasDuplicateParameters() const;

  FunctionDeclarationPtr declaration_;
  std::shared_ptr<EnvironmentRecord> scope_;
  bool strict_;
};

using NativeCallback =
    std::function<Value(Engine& engine, const Value& thisArg, const std::vector<Value>& args)>;
using NativeConstructCallback = std::function<std::shared_ptr<Object>(
    Engine& engine, const std::vector<Value>& args, std::shared_ptr<Object> newTarget)>;

// Host-implemented function. `this` is passed through unchanged.
class NativeFunction : public Function {
public:
  NativeFunction(Engine& engine, std::shared_ptr<Object> prototype, const std::string& name,
                 uint32_t length, NativeCallback callback,
                 NativeConstructCallback constructCallback = nullptr);

  bool isConstructor() const override { return static_cast<bool>(constructCallback_); }
  bool isStrict() const override { return true; }

  Value call(const Value& thisArg, const std::vector<Value>& args) override;
  std::shared_ptr<Object> construct(const std::vector<Value>& args,
                                    std::shared_ptr<Object> newTarget = nullptr) override;

private:
  NativeCallback callback_;
  NativeConstructCallback constructCallback_;
};

class BoundFunction : public Function {
public:
  static std::shared_ptr<BoundFunction> create(Engine& engine, FunctionPtr target,
                                               Value boundThis, std::vector<Value> boundArgs);

  BoundFunction(Engine& engine, FunctionPtr target, Value boundThis,
                std::vector<Value> boundArgs);

  bool isConstructor() const override { return target_->isConstructor(); }
  bool isStrict() const override { return target_->isStrict(); }

  Value call(const Value& thisArg, const std::vector<Value>& args) override;
  std::shared_ptr<Object> construct(const std::vector<Value>& args,
                                    std::shared_ptr<Object> newTarget = nullptr) override;

  const FunctionPtr& target() const { return target_; }

private:
  std::vector<Value> prependBoundArgs(const std::vector<Value>& args) const;

  FunctionPtr target_;
  Value boundThis_;
  std::vector<Value> boundArgs_;
};

}  // namespace kernjs
