#include "kernjs/function.h"
#include "kernjs/arguments_object.h"
#include "kernjs/engine.h"
#include "kernjs/execution_context.h"
#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace kernjs {

// Function

Function::Function(Engine& engine, std::shared_ptr<Object> prototype,
                   std::unique_ptr<PropertyStorage> storage)
  : Object(engine, std::move(prototype), std::move(storage)) {}

std::shared_ptr<Object> Function::construct(const std::vector<Value>&, std::shared_ptr<Object>) {
  std::string fnName = name();
  engine_.throwTypeError((fnName.empty() ? std::string("anonymous") : fnName) +
                         " is not a constructor");
}

std::string Function::name() const {
  auto desc = getOwnProperty("name");
  if (desc && desc->isDataDescriptor() && desc->value().isString()) {
    return desc->value().asString();
  }
  return {};
}

uint32_t Function::length() const {
  auto desc = getOwnProperty("length");
  if (desc && desc->isDataDescriptor() && desc->value().isNumber()) {
    return toUint32(desc->value().asNumber());
  }
  return 0;
}

void Function::installNameAndLength(const std::string& name, uint32_t length) {
  fastAddProperty("length", Value(length), PropertyFlag::Configurable);
  fastAddProperty("name", Value(name), PropertyFlag::Configurable);
}

void Function::installPoisonedAccessors() {
  const auto& thrower = engine_.throwTypeErrorFunction();
  fastAddProperty("caller", PropertyDescriptor::accessor(thrower, thrower, false, false));
  fastAddProperty("arguments", PropertyDescriptor::accessor(thrower, thrower, false, false));
}

// ScriptFunction

std::shared_ptr<ScriptFunction> ScriptFunction::create(Engine& engine,
                                                       FunctionDeclarationPtr declaration,
                                                       std::shared_ptr<EnvironmentRecord> scope,
                                                       bool strict) {
  auto fn = std::make_shared<ScriptFunction>(engine, std::move(declaration), std::move(scope),
                                             strict);

  auto storage = std::make_unique<ConstructorSlotStorage>(
      "constructor", PropertyDescriptor(Value(fn), PropertyFlag::NonEnumerable));
  auto prototype = std::make_shared<Object>(engine, engine.objectPrototype(), std::move(storage));
  fn->fastAddProperty("prototype", Value(prototype), PropertyFlag::OnlyWritable);
  return fn;
}

ScriptFunction::ScriptFunction(Engine& engine, FunctionDeclarationPtr declaration,
                               std::shared_ptr<EnvironmentRecord> scope, bool strict)
  : Function(engine, engine.functionPrototype()),
    declaration_(std::move(declaration)),
    scope_(std::move(scope)),
    strict_(strict || declaration_->strict) {
  installNameAndLength(declaration_->name,
                       static_cast<uint32_t>(declaration_->parameterNames.size()));
  if (strict_) {
    installPoisonedAccessors();
  }
}

Value ScriptFunction::call(const Value& thisArg, const std::vector<Value>& args) {
  Completion completion = callWithCompletion(thisArg, args);
  switch (completion.type) {
    case CompletionType::Throw:
      throw JsException(completion.value);
    case CompletionType::Return:
      return completion.value;
    case CompletionType::Normal:
      return Value();
    case CompletionType::Break:
    case CompletionType::Continue:
      break;
  }
  throw std::logic_error(std::string("Unresolved ") + completionTypeName(completion.type) +
                         " completion escaped function '" + declaration_->name + "'");
}

Completion ScriptFunction::callWithCompletion(const Value& thisArg,
                                              const std::vector<Value>& args) {
  Value thisBinding = resolveThisBinding(thisArg);
  auto env = std::make_shared<DeclarativeEnvironment>(engine_, scope_);
  auto self = std::static_pointer_cast<Function>(shared_from_this());

  ExecutionContextScope contextScope(engine_, ExecutionContext{env, env, thisBinding, self, strict_});
  instantiateDeclarations(env, args);
  if (!declaration_->body) {
    return Completion::normal();
  }
  return declaration_->body(engine_);
}

std::shared_ptr<Object> ScriptFunction::construct(const std::vector<Value>& args,
                                                  std::shared_ptr<Object> newTarget) {
  if (!newTarget) {
    newTarget = shared_from_this();
  }
  Value protoValue = newTarget->get("prototype");
  auto prototype = protoValue.isObject() ? protoValue.asObject() : engine_.objectPrototype();

  auto instance = engine_.createObject(prototype);
  Value result = call(Value(instance), args);
  if (result.isObject()) {
    return result.asObject();
  }
  return instance;
}

Value ScriptFunction::resolveThisBinding(const Value& thisArg) const {
  if (strict_) {
    return thisArg;
  }
  if (thisArg.isNullOrUndefined()) {
    return Value(engine_.globalObject());
  }
  if (thisArg.isPrimitive()) {
    return Value(engine_.toObject(thisArg));
  }
  return thisArg;
}

bool ScriptFunction::hasDuplicateParameters() const {
  std::unordered_set<std::string> seen;
  for (const auto& name : declaration_->parameterNames) {
    if (!seen.insert(name).second) {
      return true;
    }
  }
  return false;
}

void ScriptFunction::instantiateDeclarations(const std::shared_ptr<DeclarativeEnvironment>& env,
                                             const std::vector<Value>& args) {
  const auto& params = declaration_->parameterNames;
  const auto& functions = declaration_->functionDeclarations;

  // Parameters; a repeated name ends up holding the last matching argument.
  for (size_t i = 0; i < params.size(); ++i) {
    if (!env->hasBinding(params[i])) {
      env->createMutableBinding(params[i], false);
    }
    env->setMutableBinding(params[i], i < args.size() ? args[i] : Value(), strict_);
  }

  // arguments, unless a parameter or nested function already claims the name.
  bool argumentsDeclared =
      env->hasBinding("arguments") ||
      std::any_of(functions.begin(), functions.end(),
                  [](const FunctionDeclarationPtr& fd) { return fd->name == "arguments"; });
  if (!argumentsDeclared) {
    std::vector<std::string> mappedNames;
    if (!strict_ && !hasDuplicateParameters()) {
      mappedNames = params;
    }
    auto self = std::static_pointer_cast<Function>(shared_from_this());
    auto argumentsObject = ArgumentsObject::create(engine_, self, args, mappedNames, env, strict_);
    if (strict_) {
      env->createImmutableBinding("arguments", true);
      env->initializeBinding("arguments", Value(argumentsObject));
    } else {
      env->createMutableBinding("arguments", false);
      env->setMutableBinding("arguments", Value(argumentsObject), false);
    }
  }

  // Nested functions close over the new environment; later ones win.
  for (const auto& fd : functions) {
    auto fn = ScriptFunction::create(engine_, fd, env, strict_ || fd->strict);
    if (!env->hasBinding(fd->name)) {
      env->createMutableBinding(fd->name, false);
    }
    env->setMutableBinding(fd->name, Value(fn), strict_);
  }

  for (const auto& name : declaration_->varNames) {
    if (!env->hasBinding(name)) {
      env->createMutableBinding(name, false);
    }
  }
}

// NativeFunction

NativeFunction::NativeFunction(Engine& engine, std::shared_ptr<Object> prototype,
                               const std::string& name, uint32_t length, NativeCallback callback,
                               NativeConstructCallback constructCallback)
  : Function(engine, std::move(prototype)),
    callback_(std::move(callback)),
    constructCallback_(std::move(constructCallback)) {
  installNameAndLength(name, length);
}

Value NativeFunction::call(const Value& thisArg, const std::vector<Value>& args) {
  const auto& global = engine_.globalEnvironment();
  auto self = std::static_pointer_cast<Function>(shared_from_this());
  ExecutionContextScope contextScope(engine_, ExecutionContext{global, global, thisArg, self, true});
  return callback_(engine_, thisArg, args);
}

std::shared_ptr<Object> NativeFunction::construct(const std::vector<Value>& args,
                                                  std::shared_ptr<Object> newTarget) {
  if (!constructCallback_) {
    return Function::construct(args, newTarget);
  }
  const auto& global = engine_.globalEnvironment();
  auto self = std::static_pointer_cast<Function>(shared_from_this());
  if (!newTarget) {
    newTarget = self;
  }
  ExecutionContextScope contextScope(engine_, ExecutionContext{global, global, Value(), self, true});
  return constructCallback_(engine_, args, std::move(newTarget));
}

// BoundFunction

std::shared_ptr<BoundFunction> BoundFunction::create(Engine& engine, FunctionPtr target,
                                                     Value boundThis,
                                                     std::vector<Value> boundArgs) {
  return std::make_shared<BoundFunction>(engine, std::move(target), std::move(boundThis),
                                         std::move(boundArgs));
}

BoundFunction::BoundFunction(Engine& engine, FunctionPtr target, Value boundThis,
                             std::vector<Value> boundArgs)
  : Function(engine, target->getPrototypeOf()),
    target_(std::move(target)),
    boundThis_(std::move(boundThis)),
    boundArgs_(std::move(boundArgs)) {
  uint32_t targetLength = target_->length();
  uint32_t boundCount = static_cast<uint32_t>(boundArgs_.size());
  installNameAndLength("bound " + target_->name(),
                       targetLength > boundCount ? targetLength - boundCount : 0);
  installPoisonedAccessors();
}

std::vector<Value> BoundFunction::prependBoundArgs(const std::vector<Value>& args) const {
  std::vector<Value> combined;
  combined.reserve(boundArgs_.size() + args.size());
  combined.insert(combined.end(), boundArgs_.begin(), boundArgs_.end());
  combined.insert(combined.end(), args.begin(), args.end());
  return combined;
}

Value BoundFunction::call(const Value&, const std::vector<Value>& args) {
  return target_->call(boundThis_, prependBoundArgs(args));
}

std::shared_ptr<Object> BoundFunction::construct(const std::vector<Value>& args,
                                                 std::shared_ptr<Object> newTarget) {
  if (!target_->isConstructor()) {
    return Function::construct(args, newTarget);
  }
  if (!newTarget || newTarget == shared_from_this()) {
    newTarget = target_;
  }
  return target_->construct(prependBoundArgs(args), std::move(newTarget));
}

}  // namespace kernjs
