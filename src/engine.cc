#include "kernjs/engine.h"
#include "kernjs/object_methods.h"
#include "kernjs/primitive_object.h"
#include "kernjs/symbols.h"
#include <limits>
#include <stdexcept>
#include <utility>

namespace kernjs {

Engine::Engine(EngineOptions options) : options_(options) {
  createIntrinsics();

  globalObject_ = std::make_shared<Object>(*this, objectPrototype_);
  globalEnv_ = std::make_shared<ObjectEnvironment>(*this, globalObject_, nullptr);
  contexts_.push(ExecutionContext{globalEnv_, globalEnv_, Value(globalObject_), nullptr,
                                  options_.strict});

  installGlobals();
}

Engine::~Engine() = default;

void Engine::createIntrinsics() {
  objectPrototype_ = std::make_shared<Object>(*this, nullptr);

  // Function.prototype is itself callable and ignores its arguments.
  functionPrototype_ = std::make_shared<NativeFunction>(
      *this, objectPrototype_, "", 0,
      [](Engine&, const Value&, const std::vector<Value>&) { return Value(); });

  throwTypeError_ = std::make_shared<NativeFunction>(
      *this, functionPrototype_, "", 0,
      [](Engine& engine, const Value&, const std::vector<Value>&) -> Value {
        engine.throwTypeError(
            "'caller', 'callee', and 'arguments' properties may not be accessed on strict mode "
            "functions or the arguments objects for calls to them");
      });
  throwTypeError_->preventExtensions();

  arrayPrototype_ = std::make_shared<ArrayObject>(*this, objectPrototype_);

  for (size_t i = 0; i < kErrorTypeCount; ++i) {
    auto type = static_cast<ErrorType>(i);
    auto parent = type == ErrorType::Error ? objectPrototype_ : errorPrototypes_[0];
    auto proto = std::make_shared<Object>(*this, parent);
    proto->fastAddProperty("name", Value(errorTypeName(type)), PropertyFlag::NonEnumerable);
    proto->fastAddProperty("message", Value(""), PropertyFlag::NonEnumerable);
    errorPrototypes_[i] = std::move(proto);
  }

  booleanPrototype_ = std::make_shared<BooleanObject>(*this, objectPrototype_, Value(false));
  numberPrototype_ = std::make_shared<NumberObject>(*this, objectPrototype_, Value(0));
  stringPrototype_ = std::make_shared<StringObject>(*this, objectPrototype_, "");
  symbolPrototype_ = std::make_shared<Object>(*this, objectPrototype_);
  bigintPrototype_ = std::make_shared<Object>(*this, objectPrototype_);

  iteratorPrototype_ = IteratorPrototype::create(*this, objectPrototype_, std::nullopt);
  arrayIteratorPrototype_ = IteratorPrototype::create(*this, iteratorPrototype_, "Array Iterator");
}

void Engine::installGlobals() {
  globalObject_->fastAddProperty("undefined", Value(), PropertyFlag::None);
  globalObject_->fastAddProperty("NaN", Value(std::numeric_limits<double>::quiet_NaN()),
                                 PropertyFlag::None);
  globalObject_->fastAddProperty("Infinity", Value(std::numeric_limits<double>::infinity()),
                                 PropertyFlag::None);

  installObjectBuiltins(*this);

  auto iterationMethod = [this](const std::string& name, ArrayIterationKind kind) {
    return createNativeFunction(name, 0,
        [kind](Engine& engine, const Value& thisArg, const std::vector<Value>&) {
          return Value(engine.createArrayIterator(engine.toObject(thisArg), kind));
        });
  };
  auto values = iterationMethod("values", ArrayIterationKind::Values);
  arrayPrototype_->fastAddProperty("keys", Value(iterationMethod("keys", ArrayIterationKind::Keys)),
                                   PropertyFlag::NonEnumerable);
  arrayPrototype_->fastAddProperty("values", Value(values), PropertyFlag::NonEnumerable);
  arrayPrototype_->fastAddProperty("entries",
                                   Value(iterationMethod("entries", ArrayIterationKind::Entries)),
                                   PropertyFlag::NonEnumerable);
  arrayPrototype_->fastAddProperty(WellKnownSymbols::iterator(), Value(values),
                                   PropertyFlag::NonEnumerable);
}

const std::shared_ptr<Object>& Engine::errorPrototype(ErrorType type) const {
  return errorPrototypes_[static_cast<size_t>(type)];
}

// Execution contexts

void Engine::enterExecutionContext(ExecutionContext context) {
  if (contexts_.depth() >= options_.maxCallDepth) {
    throwRangeError("Maximum call stack size exceeded");
  }
  contexts_.push(std::move(context));
}

void Engine::leaveExecutionContext() {
  contexts_.pop();
}

// Conversions

Value Engine::toPrimitive(const Value& value, PreferredType hint) {
  if (!value.isObject()) {
    return value;
  }
  const auto& obj = value.asObject();
  const char* order[2] = {"valueOf", "toString"};
  if (hint == PreferredType::String) {
    std::swap(order[0], order[1]);
  }
  for (const char* methodName : order) {
    if (auto method = obj->get(methodName).tryCast<Function>()) {
      Value result = method->call(value, {});
      if (result.isPrimitive()) {
        return result;
      }
    }
  }
  throwTypeError("Cannot convert object to primitive value");
}

double Engine::toNumber(const Value& value) {
  if (value.isObject()) {
    return toNumber(toPrimitive(value, PreferredType::Number));
  }
  if (value.isSymbol()) {
    throwTypeError("Cannot convert a Symbol value to a number");
  }
  if (value.isBigInt()) {
    throwTypeError("Cannot convert a BigInt value to a number");
  }
  return value.toNumber();
}

std::string Engine::toString(const Value& value) {
  if (value.isObject()) {
    return toString(toPrimitive(value, PreferredType::String));
  }
  if (value.isSymbol()) {
    throwTypeError("Cannot convert a Symbol value to a string");
  }
  return value.toString();
}

std::shared_ptr<Object> Engine::toObject(const Value& value) {
  switch (value.type()) {
    case ValueType::Undefined:
    case ValueType::Null:
      throwTypeError("Cannot convert undefined or null to object");
    case ValueType::Boolean:
      return std::make_shared<BooleanObject>(*this, booleanPrototype_, value);
    case ValueType::Number:
      return std::make_shared<NumberObject>(*this, numberPrototype_, value);
    case ValueType::BigInt:
      return std::make_shared<BigIntObject>(*this, bigintPrototype_, value);
    case ValueType::Symbol:
      return std::make_shared<SymbolObject>(*this, symbolPrototype_, value);
    case ValueType::String:
      return std::make_shared<StringObject>(*this, stringPrototype_, value.asString());
    case ValueType::Object:
      return value.asObject();
  }
  throwTypeError("Cannot convert value to object");
}

PropertyKey Engine::toPropertyKey(const Value& value) {
  Value key = toPrimitive(value, PreferredType::String);
  if (key.isSymbol()) {
    return PropertyKey(key.asSymbol());
  }
  if (key.isNumber()) {
    return PropertyKey::fromNumber(key.asNumber());
  }
  return PropertyKey(toString(key));
}

uint32_t Engine::toUint32(const Value& value) {
  return kernjs::toUint32(toNumber(value));
}

// Allocation

std::shared_ptr<Object> Engine::createObject() {
  return std::make_shared<Object>(*this, objectPrototype_);
}

std::shared_ptr<Object> Engine::createObject(std::shared_ptr<Object> prototype) {
  return std::make_shared<Object>(*this, std::move(prototype));
}

std::shared_ptr<ArrayObject> Engine::createArray(const std::vector<Value>& elements) {
  auto array = std::make_shared<ArrayObject>(*this, arrayPrototype_);
  for (size_t i = 0; i < elements.size(); ++i) {
    array->createDataPropertyOrThrow(PropertyKey::fromIndex(static_cast<uint32_t>(i)), elements[i]);
  }
  return array;
}

std::shared_ptr<ScriptFunction> Engine::createFunction(FunctionDeclarationPtr declaration,
                                                       std::shared_ptr<EnvironmentRecord> scope,
                                                       bool strict) {
  return ScriptFunction::create(*this, std::move(declaration), std::move(scope), strict);
}

std::shared_ptr<NativeFunction> Engine::createNativeFunction(const std::string& name,
                                                             uint32_t length,
                                                             NativeCallback callback,
                                                             NativeConstructCallback construct) {
  return std::make_shared<NativeFunction>(*this, functionPrototype_, name, length,
                                          std::move(callback), std::move(construct));
}

std::shared_ptr<ErrorObject> Engine::createError(ErrorType type, const std::string& message) {
  auto error = std::make_shared<ErrorObject>(*this, type, errorPrototype(type));
  if (!message.empty()) {
    error->fastAddProperty("message", Value(message), PropertyFlag::NonEnumerable);
  }
  if (options_.captureStackTraces) {
    error->setStackTrace(captureStackTrace());
  }
  return error;
}

std::shared_ptr<Object> Engine::createIterResultObject(const Value& value, bool done) {
  auto result = createObject();
  result->createDataPropertyOrThrow("value", value);
  result->createDataPropertyOrThrow("done", Value(done));
  return result;
}

std::shared_ptr<ListIterator> Engine::createListIterator(std::vector<Value> values) {
  return std::make_shared<ListIterator>(*this, iteratorPrototype_, std::move(values));
}

std::shared_ptr<ArrayIterator> Engine::createArrayIterator(std::shared_ptr<Object> iterated,
                                                           ArrayIterationKind kind) {
  return std::make_shared<ArrayIterator>(*this, arrayIteratorPrototype_, std::move(iterated), kind);
}

// Errors

void Engine::throwError(ErrorType type, const std::string& message) {
  throw JsException(Value(createError(type, message)));
}

void Engine::throwTypeError(const std::string& message) {
  throwError(ErrorType::TypeError, message);
}

void Engine::throwRangeError(const std::string& message) {
  throwError(ErrorType::RangeError, message);
}

void Engine::throwReferenceError(const std::string& message) {
  throwError(ErrorType::ReferenceError, message);
}

// Identifier resolution

std::shared_ptr<EnvironmentRecord> Engine::resolveBinding(const std::string& name) const {
  for (auto env = contexts_.top().lexicalEnvironment; env; env = env->outer()) {
    if (env->hasBinding(name)) {
      return env;
    }
  }
  return nullptr;
}

Value Engine::getIdentifierValue(const std::string& name) {
  auto env = resolveBinding(name);
  if (!env) {
    throwReferenceError(name + " is not defined");
  }
  return env->getBindingValue(name, isStrict());
}

void Engine::putIdentifierValue(const std::string& name, const Value& value) {
  auto env = resolveBinding(name);
  if (env) {
    env->setMutableBinding(name, value, isStrict());
    return;
  }
  if (isStrict()) {
    throwReferenceError(name + " is not defined");
  }
  globalObject_->put(name, value, false);
}

// Script execution

Value Engine::execute(const Script& script) {
  bool strict = options_.strict || script.strict;
  ExecutionContextScope scope(*this, ExecutionContext{globalEnv_, globalEnv_, Value(globalObject_),
                                                      nullptr, strict});

  for (const auto& fd : script.functionDeclarations) {
    auto fn = createFunction(fd, globalEnv_, strict || fd->strict);
    auto existing = globalObject_->getOwnProperty(fd->name);
    if (!existing) {
      globalEnv_->createMutableBinding(fd->name, false);
    } else if (existing->configurable()) {
      globalObject_->defineOwnProperty(fd->name, PropertyDescriptor::data(Value(), true, true, false),
                                       true);
    } else if (existing->isAccessorDescriptor() ||
               !(existing->writable() && existing->enumerable())) {
      throwTypeError("Cannot redefine global function '" + fd->name + "'");
    }
    globalEnv_->setMutableBinding(fd->name, Value(fn), strict);
  }

  for (const auto& name : script.varNames) {
    if (!globalEnv_->hasBinding(name)) {
      globalEnv_->createMutableBinding(name, false);
    }
  }

  if (!script.body) {
    return Value();
  }
  Completion completion = script.body(*this);
  switch (completion.type) {
    case CompletionType::Throw:
      throw JsException(completion.value);
    case CompletionType::Normal:
    case CompletionType::Return:
      return completion.value;
    case CompletionType::Break:
    case CompletionType::Continue:
      break;
  }
  throw std::logic_error(std::string("Unresolved ") + completionTypeName(completion.type) +
                         " completion escaped global code");
}

// Diagnostics

std::vector<StackFrame> Engine::captureStackTrace() const {
  std::vector<StackFrame> frames;
  const auto& contexts = contexts_.contexts();
  // Global code may be entered more than once (engine setup, execute());
  // it is reported as a single bottom frame.
  for (auto it = contexts.rbegin(); it != contexts.rend(); ++it) {
    if (!it->function) {
      continue;
    }
    std::string name = it->function->name();
    frames.emplace_back(name.empty() ? "<anonymous>" : name);
  }
  frames.emplace_back("<global>");
  return frames;
}

void Engine::reportException(const JsException& exception, std::ostream& out) const {
  if (auto error = exception.value().tryCast<ErrorObject>()) {
    out << ErrorFormatter::formatError(error->name(), error->message(), error->stackTrace())
        << std::endl;
    return;
  }
  out << exception.what() << std::endl;
}

}  // namespace kernjs
