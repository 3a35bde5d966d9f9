#pragma once

#include <array>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "array_object.h"
#include "completion.h"
#include "environment.h"
#include "error.h"
#include "execution_context.h"
#include "function.h"
#include "function_declaration.h"
#include "iterator.h"
#include "object.h"
#include "property_key.h"
#include "value.h"

namespace kernjs {

struct EngineOptions {
  bool strict = false;              // Strictness of global code
  size_t maxCallDepth = 2000;       // Execution contexts, global one included
  bool captureStackTraces = true;   // Record a stack on every new error
};

enum class PreferredType { Default, Number, String };

/**
 * @brief One isolated runtime: intrinsics, global object and the
 * execution-context stack.
 *
 * The global execution context is pushed on construction and stays at the
 * bottom of the stack for the engine's lifetime.
 */
class Engine {
public:
  explicit Engine(EngineOptions options = {});
  ~Engine();

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  const EngineOptions& options() const { return options_; }

  // Intrinsics
  const std::shared_ptr<Object>& objectPrototype() const { return objectPrototype_; }
  const std::shared_ptr<Function>& functionPrototype() const { return functionPrototype_; }
  const std::shared_ptr<Object>& arrayPrototype() const { return arrayPrototype_; }
  const std::shared_ptr<Object>& errorPrototype(ErrorType type) const;
  const std::shared_ptr<Object>& booleanPrototype() const { return booleanPrototype_; }
  const std::shared_ptr<Object>& numberPrototype() const { return numberPrototype_; }
  const std::shared_ptr<Object>& stringPrototype() const { return stringPrototype_; }
  const std::shared_ptr<Object>& symbolPrototype() const { return symbolPrototype_; }
  const std::shared_ptr<Object>& bigintPrototype() const { return bigintPrototype_; }
  const std::shared_ptr<IteratorPrototype>& iteratorPrototype() const { return iteratorPrototype_; }
  const std::shared_ptr<IteratorPrototype>& arrayIteratorPrototype() const {
    return arrayIteratorPrototype_;
  }
  // %ThrowTypeError%, shared by every poisoned accessor.
  const std::shared_ptr<Function>& throwTypeErrorFunction() const { return throwTypeError_; }

  const std::shared_ptr<Object>& globalObject() const { return globalObject_; }
  const std::shared_ptr<ObjectEnvironment>& globalEnvironment() const { return globalEnv_; }

  // Execution contexts
  ExecutionContextStack& contextStack() { return contexts_; }
  const ExecutionContextStack& contextStack() const { return contexts_; }
  const ExecutionContext& runningContext() const { return contexts_.top(); }
  // Raises RangeError, leaving the stack untouched, past maxCallDepth.
  void enterExecutionContext(ExecutionContext context);
  void leaveExecutionContext();
  Value thisValue() const { return contexts_.top().thisBinding; }
  bool isStrict() const { return contexts_.top().strict; }

  // Conversions
  Value toPrimitive(const Value& value, PreferredType hint = PreferredType::Default);
  double toNumber(const Value& value);
  std::string toString(const Value& value);
  std::shared_ptr<Object> toObject(const Value& value);
  PropertyKey toPropertyKey(const Value& value);
  uint32_t toUint32(const Value& value);

  // Allocation
  std::shared_ptr<Object> createObject();
  std::shared_ptr<Object> createObject(std::shared_ptr<Object> prototype);
  std::shared_ptr<ArrayObject> createArray(const std::vector<Value>& elements = {});
  std::shared_ptr<ScriptFunction> createFunction(FunctionDeclarationPtr declaration,
                                                 std::shared_ptr<EnvironmentRecord> scope,
                                                 bool strict);
  std::shared_ptr<NativeFunction> createNativeFunction(const std::string& name, uint32_t length,
                                                       NativeCallback callback,
                                                       NativeConstructCallback construct = nullptr);
  std::shared_ptr<ErrorObject> createError(ErrorType type, const std::string& message);
  std::shared_ptr<Object> createIterResultObject(const Value& value, bool done);
  std::shared_ptr<ListIterator> createListIterator(std::vector<Value> values);
  std::shared_ptr<ArrayIterator> createArrayIterator(std::shared_ptr<Object> iterated,
                                                     ArrayIterationKind kind);

  // Error raising. Every helper throws JsException carrying a new error.
  [[noreturn]] void throwError(ErrorType type, const std::string& message);
  [[noreturn]] void throwTypeError(const std::string& message);
  [[noreturn]] void throwRangeError(const std::string& message);
  [[noreturn]] void throwReferenceError(const std::string& message);

  // Identifier resolution against the running lexical environment.
  // resolveBinding returns nullptr for unresolvable names.
  std::shared_ptr<EnvironmentRecord> resolveBinding(const std::string& name) const;
  Value getIdentifierValue(const std::string& name);
  void putIdentifierValue(const std::string& name, const Value& value);

  // Global declaration instantiation, then the script body in global scope.
  Value execute(const Script& script);

  std::vector<StackFrame> captureStackTrace() const;
  // Prints an uncaught exception with its stack trace.
  void reportException(const JsException& exception, std::ostream& out = std::cerr) const;

private:
  void createIntrinsics();
  void installGlobals();

  EngineOptions options_;
  ExecutionContextStack contexts_;

  std::shared_ptr<Object> objectPrototype_;
  std::shared_ptr<Function> functionPrototype_;
  std::shared_ptr<Object> arrayPrototype_;
  std::array<std::shared_ptr<Object>, kErrorTypeCount> errorPrototypes_;
  std::shared_ptr<Object> booleanPrototype_;
  std::shared_ptr<Object> numberPrototype_;
  std::shared_ptr<Object> stringPrototype_;
  std::shared_ptr<Object> symbolPrototype_;
  std::shared_ptr<Object> bigintPrototype_;
  std::shared_ptr<IteratorPrototype> iteratorPrototype_;
  std::shared_ptr<IteratorPrototype> arrayIteratorPrototype_;
  std::shared_ptr<Function> throwTypeError_;

  std::shared_ptr<Object> globalObject_;
  std::shared_ptr<ObjectEnvironment> globalEnv_;
};

}  // namespace kernjs
