#pragma once

#include <exception>
#include <string>
#include <vector>
#include "error_formatter.h"
#include "object.h"

namespace kernjs {

enum class ErrorType {
  Error,
  TypeError,
  ReferenceError,
  RangeError,
  SyntaxError,
  URIError,
  EvalError
};

constexpr size_t kErrorTypeCount = 7;

const char* errorTypeName(ErrorType type);

/**
 * Error instance. The message is an own, non-enumerable property; the name
 * is inherited from the prototype of the error's type.
 */
class ErrorObject : public Object {
public:
  ErrorObject(Engine& engine, ErrorType type, std::shared_ptr<Object> prototype);

  const char* className() const override { return "Error"; }

  ErrorType errorType() const { return type_; }

  // "name" and "message" as currently visible through the prototype chain.
  std::string name();
  std::string message();

  const std::vector<StackFrame>& stackTrace() const { return stackTrace_; }
  // Records the trace and mirrors it into a non-enumerable "stack" property.
  void setStackTrace(std::vector<StackFrame> frames);

private:
  ErrorType type_;
  std::vector<StackFrame> stackTrace_;
};

/**
 * A thrown script value crossing C++ frames. Engine-raised errors carry an
 * ErrorObject, but a body may throw any value.
 */
class JsException : public std::exception {
public:
  explicit JsException(Value value);

  const Value& value() const noexcept { return value_; }
  const char* what() const noexcept override { return what_.c_str(); }

private:
  Value value_;
  std::string what_;
};

}  // namespace kernjs
