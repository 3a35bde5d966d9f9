#include "kernjs/error.h"
#include "kernjs/engine.h"

namespace kernjs {

namespace {

// Own string-valued data property, without running accessors.
std::string ownStringProperty(const Object& object, const char* name) {
  auto desc = object.getOwnProperty(name);
  if (desc && desc->isDataDescriptor() && desc->value().isString()) {
    return desc->value().asString();
  }
  return {};
}

}  // namespace

const char* errorTypeName(ErrorType type) {
  switch (type) {
    case ErrorType::Error: return "Error";
    case ErrorType::TypeError: return "TypeError";
    case ErrorType::ReferenceError: return "ReferenceError";
    case ErrorType::RangeError: return "RangeError";
    case ErrorType::SyntaxError: return "SyntaxError";
    case ErrorType::URIError: return "URIError";
    case ErrorType::EvalError: return "EvalError";
  }
  return "Error";
}

ErrorObject::ErrorObject(Engine& engine, ErrorType type, std::shared_ptr<Object> prototype)
  : Object(engine, std::move(prototype)), type_(type) {}

std::string ErrorObject::name() {
  Value name = get("name");
  return name.isUndefined() ? std::string(errorTypeName(type_)) : engine_.toString(name);
}

std::string ErrorObject::message() {
  Value message = get("message");
  return message.isUndefined() ? std::string() : engine_.toString(message);
}

void ErrorObject::setStackTrace(std::vector<StackFrame> frames) {
  stackTrace_ = std::move(frames);
  std::string stack = ErrorFormatter::formatError(errorTypeName(type_),
                                                  ownStringProperty(*this, "message"),
                                                  stackTrace_);
  fastAddProperty("stack", Value(std::move(stack)), PropertyFlag::NonEnumerable);
}

JsException::JsException(Value value) : value_(std::move(value)) {
  if (auto error = value_.tryCast<ErrorObject>()) {
    what_ = errorTypeName(error->errorType());
    std::string message = ownStringProperty(*error, "message");
    if (!message.empty()) {
      what_ += ": " + message;
    }
  } else {
    what_ = "Uncaught " + value_.toDisplayString();
  }
}

}  // namespace kernjs
