#pragma once

#include <string>
#include "value.h"

namespace kernjs {

enum class CompletionType { Normal, Return, Throw, Break, Continue };

inline const char* completionTypeName(CompletionType type) {
  switch (type) {
    case CompletionType::Normal: return "normal";
    case CompletionType::Return: return "return";
    case CompletionType::Throw: return "throw";
    case CompletionType::Break: return "break";
    case CompletionType::Continue: return "continue";
  }
  return "unknown";
}

// Outcome of running a body. target is only meaningful for break/continue.
struct Completion {
  CompletionType type = CompletionType::Normal;
  Value value;
  std::string target;

  static Completion normal(Value value = Value()) {
    return {CompletionType::Normal, std::move(value), {}};
  }
  static Completion returnValue(Value value = Value()) {
    return {CompletionType::Return, std::move(value), {}};
  }
  static Completion throwValue(Value value) {
    return {CompletionType::Throw, std::move(value), {}};
  }
  static Completion breakTo(std::string target = {}) {
    return {CompletionType::Break, Value(), std::move(target)};
  }
  static Completion continueTo(std::string target = {}) {
    return {CompletionType::Continue, Value(), std::move(target)};
  }

  bool isAbrupt() const { return type != CompletionType::Normal; }
};

}  // namespace kernjs
