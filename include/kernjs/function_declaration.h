#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "completion.h"

namespace kernjs {

class Engine;

// Compiled body supplied by the front end. It reads bindings and `this`
// through the engine's running execution context.
using FunctionBody = std::function<Completion(Engine& engine)>;

struct FunctionDeclaration {
  std::string name;
  std::vector<std::string> parameterNames;
  // Nested function declarations, in source order.
  std::vector<std::shared_ptr<const FunctionDeclaration>> functionDeclarations;
  std::vector<std::string> varNames;
  bool strict = false;
  FunctionBody body;
};

using FunctionDeclarationPtr = std::shared_ptr<const FunctionDeclaration>;

// Top-level code: like a function without parameters, run against the
// global environment.
struct Script {
  std::vector<FunctionDeclarationPtr> functionDeclarations;
  std::vector<std::string> varNames;
  bool strict = false;
  FunctionBody body;
};

}  // namespace kernjs
