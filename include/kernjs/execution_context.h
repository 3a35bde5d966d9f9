#pragma once

#include <memory>
#include <vector>
#include "environment.h"
#include "value.h"

namespace kernjs {

class Engine;
class Function;

struct ExecutionContext {
  std::shared_ptr<EnvironmentRecord> variableEnvironment;
  std::shared_ptr<EnvironmentRecord> lexicalEnvironment;
  Value thisBinding;
  std::shared_ptr<Function> function;  // nullptr for global code
  bool strict = false;
};

class ExecutionContextStack {
public:
  void push(ExecutionContext context) { contexts_.push_back(std::move(context)); }
  void pop();
  // Pops down to `depth` entries; no-op when already at or below it.
  void unwindTo(size_t depth) noexcept;

  ExecutionContext& top() { return contexts_.back(); }
  const ExecutionContext& top() const { return contexts_.back(); }

  size_t depth() const { return contexts_.size(); }
  bool empty() const { return contexts_.empty(); }

  // Bottom (global) first.
  const std::vector<ExecutionContext>& contexts() const { return contexts_; }

private:
  std::vector<ExecutionContext> contexts_;
};

/**
 * RAII helper pairing Engine::enterExecutionContext with a pop back to the
 * depth below the entered context. The pop runs on every exit path and
 * never throws, even if the context was already popped.
 */
class ExecutionContextScope {
public:
  ExecutionContextScope(Engine& engine, ExecutionContext context);
  ~ExecutionContextScope();

  // Non-copyable
  ExecutionContextScope(const ExecutionContextScope&) = delete;
  ExecutionContextScope& operator=(const ExecutionContextScope&) = delete;

private:
  Engine& engine_;
  size_t depth_;
};

}  // namespace kernjs
