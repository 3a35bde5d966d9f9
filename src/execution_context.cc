#include "kernjs/execution_context.h"
#include "kernjs/engine.h"
#include <stdexcept>

namespace kernjs {

void ExecutionContextStack::pop() {
  if (contexts_.empty()) {
    throw std::logic_error("Execution context stack underflow");
  }
  contexts_.pop_back();
}

void ExecutionContextStack::unwindTo(size_t depth) noexcept {
  while (contexts_.size() > depth) {
    contexts_.pop_back();
  }
}

ExecutionContextScope::ExecutionContextScope(Engine& engine, ExecutionContext context)
  : engine_(engine) {
  engine_.enterExecutionContext(std::move(context));
  depth_ = engine_.contextStack().depth();
}

ExecutionContextScope::~ExecutionContextScope() {
  engine_.contextStack().unwindTo(depth_ - 1);
}

}  // namespace kernjs
