#include "kernjs/error_formatter.h"
#include <sstream>

namespace kernjs {

std::string StackFrame::toString() const {
  std::ostringstream oss;
  oss << "  at " << (functionName.empty() ? "<anonymous>" : functionName);
  return oss.str();
}

std::string ErrorFormatter::formatError(const std::string& errorType, const std::string& message,
                                        const std::vector<StackFrame>& stackTrace) {
  std::ostringstream oss;
  oss << errorType;
  if (!message.empty()) {
    oss << ": " << message;
  }
  oss << formatStackTrace(stackTrace);
  return oss.str();
}

std::string ErrorFormatter::formatStackTrace(const std::vector<StackFrame>& stackTrace) {
  std::ostringstream oss;
  for (const auto& frame : stackTrace) {
    oss << "\n" << frame.toString();
  }
  return oss.str();
}

}  // namespace kernjs
