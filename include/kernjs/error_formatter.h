#pragma once

#include <string>
#include <vector>

namespace kernjs {

/**
 * One entry of a captured stack trace, innermost first.
 */
struct StackFrame {
  std::string functionName;  // Function name, "<anonymous>" or "<global>"

  StackFrame() = default;
  explicit StackFrame(std::string fn) : functionName(std::move(fn)) {}

  // Format as "  at functionName"
  std::string toString() const;
};

/**
 * Renders uncaught errors for diagnostics.
 */
class ErrorFormatter {
public:
  /**
   * Format an error with its stack trace.
   *
   * Example output:
   * ```
   * TypeError: Cannot redefine property: foo
   *   at inner
   *   at outer
   *   at <global>
   * ```
   */
  static std::string formatError(const std::string& errorType, const std::string& message,
                                 const std::vector<StackFrame>& stackTrace);

  // Only the trace lines, one per frame.
  static std::string formatStackTrace(const std::vector<StackFrame>& stackTrace);
};

}  // namespace kernjs
