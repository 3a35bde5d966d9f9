#pragma once

/**
 * @file kernjs.h
 * @brief kernjs - C++20 ECMAScript runtime core
 *
 * Convenience header that includes all public kernjs APIs.
 *
 * @example
 * ```cpp
 * #include <kernjs/kernjs.h>
 *
 * int main() {
 *   kernjs::Engine engine;
 *
 *   // function add(a, b) { return a + b; }
 *   auto decl = std::make_shared<kernjs::FunctionDeclaration>();
 *   decl->name = "add";
 *   decl->parameterNames = {"a", "b"};
 *   decl->body = [](kernjs::Engine& e) {
 *     double sum = e.toNumber(e.getIdentifierValue("a")) +
 *                  e.toNumber(e.getIdentifierValue("b"));
 *     return kernjs::Completion::returnValue(sum);
 *   };
 *
 *   auto add = engine.createFunction(decl, engine.globalEnvironment(), false);
 *   kernjs::Value result = add->call(kernjs::Value(), {40, 2});
 *   std::cout << result.toString() << std::endl; // Output: 42
 *   return 0;
 * }
 * ```
 */

#include "value.h"
#include "bigint.h"
#include "symbols.h"
#include "property_key.h"
#include "property_descriptor.h"
#include "property_storage.h"
#include "object.h"
#include "array_object.h"
#include "arguments_object.h"
#include "primitive_object.h"
#include "error.h"
#include "error_formatter.h"
#include "completion.h"
#include "environment.h"
#include "execution_context.h"
#include "function_declaration.h"
#include "function.h"
#include "iterator.h"
#include "object_methods.h"
#include "engine.h"

#define KERNJS_VERSION_MAJOR 0
#define KERNJS_VERSION_MINOR 1
#define KERNJS_VERSION_PATCH 0
#define KERNJS_VERSION_STRING "0.1.0"

/**
 * @namespace kernjs
 * @brief Main namespace for kernjs
 */
namespace kernjs {

/**
 * @brief Get kernjs version string
 * @return Version string in format "MAJOR.MINOR.PATCH"
 */
inline const char* version() {
  return KERNJS_VERSION_STRING;
}

inline int version_major() {
  return KERNJS_VERSION_MAJOR;
}

inline int version_minor() {
  return KERNJS_VERSION_MINOR;
}

inline int version_patch() {
  return KERNJS_VERSION_PATCH;
}

}  // namespace kernjs
