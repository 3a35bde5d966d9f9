#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <string>

namespace kernjs::bigint {

using BigIntValue = boost::multiprecision::cpp_int;

inline int digitValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'z') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'Z') return 10 + (c - 'A');
  return -1;
}

inline std::string toString(const BigIntValue& value) {
  if (value == 0) {
    return "0";
  }
  return value.convert_to<std::string>();
}

inline double toDouble(const BigIntValue& value) {
  return value.convert_to<double>();
}

}  // namespace kernjs::bigint
