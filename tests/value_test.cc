#include "kernjs/kernjs.h"
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using namespace kernjs;

void testNumberToString() {
  std::cout << "Test: Number to string" << std::endl;

  assert(numberToString(0.000001) == "0.000001");
  assert(numberToString(1e-7) == "1e-7");
  assert(numberToString(1e21) == "1e+21");
  assert(numberToString(1e20) == "100000000000000000000");
  assert(numberToString(-0.0) == "0");
  assert(numberToString(123.456) == "123.456");
  assert(numberToString(-42) == "-42");
  assert(numberToString(std::numeric_limits<double>::quiet_NaN()) == "NaN");
  assert(numberToString(-std::numeric_limits<double>::infinity()) == "-Infinity");

  std::cout << "  PASSED" << std::endl;
}

void testStringToNumber() {
  std::cout << "Test: String to number" << std::endl;

  assert(stringToNumber("  42  ") == 42);
  assert(stringToNumber("") == 0);
  assert(stringToNumber("0x1F") == 31);
  assert(stringToNumber("1e3") == 1000);
  assert(std::isnan(stringToNumber("12px")));
  assert(std::isinf(stringToNumber("-Infinity")));

  std::cout << "  PASSED" << std::endl;
}

void testIntegerConversions() {
  std::cout << "Test: ToUint32" << std::endl;

  assert(toUint32(-1) == 4294967295u);
  assert(toUint32(4294967296.0) == 0);
  assert(toUint32(3.9) == 3);
  assert(toUint32(std::numeric_limits<double>::quiet_NaN()) == 0);

  std::cout << "  PASSED" << std::endl;
}

void testSameValue() {
  std::cout << "Test: SameValue and strict equality" << std::endl;

  double nan = std::numeric_limits<double>::quiet_NaN();
  assert(sameValue(Value(nan), Value(nan)));
  assert(!strictEquals(Value(nan), Value(nan)));
  assert(!sameValue(Value(0.0), Value(-0.0)));
  assert(strictEquals(Value("abc"), Value(std::string("abc"))));
  assert(!strictEquals(Value(1), Value("1")));

  Symbol a("tag");
  Symbol b("tag");
  assert(sameValue(Value(a), Value(a)));
  assert(!sameValue(Value(a), Value(b)));

  assert(strictEquals(Value(BigInt(7)), Value(BigInt(7))));

  std::cout << "  PASSED" << std::endl;
}

void testPrimitiveCoercions() {
  std::cout << "Test: Primitive coercions" << std::endl;

  assert(!Value().toBool());
  assert(!Value(Null{}).toBool());
  assert(!Value("").toBool());
  assert(Value("0").toBool());
  assert(!Value(BigInt(0)).toBool());
  assert(std::isnan(Value().toNumber()));
  assert(Value(Null{}).toNumber() == 0);
  assert(Value(true).isBool());
  assert(Value(true).toNumber() == 1);
  assert(Value(false).toString() == "false");
  assert(Value(BigInt(42)).toDisplayString() == "42n");
  assert(Value("hi").toDisplayString() == "\"hi\"");
  assert(std::string(typeName(Value(Symbol()).type())) == "symbol");

  bigint::BigIntValue big("123456789012345678901234567890");
  assert(Value(BigInt(big)).toDisplayString() == "123456789012345678901234567890n");

  std::cout << "  PASSED" << std::endl;
}

void testPropertyKeys() {
  std::cout << "Test: Property keys" << std::endl;

  assert(PropertyKey::fromNumber(0.000001) == PropertyKey("0.000001"));
  assert(PropertyKey::fromNumber(-0.0) == PropertyKey("0"));
  assert(PropertyKey::fromNumber(1e21).name() == "1e+21");

  assert(PropertyKey("0").arrayIndex() == 0u);
  assert(PropertyKey("4294967294").isArrayIndex());
  assert(!PropertyKey("4294967295").isArrayIndex());
  assert(!PropertyKey("01").isArrayIndex());
  assert(!PropertyKey("-1").isArrayIndex());
  assert(!PropertyKey("1.5").isArrayIndex());

  Symbol sym("key");
  PropertyKey symbolKey(sym);
  assert(symbolKey.isSymbol());
  assert(!symbolKey.isArrayIndex());
  assert(symbolKey != PropertyKey("key"));
  assert(symbolKey.toDisplayString() == "Symbol(key)");

  std::cout << "  PASSED" << std::endl;
}

int main() {
  std::cout << "=== Value Tests ===" << std::endl << std::endl;

  testNumberToString();
  testStringToNumber();
  testIntegerConversions();
  testSameValue();
  testPrimitiveCoercions();
  testPropertyKeys();

  std::cout << std::endl << "All value tests passed!" << std::endl;
  return 0;
}
