#include "kernjs/symbols.h"

namespace kernjs {

const Symbol& WellKnownSymbols::iterator() {
  static const Symbol symbolIterator("Symbol.iterator");
  return symbolIterator;
}

const Symbol& WellKnownSymbols::toStringTag() {
  static const Symbol symbolToStringTag("Symbol.toStringTag");
  return symbolToStringTag;
}

}  // namespace kernjs
