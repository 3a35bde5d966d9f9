#pragma once

#include "value.h"

namespace kernjs {

class WellKnownSymbols {
public:
  static const Symbol& iterator();
  static const Symbol& toStringTag();
};

}  // namespace kernjs
