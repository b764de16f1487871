#pragma once

#include <fmt/core.h>
#include <cstdlib>

namespace scalarnet {
#define ASSERT(expr, message)                                                  \
  {                                                                            \
    if (!(expr)) {                                                             \
      fmt::print("Assertion fail at {}:{}: {}\n", __FILE__, __LINE__,          \
                 message);                                                     \
      exit(-1);                                                                \
    }                                                                          \
  }

} // namespace scalarnet
