#pragma once

#include <amc/smallvector.hpp>  // IWYU pragma: export

namespace conneg {

using amc::SmallVector;

}  // namespace conneg
