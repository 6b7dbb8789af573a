#pragma once

#include <amc/fixedcapacityvector.hpp>  // IWYU pragma: export

namespace conneg {

using amc::FixedCapacityVector;

}  // namespace conneg
