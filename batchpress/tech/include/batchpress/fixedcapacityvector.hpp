#pragma once

#include <amc/fixedcapacityvector.hpp>  // IWYU pragma: export

namespace batchpress {

using amc::FixedCapacityVector;

}  // namespace batchpress
