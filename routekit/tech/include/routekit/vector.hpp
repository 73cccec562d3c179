#pragma once

#include <amc/vector.hpp>  // IWYU pragma: export

namespace routekit {

using amc::vector;

}  // namespace routekit
