#pragma once

#include "extent.hpp"

class CapacityValidator {
public:
  // Throws InsufficientCapacityError when dest is smaller than source.
  // A larger destination is fine.
  static void validate(const Extent& source, const Extent& dest);
};
