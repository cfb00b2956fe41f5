#include "capacity_validator.hpp"

#include "errors.hpp"

void CapacityValidator::validate(const Extent& source, const Extent& dest) {
  if(dest.byte_length < source.byte_length) {
    throw InsufficientCapacityError(source.byte_length, dest.byte_length);
  }
}
