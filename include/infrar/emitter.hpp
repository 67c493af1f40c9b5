#pragma once
#include "infrar/source_unit.hpp"
#include <string>

namespace infrar {

// Applies the unit's edits to its original text in offset order. An Unmodified unit
// emits its input byte for byte.
std::string emit(const SourceUnit& unit);

} // namespace infrar
