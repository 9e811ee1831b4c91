#pragma once

#include <source_location>

namespace od
{
/// Source position captured by assertions (file, line, column, function)
using source_location = std::source_location;
} // namespace od
