#pragma once

#include <stacktrace>

namespace od
{
/// Call stack snapshot, printed by the default assertion handler
/// Usage:
///   auto trace = od::stacktrace::current();
using stacktrace = std::stacktrace;
} // namespace od
