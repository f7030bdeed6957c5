#ifndef WSA_CORE_UTILS_HPP
#define WSA_CORE_UTILS_HPP

#include <cmath>
#include <concepts>

namespace wsa_core
{

// Default tolerance for near-zero checks
constexpr double TOLERANCE = 1e-10;

template <std::floating_point T>
bool isNearZero(T value, double tolerance = TOLERANCE)
{
  return std::abs(value) <= tolerance;
}

}  // namespace wsa_core

#endif  // WSA_CORE_UTILS_HPP
