/// @file policy.cpp
/// @brief Shared error predicates.

#include "callguard/resilience/policy.hpp"

#include <algorithm>
#include <vector>

namespace callguard::resilience {

ErrorPredicate matchesAnyOf(std::initializer_list<ErrorCode> codes) {
    std::vector<ErrorCode> accepted(codes);
    return [accepted = std::move(accepted)](const GuardError& error) {
        return std::find(accepted.begin(), accepted.end(), error.code()) != accepted.end();
    };
}

} // namespace callguard::resilience
