#pragma once
#include <string>
#include <vector>

#include "ht_types.hpp"

namespace ht {

// Longest run of calendar-consecutive days in `dates` (YYYY-MM-DD strings).
// Order and duplicates do not matter. 0 for an empty list; InvalidInput if
// any entry is not a valid date.
Result<int> longest_streak(const std::vector<std::string>& dates);

} // namespace ht
