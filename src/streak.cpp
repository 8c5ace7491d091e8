#include "streak.hpp"

#include <algorithm>

#include "calendar_date.hpp"

namespace ht {

Result<int> longest_streak(const std::vector<std::string>& dates) {
    std::vector<long> days;
    days.reserve(dates.size());
    for (const auto& text : dates) {
        auto parsed = parse_iso_date(trim_copy(text));
        if (!parsed) {
            return Result<int>::Fail(HabitErrc::InvalidInput, "Invalid date format: " + text);
        }
        days.push_back(parsed->days_since_epoch());
    }
    if (days.empty()) return Result<int>::Ok(0);

    std::sort(days.begin(), days.end());
    days.erase(std::unique(days.begin(), days.end()), days.end());

    int max_run = 1;
    int current = 1;
    for (size_t i = 1; i < days.size(); ++i) {
        current = (days[i] - days[i - 1] == 1) ? current + 1 : 1;
        max_run = std::max(max_run, current);
    }
    return Result<int>::Ok(max_run);
}

} // namespace ht
