#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "cli/pager.hpp"
#include "cli/terminal_input.hpp"

namespace ht {

// ASCII-only lowering; multibyte UTF-8 passes through unchanged.
inline std::string to_lower_copy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(c >= 'A' && c <= 'Z' ? c + ('a' - 'A') : c); });
    return s;
}

// Removes the last UTF-8 code point of `s` (no-op when empty).
inline void pop_utf8_char(std::string& s) {
    while (!s.empty() && (static_cast<unsigned char>(s.back()) & 0xC0) == 0x80) s.pop_back();
    if (!s.empty()) s.pop_back();
}

// Incremental, case-insensitive substring filter over a fixed candidate
// list. Only the first `limit` matches are offered; the cursor indexes that
// displayed subset.
template <typename T>
class LiveFilter {
public:
    using LabelFn = std::function<std::string(const T&)>;
    enum class Step { Continue, Selected, Cancelled, Interrupted };

    LiveFilter(std::vector<T> candidates, LabelFn label, std::size_t limit = 5)
        : candidates_(std::move(candidates)), label_(std::move(label)),
          limit_(std::max<std::size_t>(limit, 1)) {
        Refresh();
    }

    const std::string& query() const { return query_; }
    std::size_t selected_index() const { return index_; }
    std::size_t limit() const { return limit_; }

    // Displayed matches, original order preserved.
    const std::vector<T>& matches() const { return displayed_; }
    std::vector<std::string> match_labels() const {
        std::vector<std::string> out;
        out.reserve(displayed_.size());
        for (const auto& item : displayed_) out.push_back(label_(item));
        return out;
    }

    const T& selected() const { return displayed_.at(index_); }

    Step Feed(const KeyEvent& key) {
        switch (key.kind) {
            case KeyKind::Character:
                query_ += key.text;
                index_ = 0;
                Refresh();
                return Step::Continue;
            case KeyKind::Backspace:
                pop_utf8_char(query_);
                index_ = 0;
                Refresh();
                return Step::Continue;
            case KeyKind::ArrowUp:
                if (!displayed_.empty()) index_ = (index_ + displayed_.size() - 1) % displayed_.size();
                return Step::Continue;
            case KeyKind::ArrowDown:
                if (!displayed_.empty()) index_ = (index_ + 1) % displayed_.size();
                return Step::Continue;
            case KeyKind::Enter:
                return displayed_.empty() ? Step::Continue : Step::Selected;
            case KeyKind::Escape: return Step::Cancelled;
            case KeyKind::Interrupt: return Step::Interrupted;
            default: return Step::Continue;
        }
    }

private:
    void Refresh() {
        displayed_.clear();
        std::string needle = to_lower_copy(query_);
        for (const auto& item : candidates_) {
            if (displayed_.size() >= limit_) break;
            if (to_lower_copy(label_(item)).find(needle) != std::string::npos) {
                displayed_.push_back(item);
            }
        }
        if (index_ >= displayed_.size()) index_ = 0;
    }

    std::vector<T> candidates_;
    LabelFn label_;
    std::size_t limit_;
    std::string query_;
    std::vector<T> displayed_;
    std::size_t index_ = 0;
};

template <typename T, typename RenderFn>
Selection<T> RunLiveFilter(LiveFilter<T>& filter, KeySource& keys, RenderFn&& render) {
    Selection<T> result;
    while (true) {
        render(filter);
        switch (filter.Feed(keys.NextKey())) {
            case LiveFilter<T>::Step::Continue: break;
            case LiveFilter<T>::Step::Selected:
                result.outcome = SelectOutcome::Selected;
                result.item = filter.selected();
                return result;
            case LiveFilter<T>::Step::Cancelled:
                result.outcome = SelectOutcome::Cancelled;
                return result;
            case LiveFilter<T>::Step::Interrupted:
                result.outcome = SelectOutcome::Interrupted;
                return result;
        }
    }
}

} // namespace ht
