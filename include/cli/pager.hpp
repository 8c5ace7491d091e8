#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "cli/terminal_input.hpp"

namespace ht {

enum class SelectOutcome { Selected, Cancelled, Interrupted, NoItems };

template <typename T>
struct Selection {
    SelectOutcome outcome = SelectOutcome::Cancelled;
    std::optional<T> item;
};

// Paginated list selection with wrap-around. Items are fixed for the
// lifetime of the pager; the cursor is (current_page, selected_index) where
// selected_index is relative to the page.
template <typename T>
class Pager {
public:
    enum class Step { Continue, Selected, Cancelled, Interrupted };

    explicit Pager(std::vector<T> items, std::size_t page_size = 5)
        : items_(std::move(items)), page_size_(std::max<std::size_t>(page_size, 1)) {}

    bool empty() const { return items_.empty(); }
    std::size_t size() const { return items_.size(); }
    std::size_t page_size() const { return page_size_; }
    std::size_t page_count() const { return (items_.size() + page_size_ - 1) / page_size_; }
    std::size_t current_page() const { return page_; }
    std::size_t selected_index() const { return index_; }

    std::size_t page_length(std::size_t page) const {
        std::size_t begin = page * page_size_;
        if (begin >= items_.size()) return 0;
        return std::min(page_size_, items_.size() - begin);
    }

    // Items of the current page, in order.
    std::vector<T> page_items() const {
        std::size_t begin = page_ * page_size_;
        std::size_t len = page_length(page_);
        return std::vector<T>(items_.begin() + begin, items_.begin() + begin + len);
    }

    const T& selected() const { return items_.at(page_ * page_size_ + index_); }

    Step Feed(const KeyEvent& key) {
        if (items_.empty()) return Step::Cancelled;
        switch (key.kind) {
            case KeyKind::ArrowDown:
                ++index_;
                if (index_ >= page_length(page_)) {
                    page_ = (page_ + 1) % page_count();
                    index_ = 0;
                }
                return Step::Continue;
            case KeyKind::ArrowUp:
                if (index_ == 0) {
                    page_ = (page_ + page_count() - 1) % page_count();
                    index_ = page_length(page_) - 1;
                } else {
                    --index_;
                }
                return Step::Continue;
            case KeyKind::Enter: return Step::Selected;
            case KeyKind::Escape: return Step::Cancelled;
            case KeyKind::Interrupt: return Step::Interrupted;
            default: return Step::Continue;
        }
    }

private:
    std::vector<T> items_;
    std::size_t page_size_;
    std::size_t page_ = 0;
    std::size_t index_ = 0;
};

// Render / read / feed until the pager reaches a terminal step. An empty
// pager reports NoItems without reading a key.
template <typename T, typename RenderFn>
Selection<T> RunPager(Pager<T>& pager, KeySource& keys, RenderFn&& render) {
    Selection<T> result;
    if (pager.empty()) {
        result.outcome = SelectOutcome::NoItems;
        return result;
    }
    while (true) {
        render(pager);
        switch (pager.Feed(keys.NextKey())) {
            case Pager<T>::Step::Continue: break;
            case Pager<T>::Step::Selected:
                result.outcome = SelectOutcome::Selected;
                result.item = pager.selected();
                return result;
            case Pager<T>::Step::Cancelled:
                result.outcome = SelectOutcome::Cancelled;
                return result;
            case Pager<T>::Step::Interrupted:
                result.outcome = SelectOutcome::Interrupted;
                return result;
        }
    }
}

} // namespace ht
