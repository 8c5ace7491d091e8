#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ht {

#if defined(_WIN32)
    #if defined(HABITRACK_LIB_BUILD)
        #define HABITRACK_API __declspec(dllexport)
    #else
        #define HABITRACK_API __declspec(dllimport)
    #endif
#else // Non-Windows platforms
    #if defined(HABITRACK_LIB_BUILD)
        #define HABITRACK_API __attribute__((visibility("default")))
    #else
        #define HABITRACK_API
    #endif
#endif

struct Habit {
    std::int64_t id = -1;
    std::string name;
};

struct Record {
    std::int64_t id = -1;
    std::int64_t habit_id = -1;
    std::string date; // YYYY-MM-DD
};

inline bool operator==(const Habit& a, const Habit& b) {
    return a.id == b.id && a.name == b.name;
}
inline bool operator==(const Record& a, const Record& b) {
    return a.id == b.id && a.habit_id == b.habit_id && a.date == b.date;
}

enum class HabitErrc {
    Ok = 0, InvalidInput, AlreadyExists, NotFound, Storage,
};

// Thrown for failures outside the expected outcomes (I/O, locked or corrupt
// database). Expected outcomes travel in Result<T> instead.
struct HABITRACK_API HabitError : public std::runtime_error {
    explicit HabitError(const std::string& what)
        : std::runtime_error(what), code_(HabitErrc::Storage) {}
    HabitError(HabitErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    HabitErrc code() const noexcept { return code_; }
private:
    HabitErrc code_;
};

// Either a value or one of InvalidInput / AlreadyExists / NotFound with a
// human readable message.
template <typename T>
class Result {
public:
    static Result Ok(T value) {
        Result r;
        r.value_ = std::move(value);
        return r;
    }
    static Result Fail(HabitErrc code, std::string message) {
        Result r;
        r.code_ = code;
        r.message_ = std::move(message);
        return r;
    }

    bool ok() const noexcept { return code_ == HabitErrc::Ok; }
    explicit operator bool() const noexcept { return ok(); }
    HabitErrc code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }

    const T& value() const {
        if (!value_) throw HabitError(code_, "Result has no value: " + message_);
        return *value_;
    }
    T& value() {
        if (!value_) throw HabitError(code_, "Result has no value: " + message_);
        return *value_;
    }
    const T& operator*() const { return value(); }
    T& operator*() { return value(); }
    const T* operator->() const { return &value(); }
    T* operator->() { return &value(); }

private:
    Result() = default;

    HabitErrc code_ = HabitErrc::Ok;
    std::string message_;
    std::optional<T> value_;
};

// Trim ASCII whitespace at both ends.
std::string trim_copy(const std::string& s);

} // namespace ht
