#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

#include <termios.h>

namespace ht {

enum class KeyKind {
    Character,  // one printable character, UTF-8 in KeyEvent::text
    Backspace,
    Enter,
    Escape,
    ArrowUp,
    ArrowDown,
    Ignored,    // left/right arrows, tab, other control bytes, malformed UTF-8
    Interrupt,  // Ctrl+C or end of input
};

struct KeyEvent {
    KeyKind kind = KeyKind::Ignored;
    std::string text;

    static KeyEvent Of(KeyKind kind) { return KeyEvent{kind, std::string()}; }
    static KeyEvent Char(char c) { return KeyEvent{KeyKind::Character, std::string(1, c)}; }
    static KeyEvent Char(std::string utf8) { return KeyEvent{KeyKind::Character, std::move(utf8)}; }
};

inline bool operator==(const KeyEvent& a, const KeyEvent& b) {
    return a.kind == b.kind && a.text == b.text;
}

// Byte count of the UTF-8 sequence started by `lead`; 0 for a byte that
// cannot start one (continuation bytes, overlong or out-of-range leads).
inline std::size_t utf8_sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 0;
}

// Byte supplier used by DecodeKey.
class ByteReader {
public:
    virtual ~ByteReader() = default;
    // Blocking read of the next byte; nullopt at end of input.
    virtual std::optional<unsigned char> ReadByte() = 0;
    // Next byte of an escape sequence; nullopt if none arrives promptly.
    virtual std::optional<unsigned char> ReadFollowByte() = 0;
};

// Consumes one logical key from `in`.
KeyEvent DecodeKey(ByteReader& in);

// Anything that produces key events: the terminal, or a script in tests.
class KeySource {
public:
    virtual ~KeySource() = default;
    virtual KeyEvent NextKey() = 0;
};

// Puts `fd` into raw mode for the guard's lifetime and restores the saved
// attributes on destruction. Does nothing when `fd` is not a terminal.
class RawModeGuard {
public:
    explicit RawModeGuard(int fd);
    ~RawModeGuard();
    RawModeGuard(const RawModeGuard&) = delete;
    RawModeGuard& operator=(const RawModeGuard&) = delete;

    bool active() const { return active_; }

private:
    int fd_;
    bool active_ = false;
    struct termios original_termios_;
};

// Terminal-backed key source. Raw mode is held only while a key is read.
class TerminalInput : public KeySource, private ByteReader {
public:
    explicit TerminalInput(int fd, int escape_timeout_ms = 50);
    TerminalInput();

    KeyEvent NextKey() override;

private:
    std::optional<unsigned char> ReadByte() override;
    std::optional<unsigned char> ReadFollowByte() override;

    int fd_;
    int escape_timeout_ms_;
};

} // namespace ht
