#include "cli/terminal_input.hpp"

#include <cerrno>
#include <string>
#include <utility>
#include <poll.h>
#include <unistd.h>

namespace ht {

namespace {

// CSI sequence after "ESC [": parameter and intermediate bytes up to the
// final byte, which alone decides the key.
KeyEvent DecodeCsi(ByteReader& in) {
    while (auto b = in.ReadFollowByte()) {
        if (*b >= 0x20 && *b <= 0x3F) continue;
        if (*b == 'A') return KeyEvent::Of(KeyKind::ArrowUp);
        if (*b == 'B') return KeyEvent::Of(KeyKind::ArrowDown);
        return KeyEvent::Of(KeyKind::Ignored); // C/D, ~ and others
    }
    return KeyEvent::Of(KeyKind::Ignored);
}

KeyEvent DecodeUtf8(ByteReader& in, unsigned char lead) {
    std::size_t len = utf8_sequence_length(lead);
    if (len < 2) return KeyEvent::Of(KeyKind::Ignored);
    std::string text(1, static_cast<char>(lead));
    for (std::size_t i = 1; i < len; ++i) {
        auto b = in.ReadFollowByte();
        if (!b || (*b & 0xC0) != 0x80) return KeyEvent::Of(KeyKind::Ignored);
        text.push_back(static_cast<char>(*b));
    }
    return KeyEvent::Char(std::move(text));
}

} // namespace

KeyEvent DecodeKey(ByteReader& in) {
    auto first = in.ReadByte();
    if (!first) return KeyEvent::Of(KeyKind::Interrupt);
    unsigned char c = *first;

    if (c == 3) {
        return KeyEvent::Of(KeyKind::Interrupt);
    } else if (c == 0x1b) {
        auto second = in.ReadFollowByte();
        if (!second || *second != '[') return KeyEvent::Of(KeyKind::Escape);
        return DecodeCsi(in);
    } else if (c == 127 || c == 8) { // Backspace on Mac/Linux
        return KeyEvent::Of(KeyKind::Backspace);
    } else if (c == '\n' || c == '\r') {
        return KeyEvent::Of(KeyKind::Enter);
    } else if (c >= 32 && c <= 126) {
        return KeyEvent::Char(static_cast<char>(c));
    } else if (c >= 0x80) {
        return DecodeUtf8(in, c);
    }
    return KeyEvent::Of(KeyKind::Ignored);
}

RawModeGuard::RawModeGuard(int fd) : fd_(fd) {
    if (tcgetattr(fd_, &original_termios_) == -1) return;
    struct termios raw = original_termios_;
    raw.c_iflag &= ~(BRKINT | ICRNL | INPCK | ISTRIP | IXON);
    raw.c_oflag &= ~(OPOST);
    raw.c_cflag |= (CS8);
    raw.c_lflag &= ~(ECHO | ICANON | IEXTEN | ISIG);
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;
    // No flush: bytes typed since the previous read stay queued.
    active_ = tcsetattr(fd_, TCSANOW, &raw) == 0;
}

RawModeGuard::~RawModeGuard() {
    if (active_) tcsetattr(fd_, TCSADRAIN, &original_termios_);
}

TerminalInput::TerminalInput(int fd, int escape_timeout_ms)
    : fd_(fd), escape_timeout_ms_(escape_timeout_ms) {}

TerminalInput::TerminalInput() : TerminalInput(STDIN_FILENO) {}

KeyEvent TerminalInput::NextKey() {
    RawModeGuard guard(fd_);
    return DecodeKey(*this);
}

std::optional<unsigned char> TerminalInput::ReadByte() {
    unsigned char c = 0;
    while (true) {
        ssize_t n = read(fd_, &c, 1);
        if (n == 1) return c;
        if (n < 0 && errno == EINTR) continue;
        return std::nullopt;
    }
}

std::optional<unsigned char> TerminalInput::ReadFollowByte() {
    struct pollfd pfd{fd_, POLLIN, 0};
    int ready = poll(&pfd, 1, escape_timeout_ms_);
    if (ready <= 0 || !(pfd.revents & POLLIN)) return std::nullopt;
    return ReadByte();
}

} // namespace ht
