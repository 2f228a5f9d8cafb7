// Terminal abstraction the orchestrator draws through and reads keys from.
#pragma once

#include <optional>
#include <string>

namespace opendir {

class App;

struct Key {
    enum class Code {
        Char,
        Enter,
        Escape,
        Backspace,
        Tab,
        Up,
        Down,
        Left,
        Right,
        PageUp,
        PageDown,
        Home,
        End,
        Insert,
        Delete,
        Function
    };

    Code code = Code::Char;
    char32_t ch = 0;  // Char
    int fn = 0;       // Function: 1..12
    bool ctrl = false;

    static Key character(char32_t c, bool ctrl = false) {
        Key k;
        k.code = Code::Char;
        k.ch = c;
        k.ctrl = ctrl;
        return k;
    }
    static Key special(Code code) {
        Key k;
        k.code = code;
        return k;
    }
    static Key function(int n) {
        Key k;
        k.code = Code::Function;
        k.fn = n;
        return k;
    }

    bool is(char32_t c) const { return code == Code::Char && !ctrl && ch == c; }
    bool isCtrl(char32_t c) const { return code == Code::Char && ctrl && ch == c; }
};

class Frontend {
public:
    virtual ~Frontend() = default;

    virtual void draw(const App &app) = 0;
    // Waits up to timeoutMs for one key.
    virtual std::optional<Key> pollKey(int timeoutMs) = 0;
    // Give the terminal back to a child process and take it again.
    virtual void suspend() = 0;
    virtual void resume() = 0;
    // Rows available to a panel listing.
    virtual int listRows() const = 0;
};

// Line editing for dialog and prompt input.
inline void appendUtf8(std::string &out, char32_t c) {
    if (c < 0x80) {
        out += char(c);
    } else if (c < 0x800) {
        out += char(0xC0 | (c >> 6));
        out += char(0x80 | (c & 0x3F));
    } else if (c < 0x10000) {
        out += char(0xE0 | (c >> 12));
        out += char(0x80 | ((c >> 6) & 0x3F));
        out += char(0x80 | (c & 0x3F));
    } else {
        out += char(0xF0 | (c >> 18));
        out += char(0x80 | ((c >> 12) & 0x3F));
        out += char(0x80 | ((c >> 6) & 0x3F));
        out += char(0x80 | (c & 0x3F));
    }
}

inline void popUtf8(std::string &s) {
    while (!s.empty()) {
        const unsigned char c = static_cast<unsigned char>(s.back());
        s.pop_back();
        if ((c & 0xC0) != 0x80)
            break;
    }
}

// Suspends the frontend for its lifetime.
class SuspendGuard {
public:
    explicit SuspendGuard(Frontend *frontend) : frontend_(frontend) {
        if (frontend_)
            frontend_->suspend();
    }
    ~SuspendGuard() {
        if (frontend_)
            frontend_->resume();
    }
    SuspendGuard(const SuspendGuard &) = delete;
    SuspendGuard &operator=(const SuspendGuard &) = delete;

private:
    Frontend *frontend_;
};

} // namespace opendir
