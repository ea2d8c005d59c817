#pragma once

#include <termios.h>

namespace framecast {

// Non-blocking single-key reads from stdin. While alive, the terminal is
// switched to non-canonical, no-echo mode; the destructor restores it.
// Does nothing when stdin is not a terminal.
class KeyboardInput {
public:
    KeyboardInput();
    ~KeyboardInput();

    KeyboardInput(const KeyboardInput&) = delete;
    KeyboardInput& operator=(const KeyboardInput&) = delete;

    // Returns the next pending key, or -1 if none.
    int poll_key();

    bool is_active() const { return active_; }

private:
    bool active_ = false;
    struct termios saved_;
};

} // namespace framecast
