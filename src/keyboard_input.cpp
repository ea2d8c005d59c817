#include "keyboard_input.hpp"

#include <poll.h>
#include <unistd.h>

namespace framecast {

KeyboardInput::KeyboardInput() {
    if (!isatty(STDIN_FILENO) || tcgetattr(STDIN_FILENO, &saved_) != 0) {
        return;
    }

    struct termios raw = saved_;
    raw.c_lflag &= ~(ICANON | ECHO);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    active_ = tcsetattr(STDIN_FILENO, TCSANOW, &raw) == 0;
}

KeyboardInput::~KeyboardInput() {
    if (active_) {
        tcsetattr(STDIN_FILENO, TCSANOW, &saved_);
    }
}

int KeyboardInput::poll_key() {
    if (!active_) {
        return -1;
    }

    struct pollfd pfd;
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;
    pfd.revents = 0;
    if (poll(&pfd, 1, 0) <= 0 || !(pfd.revents & POLLIN)) {
        return -1;
    }

    unsigned char c = 0;
    if (read(STDIN_FILENO, &c, 1) != 1) {
        return -1;
    }
    return c;
}

} // namespace framecast
