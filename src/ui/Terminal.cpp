#include "ui/Terminal.hpp"
#include "util/Logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace lyre::ui {

// Only set a flag here, never call ioctl in a handler
static volatile std::sig_atomic_t g_resize_pending = 0;

static void sigwinch_handler(int) {
    g_resize_pending = 1;
}

Terminal& Terminal::instance() {
    static Terminal instance;
    return instance;
}

Terminal::~Terminal() {
    shutdown();
}

void Terminal::init() {
    if (initialized_) return;

    if (tcgetattr(STDIN_FILENO, &original_termios_) != 0) {
        util::Logger::warn("Terminal: stdin is not a tty");
    }

    ::termios raw = original_termios_;
    raw.c_lflag &= ~(ECHO | ICANON);
    raw.c_iflag &= ~(IXON | ICRNL);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw);

    int flags = fcntl(STDIN_FILENO, F_GETFL, 0);
    fcntl(STDIN_FILENO, F_SETFL, flags | O_NONBLOCK);

    std::signal(SIGWINCH, sigwinch_handler);

    running_ = true;
    writer_thread_ = std::thread(&Terminal::writer_loop, this);

    write_raw("\033[?1049h");  // Enter alternate screen buffer
    write_raw("\033[?25l");    // Hide cursor
    initialized_ = true;
}

void Terminal::shutdown() {
    if (!initialized_) return;

    write_raw("\033[?25h");    // Show cursor
    write_raw("\033[?1049l");  // Exit alternate screen buffer

    running_ = false;
    queue_cv_.notify_all();
    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }

    tcsetattr(STDIN_FILENO, TCSAFLUSH, &original_termios_);
    initialized_ = false;
}

bool Terminal::is_initialized() const {
    return initialized_;
}

void Terminal::writer_loop() {
    while (true) {
        std::string chunk;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !write_queue_.empty() || !running_; });

            if (write_queue_.empty()) {
                break;  // Stopped and drained
            }
            chunk = std::move(write_queue_.front());
            write_queue_.pop_front();
        }

        size_t written = 0;
        while (written < chunk.size()) {
            ssize_t n = write(STDOUT_FILENO, chunk.data() + written, chunk.size() - written);
            if (n > 0) {
                written += static_cast<size_t>(n);
            } else if (n < 0) {
                if (errno == EINTR) continue;

                // stdout may share the O_NONBLOCK file description with stdin
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    struct pollfd pfd = {STDOUT_FILENO, POLLOUT, 0};
                    poll(&pfd, 1, 100);
                    continue;
                }

                util::Logger::error("Terminal: write failed: " + std::string(strerror(errno)));
                break;
            }
        }
    }
}

void Terminal::write_raw(const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        write_queue_.push_back(text);
    }
    queue_cv_.notify_one();
}

void Terminal::clear_screen() {
    write_raw("\033[2J\033[H");
}

void Terminal::print_line(int y, const std::string& text) {
    // Cursor move, clear and text in one chunk so lines never tear
    write_raw(std::format("\033[{};1H\033[2K{}", y + 1, text));
}

InputEvent Terminal::read_input() {
    if (g_resize_pending) {
        g_resize_pending = 0;
        return {InputEvent::Type::Resize, 0, "resize"};
    }

    auto read_byte = [](char& out) {
        ssize_t n;
        do {
            n = read(STDIN_FILENO, &out, 1);
        } while (n < 0 && errno == EINTR);
        return n == 1;
    };

    char c = 0;
    if (!read_byte(c)) {
        return {};
    }

    if (c == '\033') {
        char seq[2];
        if (read_byte(seq[0]) && seq[0] == '[' && read_byte(seq[1])) {
            switch (seq[1]) {
                case 'A': return {InputEvent::Type::KeyPress, 0, "up"};
                case 'B': return {InputEvent::Type::KeyPress, 0, "down"};
                case 'C': return {InputEvent::Type::KeyPress, 0, "right"};
                case 'D': return {InputEvent::Type::KeyPress, 0, "left"};
            }
        }
        return {InputEvent::Type::KeyPress, 27, "escape"};
    }

    if (c == '\n' || c == '\r') {
        return {InputEvent::Type::KeyPress, c, "enter"};
    }
    if (c == ' ') {
        return {InputEvent::Type::KeyPress, c, "space"};
    }

    return {InputEvent::Type::KeyPress, c, std::string(1, c)};
}

int Terminal::get_terminal_width() const {
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) != 0 || w.ws_col == 0) {
        return 80;
    }
    return w.ws_col;
}

}  // namespace lyre::ui
