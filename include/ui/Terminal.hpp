#pragma once

#include "ui/InputEvent.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <termios.h>

namespace lyre::ui {

// Raw-mode terminal with an asynchronous stdout writer, so a slow terminal
// never stalls the control loop
class Terminal {
public:
    static Terminal& instance();

    void init();
    void shutdown();
    bool is_initialized() const;

    void clear_screen();
    // Replaces row y (0-based) with text
    void print_line(int y, const std::string& text);

    // Enqueue raw data for asynchronous writing to stdout
    void write_raw(const std::string& text);

    // Non-blocking; Type::None when nothing is pending
    InputEvent read_input();
    int get_terminal_width() const;

private:
    Terminal() = default;
    ~Terminal();

    void writer_loop();

    bool initialized_ = false;

    std::thread writer_thread_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::string> write_queue_;
    std::atomic<bool> running_{false};

    ::termios original_termios_{};
};

}  // namespace lyre::ui
