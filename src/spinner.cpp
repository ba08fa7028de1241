#include "spinner.hpp"
#include "colors.hpp"
#include "text_utils.hpp"
#include <chrono>

Spinner::Spinner(std::string_view label, std::ostream& out, bool enabled) : label_(label), out_(out), running_(enabled) {
    if (!enabled) return;
    thread_ = std::thread([this]() {
        const int width = 10;
        int position = 0;
        int direction = 1;  // 1 for right, -1 for left
        while (running_) {
            std::string bar = "[";
            for (int i = 0; i < width; ++i) {
                if (i == position) {
                    bar += Colors::GREEN + std::string("█") + Colors::RESET;
                } else {
                    bar += " ";
                }
            }
            bar += "]";
            out_ << "\r" << Colors::GREEN << label_ << Colors::RESET << " " << bar << std::flush;
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            position += direction;
            if (position == width - 1 || position == 0) {
                direction = -direction;
            }
        }
        // Clear the line
        out_ << "\r" << std::string(utf8_length(label_) + width + 3, ' ') << "\r" << std::flush;
    });
}

Spinner::~Spinner() {
    stop();
}

void Spinner::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
}
