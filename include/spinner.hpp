#pragma once

#include <atomic>
#include <ostream>
#include <string>
#include <string_view>
#include <thread>

// Bouncing progress bar on one terminal line. Inactive when disabled.
class Spinner {
public:
    Spinner(std::string_view label, std::ostream& out, bool enabled = true);
    ~Spinner();

private:
    void stop();

    std::string label_;
    std::ostream& out_;
    std::atomic<bool> running_;
    std::thread thread_;
};
