#include "output.hpp"
#include "colors.hpp"
#include "messages.hpp"
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/screen.hpp>
#include <cctype>
#include <cstdio>
#include <sstream>
#include <sys/ioctl.h>
#include <unistd.h>

int terminal_width() {
    struct winsize ws {};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) {
        return ws.ws_col;
    }
    return 80;
}

bool stdout_is_terminal() {
    return isatty(STDOUT_FILENO) != 0;
}

std::string file_uri(const std::filesystem::path& path) {
    static const char* HEX = "0123456789ABCDEF";
    std::string absolute = std::filesystem::absolute(path).lexically_normal().string();
    std::string uri = "file://";
    for (unsigned char c : absolute) {
        if (std::isalnum(c) || c == '/' || c == '-' || c == '_' || c == '.' || c == '~') {
            uri += static_cast<char>(c);
        } else {
            uri += '%';
            uri += HEX[c >> 4];
            uri += HEX[c & 0x0F];
        }
    }
    return uri;
}

Output::Output(std::ostream& out, std::ostream& err, const std::string& locale, int width, bool color)
    : out_(out), err_(err), locale_(locale), width_(width > 20 ? width : 80), color_(color) {}

std::string Output::render_panel(const std::string& title, const std::string& body, bool green) const {
    using namespace ftxui;

    Elements lines;
    std::istringstream stream(body);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.empty()) {
            lines.push_back(text(""));
        } else {
            lines.push_back(paragraph(line));
        }
    }
    if (lines.empty()) {
        lines.push_back(text(""));
    }

    Element document = window(text(" " + title + " ") | bold, vbox(std::move(lines)));
    if (color_) {
        document = document | ftxui::color(green ? Color::Green : Color::Blue);
    }
    auto screen = Screen::Create(Dimension::Fixed(width_), Dimension::Fit(document));
    Render(screen, document);
    return screen.ToString();
}

void Output::print_analysis(const std::string& markdown_text, const std::string& title) {
    out_ << render_panel(title, markdown_text, false) << "\n";
    out_.flush();
}

void Output::print_commit_message(const std::string& message) {
    out_ << render_panel(translate(Msg::SuggestedCommit, locale_), message, true) << "\n";
    out_.flush();
}

void Output::print_error(const std::string& message) {
    std::string prefix = translate(Msg::ErrorPrefix, locale_);
    if (color_) {
        err_ << Colors::RED << prefix << Colors::RESET << " " << message << std::endl;
    } else {
        err_ << prefix << " " << message << std::endl;
    }
}

void Output::print_info(const std::string& message) {
    if (color_) {
        out_ << Colors::DIM << message << Colors::RESET << std::endl;
    } else {
        out_ << message << std::endl;
    }
}

void Output::print_line(const std::string& message) {
    out_ << message << std::endl;
}

void Output::print_html_report_written(const std::filesystem::path& path) {
    std::string prefix = translate(Msg::HtmlReportWrittenPrefix, locale_);
    if (!color_) {
        out_ << prefix << std::filesystem::absolute(path).string() << std::endl;
        return;
    }
    // OSC 8 hyperlink so the file name opens in a browser when clicked.
    out_ << Colors::DIM << prefix
         << "\033]8;;" << file_uri(path) << "\033\\"
         << path.filename().string()
         << "\033]8;;\033\\" << Colors::RESET << std::endl;
}
