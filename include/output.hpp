#pragma once

#include <filesystem>
#include <ostream>
#include <string>

// Terminal width, or 80 when stdout is not a terminal.
int terminal_width();
bool stdout_is_terminal();

std::string file_uri(const std::filesystem::path& path);

// Every user-visible line goes through here, in the interface locale.
class Output {
public:
    Output(std::ostream& out, std::ostream& err, const std::string& locale, int width = 80, bool color = false);

    const std::string& locale() const { return locale_; }
    std::ostream& out() { return out_; }
    bool color() const { return color_; }

    void print_analysis(const std::string& markdown_text, const std::string& title);
    void print_commit_message(const std::string& message);
    // One line: localized "Error:" prefix followed by message.
    void print_error(const std::string& message);
    void print_info(const std::string& message);
    void print_line(const std::string& message);
    void print_html_report_written(const std::filesystem::path& path);

private:
    std::string render_panel(const std::string& title, const std::string& body, bool green) const;

    std::ostream& out_;
    std::ostream& err_;
    std::string locale_;
    int width_;
    bool color_;
};
