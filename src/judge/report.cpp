#include "cpjudge/judge/report.hpp"
#include <fmt/color.h>
#include <fmt/core.h>
#include <sys/ioctl.h>
#include <unistd.h>
#include <boost/lexical_cast.hpp>
#include "cpjudge/common/stl_utils.hpp"
#include "cpjudge/common/utils.hpp"
#include "cpjudge/config.hpp"

namespace cpjudge {
using namespace std;

static string styled(const string &text, const fmt::text_style &style) {
    if (!USE_COLOR) return text;
    return fmt::format(style, "{}", text);
}

static fmt::text_style tag_style(fmt::text_style background) {
    return background | fmt::fg(fmt::terminal_color::bright_white);
}

static fmt::text_style verdict_style(verdict v) {
    switch (v) {
        case verdict::ACCEPTED:
            return tag_style(fmt::bg(fmt::terminal_color::green));
        case verdict::WRONG_ANSWER:
            return tag_style(fmt::bg(fmt::terminal_color::red));
        case verdict::TIME_LIMIT_EXCEEDED:
            return tag_style(fmt::bg(fmt::rgb(0x8d, 0x42, 0xf5)));
        case verdict::RUNTIME_ERROR:
        default:
            return tag_style(fmt::bg(fmt::terminal_color::blue));
    }
}

int terminal_width() {
    struct winsize w;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    string columns = get_env("COLUMNS", "");
    if (is_integer(columns) && columns.size() < 6)
        return boost::lexical_cast<int>(columns);
    return 80;
}

string pad_center(const string &text, size_t width) {
    if (text.size() >= width) return text;
    size_t left = (width - text.size()) / 2;
    return string(left, ' ') + text + string(width - text.size() - left, ' ');
}

static string pad_end(const string &text, size_t width) {
    if (text.size() >= width) return text;
    return text + string(width - text.size(), ' ');
}

void print_verdict(ostream &out, int id, verdict v) {
    out << "Test Case " << id << ": " << styled(get_tag(v), verdict_style(v)) << endl
        << endl;
}

void print_whitespace_advisory(ostream &out) {
    out << styled("Check leading and trailing blank spaces", fmt::fg(fmt::terminal_color::yellow)) << endl
        << endl;
}

void print_output_block(ostream &out, const string &title, const string &text) {
    out << styled(title, tag_style(fmt::bg(fmt::terminal_color::green))) << endl
        << endl
        << text << endl;
}

void print_diff_table(ostream &out, const diff_table &table) {
    size_t width = table.column_width;
    out << styled(pad_center("Your Output", width), tag_style(fmt::bg(fmt::terminal_color::red)))
        << "|"
        << styled(pad_center("Correct Answer", width), tag_style(fmt::bg(fmt::terminal_color::green)))
        << endl;
    out << string(width, ' ') << "|" << string(width, ' ') << endl;

    for (auto &row : table.rows) {
        out << pad_end(row.left, width) << "|" << pad_end(row.right, width);
        if (USE_COLOR)
            out << styled("  ", fmt::bg(row.matches ? fmt::terminal_color::green : fmt::terminal_color::red));
        else
            out << (row.matches ? "  " : "XX");
        out << endl;
    }
    out << endl;
}

void print_score(ostream &out, const score &s) {
    string plain = fmt::format("| {} / {} AC |", s.accepted, s.total);
    string msg = fmt::format("| {} / {} {} |", s.accepted, s.total, styled("AC", fmt::fg(fmt::terminal_color::bright_green)));
    if (s.accepted == s.total) msg += " 🎉🎉🎉";
    string summary = "Summary: ";
    string rule = string(summary.size(), ' ') + string(plain.size(), '+');

    out << endl
        << rule << endl
        << summary << msg << endl
        << rule << endl
        << endl;
}

void print_compilation_error(ostream &out) {
    out << styled(" Compilation Error ", tag_style(fmt::bg(fmt::terminal_color::yellow))) << endl
        << endl;
}

}  // namespace cpjudge
