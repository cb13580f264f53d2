#pragma once

// Shared CLI UI helpers
// - ANSI color enablement (TTY/NO_COLOR)
// - Visible-width-safe padding
// - Plain column tables
//
// Header-only, no external dependencies.

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <unistd.h>

namespace hastat::cli::ui {

struct Ansi {
    static constexpr const char* RESET = "\x1b[0m";
    static constexpr const char* YELLOW = "\x1b[33m";
};

inline bool stream_is_tty(FILE* stream) {
    return isatty(fileno(stream)) != 0;
}

// Colors enabled if NO_COLOR is unset, TERM is not "dumb" and the stream is a TTY
inline bool colors_enabled(FILE* stream = stdout) {
    if (std::getenv("NO_COLOR"))
        return false;
    const char* term = std::getenv("TERM");
    if (term && std::string_view(term) == "dumb")
        return false;
    return stream_is_tty(stream);
}

inline std::string colorize(std::string_view s, const char* code, FILE* stream = stdout) {
    if (!colors_enabled(stream) || code == nullptr || *code == '\0') {
        return std::string(s);
    }
    std::string out;
    out.reserve(s.size() + 16);
    out.append(code);
    out.append(s.data(), s.size());
    out.append(Ansi::RESET);
    return out;
}

inline std::string repeat(char ch, size_t n) {
    return std::string(n, ch);
}

// Visible width of string treating ANSI CSI sequences as zero-width
inline size_t visible_width(std::string_view s) {
    size_t w = 0;
    bool in_esc = false;
    for (char ch : s) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (!in_esc) {
            if (c == 0x1B) {
                in_esc = true;
                continue;
            }
            ++w;
        } else if (c >= 0x40 && c <= 0x7E) {
            in_esc = false;
        }
    }
    return w;
}

inline std::string pad_right(std::string_view s, size_t width, char fill = ' ') {
    size_t vw = visible_width(s);
    std::string out(s);
    if (vw < width)
        out.append(width - vw, fill);
    return out;
}

inline std::string pad_left(std::string_view s, size_t width, char fill = ' ') {
    size_t vw = visible_width(s);
    if (vw >= width)
        return std::string(s);
    return std::string(width - vw, fill) + std::string(s);
}

// "WARNING: ..." on stderr, yellow when stderr is a terminal
inline std::string warning_text(std::string_view text) {
    return colorize("WARNING: ", Ansi::YELLOW, stderr) + std::string(text);
}

enum class Align { Left, Right };

// Column table; numeric columns are usually right aligned
struct Table {
    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> rows;
    std::vector<Align> align; // per column, Left when absent

    void add_row(const std::vector<std::string>& row) { rows.push_back(row); }
};

// Render without borders: header line, then rows, two spaces between columns
inline void render_table(std::ostream& os, const Table& table) {
    size_t num_cols = table.headers.size();
    if (num_cols == 0)
        return;

    std::vector<size_t> col_widths(num_cols, 0);
    for (size_t i = 0; i < num_cols; ++i) {
        col_widths[i] = visible_width(table.headers[i]);
    }
    for (const auto& row : table.rows) {
        for (size_t i = 0; i < num_cols && i < row.size(); ++i) {
            col_widths[i] = std::max(col_widths[i], visible_width(row[i]));
        }
    }

    auto renderRow = [&](const std::vector<std::string>& cells) {
        std::string line;
        for (size_t i = 0; i < num_cols; ++i) {
            if (i > 0)
                line += "  ";
            std::string_view cell = (i < cells.size()) ? std::string_view(cells[i]) : "";
            bool right = i < table.align.size() && table.align[i] == Align::Right;
            line += right ? pad_left(cell, col_widths[i]) : pad_right(cell, col_widths[i]);
        }
        // Trailing padding of the last column is noise
        line.erase(line.find_last_not_of(' ') + 1);
        os << line << '\n';
    };

    renderRow(table.headers);
    for (const auto& row : table.rows) {
        renderRow(row);
    }
}

inline std::string horizontal_rule(size_t width = 70, char ch = '-') {
    return repeat(ch, width);
}

} // namespace hastat::cli::ui
