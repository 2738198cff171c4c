// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr.
// Байты первичны: без std::endl, явные "\n".
//
// ==============================================================================

#include "ruleval/output.hpp"

#include "ruleval/platform.hpp"

#include <algorithm>
#include <cstdio>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace ruleval::output {

// ----------------------------------------------------------------------------
// ANSI Escape Codes
// ----------------------------------------------------------------------------

namespace {

// ANSI SGR (Select Graphic Rendition) коды
constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

// Unicode box-drawing characters для таблиц (UTF-8)
constexpr const char* BOX_V = "\xe2\x94\x82";      // │ U+2502
constexpr const char* BOX_H = "\xe2\x94\x80";      // ─ U+2500
constexpr const char* BOX_TL = "\xe2\x94\x8c";     // ┌ U+250C
constexpr const char* BOX_TR = "\xe2\x94\x90";     // ┐ U+2510
constexpr const char* BOX_BL = "\xe2\x94\x94";     // └ U+2514
constexpr const char* BOX_BR = "\xe2\x94\x98";     // ┘ U+2518
constexpr const char* BOX_LT = "\xe2\x94\x9c";     // ├ U+251C
constexpr const char* BOX_RT = "\xe2\x94\xa4";     // ┤ U+2524
constexpr const char* BOX_TT = "\xe2\x94\xac";     // ┬ U+252C
constexpr const char* BOX_BT = "\xe2\x94\xb4";     // ┴ U+2534
constexpr const char* BOX_CROSS = "\xe2\x94\xbc";  // ┼ U+253C

// Ширина строки в кодовых точках UTF-8
size_t display_width(const std::string& s) {
    size_t width = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) {
            ++width;
        }
    }
    return width;
}

void add_string(rapidjson::Value& obj, const char* key, const std::string& value,
                rapidjson::Document::AllocatorType& alloc) {
    obj.AddMember(rapidjson::Value(key, alloc),
                  rapidjson::Value(value.c_str(), static_cast<rapidjson::SizeType>(value.size()),
                                   alloc),
                  alloc);
}

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {}

Writer::~Writer() {
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    FILE* f = get_file(s);
    if (f != nullptr) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

void Writer::write_prefix(std::string_view prefix, Color color) {
    if (supports_color(Stream::Stderr)) {
        write(Stream::Stderr, ansi_color_code(color));
        write(Stream::Stderr, prefix);
        write(Stream::Stderr, ANSI_RESET);
    } else {
        write(Stream::Stderr, prefix);
    }
}

void Writer::info(std::string_view message) {
    // Подавляем информационные сообщения при --quiet
    if (config_.quiet) {
        return;
    }
    write_prefix("[+] ", Color::Green);
    write_line(Stream::Stderr, message);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefix("[!] ", Color::Yellow);
    write_line(Stream::Stderr, message);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются всегда, даже при --quiet
    write_prefix("[x] ", Color::Red);
    write_line(Stream::Stderr, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    write_prefix("[*] ", Color::Cyan);
    write_line(Stream::Stderr, message);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    write_prefix("[~] ", Color::Magenta);
    write_line(Stream::Stderr, message);
}

void Writer::green_line(std::string_view message) {
    write_colored(Stream::Stdout, message, Color::Green);
    write(Stream::Stdout, "\n");
}

void Writer::red_line(std::string_view message) {
    write_colored(Stream::Stdout, message, Color::Red);
    write(Stream::Stdout, "\n");
}

void Writer::write_colored(Stream s, std::string_view message, Color color) {
    if (supports_color(s)) {
        write(s, ansi_color_code(color));
        write(s, message);
        write(s, ANSI_RESET);
    } else {
        write(s, message);
    }
}

void Writer::write_json(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);

    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    flush();
}

void Writer::write_json_line(const rapidjson::Value& value) {
    write_json(value);
    write(Stream::Stdout, "\n");
}

void Writer::report_error(const Error& err) {
    if (config_.format == Format::Json) {
        rapidjson::Document doc;
        error_to_json(err, doc);
        write_json_line(doc);
        return;
    }

    std::string text = err.format();
    std::size_t newline = text.find('\n');
    error(std::string_view(text).substr(0, newline));
    if (newline != std::string::npos) {
        write_line(Stream::Stderr, std::string_view(text).substr(newline + 1));
    }
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

Table::Table() = default;

void Table::set_headers(const std::vector<std::string>& headers) {
    headers_ = headers;
}

void Table::add_row(const std::vector<std::string>& cells) {
    rows_.push_back(cells);
}

std::vector<size_t> Table::column_widths() const {
    size_t num_cols = headers_.size();
    for (const auto& row : rows_) {
        num_cols = std::max(num_cols, row.size());
    }

    std::vector<size_t> widths(num_cols, 0);
    for (size_t i = 0; i < headers_.size(); ++i) {
        widths[i] = std::max(widths[i], display_width(headers_[i]));
    }
    for (const auto& row : rows_) {
        for (size_t i = 0; i < row.size(); ++i) {
            widths[i] = std::max(widths[i], display_width(row[i]));
        }
    }
    return widths;
}

std::string Table::format_line(char position) const {
    const char* left = position == 'T' ? BOX_TL : (position == 'M' ? BOX_LT : BOX_BL);
    const char* middle = position == 'T' ? BOX_TT : (position == 'M' ? BOX_CROSS : BOX_BT);
    const char* right = position == 'T' ? BOX_TR : (position == 'M' ? BOX_RT : BOX_BR);

    auto widths = column_widths();
    std::string line = left;
    for (size_t i = 0; i < widths.size(); ++i) {
        // padding (1 пробел с каждой стороны) + ширина содержимого
        for (size_t j = 0; j < widths[i] + 2; ++j) {
            line += BOX_H;
        }
        if (i + 1 < widths.size()) {
            line += middle;
        }
    }
    line += right;
    return line;
}

std::string Table::format_row(const std::vector<std::string>& cells) const {
    auto widths = column_widths();
    std::string line = BOX_V;

    for (size_t i = 0; i < widths.size(); ++i) {
        std::string cell = (i < cells.size()) ? cells[i] : "";
        line += ' ';
        line += cell;
        size_t width = display_width(cell);
        if (width < widths[i]) {
            line.append(widths[i] - width, ' ');
        }
        line += ' ';
        line += BOX_V;
    }
    return line;
}

std::string Table::to_string() const {
    std::string result;

    result += format_line('T');
    result += '\n';

    if (!headers_.empty()) {
        result += format_row(headers_);
        result += '\n';
        result += format_line('M');
        result += '\n';
    }

    for (const auto& row : rows_) {
        result += format_row(row);
        result += '\n';
    }

    result += format_line('B');
    result += '\n';
    return result;
}

void Table::print(Writer& w) {
    w.write(Stream::Stdout, to_string());
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

void error_to_json(const Error& error, rapidjson::Document& doc) {
    auto& alloc = doc.GetAllocator();
    doc.SetObject();

    rapidjson::Value body(rapidjson::kObjectType);
    add_string(body, "kind", error_kind_name(error.kind), alloc);
    add_string(body, "message", error.message, alloc);
    if (!error.cause.empty()) {
        add_string(body, "cause", error.cause, alloc);
    }
    if (!error.expression.empty()) {
        add_string(body, "expression", error.expression, alloc);
    }
    if (!error.issues.empty()) {
        rapidjson::Value issues(rapidjson::kArrayType);
        for (const auto& issue : error.issues) {
            std::string text = issue.format(error.expression);
            issues.PushBack(
                rapidjson::Value(text.c_str(), static_cast<rapidjson::SizeType>(text.size()),
                                 alloc),
                alloc);
        }
        body.AddMember("issues", issues, alloc);
    }

    doc.AddMember("error", body, alloc);
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
    default:
        return "";
    }
}

bool supports_color(Stream s) {
    if (s == Stream::Stdout) {
        return platform::is_tty_stdout();
    }
    return platform::is_tty_stderr();
}

}  // namespace ruleval::output
