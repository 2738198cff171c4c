// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================
//
// Вся платформенная специфика изолирована здесь.
//
// ==============================================================================

#include "ruleval/platform.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <random>
#include <sstream>
#include <stdexcept>
#include <vector>

#ifdef _WIN32
#include <fcntl.h>
#include <io.h>
#else
#include <unistd.h>
#endif

namespace ruleval::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

// Windows хранит путь в UTF-16, POSIX в байтах локали (на практике UTF-8)

std::filesystem::path path_from_utf8(std::string_view u8str) {
#ifdef _WIN32
    return std::filesystem::u8path(u8str.begin(), u8str.end());
#else
    return std::filesystem::path(std::string(u8str));
#endif
}

std::string path_to_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
    return p.u8string();
#else
    return p.string();
#endif
}

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(fileno(stdout)) != 0;
#endif
}

bool is_tty_stderr() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

// ----------------------------------------------------------------------------
// Чтение входных данных
// ----------------------------------------------------------------------------

ReadResult read_file(const std::filesystem::path& p) {
    ReadResult result;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(p, ec)) {
        result.error = "file not found: " + path_to_utf8(p);
        return result;
    }

    std::ifstream in(p, std::ios::binary);
    if (!in) {
        result.error = "failed to open file: " + path_to_utf8(p);
        return result;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        result.error = "failed to read file: " + path_to_utf8(p);
        return result;
    }

    result.ok = true;
    result.content = buffer.str();
    return result;
}

ReadResult read_stdin() {
    ReadResult result;
#ifdef _WIN32
    _setmode(_fileno(stdin), _O_BINARY);
#endif
    result.content.assign(std::istreambuf_iterator<char>(std::cin),
                          std::istreambuf_iterator<char>());
    if (std::cin.bad()) {
        result.error = "failed to read stdin";
        return result;
    }
    result.ok = true;
    return result;
}

// ----------------------------------------------------------------------------
// Временные файлы
// ----------------------------------------------------------------------------

std::filesystem::path make_temp_file(std::string_view prefix) {
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        throw std::runtime_error("failed to locate temp directory: " + ec.message());
    }

#ifdef _WIN32
    // mkstemp нет: случайный суффикс + эксклюзивное создание ("x")
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<unsigned> dist(0, 0xffff);

    for (int attempt = 0; attempt < 16; ++attempt) {
        char suffix[16];
        std::snprintf(suffix, sizeof(suffix), "_%04x%04x.tmp", dist(gen), dist(gen));
        std::filesystem::path candidate = dir / path_from_utf8(std::string(prefix) + suffix);

        FILE* f = _wfopen(candidate.c_str(), L"wbx");
        if (f != nullptr) {
            std::fclose(f);
            return candidate;
        }
    }
    throw std::runtime_error("failed to create temp file in " + path_to_utf8(dir));
#else
    std::string tmpl = path_to_utf8(dir / (std::string(prefix) + "_XXXXXX"));
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    int fd = mkstemp(buf.data());
    if (fd == -1) {
        throw std::runtime_error("failed to create temp file in " + path_to_utf8(dir));
    }
    close(fd);
    return std::filesystem::path(buf.data());
#endif
}

}  // namespace ruleval::platform
