// ==============================================================================
// ruleval/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Явные преобразования path <-> UTF-8
// - Определение TTY для цветного вывода
// - Чтение файла / stdin целиком
// - Временные файлы (для тестов)
//
// Платформенная специфика (#ifdef _WIN32) изолирована в platform.cpp.
//
// ==============================================================================

#ifndef RULEVAL_PLATFORM_HPP
#define RULEVAL_PLATFORM_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace ruleval::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// UTF-8 строка -> native path
std::filesystem::path path_from_utf8(std::string_view u8str);

/// native path -> UTF-8 строка
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Чтение входных данных
// ----------------------------------------------------------------------------

/// Результат чтения
struct ReadResult {
    bool ok = false;
    std::string content;
    std::string error;

    explicit operator bool() const { return ok; }
};

/// Прочитать файл целиком (бинарно, без преобразований)
ReadResult read_file(const std::filesystem::path& p);

/// Прочитать stdin до EOF
ReadResult read_stdin();

// ----------------------------------------------------------------------------
// Временные файлы
// ----------------------------------------------------------------------------

/// Создать пустой временный файл (бросает std::runtime_error при ошибке)
std::filesystem::path make_temp_file(std::string_view prefix);

}  // namespace ruleval::platform

#endif  // RULEVAL_PLATFORM_HPP
