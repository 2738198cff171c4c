// ==============================================================================
// ruleval/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr (ядро ничего не печатает)
// - Сообщения с префиксами [+] [!] [x] [*] [~]
// - Цветной вывод (ANSI escape codes) на TTY
// - JSON вывод через RapidJSON, контекст ошибки конвейера
// - Таблицы (список переменных окружения для команды check)
//
// ==============================================================================

#ifndef RULEVAL_OUTPUT_HPP
#define RULEVAL_OUTPUT_HPP

#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

#include <rapidjson/document.h>
#include "ruleval/engine.hpp"

namespace ruleval::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// Формат вывода
// ----------------------------------------------------------------------------

enum class Format {
    Text,  // true / false, текстовые ошибки
    Json   // JSON объект на строку
};

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Успех, информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;            // -q: подавить informational stderr
    int verbose = 0;               // -v: уровень подробности (0..2+)
    bool no_banner = false;        // --no-banner: скрыть баннер
    Format format = Format::Text;  // -j: JSON
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Сообщения с префиксами
    // -------------------------------------------------------------------------

    /// Информационное сообщение в stderr (если не quiet): "[+] <message>"
    void info(std::string_view message);

    /// Предупреждение в stderr (если не quiet): "[!] <message>"
    void warn(std::string_view message);

    /// Ошибка в stderr (всегда): "[x] <message>"
    void error(std::string_view message);

    /// Отладочное сообщение (только при verbose > 0): "[*] <message>"
    void debug(std::string_view message);

    /// Трассировка (только при verbose > 1): "[~] <message>"
    void trace(std::string_view message);

    // Цветной вывод
    // -------------------------------------------------------------------------

    /// Зелёная строка в stdout
    void green_line(std::string_view message);

    /// Красная строка в stdout
    void red_line(std::string_view message);

    // JSON вывод
    // -------------------------------------------------------------------------

    /// Записать JSON значение (компактно)
    void write_json(const rapidjson::Value& value);

    /// Записать JSON значение + newline
    void write_json_line(const rapidjson::Value& value);

    // Ошибки конвейера
    // -------------------------------------------------------------------------

    /// Сообщить об ошибке. Json формат: объект {"error": {...}} в stdout,
    /// иначе "[x] ..." и перечень issues в stderr
    void report_error(const Error& error);

    // Управление
    // -------------------------------------------------------------------------

    /// Сбросить буферы
    void flush();

    /// Получить текущую конфигурацию
    const OutputConfig& config() const { return config_; }

private:
    /// Записать с цветом
    void write_colored(Stream s, std::string_view message, Color color);

    /// Записать префикс сообщения ("[+] " и т.п.) в stderr
    void write_prefix(std::string_view prefix, Color color);

    /// Получить FILE* для потока
    FILE* get_file(Stream s) const;

    OutputConfig config_;
};

// ----------------------------------------------------------------------------
// Table - форматирование таблиц
// ----------------------------------------------------------------------------

class Table {
public:
    Table();

    /// Добавить заголовки
    void set_headers(const std::vector<std::string>& headers);

    /// Добавить строку данных
    void add_row(const std::vector<std::string>& cells);

    /// Вывести таблицу через Writer (Unicode box-drawing)
    void print(Writer& w);

    /// Вывести таблицу в строку
    std::string to_string() const;

    /// Количество строк (без заголовка)
    size_t row_count() const { return rows_.size(); }

private:
    /// Горизонтальная линия: 'T' верх, 'M' разделитель, 'B' низ
    std::string format_line(char position) const;

    /// Строка данных
    std::string format_row(const std::vector<std::string>& cells) const;

    /// Ширины столбцов по содержимому (в кодовых точках UTF-8)
    std::vector<size_t> column_widths() const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Построить JSON контекст ошибки:
/// {"error": {"kind", "message", "cause"?, "expression"?, "issues"?}}
void error_to_json(const Error& error, rapidjson::Document& doc);

/// Получить ANSI escape code для цвета
std::string ansi_color_code(Color color);

/// Проверить, поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace ruleval::output

#endif  // RULEVAL_OUTPUT_HPP
