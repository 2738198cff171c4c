// ==============================================================================
// ruleval/path.hpp - Путь к полю в JSON документе
// ==============================================================================
//
// Назначение:
// - Разбор пути вида field, field.sub, field[0].sub, field.0.sub
// - Экранирование: "a\.b": ключ "a.b", "a\[0]": ключ "a[0]"
// - Трансляция в JSON Pointer (RFC 6901) и поиск через rapidjson::Pointer
//
// Некорректный путь не является ошибкой: он просто ничего не находит.
//
// ==============================================================================

#ifndef RULEVAL_PATH_HPP
#define RULEVAL_PATH_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <rapidjson/document.h>

namespace ruleval::path {

/// Разбить путь на сегменты (nullopt для некорректного пути)
std::optional<std::vector<std::string>> split(std::string_view path);

/// Преобразовать путь в JSON Pointer ("a.b[0]" -> "/a/b/0")
std::optional<std::string> to_json_pointer(std::string_view path);

/// Найти значение по пути (nullptr если путь некорректен или не найден)
const rapidjson::Value* query(const rapidjson::Value& root, std::string_view path);

}  // namespace ruleval::path

#endif  // RULEVAL_PATH_HPP
