// ==============================================================================
// ruleval/declarations.hpp - Файл дополнительных деклараций (YAML)
// ==============================================================================
//
// Назначение:
// - Загрузка типизированных переменных, которые хост подставляет в окружение
// - Конвертация YAML значения по объявленному типу
//
// Формат:
//   variables:
//     - name: tenant
//       kind: string
//       value: acme
//     - name: request       # без value: связывается с полем документа
//       kind: map
//     - name: principal
//       kind: object:Principal
//       value: {id: 42}
//
// ==============================================================================

#ifndef RULEVAL_DECLARATIONS_HPP
#define RULEVAL_DECLARATIONS_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "ruleval/engine.hpp"

namespace ruleval::config {

/// Ошибка загрузки деклараций
struct LoadError {
    std::string message;
    std::string path;

    std::string format() const {
        if (path.empty()) {
            return message;
        }
        return message + " (" + path + ")";
    }
};

/// Результат загрузки
struct LoadResult {
    bool ok = false;
    std::vector<Declaration> declarations;
    LoadError error;

    explicit operator bool() const { return ok; }
};

/// Загрузить декларации из YAML файла
LoadResult load_declarations(const std::filesystem::path& path);

/// Разобрать декларации из YAML текста
LoadResult parse_declarations(std::string_view yaml, std::string_view origin = {});

}  // namespace ruleval::config

#endif  // RULEVAL_DECLARATIONS_HPP
