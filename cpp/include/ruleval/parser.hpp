// ==============================================================================
// ruleval/parser.hpp - Лексер и парсер выражений правил
// ==============================================================================
//
// Назначение:
// - Токенизация текста выражения
// - Рекурсивный спуск с приоритетами операторов:
//     ?:  ||  &&  == != < <= > >= in  + -  * / %  ! -  . [] ()
// - Раскрытие макросов: has(), all/exists/exists_one/filter/map
//
// Синтаксическая ошибка останавливает разбор: ParseResult содержит одну
// issue с позицией ошибки.
//
// ==============================================================================

#ifndef RULEVAL_PARSER_HPP
#define RULEVAL_PARSER_HPP

#include <string_view>
#include <vector>

#include "ruleval/expr.hpp"

namespace ruleval::expr {

/// Максимальная глубина вложенности выражения
constexpr int MAX_RECURSION_DEPTH = 200;

/// Результат разбора
struct ParseResult {
    bool ok = false;
    Expression expression;
    std::vector<Issue> issues;

    explicit operator bool() const { return ok; }
};

/// Разобрать текст выражения
ParseResult parse(std::string_view source);

}  // namespace ruleval::expr

#endif  // RULEVAL_PARSER_HPP
