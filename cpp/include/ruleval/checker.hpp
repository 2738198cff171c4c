// ==============================================================================
// ruleval/checker.hpp - Проверка типов выражения
// ==============================================================================
//
// Назначение:
// - Разрешение идентификаторов (переменные окружения, переменные макросов,
//   квалифицированные имена вида a.b.c)
// - Выбор перегрузок функций и операторов по статическим типам
// - Сбор ВСЕХ проблем (issues), а не только первой
//
// Результат: CheckedExpression (AST + таблица типов + таблица ссылок),
// его использует интерпретатор.
//
// ==============================================================================

#ifndef RULEVAL_CHECKER_HPP
#define RULEVAL_CHECKER_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "ruleval/env.hpp"
#include "ruleval/expr.hpp"
#include "ruleval/kind.hpp"

namespace ruleval::expr {

/// Ссылка узла AST на объявление окружения
struct Reference {
    std::string variable;                   // имя переменной (для Ident / квалифицированного Select)
    std::vector<std::string> overload_ids;  // кандидаты перегрузки (для Call)

    bool is_variable() const { return !variable.empty(); }
};

/// Проверенное выражение
struct CheckedExpression {
    Expression root;
    std::map<std::int64_t, ValueKind> types;       // id узла -> статический тип
    std::map<std::int64_t, Reference> references;  // id узла -> ссылка

    /// Статический тип корня
    ValueKind result_kind() const;
};

/// Результат проверки
struct CheckResult {
    bool ok = false;
    CheckedExpression checked;
    std::vector<Issue> issues;  // отсортированы по позиции

    explicit operator bool() const { return ok; }
};

/// Проверить выражение относительно окружения
CheckResult check(Expression root, const Environment& env);

}  // namespace ruleval::expr

#endif  // RULEVAL_CHECKER_HPP
