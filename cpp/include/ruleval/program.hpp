// ==============================================================================
// ruleval/program.hpp - Компиляция и вычисление выражения
// ==============================================================================
//
// Назначение:
// - compile(): parse + check -> Program, привязанный к Environment
// - Program::eval(): интерпретация проверенного AST на значениях окружения
//
// Program держит shared_ptr на своё Environment и вычисляется только на его
// переменных. Ошибки времени выполнения не выходят за пределы eval():
// они возвращаются в EvalResult.
//
// Семантика логических операторов: && и || поглощают ошибку одной стороны,
// если другая сторона определяет результат (false && err == false).
//
// ==============================================================================

#ifndef RULEVAL_PROGRAM_HPP
#define RULEVAL_PROGRAM_HPP

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "ruleval/checker.hpp"
#include "ruleval/env.hpp"
#include "ruleval/expr.hpp"
#include "ruleval/value.hpp"

namespace ruleval {

struct CompileResult;

/// Скомпилировать выражение относительно окружения
CompileResult compile(std::shared_ptr<const Environment> env, std::string_view source);

/// Исполняемое выражение
class Program {
public:
    /// Результат вычисления
    struct EvalResult {
        bool ok = false;
        Value value;
        std::string error;  // описание ошибки времени выполнения

        explicit operator bool() const { return ok; }
    };

    /// Вычислить выражение
    EvalResult eval() const;

    /// Исходный текст выражения
    const std::string& source() const { return source_; }

    /// Статический тип результата
    ValueKind result_kind() const { return checked_.result_kind(); }

    /// Окружение, к которому привязан Program
    const Environment& environment() const { return *env_; }

private:
    friend CompileResult compile(std::shared_ptr<const Environment> env, std::string_view source);

    Program(std::shared_ptr<const Environment> env, std::string source,
            expr::CheckedExpression checked)
        : env_(std::move(env)), source_(std::move(source)), checked_(std::move(checked)) {}

    std::shared_ptr<const Environment> env_;
    std::string source_;
    expr::CheckedExpression checked_;
};

/// Результат компиляции
struct CompileResult {
    bool ok = false;
    std::shared_ptr<const Program> program;
    std::vector<expr::Issue> issues;  // синтаксическая ошибка или все ошибки типов

    explicit operator bool() const { return ok; }
};

}  // namespace ruleval

#endif  // RULEVAL_PROGRAM_HPP
