// ==============================================================================
// ruleval/engine.hpp - Конвейер вычисления правила над событием
// ==============================================================================
//
// Назначение:
// - evaluate(): документ + выражение -> булев вердикт или ошибка
// - Стадии: parse_payload -> build_environment -> compile -> eval ->
//   validate_result. Первая ошибка останавливает конвейер.
// - prepare(): конвейер без вычисления (для проверки правила)
// - Таксономия ошибок ErrorKind
//
// Ошибки возвращаются значениями (Error в результате), исключения наружу не выходят.
// Каждый вызов строит собственные Payload, Environment и Program, поэтому
// параллельные вызовы не требуют синхронизации.
//
// Использование:
// @code
//   std::string data = R"({"user":"alice","age":30})";
//   auto verdict = ruleval::evaluate(&data, "age > 18");
//   if (verdict.ok && verdict.matched) { ... }
// @endcode
//
// ==============================================================================

#ifndef RULEVAL_ENGINE_HPP
#define RULEVAL_ENGINE_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ruleval/env.hpp"
#include "ruleval/expr.hpp"
#include "ruleval/kind.hpp"
#include "ruleval/payload.hpp"
#include "ruleval/program.hpp"
#include "ruleval/value.hpp"

namespace ruleval {

// ============================================================================
// Error
// ============================================================================

/// Вид ошибки конвейера
enum class ErrorKind {
    NilInput,          // документ отсутствует
    PayloadParse,      // не JSON или корень не объект
    EnvironmentBuild,  // ошибка объединения деклараций
    Compile,           // синтаксис или типы (все issues)
    Evaluation,        // ошибка времени выполнения
    NonBooleanResult   // результат не bool
};

/// Имя вида ошибки ("NilInput", "Compile", ...)
const char* error_kind_name(ErrorKind kind);

/// Ошибка конвейера
struct Error {
    ErrorKind kind = ErrorKind::NilInput;
    std::string message;
    std::string expression;          // текст выражения (если известен)
    std::vector<expr::Issue> issues; // только для Compile
    std::string cause;               // исходное сообщение нижнего уровня

    /// Текст ошибки; для Compile: с перечнем issues
    std::string format() const;
};

// ============================================================================
// Декларации и результаты
// ============================================================================

/// Дополнительная декларация переменной от хоста
/// value == nullopt: переменная связывается со значением документа с тем же
/// именем, если оно есть, иначе остаётся несвязанной
struct Declaration {
    std::string name;
    ValueKind kind;
    std::optional<Value> value;
};

/// Вердикт
struct Verdict {
    bool ok = false;
    bool matched = false;
    Error error;

    explicit operator bool() const { return ok; }
};

/// Результат построения окружения
struct EnvironmentResult {
    bool ok = false;
    std::shared_ptr<const Environment> environment;
    Error error;

    explicit operator bool() const { return ok; }
};

/// Результат подготовки: окружение и скомпилированный Program
struct Prepared {
    bool ok = false;
    std::shared_ptr<const Environment> environment;
    std::shared_ptr<const Program> program;
    Error error;

    explicit operator bool() const { return ok; }
};

// ============================================================================
// Стадии
// ============================================================================

/// Построить окружение: переменные документа, exists/safe, стандартная
/// библиотека, затем дополнительные декларации (они имеют приоритет)
EnvironmentResult build_environment(std::shared_ptr<const Payload> payload,
                                    const std::vector<Declaration>& extra = {});

/// Проверить, что результат вычисления имеет тип bool
Verdict validate_result(const Value& result, std::string_view expression = {});

/// Разобрать документ, построить окружение и скомпилировать выражение
/// (всё, кроме вычисления)
Prepared prepare(const std::string* data, std::string_view expression,
                 const std::vector<Declaration>& extra = {});

/// Вычислить правило над документом
/// @param data Исходный текст документа (nullptr -> NilInput)
/// @param expression Текст правила
/// @param extra Дополнительные декларации
Verdict evaluate(const std::string* data, std::string_view expression,
                 const std::vector<Declaration>& extra = {});

}  // namespace ruleval

#endif  // RULEVAL_ENGINE_HPP
