// ==============================================================================
// ruleval/env.hpp - Окружение выражений (переменные и функции)
// ==============================================================================
//
// Назначение:
// - VariableBinding: имя, ValueKind и (опционально) значение переменной
// - Overload / FunctionDecl: объявления функций с реализациями
// - EnvironmentBuilder: builder pattern для создания Environment
// - Environment: неизменяемый набор объявлений одного вычисления
//
// Окружение строится заново на каждое вычисление и разделяется между
// проверкой типов и интерпретатором через shared_ptr.
//
// ==============================================================================

#ifndef RULEVAL_ENV_HPP
#define RULEVAL_ENV_HPP

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "ruleval/kind.hpp"
#include "ruleval/value.hpp"

namespace ruleval {

// ============================================================================
// EvaluationFailure: ошибка времени выполнения
// ============================================================================

/// Ошибка времени выполнения (выход за границы, переполнение, неверная
/// конверсия). Бросается реализациями функций и интерпретатором,
/// перехватывается в Program::eval и не выходит за его пределы.
class EvaluationFailure : public std::runtime_error {
public:
    explicit EvaluationFailure(const std::string& message) : std::runtime_error(message) {}
};

// ============================================================================
// Объявления
// ============================================================================

/// Переменная окружения
struct VariableBinding {
    std::string name;
    ValueKind kind;
    std::optional<Value> value;  // nullopt: объявлена, но не связана
};

/// Реализация перегрузки: аргументы уже вычислены (receiver первым)
using FunctionImpl = std::function<Value(const std::vector<Value>& args)>;

/// Одна перегрузка функции
struct Overload {
    std::string id;                 // уникальный идентификатор ("safe_string", ...)
    std::vector<ValueKind> params;  // для receiver_style params[0]: тип receiver
    ValueKind result;
    bool receiver_style = false;    // x.f(y) вместо f(x, y)
    FunctionImpl impl;
};

/// Функция со списком перегрузок
struct FunctionDecl {
    std::string name;
    std::vector<Overload> overloads;
};

// ============================================================================
// Environment
// ============================================================================

class EnvironmentBuilder;

/// Окружение одного вычисления
class Environment {
public:
    /// Найти переменную по имени
    const VariableBinding* find_variable(const std::string& name) const;

    /// Найти функцию по имени
    const FunctionDecl* find_function(const std::string& name) const;

    /// Найти перегрузку по id
    const Overload* find_overload(const std::string& id) const;

    /// Все переменные в порядке имён
    const std::vector<VariableBinding>& variables() const { return variables_; }

    /// Все функции
    const std::map<std::string, FunctionDecl>& functions() const { return functions_; }

private:
    friend class EnvironmentBuilder;

    std::vector<VariableBinding> variables_;
    std::map<std::string, std::size_t> variable_index_;
    std::map<std::string, FunctionDecl> functions_;
    std::map<std::string, const Overload*> overload_index_;
};

// ============================================================================
// EnvironmentBuilder: builder pattern
// ============================================================================

/// Builder для создания Environment
///
/// Использование:
/// @code
///   auto result = EnvironmentBuilder::create()
///       .stdlib()
///       .variable("age", KindTag::Int, Value(std::int64_t{30}))
///       .build();
///   if (result.ok) {
///       auto program = compile(result.environment, "age > 18");
///   }
/// @endcode
///
/// Повторное объявление переменной заменяет предыдущее. Перегрузки
/// функции с уже объявленным именем добавляются к существующим.
class EnvironmentBuilder {
public:
    /// Создать builder
    static EnvironmentBuilder create();

    /// Объявить переменную
    EnvironmentBuilder& variable(std::string name, ValueKind kind,
                                 std::optional<Value> value = std::nullopt);

    /// Объявить функцию (или добавить перегрузки к существующей)
    EnvironmentBuilder& function(FunctionDecl decl);

    /// Зарегистрировать стандартную библиотеку
    EnvironmentBuilder& stdlib();

    /// Собрать Environment
    /// Ошибки: пустое имя, значение не соответствует объявленному типу,
    /// повторный id перегрузки
    struct BuildResult {
        bool ok = false;
        std::shared_ptr<const Environment> environment;
        std::string error;

        explicit operator bool() const { return ok; }
    };
    BuildResult build();

private:
    EnvironmentBuilder() = default;

    std::vector<VariableBinding> variables_;
    std::vector<FunctionDecl> functions_;
};

/// Функции стандартной библиотеки (size, contains, matches, конверсии, ...)
std::vector<FunctionDecl> standard_library();

}  // namespace ruleval

#endif  // RULEVAL_ENV_HPP
