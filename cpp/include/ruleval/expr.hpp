// ==============================================================================
// ruleval/expr.hpp - AST выражений правил
// ==============================================================================
//
// Назначение:
// - Expression: рекурсивный AST узел (variant по типам узлов)
// - Каждый узел имеет id (для таблиц типов и ссылок) и позицию в тексте
// - Issue: диагностика парсера и проверки типов
//
// ==============================================================================

#ifndef RULEVAL_EXPR_HPP
#define RULEVAL_EXPR_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "ruleval/value.hpp"

namespace ruleval::expr {

// ============================================================================
// Enums
// ============================================================================

/// Унарный оператор
enum class UnaryOp {
    Not,    // !
    Negate  // -
};

/// Бинарный оператор
enum class BinaryOp {
    Or,            // ||
    And,           // &&
    Equal,         // ==
    NotEqual,      // !=
    Less,          // <
    LessEqual,     // <=
    Greater,       // >
    GreaterEqual,  // >=
    In,            // in
    Add,           // +
    Subtract,      // -
    Multiply,      // *
    Divide,        // /
    Modulo         // %
};

/// Макрос-итератор над list/map
enum class MacroKind {
    All,        // r.all(x, p)
    Exists,     // r.exists(x, p)
    ExistsOne,  // r.exists_one(x, p)
    Filter,     // r.filter(x, p)
    Map         // r.map(x, e)
};

// ============================================================================
// Expression - AST
// ============================================================================

struct Expression;
using ExpressionPtr = std::unique_ptr<Expression>;
using ExpressionVec = std::vector<Expression>;

/// Литерал (bool, int, uint, double, string, bytes, null)
struct ExprLiteral {
    Value value;
};

/// Ссылка на переменную
struct ExprIdent {
    std::string name;
};

/// Выбор поля operand.field; test_only = true для has(operand.field)
struct ExprSelect {
    ExpressionPtr operand;
    std::string field;
    bool test_only = false;
};

/// Индекс operand[index]
struct ExprIndex {
    ExpressionPtr operand;
    ExpressionPtr index;
};

/// Вызов функции: f(args) или target.f(args)
struct ExprCall {
    std::string function;
    ExpressionPtr target;  // nullptr для глобального вызова
    ExpressionVec args;
};

/// Литерал списка [a, b, c]
struct ExprList {
    ExpressionVec elements;
};

/// Элемент литерала map
struct MapEntry {
    ExpressionPtr key;
    ExpressionPtr value;
};

/// Литерал map {k: v}
struct ExprMap {
    std::vector<MapEntry> entries;
};

/// Унарная операция
struct ExprUnary {
    UnaryOp op;
    ExpressionPtr operand;
};

/// Бинарная операция
struct ExprBinary {
    BinaryOp op;
    ExpressionPtr left;
    ExpressionPtr right;
};

/// Условный оператор cond ? a : b
struct ExprConditional {
    ExpressionPtr condition;
    ExpressionPtr when_true;
    ExpressionPtr when_false;
};

/// Макрос-итератор: range.macro(variable, body)
struct ExprComprehension {
    MacroKind macro;
    std::string variable;
    ExpressionPtr range;
    ExpressionPtr body;
};

using ExpressionVariant =
    std::variant<ExprLiteral, ExprIdent, ExprSelect, ExprIndex, ExprCall, ExprList, ExprMap,
                 ExprUnary, ExprBinary, ExprConditional, ExprComprehension>;

/// Expression - рекурсивный AST узел
struct Expression {
    std::int64_t id = 0;
    std::size_t offset = 0;  // позиция начала узла в исходном тексте
    ExpressionVariant data;

    Expression() : data(ExprLiteral{}) {}
    Expression(std::int64_t node_id, std::size_t pos, ExpressionVariant v)
        : id(node_id), offset(pos), data(std::move(v)) {}

    template <typename T>
    const T* get() const {
        return std::get_if<T>(&data);
    }
};

// ============================================================================
// Issue - диагностика
// ============================================================================

/// Проблема, найденная при разборе или проверке выражения
struct Issue {
    std::size_t offset = 0;
    std::string message;

    /// Форматировать относительно исходного текста:
    /// "ERROR: <input>:LINE:COL: message"
    std::string format(std::string_view source) const;
};

/// Форматировать все issues, по одному в строке
std::string format_issues(const std::vector<Issue>& issues, std::string_view source);

/// Текстовое имя оператора ("_&&_", "_==_", "!_", ...) для диагностики
const char* operator_name(BinaryOp op);
const char* operator_name(UnaryOp op);

/// Имя макроса ("all", "exists", ...)
const char* macro_name(MacroKind macro);

}  // namespace ruleval::expr

#endif  // RULEVAL_EXPR_HPP
