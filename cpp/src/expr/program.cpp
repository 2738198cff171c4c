// ==============================================================================
// program.cpp - Компиляция и интерпретатор выражений
// ==============================================================================

#include "ruleval/program.hpp"

#include <cmath>
#include <limits>
#include <optional>
#include <utility>

#include "ruleval/parser.hpp"

namespace ruleval {

using namespace expr;

namespace {

// ============================================================================
// Сравнение значений
// ============================================================================

std::string kind_name(const Value& v) {
    return to_string(classify(v));
}

[[noreturn]] void no_overload(const char* name, const Value& a, const Value& b) {
    throw EvaluationFailure(std::string("no matching overload for '") + name +
                            "' applied to '(" + kind_name(a) + ", " + kind_name(b) + ")'");
}

template <typename T>
int three_way(const T& a, const T& b) {
    return a < b ? -1 : (b < a ? 1 : 0);
}

// Сравнение int64 с double без потери точности
std::optional<int> compare_int_double(std::int64_t i, double d) {
    if (std::isnan(d)) {
        return std::nullopt;
    }
    constexpr double limit = 9223372036854775808.0;  // 2^63
    if (d >= limit) {
        return -1;
    }
    if (d < -limit) {
        return 1;
    }
    auto truncated = static_cast<std::int64_t>(d);
    if (i != truncated) {
        return three_way(i, truncated);
    }
    double fraction = d - static_cast<double>(truncated);
    return fraction > 0 ? -1 : (fraction < 0 ? 1 : 0);
}

std::optional<int> compare_uint_double(std::uint64_t u, double d) {
    if (std::isnan(d)) {
        return std::nullopt;
    }
    constexpr double limit = 18446744073709551616.0;  // 2^64
    if (d >= limit) {
        return -1;
    }
    if (d < 0) {
        return 1;
    }
    auto truncated = static_cast<std::uint64_t>(d);
    if (u != truncated) {
        return three_way(u, truncated);
    }
    double fraction = d - static_cast<double>(truncated);
    return fraction > 0 ? -1 : 0;
}

std::optional<int> flip(std::optional<int> r) {
    if (r) {
        return -*r;
    }
    return r;
}

/// Сравнение двух чисел любых числовых типов (nullopt для NaN)
std::optional<int> compare_numbers(const Value& a, const Value& b) {
    if (a.is_int()) {
        if (b.is_int())
            return three_way(a.as_int(), b.as_int());
        if (b.is_uint()) {
            if (a.as_int() < 0)
                return -1;
            return three_way(static_cast<std::uint64_t>(a.as_int()), b.as_uint());
        }
        return compare_int_double(a.as_int(), b.as_double());
    }
    if (a.is_uint()) {
        if (b.is_uint())
            return three_way(a.as_uint(), b.as_uint());
        if (b.is_int())
            return flip(compare_numbers(b, a));
        return compare_uint_double(a.as_uint(), b.as_double());
    }
    // a имеет тип double
    if (b.is_double()) {
        if (std::isnan(a.as_double()) || std::isnan(b.as_double()))
            return std::nullopt;
        return three_way(a.as_double(), b.as_double());
    }
    return flip(compare_numbers(b, a));
}

bool values_equal(const Value& a, const Value& b);

bool objects_equal(const ValueObject& a, const ValueObject& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (const auto& [key, value] : a) {
        auto it = b.find(key);
        if (it == b.end() || !values_equal(value, it->second)) {
            return false;
        }
    }
    return true;
}

/// Равенство с гетерогенным сравнением чисел; разные типы не равны
bool values_equal(const Value& a, const Value& b) {
    if (a.is_number() && b.is_number()) {
        auto cmp = compare_numbers(a, b);
        return cmp && *cmp == 0;
    }
    if (a.is_null() || b.is_null()) {
        return a.is_null() && b.is_null();
    }
    if (a.is_bool() && b.is_bool())
        return a.as_bool() == b.as_bool();
    if (a.is_string() && b.is_string())
        return a.as_string() == b.as_string();
    if (a.is_bytes() && b.is_bytes())
        return a.as_bytes() == b.as_bytes();
    if (a.is_timestamp() && b.is_timestamp())
        return a.as_timestamp() == b.as_timestamp();
    if (a.is_array() && b.is_array()) {
        const auto& x = a.as_array();
        const auto& y = b.as_array();
        if (x.size() != y.size()) {
            return false;
        }
        for (std::size_t i = 0; i < x.size(); ++i) {
            if (!values_equal(x[i], y[i])) {
                return false;
            }
        }
        return true;
    }
    if (a.is_object() && b.is_object())
        return objects_equal(a.as_object(), b.as_object());
    if (a.is_host() && b.is_host()) {
        return a.as_host().type_name == b.as_host().type_name &&
               objects_equal(a.as_host().fields, b.as_host().fields);
    }
    return false;
}

/// Порядок значений (nullopt, если несравнимы, как NaN)
std::optional<int> compare_values(const char* op, const Value& a, const Value& b) {
    if (a.is_number() && b.is_number())
        return compare_numbers(a, b);
    if (a.is_string() && b.is_string())
        return three_way(a.as_string(), b.as_string());
    if (a.is_bytes() && b.is_bytes())
        return three_way(a.as_bytes().data, b.as_bytes().data);
    if (a.is_bool() && b.is_bool())
        return three_way(a.as_bool(), b.as_bool());
    if (a.is_timestamp() && b.is_timestamp()) {
        const auto& x = a.as_timestamp();
        const auto& y = b.as_timestamp();
        return x < y ? -1 : (y < x ? 1 : 0);
    }
    no_overload(op, a, b);
}

// ============================================================================
// Арифметика
// ============================================================================

// Переполнение проверяется до операции: знаковое переполнение в C++ - UB
bool add_overflows(std::int64_t x, std::int64_t y) {
    constexpr auto max = std::numeric_limits<std::int64_t>::max();
    constexpr auto min = std::numeric_limits<std::int64_t>::min();
    return (y > 0 && x > max - y) || (y < 0 && x < min - y);
}

bool sub_overflows(std::int64_t x, std::int64_t y) {
    constexpr auto max = std::numeric_limits<std::int64_t>::max();
    constexpr auto min = std::numeric_limits<std::int64_t>::min();
    return (y < 0 && x > max + y) || (y > 0 && x < min + y);
}

bool mul_overflows(std::int64_t x, std::int64_t y) {
    constexpr auto max = std::numeric_limits<std::int64_t>::max();
    constexpr auto min = std::numeric_limits<std::int64_t>::min();
    if (x == 0 || y == 0) {
        return false;
    }
    if (x > 0) {
        return y > 0 ? x > max / y : y < min / x;
    }
    return y > 0 ? x < min / y : x < max / y;
}

bool mul_overflows(std::uint64_t x, std::uint64_t y) {
    return y != 0 && x > std::numeric_limits<std::uint64_t>::max() / y;
}

Value arithmetic(BinaryOp op, const Value& a, const Value& b) {
    const char* name = operator_name(op);

    if (a.is_int() && b.is_int()) {
        std::int64_t x = a.as_int();
        std::int64_t y = b.as_int();
        switch (op) {
        case BinaryOp::Add:
            if (add_overflows(x, y))
                throw EvaluationFailure("int overflow");
            return Value(x + y);
        case BinaryOp::Subtract:
            if (sub_overflows(x, y))
                throw EvaluationFailure("int overflow");
            return Value(x - y);
        case BinaryOp::Multiply:
            if (mul_overflows(x, y))
                throw EvaluationFailure("int overflow");
            return Value(x * y);
        case BinaryOp::Divide:
            if (y == 0)
                throw EvaluationFailure("division by zero");
            if (x == std::numeric_limits<std::int64_t>::min() && y == -1)
                throw EvaluationFailure("int overflow");
            return Value(x / y);
        case BinaryOp::Modulo:
            if (y == 0)
                throw EvaluationFailure("modulus by zero");
            if (x == std::numeric_limits<std::int64_t>::min() && y == -1)
                throw EvaluationFailure("int overflow");
            return Value(x % y);
        default:
            break;
        }
    }

    if (a.is_uint() && b.is_uint()) {
        std::uint64_t x = a.as_uint();
        std::uint64_t y = b.as_uint();
        switch (op) {
        case BinaryOp::Add:
            if (x > std::numeric_limits<std::uint64_t>::max() - y)
                throw EvaluationFailure("uint overflow");
            return Value(x + y);
        case BinaryOp::Subtract:
            if (x < y)
                throw EvaluationFailure("uint overflow");
            return Value(x - y);
        case BinaryOp::Multiply:
            if (mul_overflows(x, y))
                throw EvaluationFailure("uint overflow");
            return Value(x * y);
        case BinaryOp::Divide:
            if (y == 0)
                throw EvaluationFailure("division by zero");
            return Value(x / y);
        case BinaryOp::Modulo:
            if (y == 0)
                throw EvaluationFailure("modulus by zero");
            return Value(x % y);
        default:
            break;
        }
    }

    if (a.is_double() && b.is_double() && op != BinaryOp::Modulo) {
        double x = a.as_double();
        double y = b.as_double();
        switch (op) {
        case BinaryOp::Add:
            return Value(x + y);
        case BinaryOp::Subtract:
            return Value(x - y);
        case BinaryOp::Multiply:
            return Value(x * y);
        case BinaryOp::Divide:
            return Value(x / y);
        default:
            break;
        }
    }

    if (op == BinaryOp::Add) {
        if (a.is_string() && b.is_string()) {
            return Value(a.as_string() + b.as_string());
        }
        if (a.is_bytes() && b.is_bytes()) {
            return Value::make_bytes(a.as_bytes().data + b.as_bytes().data);
        }
        if (a.is_array() && b.is_array()) {
            ValueArray joined = a.as_array();
            joined.insert(joined.end(), b.as_array().begin(), b.as_array().end());
            return Value(std::move(joined));
        }
    }

    no_overload(name, a, b);
}

// ============================================================================
// Interpreter
// ============================================================================

class Interpreter {
public:
    Interpreter(const Environment& env, const CheckedExpression& checked)
        : env_(env), checked_(checked) {}

    Value eval(const Expression& node) {
        return std::visit([&](const auto& data) { return eval_node(node, data); }, node.data);
    }

private:
    const Reference* reference(const Expression& node) const {
        auto it = checked_.references.find(node.id);
        return it != checked_.references.end() ? &it->second : nullptr;
    }

    const Value* find_local(const std::string& name) const {
        for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
            if (it->first == name) {
                return &it->second;
            }
        }
        return nullptr;
    }

    Value variable_value(const std::string& name) const {
        const VariableBinding* var = env_.find_variable(name);
        if (var == nullptr) {
            throw EvaluationFailure("undeclared reference to '" + name + "'");
        }
        if (!var->value) {
            throw EvaluationFailure("no value bound for variable '" + name + "'");
        }
        return *var->value;
    }

    bool as_condition(const Value& v, const char* context) const {
        if (!v.is_bool()) {
            throw EvaluationFailure(std::string("no matching overload for '") + context +
                                    "' applied to '(" + kind_name(v) + ")'");
        }
        return v.as_bool();
    }

    // ------------------------------------------------------------------------
    // Узлы
    // ------------------------------------------------------------------------

    Value eval_node(const Expression&, const ExprLiteral& lit) { return lit.value; }

    Value eval_node(const Expression&, const ExprIdent& ident) {
        if (const Value* local = find_local(ident.name)) {
            return *local;
        }
        return variable_value(ident.name);
    }

    Value eval_node(const Expression& node, const ExprSelect& select) {
        if (const Reference* ref = reference(node); ref && ref->is_variable()) {
            return variable_value(ref->variable);
        }

        Value operand = eval(*select.operand);
        const ValueObject* fields = operand.get_object();
        if (fields == nullptr) {
            if (const HostObject* host = operand.get_host()) {
                fields = &host->fields;
            }
        }
        if (fields == nullptr) {
            throw EvaluationFailure("type '" + kind_name(operand) +
                                    "' does not support field selection");
        }

        auto it = fields->find(select.field);
        if (select.test_only) {
            return Value(it != fields->end());
        }
        if (it == fields->end()) {
            throw EvaluationFailure((operand.is_host() ? "no such field: '" : "no such key: '") +
                                    select.field + "'");
        }
        return it->second;
    }

    Value eval_node(const Expression&, const ExprIndex& index) {
        Value operand = eval(*index.operand);
        Value key = eval(*index.index);

        if (const ValueArray* list = operand.get_array()) {
            std::int64_t position = 0;
            if (key.is_int()) {
                position = key.as_int();
            } else if (key.is_uint() &&
                       key.as_uint() <= static_cast<std::uint64_t>(
                                            std::numeric_limits<std::int64_t>::max())) {
                position = static_cast<std::int64_t>(key.as_uint());
            } else if (key.is_uint()) {
                position = -1;
            } else {
                no_overload("_[_]", operand, key);
            }
            if (position < 0 || static_cast<std::uint64_t>(position) >= list->size()) {
                throw EvaluationFailure("index out of range: " + key.to_json());
            }
            return (*list)[static_cast<std::size_t>(position)];
        }

        if (const ValueObject* map = operand.get_object()) {
            if (!key.is_string()) {
                no_overload("_[_]", operand, key);
            }
            auto it = map->find(key.as_string());
            if (it == map->end()) {
                throw EvaluationFailure("no such key: '" + key.as_string() + "'");
            }
            return it->second;
        }

        no_overload("_[_]", operand, key);
    }

    Value eval_node(const Expression& node, const ExprCall& call) {
        std::vector<Value> args;
        args.reserve(call.args.size() + 1);
        if (call.target) {
            args.push_back(eval(*call.target));
        }
        for (const auto& arg : call.args) {
            args.push_back(eval(arg));
        }

        // Выбор перегрузки по фактическим типам аргументов
        const Reference* ref = reference(node);
        if (ref != nullptr) {
            for (const auto& id : ref->overload_ids) {
                const Overload* overload = env_.find_overload(id);
                if (overload == nullptr || overload->params.size() != args.size()) {
                    continue;
                }
                bool match = true;
                for (std::size_t i = 0; i < args.size() && match; ++i) {
                    match = is_assignable(overload->params[i], classify(args[i]));
                }
                if (match) {
                    return overload->impl(args);
                }
            }
        }

        std::string kinds;
        for (std::size_t i = 0; i < args.size(); ++i) {
            if (i > 0)
                kinds += ", ";
            kinds += kind_name(args[i]);
        }
        throw EvaluationFailure("no matching overload for '" + call.function + "' applied to '(" +
                                kinds + ")'");
    }

    Value eval_node(const Expression&, const ExprList& list) {
        ValueArray out;
        out.reserve(list.elements.size());
        for (const auto& element : list.elements) {
            out.push_back(eval(element));
        }
        return Value(std::move(out));
    }

    Value eval_node(const Expression&, const ExprMap& map) {
        ValueObject out;
        for (const auto& entry : map.entries) {
            Value key = eval(*entry.key);
            if (!key.is_string()) {
                throw EvaluationFailure("unsupported map key type: " + kind_name(key));
            }
            Value value = eval(*entry.value);
            if (!out.emplace(key.as_string(), std::move(value)).second) {
                throw EvaluationFailure("repeated map key: '" + key.as_string() + "'");
            }
        }
        return Value(std::move(out));
    }

    Value eval_node(const Expression&, const ExprUnary& unary) {
        Value operand = eval(*unary.operand);
        if (unary.op == UnaryOp::Not) {
            return Value(!as_condition(operand, operator_name(unary.op)));
        }
        if (operand.is_int()) {
            if (operand.as_int() == std::numeric_limits<std::int64_t>::min()) {
                throw EvaluationFailure("int overflow");
            }
            return Value(-operand.as_int());
        }
        if (operand.is_double()) {
            return Value(-operand.as_double());
        }
        throw EvaluationFailure(std::string("no matching overload for '") +
                                operator_name(unary.op) + "' applied to '(" +
                                kind_name(operand) + ")'");
    }

    // && / ||: ошибка одной стороны поглощается, если другая сторона решает исход
    Value logical(const ExprBinary& binary) {
        const bool deciding = binary.op == BinaryOp::Or;  // true для ||, false для &&
        const char* name = operator_name(binary.op);

        std::optional<Value> left;
        std::optional<EvaluationFailure> left_error;
        try {
            left = eval(*binary.left);
        } catch (const EvaluationFailure& e) {
            left_error = e;
        }
        if (left && left->is_bool() && left->as_bool() == deciding) {
            return Value(deciding);
        }

        std::optional<Value> right;
        std::optional<EvaluationFailure> right_error;
        try {
            right = eval(*binary.right);
        } catch (const EvaluationFailure& e) {
            right_error = e;
        }
        if (right && right->is_bool() && right->as_bool() == deciding) {
            return Value(deciding);
        }

        if (left_error) {
            throw *left_error;
        }
        if (right_error) {
            throw *right_error;
        }
        if (!left->is_bool() || !right->is_bool()) {
            no_overload(name, *left, *right);
        }
        return Value(!deciding);
    }

    Value eval_node(const Expression&, const ExprBinary& binary) {
        if (binary.op == BinaryOp::And || binary.op == BinaryOp::Or) {
            return logical(binary);
        }

        Value left = eval(*binary.left);
        Value right = eval(*binary.right);
        const char* name = operator_name(binary.op);

        switch (binary.op) {
        case BinaryOp::Equal:
            return Value(values_equal(left, right));
        case BinaryOp::NotEqual:
            return Value(!values_equal(left, right));
        case BinaryOp::Less: {
            auto cmp = compare_values(name, left, right);
            return Value(cmp && *cmp < 0);
        }
        case BinaryOp::LessEqual: {
            auto cmp = compare_values(name, left, right);
            return Value(cmp && *cmp <= 0);
        }
        case BinaryOp::Greater: {
            auto cmp = compare_values(name, left, right);
            return Value(cmp && *cmp > 0);
        }
        case BinaryOp::GreaterEqual: {
            auto cmp = compare_values(name, left, right);
            return Value(cmp && *cmp >= 0);
        }
        case BinaryOp::In:
            return Value(contains(left, right));
        default:
            return arithmetic(binary.op, left, right);
        }
    }

    bool contains(const Value& element, const Value& container) const {
        if (const ValueArray* list = container.get_array()) {
            for (const auto& item : *list) {
                if (values_equal(element, item)) {
                    return true;
                }
            }
            return false;
        }
        if (const ValueObject* map = container.get_object()) {
            return element.is_string() && map->count(element.as_string()) > 0;
        }
        no_overload("@in", element, container);
    }

    Value eval_node(const Expression&, const ExprConditional& cond) {
        Value condition = eval(*cond.condition);
        if (as_condition(condition, "_?_:_")) {
            return eval(*cond.when_true);
        }
        return eval(*cond.when_false);
    }

    Value eval_node(const Expression&, const ExprComprehension& comp) {
        Value range = eval(*comp.range);

        ValueArray items;
        if (const ValueArray* list = range.get_array()) {
            items = *list;
        } else if (const ValueObject* map = range.get_object()) {
            for (const auto& [key, value] : *map) {
                items.emplace_back(key);
            }
        } else {
            throw EvaluationFailure("expression of type '" + kind_name(range) +
                                    "' cannot be range of a comprehension");
        }

        const char* name = macro_name(comp.macro);
        std::optional<EvaluationFailure> first_error;
        std::int64_t true_count = 0;
        ValueArray collected;

        for (const auto& item : items) {
            scopes_.emplace_back(comp.variable, item);
            std::optional<Value> body;
            try {
                body = eval(*comp.body);
            } catch (const EvaluationFailure& e) {
                scopes_.pop_back();
                // all/exists: ошибка поглощается, если результат решён другим элементом
                if (comp.macro == MacroKind::All || comp.macro == MacroKind::Exists) {
                    if (!first_error) {
                        first_error = e;
                    }
                    continue;
                }
                throw;
            }
            scopes_.pop_back();

            switch (comp.macro) {
            case MacroKind::All:
                if (!as_condition(*body, name)) {
                    return Value(false);
                }
                break;
            case MacroKind::Exists:
                if (as_condition(*body, name)) {
                    return Value(true);
                }
                break;
            case MacroKind::ExistsOne:
                if (as_condition(*body, name)) {
                    ++true_count;
                }
                break;
            case MacroKind::Filter:
                if (as_condition(*body, name)) {
                    collected.push_back(item);
                }
                break;
            case MacroKind::Map:
                collected.push_back(std::move(*body));
                break;
            }
        }

        if (first_error) {
            throw *first_error;
        }

        switch (comp.macro) {
        case MacroKind::All:
            return Value(true);
        case MacroKind::Exists:
            return Value(false);
        case MacroKind::ExistsOne:
            return Value(true_count == 1);
        case MacroKind::Filter:
        case MacroKind::Map:
            break;
        }
        return Value(std::move(collected));
    }

    const Environment& env_;
    const CheckedExpression& checked_;
    std::vector<std::pair<std::string, Value>> scopes_;
};

}  // namespace

// ============================================================================
// Program
// ============================================================================

Program::EvalResult Program::eval() const {
    EvalResult result;
    try {
        Interpreter interpreter(*env_, checked_);
        result.value = interpreter.eval(checked_.root);
        result.ok = true;
    } catch (const EvaluationFailure& e) {
        result.error = e.what();
    }
    return result;
}

CompileResult compile(std::shared_ptr<const Environment> env, std::string_view source) {
    CompileResult result;
    if (!env) {
        result.issues.push_back(Issue{0, "no environment to compile against"});
        return result;
    }

    auto parsed = parse(source);
    if (!parsed) {
        result.issues = std::move(parsed.issues);
        return result;
    }

    auto checked = check(std::move(parsed.expression), *env);
    if (!checked) {
        result.issues = std::move(checked.issues);
        return result;
    }

    result.program = std::shared_ptr<const Program>(
        new Program(std::move(env), std::string(source), std::move(checked.checked)));
    result.ok = true;
    return result;
}

}  // namespace ruleval
