// ==============================================================================
// checker.cpp - Проверка типов и разрешение ссылок
// ==============================================================================

#include "ruleval/checker.hpp"

#include <algorithm>
#include <optional>
#include <utility>

namespace ruleval::expr {

ValueKind CheckedExpression::result_kind() const {
    auto it = types.find(root.id);
    return it != types.end() ? it->second : ValueKind::dyn();
}

namespace {

bool is_bool_like(const ValueKind& k) {
    return k.tag == KindTag::Bool || k.is_dyn();
}

bool is_numeric_or_dyn(const ValueKind& k) {
    return k.is_numeric() || k.is_dyn();
}

// Типы, для которых определён оператор +
bool supports_add(const ValueKind& k) {
    switch (k.tag) {
    case KindTag::Int:
    case KindTag::Uint:
    case KindTag::Double:
    case KindTag::String:
    case KindTag::Bytes:
    case KindTag::List:
        return true;
    default:
        return k.is_dyn();
    }
}

// Типы, сравнимые операторами порядка сами с собой
bool supports_ordering(const ValueKind& k) {
    switch (k.tag) {
    case KindTag::Int:
    case KindTag::Uint:
    case KindTag::Double:
    case KindTag::String:
    case KindTag::Bytes:
    case KindTag::Bool:
    case KindTag::Timestamp:
        return true;
    default:
        return false;
    }
}

std::string describe_args(const std::vector<ValueKind>& kinds) {
    std::string out = "(";
    for (std::size_t i = 0; i < kinds.size(); ++i) {
        if (i > 0)
            out += ", ";
        out += to_string(kinds[i]);
    }
    out += ")";
    return out;
}

// ============================================================================
// Checker
// ============================================================================

class Checker {
public:
    explicit Checker(const Environment& env) : env_(env) {}

    CheckResult run(Expression root) {
        CheckResult result;
        visit(root);

        std::stable_sort(issues_.begin(), issues_.end(),
                         [](const Issue& a, const Issue& b) { return a.offset < b.offset; });

        result.ok = issues_.empty();
        result.issues = std::move(issues_);
        result.checked.root = std::move(root);
        result.checked.types = std::move(types_);
        result.checked.references = std::move(references_);
        return result;
    }

private:
    ValueKind set_type(const Expression& node, ValueKind kind) {
        types_[node.id] = kind;
        return kind;
    }

    void issue(const Expression& node, std::string message) {
        issues_.push_back(Issue{node.offset, std::move(message)});
    }

    void no_overload(const Expression& node, const std::string& name,
                     const std::vector<ValueKind>& kinds) {
        issue(node, "found no matching overload for '" + name + "' applied to '" +
                        describe_args(kinds) + "'");
    }

    // Переменная макроса (ближайшая в стеке областей видимости)
    const ValueKind* find_local(const std::string& name) const {
        for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
            if (it->first == name) {
                return &it->second;
            }
        }
        return nullptr;
    }

    // a.b.c -> "a.b.c", если цепочка Select заканчивается идентификатором
    static std::optional<std::string> qualified_name(const Expression& node) {
        if (const auto* ident = node.get<ExprIdent>()) {
            return ident->name;
        }
        if (const auto* select = node.get<ExprSelect>()) {
            if (select->test_only) {
                return std::nullopt;
            }
            auto prefix = qualified_name(*select->operand);
            if (prefix) {
                return *prefix + "." + select->field;
            }
        }
        return std::nullopt;
    }

    static std::string root_name(const std::string& qualified) {
        return qualified.substr(0, qualified.find('.'));
    }

    ValueKind visit(const Expression& node) {
        return std::visit([&](const auto& data) { return set_type(node, check_node(node, data)); },
                          node.data);
    }

    // ------------------------------------------------------------------------
    // Узлы
    // ------------------------------------------------------------------------

    ValueKind check_node(const Expression&, const ExprLiteral& lit) { return classify(lit.value); }

    ValueKind check_node(const Expression& node, const ExprIdent& ident) {
        if (const ValueKind* local = find_local(ident.name)) {
            return *local;
        }
        if (const VariableBinding* var = env_.find_variable(ident.name)) {
            references_[node.id] = Reference{var->name, {}};
            return var->kind;
        }
        issue(node, "undeclared reference to '" + ident.name + "'");
        return ValueKind::dyn();
    }

    ValueKind check_node(const Expression& node, const ExprSelect& select) {
        // Квалифицированное имя переменной побеждает выбор поля
        if (!select.test_only) {
            auto name = qualified_name(node);
            if (name && find_local(root_name(*name)) == nullptr) {
                if (const VariableBinding* var = env_.find_variable(*name)) {
                    references_[node.id] = Reference{var->name, {}};
                    return var->kind;
                }
            }
        }

        ValueKind operand = visit(*select.operand);
        if (operand.tag != KindTag::Mapping && operand.tag != KindTag::OpaqueObject) {
            issue(node, "type '" + to_string(operand) + "' does not support field selection");
        }
        if (select.test_only) {
            return KindTag::Bool;
        }
        return ValueKind::dyn();
    }

    ValueKind check_node(const Expression& node, const ExprIndex& index) {
        ValueKind operand = visit(*index.operand);
        ValueKind key = visit(*index.index);

        bool ok = false;
        if (operand.is_dyn()) {
            ok = true;
        } else if (operand.tag == KindTag::List) {
            ok = key.tag == KindTag::Int || key.tag == KindTag::Uint || key.is_dyn();
        } else if (operand.tag == KindTag::Mapping) {
            ok = key.tag == KindTag::String || key.is_dyn();
        }
        if (!ok) {
            no_overload(node, "_[_]", {operand, key});
        }
        return ValueKind::dyn();
    }

    ValueKind check_node(const Expression& node, const ExprCall& call) {
        std::vector<ValueKind> kinds;
        if (call.target) {
            kinds.push_back(visit(*call.target));
        }
        for (const auto& arg : call.args) {
            kinds.push_back(visit(arg));
        }

        const FunctionDecl* decl = env_.find_function(call.function);
        if (decl == nullptr) {
            issue(node, "undeclared reference to '" + call.function + "'");
            return ValueKind::dyn();
        }

        bool receiver_style = call.target != nullptr;
        std::vector<const Overload*> candidates;
        for (const auto& overload : decl->overloads) {
            if (overload.receiver_style != receiver_style ||
                overload.params.size() != kinds.size()) {
                continue;
            }
            bool match = true;
            for (std::size_t i = 0; i < kinds.size() && match; ++i) {
                match = is_assignable(overload.params[i], kinds[i]);
            }
            if (match) {
                candidates.push_back(&overload);
            }
        }

        if (candidates.empty()) {
            if (receiver_style) {
                std::vector<ValueKind> rest(kinds.begin() + 1, kinds.end());
                issue(node, "found no matching overload for '" + call.function +
                                "' applied to '" + to_string(kinds.front()) + "." +
                                describe_args(rest) + "'");
            } else {
                no_overload(node, call.function, kinds);
            }
            return ValueKind::dyn();
        }

        Reference ref;
        ValueKind result = candidates.front()->result;
        for (const Overload* overload : candidates) {
            ref.overload_ids.push_back(overload->id);
            if (overload->result != result) {
                result = ValueKind::dyn();
            }
        }
        references_[node.id] = std::move(ref);
        return result;
    }

    ValueKind check_node(const Expression&, const ExprList& list) {
        for (const auto& element : list.elements) {
            visit(element);
        }
        return KindTag::List;
    }

    ValueKind check_node(const Expression&, const ExprMap& map) {
        for (const auto& entry : map.entries) {
            ValueKind key = visit(*entry.key);
            if (key.tag != KindTag::String && !key.is_dyn()) {
                issue(*entry.key, "unsupported map key type: " + to_string(key));
            }
            visit(*entry.value);
        }
        return KindTag::Mapping;
    }

    ValueKind check_node(const Expression& node, const ExprUnary& unary) {
        ValueKind operand = visit(*unary.operand);
        if (unary.op == UnaryOp::Not) {
            if (!is_bool_like(operand)) {
                no_overload(node, operator_name(unary.op), {operand});
            }
            return KindTag::Bool;
        }
        if (operand.tag == KindTag::Int || operand.tag == KindTag::Double || operand.is_dyn()) {
            return operand;
        }
        no_overload(node, operator_name(unary.op), {operand});
        return ValueKind::dyn();
    }

    ValueKind check_node(const Expression& node, const ExprBinary& binary) {
        ValueKind left = visit(*binary.left);
        ValueKind right = visit(*binary.right);
        const char* name = operator_name(binary.op);

        switch (binary.op) {
        case BinaryOp::And:
        case BinaryOp::Or:
            if (!is_bool_like(left) || !is_bool_like(right)) {
                no_overload(node, name, {left, right});
            }
            return KindTag::Bool;

        case BinaryOp::Equal:
        case BinaryOp::NotEqual:
            if (!is_assignable(left, right) && !is_assignable(right, left) &&
                !(left.is_numeric() && right.is_numeric()) && left.tag != KindTag::Null &&
                right.tag != KindTag::Null) {
                no_overload(node, name, {left, right});
            }
            return KindTag::Bool;

        case BinaryOp::Less:
        case BinaryOp::LessEqual:
        case BinaryOp::Greater:
        case BinaryOp::GreaterEqual: {
            bool ok = (left.is_dyn() && (right.is_dyn() || supports_ordering(right))) ||
                      (right.is_dyn() && supports_ordering(left)) ||
                      (left.is_numeric() && right.is_numeric()) ||
                      (left == right && supports_ordering(left));
            if (!ok) {
                no_overload(node, name, {left, right});
            }
            return KindTag::Bool;
        }

        case BinaryOp::In: {
            bool ok = right.is_dyn() || right.tag == KindTag::List ||
                      (right.tag == KindTag::Mapping &&
                       (left.tag == KindTag::String || left.is_dyn()));
            if (!ok) {
                no_overload(node, name, {left, right});
            }
            return KindTag::Bool;
        }

        case BinaryOp::Add:
        case BinaryOp::Subtract:
        case BinaryOp::Multiply:
        case BinaryOp::Divide:
        case BinaryOp::Modulo:
            return check_arithmetic(node, binary.op, left, right);
        }
        return ValueKind::dyn();
    }

    ValueKind check_arithmetic(const Expression& node, BinaryOp op, const ValueKind& left,
                               const ValueKind& right) {
        auto allowed = [op](const ValueKind& k) {
            if (op == BinaryOp::Add) {
                return supports_add(k);
            }
            if (op == BinaryOp::Modulo) {
                return k.tag == KindTag::Int || k.tag == KindTag::Uint || k.is_dyn();
            }
            return is_numeric_or_dyn(k);
        };

        if (allowed(left) && allowed(right)) {
            if (left.is_dyn()) {
                return right;
            }
            if (right.is_dyn() || left == right) {
                return left;
            }
        }
        no_overload(node, operator_name(op), {left, right});
        return ValueKind::dyn();
    }

    ValueKind check_node(const Expression& node, const ExprConditional& cond) {
        ValueKind condition = visit(*cond.condition);
        ValueKind when_true = visit(*cond.when_true);
        ValueKind when_false = visit(*cond.when_false);

        bool branches_ok = is_assignable(when_true, when_false) ||
                           is_assignable(when_false, when_true) ||
                           when_true.tag == KindTag::Null || when_false.tag == KindTag::Null;
        if (!is_bool_like(condition) || !branches_ok) {
            no_overload(node, "_?_:_", {condition, when_true, when_false});
            return ValueKind::dyn();
        }
        if (when_true == when_false) {
            return when_true;
        }
        if (when_true.tag == KindTag::Null && !when_false.is_dyn()) {
            return when_false;
        }
        if (when_false.tag == KindTag::Null && !when_true.is_dyn()) {
            return when_true;
        }
        return ValueKind::dyn();
    }

    ValueKind check_node(const Expression& node, const ExprComprehension& comp) {
        ValueKind range = visit(*comp.range);
        ValueKind element = ValueKind::dyn();
        if (range.tag == KindTag::Mapping) {
            element = KindTag::String;
        } else if (range.tag != KindTag::List && !range.is_dyn()) {
            issue(node, "expression of type '" + to_string(range) +
                            "' cannot be range of a comprehension (must be list, map, or dynamic)");
        }

        scopes_.emplace_back(comp.variable, element);
        ValueKind body = visit(*comp.body);
        scopes_.pop_back();

        switch (comp.macro) {
        case MacroKind::All:
        case MacroKind::Exists:
        case MacroKind::ExistsOne:
        case MacroKind::Filter:
            if (!is_bool_like(body)) {
                issue(*comp.body, std::string("predicate of '") + macro_name(comp.macro) +
                                      "' must be bool, found '" + to_string(body) + "'");
            }
            return comp.macro == MacroKind::Filter ? ValueKind(KindTag::List)
                                                   : ValueKind(KindTag::Bool);
        case MacroKind::Map:
            return KindTag::List;
        }
        return ValueKind::dyn();
    }

    const Environment& env_;
    std::vector<std::pair<std::string, ValueKind>> scopes_;
    std::map<std::int64_t, ValueKind> types_;
    std::map<std::int64_t, Reference> references_;
    std::vector<Issue> issues_;
};

}  // namespace

CheckResult check(Expression root, const Environment& env) {
    Checker checker(env);
    return checker.run(std::move(root));
}

}  // namespace ruleval::expr
