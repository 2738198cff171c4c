// ==============================================================================
// evaluate.cpp - Конвейер: документ -> окружение -> Program -> вердикт
// ==============================================================================

#include "ruleval/engine.hpp"

#include <cmath>
#include <set>

#include "ruleval/accessors.hpp"

namespace ruleval {

// ============================================================================
// Error
// ============================================================================

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NilInput:
        return "NilInput";
    case ErrorKind::PayloadParse:
        return "PayloadParse";
    case ErrorKind::EnvironmentBuild:
        return "EnvironmentBuild";
    case ErrorKind::Compile:
        return "Compile";
    case ErrorKind::Evaluation:
        return "Evaluation";
    case ErrorKind::NonBooleanResult:
        return "NonBooleanResult";
    }
    return "Unknown";
}

namespace {

const char* error_kind_label(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NilInput:
        return "nil input";
    case ErrorKind::PayloadParse:
        return "payload parse error";
    case ErrorKind::EnvironmentBuild:
        return "environment build error";
    case ErrorKind::Compile:
        return "compile error";
    case ErrorKind::Evaluation:
        return "evaluation error";
    case ErrorKind::NonBooleanResult:
        return "non-boolean result";
    }
    return "error";
}

Error make_error(ErrorKind kind, std::string message, std::string_view expression,
                 std::string cause = {}) {
    Error error;
    error.kind = kind;
    error.message = std::move(message);
    error.expression = std::string(expression);
    error.cause = std::move(cause);
    return error;
}

Verdict failed(Error error) {
    Verdict verdict;
    verdict.error = std::move(error);
    return verdict;
}

// Числа документа приходят как double. Декларация int/uint без значения
// получает целое, если double целый и помещается в диапазон.
Value narrow_document_number(const Value& value, const ValueKind& kind) {
    if (!value.is_double()) {
        return value;
    }
    double d = value.as_double();
    if (std::trunc(d) != d) {
        return value;
    }
    constexpr double kTwo63 = 9223372036854775808.0;
    constexpr double kTwo64 = 18446744073709551616.0;
    if (kind.tag == KindTag::Int && d >= -kTwo63 && d < kTwo63) {
        return Value(static_cast<std::int64_t>(d));
    }
    if (kind.tag == KindTag::Uint && d >= 0.0 && d < kTwo64) {
        return Value(static_cast<std::uint64_t>(d));
    }
    return value;
}

}  // namespace

std::string Error::format() const {
    std::string out = std::string(error_kind_label(kind)) + ": " + message;
    if (!cause.empty()) {
        out += ": " + cause;
    }
    if (!issues.empty()) {
        out += "\n" + expr::format_issues(issues, expression);
    }
    return out;
}

// ============================================================================
// Стадии
// ============================================================================

EnvironmentResult build_environment(std::shared_ptr<const Payload> payload,
                                    const std::vector<Declaration>& extra) {
    EnvironmentResult result;
    if (!payload) {
        result.error = make_error(ErrorKind::NilInput, "no payload", {});
        return result;
    }

    // Имена дополнительных деклараций уникальны
    std::set<std::string> names;
    for (const auto& decl : extra) {
        if (!decl.name.empty() && !names.insert(decl.name).second) {
            result.error = make_error(ErrorKind::EnvironmentBuild, "failed to build environment",
                                      {}, "duplicate declaration '" + decl.name + "'");
            return result;
        }
    }

    auto builder = EnvironmentBuilder::create();

    const ValueObject& fields = payload->fields();
    for (const auto& [key, value] : fields) {
        builder.variable(key, classify(value), value);
    }

    for (auto& decl : accessors::make_accessors(payload)) {
        builder.function(std::move(decl));
    }
    builder.stdlib();

    // Дополнительные декларации регистрируются последними и побеждают
    for (const auto& decl : extra) {
        std::optional<Value> value = decl.value;
        if (!value) {
            auto it = fields.find(decl.name);
            if (it != fields.end()) {
                value = narrow_document_number(it->second, decl.kind);
            }
        }
        builder.variable(decl.name, decl.kind, std::move(value));
    }

    auto built = builder.build();
    if (!built) {
        result.error = make_error(ErrorKind::EnvironmentBuild, "failed to build environment", {},
                                  built.error);
        return result;
    }

    result.ok = true;
    result.environment = std::move(built.environment);
    return result;
}

Verdict validate_result(const Value& result, std::string_view expression) {
    ValueKind kind = classify(result);
    if (kind.tag != KindTag::Bool) {
        return failed(make_error(ErrorKind::NonBooleanResult,
                                 "expression result is " + to_string(kind) + ", expected bool",
                                 expression));
    }
    Verdict verdict;
    verdict.ok = true;
    verdict.matched = result.as_bool();
    return verdict;
}

Prepared prepare(const std::string* data, std::string_view expression,
                 const std::vector<Declaration>& extra) {
    Prepared prepared;
    if (data == nullptr) {
        prepared.error = make_error(ErrorKind::NilInput, "no data to evaluate", expression);
        return prepared;
    }

    auto payload = parse_payload(*data);
    if (!payload) {
        prepared.error =
            make_error(ErrorKind::PayloadParse, "invalid payload", expression, payload.message);
        return prepared;
    }

    auto env = build_environment(payload.payload, extra);
    if (!env) {
        prepared.error = std::move(env.error);
        prepared.error.expression = std::string(expression);
        return prepared;
    }

    auto compiled = compile(env.environment, expression);
    if (!compiled) {
        prepared.error = make_error(
            ErrorKind::Compile,
            std::to_string(compiled.issues.size()) +
                (compiled.issues.size() == 1 ? " issue" : " issues") + " found",
            expression);
        prepared.error.issues = std::move(compiled.issues);
        return prepared;
    }

    prepared.ok = true;
    prepared.environment = std::move(env.environment);
    prepared.program = std::move(compiled.program);
    return prepared;
}

Verdict evaluate(const std::string* data, std::string_view expression,
                 const std::vector<Declaration>& extra) {
    auto prepared = prepare(data, expression, extra);
    if (!prepared) {
        return failed(std::move(prepared.error));
    }

    auto evaluated = prepared.program->eval();
    if (!evaluated) {
        return failed(make_error(ErrorKind::Evaluation, "failed to evaluate expression",
                                 expression, evaluated.error));
    }

    return validate_result(evaluated.value, expression);
}

}  // namespace ruleval
