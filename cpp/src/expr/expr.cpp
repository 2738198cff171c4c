// ==============================================================================
// expr.cpp - Диагностика и имена операторов
// ==============================================================================

#include "ruleval/expr.hpp"

namespace ruleval::expr {

std::string Issue::format(std::string_view source) const {
    // Позиция -> (строка, колонка), обе с единицы
    std::size_t line = 1;
    std::size_t line_start = 0;
    std::size_t end = offset < source.size() ? offset : source.size();
    for (std::size_t i = 0; i < end; ++i) {
        if (source[i] == '\n') {
            ++line;
            line_start = i + 1;
        }
    }
    std::size_t column = end - line_start + 1;

    std::string out = "ERROR: <input>:" + std::to_string(line) + ":" + std::to_string(column) +
                      ": " + message;

    // Строка исходного текста с указателем на позицию
    std::size_t line_end = source.find('\n', line_start);
    if (line_end == std::string_view::npos) {
        line_end = source.size();
    }
    out += "\n | ";
    out += source.substr(line_start, line_end - line_start);
    out += "\n | ";
    out += std::string(column - 1, '.');
    out += '^';
    return out;
}

std::string format_issues(const std::vector<Issue>& issues, std::string_view source) {
    std::string out;
    for (std::size_t i = 0; i < issues.size(); ++i) {
        if (i > 0)
            out += '\n';
        out += issues[i].format(source);
    }
    return out;
}

const char* operator_name(BinaryOp op) {
    switch (op) {
    case BinaryOp::Or:
        return "_||_";
    case BinaryOp::And:
        return "_&&_";
    case BinaryOp::Equal:
        return "_==_";
    case BinaryOp::NotEqual:
        return "_!=_";
    case BinaryOp::Less:
        return "_<_";
    case BinaryOp::LessEqual:
        return "_<=_";
    case BinaryOp::Greater:
        return "_>_";
    case BinaryOp::GreaterEqual:
        return "_>=_";
    case BinaryOp::In:
        return "@in";
    case BinaryOp::Add:
        return "_+_";
    case BinaryOp::Subtract:
        return "_-_";
    case BinaryOp::Multiply:
        return "_*_";
    case BinaryOp::Divide:
        return "_/_";
    case BinaryOp::Modulo:
        return "_%_";
    }
    return "_?_";
}

const char* operator_name(UnaryOp op) {
    switch (op) {
    case UnaryOp::Not:
        return "!_";
    case UnaryOp::Negate:
        return "-_";
    }
    return "?_";
}

const char* macro_name(MacroKind macro) {
    switch (macro) {
    case MacroKind::All:
        return "all";
    case MacroKind::Exists:
        return "exists";
    case MacroKind::ExistsOne:
        return "exists_one";
    case MacroKind::Filter:
        return "filter";
    case MacroKind::Map:
        return "map";
    }
    return "unknown";
}

}  // namespace ruleval::expr
