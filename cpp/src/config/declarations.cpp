// ==============================================================================
// declarations.cpp - Загрузка деклараций переменных из YAML (yaml-cpp)
// ==============================================================================

#include "ruleval/declarations.hpp"

#include <charconv>
#include <cstdlib>
#include <set>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace ruleval::config {

namespace {

/// Ошибка содержимого файла деклараций (не синтаксиса YAML)
class DeclarationError : public std::runtime_error {
public:
    explicit DeclarationError(const std::string& message) : std::runtime_error(message) {}
};

std::string location(const YAML::Node& node) {
    const YAML::Mark mark = node.Mark();
    if (mark.is_null()) {
        return "";
    }
    return " at line " + std::to_string(mark.line + 1) + ", column " +
           std::to_string(mark.column + 1);
}

// Скаляр без явного типа: null, bool, int, uint, double или string
Value dynamic_scalar(const YAML::Node& node) {
    const std::string& text = node.Scalar();

    // Строки в кавычках имеют тег "!"
    if (node.Tag() == "!") {
        return Value(text);
    }
    if (text == "~" || text == "null" || text == "Null" || text == "NULL") {
        return Value::make_null();
    }
    if (text == "true" || text == "True" || text == "TRUE") {
        return Value(true);
    }
    if (text == "false" || text == "False" || text == "FALSE") {
        return Value(false);
    }

    const char* begin = text.data();
    const char* end = text.data() + text.size();
    std::int64_t i = 0;
    if (auto [ptr, ec] = std::from_chars(begin, end, i); ec == std::errc{} && ptr == end) {
        return Value(i);
    }
    std::uint64_t u = 0;
    if (auto [ptr, ec] = std::from_chars(begin, end, u); ec == std::errc{} && ptr == end) {
        return Value(u);
    }
    if (!text.empty()) {
        char* parsed_end = nullptr;
        double d = std::strtod(text.c_str(), &parsed_end);
        if (parsed_end == text.c_str() + text.size()) {
            return Value(d);
        }
    }
    return Value(text);
}

Value dynamic_value(const YAML::Node& node) {
    switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
        return Value::make_null();
    case YAML::NodeType::Scalar:
        return dynamic_scalar(node);
    case YAML::NodeType::Sequence: {
        ValueArray items;
        for (const auto& item : node) {
            items.push_back(dynamic_value(item));
        }
        return Value(std::move(items));
    }
    case YAML::NodeType::Map: {
        ValueObject fields;
        for (const auto& entry : node) {
            fields[entry.first.as<std::string>()] = dynamic_value(entry.second);
        }
        return Value(std::move(fields));
    }
    }
    return Value::make_null();
}

// Значение по объявленному типу
Value typed_value(const YAML::Node& node, const ValueKind& kind) {
    auto mismatch = [&]() {
        return DeclarationError("value does not match kind " + to_string(kind) + location(node));
    };

    switch (kind.tag) {
    case KindTag::Bool:
        return Value(node.as<bool>());
    case KindTag::Int:
        return Value(node.as<std::int64_t>());
    case KindTag::Uint:
        return Value(node.as<std::uint64_t>());
    case KindTag::Double:
        return Value(node.as<double>());
    case KindTag::String:
        if (!node.IsScalar()) {
            throw mismatch();
        }
        return Value(node.Scalar());
    case KindTag::Bytes:
        if (!node.IsScalar()) {
            throw mismatch();
        }
        return Value::make_bytes(node.Scalar());
    case KindTag::Timestamp: {
        std::optional<Timestamp> ts;
        if (node.IsScalar()) {
            ts = Timestamp::parse(node.Scalar());
        }
        if (!ts) {
            throw DeclarationError("invalid timestamp" + location(node));
        }
        return Value(*ts);
    }
    case KindTag::Mapping:
        if (!node.IsMap()) {
            throw mismatch();
        }
        return dynamic_value(node);
    case KindTag::List:
        if (!node.IsSequence()) {
            throw mismatch();
        }
        return dynamic_value(node);
    case KindTag::Null:
        if (!node.IsNull()) {
            throw mismatch();
        }
        return Value::make_null();
    case KindTag::OpaqueObject:
        if (kind.is_dyn()) {
            return dynamic_value(node);
        }
        if (node.IsNull()) {
            return Value::make_null();
        }
        if (!node.IsMap()) {
            throw mismatch();
        }
        return Value::make_host(kind.object_name, dynamic_value(node).as_object());
    }
    throw mismatch();
}

std::vector<Declaration> parse_root(const YAML::Node& root) {
    std::vector<Declaration> out;
    if (!root || root.IsNull()) {
        return out;
    }
    if (!root.IsMap()) {
        throw DeclarationError("declarations root must be a mapping" + location(root));
    }

    const YAML::Node variables = root["variables"];
    if (!variables || variables.IsNull()) {
        return out;
    }
    if (!variables.IsSequence()) {
        throw DeclarationError("'variables' must be a sequence" + location(variables));
    }

    std::set<std::string> names;
    for (const auto& entry : variables) {
        if (!entry.IsMap()) {
            throw DeclarationError("variable entry must be a mapping" + location(entry));
        }
        if (!entry["name"] || !entry["kind"]) {
            throw DeclarationError("variable entry requires 'name' and 'kind'" + location(entry));
        }

        Declaration decl;
        decl.name = entry["name"].as<std::string>();
        if (decl.name.empty()) {
            throw DeclarationError("variable name must not be empty" + location(entry));
        }
        if (!names.insert(decl.name).second) {
            throw DeclarationError("duplicate variable '" + decl.name + "'" + location(entry));
        }

        std::string kind_text = entry["kind"].as<std::string>();
        auto kind = parse_kind(kind_text);
        if (!kind) {
            throw DeclarationError("unknown kind '" + kind_text + "'" + location(entry["kind"]));
        }
        decl.kind = *kind;

        if (const YAML::Node value = entry["value"]) {
            decl.value = typed_value(value, decl.kind);
        }
        out.push_back(std::move(decl));
    }
    return out;
}

}  // namespace

LoadResult parse_declarations(std::string_view yaml, std::string_view origin) {
    LoadResult result;
    try {
        YAML::Node root = YAML::Load(std::string(yaml));
        result.declarations = parse_root(root);
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = LoadError{e.what(), std::string(origin)};
    } catch (const DeclarationError& e) {
        result.error = LoadError{e.what(), std::string(origin)};
    }
    return result;
}

LoadResult load_declarations(const std::filesystem::path& path) {
    LoadResult result;
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        result.declarations = parse_root(root);
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = LoadError{e.what(), path.string()};
    } catch (const DeclarationError& e) {
        result.error = LoadError{e.what(), path.string()};
    }
    return result;
}

}  // namespace ruleval::config
