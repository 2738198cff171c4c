// ==============================================================================
// kind.cpp - Классификатор ValueKind
// ==============================================================================

#include "ruleval/kind.hpp"

namespace ruleval {

ValueKind classify(const Value& value) {
    if (value.is_bool())
        return KindTag::Bool;
    if (value.is_string())
        return KindTag::String;
    if (value.is_int())
        return KindTag::Int;
    if (value.is_uint())
        return KindTag::Uint;
    if (value.is_double())
        return KindTag::Double;
    if (value.is_bytes())
        return KindTag::Bytes;
    if (value.is_timestamp())
        return KindTag::Timestamp;
    if (value.is_object())
        return KindTag::Mapping;
    if (value.is_array())
        return KindTag::List;
    if (value.is_null())
        return KindTag::Null;

    // Объект хоста: распознанное сообщение -> dyn, иначе собственное имя типа
    const HostObject& host = value.as_host();
    if (host.message) {
        return ValueKind::dyn();
    }
    return ValueKind::object(host.type_name);
}

bool is_assignable(const ValueKind& to, const ValueKind& from) {
    if (to.is_dyn() || from.is_dyn()) {
        return true;
    }
    if (to == from) {
        return true;
    }
    return to.tag == KindTag::OpaqueObject && from.tag == KindTag::Null;
}

std::string to_string(const ValueKind& kind) {
    switch (kind.tag) {
    case KindTag::Bool:
        return "bool";
    case KindTag::String:
        return "string";
    case KindTag::Int:
        return "int";
    case KindTag::Uint:
        return "uint";
    case KindTag::Double:
        return "double";
    case KindTag::Bytes:
        return "bytes";
    case KindTag::Timestamp:
        return "timestamp";
    case KindTag::Mapping:
        return "map(string, dyn)";
    case KindTag::List:
        return "list(dyn)";
    case KindTag::Null:
        return "null_type";
    case KindTag::OpaqueObject:
        return kind.object_name;
    }
    return "unknown";
}

std::optional<ValueKind> parse_kind(std::string_view text) {
    if (text == "bool")
        return ValueKind(KindTag::Bool);
    if (text == "string")
        return ValueKind(KindTag::String);
    if (text == "int")
        return ValueKind(KindTag::Int);
    if (text == "uint")
        return ValueKind(KindTag::Uint);
    if (text == "double")
        return ValueKind(KindTag::Double);
    if (text == "bytes")
        return ValueKind(KindTag::Bytes);
    if (text == "timestamp")
        return ValueKind(KindTag::Timestamp);
    if (text == "map" || text == "map(string, dyn)")
        return ValueKind(KindTag::Mapping);
    if (text == "list" || text == "list(dyn)")
        return ValueKind(KindTag::List);
    if (text == "null" || text == "null_type")
        return ValueKind(KindTag::Null);
    if (text == DYN_TYPE_NAME)
        return ValueKind::dyn();

    constexpr std::string_view prefix = "object:";
    if (text.size() > prefix.size() && text.substr(0, prefix.size()) == prefix) {
        return ValueKind::object(std::string(text.substr(prefix.size())));
    }
    return std::nullopt;
}

}  // namespace ruleval
