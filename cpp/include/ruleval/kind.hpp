// ==============================================================================
// ruleval/kind.hpp - Классификатор ValueKind
// ==============================================================================
//
// Назначение:
// - ValueKind: символический тип значения для системы типов выражений
// - classify(): тип значения выводится из самого значения
// - Совместимость типов (dyn совместим со всем)
// - Текстовое представление и разбор (для CLI и файла деклараций)
//
// Закрытый набор тегов: Bool, String, Int, Uint, Double, Bytes, Timestamp,
// Mapping (map(string, dyn)), List (list(dyn)), Null, OpaqueObject(name).
// OpaqueObject("dyn"): динамический тип.
//
// ==============================================================================

#ifndef RULEVAL_KIND_HPP
#define RULEVAL_KIND_HPP

#include <optional>
#include <string>
#include <string_view>

#include "ruleval/value.hpp"

namespace ruleval {

/// Тег типа
enum class KindTag {
    Bool,
    String,
    Int,
    Uint,
    Double,
    Bytes,
    Timestamp,
    Mapping,      // map(string, dyn)
    List,         // list(dyn)
    Null,         // null_type
    OpaqueObject  // именованный тип хоста или dyn
};

/// Имя динамического типа
constexpr const char* DYN_TYPE_NAME = "dyn";

/// Символический тип значения
struct ValueKind {
    KindTag tag = KindTag::Null;
    std::string object_name;  // только для OpaqueObject

    ValueKind() = default;
    ValueKind(KindTag t) : tag(t) {}  // NOLINT: неявное преобразование из тега удобно
    ValueKind(KindTag t, std::string name) : tag(t), object_name(std::move(name)) {}

    static ValueKind dyn() { return ValueKind(KindTag::OpaqueObject, DYN_TYPE_NAME); }
    static ValueKind object(std::string name) {
        return ValueKind(KindTag::OpaqueObject, std::move(name));
    }

    bool is_dyn() const { return tag == KindTag::OpaqueObject && object_name == DYN_TYPE_NAME; }
    bool is_numeric() const {
        return tag == KindTag::Int || tag == KindTag::Uint || tag == KindTag::Double;
    }

    bool operator==(const ValueKind& other) const {
        return tag == other.tag && object_name == other.object_name;
    }
    bool operator!=(const ValueKind& other) const { return !(*this == other); }
};

/// Определить ValueKind значения. Чистая функция.
ValueKind classify(const Value& value);

/// Может ли значение типа `from` использоваться там, где ожидается `to`
/// (равные типы, любой из них dyn, или null для объектного типа)
bool is_assignable(const ValueKind& to, const ValueKind& from);

/// Текстовое имя типа: "int", "map(string, dyn)", "list(dyn)", "null_type", ...
std::string to_string(const ValueKind& kind);

/// Разобрать имя типа (to_string + короткие формы map, list, null, object:<Name>)
std::optional<ValueKind> parse_kind(std::string_view text);

}  // namespace ruleval

#endif  // RULEVAL_KIND_HPP
