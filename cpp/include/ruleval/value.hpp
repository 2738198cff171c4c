// ==============================================================================
// ruleval/value.hpp - Каноническая модель значения (Value)
// ==============================================================================
//
// Назначение:
// - Динамически типизированное значение для документа события и выражений
// - Конверсия из/в RapidJSON Value
// - Явная типизация чисел: Int64 / UInt64 / Double
// - Значения, которые не приходят из JSON: Bytes, Timestamp, HostObject
//   (типизированные объекты, которые подставляет хост-приложение)
//
// ==============================================================================

#ifndef RULEVAL_VALUE_HPP
#define RULEVAL_VALUE_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <rapidjson/document.h>
#include "ruleval/timestamp.hpp"

// GCC 13 generates false positives for -Wnull-dereference when using
// std::get on std::variant at high optimization levels.
// See: https://gcc.gnu.org/bugzilla/show_bug.cgi?id=108842
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnull-dereference"
#endif

namespace ruleval {

class Value;

/// Тип для массива значений
using ValueArray = std::vector<Value>;

/// Тип для объекта (map string -> Value), упорядочен для детерминированного вывода
using ValueObject = std::map<std::string, Value>;

/// Последовательность байт (отличается от String на уровне типа)
struct Bytes {
    std::string data;

    bool operator==(const Bytes& other) const { return data == other.data; }
};

/// Объект хоста: именованный тип с набором полей
/// message = true для распознанных протокольных сообщений (тип dyn)
struct HostObject {
    std::string type_name;
    ValueObject fields;
    bool message = false;
};

/// Типизация чисел JSON при конверсии
/// Typed: Int64 -> UInt64 -> Double; AsDouble: любое число становится Double
enum class JsonNumbers { Typed, AsDouble };

/// Каноническое представление значения
class Value {
public:
    // Внутренние типы для variant
    struct Null {};
    using Bool = bool;
    using Int64 = std::int64_t;
    using UInt64 = std::uint64_t;
    using Double = double;
    using String = std::string;
    using Array = ValueArray;
    using Object = ValueObject;

private:
    std::variant<Null, Bool, Int64, UInt64, Double, String, Bytes, Timestamp,
                 std::shared_ptr<Array>, std::shared_ptr<Object>, std::shared_ptr<HostObject>>
        data_;

public:
    // -------------------------------------------------------------------------
    // Конструкторы
    // -------------------------------------------------------------------------

    Value() : data_(Null{}) {}
    explicit Value(bool v) : data_(v) {}
    explicit Value(std::int64_t v) : data_(v) {}
    explicit Value(std::uint64_t v) : data_(v) {}
    explicit Value(double v) : data_(v) {}
    explicit Value(std::string v) : data_(std::move(v)) {}
    explicit Value(const char* v) : data_(std::string(v)) {}
    explicit Value(Bytes v) : data_(std::move(v)) {}
    explicit Value(Timestamp v) : data_(v) {}
    explicit Value(Array v) : data_(std::make_shared<Array>(std::move(v))) {}
    explicit Value(Object v) : data_(std::make_shared<Object>(std::move(v))) {}
    explicit Value(HostObject v) : data_(std::make_shared<HostObject>(std::move(v))) {}

    // -------------------------------------------------------------------------
    // Статические фабричные методы
    // -------------------------------------------------------------------------

    static Value make_null() { return Value(); }
    static Value make_bool(bool v) { return Value(v); }
    static Value make_int(std::int64_t v) { return Value(v); }
    static Value make_uint(std::uint64_t v) { return Value(v); }
    static Value make_double(double v) { return Value(v); }
    static Value make_string(std::string v) { return Value(std::move(v)); }
    static Value make_bytes(std::string v) { return Value(Bytes{std::move(v)}); }
    static Value make_array() { return Value(Array{}); }
    static Value make_object() { return Value(Object{}); }

    /// Создать объект хоста
    static Value make_host(std::string type_name, Object fields = {}, bool message = false) {
        return Value(HostObject{std::move(type_name), std::move(fields), message});
    }

    // -------------------------------------------------------------------------
    // Проверка типа
    // -------------------------------------------------------------------------

    bool is_null() const { return std::holds_alternative<Null>(data_); }
    bool is_bool() const { return std::holds_alternative<Bool>(data_); }
    bool is_int() const { return std::holds_alternative<Int64>(data_); }
    bool is_uint() const { return std::holds_alternative<UInt64>(data_); }
    bool is_double() const { return std::holds_alternative<Double>(data_); }
    bool is_string() const { return std::holds_alternative<String>(data_); }
    bool is_bytes() const { return std::holds_alternative<Bytes>(data_); }
    bool is_timestamp() const { return std::holds_alternative<Timestamp>(data_); }
    bool is_array() const { return std::holds_alternative<std::shared_ptr<Array>>(data_); }
    bool is_object() const { return std::holds_alternative<std::shared_ptr<Object>>(data_); }
    bool is_host() const { return std::holds_alternative<std::shared_ptr<HostObject>>(data_); }

    /// Проверка на числовой тип (int, uint или double)
    bool is_number() const { return is_int() || is_uint() || is_double(); }

    // -------------------------------------------------------------------------
    // Доступ к значению (undefined behavior при несовпадении типа)
    // -------------------------------------------------------------------------

    Bool as_bool() const { return std::get<Bool>(data_); }
    Int64 as_int() const { return std::get<Int64>(data_); }
    UInt64 as_uint() const { return std::get<UInt64>(data_); }
    Double as_double() const { return std::get<Double>(data_); }
    const String& as_string() const { return std::get<String>(data_); }
    const Bytes& as_bytes() const { return std::get<Bytes>(data_); }
    const Timestamp& as_timestamp() const { return std::get<Timestamp>(data_); }
    const Array& as_array() const { return *std::get<std::shared_ptr<Array>>(data_); }
    const Object& as_object() const { return *std::get<std::shared_ptr<Object>>(data_); }
    const HostObject& as_host() const { return *std::get<std::shared_ptr<HostObject>>(data_); }

    // -------------------------------------------------------------------------
    // Безопасный доступ (возвращает nullptr если тип не совпадает)
    // -------------------------------------------------------------------------

    const Array* get_array() const {
        auto* ptr = std::get_if<std::shared_ptr<Array>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    const Object* get_object() const {
        auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    const HostObject* get_host() const {
        auto* ptr = std::get_if<std::shared_ptr<HostObject>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    // -------------------------------------------------------------------------
    // Операции с массивом и объектом
    // -------------------------------------------------------------------------

    /// Добавить элемент в массив (только если is_array())
    void push_back(Value v) {
        if (auto* arr = get_array_mut()) {
            arr->push_back(std::move(v));
        }
    }

    /// Размер массива (0 если не массив)
    std::size_t array_size() const {
        if (const auto* arr = get_array()) {
            return arr->size();
        }
        return 0;
    }

    /// Установить поле объекта (только если is_object())
    void set(const std::string& key, Value v) {
        if (auto* obj = get_object_mut()) {
            (*obj)[key] = std::move(v);
        }
    }

    /// Получить поле объекта или объекта хоста (nullptr если нет)
    const Value* get(const std::string& key) const {
        const Object* obj = get_object();
        if (obj == nullptr) {
            const HostObject* host = get_host();
            obj = host ? &host->fields : nullptr;
        }
        if (obj != nullptr) {
            auto it = obj->find(key);
            if (it != obj->end()) {
                return &it->second;
            }
        }
        return nullptr;
    }

    // -------------------------------------------------------------------------
    // Конверсия RapidJSON
    // -------------------------------------------------------------------------

    /// Конвертировать из RapidJSON Value
    static Value from_rapidjson(const rapidjson::Value& json,
                                JsonNumbers numbers = JsonNumbers::Typed);

    /// Конвертировать в RapidJSON Value
    /// Bytes и Timestamp сериализуются строками, HostObject: объектом полей
    void to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const;

    /// Сериализовать в компактную JSON строку
    std::string to_json() const;

private:
    Array* get_array_mut() {
        auto* ptr = std::get_if<std::shared_ptr<Array>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    Object* get_object_mut() {
        auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }
};

}  // namespace ruleval

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif

#endif  // RULEVAL_VALUE_HPP
