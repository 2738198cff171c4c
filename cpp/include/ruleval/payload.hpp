// ==============================================================================
// ruleval/payload.hpp - Документ события
// ==============================================================================
//
// Назначение:
// - Payload: исходный текст документа + его DOM (RapidJSON) + верхнеуровневый
//   mapping ключ -> Value
// - Документ неизменяем на время одного вычисления; функции-аксессоры
//   держат его через shared_ptr
//
// ==============================================================================

#ifndef RULEVAL_PAYLOAD_HPP
#define RULEVAL_PAYLOAD_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include <rapidjson/document.h>
#include "ruleval/value.hpp"

namespace ruleval {

struct PayloadResult;

/// Максимальная глубина вложенности массивов и объектов документа
constexpr std::size_t MAX_DOCUMENT_DEPTH = 1000;

/// Разобрать документ. Корень обязан быть JSON объектом.
PayloadResult parse_payload(std::string raw);

/// Распарсенный документ события
class Payload {
public:
    /// Исходный текст
    const std::string& raw() const { return raw_; }

    /// DOM исходного текста (для путевых запросов)
    const rapidjson::Value& dom() const { return dom_; }

    /// Верхнеуровневые поля документа
    const ValueObject& fields() const { return fields_; }

private:
    friend PayloadResult parse_payload(std::string raw);

    std::string raw_;
    rapidjson::Document dom_;
    ValueObject fields_;
};

/// Результат разбора документа
struct PayloadResult {
    bool ok = false;
    std::shared_ptr<const Payload> payload;
    std::string message;  // описание ошибки разбора

    explicit operator bool() const { return ok; }
};

}  // namespace ruleval

#endif  // RULEVAL_PAYLOAD_HPP
