// ==============================================================================
// payload.cpp - Разбор документа события
// ==============================================================================

#include "ruleval/payload.hpp"

#include <rapidjson/error/en.h>
#include <utility>
#include <vector>

namespace ruleval {

namespace {

// Глубина вложенности DOM без рекурсии (явный стек)
std::size_t nesting_depth(const rapidjson::Value& root) {
    std::size_t max_depth = 0;
    std::vector<std::pair<const rapidjson::Value*, std::size_t>> stack;
    stack.emplace_back(&root, 0);
    while (!stack.empty()) {
        auto [node, depth] = stack.back();
        stack.pop_back();
        if (depth > max_depth) {
            max_depth = depth;
        }
        if (node->IsArray()) {
            for (const auto& item : node->GetArray()) {
                stack.emplace_back(&item, depth + 1);
            }
        } else if (node->IsObject()) {
            for (const auto& member : node->GetObject()) {
                stack.emplace_back(&member.value, depth + 1);
            }
        }
    }
    return max_depth;
}

}  // namespace

PayloadResult parse_payload(std::string raw) {
    PayloadResult result;

    auto payload = std::make_shared<Payload>();
    payload->raw_ = std::move(raw);

    // Parse по размеру: исходный текст может содержать '\0'.
    // Итеративный парсер не расходует стек на вложенность.
    payload->dom_.Parse<rapidjson::kParseIterativeFlag>(payload->raw_.c_str(),
                                                         payload->raw_.size());
    if (payload->dom_.HasParseError()) {
        result.message = std::string("JSON parse error: ") +
                         rapidjson::GetParseError_En(payload->dom_.GetParseError()) +
                         " at offset " + std::to_string(payload->dom_.GetErrorOffset());
        return result;
    }

    if (!payload->dom_.IsObject()) {
        result.message = "document root is not a JSON object";
        return result;
    }

    if (nesting_depth(payload->dom_) > MAX_DOCUMENT_DEPTH) {
        result.message = "document nesting exceeds maximum depth of " +
                         std::to_string(MAX_DOCUMENT_DEPTH);
        return result;
    }

    for (auto it = payload->dom_.MemberBegin(); it != payload->dom_.MemberEnd(); ++it) {
        std::string key(it->name.GetString(), it->name.GetStringLength());
        // Дубликаты ключей: побеждает последний, как в обычном JSON декодере.
        // Все числа документа: double.
        payload->fields_[key] = Value::from_rapidjson(it->value, JsonNumbers::AsDouble);
    }

    result.ok = true;
    result.payload = std::move(payload);
    return result;
}

}  // namespace ruleval
