// ==============================================================================
// ruleval/accessors.hpp - Безопасные функции доступа к документу
// ==============================================================================
//
// Назначение:
// - exists(path) -> bool: достижимо ли значение по пути (включая null)
// - safe(path, default) -> T для T из {string, double, bool}:
//   значение по пути, если оно есть и имеет тип T, иначе default
//
// Функции замкнуты на DOM исходного документа (а не на верхнеуровневые
// переменные), поэтому видят вложенные поля. Ошибок не бросают.
//
// ==============================================================================

#ifndef RULEVAL_ACCESSORS_HPP
#define RULEVAL_ACCESSORS_HPP

#include <memory>
#include <string_view>
#include <vector>

#include "ruleval/env.hpp"
#include "ruleval/payload.hpp"

namespace ruleval::accessors {

/// Id перегрузок
constexpr const char* EXISTS_OVERLOAD = "exists_string";
constexpr const char* SAFE_STRING_OVERLOAD = "safe_string";
constexpr const char* SAFE_NUMBER_OVERLOAD = "safe_number";
constexpr const char* SAFE_BOOL_OVERLOAD = "safe_bool";

/// Достижимо ли значение по пути
bool exists(const Payload& payload, std::string_view path);

/// Значение по пути того же типа, что и fallback (string, double или bool),
/// иначе fallback. Любое JSON число считается double.
Value safe(const Payload& payload, std::string_view path, const Value& fallback);

/// Объявления функций exists и safe, замкнутые на документ
std::vector<FunctionDecl> make_accessors(std::shared_ptr<const Payload> payload);

}  // namespace ruleval::accessors

#endif  // RULEVAL_ACCESSORS_HPP
