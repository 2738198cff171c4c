// ==============================================================================
// accessors.cpp - exists / safe поверх DOM документа
// ==============================================================================

#include "ruleval/accessors.hpp"

#include "ruleval/path.hpp"

namespace ruleval::accessors {

bool exists(const Payload& payload, std::string_view path) {
    return path::query(payload.dom(), path) != nullptr;
}

Value safe(const Payload& payload, std::string_view path, const Value& fallback) {
    const rapidjson::Value* found = path::query(payload.dom(), path);
    if (found == nullptr) {
        return fallback;
    }

    if (fallback.is_string() && found->IsString()) {
        return Value(std::string(found->GetString(), found->GetStringLength()));
    }
    if (fallback.is_double() && found->IsNumber()) {
        return Value(found->GetDouble());
    }
    if (fallback.is_bool() && found->IsBool()) {
        return Value(found->GetBool());
    }
    return fallback;
}

std::vector<FunctionDecl> make_accessors(std::shared_ptr<const Payload> payload) {
    // Все перегрузки делят владение документом
    auto safe_impl = [payload](const std::vector<Value>& args) {
        return safe(*payload, args[0].as_string(), args[1]);
    };

    FunctionDecl exists_decl{
        "exists",
        {Overload{EXISTS_OVERLOAD, {KindTag::String}, KindTag::Bool, false,
                  [payload](const std::vector<Value>& args) {
                      return Value(exists(*payload, args[0].as_string()));
                  }}}};

    FunctionDecl safe_decl{
        "safe",
        {Overload{SAFE_STRING_OVERLOAD, {KindTag::String, KindTag::String}, KindTag::String,
                  false, safe_impl},
         Overload{SAFE_NUMBER_OVERLOAD, {KindTag::String, KindTag::Double}, KindTag::Double,
                  false, safe_impl},
         Overload{SAFE_BOOL_OVERLOAD, {KindTag::String, KindTag::Bool}, KindTag::Bool, false,
                  safe_impl}}};

    std::vector<FunctionDecl> out;
    out.push_back(std::move(exists_decl));
    out.push_back(std::move(safe_decl));
    return out;
}

}  // namespace ruleval::accessors
