// ==============================================================================
// env.cpp - Environment и EnvironmentBuilder
// ==============================================================================

#include "ruleval/env.hpp"

#include <set>

namespace ruleval {

// ============================================================================
// Environment
// ============================================================================

const VariableBinding* Environment::find_variable(const std::string& name) const {
    auto it = variable_index_.find(name);
    if (it == variable_index_.end()) {
        return nullptr;
    }
    return &variables_[it->second];
}

const FunctionDecl* Environment::find_function(const std::string& name) const {
    auto it = functions_.find(name);
    return it != functions_.end() ? &it->second : nullptr;
}

const Overload* Environment::find_overload(const std::string& id) const {
    auto it = overload_index_.find(id);
    return it != overload_index_.end() ? it->second : nullptr;
}

// ============================================================================
// EnvironmentBuilder
// ============================================================================

EnvironmentBuilder EnvironmentBuilder::create() {
    return EnvironmentBuilder();
}

EnvironmentBuilder& EnvironmentBuilder::variable(std::string name, ValueKind kind,
                                                 std::optional<Value> value) {
    variables_.push_back(VariableBinding{std::move(name), std::move(kind), std::move(value)});
    return *this;
}

EnvironmentBuilder& EnvironmentBuilder::function(FunctionDecl decl) {
    functions_.push_back(std::move(decl));
    return *this;
}

EnvironmentBuilder& EnvironmentBuilder::stdlib() {
    for (auto& decl : standard_library()) {
        functions_.push_back(std::move(decl));
    }
    return *this;
}

EnvironmentBuilder::BuildResult EnvironmentBuilder::build() {
    BuildResult result;
    auto env = std::make_shared<Environment>();

    // Переменные: последнее объявление с тем же именем побеждает
    std::map<std::string, VariableBinding> merged;
    for (auto& binding : variables_) {
        if (binding.name.empty()) {
            result.error = "variable name must not be empty";
            return result;
        }
        if (binding.value.has_value()) {
            ValueKind actual = classify(*binding.value);
            if (!is_assignable(binding.kind, actual)) {
                result.error = "variable '" + binding.name + "' declared as " +
                               to_string(binding.kind) + " but its value is " +
                               to_string(actual);
                return result;
            }
        }
        std::string name = binding.name;
        merged[name] = std::move(binding);
    }
    for (auto& [name, binding] : merged) {
        env->variable_index_[name] = env->variables_.size();
        env->variables_.push_back(std::move(binding));
    }

    // Функции: перегрузки с одинаковым именем объединяются
    std::set<std::string> overload_ids;
    for (auto& decl : functions_) {
        if (decl.name.empty()) {
            result.error = "function name must not be empty";
            return result;
        }
        FunctionDecl& target = env->functions_[decl.name];
        target.name = decl.name;
        for (auto& overload : decl.overloads) {
            if (overload.id.empty()) {
                result.error = "overload of '" + decl.name + "' has an empty id";
                return result;
            }
            if (!overload_ids.insert(overload.id).second) {
                result.error = "overload '" + overload.id + "' is already declared";
                return result;
            }
            if (!overload.impl) {
                result.error = "overload '" + overload.id + "' has no implementation";
                return result;
            }
            if (overload.receiver_style && overload.params.empty()) {
                result.error = "receiver overload '" + overload.id + "' has no receiver type";
                return result;
            }
            target.overloads.push_back(std::move(overload));
        }
    }

    // Индекс перегрузок строится после заполнения: адреса стабильны
    for (const auto& [name, decl] : env->functions_) {
        for (const auto& overload : decl.overloads) {
            env->overload_index_[overload.id] = &overload;
        }
    }

    variables_.clear();
    functions_.clear();

    result.ok = true;
    result.environment = std::move(env);
    return result;
}

}  // namespace ruleval
