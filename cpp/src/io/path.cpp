// ==============================================================================
// path.cpp - Путь к полю в JSON документе
// ==============================================================================

#include "ruleval/path.hpp"

#include <rapidjson/pointer.h>

namespace ruleval::path {

std::optional<std::vector<std::string>> split(std::string_view path) {
    std::vector<std::string> segments;
    if (path.empty()) {
        return std::nullopt;
    }

    std::string current;
    bool after_index = false;  // только что закрыли [N]
    std::size_t i = 0;

    while (i < path.size()) {
        char c = path[i];

        if (c == '\\') {
            if (i + 1 >= path.size()) {
                return std::nullopt;
            }
            current += path[i + 1];
            after_index = false;
            i += 2;
            continue;
        }

        if (c == '.') {
            if (current.empty() && !after_index) {
                return std::nullopt;  // ".a", "a..b"
            }
            if (!current.empty()) {
                segments.push_back(std::move(current));
                current.clear();
            }
            after_index = false;
            ++i;
            // Точка в конце пути
            if (i == path.size()) {
                return std::nullopt;
            }
            continue;
        }

        if (c == '[') {
            if (current.empty() && segments.empty()) {
                return std::nullopt;  // "[0]" без имени поля
            }
            if (!current.empty()) {
                segments.push_back(std::move(current));
                current.clear();
            }
            std::size_t close = path.find(']', i + 1);
            if (close == std::string_view::npos || close == i + 1) {
                return std::nullopt;
            }
            std::string_view index = path.substr(i + 1, close - i - 1);
            for (char d : index) {
                if (d < '0' || d > '9') {
                    return std::nullopt;
                }
            }
            segments.emplace_back(index);
            after_index = true;
            i = close + 1;
            // После ] допустимы только '.', '[' или конец
            if (i < path.size() && path[i] != '.' && path[i] != '[') {
                return std::nullopt;
            }
            continue;
        }

        if (after_index) {
            return std::nullopt;
        }
        current += c;
        ++i;
    }

    if (!current.empty()) {
        segments.push_back(std::move(current));
    }
    if (segments.empty()) {
        return std::nullopt;
    }
    return segments;
}

std::optional<std::string> to_json_pointer(std::string_view path) {
    auto segments = split(path);
    if (!segments) {
        return std::nullopt;
    }

    // RFC 6901: '~' -> "~0", '/' -> "~1"
    std::string pointer;
    for (const auto& segment : *segments) {
        pointer += '/';
        for (char c : segment) {
            if (c == '~') {
                pointer += "~0";
            } else if (c == '/') {
                pointer += "~1";
            } else {
                pointer += c;
            }
        }
    }
    return pointer;
}

const rapidjson::Value* query(const rapidjson::Value& root, std::string_view path) {
    auto pointer_str = to_json_pointer(path);
    if (!pointer_str) {
        return nullptr;
    }

    rapidjson::Pointer pointer(pointer_str->c_str(), pointer_str->size());
    if (!pointer.IsValid()) {
        return nullptr;
    }
    return pointer.Get(root);
}

}  // namespace ruleval::path
