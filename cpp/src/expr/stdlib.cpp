// ==============================================================================
// stdlib.cpp - Стандартная библиотека функций выражений
// ==============================================================================
//
// Назначение:
// - size, contains, startsWith, endsWith, matches, lowerAscii, upperAscii
// - Конверсии: int, uint, double, string, bytes, bool, timestamp, dyn
//
// Ошибки времени выполнения (переполнение, неверная конверсия, некорректный
// regex) сообщаются через EvaluationFailure.
//
// ==============================================================================

#include "ruleval/env.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <re2/re2.h>

namespace ruleval {

namespace {

// ============================================================================
// Вспомогательные функции
// ============================================================================

Overload global(std::string id, std::vector<ValueKind> params, ValueKind result,
                FunctionImpl impl) {
    return Overload{std::move(id), std::move(params), std::move(result), false, std::move(impl)};
}

Overload receiver(std::string id, std::vector<ValueKind> params, ValueKind result,
                  FunctionImpl impl) {
    return Overload{std::move(id), std::move(params), std::move(result), true, std::move(impl)};
}

// Количество кодовых точек UTF-8
std::int64_t utf8_length(const std::string& s) {
    std::int64_t count = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// RE2: линейное время, без рекурсии по длине строки
bool regex_matches(const std::string& text, const std::string& pattern) {
    RE2::Options options;
    options.set_log_errors(false);
    RE2 re(pattern, options);
    if (!re.ok()) {
        throw EvaluationFailure("invalid regex '" + pattern + "': " + re.error());
    }
    return RE2::PartialMatch(text, re);
}

std::string ascii_transform(std::string s, bool upper) {
    for (char& c : s) {
        auto uc = static_cast<unsigned char>(c);
        c = static_cast<char>(upper ? std::toupper(uc) : std::tolower(uc));
    }
    return s;
}

std::string format_double(double d) {
    if (std::isnan(d)) {
        return "NaN";
    }
    if (std::isinf(d)) {
        return d > 0 ? "+Inf" : "-Inf";
    }
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
    if (ec != std::errc{}) {
        throw EvaluationFailure("cannot format double");
    }
    return std::string(buf, ptr);
}

std::int64_t double_to_int(double d) {
    // 2^63 точно представимо в double; диапазон [-2^63, 2^63)
    constexpr double limit = 9223372036854775808.0;
    if (std::isnan(d) || d >= limit || d < -limit) {
        throw EvaluationFailure("double out of int range: " + format_double(d));
    }
    return static_cast<std::int64_t>(d);
}

std::uint64_t double_to_uint(double d) {
    constexpr double limit = 18446744073709551616.0;
    if (std::isnan(d) || d >= limit || d < 0) {
        throw EvaluationFailure("double out of uint range: " + format_double(d));
    }
    return static_cast<std::uint64_t>(d);
}

template <typename T>
T parse_integer(const std::string& s, const char* type_name) {
    T out = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    if (ec != std::errc{} || ptr != s.data() + s.size() || s.empty()) {
        throw EvaluationFailure("cannot convert '" + s + "' to " + type_name);
    }
    return out;
}

double parse_double(const std::string& s) {
    if (s.empty()) {
        throw EvaluationFailure("cannot convert '' to double");
    }
    char* end = nullptr;
    double d = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size()) {
        throw EvaluationFailure("cannot convert '" + s + "' to double");
    }
    return d;
}

Timestamp parse_timestamp(const std::string& s) {
    auto ts = Timestamp::parse(s);
    if (!ts) {
        throw EvaluationFailure("cannot convert '" + s + "' to timestamp");
    }
    return *ts;
}

// ============================================================================
// Группы функций
// ============================================================================

FunctionDecl size_function() {
    auto string_size = [](const std::vector<Value>& a) {
        return Value(utf8_length(a[0].as_string()));
    };
    auto bytes_size = [](const std::vector<Value>& a) {
        return Value(static_cast<std::int64_t>(a[0].as_bytes().data.size()));
    };
    auto list_size = [](const std::vector<Value>& a) {
        return Value(static_cast<std::int64_t>(a[0].as_array().size()));
    };
    auto map_size = [](const std::vector<Value>& a) {
        return Value(static_cast<std::int64_t>(a[0].as_object().size()));
    };

    return FunctionDecl{"size",
                        {global("size_string", {KindTag::String}, KindTag::Int, string_size),
                         global("size_bytes", {KindTag::Bytes}, KindTag::Int, bytes_size),
                         global("size_list", {KindTag::List}, KindTag::Int, list_size),
                         global("size_map", {KindTag::Mapping}, KindTag::Int, map_size),
                         receiver("string_size", {KindTag::String}, KindTag::Int, string_size),
                         receiver("bytes_size", {KindTag::Bytes}, KindTag::Int, bytes_size),
                         receiver("list_size", {KindTag::List}, KindTag::Int, list_size),
                         receiver("map_size", {KindTag::Mapping}, KindTag::Int, map_size)}};
}

std::vector<FunctionDecl> string_functions() {
    std::vector<FunctionDecl> out;

    out.push_back(FunctionDecl{
        "contains",
        {receiver("contains_string", {KindTag::String, KindTag::String}, KindTag::Bool,
                  [](const std::vector<Value>& a) {
                      return Value(a[0].as_string().find(a[1].as_string()) != std::string::npos);
                  })}});

    out.push_back(FunctionDecl{
        "startsWith",
        {receiver("starts_with_string", {KindTag::String, KindTag::String}, KindTag::Bool,
                  [](const std::vector<Value>& a) {
                      return Value(starts_with(a[0].as_string(), a[1].as_string()));
                  })}});

    out.push_back(FunctionDecl{
        "endsWith",
        {receiver("ends_with_string", {KindTag::String, KindTag::String}, KindTag::Bool,
                  [](const std::vector<Value>& a) {
                      return Value(ends_with(a[0].as_string(), a[1].as_string()));
                  })}});

    auto matches = [](const std::vector<Value>& a) {
        return Value(regex_matches(a[0].as_string(), a[1].as_string()));
    };
    out.push_back(FunctionDecl{
        "matches",
        {global("matches", {KindTag::String, KindTag::String}, KindTag::Bool, matches),
         receiver("matches_string", {KindTag::String, KindTag::String}, KindTag::Bool,
                  matches)}});

    out.push_back(FunctionDecl{
        "lowerAscii",
        {receiver("string_lower_ascii", {KindTag::String}, KindTag::String,
                  [](const std::vector<Value>& a) {
                      return Value(ascii_transform(a[0].as_string(), false));
                  })}});

    out.push_back(FunctionDecl{
        "upperAscii",
        {receiver("string_upper_ascii", {KindTag::String}, KindTag::String,
                  [](const std::vector<Value>& a) {
                      return Value(ascii_transform(a[0].as_string(), true));
                  })}});

    return out;
}

std::vector<FunctionDecl> conversion_functions() {
    std::vector<FunctionDecl> out;
    auto identity = [](const std::vector<Value>& a) { return a[0]; };

    // int()
    out.push_back(FunctionDecl{
        "int",
        {global("int64_to_int64", {KindTag::Int}, KindTag::Int, identity),
         global("uint64_to_int64", {KindTag::Uint}, KindTag::Int,
                [](const std::vector<Value>& a) {
                    if (a[0].as_uint() >
                        static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                        throw EvaluationFailure("int overflow");
                    }
                    return Value(static_cast<std::int64_t>(a[0].as_uint()));
                }),
         global("double_to_int64", {KindTag::Double}, KindTag::Int,
                [](const std::vector<Value>& a) { return Value(double_to_int(a[0].as_double())); }),
         global("string_to_int64", {KindTag::String}, KindTag::Int,
                [](const std::vector<Value>& a) {
                    return Value(parse_integer<std::int64_t>(a[0].as_string(), "int"));
                }),
         global("timestamp_to_int64", {KindTag::Timestamp}, KindTag::Int,
                [](const std::vector<Value>& a) { return Value(a[0].as_timestamp().seconds); })}});

    // uint()
    out.push_back(FunctionDecl{
        "uint",
        {global("uint64_to_uint64", {KindTag::Uint}, KindTag::Uint, identity),
         global("int64_to_uint64", {KindTag::Int}, KindTag::Uint,
                [](const std::vector<Value>& a) {
                    if (a[0].as_int() < 0) {
                        throw EvaluationFailure("uint overflow");
                    }
                    return Value(static_cast<std::uint64_t>(a[0].as_int()));
                }),
         global("double_to_uint64", {KindTag::Double}, KindTag::Uint,
                [](const std::vector<Value>& a) {
                    return Value(double_to_uint(a[0].as_double()));
                }),
         global("string_to_uint64", {KindTag::String}, KindTag::Uint,
                [](const std::vector<Value>& a) {
                    return Value(parse_integer<std::uint64_t>(a[0].as_string(), "uint"));
                })}});

    // double()
    out.push_back(FunctionDecl{
        "double",
        {global("double_to_double", {KindTag::Double}, KindTag::Double, identity),
         global("int64_to_double", {KindTag::Int}, KindTag::Double,
                [](const std::vector<Value>& a) {
                    return Value(static_cast<double>(a[0].as_int()));
                }),
         global("uint64_to_double", {KindTag::Uint}, KindTag::Double,
                [](const std::vector<Value>& a) {
                    return Value(static_cast<double>(a[0].as_uint()));
                }),
         global("string_to_double", {KindTag::String}, KindTag::Double,
                [](const std::vector<Value>& a) { return Value(parse_double(a[0].as_string())); })}});

    // string()
    out.push_back(FunctionDecl{
        "string",
        {global("string_to_string", {KindTag::String}, KindTag::String, identity),
         global("int64_to_string", {KindTag::Int}, KindTag::String,
                [](const std::vector<Value>& a) { return Value(std::to_string(a[0].as_int())); }),
         global("uint64_to_string", {KindTag::Uint}, KindTag::String,
                [](const std::vector<Value>& a) { return Value(std::to_string(a[0].as_uint())); }),
         global("double_to_string", {KindTag::Double}, KindTag::String,
                [](const std::vector<Value>& a) { return Value(format_double(a[0].as_double())); }),
         global("bytes_to_string", {KindTag::Bytes}, KindTag::String,
                [](const std::vector<Value>& a) { return Value(a[0].as_bytes().data); }),
         global("bool_to_string", {KindTag::Bool}, KindTag::String,
                [](const std::vector<Value>& a) {
                    return Value(std::string(a[0].as_bool() ? "true" : "false"));
                }),
         global("timestamp_to_string", {KindTag::Timestamp}, KindTag::String,
                [](const std::vector<Value>& a) {
                    return Value(a[0].as_timestamp().to_string());
                })}});

    // bytes()
    out.push_back(FunctionDecl{
        "bytes",
        {global("bytes_to_bytes", {KindTag::Bytes}, KindTag::Bytes, identity),
         global("string_to_bytes", {KindTag::String}, KindTag::Bytes,
                [](const std::vector<Value>& a) { return Value::make_bytes(a[0].as_string()); })}});

    // bool()
    out.push_back(FunctionDecl{
        "bool",
        {global("bool_to_bool", {KindTag::Bool}, KindTag::Bool, identity),
         global("string_to_bool", {KindTag::String}, KindTag::Bool,
                [](const std::vector<Value>& a) {
                    const std::string& s = a[0].as_string();
                    if (s == "true" || s == "True" || s == "TRUE" || s == "t" || s == "1") {
                        return Value(true);
                    }
                    if (s == "false" || s == "False" || s == "FALSE" || s == "f" || s == "0") {
                        return Value(false);
                    }
                    throw EvaluationFailure("cannot convert '" + s + "' to bool");
                })}});

    // timestamp()
    out.push_back(FunctionDecl{
        "timestamp",
        {global("timestamp_to_timestamp", {KindTag::Timestamp}, KindTag::Timestamp, identity),
         global("string_to_timestamp", {KindTag::String}, KindTag::Timestamp,
                [](const std::vector<Value>& a) {
                    return Value(parse_timestamp(a[0].as_string()));
                }),
         global("int64_to_timestamp", {KindTag::Int}, KindTag::Timestamp,
                [](const std::vector<Value>& a) {
                    return Value(Timestamp::from_unix(a[0].as_int()));
                })}});

    // dyn()
    out.push_back(FunctionDecl{
        "dyn", {global("to_dyn", {ValueKind::dyn()}, ValueKind::dyn(), identity)}});

    return out;
}

}  // namespace

std::vector<FunctionDecl> standard_library() {
    std::vector<FunctionDecl> out;
    out.push_back(size_function());
    for (auto& decl : string_functions()) {
        out.push_back(std::move(decl));
    }
    for (auto& decl : conversion_functions()) {
        out.push_back(std::move(decl));
    }
    return out;
}

}  // namespace ruleval
