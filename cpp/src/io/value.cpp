// ==============================================================================
// value.cpp - Реализация Value (каноническая модель значения)
// ==============================================================================

#include "ruleval/value.hpp"

#include <cmath>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <stdexcept>

namespace ruleval {

// ----------------------------------------------------------------------------
// Value::from_rapidjson
// ----------------------------------------------------------------------------
//
// Числа в режиме Typed: Int64 -> UInt64 -> Double. Целые, которые помещаются
// в int64, получают тип Int; большие положительные: Uint; всё с дробной
// частью или экспонентой: Double. В режиме AsDouble любое число: Double
// (так типизируются поля документа события).
//

Value Value::from_rapidjson(const rapidjson::Value& json, JsonNumbers numbers) {
    if (json.IsNull()) {
        return Value();
    }

    if (json.IsBool()) {
        return Value(json.GetBool());
    }

    if (json.IsNumber()) {
        if (numbers == JsonNumbers::AsDouble) {
            return Value(json.GetDouble());
        }
        if (json.IsInt64()) {
            return Value(static_cast<std::int64_t>(json.GetInt64()));
        }
        if (json.IsUint64()) {
            return Value(static_cast<std::uint64_t>(json.GetUint64()));
        }
        return Value(json.GetDouble());
    }

    if (json.IsString()) {
        return Value(std::string(json.GetString(), json.GetStringLength()));
    }

    if (json.IsArray()) {
        Array arr;
        arr.reserve(json.Size());
        for (rapidjson::SizeType i = 0; i < json.Size(); ++i) {
            arr.push_back(from_rapidjson(json[i], numbers));
        }
        return Value(std::move(arr));
    }

    if (json.IsObject()) {
        Object obj;
        for (auto it = json.MemberBegin(); it != json.MemberEnd(); ++it) {
            std::string key(it->name.GetString(), it->name.GetStringLength());
            obj[key] = from_rapidjson(it->value, numbers);
        }
        return Value(std::move(obj));
    }

    // Неизвестный тип (не должно произойти)
    return Value();
}

// ----------------------------------------------------------------------------
// Value::to_rapidjson
// ----------------------------------------------------------------------------

namespace {

void object_to_rapidjson(const ValueObject& obj, rapidjson::Value& out,
                         rapidjson::Document::AllocatorType& alloc) {
    out.SetObject();
    for (const auto& [key, val] : obj) {
        rapidjson::Value k;
        k.SetString(key.c_str(), static_cast<rapidjson::SizeType>(key.size()), alloc);
        rapidjson::Value v;
        val.to_rapidjson(v, alloc);
        out.AddMember(k, v, alloc);
    }
}

}  // namespace

void Value::to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const {
    if (is_null()) {
        out.SetNull();
    } else if (is_bool()) {
        out.SetBool(as_bool());
    } else if (is_int()) {
        out.SetInt64(as_int());
    } else if (is_uint()) {
        out.SetUint64(as_uint());
    } else if (is_double()) {
        double d = as_double();
        // JSON не умеет NaN/Inf
        if (!std::isfinite(d)) {
            throw std::runtime_error("could not convert float to JSON: non-finite value");
        }
        out.SetDouble(d);
    } else if (is_string()) {
        const auto& s = as_string();
        out.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
    } else if (is_bytes()) {
        const auto& b = as_bytes().data;
        out.SetString(b.c_str(), static_cast<rapidjson::SizeType>(b.size()), alloc);
    } else if (is_timestamp()) {
        std::string s = as_timestamp().to_string();
        out.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
    } else if (is_array()) {
        out.SetArray();
        const auto& arr = as_array();
        out.Reserve(static_cast<rapidjson::SizeType>(arr.size()), alloc);
        for (const auto& elem : arr) {
            rapidjson::Value v;
            elem.to_rapidjson(v, alloc);
            out.PushBack(v, alloc);
        }
    } else if (is_object()) {
        object_to_rapidjson(as_object(), out, alloc);
    } else if (is_host()) {
        object_to_rapidjson(as_host().fields, out, alloc);
    } else {
        out.SetNull();
    }
}

std::string Value::to_json() const {
    rapidjson::Document doc;
    to_rapidjson(doc, doc.GetAllocator());
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

}  // namespace ruleval
