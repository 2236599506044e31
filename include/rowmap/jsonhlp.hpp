// jsonhlp.hpp

#pragma once

// Centralize all necessary RapidJSON headers
#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
#include "rapidjson/istreamwrapper.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

#include <cstdint>
#include <fstream>
#include <string>
#include <type_traits>

namespace rowmap {

namespace json = rapidjson;
using jdoc = json::Document;
using jval = json::Value;
using jit = json::Value::ConstMemberIterator;
using jalloc = json::Document::AllocatorType;

// A namespace to keep our helper functions organized
namespace jhlp {

    // Parse a JSON string into a Document. Returns false on a parse error,
    // parse_error() describes it.
    inline bool parse_str(const std::string& json_string, jdoc& document) {
        document.Parse(json_string.c_str());
        return !document.HasParseError();
    }

    inline bool parse_file(const std::string& file_path, jdoc& document) {
        std::ifstream ifs(file_path);
        if (!ifs.is_open()) return false;
        json::IStreamWrapper isw(ifs);
        document.ParseStream(isw);
        return !document.HasParseError();
    }

    inline std::string parse_error(const jdoc& document) {
        if (!document.HasParseError()) return "";
        return std::string(json::GetParseError_En(document.GetParseError())) + " at offset "
            + std::to_string(document.GetErrorOffset());
    }

    inline std::string dump(const jval& value) {
        if (value.IsString()) return value.GetString();
        if (value.IsNull()) return "null";
        json::StringBuffer buffer;
        json::Writer<json::StringBuffer> writer(buffer);
        value.Accept(writer);
        return buffer.GetString();
    }

    // Template helper to get a value from an object member.
    // Returns default_value if the key is not found or the type is incorrect.
    template <typename T>
    inline T get(const jval& parent, const std::string& key, const T& default_value = T()) {
        if (!parent.IsObject() || !parent.HasMember(key.c_str())) return default_value;
        const jval& val = parent.FindMember(key.c_str())->value;
        if constexpr (std::is_same_v<T, std::string>) {
            if (val.IsString()) return val.GetString();
        } else if constexpr (std::is_same_v<T, bool>) {
            if (val.IsBool()) return val.GetBool();
        } else if constexpr (std::is_same_v<T, int>) {
            if (val.IsInt()) return val.GetInt();
        } else if constexpr (std::is_same_v<T, int64_t>) {
            if (val.IsInt64()) return val.GetInt64();
        } else if constexpr (std::is_same_v<T, double>) {
            if (val.IsNumber()) return val.GetDouble();
        }
        return default_value;
    }

    // Build a Value from a C++ scalar; strings are copied into the allocator.
    template <typename T>
    inline jval to_value(const T& value, jalloc& a) {
        using U = std::decay_t<T>;
        if constexpr (std::is_same_v<U, std::nullptr_t>) {
            return jval(json::kNullType);
        } else if constexpr (std::is_same_v<U, bool>) {
            return jval(value);
        } else if constexpr (std::is_integral_v<U>) {
            return jval(static_cast<int64_t>(value));
        } else if constexpr (std::is_floating_point_v<U>) {
            return jval(static_cast<double>(value));
        } else if constexpr (std::is_same_v<U, jval>) {
            return jval(value, a);
        } else {
            std::string s(value);
            return jval(s.c_str(), static_cast<json::SizeType>(s.size()), a);
        }
    }

    // Convert a Value to a C++ scalar. Returns false if it does not fit.
    template <typename T>
    inline bool as(const jval& value, T& out) {
        if constexpr (std::is_same_v<T, std::string>) {
            if (!value.IsString()) return false;
            out.assign(value.GetString(), value.GetStringLength());
            return true;
        } else if constexpr (std::is_same_v<T, bool>) {
            if (value.IsBool()) { out = value.GetBool(); return true; }
            if (value.IsInt64()) { out = value.GetInt64() != 0; return true; }
            return false;
        } else if constexpr (std::is_integral_v<T>) {
            if (!value.IsInt64()) return false;
            out = static_cast<T>(value.GetInt64());
            return true;
        } else if constexpr (std::is_floating_point_v<T>) {
            if (!value.IsNumber()) return false;
            out = static_cast<T>(value.GetDouble());
            return true;
        } else {
            static_assert(std::is_same_v<T, void>, "unsupported conversion");
            return false;
        }
    }

    // Replace the member if present, add it otherwise.
    inline void set_member(jval& object, const std::string& key, jval&& value, jalloc& a) {
        auto it = object.FindMember(key.c_str());
        if (it != object.MemberEnd()) {
            it->value = value.Move();
            return;
        }
        object.AddMember(jval(key.c_str(), static_cast<json::SizeType>(key.size()), a).Move(), value.Move(), a);
    }

} // namespace jhlp

} // namespace rowmap
