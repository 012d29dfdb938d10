// jsonhlp.hpp

#pragma once

// Centralize all necessary RapidJSON headers
#include "rapidjson/document.h"
#include "rapidjson/writer.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/error/en.h"

#include <iostream>
#include <string>
#include <type_traits>
#include "lib.hpp"

namespace json = rapidjson;
using jdoc = json::Document;
using jval = json::Value;
using jit = rapidjson::Value::ConstMemberIterator;


// A namespace to keep our helper functions organized
namespace jhlp {

    // Parses a JSON string into a RapidJSON Document.
    // Returns false on failure; the reason is echoed to std::cerr when verbose.
    inline bool parse_str(const std::string& json_string, rapidjson::Document& document, bool verbose = false) {
        document.Parse(json_string.c_str(), json_string.size());
        if (document.HasParseError()) {
            if (verbose) {
                std::cerr << "JSON Parse Error: " << rapidjson::GetParseError_En(document.GetParseError())
                          << " at offset " << document.GetErrorOffset() << std::endl;
            }
            return false;
        }
        return true;
    }

    // Helper function to stringify a RapidJSON Value into a std::string.
    inline std::string stringify(const rapidjson::Value& value, bool pretty = false) {
        rapidjson::StringBuffer buffer;
        if (pretty) {
            rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
            value.Accept(writer);
        } else {
            rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
            value.Accept(writer);
        }
        return buffer.GetString();
    }

    // Name of a value's JSON type, for error messages.
    inline const char* type_name(const rapidjson::Value& value) {
        if (value.IsNull()) return "nothing";
        if (value.IsBool()) return "bool";
        if (value.IsObject()) return "record";
        if (value.IsArray()) return "list";
        if (value.IsString()) return "string";
        if (value.IsInt64() || value.IsUint64()) return "int";
        return "float";
    }

    // Utility to convert any Value to string
    inline std::string val2str(const rapidjson::Value& value) {
        if (value.IsString()) {
            return value.GetString();
        } else if (value.IsBool()) {
            return value.GetBool() ? "true" : "false";
        } else if (value.IsNull()) {
            return "null";
        }
        return stringify(value);
    }

    // Looks up `key` in an object and returns it as T.
    // Returns default_value if the key is missing or has another type.
    template<typename T>
    inline T get(const rapidjson::Value& parent, const std::string& key, const T& default_value = T()) {

        if (!parent.IsObject() || !parent.HasMember(key.c_str())) { return default_value; }
        const jval& val = parent.FindMember(key.c_str())->value;
        if constexpr (std::is_same_v<T, std::string>) {
            if (val.IsString()) return val.GetString();
            if (val.IsNumber()) return val2str(val);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            if (val.IsInt64()) return val.GetInt64();
        } else if constexpr (std::is_same_v<T, uint64_t>) {
            if (val.IsUint64()) return val.GetUint64();
        } else if constexpr (std::is_same_v<T, bool>) {
            if (val.IsBool()) return val.GetBool();
        }
        return default_value;
    }

    // Returns the member named `key`, or nullptr when absent.
    inline const jval* find(const rapidjson::Value& parent, const char* key) {
        if (!parent.IsObject()) return nullptr;
        jit it = parent.FindMember(key);
        return it == parent.MemberEnd() ? nullptr : &it->value;
    }

    // Template helper to set a value in a RapidJSON Document object.
    template<typename T>
    inline void set(rapidjson::Document& document, const std::string& key, const T& value) {
        rapidjson::Document::AllocatorType& allocator = document.GetAllocator();
        if constexpr (std::is_same_v<T, std::string>) {
            document.AddMember(rapidjson::Value(key.c_str(), allocator).Move(),
                               rapidjson::Value(value.c_str(), allocator).Move(),
                               allocator);
        } else {
            document.AddMember(rapidjson::Value(key.c_str(), allocator).Move(),
                               value,
                               allocator);
        }
    }

} // namespace jhlp
