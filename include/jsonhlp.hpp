// jsonhlp.hpp

#pragma once

// Centralize all necessary RapidJSON headers
#include "rapidjson/document.h"
#include "rapidjson/writer.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/istreamwrapper.h"
#include "rapidjson/error/en.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "lib.hpp"

namespace json = rapidjson;
using jdoc = json::Document;
using jval = json::Value;
using jit = rapidjson::Value::ConstMemberIterator;
using jdaloc = rapidjson::Document::AllocatorType;


// A namespace to keep our helper functions organized
namespace jhlp {

    // Parse a JSON string into a Document. Logs and returns false on error.
    inline bool parse_str(const std::string& json_string, rapidjson::Document& document) {
        document.Parse(json_string.c_str());
        if (document.HasParseError()) {
            SPDLOG_ERROR("JSON parse error: {} at offset {}",
                rapidjson::GetParseError_En(document.GetParseError()), document.GetErrorOffset());
            return false;
        }
        return true;
    }

    // Parse a JSON file into a Document. Logs and returns false on error.
    inline bool parse_file(const std::string& file_path, rapidjson::Document& document) {
        std::ifstream ifs(file_path);
        if (!ifs.is_open()) {
            SPDLOG_ERROR("Failed to open file: {}", file_path);
            return false;
        }
        rapidjson::IStreamWrapper isw(ifs);
        document.ParseStream(isw);
        if (document.HasParseError()) {
            SPDLOG_ERROR("JSON parse error in file {}: {} at offset {}", file_path,
                rapidjson::GetParseError_En(document.GetParseError()), document.GetErrorOffset());
            return false;
        }
        return true;
    }

    // Same as parse_file, throws on failure.
    inline void load_file(const std::string& file_path, rapidjson::Document& document) {
        if (!parse_file(file_path, document)) THROW("Invalid JSON file: %s", file_path.c_str());
    }

    inline std::string stringify(const rapidjson::Value& value, bool pretty = false) {
        rapidjson::StringBuffer buffer;
        if (pretty) {
            rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
            writer.SetIndent(' ', 2);
            value.Accept(writer);
        } else {
            rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
            value.Accept(writer);
        }
        return buffer.GetString();
    }

    // Write pretty JSON to 'path' through a temp file + rename so readers never
    // see a half written file.
    inline void write_file(const std::filesystem::path& path, const rapidjson::Value& value) {
        std::filesystem::path tmp = path;
        tmp += ".tmp";
        {
            std::ofstream ofs(tmp, std::ios::trunc);
            if (!ofs) THROW("Failed to open for writing: %s", tmp.c_str());
            ofs << stringify(value, true) << '\n';
            ofs.flush();
            if (!ofs) THROW("Failed to write: %s", tmp.c_str());
        }
        std::error_code ec;
        std::filesystem::rename(tmp, path, ec);
        if (ec) {
            std::filesystem::remove(tmp);
            THROW("Failed to rename %s: %s", tmp.c_str(), ec.message().c_str());
        }
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

    // Get a member with type check, returns default_value if missing or of another type.
    template<typename T>
    inline T get(const rapidjson::Value& parent, const std::string& key, const T& default_value = T()) {

        if (!parent.IsObject() || !parent.HasMember(key.c_str())) { return default_value; }
        const jval& val = parent.FindMember(key.c_str())->value;
        if constexpr (std::is_same_v<T, std::string>) {
            if (val.IsString()) return val.GetString();
            if (val.IsNumber()) return val2str(val);
        } else if constexpr (std::is_same_v<T, int>) {
            if (val.IsInt()) return val.GetInt();
        } else if constexpr (std::is_same_v<T, int64_t>) {
            if (val.IsInt64()) return val.GetInt64();
        } else if constexpr (std::is_same_v<T, double>){
            if (val.IsNumber()) return val.GetDouble();
        } else if constexpr (std::is_same_v<T, bool>) {
            if (val.IsBool()) return val.GetBool();
        }
        return default_value;
    }

    // Array of strings member; missing member gives an empty list, other types throw.
    inline std::vector<std::string> get_strings(const rapidjson::Value& parent, const std::string& key) {
        std::vector<std::string> out;
        if (!parent.IsObject() || !parent.HasMember(key.c_str())) return out;
        const jval& arr = parent.FindMember(key.c_str())->value;
        if (arr.IsNull()) return out;
        if (!arr.IsArray()) THROW("JSON member '%s' must be an array of strings", key.c_str());
        for (const auto& el : arr.GetArray()) {
            if (!el.IsString()) THROW("JSON member '%s' must be an array of strings", key.c_str());
            out.emplace_back(el.GetString());
        }
        return out;
    }

    inline jval str_val(const std::string& s, jdaloc& a) {
        return jval(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), a);
    }

    inline jval strings_val(const std::vector<std::string>& items, jdaloc& a) {
        jval arr(rapidjson::kArrayType);
        for (const auto& s : items) arr.PushBack(str_val(s, a), a);
        return arr;
    }

    // Add (or replace) a member on an object value.
    template<typename T>
    inline void set(rapidjson::Value& parent, const std::string& key, const T& value, jdaloc& allocator) {
        if (parent.HasMember(key.c_str())) parent.RemoveMember(key.c_str());
        if constexpr (std::is_same_v<T, std::string>) {
            parent.AddMember(str_val(key, allocator), str_val(value, allocator), allocator);
        } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            parent.AddMember(str_val(key, allocator), strings_val(value, allocator), allocator);
        } else {
            parent.AddMember(str_val(key, allocator), jval(value), allocator);
        }
    }

    // Move a ready built value under 'key'.
    inline void set_value(rapidjson::Value& parent, const std::string& key, jval&& value, jdaloc& allocator) {
        if (parent.HasMember(key.c_str())) parent.RemoveMember(key.c_str());
        parent.AddMember(str_val(key, allocator), value, allocator);
    }

} // namespace jhlp
