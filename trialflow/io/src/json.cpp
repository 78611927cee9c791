#include <trialflow/io/json.hpp>
#include <trialflow/io/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <fstream>
#include <sstream>

namespace trialflow::io {

namespace {

using namespace trialflow::core;

Value from_rapidjson(const rapidjson::Value& json) {
    if (json.IsNull()) {
        return {};
    }
    if (json.IsBool()) {
        return json.GetBool();
    }
    if (json.IsInt64()) {
        return json.GetInt64();
    }
    if (json.IsNumber()) {
        return json.GetDouble();
    }
    if (json.IsString()) {
        return std::string(json.GetString(), json.GetStringLength());
    }
    if (json.IsArray()) {
        Array array;
        array.reserve(json.Size());
        for (rapidjson::SizeType idx = 0; idx < json.Size(); ++idx) {
            array.push_back(from_rapidjson(json[idx]));
        }
        return array;
    }

    Object object;
    for (auto it = json.MemberBegin(); it != json.MemberEnd(); ++it) {
        object[std::string(it->name.GetString(), it->name.GetStringLength())] = from_rapidjson(it->value);
    }
    return object;
}

template<typename Writer>
void write_value(const Value& value, Writer& writer) {
    if (value.is_null()) {
        writer.Null();
    } else if (value.is_bool()) {
        writer.Bool(value.as_bool());
    } else if (value.is_int()) {
        writer.Int64(value.as_int());
    } else if (value.is_double()) {
        writer.Double(value.as_double());
    } else if (value.is_string()) {
        const auto& str = value.as_string();
        writer.String(str.data(), static_cast<rapidjson::SizeType>(str.size()));
    } else if (value.is_array()) {
        writer.StartArray();
        for (const auto& element : value.as_array()) {
            write_value(element, writer);
        }
        writer.EndArray();
    } else {
        writer.StartObject();
        for (const auto& [key, member] : value.as_object()) {
            writer.Key(key.data(), static_cast<rapidjson::SizeType>(key.size()));
            write_value(member, writer);
        }
        writer.EndObject();
    }
}

} // anonymous namespace

core::Value parse_json(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw IoError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }
    return from_rapidjson(doc);
}

core::Object load_settings(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw IoError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_settings_from_string(oss.str());
}

core::Object load_settings_from_string(std::string_view json) {
    core::Value value = parse_json(json);
    if (!value.is_object()) {
        throw IoError("root must be an object", "settings");
    }
    return value.as_object();
}

void write_json(const core::Value& value, std::ostream& out) {
    out << to_json_string(value);
}

std::string to_json_string(const core::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    write_value(value, writer);
    return {buffer.GetString(), buffer.GetSize()};
}

} // namespace trialflow::io
