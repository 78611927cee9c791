#include <trialflow/io/experiment_loader.hpp>
#include <trialflow/io/error.hpp>
#include <trialflow/io/json.hpp>

#include <trialflow/core/session.hpp>

#include <fstream>
#include <sstream>

namespace trialflow::io {

namespace {

using namespace trialflow::core;

std::vector<std::string> get_string_list(const Object& obj, const char* name, const std::string& context) {
    std::vector<std::string> result;
    auto it = obj.find(name);
    if (it == obj.end()) {
        return result;
    }
    if (!it->second.is_array()) {
        throw IoError(std::string("field '") + name + "' must be an array of strings", context);
    }
    for (const auto& element : it->second.as_array()) {
        if (!element.is_string()) {
            throw IoError(std::string("field '") + name + "' must be an array of strings", context);
        }
        result.push_back(element.as_string());
    }
    return result;
}

Object get_object_or_empty(const Object& obj, const char* name, const std::string& context) {
    auto it = obj.find(name);
    if (it == obj.end()) {
        return {};
    }
    if (!it->second.is_object()) {
        throw IoError(std::string("field '") + name + "' must be an object", context);
    }
    return it->second.as_object();
}

BlockDefinition parse_block(const Value& json, const std::string& context) {
    if (!json.is_object()) {
        throw IoError("block must be an object", context);
    }
    const Object& obj = json.as_object();

    auto trials = obj.find("trials");
    if (trials == obj.end()) {
        throw IoError("missing required field 'trials'", context);
    }
    if (!trials->second.is_int() || trials->second.as_int() < 0) {
        throw IoError("field 'trials' must be a non-negative integer", context);
    }

    BlockDefinition block;
    block.trials = static_cast<std::size_t>(trials->second.as_int());
    block.settings = get_object_or_empty(obj, "settings", context);
    return block;
}

} // anonymous namespace

ExperimentDefinition load_experiment(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw IoError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_experiment_from_string(oss.str());
}

ExperimentDefinition load_experiment_from_string(std::string_view json) {
    Value doc = parse_json(json);
    if (!doc.is_object()) {
        throw IoError("root must be an object", "experiment");
    }
    const Object& root = doc.as_object();

    ExperimentDefinition result;
    result.settings = get_object_or_empty(root, "settings", "experiment");
    result.settings_to_log = get_string_list(root, "settings_to_log", "experiment");
    result.custom_headers = get_string_list(root, "custom_headers", "experiment");

    if (auto it = root.find("ad_hoc_headers"); it != root.end()) {
        if (!it->second.is_bool()) {
            throw IoError("field 'ad_hoc_headers' must be a boolean", "experiment");
        }
        result.ad_hoc_headers = it->second.as_bool();
    }

    if (auto it = root.find("blocks"); it != root.end()) {
        if (!it->second.is_array()) {
            throw IoError("field 'blocks' must be an array", "experiment");
        }
        const Array& blocks = it->second.as_array();
        for (std::size_t idx = 0; idx < blocks.size(); ++idx) {
            result.blocks.push_back(parse_block(blocks[idx], "blocks[" + std::to_string(idx) + "]"));
        }
    }

    return result;
}

void apply_definition(core::Session& session, const ExperimentDefinition& definition) {
    auto& options = session.options();
    options.settings_to_log.insert(options.settings_to_log.end(),
                                   definition.settings_to_log.begin(), definition.settings_to_log.end());
    options.custom_headers.insert(options.custom_headers.end(),
                                  definition.custom_headers.begin(), definition.custom_headers.end());
    if (definition.ad_hoc_headers) {
        options.ad_hoc_header_add = *definition.ad_hoc_headers;
    }

    for (const auto& block_def : definition.blocks) {
        auto& block = session.create_block(block_def.trials);
        block.settings().assign(block_def.settings);
    }
}

} // namespace trialflow::io
