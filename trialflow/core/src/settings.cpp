#include <trialflow/core/settings.hpp>
#include <trialflow/core/error.hpp>

#include <utility>

namespace trialflow::core {

Settings::Settings(Object table, const Settings* parent)
    : table_(std::move(table))
    , parent_(parent) {}

Settings::Settings(const Settings* parent)
    : parent_(parent) {}

const Value* Settings::find(const std::string& key) const {
    for (const Settings* node = this; node != nullptr; node = node->parent_) {
        auto it = node->table_.find(key);
        if (it != node->table_.end()) {
            return &it->second;
        }
    }
    return nullptr;
}

const Value& Settings::get(const std::string& key) const {
    if (const Value* value = find(key)) {
        return *value;
    }
    throw KeyNotFoundError(key);
}

Value Settings::get_or(const std::string& key, Value fallback) const {
    if (const Value* value = find(key)) {
        return *value;
    }
    return fallback;
}

bool Settings::contains(const std::string& key) const {
    return find(key) != nullptr;
}

bool Settings::contains_local(const std::string& key) const {
    return table_.find(key) != table_.end();
}

void Settings::set(const std::string& key, Value value) {
    table_[key] = std::move(value);
}

bool Settings::erase(const std::string& key) {
    return table_.erase(key) > 0;
}

void Settings::assign(Object table) {
    table_ = std::move(table);
}

} // namespace trialflow::core
