#include <trialflow/io/memory_data_handler.hpp>

#include <trialflow/core/session.hpp>

#include <utility>

namespace trialflow::io {

template<typename T>
std::string MemoryDataHandler::store(T payload, const core::DataTarget& target) {
    std::string location = "memory://" + target.experiment + "/" + target.participant + "/" +
                           core::Session::session_number_to_name(target.session_number) + "/" + target.name;

    std::lock_guard lock(mutex_);
    payloads_.push_back(StoredPayload{
        target, location, decltype(StoredPayload::payload)(std::in_place_type<T>, std::move(payload))});
    return location;
}

std::string MemoryDataHandler::handle_table(const core::DataTable& table, const core::DataTarget& target) {
    return store(table, target);
}

std::string MemoryDataHandler::handle_json(const core::Value& value, const core::DataTarget& target) {
    return store(value, target);
}

std::string MemoryDataHandler::handle_text(std::string_view text, const core::DataTarget& target) {
    return store(std::string(text), target);
}

std::string MemoryDataHandler::handle_bytes(std::span<const std::uint8_t> bytes, const core::DataTarget& target) {
    return store(std::vector<std::uint8_t>(bytes.begin(), bytes.end()), target);
}

std::vector<StoredPayload> MemoryDataHandler::payloads() const {
    std::lock_guard lock(mutex_);
    return payloads_;
}

std::optional<StoredPayload> MemoryDataHandler::find(std::string_view name) const {
    std::lock_guard lock(mutex_);
    for (auto it = payloads_.rbegin(); it != payloads_.rend(); ++it) {
        if (it->target.name == name) {
            return *it;
        }
    }
    return std::nullopt;
}

std::size_t MemoryDataHandler::size() const {
    std::lock_guard lock(mutex_);
    return payloads_.size();
}

void MemoryDataHandler::clear() {
    std::lock_guard lock(mutex_);
    payloads_.clear();
}

} // namespace trialflow::io
