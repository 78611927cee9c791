#pragma once

/// @file memory_data_handler.hpp
/// @brief Data handler keeping every payload in memory.
/// @ingroup io_handlers

#include <trialflow/core/data_handler.hpp>

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace trialflow::io {

/// @brief A payload received by a MemoryDataHandler.
/// @ingroup io_handlers
struct StoredPayload {
    core::DataTarget target;   ///< Identity the payload was saved under.
    std::string location;      ///< Location returned to the caller.
    /// @brief Frozen copy of the payload.
    std::variant<core::DataTable, core::Value, std::string, std::vector<std::uint8_t>> payload;
};

/// @brief Stores payloads in memory and returns `memory://` locations.
///
/// Locations have the form `memory://experiment/participant/S###/name`.
/// Payloads are copied synchronously on the calling thread. All methods
/// are thread-safe.
///
/// Useful for dry runs and tests that inspect what a session saved.
///
/// @ingroup io_handlers
/// @see FileSaver
class MemoryDataHandler : public core::DataHandler {
public:
    std::string handle_table(const core::DataTable& table, const core::DataTarget& target) override;
    std::string handle_json(const core::Value& value, const core::DataTarget& target) override;
    std::string handle_text(std::string_view text, const core::DataTarget& target) override;
    std::string handle_bytes(std::span<const std::uint8_t> bytes, const core::DataTarget& target) override;

    /// @brief Copy of every stored payload, in arrival order.
    [[nodiscard]] std::vector<StoredPayload> payloads() const;

    /// @brief The most recent payload saved under @p name, if any.
    [[nodiscard]] std::optional<StoredPayload> find(std::string_view name) const;

    [[nodiscard]] std::size_t size() const;
    void clear();

private:
    template<typename T>
    std::string store(T payload, const core::DataTarget& target);

    mutable std::mutex mutex_;
    std::vector<StoredPayload> payloads_;
};

} // namespace trialflow::io
