#pragma once

#include <trialflow/core/settings.hpp>
#include <trialflow/core/trial.hpp>

#include <cstddef>
#include <memory>
#include <vector>

namespace trialflow::core {

class Session;

/// @brief Ordered group of trials sharing configuration.
/// @ingroup core_experiment
///
/// A block is created by Session::create_block with a fixed number of
/// trials, all constructed up front. Its settings chain to the session's
/// settings; each trial's settings chain to the block's.
///
/// Trials are stored as `vector<unique_ptr<Trial>>` so references handed
/// out stay valid for the life of the block.
///
/// @see Session::create_block, Trial
class Block {
    friend class Session;

public:
    /// @brief Construction token: only a Session can create blocks.
    class Key {
        friend class Session;
        Key() = default;
    };

    Block(Key key, Session& session, std::size_t trial_count);

    Block(const Block&) = delete;
    Block& operator=(const Block&) = delete;
    Block(Block&&) = delete;
    Block& operator=(Block&&) = delete;

    /// @brief 1-based position in the session's block list.
    [[nodiscard]] std::size_t number() const;

    [[nodiscard]] std::size_t trial_count() const noexcept { return trials_.size(); }

    /// @brief Access a trial by its 1-based position in this block.
    /// @throws NoSuchTrialError if @p number_in_block is out of range.
    [[nodiscard]] Trial& trial(std::size_t number_in_block);
    [[nodiscard]] const Trial& trial(std::size_t number_in_block) const;

    /// @brief First trial of this block.
    /// @throws NoSuchTrialError if the block is empty.
    [[nodiscard]] Trial& first_trial();

    /// @brief Last trial of this block.
    /// @throws NoSuchTrialError if the block is empty.
    [[nodiscard]] Trial& last_trial();

    /// @brief Block-level settings; unresolved keys fall through to the session.
    [[nodiscard]] Settings& settings() noexcept { return settings_; }
    [[nodiscard]] const Settings& settings() const noexcept { return settings_; }

    [[nodiscard]] Session& session() noexcept { return session_; }
    [[nodiscard]] const Session& session() const noexcept { return session_; }

private:
    friend class Trial;

    /// @brief 0-based index of @p trial in this block.
    [[nodiscard]] std::size_t index_of(const Trial& trial) const;

    Session& session_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    Settings settings_;
    std::vector<std::unique_ptr<Trial>> trials_;
};

} // namespace trialflow::core
