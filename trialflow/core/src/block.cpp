#include <trialflow/core/block.hpp>
#include <trialflow/core/error.hpp>
#include <trialflow/core/session.hpp>

namespace trialflow::core {

Block::Block(Key /*key*/, Session& session, std::size_t trial_count)
    : session_(session)
    , settings_(&session.settings()) {
    trials_.reserve(trial_count);
    for (std::size_t i = 0; i < trial_count; ++i) {
        trials_.push_back(std::make_unique<Trial>(Trial::Key{}, *this));
    }
}

std::size_t Block::number() const {
    const auto& blocks = session_.block_list(*this);
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        if (blocks[i].get() == this) {
            return i + 1;
        }
    }
    return 0;
}

Trial& Block::trial(std::size_t number_in_block) {
    if (number_in_block == 0 || number_in_block > trials_.size()) {
        throw NoSuchTrialError("trial " + std::to_string(number_in_block) + " does not exist in block " +
                               std::to_string(number()) + " (" + std::to_string(trials_.size()) + " trials)");
    }
    return *trials_[number_in_block - 1];
}

const Trial& Block::trial(std::size_t number_in_block) const {
    if (number_in_block == 0 || number_in_block > trials_.size()) {
        throw NoSuchTrialError("trial " + std::to_string(number_in_block) + " does not exist in block " +
                               std::to_string(number()) + " (" + std::to_string(trials_.size()) + " trials)");
    }
    return *trials_[number_in_block - 1];
}

Trial& Block::first_trial() {
    if (trials_.empty()) {
        throw NoSuchTrialError("block " + std::to_string(number()) + " has no trials");
    }
    return *trials_.front();
}

Trial& Block::last_trial() {
    if (trials_.empty()) {
        throw NoSuchTrialError("block " + std::to_string(number()) + " has no trials");
    }
    return *trials_.back();
}

std::size_t Block::index_of(const Trial& trial) const {
    for (std::size_t i = 0; i < trials_.size(); ++i) {
        if (trials_[i].get() == &trial) {
            return i;
        }
    }
    return trials_.size();
}

} // namespace trialflow::core
