#include <trialflow/core/trial.hpp>
#include <trialflow/core/block.hpp>
#include <trialflow/core/data_table.hpp>
#include <trialflow/core/error.hpp>
#include <trialflow/core/session.hpp>
#include <trialflow/core/tracker.hpp>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace trialflow::core {

namespace {

std::string trial_suffix(std::size_t number) {
    std::ostringstream oss;
    oss << "_T" << std::setw(3) << std::setfill('0') << number;
    return oss.str();
}

} // anonymous namespace

const char* to_string(TrialStatus status) noexcept {
    switch (status) {
    case TrialStatus::NotDone:
        return "not_done";
    case TrialStatus::InProgress:
        return "in_progress";
    case TrialStatus::Done:
        return "done";
    }
    return "unknown";
}

Trial::Trial(Key /*key*/, Block& block)
    : block_(block)
    , settings_(&block.settings()) {}

std::size_t Trial::number() const {
    const auto& blocks = block_.session().block_list(block_);
    std::size_t offset = 0;
    for (const auto& block : blocks) {
        if (block.get() == &block_) {
            break;
        }
        offset += block->trial_count();
    }
    return offset + number_in_block();
}

std::size_t Trial::number_in_block() const {
    return block_.index_of(*this) + 1;
}

Session& Trial::session() noexcept {
    return block_.session();
}

const Session& Trial::session() const noexcept {
    return block_.session();
}

void Trial::begin() {
    Session& session = block_.session();
    session.require_initialised("Trial::begin");

    if (status_ != TrialStatus::NotDone) {
        throw InvalidTransitionError("cannot begin trial " + std::to_string(number()) +
                                     ": status is " + to_string(status_));
    }
    if (session.in_trial()) {
        throw InvalidTransitionError("cannot begin trial " + std::to_string(number()) + ": trial " +
                                     std::to_string(session.current_trial_num()) + " is still in progress");
    }

    session.current_trial_num_ = number();
    session.current_block_num_ = block_.number();
    start_time_ = session.now();
    status_ = TrialStatus::InProgress;

    result_.emplace(session.headers(), session.options().ad_hoc_header_add);
    result_->set("directory", session.directory());
    result_->set("experiment", session.experiment());
    result_->set("ppid", session.participant());
    result_->set("session_num", session.number());
    result_->set("trial_num", number());
    result_->set("block_num", block_.number());
    result_->set("trial_num_in_block", number_in_block());
    result_->set("start_time", *start_time_);

    for (Tracker* tracker : session.trackers()) {
        tracker->start_recording();
    }

    session.log([this](EventWriter& w) {
        w.type("trial_begin");
        w.field("trial", static_cast<int64_t>(number()));
        w.field("block", static_cast<int64_t>(block_.number()));
        w.field("trial_in_block", static_cast<int64_t>(number_in_block()));
    });

    auto& callbacks = session.trial_begin_callbacks_;
    for (std::size_t i = 0; i < callbacks.size(); ++i) {
        callbacks[i](*this);
    }
}

void Trial::end() {
    if (status_ != TrialStatus::InProgress) {
        throw InvalidTransitionError("cannot end trial " + std::to_string(number()) +
                                     ": status is " + to_string(status_));
    }

    Session& session = block_.session();
    end_time_ = session.now();
    result_->set("end_time", *end_time_);

    for (Tracker* tracker : session.trackers()) {
        DataTable table = tracker->data();
        tracker->stop_recording();
        save_data_table(table, tracker->data_name(), DataType::Trackers);
    }

    for (const auto& key : session.options().settings_to_log) {
        result_->set(key, settings_.get(key));
    }

    status_ = TrialStatus::Done;

    session.log([this](EventWriter& w) {
        w.type("trial_end");
        w.field("trial", static_cast<int64_t>(number()));
        w.field("duration", *end_time_ - *start_time_);
    });

    auto& callbacks = session.trial_end_callbacks_;
    for (std::size_t i = 0; i < callbacks.size(); ++i) {
        callbacks[i](*this);
    }

    // May end the session; nothing below may touch the block list.
    if (session.options().end_after_last_trial) {
        session.end_if_last_trial(*this);
    }
}

ResultRow& Trial::result() {
    if (!result_) {
        throw InvalidTransitionError("trial " + std::to_string(number()) + " has no results: it has not begun");
    }
    return *result_;
}

const ResultRow* Trial::result_if_any() const noexcept {
    return result_ ? &*result_ : nullptr;
}

template<typename F>
std::vector<std::string> Trial::fan_out(const std::string& name, DataType type, F&& handle) {
    if (!result_) {
        throw InvalidTransitionError("cannot save '" + name + "' for trial " + std::to_string(number()) +
                                     ": it has not begun");
    }

    Session& session = block_.session();
    const DataTarget target = session.target(name + trial_suffix(number()), type);

    std::vector<std::string> locations;
    const auto handlers = session.active_data_handlers();
    for (std::size_t i = 0; i < handlers.size(); ++i) {
        std::string location = handle(*handlers[i], target);
        std::replace(location.begin(), location.end(), '\\', '/');
        result_->add_column(name + "_location_" + std::to_string(i), location);
        locations.push_back(std::move(location));
    }
    return locations;
}

std::vector<std::string> Trial::save_data_table(const DataTable& table, const std::string& name, DataType type) {
    return fan_out(name, type, [&table](DataHandler& handler, const DataTarget& target) {
        return handler.handle_table(table, target);
    });
}

std::vector<std::string> Trial::save_json(const Value& value, const std::string& name, DataType type) {
    return fan_out(name, type, [&value](DataHandler& handler, const DataTarget& target) {
        return handler.handle_json(value, target);
    });
}

std::vector<std::string> Trial::save_text(std::string_view text, const std::string& name, DataType type) {
    return fan_out(name, type, [text](DataHandler& handler, const DataTarget& target) {
        return handler.handle_text(text, target);
    });
}

std::vector<std::string> Trial::save_bytes(std::span<const std::uint8_t> bytes, const std::string& name,
                                           DataType type) {
    return fan_out(name, type, [bytes](DataHandler& handler, const DataTarget& target) {
        return handler.handle_bytes(bytes, target);
    });
}

} // namespace trialflow::core
