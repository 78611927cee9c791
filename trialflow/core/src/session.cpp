#include <trialflow/core/session.hpp>
#include <trialflow/core/data_table.hpp>
#include <trialflow/core/error.hpp>
#include <trialflow/core/tracker.hpp>

#include <algorithm>
#include <chrono>
#include <exception>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>

namespace trialflow::core {

namespace fs = std::filesystem;

namespace {

Session::Clock steady_clock_from_now() {
    const auto origin = std::chrono::steady_clock::now();
    return [origin] {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - origin).count();
    };
}

} // anonymous namespace

Session::Session(SessionOptions options, Clock clock)
    : options_(std::move(options))
    , clock_(clock ? std::move(clock) : steady_clock_from_now()) {}

Session::~Session() = default;

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

void Session::begin(std::string experiment, std::string participant, const fs::path& base_path,
                    int session_number, Object participant_details, Object settings) {
    if (initialised_) {
        throw InvalidTransitionError("session has already begun: end it before beginning again");
    }

    std::error_code ec;
    fs::path absolute = fs::absolute(base_path, ec);
    if (ec || !fs::is_directory(absolute, ec)) {
        throw PathNotFoundError("base path '" + base_path.string() + "' does not exist or is not a directory");
    }

    experiment_ = std::move(experiment);
    participant_ = std::move(participant);
    number_ = session_number;
    base_path_ = std::move(absolute);
    participant_details_ = std::move(participant_details);
    settings_.assign(std::move(settings));

    retired_blocks_.clear();
    current_trial_num_ = 0;
    current_block_num_ = 0;

    if (session_exists(experiment_, participant_, base_path_, number_)) {
        log([this](EventWriter& w) {
            w.type("session_exists");
            w.field("path", full_path().string());
        });
    }

    worker_.begin();
    initialised_ = true;

    log([this](EventWriter& w) {
        w.type("session_begin");
        w.field("experiment", experiment_);
        w.field("participant", participant_);
        w.field("session", static_cast<int64_t>(number_));
        w.field("path", full_path().string());
    });

    for (std::size_t i = 0; i < session_begin_callbacks_.size(); ++i) {
        session_begin_callbacks_[i](*this);
    }

    if (options_.copy_settings) {
        save_json(Value(settings_.table()), "settings", DataType::SessionInfo);
    }

    // Written even when empty: one row with no columns.
    if (options_.copy_participant_details) {
        std::vector<std::string> headers;
        std::vector<std::string> cells;
        for (const auto& [key, value] : participant_details_) {
            headers.push_back(key);
            cells.push_back(value.to_string());
        }
        DataTable details(std::move(headers));
        details.add_row(std::move(cells));
        save_data_table(details, "participant_details", DataType::SessionInfo);
    }
}

void Session::end() {
    if (!initialised_ || ending_) {
        return;
    }
    ending_ = true;

    // Once started, end() runs to completion: every stage is attempted and
    // the first failure is reported after the session has been reset.
    std::exception_ptr failure;
    auto attempt = [&failure](auto&& step) {
        try {
            step();
        } catch (...) {
            if (!failure) {
                failure = std::current_exception();
            }
        }
    };

    if (in_trial()) {
        attempt([this] { current_trial().end(); });
    }
    attempt([this] { save_results(); });
    for (std::size_t i = 0; i < clean_up_callbacks_.size(); ++i) {
        attempt([this, i] { clean_up_callbacks_[i](); });
    }

    try {
        worker_.end();
    } catch (const std::exception& e) {
        log([&e](EventWriter& w) {
            w.type("write_failed");
            w.field("what", std::string_view(e.what()));
        });
        if (!failure) {
            failure = std::current_exception();
        }
    }

    log([](EventWriter& w) { w.type("session_end"); });

    for (std::size_t i = 0; i < session_end_callbacks_.size(); ++i) {
        attempt([this, i] { session_end_callbacks_[i](*this); });
    }

    current_trial_num_ = 0;
    current_block_num_ = 0;
    retired_blocks_ = std::move(blocks_);
    blocks_.clear();
    initialised_ = false;
    ending_ = false;

    if (failure) {
        std::rethrow_exception(failure);
    }
}

void Session::save_results() {
    std::vector<const ResultRow*> results;
    std::size_t rows = 0;
    for (const Trial* trial : trials()) {
        const ResultRow* result = trial->result_if_any();
        if (result != nullptr) {
            ++rows;
        }
        results.push_back(result);
    }
    if (rows == 0) {
        return;
    }

    DataTable table = build_results_table(results);
    save_data_table(table, "trial_results", DataType::Trials);

    log([&table](EventWriter& w) {
        w.type("results_saved");
        w.field("rows", static_cast<int64_t>(table.row_count()));
        w.field("columns", static_cast<int64_t>(table.column_count()));
    });
}

// ---------------------------------------------------------------------------
// Blocks and trials
// ---------------------------------------------------------------------------

Block& Session::create_block(std::size_t trial_count) {
    blocks_.push_back(std::make_unique<Block>(Block::Key{}, *this, trial_count));
    return *blocks_.back();
}

std::size_t Session::trial_count() const noexcept {
    std::size_t total = 0;
    for (const auto& block : blocks_) {
        total += block->trial_count();
    }
    return total;
}

Block& Session::block(std::size_t number) {
    if (number == 0 || number > blocks_.size()) {
        throw NoSuchBlockError("block " + std::to_string(number) + " does not exist (session has " +
                               std::to_string(blocks_.size()) + " blocks)");
    }
    return *blocks_[number - 1];
}

Block& Session::current_block() {
    if (current_block_num_ == 0) {
        throw NoSuchBlockError("no block is current: no trial has begun");
    }
    return block(current_block_num_);
}

std::vector<Trial*> Session::trials() const {
    std::vector<Trial*> result;
    result.reserve(trial_count());
    for (const auto& block : blocks_) {
        for (const auto& trial : block->trials_) {
            result.push_back(trial.get());
        }
    }
    return result;
}

Trial& Session::trial(std::size_t number) {
    if (number != 0) {
        std::size_t remaining = number;
        for (auto& block : blocks_) {
            if (remaining <= block->trial_count()) {
                return *block->trials_[remaining - 1];
            }
            remaining -= block->trial_count();
        }
    }
    throw NoSuchTrialError("trial " + std::to_string(number) + " does not exist (session has " +
                           std::to_string(trial_count()) + " trials)");
}

Trial& Session::current_trial() {
    if (current_trial_num_ == 0) {
        throw NoSuchTrialError("no trial is current: no trial has begun");
    }
    return trial(current_trial_num_);
}

Trial& Session::next_trial() {
    return trial(current_trial_num_ + 1);
}

Trial& Session::prev_trial() {
    if (current_trial_num_ <= 1) {
        throw NoSuchTrialError("there is no trial before trial " + std::to_string(current_trial_num_));
    }
    return trial(current_trial_num_ - 1);
}

Trial& Session::first_trial() {
    if (blocks_.empty()) {
        throw NoSuchTrialError("session has no blocks");
    }
    return blocks_.front()->first_trial();
}

Trial& Session::last_trial() {
    if (blocks_.empty()) {
        throw NoSuchTrialError("session has no blocks");
    }
    return blocks_.back()->last_trial();
}

bool Session::in_trial() const noexcept {
    std::size_t remaining = current_trial_num_;
    if (remaining == 0) {
        return false;
    }
    for (const auto& block : blocks_) {
        if (remaining <= block->trial_count()) {
            return block->trials_[remaining - 1]->status() == TrialStatus::InProgress;
        }
        remaining -= block->trial_count();
    }
    return false;
}

void Session::begin_next_trial() {
    next_trial().begin();
}

void Session::end_current_trial() {
    current_trial().end();
}

void Session::begin_next_trial_safe() {
    if (current_trial_num_ < trial_count()) {
        begin_next_trial();
    }
}

void Session::end_if_last_trial(const Trial& trial) {
    if (!initialised_) {
        return;
    }
    const std::size_t total = trial_count();
    if (total != 0 && &this->trial(total) == &trial) {
        end();
    }
}

bool Session::owns(const Block& block) const noexcept {
    return std::any_of(blocks_.begin(), blocks_.end(),
                       [&block](const auto& candidate) { return candidate.get() == &block; });
}

const std::vector<std::unique_ptr<Block>>& Session::block_list(const Block& block) const {
    return owns(block) ? blocks_ : retired_blocks_;
}

// ---------------------------------------------------------------------------
// Identity and paths
// ---------------------------------------------------------------------------

fs::path Session::experiment_path() const {
    return base_path_ / experiment_;
}

fs::path Session::participant_path() const {
    return experiment_path() / participant_;
}

fs::path Session::full_path() const {
    return participant_path() / folder_name();
}

std::string Session::folder_name() const {
    return session_number_to_name(number_);
}

std::string Session::directory() const {
    return experiment_ + "/" + participant_ + "/" + folder_name();
}

std::string Session::session_number_to_name(int number) {
    std::ostringstream oss;
    oss << 'S' << std::setw(3) << std::setfill('0') << std::internal << number;
    return oss.str();
}

bool Session::session_exists(std::string_view experiment, std::string_view participant,
                             const fs::path& base_path, int session_number) {
    std::error_code ec;
    return fs::exists(base_path / experiment / participant / session_number_to_name(session_number), ec);
}

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

const std::vector<std::string>& Session::base_headers() {
    static const std::vector<std::string> headers = {
        "directory", "experiment", "ppid", "session_num", "trial_num",
        "block_num", "trial_num_in_block", "start_time", "end_time",
    };
    return headers;
}

std::vector<std::string> Session::headers() const {
    std::vector<std::string> result = base_headers();
    result.insert(result.end(), options_.settings_to_log.begin(), options_.settings_to_log.end());
    result.insert(result.end(), options_.custom_headers.begin(), options_.custom_headers.end());

    const std::size_t handler_count = active_data_handlers().size();
    for (const Tracker* tracker : trackers_) {
        for (std::size_t i = 0; i < handler_count; ++i) {
            result.push_back(tracker->data_name() + "_location_" + std::to_string(i));
        }
    }
    return result;
}

// ---------------------------------------------------------------------------
// Trackers and storage
// ---------------------------------------------------------------------------

void Session::add_tracker(Tracker& tracker) {
    if (std::find(trackers_.begin(), trackers_.end(), &tracker) == trackers_.end()) {
        trackers_.push_back(&tracker);
    }
}

void Session::add_data_handler(DataHandler& handler) {
    if (std::find(data_handlers_.begin(), data_handlers_.end(), &handler) == data_handlers_.end()) {
        data_handlers_.push_back(&handler);
    }
}

std::vector<DataHandler*> Session::active_data_handlers() const {
    std::vector<DataHandler*> result;
    for (DataHandler* handler : data_handlers_) {
        if (handler->active()) {
            result.push_back(handler);
        }
    }
    return result;
}

void Session::require_initialised(const char* operation) const {
    if (!initialised_) {
        throw UninitializedUseError(std::string(operation) + " requires a session that has begun");
    }
}

DataTarget Session::target(const std::string& name, DataType type) const {
    DataTarget result;
    result.experiment = experiment_;
    result.participant = participant_;
    result.session_number = number_;
    result.name = name;
    result.type = type;
    return result;
}

template<typename F>
std::vector<std::string> Session::fan_out(const std::string& name, DataType type, F&& handle) {
    const DataTarget data_target = target(name, type);
    std::vector<std::string> locations;
    for (DataHandler* handler : active_data_handlers()) {
        std::string location = handle(*handler, data_target);
        std::replace(location.begin(), location.end(), '\\', '/');
        locations.push_back(std::move(location));
    }
    return locations;
}

std::vector<std::string> Session::save_data_table(const DataTable& table, const std::string& name, DataType type) {
    require_initialised("Session::save_data_table");
    return fan_out(name, type, [&table](DataHandler& handler, const DataTarget& data_target) {
        return handler.handle_table(table, data_target);
    });
}

std::vector<std::string> Session::save_json(const Value& value, const std::string& name, DataType type) {
    require_initialised("Session::save_json");
    return fan_out(name, type, [&value](DataHandler& handler, const DataTarget& data_target) {
        return handler.handle_json(value, data_target);
    });
}

std::vector<std::string> Session::save_text(std::string_view text, const std::string& name, DataType type) {
    require_initialised("Session::save_text");
    return fan_out(name, type, [text](DataHandler& handler, const DataTarget& data_target) {
        return handler.handle_text(text, data_target);
    });
}

std::vector<std::string> Session::save_bytes(std::span<const std::uint8_t> bytes, const std::string& name,
                                             DataType type) {
    require_initialised("Session::save_bytes");
    return fan_out(name, type, [bytes](DataHandler& handler, const DataTarget& data_target) {
        return handler.handle_bytes(bytes, data_target);
    });
}

void Session::copy_file_to_session_folder(const fs::path& file) {
    require_initialised("Session::copy_file_to_session_folder");
    worker_.submit([source = file, destination = full_path()] {
        fs::create_directories(destination);
        fs::copy_file(source, destination / source.filename(), fs::copy_options::overwrite_existing);
    });
}

// ---------------------------------------------------------------------------
// Notifications
// ---------------------------------------------------------------------------

void Session::on_session_begin(SessionCallback callback) {
    session_begin_callbacks_.push_back(std::move(callback));
}

void Session::on_trial_begin(TrialCallback callback) {
    trial_begin_callbacks_.push_back(std::move(callback));
}

void Session::on_trial_end(TrialCallback callback) {
    trial_end_callbacks_.push_back(std::move(callback));
}

void Session::on_clean_up(CleanUpCallback callback) {
    clean_up_callbacks_.push_back(std::move(callback));
}

void Session::on_session_end(SessionCallback callback) {
    session_end_callbacks_.push_back(std::move(callback));
}

} // namespace trialflow::core
