#include <trialflow/core/error.hpp>
#include <trialflow/core/session.hpp>
#include <trialflow/core/tracker.hpp>

#include <trialflow/io/error.hpp>
#include <trialflow/io/event_writers.hpp>
#include <trialflow/io/experiment_loader.hpp>
#include <trialflow/io/file_saver.hpp>
#include <trialflow/io/json.hpp>

#include <cxxopts.hpp>

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

namespace core = trialflow::core;
namespace io = trialflow::io;

constexpr double FRAME_PERIOD = 1.0 / 60.0;

struct Config {
    std::string experiment;
    std::string participant;
    std::string base_path{"."};
    int session_number{1};
    std::string definition_file;
    std::string details_file;
    std::size_t trials{5};
    std::size_t samples{30};
    std::string log_output{"-"};
    std::string log_format{"text"};
    bool verbose{false};
};

// Replays a circular cursor path so runs are reproducible.
class CursorTracker : public core::Tracker {
public:
    explicit CursorTracker(const double& time)
        : core::Tracker("cursor", "position", {"x", "y"})
        , time_(time) {}

protected:
    std::vector<std::string> current_values() override {
        std::ostringstream x;
        std::ostringstream y;
        x << std::cos(time_);
        y << std::sin(time_);
        return {x.str(), y.str()};
    }

private:
    const double& time_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
};

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("trialflow-run", "Run a scripted experiment session and store its data");

    options.add_options()
        ("e,experiment", "Experiment name", cxxopts::value<std::string>())
        ("p,participant", "Participant identifier", cxxopts::value<std::string>())
        ("b,base", "Base data directory (default: .)", cxxopts::value<std::string>()->default_value("."))
        ("s,session", "Session number (default: 1)", cxxopts::value<int>()->default_value("1"))
        ("d,definition", "Experiment definition (JSON)", cxxopts::value<std::string>())
        ("details", "Participant details (JSON object)", cxxopts::value<std::string>())
        ("t,trials", "Trials when no definition is given (default: 5)",
            cxxopts::value<std::size_t>()->default_value("5"))
        ("n,samples", "Tracker samples per trial (default: 30)",
            cxxopts::value<std::size_t>()->default_value("30"))
        ("o,log-output", "Event log output (default: stderr)", cxxopts::value<std::string>()->default_value("-"))
        ("log-format", "Event log format: text|json|none (default: text)",
            cxxopts::value<std::string>()->default_value("text"))
        ("v,verbose", "Verbose output")
        ("h,help", "Show help");

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    if (result.count("experiment") == 0U) {
        std::cerr << "Error: --experiment is required" << std::endl;
        std::exit(64);
    }

    if (result.count("participant") == 0U) {
        std::cerr << "Error: --participant is required" << std::endl;
        std::exit(64);
    }

    Config config;
    config.experiment = result["experiment"].as<std::string>();
    config.participant = result["participant"].as<std::string>();
    config.base_path = result["base"].as<std::string>();
    config.session_number = result["session"].as<int>();
    if (result.count("definition") != 0U) {
        config.definition_file = result["definition"].as<std::string>();
    }
    if (result.count("details") != 0U) {
        config.details_file = result["details"].as<std::string>();
    }
    config.trials = result["trials"].as<std::size_t>();
    config.samples = result["samples"].as<std::size_t>();
    config.log_output = result["log-output"].as<std::string>();
    config.log_format = result["log-format"].as<std::string>();
    config.verbose = result.count("verbose") != 0U;

    return config;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        // 1. Load definition and participant details
        io::ExperimentDefinition definition;
        if (!config.definition_file.empty()) {
            if (config.verbose) {
                std::cerr << "Loading experiment from: " << config.definition_file << std::endl;
            }
            definition = io::load_experiment(config.definition_file);
        } else {
            definition.blocks.push_back(io::BlockDefinition{config.trials, {}});
        }

        core::Object details;
        if (!config.details_file.empty()) {
            details = io::load_settings(config.details_file);
        }

        // 2. Session on a simulated clock advanced once per frame
        double sim_time = 0.0;
        core::SessionOptions options;
        options.custom_headers = {"response_time"};
        core::Session session(options, [&sim_time] { return sim_time; });
        io::apply_definition(session, definition);

        io::FileSaver saver(session.persistence_worker(), config.base_path);
        session.add_data_handler(saver);

        CursorTracker tracker(sim_time);
        session.add_tracker(tracker);

        // 3. Event log
        std::unique_ptr<core::EventWriter> writer;
        std::ofstream outfile;
        std::ostream* log_stream = &std::cerr;
        if (config.log_output != "-") {
            outfile.open(config.log_output);
            if (!outfile) {
                std::cerr << "Error: cannot open log file: " << config.log_output << std::endl;
                return 1;
            }
            log_stream = &outfile;
        }
        if (config.log_format == "json") {
            writer = std::make_unique<io::JsonEventWriter>(*log_stream);
        } else if (config.log_format == "text") {
            writer = std::make_unique<io::TextEventWriter>(*log_stream);
        } else if (config.log_format != "none") {
            std::cerr << "Error: unknown log format: " << config.log_format << std::endl;
            return 64;
        }
        session.set_event_writer(writer.get());

        // 4. Run every trial
        session.begin(config.experiment, config.participant, config.base_path, config.session_number,
                      std::move(details), definition.settings);

        while (session.current_trial_num() < session.trial_count()) {
            session.begin_next_trial();
            auto& trial = session.current_trial();
            for (std::size_t i = 0; i < config.samples; ++i) {
                sim_time += FRAME_PERIOD;
                tracker.sample(session.now());
            }
            trial.result()["response_time"] = session.now() - *trial.start_time();
            session.end_current_trial();
        }

        const auto full_path = session.full_path();
        const auto trial_count = session.trial_count();
        session.end();

        if (auto* json = dynamic_cast<io::JsonEventWriter*>(writer.get())) {
            json->finalize();
        }

        if (config.verbose) {
            std::cerr << "Recorded " << trial_count << " trials to: " << full_path.string() << std::endl;
        }

        return 0;
    }
    catch (const io::IoError& e) {
        std::cerr << "I/O error: " << e.what() << std::endl;
        return 1;
    }
    catch (const core::ExperimentError& e) {
        std::cerr << "Experiment error: " << e.what() << std::endl;
        return 2;
    }
    catch (const cxxopts::exceptions::parsing& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return 64;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
