#include <trialflow/io/file_saver.hpp>
#include <trialflow/io/error.hpp>
#include <trialflow/io/json.hpp>

#include <trialflow/core/session.hpp>

#include <fstream>
#include <utility>
#include <vector>

namespace trialflow::io {

namespace fs = std::filesystem;

namespace {

const char* subdirectory(core::DataType type) {
    switch (type) {
    case core::DataType::Trials:
        return "";
    case core::DataType::Trackers:
        return "trackers";
    case core::DataType::SessionInfo:
        return "session_info";
    case core::DataType::Other:
        return "other";
    }
    return "other";
}

std::ofstream open_for_writing(const fs::path& path, std::ios::openmode mode = std::ios::out) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw IoError("cannot create directory: " + ec.message(), path.parent_path().string());
    }
    std::ofstream file(path, mode | std::ios::trunc);
    if (!file) {
        throw IoError("cannot open file for writing", path.string());
    }
    return file;
}

void check_written(std::ofstream& file, const fs::path& path) {
    file.flush();
    if (!file) {
        throw IoError("write failed", path.string());
    }
}

} // anonymous namespace

FileSaver::FileSaver(core::PersistenceWorker& worker, fs::path base_path, bool relative_locations)
    : worker_(worker)
    , base_path_(std::move(base_path))
    , relative_locations_(relative_locations) {}

fs::path FileSaver::session_path(const core::DataTarget& target) const {
    return base_path_ / target.experiment / target.participant /
           core::Session::session_number_to_name(target.session_number);
}

fs::path FileSaver::path_for(const core::DataTarget& target, std::string_view extension) const {
    fs::path directory = session_path(target);
    const std::string sub = subdirectory(target.type);
    if (!sub.empty()) {
        directory /= sub;
    }
    return directory / (target.name + std::string(extension));
}

std::string FileSaver::location_for(const core::DataTarget& target, const fs::path& path) const {
    if (relative_locations_) {
        return path.lexically_relative(session_path(target)).generic_string();
    }
    return path.generic_string();
}

std::string FileSaver::handle_table(const core::DataTable& table, const core::DataTarget& target) {
    fs::path path = path_for(target, ".csv");
    worker_.submit([path, lines = table.to_csv_lines()] {
        std::ofstream file = open_for_writing(path);
        for (const auto& line : lines) {
            file << line << '\n';
        }
        check_written(file, path);
    });
    return location_for(target, path);
}

std::string FileSaver::handle_json(const core::Value& value, const core::DataTarget& target) {
    fs::path path = path_for(target, ".json");
    worker_.submit([path, text = to_json_string(value)] {
        std::ofstream file = open_for_writing(path);
        file << text;
        check_written(file, path);
    });
    return location_for(target, path);
}

std::string FileSaver::handle_text(std::string_view text, const core::DataTarget& target) {
    fs::path path = path_for(target, ".txt");
    worker_.submit([path, content = std::string(text)] {
        std::ofstream file = open_for_writing(path);
        file << content;
        check_written(file, path);
    });
    return location_for(target, path);
}

std::string FileSaver::handle_bytes(std::span<const std::uint8_t> bytes, const core::DataTarget& target) {
    fs::path path = path_for(target, ".bin");
    worker_.submit([path, content = std::vector<std::uint8_t>(bytes.begin(), bytes.end())] {
        std::ofstream file = open_for_writing(path, std::ios::out | std::ios::binary);
        file.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
        check_written(file, path);
    });
    return location_for(target, path);
}

} // namespace trialflow::io
