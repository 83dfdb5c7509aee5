#include "mcpmux/log/server_log_manager.hpp"

#include <deque>
#include <fstream>
#include <system_error>

namespace mcpmux {

namespace {

// Ids become path components; keep them inside base_dir.
std::string sanitize_component(std::string_view id) {
    std::string out;
    out.reserve(id.size());
    for (char c : id) {
        const bool separator = (c == '/' || c == '\\' || c == ':');
        out.push_back(separator ? '_' : c);
    }
    if (out.empty() || out == "." || out == "..") {
        out = "_" + out;
    }
    return out;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// ServerLogManager
// ─────────────────────────────────────────────────────────────────────────────

ServerLogManager::ServerLogManager(ServerLogConfig config)
    : config_(std::move(config))
{}

std::filesystem::path ServerLogManager::log_file(
    std::string_view space_id,
    std::string_view server_id
) const {
    return config_.base_dir / sanitize_component(space_id)
        / (sanitize_component(server_id) + ".log");
}

SinkResult<void> ServerLogManager::append(
    std::string_view space_id,
    std::string_view server_id,
    const ServerLog& entry
) {
    const auto file = log_file(space_id, server_id);
    // Serialize before taking the lock; the write itself is one line.
    const std::string line = entry.to_json().dump(
        -1, ' ', false, Json::error_handler_t::replace
    ) + "\n";

    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    std::filesystem::create_directories(file.parent_path(), ec);
    if (ec) {
        return tl::unexpected(SinkError{
            "Failed to create log directory " + file.parent_path().string() + ": " + ec.message()
        });
    }

    rotate_if_needed(file);

    std::ofstream out(file, std::ios::app | std::ios::binary);
    if (!out) {
        return tl::unexpected(SinkError{"Failed to open log file " + file.string()});
    }
    out.write(line.data(), static_cast<std::streamsize>(line.size()));
    out.flush();
    if (!out) {
        return tl::unexpected(SinkError{"Failed to write log file " + file.string()});
    }
    return {};
}

SinkResult<std::vector<ServerLog>> ServerLogManager::read_logs(
    std::string_view space_id,
    std::string_view server_id,
    std::size_t limit
) const {
    const auto file = log_file(space_id, server_id);

    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (!std::filesystem::exists(file, ec)) {
        return std::vector<ServerLog>{};
    }

    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return tl::unexpected(SinkError{"Failed to open log file " + file.string()});
    }

    std::deque<ServerLog> newest;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) {
            continue;
        }
        auto parsed = Json::parse(line, nullptr, false);
        if (parsed.is_discarded()) {
            continue;
        }
        auto entry = ServerLog::from_json(parsed);
        if (!entry) {
            continue;
        }
        newest.push_back(std::move(*entry));
        if (newest.size() > limit) {
            newest.pop_front();
        }
    }

    return std::vector<ServerLog>(
        std::make_move_iterator(newest.begin()),
        std::make_move_iterator(newest.end())
    );
}

void ServerLogManager::rotate_if_needed(const std::filesystem::path& file) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(file, ec);
    if (ec || size < config_.max_file_bytes) {
        return;
    }

    auto backup = file;
    backup += ".1";
    std::filesystem::rename(file, backup, ec);
    if (ec) {
        MCPMUX_LOG_WARN("Failed to rotate server log " + file.string() + ": " + ec.message());
    }
}

}  // namespace mcpmux
