#pragma once

#include "mcpmux/log/server_log.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace mcpmux {

struct ServerLogConfig {
    /// Root directory; entries go to <base_dir>/<space_id>/<server_id>.log
    std::filesystem::path base_dir;

    /// Rotate to <server_id>.log.1 once a file grows past this size
    std::uintmax_t max_file_bytes{5 * 1024 * 1024};
};

// ─────────────────────────────────────────────────────────────────────────────
// ServerLogManager - JSON-lines file store behind IServerLogSink
// ─────────────────────────────────────────────────────────────────────────────

class ServerLogManager final : public IServerLogSink {
public:
    explicit ServerLogManager(ServerLogConfig config);

    SinkResult<void> append(
        std::string_view space_id,
        std::string_view server_id,
        const ServerLog& entry
    ) override;

    /// The newest `limit` entries of the current file, oldest first.
    /// Lines that fail to parse are skipped.
    [[nodiscard]] SinkResult<std::vector<ServerLog>> read_logs(
        std::string_view space_id,
        std::string_view server_id,
        std::size_t limit
    ) const;

    [[nodiscard]] std::filesystem::path log_file(
        std::string_view space_id,
        std::string_view server_id
    ) const;

private:
    void rotate_if_needed(const std::filesystem::path& file);

    ServerLogConfig config_;
    mutable std::mutex mutex_;
};

}  // namespace mcpmux
