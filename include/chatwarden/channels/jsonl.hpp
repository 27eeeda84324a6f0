#pragma once

#include <atomic>
#include <fstream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <thread>

#include "chatwarden/channels/channel.hpp"
#include "chatwarden/core/config.hpp"

namespace chatwarden::channels {

/// Newline-delimited JSON transport.
///
/// Each input line is one raw inbound event; each sent message is written
/// as one JSON object per line. Input is read on a dedicated thread so the
/// io_context stays free for the pipeline. Empty paths mean stdin/stdout.
class JsonlChannel : public Channel {
public:
    explicit JsonlChannel(TransportConfig config);

    /// Writes outbound messages to `out` instead of the configured output.
    JsonlChannel(TransportConfig config, std::ostream& out);

    ~JsonlChannel() override;

    auto start() -> boost::asio::awaitable<void> override;
    auto stop() -> boost::asio::awaitable<void> override;
    auto send(OutgoingMessage msg) -> boost::asio::awaitable<Result<void>> override;

    [[nodiscard]] auto name() const -> std::string_view override { return config_.name; }
    [[nodiscard]] auto type() const -> std::string_view override { return "jsonl"; }
    [[nodiscard]] auto is_running() const noexcept -> bool override { return running_.load(); }

    /// Parses one input line and publishes it. Blank lines are ignored;
    /// unparseable lines are logged and skipped. Returns true if published.
    auto ingest_line(std::string_view line) -> bool;

    [[nodiscard]] auto events_read() const noexcept -> size_t { return events_read_.load(); }
    [[nodiscard]] auto lines_rejected() const noexcept -> size_t { return lines_rejected_.load(); }

private:
    void read_loop(int fd, bool owns_fd);
    void finish_input();

    TransportConfig config_;
    std::unique_ptr<std::ofstream> file_out_;
    std::ostream* out_;
    std::mutex write_mutex_;

    std::thread reader_;
    std::atomic<bool> running_{false};
    std::atomic<bool> reader_done_{true};
    std::atomic<size_t> events_read_{0};
    std::atomic<size_t> lines_rejected_{0};
};

} // namespace chatwarden::channels
