#include "chatwarden/channels/jsonl.hpp"

#include <cerrno>
#include <cstring>
#include <chrono>
#include <iostream>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include "chatwarden/core/logger.hpp"
#include "chatwarden/core/utils.hpp"
#include "chatwarden/pipeline/event_queue.hpp"

namespace chatwarden::channels {

namespace {

constexpr int kPollTimeoutMs = 200;
constexpr size_t kReadChunk = 64 * 1024;

} // anonymous namespace

JsonlChannel::JsonlChannel(TransportConfig config)
    : config_(std::move(config))
    , out_(&std::cout) {
    if (!config_.output.empty()) {
        file_out_ = std::make_unique<std::ofstream>(config_.output, std::ios::app);
        if (!*file_out_) {
            LOG_ERROR("Cannot open transport output {}, falling back to stdout", config_.output);
            file_out_.reset();
        } else {
            out_ = file_out_.get();
        }
    }
}

JsonlChannel::JsonlChannel(TransportConfig config, std::ostream& out)
    : config_(std::move(config))
    , out_(&out) {}

JsonlChannel::~JsonlChannel() {
    running_.store(false);
    if (reader_.joinable()) {
        reader_.join();
    }
}

auto JsonlChannel::start() -> boost::asio::awaitable<void> {
    if (running_.exchange(true)) {
        co_return;
    }

    int fd = STDIN_FILENO;
    bool owns_fd = false;
    if (!config_.input.empty()) {
        fd = ::open(config_.input.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            LOG_ERROR("Cannot open transport input {}: {}", config_.input, std::strerror(errno));
            running_.store(false);
            finish_input();
            co_return;
        }
        owns_fd = true;
    }

    reader_done_.store(false);
    LOG_INFO("JSONL channel '{}' reading from {}", config_.name,
             config_.input.empty() ? "stdin" : config_.input);
    reader_ = std::thread([this, fd, owns_fd] { read_loop(fd, owns_fd); });
    co_return;
}

auto JsonlChannel::stop() -> boost::asio::awaitable<void> {
    running_.store(false);
    if (reader_.joinable()) {
        // The reader may be waiting on a full queue that this io_context
        // drains, so yield to it instead of blocking in join().
        boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
        while (!reader_done_.load()) {
            timer.expires_after(std::chrono::milliseconds(20));
            co_await timer.async_wait(boost::asio::use_awaitable);
        }
        reader_.join();
    }
    std::lock_guard lock(write_mutex_);
    out_->flush();
    LOG_INFO("JSONL channel '{}' stopped", config_.name);
    co_return;
}

auto JsonlChannel::send(OutgoingMessage msg) -> boost::asio::awaitable<Result<void>> {
    if (msg.conversation_id.empty()) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument,
            "Outgoing message has no conversation"));
    }

    json line = msg;
    line["timestamp"] = utils::timestamp_iso();

    {
        std::lock_guard lock(write_mutex_);
        *out_ << line.dump() << '\n';
        out_->flush();
        if (!*out_) {
            co_return make_fail(make_error(ErrorCode::ChannelError,
                "Failed to write outgoing message", msg.conversation_id));
        }
    }

    LOG_DEBUG("Sent message to {}", msg.conversation_id);
    co_return ok_result();
}

auto JsonlChannel::ingest_line(std::string_view line) -> bool {
    auto trimmed = utils::trim(line);
    if (trimmed.empty()) {
        return false;
    }

    auto event = json::parse(trimmed, nullptr, false);
    if (event.is_discarded() || !event.is_object()) {
        lines_rejected_.fetch_add(1);
        LOG_WARN("Skipping unparseable input line ({} bytes)", trimmed.size());
        return false;
    }

    events_read_.fetch_add(1);
    return publish(std::move(event));
}

void JsonlChannel::read_loop(int fd, bool owns_fd) {
    std::string pending;
    std::string chunk(kReadChunk, '\0');

    while (running_.load()) {
        pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
        int ready = ::poll(&pfd, 1, kPollTimeoutMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("Input poll failed: {}", std::strerror(errno));
            break;
        }
        if (ready == 0) continue;

        auto n = ::read(fd, chunk.data(), chunk.size());
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            LOG_ERROR("Input read failed: {}", std::strerror(errno));
            break;
        }
        if (n == 0) {
            break;  // EOF
        }

        pending.append(chunk.data(), static_cast<size_t>(n));
        size_t start = 0;
        for (auto nl = pending.find('\n', start); nl != std::string::npos;
             nl = pending.find('\n', start)) {
            ingest_line(std::string_view(pending).substr(start, nl - start));
            start = nl + 1;
        }
        pending.erase(0, start);
    }

    if (!pending.empty()) {
        ingest_line(pending);
    }
    if (owns_fd) {
        ::close(fd);
    }

    LOG_INFO("JSONL input finished: {} events, {} rejected lines",
             events_read_.load(), lines_rejected_.load());
    running_.store(false);
    finish_input();
    reader_done_.store(true);
}

void JsonlChannel::finish_input() {
    if (config_.close_on_eof && queue_) {
        queue_->close();
    }
}

} // namespace chatwarden::channels
