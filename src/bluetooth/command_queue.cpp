#include "podbridge/bluetooth/command_queue.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <utility>
#include <vector>

#include <boost/asio/post.hpp>

#include "podbridge/util/logging.hpp"

namespace podbridge::bluetooth {

namespace {

std::string first_word(std::string_view command) {
    const auto begin = command.find_first_not_of(" \t");
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = command.find_first_of(" \t", begin);
    std::string word(command.substr(begin, end == std::string_view::npos ? end : end - begin));
    std::transform(word.begin(), word.end(), word.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return word;
}

}  // namespace

CommandQueue::CommandQueue(boost::asio::io_context& io_context, CommandChannel& channel, CommandTimeouts timeouts,
                           std::chrono::milliseconds gap)
    : io_context_(io_context),
      channel_(channel),
      timeouts_(timeouts),
      gap_(gap),
      timeout_timer_(io_context),
      gap_timer_(io_context) {}

CommandQueue::~CommandQueue() {
    timeout_timer_.cancel();
    gap_timer_.cancel();
}

std::chrono::milliseconds CommandQueue::timeout_for(std::string_view command) const {
    const auto word = first_word(command);
    if (word == "scan" || word == "power") {
        return timeouts_.scan;
    }
    if (word == "pair" || word == "connect") {
        return timeouts_.pair;
    }
    return timeouts_.command;
}

void CommandQueue::submit(std::string command, Handler handler) {
    const auto timeout = timeout_for(command);
    submit(std::move(command), timeout, std::move(handler));
}

void CommandQueue::submit(std::string command, std::chrono::milliseconds timeout, Handler handler) {
    Request request{std::move(command), timeout, std::move(handler), {}};
    if (!channel_.is_running()) {
        reject(std::move(request), kNotConnected);
        return;
    }
    queue_.push_back(std::move(request));
    pump();
}

void CommandQueue::capture(std::string_view chunk) {
    if (active_) {
        active_->output.append(chunk.data(), chunk.size());
    }
}

void CommandQueue::pump() {
    if (active_ || in_gap_ || queue_.empty()) {
        return;
    }

    active_ = std::move(queue_.front());
    queue_.pop_front();

    if (!channel_.is_running()) {
        finish(std::string(kNotConnected));
        return;
    }

    util::log::debug("[command] > " + active_->command);
    try {
        channel_.write_line(active_->command);
    } catch (const std::system_error& ex) {
        util::log::error("[command] Failed to write '" + active_->command + "': " + ex.what());
        finish(std::string("Failed to write command: ") + ex.what());
        return;
    }

    const auto generation = ++generation_;
    timeout_timer_.expires_after(active_->timeout);
    timeout_timer_.async_wait([this, generation](const boost::system::error_code& ec) {
        if (ec || generation != generation_) {
            return;
        }
        finish(std::nullopt);
    });
}

void CommandQueue::finish(std::optional<std::string> error) {
    if (!active_) {
        return;
    }
    auto request = std::move(*active_);
    active_.reset();
    ++generation_;
    timeout_timer_.cancel();

    in_gap_ = true;
    gap_timer_.expires_after(gap_);
    gap_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        in_gap_ = false;
        pump();
    });

    CommandReply reply{std::move(request.command), std::move(request.output), std::move(error)};
    if (request.handler) {
        request.handler(std::move(reply));
    }
}

void CommandQueue::reject(Request request, const std::string& reason) {
    if (!request.handler) {
        return;
    }
    CommandReply reply{std::move(request.command), {}, reason};
    boost::asio::post(io_context_, [handler = std::move(request.handler), reply = std::move(reply)]() mutable {
        handler(std::move(reply));
    });
}

void CommandQueue::abort_all(const std::string& reason) {
    ++generation_;
    timeout_timer_.cancel();
    gap_timer_.cancel();
    in_gap_ = false;

    std::vector<Request> dropped;
    if (active_) {
        dropped.push_back(std::move(*active_));
        active_.reset();
    }
    while (!queue_.empty()) {
        dropped.push_back(std::move(queue_.front()));
        queue_.pop_front();
    }
    if (!dropped.empty()) {
        util::log::warn("[command] Dropping " + std::to_string(dropped.size()) + " command(s): " + reason);
    }
    for (auto& request : dropped) {
        if (request.handler) {
            request.handler(CommandReply{std::move(request.command), std::move(request.output), reason});
        }
    }
}

}  // namespace podbridge::bluetooth
