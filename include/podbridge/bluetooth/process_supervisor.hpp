#pragma once

#include <sys/types.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/steady_timer.hpp>

#include "podbridge/bluetooth/command_queue.hpp"

namespace podbridge::bluetooth {

// Owns the long-lived control tool child process and its three pipes.
// Output is read asynchronously on the io_context; the end of the output
// stream marks the exit of the child, which is then reaped on a timer so
// the io_context never blocks on waitpid.
class ProcessSupervisor : public CommandChannel {
public:
    using OutputHandler = std::function<void(std::string_view)>;
    // Exit status, or 128 + signal number when the child was killed. A stop()
    // reports 128 + SIGTERM unless the child had already exited.
    using ExitHandler = std::function<void(int)>;

    ProcessSupervisor(boost::asio::io_context& io_context, std::string executable, std::vector<std::string> args,
                      std::chrono::milliseconds stop_grace = std::chrono::milliseconds(1000));
    ~ProcessSupervisor() override;

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    void set_output_handler(OutputHandler handler);
    void set_diagnostic_handler(OutputHandler handler);
    void set_exit_handler(ExitHandler handler);

    // Terminates a running child first. Throws std::system_error when the
    // executable cannot be spawned.
    void start();
    // Sends SIGTERM and returns; SIGKILL follows after the stop grace period.
    void stop();
    void restart();

    bool is_running() const override { return running_; }
    void write_line(const std::string& line) override;

    std::optional<pid_t> pid() const;
    // Children that were stopped or exited but are not reaped yet.
    std::size_t unreaped() const { return reapers_.size(); }
    const std::string& executable() const { return executable_; }

private:
    void read_output(std::uint64_t generation);
    void read_diagnostics(std::uint64_t generation);
    void handle_exit(std::uint64_t generation);
    void close_pipes();
    void notify_exit(int status);
    void reap_later(pid_t pid, std::function<void(int)> on_reaped);
    void poll_reap(pid_t pid, std::chrono::steady_clock::time_point kill_at);

    boost::asio::io_context& io_context_;
    std::string executable_;
    std::vector<std::string> args_;
    std::chrono::milliseconds stop_grace_;

    OutputHandler output_handler_;
    OutputHandler diagnostic_handler_;
    ExitHandler exit_handler_;

    boost::asio::posix::stream_descriptor stdin_;
    boost::asio::posix::stream_descriptor stdout_;
    boost::asio::posix::stream_descriptor stderr_;
    std::array<char, 4096> output_buffer_{};
    std::array<char, 4096> diagnostic_buffer_{};

    struct Reaper {
        std::unique_ptr<boost::asio::steady_timer> timer;
        std::function<void(int)> on_reaped;
        bool killed{false};
    };
    std::unordered_map<pid_t, Reaper> reapers_;

    pid_t pid_{-1};
    bool running_{false};
    // Child whose exit was seen on the output stream but not reported yet.
    std::optional<pid_t> pending_exit_;
    std::uint64_t generation_{0};
};

}  // namespace podbridge::bluetooth
