#include "podbridge/bluetooth/process_supervisor.hpp"

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <system_error>
#include <thread>
#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/write.hpp>

#include "podbridge/util/logging.hpp"

namespace podbridge::bluetooth {

namespace {

struct Pipe {
    int read_end{-1};
    int write_end{-1};

    Pipe() {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            throw std::system_error(errno, std::generic_category(), "pipe2");
        }
        read_end = fds[0];
        write_end = fds[1];
    }

    ~Pipe() {
        close_read();
        close_write();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int release_read() { return std::exchange(read_end, -1); }
    int release_write() { return std::exchange(write_end, -1); }

    void close_read() {
        if (read_end >= 0) {
            ::close(std::exchange(read_end, -1));
        }
    }

    void close_write() {
        if (write_end >= 0) {
            ::close(std::exchange(write_end, -1));
        }
    }
};

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Status of a child that has exited, or nothing while it still runs.
std::optional<int> try_reap(pid_t pid) {
    int status = 0;
    pid_t result = 0;
    do {
        result = ::waitpid(pid, &status, WNOHANG);
    } while (result < 0 && errno == EINTR);
    if (result == 0) {
        return std::nullopt;
    }
    return result == pid ? decode_status(status) : -1;
}

constexpr std::chrono::milliseconds kReapInterval{10};

}  // namespace

ProcessSupervisor::ProcessSupervisor(boost::asio::io_context& io_context, std::string executable,
                                     std::vector<std::string> args, std::chrono::milliseconds stop_grace)
    : io_context_(io_context),
      executable_(std::move(executable)),
      args_(std::move(args)),
      stop_grace_(stop_grace),
      stdin_(io_context),
      stdout_(io_context),
      stderr_(io_context) {}

ProcessSupervisor::~ProcessSupervisor() {
    exit_handler_ = nullptr;
    stop();

    // The io_context no longer runs the reap timers at this point.
    for (auto& [child, reaper] : reapers_) {
        reaper.timer->cancel();
        const auto kill_at = std::chrono::steady_clock::now() + stop_grace_;
        while (!try_reap(child)) {
            if (std::chrono::steady_clock::now() >= kill_at) {
                ::kill(child, SIGKILL);
                int status = 0;
                while (::waitpid(child, &status, 0) < 0 && errno == EINTR) {
                }
                break;
            }
            std::this_thread::sleep_for(kReapInterval);
        }
    }
}

void ProcessSupervisor::set_output_handler(OutputHandler handler) {
    output_handler_ = std::move(handler);
}

void ProcessSupervisor::set_diagnostic_handler(OutputHandler handler) {
    diagnostic_handler_ = std::move(handler);
}

void ProcessSupervisor::set_exit_handler(ExitHandler handler) {
    exit_handler_ = std::move(handler);
}

void ProcessSupervisor::start() {
    if (running_) {
        stop();
    }
    if (pending_exit_) {
        pending_exit_.reset();
        notify_exit(-1);
    }

    Pipe input;
    Pipe output;
    Pipe diagnostics;
    Pipe exec_status;

    std::vector<std::string> argv_storage;
    argv_storage.reserve(args_.size() + 1);
    argv_storage.push_back(executable_);
    argv_storage.insert(argv_storage.end(), args_.begin(), args_.end());
    std::vector<char*> argv;
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    const pid_t child = ::fork();
    if (child < 0) {
        throw std::system_error(errno, std::generic_category(), "fork");
    }

    if (child == 0) {
        ::dup2(input.read_end, STDIN_FILENO);
        ::dup2(output.write_end, STDOUT_FILENO);
        ::dup2(diagnostics.write_end, STDERR_FILENO);
        ::signal(SIGPIPE, SIG_DFL);
        ::execvp(argv[0], argv.data());
        const int err = errno;
        [[maybe_unused]] auto written = ::write(exec_status.write_end, &err, sizeof(err));
        ::_exit(127);
    }

    input.close_read();
    output.close_write();
    diagnostics.close_write();
    exec_status.close_write();

    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(exec_status.read_end, &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        ::waitpid(child, &status, 0);
        throw std::system_error(exec_errno, std::generic_category(), "Failed to start " + executable_);
    }

    stdin_.assign(input.release_write());
    stdout_.assign(output.release_read());
    stderr_.assign(diagnostics.release_read());
    pid_ = child;
    running_ = true;

    const auto generation = ++generation_;
    util::log::info("[bluetooth] Started " + executable_ + " (pid " + std::to_string(pid_) + ")");
    read_output(generation);
    read_diagnostics(generation);
}

void ProcessSupervisor::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    ++generation_;

    const pid_t child = std::exchange(pid_, -1);
    close_pipes();

    auto status = try_reap(child);
    if (!status) {
        ::kill(child, SIGTERM);
        reap_later(child, nullptr);
        status = 128 + SIGTERM;
    }
    util::log::info("[bluetooth] Stopped " + executable_ + " (pid " + std::to_string(child) + ")");
    notify_exit(*status);
}

void ProcessSupervisor::restart() {
    stop();
    start();
}

void ProcessSupervisor::write_line(const std::string& line) {
    if (!running_) {
        throw std::system_error(std::make_error_code(std::errc::broken_pipe), executable_ + " is not running");
    }
    const std::string payload = line + "\n";
    boost::system::error_code ec;
    boost::asio::write(stdin_, boost::asio::buffer(payload), ec);
    if (ec) {
        throw std::system_error(ec.value(), std::generic_category(), "write to " + executable_);
    }
}

std::optional<pid_t> ProcessSupervisor::pid() const {
    if (!running_) {
        return std::nullopt;
    }
    return pid_;
}

void ProcessSupervisor::read_output(std::uint64_t generation) {
    stdout_.async_read_some(boost::asio::buffer(output_buffer_),
                            [this, generation](const boost::system::error_code& ec, std::size_t bytes) {
                                if (generation != generation_) {
                                    return;
                                }
                                if (ec) {
                                    handle_exit(generation);
                                    return;
                                }
                                if (output_handler_) {
                                    output_handler_(std::string_view(output_buffer_.data(), bytes));
                                }
                                if (generation == generation_) {
                                    read_output(generation);
                                }
                            });
}

void ProcessSupervisor::read_diagnostics(std::uint64_t generation) {
    stderr_.async_read_some(boost::asio::buffer(diagnostic_buffer_),
                            [this, generation](const boost::system::error_code& ec, std::size_t bytes) {
                                if (ec || generation != generation_) {
                                    return;
                                }
                                if (diagnostic_handler_) {
                                    diagnostic_handler_(std::string_view(diagnostic_buffer_.data(), bytes));
                                }
                                read_diagnostics(generation);
                            });
}

void ProcessSupervisor::handle_exit(std::uint64_t generation) {
    if (generation != generation_ || !running_) {
        return;
    }
    running_ = false;
    ++generation_;

    const pid_t child = std::exchange(pid_, -1);
    close_pipes();

    auto report = [this](int status) {
        util::log::warn("[bluetooth] " + executable_ + " exited with status " + std::to_string(status));
        notify_exit(status);
    };
    if (const auto status = try_reap(child)) {
        report(*status);
        return;
    }
    pending_exit_ = child;
    reap_later(child, [this, child, report](int status) {
        if (pending_exit_ != child) {
            return;
        }
        pending_exit_.reset();
        report(status);
    });
}

void ProcessSupervisor::notify_exit(int status) {
    if (exit_handler_) {
        exit_handler_(status);
    }
}

void ProcessSupervisor::close_pipes() {
    boost::system::error_code ignored;
    stdin_.close(ignored);
    stdout_.close(ignored);
    stderr_.close(ignored);
}

void ProcessSupervisor::reap_later(pid_t pid, std::function<void(int)> on_reaped) {
    Reaper reaper;
    reaper.timer = std::make_unique<boost::asio::steady_timer>(io_context_);
    reaper.on_reaped = std::move(on_reaped);
    reapers_[pid] = std::move(reaper);
    poll_reap(pid, std::chrono::steady_clock::now() + stop_grace_);
}

void ProcessSupervisor::poll_reap(pid_t pid, std::chrono::steady_clock::time_point kill_at) {
    auto& timer = *reapers_.at(pid).timer;
    timer.expires_after(kReapInterval);
    timer.async_wait([this, pid, kill_at](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        auto it = reapers_.find(pid);
        if (it == reapers_.end()) {
            return;
        }
        if (const auto status = try_reap(pid)) {
            auto on_reaped = std::move(it->second.on_reaped);
            reapers_.erase(it);
            if (on_reaped) {
                on_reaped(*status);
            }
            return;
        }
        if (!it->second.killed && std::chrono::steady_clock::now() >= kill_at) {
            util::log::warn("[bluetooth] " + executable_ + " did not exit in time, killing pid " +
                            std::to_string(pid));
            ::kill(pid, SIGKILL);
            it->second.killed = true;
        }
        poll_reap(pid, kill_at);
    });
}

}  // namespace podbridge::bluetooth
