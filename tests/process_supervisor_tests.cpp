#include "podbridge/bluetooth/process_supervisor.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <csignal>
#include <string>
#include <system_error>
#include <vector>

#include <boost/asio/io_context.hpp>

using podbridge::bluetooth::ProcessSupervisor;

namespace {

std::vector<std::string> shell(const std::string& script) {
    return {"-c", script};
}

template <typename Predicate>
bool runUntil(boost::asio::io_context& io, Predicate done, std::chrono::milliseconds limit) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (!done()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        io.restart();
        io.run_for(std::chrono::milliseconds(10));
    }
    return true;
}

}  // namespace

TEST_CASE("Supervisor relays commands and output of a live child", "[supervisor]") {
    boost::asio::io_context io;
    ProcessSupervisor supervisor(io, "/bin/cat", {}, std::chrono::milliseconds(500));

    std::string output;
    std::vector<int> exits;
    supervisor.set_exit_handler([&](int status) { exits.push_back(status); });
    supervisor.set_output_handler([&](std::string_view chunk) {
        output.append(chunk);
        if (output.find("power on\n") != std::string::npos) {
            supervisor.stop();
        }
    });

    supervisor.start();
    REQUIRE(supervisor.is_running());
    REQUIRE(supervisor.pid().has_value());
    supervisor.write_line("power on");

    io.run_for(std::chrono::seconds(5));

    CHECK(output == "power on\n");
    CHECK_FALSE(supervisor.is_running());
    CHECK_FALSE(supervisor.pid().has_value());
    CHECK(exits.size() == 1);
}

TEST_CASE("Supervisor reports the exit status of a child that quits", "[supervisor]") {
    boost::asio::io_context io;
    ProcessSupervisor supervisor(io, "/bin/sh", shell("echo ready; exit 3"));

    std::string output;
    std::vector<int> exits;
    supervisor.set_output_handler([&](std::string_view chunk) { output.append(chunk); });
    supervisor.set_exit_handler([&](int status) { exits.push_back(status); });

    supervisor.start();
    io.run_for(std::chrono::seconds(5));

    CHECK(output == "ready\n");
    REQUIRE(exits.size() == 1);
    CHECK(exits.front() == 3);
    CHECK_FALSE(supervisor.is_running());

    SECTION("writing afterwards fails") {
        REQUIRE_THROWS_AS(supervisor.write_line("show"), std::system_error);
    }

    SECTION("it can be started again") {
        supervisor.start();
        io.restart();
        io.run_for(std::chrono::seconds(5));
        CHECK(exits.size() == 2);
        CHECK(output == "ready\nready\n");
    }
}

TEST_CASE("Supervisor forwards diagnostics separately", "[supervisor]") {
    boost::asio::io_context io;
    ProcessSupervisor supervisor(io, "/bin/sh", shell("echo oops 1>&2; sleep 0.3; echo done"));

    std::string output;
    std::string diagnostics;
    supervisor.set_output_handler([&](std::string_view chunk) { output.append(chunk); });
    supervisor.set_diagnostic_handler([&](std::string_view chunk) { diagnostics.append(chunk); });

    supervisor.start();
    io.run_for(std::chrono::seconds(5));

    CHECK(diagnostics == "oops\n");
    CHECK(output == "done\n");
}

TEST_CASE("Supervisor restart replaces the child", "[supervisor]") {
    boost::asio::io_context io;
    ProcessSupervisor supervisor(io, "/bin/cat", {}, std::chrono::milliseconds(500));

    int exits = 0;
    supervisor.set_exit_handler([&](int) { ++exits; });

    supervisor.start();
    const auto first = supervisor.pid();
    REQUIRE(first.has_value());

    supervisor.restart();
    const auto second = supervisor.pid();
    REQUIRE(second.has_value());
    CHECK(*first != *second);
    CHECK(exits == 1);

    supervisor.stop();
    CHECK(exits == 2);
    supervisor.stop();
    CHECK(exits == 2);
}

TEST_CASE("Supervisor refuses a missing executable", "[supervisor]") {
    boost::asio::io_context io;
    ProcessSupervisor supervisor(io, "/nonexistent/podbridge-control-tool", {});

    int exits = 0;
    supervisor.set_exit_handler([&](int) { ++exits; });

    REQUIRE_THROWS_AS(supervisor.start(), std::system_error);
    CHECK_FALSE(supervisor.is_running());
    CHECK(exits == 0);
    REQUIRE_THROWS_AS(supervisor.write_line("show"), std::system_error);
}

TEST_CASE("Supervisor stop does not wait for a stubborn child", "[supervisor]") {
    using namespace std::chrono_literals;
    boost::asio::io_context io;
    ProcessSupervisor supervisor(io, "/bin/sh", shell("trap '' TERM; echo ready; exec sleep 30"), 1500ms);

    std::string output;
    std::vector<int> exits;
    supervisor.set_output_handler([&](std::string_view chunk) { output.append(chunk); });
    supervisor.set_exit_handler([&](int status) { exits.push_back(status); });

    supervisor.start();
    REQUIRE(runUntil(io, [&] { return output == "ready\n"; }, 5000ms));

    const auto before = std::chrono::steady_clock::now();
    supervisor.stop();
    CHECK(std::chrono::steady_clock::now() - before < 500ms);
    CHECK_FALSE(supervisor.is_running());
    REQUIRE(exits.size() == 1);
    CHECK(exits.front() == 128 + SIGTERM);
    CHECK(supervisor.unreaped() == 1);

    REQUIRE(runUntil(io, [&] { return supervisor.unreaped() == 0; }, 5000ms));
    CHECK(std::chrono::steady_clock::now() - before >= 1500ms);
    CHECK(exits.size() == 1);
}

TEST_CASE("Supervisor gives the child default SIGPIPE handling", "[supervisor]") {
    using namespace std::chrono_literals;
    const auto previous = std::signal(SIGPIPE, SIG_IGN);

    boost::asio::io_context io;
    std::string output;
    std::vector<int> exits;
    {
        ProcessSupervisor supervisor(io, "/bin/sh", shell("kill -PIPE $$; echo survived"));
        supervisor.set_output_handler([&](std::string_view chunk) { output.append(chunk); });
        supervisor.set_exit_handler([&](int status) { exits.push_back(status); });
        supervisor.start();
        runUntil(io, [&] { return !exits.empty(); }, 5000ms);
    }
    std::signal(SIGPIPE, previous);

    CHECK(output.empty());
    REQUIRE(exits.size() == 1);
    CHECK(exits.front() == 128 + SIGPIPE);
}
