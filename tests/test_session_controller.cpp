#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "session/session_controller.hpp"

#include <memory>

namespace {

std::unique_ptr<fakes::FakeProcess> make_process(int pid,
                                                 std::shared_ptr<fakes::FakeProcessState> state) {
    return std::make_unique<fakes::FakeProcess>(pid, std::move(state), false);
}

} // namespace

TEST_CASE("SessionController", "[session]") {
    auto state = std::make_shared<fakes::FakeProcessState>();
    SessionController c("X", LaunchSpec{.args = {"--max-fps=30"}});

    REQUIRE(c.state() == SessionState::Starting);
    REQUIRE(c.device_id() == "X");
    REQUIRE(c.launch_spec().args == std::vector<std::string>{"--max-fps=30"});

    SECTION("AttachRuns") {
        int announced = 0;
        SessionState seen = SessionState::Starting;
        REQUIRE(c.attach(make_process(42, state), [&](int pid) {
            // The callback may inspect the controller it is announcing.
            announced = pid;
            seen = c.state();
        }));
        REQUIRE(c.state() == SessionState::Running);
        REQUIRE(c.pid() == 42);
        REQUIRE(announced == 42);
        REQUIRE(seen == SessionState::Running);
        REQUIRE(state->alive);
        c.wait_announced();
    }

    SECTION("StopDuringStartKillsLateProcess") {
        REQUIRE(c.request_stop() == nullptr);
        REQUIRE(c.state() == SessionState::StopRequested);

        bool announced = false;
        REQUIRE_FALSE(c.attach(make_process(42, state), [&](int) { announced = true; }));
        REQUIRE(c.state() == SessionState::Terminated);
        REQUIRE(state->killed);
        REQUIRE_FALSE(state->alive);
        REQUIRE_FALSE(announced);
    }

    SECTION("StopWhileRunningHandsOverProcess") {
        REQUIRE(c.attach(make_process(42, state)));
        auto process = c.request_stop();
        REQUIRE(process != nullptr);
        REQUIRE(c.state() == SessionState::StopRequested);
        REQUIRE_FALSE(c.pid().has_value());

        // Second stop finds nothing to take.
        REQUIRE(c.request_stop() == nullptr);

        auto status = process->terminate(std::chrono::milliseconds(100));
        c.finish(status.exit_code);
        REQUIRE(c.state() == SessionState::Terminated);
        REQUIRE_FALSE(c.exit_code().has_value());
        REQUIRE(state->terminated);
    }

    SECTION("SelfExit") {
        REQUIRE(c.attach(make_process(42, state)));
        REQUIRE_FALSE(c.poll_exit().has_value());
        REQUIRE(c.state() == SessionState::Running);

        state->exit(3);
        auto status = c.poll_exit();
        REQUIRE(status.has_value());
        REQUIRE(status->exit_code == 3);
        REQUIRE(c.state() == SessionState::Terminated);
        REQUIRE(c.exit_code() == 3);

        // Only one observer gets the exit.
        REQUIRE_FALSE(c.poll_exit().has_value());
        REQUIRE(c.request_stop() == nullptr);
        REQUIRE(c.state() == SessionState::Terminated);
    }

    SECTION("PollErrorCountsAsExit") {
        REQUIRE(c.attach(make_process(42, state)));
        state->poll_error = true;
        auto status = c.poll_exit();
        REQUIRE(status.has_value());
        REQUIRE_FALSE(status->exit_code.has_value());
        REQUIRE_FALSE(status->term_signal.has_value());
        REQUIRE(c.state() == SessionState::Terminated);
    }

    SECTION("Abandon") {
        c.abandon();
        REQUIRE(c.state() == SessionState::Terminated);
        REQUIRE(c.uptime() == 0.0);
    }

    SECTION("UptimeFreezesAtEnd") {
        REQUIRE(c.attach(make_process(42, state)));
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        state->exit(0);
        REQUIRE(c.poll_exit().has_value());
        double up = c.uptime();
        REQUIRE(up > 0.0);
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        REQUIRE(c.uptime() == up);
    }

    SECTION("StateNames") {
        REQUIRE(std::string(session_state_name(SessionState::Starting)) == "starting");
        REQUIRE(std::string(session_state_name(SessionState::Running)) == "running");
        REQUIRE(std::string(session_state_name(SessionState::StopRequested)) == "stopping");
        REQUIRE(std::string(session_state_name(SessionState::Terminated)) == "terminated");
    }
}
