#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "session/session_registry.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace std::chrono_literals;

namespace {

SessionOptions fast_options() {
    return SessionOptions{.supervise_interval = 10ms, .stop_timeout = 100ms};
}

// Looks at the registry from inside emit, the way a synchronous consumer would.
class ReadingSink : public EventSink {
public:
    SessionRegistry* registry = nullptr;

    void emit(Event event) override {
        if (!registry) return;
        if (!std::holds_alternative<SessionStarted>(event) &&
            !std::holds_alternative<SessionEnded>(event)) {
            return;
        }
        auto running = registry->snapshot();
        std::set<std::string> listed;
        for (const auto& info : registry->sessions()) listed.insert(info.device_id);
        std::lock_guard lock(mutex_);
        seen_.push_back(std::move(running));
        listed_.push_back(std::move(listed));
    }

    std::vector<std::set<std::string>> seen() const {
        std::lock_guard lock(mutex_);
        return seen_;
    }

    std::vector<std::set<std::string>> listed() const {
        std::lock_guard lock(mutex_);
        return listed_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::set<std::string>> seen_;
    std::vector<std::set<std::string>> listed_;
};

} // namespace

TEST_CASE("SessionRegistry", "[registry]") {
    fakes::FakeLauncher launcher;
    fakes::RecordingSink sink;
    SessionRegistry registry(launcher, sink, fast_options());

    SECTION("StartThenStop") {
        REQUIRE(registry.start("X", LaunchSpec{.args = {"--no-audio"}}));
        REQUIRE(registry.snapshot() == std::set<std::string>{"X"});
        REQUIRE(launcher.last_args() == std::vector<std::string>{"--no-audio"});

        auto started = sink.of<SessionStarted>();
        REQUIRE(started.size() == 1);
        REQUIRE(started[0].device_id == "X");
        REQUIRE(started[0].pid >= 1000);

        auto sessions = registry.sessions();
        REQUIRE(sessions.size() == 1);
        REQUIRE(sessions[0].state == SessionState::Running);
        REQUIRE(sessions[0].pid == started[0].pid);

        REQUIRE(registry.stop("X"));
        REQUIRE(registry.snapshot().empty());
        REQUIRE(launcher.last("X")->terminated);
        REQUIRE(launcher.live_processes() == 0);

        auto ended = sink.of<SessionEnded>();
        REQUIRE(ended.size() == 1);
        REQUIRE(ended[0].reason == EndReason::Stopped);
        REQUIRE(ended[0].args == std::vector<std::string>{"--no-audio"});
    }

    SECTION("StopUnknownIsNoop") {
        REQUIRE_FALSE(registry.stop("nobody"));
        REQUIRE_FALSE(registry.stop("nobody"));
        REQUIRE(sink.events().empty());
    }

    SECTION("StopIsIdempotent") {
        REQUIRE(registry.start("X", {}));
        REQUIRE(registry.stop("X"));
        REQUIRE_FALSE(registry.stop("X"));
        REQUIRE(sink.count<SessionEnded>() == 1);
    }

    SECTION("SecondStartIsRejected") {
        REQUIRE(registry.start("X", {}));
        auto again = registry.start("X", {});
        REQUIRE_FALSE(again);
        REQUIRE(again.error().code == SessionErrc::AlreadyRunning);
        REQUIRE(launcher.spawn_calls() == 1);
        REQUIRE(launcher.last("X")->alive);
        REQUIRE(sink.count<SessionStarted>() == 1);
    }

    SECTION("ConcurrentStartsSpawnOnce") {
        constexpr int kThreads = 8;
        std::atomic<int> ok{0};
        std::atomic<int> rejected{0};
        std::vector<std::jthread> threads;
        for (int i = 0; i < kThreads; i++) {
            threads.emplace_back([&] {
                auto r = registry.start("X", {});
                if (r) ok++;
                else if (r.error().code == SessionErrc::AlreadyRunning) rejected++;
            });
        }
        threads.clear();

        REQUIRE(ok == 1);
        REQUIRE(rejected == kThreads - 1);
        REQUIRE(launcher.spawn_calls() == 1);
        REQUIRE(launcher.live_processes() == 1);
    }

    SECTION("StartRejectedWhileSpawnInFlight") {
        launcher.block_spawns();
        std::expected<void, SessionError> first_result;
        std::jthread first([&] { first_result = registry.start("X", {}); });
        REQUIRE(launcher.wait_blocked(1));

        auto second = registry.start("X", {});
        REQUIRE_FALSE(second);
        REQUIRE(second.error().code == SessionErrc::AlreadyRunning);

        launcher.release_spawns();
        first.join();
        REQUIRE(first_result.has_value());
        REQUIRE(launcher.spawn_calls() == 1);
    }

    SECTION("StopDuringSpawnLeavesNoOrphan") {
        launcher.block_spawns();
        std::expected<void, SessionError> result;
        std::jthread starter([&] { result = registry.start("X", {}); });
        REQUIRE(launcher.wait_blocked(1));

        REQUIRE(registry.stop("X"));
        REQUIRE(registry.snapshot().empty());

        launcher.release_spawns();
        starter.join();

        REQUIRE(result.has_value());
        REQUIRE(launcher.last("X")->killed);
        REQUIRE(launcher.live_processes() == 0);
        REQUIRE(sink.count<SessionStarted>() == 0);
        REQUIRE(sink.count<SessionEnded>() == 0);
        REQUIRE(sink.count<DiagnosticLog>() == 1);

        // The device is free again.
        REQUIRE(registry.start("X", {}));
        REQUIRE(registry.snapshot() == std::set<std::string>{"X"});
    }

    SECTION("SpawnFailure") {
        launcher.fail_spawn = true;
        auto r = registry.start("X", {});
        REQUIRE_FALSE(r);
        REQUIRE(r.error().code == SessionErrc::SpawnFailed);
        REQUIRE(registry.sessions().empty());
        REQUIRE(sink.count<DiagnosticLog>() == 1);

        // No retry by the registry; a caller retry spawns again.
        launcher.fail_spawn = false;
        REQUIRE(registry.start("X", {}));
        REQUIRE(launcher.spawn_calls() == 2);
    }

    SECTION("StreamCaptureFailure") {
        launcher.omit_streams = true;
        auto r = registry.start("X", {});
        REQUIRE_FALSE(r);
        REQUIRE(r.error().code == SessionErrc::StreamCaptureFailed);
        REQUIRE(launcher.last("X")->killed);
        REQUIRE(launcher.live_processes() == 0);
        REQUIRE(registry.sessions().empty());
        REQUIRE(sink.count<SessionStarted>() == 0);
    }

    SECTION("SelfExitReportedOnce") {
        REQUIRE(registry.start("X", {}));
        registry.reap_exited();
        REQUIRE(sink.count<SessionEnded>() == 0);

        launcher.last("X")->exit(3);
        registry.reap_exited();
        registry.reap_exited();

        auto ended = sink.of<SessionEnded>();
        REQUIRE(ended.size() == 1);
        REQUIRE(ended[0].exit_code == 3);
        REQUIRE(ended[0].reason == EndReason::Exited);
        REQUIRE(registry.snapshot().empty());
        REQUIRE_FALSE(registry.stop("X"));
    }

    SECTION("UnknownExitStatus") {
        REQUIRE(registry.start("X", {}));
        launcher.last("X")->poll_error = true;
        registry.reap_exited();

        auto ended = sink.of<SessionEnded>();
        REQUIRE(ended.size() == 1);
        REQUIRE_FALSE(ended[0].exit_code.has_value());
        REQUIRE(registry.sessions().empty());
    }

    SECTION("ExitRacesStop") {
        for (int i = 0; i < 50; i++) {
            sink.clear();
            REQUIRE(registry.start("X", {}));
            launcher.last("X")->exit(0);

            std::jthread reaper([&] { registry.reap_exited(); });
            std::jthread stopper([&] { registry.stop("X"); });
            reaper.join();
            stopper.join();

            REQUIRE(sink.count<SessionEnded>() == 1);
            REQUIRE(registry.sessions().empty());
        }
        REQUIRE(launcher.live_processes() == 0);
    }

    SECTION("DrainTerminatesEverything") {
        REQUIRE(registry.start("A", {}));
        REQUIRE(registry.start("B", {}));
        REQUIRE(registry.start("C", {}));

        registry.drain_and_terminate_all();

        REQUIRE(launcher.live_processes() == 0);
        REQUIRE(registry.sessions().empty());
        auto ended = sink.of<SessionEnded>();
        REQUIRE(ended.size() == 3);
        for (const auto& e : ended) REQUIRE(e.reason == EndReason::Shutdown);
        REQUIRE(launcher.last("A")->terminate_requests == 1);

        auto late = registry.start("D", {});
        REQUIRE_FALSE(late);
        REQUIRE(late.error().code == SessionErrc::ShuttingDown);
    }

    SECTION("DrainWaitsForSpawnInFlight") {
        launcher.block_spawns();
        std::jthread starter([&] { (void)registry.start("X", {}); });
        REQUIRE(launcher.wait_blocked(1));

        std::atomic<bool> drained{false};
        std::jthread drainer([&] {
            registry.drain_and_terminate_all();
            drained = true;
        });
        std::this_thread::sleep_for(30ms);
        REQUIRE_FALSE(drained);

        launcher.release_spawns();
        starter.join();
        drainer.join();

        REQUIRE(drained);
        REQUIRE(launcher.live_processes() == 0);
        REQUIRE(sink.count<SessionStarted>() == 0);
    }

    SECTION("StreamsAndSupervision") {
        REQUIRE(registry.init());
        REQUIRE(registry.start("X", {}));
        auto proc = launcher.last("X");

        REQUIRE(proc->write_stdout("INFO: Renderer: opengl\r\nhalf"));
        REQUIRE(proc->write_stderr("WARN: Demuxer error\n"));
        REQUIRE(fakes::wait_until([&] { return sink.count<SessionLog>() >= 2; }));

        proc->exit(0);
        REQUIRE(fakes::wait_until([&] { return sink.count<SessionEnded>() == 1; }));
        // The unterminated fragment is flushed once the stream closes.
        REQUIRE(fakes::wait_until([&] { return sink.count<SessionLog>() == 3; }));

        std::set<std::string> lines;
        for (const auto& log : sink.of<SessionLog>()) {
            REQUIRE(log.device_id == "X");
            lines.insert(log.line);
        }
        REQUIRE(lines == std::set<std::string>{"INFO: Renderer: opengl", "WARN: Demuxer error",
                                               "half"});
        REQUIRE(registry.snapshot().empty());

        registry.shutdown(200ms);
    }

    SECTION("ThrowingSinkLeavesRegistryConsistent") {
        fakes::ThrowingSink broken;
        SessionRegistry quiet(launcher, broken, fast_options());

        REQUIRE(quiet.start("X", {}));
        REQUIRE(quiet.snapshot() == std::set<std::string>{"X"});
        launcher.last("X")->exit(0);
        quiet.reap_exited();
        REQUIRE(quiet.snapshot().empty());
        REQUIRE(quiet.sessions().empty());

        REQUIRE(quiet.start("Y", {}));
        REQUIRE(quiet.stop("Y"));
        REQUIRE(quiet.sessions().empty());

        launcher.fail_spawn = true;
        auto failed = quiet.start("W", {});
        REQUIRE_FALSE(failed);
        REQUIRE(failed.error().code == SessionErrc::SpawnFailed);
        launcher.fail_spawn = false;

        REQUIRE(quiet.start("Z", {}));
        quiet.drain_and_terminate_all();
        REQUIRE(quiet.sessions().empty());
        REQUIRE(launcher.live_processes() == 0);
        // Started and ended for X, Y and Z, plus the spawn diagnostic for W.
        REQUIRE(broken.attempts() >= 7);
    }

    SECTION("ThrowingLauncherReleasesPlaceholder") {
        launcher.throw_spawn = true;
        REQUIRE_THROWS_AS(registry.start("X", {}), std::runtime_error);
        REQUIRE(registry.sessions().empty());
        REQUIRE(sink.events().empty());

        launcher.throw_spawn = false;
        REQUIRE(registry.start("X", {}));
        REQUIRE(sink.count<SessionStarted>() == 1);

        // The in-flight count dropped too, so draining does not wait forever.
        registry.drain_and_terminate_all();
        REQUIRE(launcher.live_processes() == 0);
    }

    SECTION("SinkMayReadRegistryWhileEmitting") {
        ReadingSink reading;
        SessionRegistry observed(launcher, reading, fast_options());
        reading.registry = &observed;

        REQUIRE(observed.start("X", {}));
        REQUIRE(observed.stop("X"));
        REQUIRE(observed.start("Y", {}));
        launcher.last("Y")->exit(0);
        observed.reap_exited();

        auto seen = reading.seen();
        REQUIRE(seen.size() == 4);
        REQUIRE(seen[0] == std::set<std::string>{"X"});
        REQUIRE(seen[1].empty());
        REQUIRE(seen[2] == std::set<std::string>{"Y"});
        REQUIRE(seen[3].empty());
        REQUIRE(reading.listed() == seen);
        reading.registry = nullptr;
    }

    SECTION("ErrorNames") {
        REQUIRE(std::string(session_errc_name(SessionErrc::AlreadyRunning)) == "already_running");
        REQUIRE(std::string(session_errc_name(SessionErrc::SpawnFailed)) == "spawn_failed");
        REQUIRE(std::string(session_errc_name(SessionErrc::StreamCaptureFailed)) ==
                "stream_capture_failed");
        REQUIRE(std::string(session_errc_name(SessionErrc::ShuttingDown)) == "shutting_down");
    }
}
