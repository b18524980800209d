// ────────────────────────  test_worker.cpp  (C++17)  ────────────────────────
#include "fake_process.hpp"
#include "support.hpp"
#include "worker.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <future>

#include <signal.h>

using namespace stream_runner;
using namespace std::chrono_literals;

namespace {

RelayOptions stubOptions(const std::filesystem::path& program,
                         std::chrono::milliseconds backoff = 50ms)
{
    RelayOptions o;
    o.program = program.string();
    o.backoff = backoff;
    return o;
}

const StreamConfig CAM{"cam", "rtmp://src/live", "rtmp://dst/live"};

} // namespace

TEST(Worker, StartThenStopLeavesNothingRunning)
{
    test::TempDir dir;
    const auto childPid = dir / "relay.pid";
    const auto grandchildPid = dir / "grandchild.pid";
    const auto stub = test::writeStub(dir, "relay",
        "sleep 300 &\necho $! > " + grandchildPid.string() +
        "\necho $$ > " + childPid.string() + "\nwait");
    test::StringSink sink;
    ChildLauncher launcher;

    Worker w(CAM, stubOptions(stub), launcher, sink);
    w.start();
    ASSERT_TRUE(test::waitFor([&]{ return w.launches.load() >= 1; }));
    const pid_t child = test::readPid(childPid);
    const pid_t grandchild = test::readPid(grandchildPid);
    ASSERT_GT(child, 0);
    ASSERT_GT(grandchild, 0);

    w.stop();

    EXPECT_FALSE(w.isRunning());
    EXPECT_EQ(w.state(), Worker::State::stopped);
    EXPECT_EQ(w.pid(), -1);
    EXPECT_TRUE(test::processGone(child));
    EXPECT_TRUE(test::waitFor([&]{ return test::processGone(grandchild); }));
}

TEST(Worker, StopDoesNotWaitForEscapedDescendant)
{
    test::TempDir dir;
    const auto escapedPid = dir / "escaped.pid";
    const auto stub = test::writeStub(dir, "relay",
        "setsid sleep 30 &\necho $! > " + escapedPid.string() + "\nexec sleep 300");
    test::StringSink sink;
    ChildLauncher launcher;

    Worker w(CAM, stubOptions(stub, 10s), launcher, sink);
    w.start();
    ASSERT_TRUE(test::waitFor([&]{ return w.isRunning(); }));
    const pid_t escaped = test::readPid(escapedPid);
    ASSERT_GT(escaped, 0);

    auto stopped = std::async(std::launch::async, [&]{ w.stop(); });
    const bool finished = stopped.wait_for(3s) == std::future_status::ready;
    ::kill(escaped, SIGKILL);
    stopped.get();

    EXPECT_TRUE(finished);
    EXPECT_FALSE(w.isRunning());
    EXPECT_EQ(w.state(), Worker::State::stopped);
}

TEST(Worker, GroupMembersDieWithTheRelay)
{
    test::TempDir dir;
    const auto memberPid = dir / "member.pid";
    const auto stub = test::writeStub(dir, "relay",
        "sleep 300 &\necho $! > " + memberPid.string() + "\nexit 0");
    test::StringSink sink;
    ChildLauncher launcher;

    Worker w(CAM, stubOptions(stub, 10s), launcher, sink);
    w.start();
    ASSERT_TRUE(test::waitFor([&]{ return w.state() == Worker::State::backoff; }));
    const pid_t member = test::readPid(memberPid);
    ASSERT_GT(member, 0);

    ASSERT_TRUE(w.lastExit());
    EXPECT_TRUE(w.lastExit()->success());
    EXPECT_TRUE(test::waitFor([&]{ return test::processGone(member); }, 1s));
    EXPECT_EQ(w.launches.load(), 1u);
    w.stop();
}

TEST(Worker, ForceKillReapsChildAndGroup)
{
    test::TempDir dir;
    const auto pidFile = dir / "grandchild.pid";
    const auto stub = test::writeStub(dir, "relay",
        "sleep 300 &\necho $! > " + pidFile.string() + "\nwait");
    test::StringSink sink;
    ChildLauncher launcher;

    Worker w(CAM, stubOptions(stub, 10s), launcher, sink);
    w.start();
    ASSERT_TRUE(test::waitFor([&]{ return w.isRunning(); }));
    const pid_t child = w.pid();
    const pid_t grandchild = test::readPid(pidFile);
    ASSERT_GT(child, 0);

    w.forceKill();
    EXPECT_FALSE(w.isRunning());
    EXPECT_EQ(w.pid(), -1);
    EXPECT_TRUE(test::processGone(child));
    EXPECT_TRUE(test::waitFor([&]{ return test::processGone(grandchild); }));

    ASSERT_TRUE(test::waitFor([&]{ return w.state() == Worker::State::backoff; }));
    ASSERT_TRUE(w.lastExit());
    EXPECT_EQ(w.lastExit()->signal, 9);

    w.stop();
    EXPECT_EQ(w.launches.load(), 1u);
}

TEST(Worker, ForceKillIsIdempotentWithoutChild)
{
    test::StringSink sink;
    test::FakeLauncher launcher;
    Worker w(CAM, RelayOptions{}, launcher, sink);

    w.forceKill();
    w.forceKill();
    EXPECT_FALSE(w.isRunning());
    EXPECT_EQ(w.kills.load(), 2u);
    EXPECT_EQ(w.state(), Worker::State::idle);
    EXPECT_EQ(launcher.count(), 0u);
}

TEST(Worker, ForceKillFallsBackToDirectSignal)
{
    test::StringSink sink;
    test::FakeLauncher launcher(true);
    Worker w(CAM, stubOptions("relay", 10s), launcher, sink);

    w.start();
    ASSERT_TRUE(test::waitFor([&]{ return w.isRunning(); }));
    auto h = launcher.handle(0);
    ASSERT_TRUE(h);

    w.forceKill();
    EXPECT_FALSE(w.isRunning());
    EXPECT_EQ(h->groupCalls.load(), 1);
    EXPECT_EQ(h->directCalls.load(), 1);
    EXPECT_GE(h->reapCalls.load(), 1);

    w.stop();
    EXPECT_EQ(launcher.count(), 1u);
}

TEST(Worker, RelaunchesAfterForceKill)
{
    test::StringSink sink;
    test::FakeLauncher launcher;
    Worker w(CAM, stubOptions("relay", 20ms), launcher, sink);

    w.start();
    ASSERT_TRUE(test::waitFor([&]{ return w.isRunning(); }));
    w.forceKill();
    ASSERT_TRUE(test::waitFor([&]{ return launcher.count() >= 2 && w.isRunning(); }));
    EXPECT_EQ(launcher.handle(0)->groupCalls.load(), 1);
    EXPECT_EQ(launcher.handle(0)->directCalls.load(), 0);

    w.stop();
    EXPECT_FALSE(w.isRunning());
    EXPECT_EQ(w.starts.load(), 1u);
}

TEST(Worker, CommandLine)
{
    test::StringSink sink;
    test::FakeLauncher launcher;
    RelayOptions opts = stubOptions("ffmpeg", 10s);
    opts.container = "mpegts";
    Worker w(CAM, opts, launcher, sink);

    w.start();
    ASSERT_TRUE(test::waitFor([&]{ return w.isRunning(); }));
    const std::vector<std::string> expected{
        "ffmpeg", "-rw_timeout", "2000000", "-i", "rtmp://src/live",
        "-c", "copy", "-f", "mpegts", "rtmp://dst/live"};
    EXPECT_EQ(launcher.lastArgv(), expected);
    w.stop();
}

TEST(Worker, RestartsAfterExitAndCapturesOutput)
{
    test::TempDir dir;
    const auto stub = test::writeStub(dir, "relay", "echo \"hello from $4\"\necho 'warn' >&2\nexit 1");
    test::StringSink sink;
    ChildLauncher launcher;

    Worker w(CAM, stubOptions(stub, 20ms), launcher, sink);
    w.start();
    ASSERT_TRUE(test::waitFor([&]{ return w.launches.load() >= 3; }));
    w.stop();

    ASSERT_TRUE(w.lastExit());
    EXPECT_EQ(w.lastExit()->code, 1);
    const auto text = sink.text();
    EXPECT_NE(text.find("] [cam] hello from rtmp://src/live\n"), std::string::npos);
    EXPECT_NE(text.find("] [cam] warn\n"), std::string::npos);
}

TEST(Worker, LaunchFailureKeepsRetrying)
{
    test::StringSink sink;
    ChildLauncher launcher;
    Worker w(CAM, stubOptions("/nonexistent/relay", 20ms), launcher, sink);

    w.start();
    EXPECT_TRUE(test::waitFor([&]{ return w.state() == Worker::State::backoff; }));
    std::this_thread::sleep_for(100ms);
    EXPECT_FALSE(w.isRunning());
    EXPECT_EQ(w.launches.load(), 0u);

    w.stop();
    EXPECT_EQ(w.state(), Worker::State::stopped);
}

TEST(Worker, ReconfigureOnlyWhileStopped)
{
    test::StringSink sink;
    test::FakeLauncher launcher;
    Worker w(CAM, stubOptions("relay", 10s), launcher, sink);

    w.start();
    EXPECT_THROW(w.reconfigure({"cam", "rtmp://a", "rtmp://b"}), std::logic_error);
    w.stop();

    EXPECT_THROW(w.reconfigure({"other", "rtmp://a", "rtmp://b"}), std::invalid_argument);
    w.reconfigure({"cam", "rtmp://a", "rtmp://b"});
    EXPECT_EQ(w.config().destination, "rtmp://b");

    w.start();
    ASSERT_TRUE(test::waitFor([&]{ return w.isRunning(); }));
    EXPECT_EQ(launcher.lastArgv().back(), "rtmp://b");
    EXPECT_EQ(w.starts.load(), 2u);
}
