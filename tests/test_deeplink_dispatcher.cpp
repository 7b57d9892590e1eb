// =============================================================================
// Unit tests for DeeplinkDispatcher (deeplinkdispatcher.h)
// am start argument building and failure reporting
// =============================================================================
#include <gtest/gtest.h>
#include "deeplinkdispatcher.h"
#include "fake_command_executor.h"

TEST(DeeplinkDispatcherTest, ArgumentsWithoutSerial) {
    EXPECT_EQ(DeeplinkDispatcher::buildArguments(QString(), "app://home"),
              QStringList({"shell", "am", "start", "-a", "android.intent.action.VIEW", "-d", "app://home"}));
}

TEST(DeeplinkDispatcherTest, ArgumentsWithSerial) {
    EXPECT_EQ(DeeplinkDispatcher::buildArguments("emulator-5554", "app://home"),
              QStringList({"-s", "emulator-5554", "shell", "am", "start", "-a",
                           "android.intent.action.VIEW", "-d", "app://home"}));
}

TEST(DeeplinkDispatcherTest, DeeplinkPassedVerbatim) {
    const QString link = "myapp://open?id=1&name=a b \"c\"";
    const QStringList args = DeeplinkDispatcher::buildArguments(QString(), link);
    EXPECT_EQ(args.last(), link);
}

TEST(DeeplinkDispatcherTest, SuccessfulDispatch) {
    FakeCommandExecutor executor;
    const QStringList args = DeeplinkDispatcher::buildArguments("AAA", "app://open/page1");
    executor.respond(args, FakeCommandExecutor::ok("Starting: Intent { act=android.intent.action.VIEW }\n"));
    DeeplinkDispatcher dispatcher(&executor);
    EXPECT_NO_THROW(dispatcher.dispatch("AAA", "app://open/page1"));
    ASSERT_EQ(executor.calls.size(), 1);
    EXPECT_EQ(executor.calls[0].args, args);
    EXPECT_EQ(executor.calls[0].timeoutMs, DeeplinkDispatcher::DispatchTimeoutMs);
}

TEST(DeeplinkDispatcherTest, NonZeroExitThrows) {
    FakeCommandExecutor executor;
    executor.respond(DeeplinkDispatcher::buildArguments(QString(), "app://x"),
                     FakeCommandExecutor::failed(1, "error: more than one device/emulator"));
    DeeplinkDispatcher dispatcher(&executor);
    try {
        dispatcher.dispatch(QString(), "app://x");
        FAIL() << "expected AdbCommandError";
    } catch (const AdbCommandError &e) {
        EXPECT_NE(std::string(e.what()).find("more than one device"), std::string::npos);}
}

TEST(DeeplinkDispatcherTest, MissingToolThrows) {
    FakeCommandExecutor executor;
    DeeplinkDispatcher dispatcher(&executor);
    EXPECT_THROW(dispatcher.dispatch("AAA", "app://x"), AdbCommandError);

    DeeplinkDispatcher detached(nullptr);
    EXPECT_THROW(detached.dispatch("AAA", "app://x"), AdbCommandError);
}

TEST(DeeplinkDispatcherTest, TimeoutThrows) {
    FakeCommandExecutor executor;
    executor.respond(DeeplinkDispatcher::buildArguments("AAA", "app://x"), FakeCommandExecutor::timedOut());
    EXPECT_THROW(DeeplinkDispatcher(&executor).dispatch("AAA", "app://x"), AdbCommandError);
}
