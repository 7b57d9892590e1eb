// =============================================================================
// Unit tests for DeviceEnumerator (deviceenumerator.h)
// `adb devices -l` parsing and per-device Android version lookup
// =============================================================================
#include <gtest/gtest.h>
#include "deviceenumerator.h"
#include "fake_command_executor.h"

namespace {

const QStringList kListArgs = {"devices", "-l"};

QStringList versionArgs(const QString &serial) {
    return {"-s", serial, "shell", "getprop", "ro.build.version.release"};
}

} // namespace

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------
TEST(DeviceEnumeratorTest, ParsesSerialAndModel) {
    const QString out =
        "List of devices attached\n"
        "emulator-5554          device product:sdk_gphone64 model:sdk_gphone64_x86_64 device:emu64x transport_id:1\n"
        "R58M123ABC             device usb:1-1 product:beyond1 model:SM_G973F device:beyond1 transport_id:2\n"
        "\n";
    const QVector<AdbDevice> devices = DeviceEnumerator::parseDevicesOutput(out);
    ASSERT_EQ(devices.size(), 2);
    EXPECT_EQ(devices[0].serial, QString("emulator-5554"));
    EXPECT_EQ(devices[0].model, QString("sdk gphone64 x86 64"));
    EXPECT_EQ(devices[1].serial, QString("R58M123ABC"));
    EXPECT_EQ(devices[1].model, QString("SM G973F"));
    EXPECT_EQ(devices[1].osVersion, QString("?"));
}

TEST(DeviceEnumeratorTest, MissingModelDefaultsToUnknown) {
    const QVector<AdbDevice> devices = DeviceEnumerator::parseDevicesOutput(
        "List of devices attached\n192.168.1.20:5555\tdevice\n");
    ASSERT_EQ(devices.size(), 1);
    EXPECT_EQ(devices[0].serial, QString("192.168.1.20:5555"));
    EXPECT_EQ(devices[0].model, QString("Unknown"));
}

TEST(DeviceEnumeratorTest, SkipsDevicesNotReady) {
    const QString out =
        "* daemon not running; starting now at tcp:5037\n"
        "* daemon started successfully\n"
        "List of devices attached\n"
        "ABC unauthorized usb:1-1 transport_id:3\n"
        "DEF offline transport_id:4\n"
        "GHI device usb:1-2 model:Pixel_7 transport_id:5\n";
    const QVector<AdbDevice> devices = DeviceEnumerator::parseDevicesOutput(out);
    ASSERT_EQ(devices.size(), 1);
    EXPECT_EQ(devices[0].serial, QString("GHI"));
    EXPECT_EQ(devices[0].model, QString("Pixel 7"));
}

TEST(DeviceEnumeratorTest, DisplayText) {
    AdbDevice device;
    device.serial = "GHI";
    device.model = "Pixel 7";
    device.osVersion = "14";
    EXPECT_EQ(device.displayText(), QString("GHI | Pixel 7 | Android 14"));
}

// ---------------------------------------------------------------------------
// listDevices
// ---------------------------------------------------------------------------
TEST(DeviceEnumeratorTest, QueriesVersionPerDevice) {
    FakeCommandExecutor executor;
    executor.respond(kListArgs, FakeCommandExecutor::ok(
        "List of devices attached\nAAA device model:Pixel_7\nBBB device model:Pixel_8\n"));
    executor.respond(versionArgs("AAA"), FakeCommandExecutor::ok("14\n"));
    executor.respond(versionArgs("BBB"), FakeCommandExecutor::timedOut());

    DeviceEnumerator enumerator(&executor);
    const QVector<AdbDevice> devices = enumerator.listDevices();
    ASSERT_EQ(devices.size(), 2);
    EXPECT_EQ(devices[0].osVersion, QString("14"));
    EXPECT_EQ(devices[1].osVersion, QString("?"));

    ASSERT_EQ(executor.calls.size(), 3);
    EXPECT_EQ(executor.calls[0].timeoutMs, DeviceEnumerator::ListTimeoutMs);
    EXPECT_EQ(executor.calls[1].args, versionArgs("AAA"));
    EXPECT_EQ(executor.calls[1].timeoutMs, DeviceEnumerator::PropertyTimeoutMs);
}

TEST(DeviceEnumeratorTest, EmptyVersionFallsBackToPlaceholder) {
    FakeCommandExecutor executor;
    executor.respond(kListArgs, FakeCommandExecutor::ok("List of devices attached\nAAA device\n"));
    executor.respond(versionArgs("AAA"), FakeCommandExecutor::ok("  \n"));
    const QVector<AdbDevice> devices = DeviceEnumerator(&executor).listDevices();
    ASSERT_EQ(devices.size(), 1);
    EXPECT_EQ(devices[0].osVersion, QString("?"));
}

TEST(DeviceEnumeratorTest, ListingFailureYieldsEmpty) {
    FakeCommandExecutor missing;
    EXPECT_TRUE(DeviceEnumerator(&missing).listDevices().isEmpty());

    FakeCommandExecutor failing;
    failing.respond(kListArgs, FakeCommandExecutor::failed(1, "error: protocol fault"));
    EXPECT_TRUE(DeviceEnumerator(&failing).listDevices().isEmpty());
    EXPECT_EQ(failing.calls.size(), 1);

    FakeCommandExecutor hanging;
    hanging.respond(kListArgs, FakeCommandExecutor::timedOut());
    EXPECT_TRUE(DeviceEnumerator(&hanging).listDevices().isEmpty());
}
