#include "devdeck/metric_parsers.hpp"

#include <gtest/gtest.h>

using namespace devdeck;

TEST(LoadAverageTest, ReadsFirstField) {
    const auto load = parsers::parseLoadAverage("0.52 0.58 0.59 1/1034 12345\n");
    ASSERT_TRUE(load.has_value());
    EXPECT_DOUBLE_EQ(0.52, *load);
}

TEST(LoadAverageTest, RejectsGarbage) {
    EXPECT_FALSE(parsers::parseLoadAverage("").has_value());
    EXPECT_FALSE(parsers::parseLoadAverage("permission denied").has_value());
}

TEST(CpuCoreCountTest, CountsProcessorLines) {
    const QString text =
        "processor\t: 0\nBogoMIPS\t: 38.40\n\n"
        "processor\t: 1\nBogoMIPS\t: 38.40\n\n"
        "processor\t: 2\n";
    EXPECT_EQ(3, parsers::parseCpuCoreCount(text).value_or(0));
    EXPECT_FALSE(parsers::parseCpuCoreCount("Hardware : Qualcomm").has_value());
}

TEST(MemInfoTest, UsageIsDerivedFromAvailable) {
    const auto info = parsers::parseMemInfo("MemTotal: 1000 kB\nMemAvailable: 400 kB\n");
    ASSERT_TRUE(info.has_value());
    EXPECT_DOUBLE_EQ(60.0, info->usagePercent);
    EXPECT_EQ(1000u, info->totalKb);
    EXPECT_EQ(400u, info->availableKb);
}

TEST(MemInfoTest, ReadsOptionalFields) {
    const QString text =
        "MemTotal:        7823456 kB\n"
        "MemFree:          123456 kB\n"
        "MemAvailable:    3911728 kB\n"
        "Buffers:           20480 kB\n"
        "Cached:          2048000 kB\n"
        "SwapTotal:       2097148 kB\n"
        "SwapFree:        1048574 kB\n";
    const auto info = parsers::parseMemInfo(text);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(123456u, info->freeKb);
    EXPECT_EQ(20480u, info->buffersKb);
    EXPECT_EQ(2048000u, info->cachedKb);
    EXPECT_EQ(2097148u, info->swapTotalKb);
    EXPECT_EQ(1048574u, info->swapFreeKb);
    EXPECT_NEAR(50.0, info->usagePercent, 0.001);
}

TEST(MemInfoTest, MissingTotalOrAvailableFails) {
    EXPECT_FALSE(parsers::parseMemInfo("MemAvailable: 400 kB\n").has_value());
    EXPECT_FALSE(parsers::parseMemInfo("MemTotal: 0 kB\nMemAvailable: 0 kB\n").has_value());
    EXPECT_FALSE(parsers::parseMemInfo("MemTotal: 1000 kB\nMemFree: 10 kB\n").has_value());
}

TEST(MemInfoTest, AvailableAboveTotalClampsToZero) {
    const auto info = parsers::parseMemInfo("MemTotal: 100 kB\nMemAvailable: 150 kB\n");
    ASSERT_TRUE(info.has_value());
    EXPECT_DOUBLE_EQ(0.0, info->usagePercent);
}

TEST(BatteryTest, ScalesTemperatureAndVoltage) {
    const QString text =
        "Current Battery Service state:\n"
        "  AC powered: false\n"
        "  USB powered: true\n"
        "  Wireless powered: false\n"
        "  status: 2\n"
        "  health: 2\n"
        "  level: 87\n"
        "  voltage: 4213\n"
        "  temperature: 312\n";
    const auto battery = parsers::parseBattery(text);
    ASSERT_TRUE(battery.has_value());
    EXPECT_DOUBLE_EQ(87.0, battery->levelPercent.value_or(-1));
    EXPECT_DOUBLE_EQ(31.2, battery->temperatureC.value_or(-1));
    EXPECT_DOUBLE_EQ(4.213, battery->voltageV.value_or(-1));
    EXPECT_EQ("true", battery->usbPowered);
    EXPECT_EQ("false", battery->acPowered);
    EXPECT_EQ("2", battery->health);
}

TEST(BatteryTest, UnrecognisedOutputFails) {
    EXPECT_FALSE(parsers::parseBattery("Can't find service: battery\n").has_value());
}

TEST(BatteryTest, PartialOutputKeepsWhatItFound) {
    const auto battery = parsers::parseBattery("  level: 55\n");
    ASSERT_TRUE(battery.has_value());
    EXPECT_DOUBLE_EQ(55.0, battery->levelPercent.value_or(-1));
    EXPECT_FALSE(battery->temperatureC.has_value());
}

TEST(ThermalZoneTest, ConvertsMillidegrees) {
    EXPECT_DOUBLE_EQ(42.5, parsers::parseThermalZone("42500\n").value_or(0));
    EXPECT_FALSE(parsers::parseThermalZone("No such file or directory").has_value());
}

TEST(NetDevTest, FiltersTrackedInterfaces) {
    const QString text =
        "Inter-|   Receive                                                |  Transmit\n"
        " face |bytes    packets errs drop fifo frame compressed multicast|bytes    packets errs drop fifo colls carrier compressed\n"
        "    lo:    4096      10    0    0    0     0          0         0     4096      10    0    0    0     0       0          0\n"
        " wlan0: 1536000    1200    0    0    0     0          0         0   512000     800    0    0    0     0       0          0\n"
        "rmnet0:    2048       4    0    0    0     0          0         0     1024       2    0    0    0     0       0          0\n";
    const auto rows = parsers::parseNetDev(text, {"wlan0", "rmnet0", "eth0"});
    ASSERT_TRUE(rows.has_value());
    ASSERT_EQ(2, rows->size());
    EXPECT_EQ("wlan0", rows->at(0).name);
    EXPECT_EQ(1536000u, rows->at(0).rxBytes);
    EXPECT_EQ(512000u, rows->at(0).txBytes);
    EXPECT_EQ("rmnet0", rows->at(1).name);
}

TEST(NetDevTest, EmptyFilterKeepsEveryInterface) {
    const QString text =
        "lo: 10 0 0 0 0 0 0 0 20 0 0 0 0 0 0 0\n"
        "eth0: 30 0 0 0 0 0 0 0 40 0 0 0 0 0 0 0\n";
    const auto rows = parsers::parseNetDev(text);
    ASSERT_TRUE(rows.has_value());
    EXPECT_EQ(2, rows->size());
}

TEST(NetDevTest, RepeatedInterfaceIsSummed) {
    const QString text =
        "wlan0: 100 0 0 0 0 0 0 0 10 0 0 0 0 0 0 0\n"
        "wlan0: 50 0 0 0 0 0 0 0 5 0 0 0 0 0 0 0\n";
    const auto rows = parsers::parseNetDev(text, {"wlan0"});
    ASSERT_TRUE(rows.has_value());
    ASSERT_EQ(1, rows->size());
    EXPECT_EQ(150u, rows->at(0).rxBytes);
    EXPECT_EQ(15u, rows->at(0).txBytes);
}

TEST(NetDevTest, NameGluedToFirstCounterIsSplit) {
    const auto rows = parsers::parseNetDev("  eth0:123456 10 0 0 0 0 0 0 654321 5 0 0 0 0 0 0\n", {"eth0"});
    ASSERT_TRUE(rows.has_value());
    ASSERT_EQ(1, rows->size());
    EXPECT_EQ(123456u, rows->at(0).rxBytes);
    EXPECT_EQ(654321u, rows->at(0).txBytes);
}

TEST(NetDevTest, NoParsableRowsFails) {
    EXPECT_FALSE(parsers::parseNetDev("Inter-| Receive | Transmit\n", {"wlan0"}).has_value());
}

TEST(NetDevTest, ParsableRowsOutsideFilterGiveEmptyList) {
    const auto rows = parsers::parseNetDev("lo: 1 0 0 0 0 0 0 0 2 0 0 0 0 0 0 0\n", {"wlan0"});
    ASSERT_TRUE(rows.has_value());
    EXPECT_TRUE(rows->isEmpty());
}

TEST(ProcessListTest, ColumnsLayoutSortsByPid) {
    const QString text =
        "  PID NAME                        %CPU    RSS USER     S\n"
        " 1200 system_server                3.5 245000 system   S\n"
        "    1 init                         0.0   4200 root     S\n"
        "  530 surfaceflinger               1.2  32000 system   R\n";
    const auto processes = parsers::parseProcessList(text, ProcessLayout::Columns);
    ASSERT_TRUE(processes.has_value());
    ASSERT_EQ(3, processes->size());
    EXPECT_EQ("1", processes->at(0).pid);
    EXPECT_EQ("init", processes->at(0).name);
    EXPECT_EQ("4200 KB", processes->at(0).memory);
    EXPECT_EQ("530", processes->at(1).pid);
    EXPECT_EQ("R", processes->at(1).state);
    EXPECT_EQ("1200", processes->at(2).pid);
    EXPECT_EQ("3.5", processes->at(2).cpuPercent);
    EXPECT_EQ("system", processes->at(2).user);
}

TEST(ProcessListTest, DefaultLayoutMapsToyboxColumns) {
    const QString text =
        "USER           PID  PPID     VSZ    RSS WCHAN            ADDR S NAME\n"
        "root             1     0   35000   4200 SyS_epoll_wait      0 S init\n"
        "shell          812     1   12000   2048 do_wait             0 R sh\n";
    const auto processes = parsers::parseProcessList(text, ProcessLayout::Default);
    ASSERT_TRUE(processes.has_value());
    ASSERT_EQ(2, processes->size());
    EXPECT_EQ("812", processes->at(1).pid);
    EXPECT_EQ("sh", processes->at(1).name);
    EXPECT_EQ("shell", processes->at(1).user);
    EXPECT_EQ("R", processes->at(1).state);
    EXPECT_EQ("2048 KB", processes->at(1).memory);
    EXPECT_EQ("N/A", processes->at(1).cpuPercent);
}

TEST(ProcessListTest, NonNumericPidSortsFirst) {
    const QString text =
        "5 a 0.0 10 root S\n"
        "x b 0.0 10 root S\n";
    const auto processes = parsers::parseProcessList(text, ProcessLayout::Columns);
    ASSERT_TRUE(processes.has_value());
    EXPECT_EQ("x", processes->at(0).pid);
}

TEST(ProcessListTest, HeaderOnlyFails) {
    EXPECT_FALSE(parsers::parseProcessList("PID NAME %CPU RSS USER S\n").has_value());
}

TEST(FormatBytesTest, UsesBinaryUnits) {
    EXPECT_EQ("512 B", parsers::formatBytes(512));
    EXPECT_EQ("0 B", parsers::formatBytes(0));
    EXPECT_EQ("1.50 KB", parsers::formatBytes(1536));
    EXPECT_EQ("1.00 MB", parsers::formatBytes(1024ull * 1024ull));
    EXPECT_EQ("2.00 GB", parsers::formatBytes(2ull * 1024ull * 1024ull * 1024ull));
    EXPECT_EQ("1024.00 TB", parsers::formatBytes(1024ull * 1024ull * 1024ull * 1024ull * 1024ull));
}
