#include "devdeck/journal.hpp"

#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QTemporaryDir>

#include <gtest/gtest.h>

using devdeck::Journal;
using devdeck::ScopedDuration;

namespace {

class JournalTest : public ::testing::Test {
protected:
    void SetUp() override { Journal::instance().reset(); }
    void TearDown() override {
        Journal::instance().setMaxEvents(1500);
        Journal::instance().reset();
    }
};

}  // namespace

TEST_F(JournalTest, CountersAccumulate) {
    Journal::instance().incrementCounter("commands.count");
    Journal::instance().incrementCounter("commands.count", 4);

    EXPECT_EQ(5, Journal::instance().counter("commands.count"));
    EXPECT_EQ(0, Journal::instance().counter("missing"));
}

TEST_F(JournalTest, DurationsTrackCountTotalAndMax) {
    Journal::instance().recordDurationMs("sampler.pass_ms", 10);
    Journal::instance().recordDurationMs("sampler.pass_ms", 30);

    const QJsonObject stats =
        Journal::instance().snapshot().value("durations").toObject().value("sampler.pass_ms").toObject();
    EXPECT_EQ(2, stats.value("count").toInt());
    EXPECT_EQ(40, stats.value("total_ms").toInt());
    EXPECT_EQ(10, stats.value("min_ms").toInt());
    EXPECT_EQ(30, stats.value("max_ms").toInt());
    EXPECT_DOUBLE_EQ(20.0, stats.value("avg_ms").toDouble());
}

TEST_F(JournalTest, EventLogDropsOldestBeyondLimit) {
    Journal::instance().setMaxEvents(3);
    for (int i = 0; i < 5; ++i) {
        Journal::instance().recordEvent("stream_started", {{"index", i}});
    }

    const QJsonArray events = Journal::instance().events();
    ASSERT_EQ(3, events.size());
    EXPECT_EQ(2, events.first().toObject().value("index").toInt());
    EXPECT_EQ("stream_started", events.last().toObject().value("type").toString());
    EXPECT_TRUE(events.last().toObject().contains("timestamp_utc"));
    EXPECT_LT(events.first().toObject().value("seq").toDouble(), events.last().toObject().value("seq").toDouble());
    EXPECT_EQ(2, Journal::instance().snapshot().value("dropped_events").toInt());
}

TEST_F(JournalTest, ResetRestartsEventNumbering) {
    Journal::instance().recordEvent("stream_started");
    Journal::instance().recordEvent("stream_finished");
    Journal::instance().reset();

    Journal::instance().recordEvent("sampling_started");

    const QJsonArray events = Journal::instance().events();
    ASSERT_EQ(1, events.size());
    EXPECT_EQ(1, events.first().toObject().value("seq").toInt());
}

TEST_F(JournalTest, ScopedDurationRecordsOnExit) {
    {
        ScopedDuration duration("streams.duration_ms");
        EXPECT_GE(duration.elapsedMs(), 0);
    }

    const QJsonObject stats =
        Journal::instance().snapshot().value("durations").toObject().value("streams.duration_ms").toObject();
    EXPECT_EQ(1, stats.value("count").toInt());
}

TEST_F(JournalTest, ExportWritesSnapshotFile) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    Journal::instance().setGauge("devices.adb.count", 2);
    const QString path = QDir(dir.path()).filePath("nested/journal.json");

    const QJsonObject status = Journal::instance().exportToFile(path);

    ASSERT_TRUE(status.value("success").toBool());
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly));
    const QJsonObject written = QJsonDocument::fromJson(file.readAll()).object();
    EXPECT_DOUBLE_EQ(2.0, written.value("gauges").toObject().value("devices.adb.count").toDouble());
}

TEST_F(JournalTest, ExportToUnwritablePathReportsFailure) {
    const QJsonObject status = Journal::instance().exportToFile("/proc/devdeck/journal.json");

    EXPECT_FALSE(status.value("success").toBool(true));
    EXPECT_FALSE(status.value("error").toString().isEmpty());
}
