#include "devdeck/streaming_job.hpp"

#include <QCoreApplication>
#include <QElapsedTimer>
#include <QThread>

#include <gtest/gtest.h>

using devdeck::ErrorKind;
using devdeck::LineEventQueue;
using devdeck::StreamingJob;
using devdeck::StreamingResult;

TEST(LineEventQueueTest, DrainReturnsEverythingOnce) {
    LineEventQueue queue;
    queue.push("a");
    queue.push("b");

    EXPECT_EQ(2, queue.size());
    EXPECT_EQ((QStringList{"a", "b"}), queue.drainAll());
    EXPECT_TRUE(queue.drainAll().isEmpty());
}

TEST(StreamingJobTest, LinesAreDrainedOnTheOwnerThread) {
    StreamingJob job;
    int finishedSignals = 0;
    QObject::connect(&job, &StreamingJob::finished, [&finishedSignals](const StreamingResult&) {
        finishedSignals++;
    });

    ASSERT_TRUE(job.start("/bin/sh", {"-c", "echo one; echo two"}));
    EXPECT_TRUE(job.isRunning());
    EXPECT_EQ("/bin/sh", job.program());
    ASSERT_TRUE(job.waitForFinished(10000));

    EXPECT_FALSE(job.isRunning());
    EXPECT_EQ((QStringList{"one", "two"}), job.drain());
    EXPECT_TRUE(job.lastResult().success);
    EXPECT_EQ(1, finishedSignals);

    QCoreApplication::processEvents();
    EXPECT_EQ(1, finishedSignals);
}

TEST(StreamingJobTest, SecondStartWhileRunningIsRejected) {
    StreamingJob job;
    ASSERT_TRUE(job.start("/bin/sh", {"-c", "exec sleep 30"}));

    EXPECT_FALSE(job.start("/bin/sh", {"-c", "echo again"}));

    job.stop();
    ASSERT_TRUE(job.waitForFinished(10000));
}

TEST(StreamingJobTest, StopCancelsTheRunningTool) {
    StreamingJob job;
    QElapsedTimer elapsed;
    elapsed.start();
    ASSERT_TRUE(job.start("/bin/sh", {"-c", "echo ready; exec sleep 30"}));

    while (job.drain().isEmpty() && elapsed.elapsed() < 5000) {
        QThread::msleep(10);
    }
    job.stop();
    ASSERT_TRUE(job.waitForFinished(10000));

    EXPECT_LT(elapsed.elapsed(), 10000);
    EXPECT_FALSE(job.lastResult().success);
    EXPECT_EQ(ErrorKind::Cancelled, job.lastResult().error);
}

TEST(StreamingJobTest, JobCanBeRestartedAfterFinishing) {
    StreamingJob job;
    ASSERT_TRUE(job.start("/bin/sh", {"-c", "echo first"}));
    ASSERT_TRUE(job.waitForFinished(10000));
    job.drain();

    ASSERT_TRUE(job.start("/bin/sh", {"-c", "echo second; exit 2"}));
    ASSERT_TRUE(job.waitForFinished(10000));

    EXPECT_EQ((QStringList{"second"}), job.drain());
    EXPECT_EQ(2, job.lastResult().exitCode);
    EXPECT_EQ(ErrorKind::CommandFailed, job.lastResult().error);
}
