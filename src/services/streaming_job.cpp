#include "devdeck/streaming_job.hpp"

#include <QDeadlineTimer>
#include <QMutexLocker>

#include "devdeck/journal.hpp"

namespace devdeck {

void LineEventQueue::push(const QString& line) {
    QMutexLocker lock(&mutex_);
    lines_.enqueue(line);
}

QStringList LineEventQueue::drainAll() {
    QMutexLocker lock(&mutex_);
    QStringList out;
    out.reserve(lines_.size());
    while (!lines_.isEmpty()) {
        out.append(lines_.dequeue());
    }
    return out;
}

int LineEventQueue::size() const {
    QMutexLocker lock(&mutex_);
    return lines_.size();
}

StreamingJob::StreamingJob(QObject* parent)
    : QObject(parent) {}

StreamingJob::~StreamingJob() {
    stop();
    if (worker_) {
        worker_->wait();
    }
}

bool StreamingJob::start(const QString& program, const QStringList& args, int timeoutMs) {
    if (running_) {
        return false;
    }
    if (worker_) {
        worker_->wait();
    }

    token_.reset();
    program_ = program;
    queue_.drainAll();

    worker_.reset(QThread::create([this, program, args, timeoutMs]() {
        const StreamingResult result = StreamingExecutor::run(
            program,
            args,
            [this](const QString& line) { queue_.push(line); },
            &token_,
            timeoutMs);
        QMutexLocker lock(&resultMutex_);
        pendingResult_ = result;
    }));
    connect(worker_.get(), &QThread::finished, this, &StreamingJob::onWorkerFinished);

    running_ = true;
    worker_->start();
    Journal::instance().incrementCounter("jobs.started");
    return true;
}

void StreamingJob::stop() {
    if (!running_) {
        return;
    }
    token_.cancel();
    Journal::instance().recordEvent("stream_stop_requested", {{"program", program_}});
}

bool StreamingJob::waitForFinished(int timeoutMs) {
    if (!worker_) {
        return true;
    }
    if (!worker_->wait(QDeadlineTimer(timeoutMs))) {
        return false;
    }
    onWorkerFinished();
    return true;
}

QStringList StreamingJob::drain() {
    return queue_.drainAll();
}

void StreamingJob::onWorkerFinished() {
    if (!running_ || !worker_ || !worker_->isFinished()) {
        return;
    }
    running_ = false;
    {
        QMutexLocker lock(&resultMutex_);
        lastResult_ = pendingResult_;
    }
    Journal::instance().incrementCounter("jobs.finished");
    emit finished(lastResult_);
}

}  // namespace devdeck
