#include "devdeck/line_channel.hpp"

#include <QDeadlineTimer>
#include <QMutexLocker>

namespace devdeck {

LineChannel::LineChannel(int producers)
    : producers_(qMax(0, producers)) {}

void LineChannel::push(const QString& line) {
    QMutexLocker lock(&mutex_);
    lines_.enqueue(line);
    ready_.wakeOne();
}

void LineChannel::producerDone() {
    QMutexLocker lock(&mutex_);
    if (producers_ > 0) {
        producers_--;
    }
    ready_.wakeAll();
}

LineChannel::PopStatus LineChannel::pop(QString& line, int timeoutMs) {
    QMutexLocker lock(&mutex_);
    QDeadlineTimer deadline(timeoutMs);
    while (lines_.isEmpty()) {
        if (producers_ == 0) {
            return PopStatus::Closed;
        }
        if (!ready_.wait(&mutex_, deadline)) {
            if (!lines_.isEmpty()) {
                break;
            }
            return producers_ == 0 ? PopStatus::Closed : PopStatus::Timeout;
        }
    }
    line = lines_.dequeue();
    return PopStatus::Line;
}

int LineChannel::pending() const {
    QMutexLocker lock(&mutex_);
    return lines_.size();
}

}  // namespace devdeck
