#include "progresssink.h"
#include "appconfig.h"

#include <QtGlobal>
#include <utility>

CallbackProgressSink::CallbackProgressSink(std::function<void(int)> callback)
    : m_callback(std::move(callback))
{
}

void CallbackProgressSink::report(int percent)
{
    if (m_callback) {
        m_callback(percent);
    }
}

ProgressTracker::ProgressTracker(ProgressSink& sink, int total)
    : m_sink(sink)
    , m_total(total)
    , m_done(0)
    , m_lastReported(-1)
{
}

void ProgressTracker::step()
{
    reportDone(m_done + 1);
}

void ProgressTracker::reportDone(int done)
{
    m_done = done;

    int percent = percentOf(done, m_total);
    if (percent < m_lastReported) {
        return;
    }

    m_lastReported = percent;
    m_sink.report(percent);
}

int ProgressTracker::percentOf(int done, int total)
{
    if (total <= 0) {
        return AppConfig::PROGRESS_MAX;
    }
    int percent = qRound(static_cast<double>(AppConfig::PROGRESS_MAX) * done / total);
    return qBound(0, percent, AppConfig::PROGRESS_MAX);
}
