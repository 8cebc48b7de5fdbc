// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/UtilsGlobal.hpp"

#include <QtCore/QObject>
#include <QtCore/QTimer>

#include <algorithm>
#include <functional>
#include <utility>

namespace Utils::Async {

// Collapses bursts of requests into one call of the most recent action,
// |delayMs| after the last request. Lives on the event loop of its thread.
class UTILS_EXPORT DebouncedInvoker final : public QObject
{
    Q_OBJECT

public:
    explicit DebouncedInvoker(int delayMs, QObject* parent = nullptr)
        : QObject(parent)
    {
        m_timer.setSingleShot(true);
        m_timer.setInterval(std::max(delayMs, 0));
        connect(&m_timer, &QTimer::timeout, this, &DebouncedInvoker::run);
    }

    int delayMs() const { return m_timer.interval(); }

    // Replaces the pending action and restarts the delay.
    void trigger(std::function<void()> action)
    {
        m_action = std::move(action);
        if (m_action)
            m_timer.start();
        else
            m_timer.stop();
    }

    // Runs the pending action now, if there is one.
    void flush()
    {
        if (m_timer.isActive())
            run();
    }

    void cancel()
    {
        m_timer.stop();
        m_action = nullptr;
    }

    bool isPending() const { return m_timer.isActive(); }

private:
    void run()
    {
        m_timer.stop();
        auto action = std::exchange(m_action, nullptr);
        if (action)
            action();
    }

    QTimer m_timer;
    std::function<void()> m_action;
};

} // namespace Utils::Async
