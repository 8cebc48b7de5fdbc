// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/UtilsGlobal.hpp"

#include <QtCore/QMetaObject>
#include <QtCore/QPointer>
#include <QtCore/QThreadPool>
#include <QtCore/QRunnable>
#include <QtCore/Qt>

#include <atomic>
#include <exception>
#include <memory>
#include <type_traits>
#include <utility>

namespace Utils::Async {

// Shared flag checked before the work starts and again before the result is
// delivered. Copies observe the same flag.
class CancelToken final
{
public:
    CancelToken()
        : m_flag(std::make_shared<std::atomic_bool>(false))
    {
    }

    void cancel() const noexcept { m_flag->store(true); }
    bool isCancelled() const noexcept { return m_flag->load(); }

private:
    std::shared_ptr<std::atomic_bool> m_flag;
};

namespace detail {

template <typename Result, typename WorkFn, typename DoneFn>
class AsyncRunnable final : public QRunnable
{
public:
    AsyncRunnable(QPointer<QObject> context, WorkFn work, DoneFn done, CancelToken token)
        : m_context(std::move(context))
        , m_work(std::move(work))
        , m_done(std::move(done))
        , m_token(std::move(token))
    {
    }

    void run() override
    {
        if (m_token.isCancelled())
            return;

        Result result{};
        try {
            result = m_work();
        } catch (const std::exception& e) {
            qCWarning(utilslog).noquote() << "Background task failed:" << e.what();
            return;
        }

        if (!m_context || m_token.isCancelled())
            return;

        QPointer<QObject> guard = m_context;
        QMetaObject::invokeMethod(
            guard,
            [guard, token = m_token, done = std::move(m_done), result = std::move(result)]() mutable {
                if (guard && !token.isCancelled())
                    done(std::move(result));
            },
            Qt::QueuedConnection);
    }

private:
    QPointer<QObject> m_context;
    WorkFn m_work;
    DoneFn m_done;
    CancelToken m_token;
};

} // namespace detail

// Runs |work| on |pool| and hands its result to |done| on |context|'s thread.
// Nothing is delivered once |context| is destroyed or |token| is cancelled.
template <typename Result, typename Work, typename Done>
void run(QObject* context,
         Work&& work,
         Done&& done,
         CancelToken token = {},
         QThreadPool* pool = QThreadPool::globalInstance())
{
    static_assert(!std::is_void_v<Result>, "Async::run needs a result to deliver");
    using WorkFn = std::decay_t<Work>;
    using DoneFn = std::decay_t<Done>;

    if (!context || !pool)
        return;

    auto task = new detail::AsyncRunnable<Result, WorkFn, DoneFn>(
        QPointer<QObject>(context),
        WorkFn(std::forward<Work>(work)),
        DoneFn(std::forward<Done>(done)),
        std::move(token));
    task->setAutoDelete(true);
    pool->start(task);
}

} // namespace Utils::Async
