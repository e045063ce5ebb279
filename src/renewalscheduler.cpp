/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "renewalscheduler.h"

#include "errors.hpp"
#include "logger.hpp"

std::ostream &operator<<(std::ostream &os, RenewalScheduler::State state) {
    switch (state) {
        case RenewalScheduler::State::Renewing:
            os << "renewing";
            break;
        case RenewalScheduler::State::Resubscribing:
            os << "resubscribing";
            break;
        case RenewalScheduler::State::Lost:
            os << "lost";
            break;
        case RenewalScheduler::State::Done:
            os << "done";
            break;
    }
    return os;
}

RenewalScheduler::RenewalScheduler(
    std::shared_ptr<SubscriptionRegistry> registry)
    : m_registry{std::move(registry)} {}

RenewalScheduler::~RenewalScheduler() { stop(); }

void RenewalScheduler::start() {
    if (m_thread.joinable()) return;

    {
        std::lock_guard lock{m_mtx};
        m_shutdown = false;
        m_woken = false;
    }

    m_registry->setChangedCallback([this] { wake(); });
    m_thread = std::thread{&RenewalScheduler::loop, this};

    LOGD("renewal scheduler started");
}

void RenewalScheduler::stop() {
    if (!m_thread.joinable()) return;

    {
        std::lock_guard lock{m_mtx};
        m_shutdown = true;
    }
    m_cv.notify_one();
    m_thread.join();

    m_registry->setChangedCallback({});

    LOGD("renewal scheduler stopped");
}

void RenewalScheduler::wake() {
    {
        std::lock_guard lock{m_mtx};
        m_woken = true;
    }
    m_cv.notify_one();
}

void RenewalScheduler::loop() {
    std::unique_lock lock{m_mtx};

    while (!m_shutdown) {
        auto pred = [this] { return m_shutdown || m_woken; };

        if (auto deadline = m_registry->nextRenewalDeadline())
            m_cv.wait_until(lock, *deadline, pred);
        else
            m_cv.wait(lock, pred);

        if (m_shutdown) break;
        m_woken = false;

        lock.unlock();
        tick(m_registry->now());
        lock.lock();
    }
}

void RenewalScheduler::tick(SubscriptionRegistry::Clock::time_point now) {
    for (const auto &sid : m_registry->dueForRenewal(now)) process(sid);
}

RenewalScheduler::State RenewalScheduler::process(const QString &sid) {
    // copy taken before renewal, needed to re-subscribe after removal
    auto subscription = m_registry->snapshot(sid);
    if (!subscription) return State::Done;

    auto state = State::Renewing;

    while (state != State::Done) {
        LOGD("subscription " << sid << " state: " << state);

        switch (state) {
            case State::Renewing:
                try {
                    m_registry->renew(sid);
                    state = State::Done;
                } catch (const RenewError &e) {
                    state = e.reason() ==
                                    RenewError::Reason::UnknownSubscription
                                ? State::Done
                                : State::Resubscribing;
                }
                break;
            case State::Resubscribing:
                try {
                    auto newSid = m_registry->subscribe(
                        subscription->device, subscription->callbackBaseUrl,
                        subscription->requestedDuration,
                        subscription->handler);
                    LOGI("subscription re-established: " << sid << " => "
                                                         << newSid);
                    state = State::Done;
                } catch (const SubscribeError &e) {
                    LOGW("re-subscribe failed: " << sid << " " << e.what());
                    state = State::Lost;
                }
                break;
            case State::Lost:
                LOGW("subscription lost: " << sid);
                if (subscription->handler.onSubscriptionLost) {
                    try {
                        subscription->handler.onSubscriptionLost(sid);
                    } catch (const std::exception &e) {
                        LOGE("subscription lost handler error: " << e.what());
                    }
                }
                return State::Lost;
            case State::Done:
                break;
        }
    }

    return State::Done;
}
