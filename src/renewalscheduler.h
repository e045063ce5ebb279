/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef RENEWALSCHEDULER_H
#define RENEWALSCHEDULER_H

#include <QString>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <ostream>
#include <thread>

#include "subscriptionregistry.h"

class RenewalScheduler {
   public:
    enum class State { Renewing, Resubscribing, Lost, Done };
    friend std::ostream &operator<<(std::ostream &os, State state);

    explicit RenewalScheduler(std::shared_ptr<SubscriptionRegistry> registry);
    ~RenewalScheduler();

    void start();
    void stop();
    inline bool running() const { return m_thread.joinable(); }

    // Renews every subscription which deadline is not after now.
    void tick(SubscriptionRegistry::Clock::time_point now);
    // Runs renewal state machine for one subscription and returns final
    // state (Done or Lost).
    State process(const QString &sid);
    void wake();

   private:
    std::shared_ptr<SubscriptionRegistry> m_registry;
    std::thread m_thread;
    std::mutex m_mtx;
    std::condition_variable m_cv;
    bool m_shutdown = false;
    bool m_woken = false;

    void loop();
};

#endif  // RENEWALSCHEDULER_H
