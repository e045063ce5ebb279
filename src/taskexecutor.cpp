/* Copyright (C) 2017-2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "taskexecutor.h"

#include "logger.hpp"

TaskExecutor::Task::Task(std::function<void()> job) : m_job{std::move(job)} {}

void TaskExecutor::Task::run() {
    try {
        m_job();
    } catch (const std::exception &e) {
        LOGE("task error: " << e.what());
    }
}

TaskExecutor::TaskExecutor(int threadCount) {
    m_pool.setMaxThreadCount(threadCount);
}

void TaskExecutor::startTask(std::function<void()> job) {
    auto *task = new Task{std::move(job)};
    task->setAutoDelete(true);
    m_pool.start(task);
}

bool TaskExecutor::waitForDone(int msecs) { return m_pool.waitForDone(msecs); }

bool TaskExecutor::taskActive() const { return m_pool.activeThreadCount() > 0; }
