/* Copyright (C) 2017-2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef SINGLETON_H
#define SINGLETON_H

#include <utility>

// Process-wide instance created on first use. Arguments passed to the
// first call construct it; later calls ignore theirs.
template <typename T>
class Singleton {
   public:
    template <typename... Args>
    static T* instance(Args&&... args) {
        static T inst{std::forward<Args>(args)...};
        return &inst;
    }

   protected:
    Singleton() = default;
    virtual ~Singleton() = default;
    Singleton(const Singleton&) = delete;
    Singleton(Singleton&&) = delete;
    Singleton& operator=(const Singleton&) = delete;
    Singleton& operator=(Singleton&&) = delete;
};

#endif // SINGLETON_H
