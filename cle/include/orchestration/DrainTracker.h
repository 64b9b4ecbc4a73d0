// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>

namespace CLE {

/**
 * @brief Counts in-flight units of work so shutdown can wait for them
 *
 * @code
 * if (auto token = tracker.tryAcquire()) {
 *     process(message);
 * }  // released here
 * @endcode
 */
class DrainTracker {
public:
    /**
     * @brief RAII handle for one unit of in-flight work
     */
    class WorkToken {
    public:
        WorkToken(WorkToken &&other) noexcept : tracker_(other.tracker_) {
            other.tracker_ = nullptr;
        }

        WorkToken &operator=(WorkToken &&other) noexcept {
            if (this != &other) {
                release();
                tracker_ = other.tracker_;
                other.tracker_ = nullptr;
            }
            return *this;
        }

        WorkToken(const WorkToken &) = delete;
        WorkToken &operator=(const WorkToken &) = delete;

        ~WorkToken() {
            release();
        }

        void release();

    private:
        friend class DrainTracker;

        explicit WorkToken(DrainTracker *tracker) : tracker_(tracker) {}

        DrainTracker *tracker_;
    };

    /**
     * @brief Start a unit of work
     * @return Token, or nullopt once draining has begun
     */
    std::optional<WorkToken> tryAcquire();

    /**
     * @brief Refuse new work from now on
     */
    void beginDrain();

    /**
     * @brief Wait until no work is in flight
     * @return true if drained, false if the timeout expired first
     */
    bool waitForDrain(std::chrono::milliseconds timeout);

    size_t inFlight() const;

    bool isDraining() const;

private:
    void releaseOne();

    mutable std::mutex mutex_;
    std::condition_variable drained_;
    size_t inFlight_ = 0;
    bool draining_ = false;
};

}  // namespace CLE
