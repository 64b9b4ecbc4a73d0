// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "orchestration/DrainTracker.h"
#include "common/Logger.h"

namespace CLE {

void DrainTracker::WorkToken::release() {
    if (tracker_) {
        tracker_->releaseOne();
        tracker_ = nullptr;
    }
}

std::optional<DrainTracker::WorkToken> DrainTracker::tryAcquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (draining_) {
        return std::nullopt;
    }
    ++inFlight_;
    return WorkToken(this);
}

void DrainTracker::beginDrain() {
    std::lock_guard<std::mutex> lock(mutex_);
    draining_ = true;
}

bool DrainTracker::waitForDrain(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    const bool drained = drained_.wait_for(lock, timeout, [this] { return inFlight_ == 0; });
    if (!drained) {
        LOG_WARN("DrainTracker: {} units of work still in flight after {} ms", inFlight_, timeout.count());
    }
    return drained;
}

size_t DrainTracker::inFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inFlight_;
}

bool DrainTracker::isDraining() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return draining_;
}

void DrainTracker::releaseOne() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (inFlight_ > 0 && --inFlight_ == 0) {
        drained_.notify_all();
    }
}

}  // namespace CLE
