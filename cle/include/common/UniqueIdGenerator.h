// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace CLE {

/**
 * @brief Thread-safe generator for correlation and subscription identifiers
 *
 * Format: prefix_timestamp_counter_random. The counter is process-global so
 * two ids generated in the same millisecond never collide.
 */
class UniqueIdGenerator {
public:
    /**
     * @brief Correlation id threaded through one transition and all its actions
     */
    static std::string generateCorrelationId();

    /**
     * @brief Subscription handle id for event bus subscriptions
     */
    static std::string generateSubscriptionId();

    static std::string generateUniqueId(const std::string &prefix);

    /**
     * @brief Reset counters and seed the RNG deterministically (tests only)
     */
    static void resetForTesting();

private:
    static std::string generateBaseId(const std::string &prefix);
    static uint64_t getCurrentTimestamp();
    static uint64_t getRandomComponent();

    static std::atomic<uint64_t> globalCounter_;
    static std::mt19937_64 rng_;
    static std::mutex rngMutex_;
};

}  // namespace CLE
