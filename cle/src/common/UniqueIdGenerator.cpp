// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "common/UniqueIdGenerator.h"

#include <chrono>
#include <sstream>

namespace CLE {

std::atomic<uint64_t> UniqueIdGenerator::globalCounter_{0};
std::mt19937_64 UniqueIdGenerator::rng_{std::random_device{}()};
std::mutex UniqueIdGenerator::rngMutex_;

std::string UniqueIdGenerator::generateCorrelationId() {
    return generateBaseId("corr");
}

std::string UniqueIdGenerator::generateSubscriptionId() {
    return generateBaseId("sub");
}

std::string UniqueIdGenerator::generateUniqueId(const std::string &prefix) {
    return generateBaseId(prefix);
}

void UniqueIdGenerator::resetForTesting() {
    globalCounter_.store(0);
    std::lock_guard<std::mutex> lock(rngMutex_);
    rng_.seed(12345);
}

std::string UniqueIdGenerator::generateBaseId(const std::string &prefix) {
    uint64_t count = globalCounter_.fetch_add(1);

    std::ostringstream oss;
    oss << prefix << "_" << getCurrentTimestamp() << "_" << count << "_" << std::hex << getRandomComponent();
    return oss.str();
}

uint64_t UniqueIdGenerator::getCurrentTimestamp() {
    auto duration = std::chrono::steady_clock::now().time_since_epoch();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(duration).count());
}

uint64_t UniqueIdGenerator::getRandomComponent() {
    std::lock_guard<std::mutex> lock(rngMutex_);
    // Lower 16 bits keep the id short
    return rng_() & 0xFFFF;
}

}  // namespace CLE
