// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/JsonUtils.h"
#include "model/Contract.h"
#include <memory>

namespace CLE {

/**
 * @brief Turns a raw contract document into a validated Contract
 *
 * Pure transformation: no filesystem or network access. Documents come from
 * ContractLoader (YAML/JSON files) or are built in memory.
 */
class ContractParser {
public:
    /**
     * @brief Parse and validate a contract document
     * @param document Object with node_type, contract_version, states, transitions
     * @return Immutable contract
     * @throws SchemaError naming the contract and the offending field
     */
    static std::shared_ptr<const Contract> parse(const json &document);

    /**
     * @brief Field-level decoding only, without cross-reference validation
     * @throws SchemaError on missing or mistyped fields
     */
    static ContractDefinition parseDefinition(const json &document);
};

}  // namespace CLE
