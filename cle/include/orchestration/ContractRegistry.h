// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "model/Contract.h"
#include "parsing/ContractLoader.h"
#include "validation/ContractAnalyzer.h"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace CLE {

/**
 * @brief One document that failed validation
 */
struct ValidationFailure {
    std::string path;
    std::string contractName;
    std::string fieldPath;
    std::string message;
};

/**
 * @brief Outcome of validating a batch of discovered documents
 */
struct ValidationReport {
    std::vector<std::string> registered;  // contract names, in document order
    std::vector<ValidationFailure> failures;
    std::vector<AnalysisResult> findings;  // non-clean analyses (warnings unless strict)

    bool isValid() const {
        return failures.empty();
    }

    /**
     * @brief Single actionable message naming the first offending contract
     */
    std::string firstError() const;

    json toJson() const;
};

/**
 * @brief Name-indexed store of validated contracts
 *
 * Re-registering a name replaces the stored value with a freshly built one;
 * holders of the previous shared_ptr keep the old, still valid, contract.
 */
class ContractRegistry {
public:
    /**
     * @param strictAnalysis Turn analyzer findings into SchemaError
     */
    explicit ContractRegistry(bool strictAnalysis = false);

    /**
     * @brief Parse, analyze and insert one document
     * @throws SchemaError on invalid documents (and on analyzer findings in strict mode)
     */
    std::shared_ptr<const Contract> registerDocument(const LoadedDocument &document);

    /**
     * @brief Insert an already built contract (analysis rules still apply)
     */
    std::shared_ptr<const Contract> registerContract(std::shared_ptr<const Contract> contract,
                                                     const std::string &origin = "<memory>");

    /**
     * @brief Validate every document individually, collecting all failures
     *
     * Valid documents are registered even when others fail. Two documents of
     * the batch declaring the same name is a failure of the second one.
     */
    ValidationReport validateAll(const std::vector<LoadedDocument> &documents);

    std::shared_ptr<const Contract> find(const std::string &name) const;

    /**
     * @brief Lookup with a version requirement
     * @throws DependencyError if the contract is not registered
     * @throws VersionMismatchError if the loaded version is not compatible
     */
    std::shared_ptr<const Contract> require(const std::string &name, const SemanticVersion &required) const;

    std::string originOf(const std::string &name) const;

    /**
     * @brief Registered contracts ordered by name
     */
    std::vector<std::shared_ptr<const Contract>> contracts() const;

    std::vector<std::string> names() const;

    size_t size() const;

    bool isStrict() const {
        return strictAnalysis_;
    }

private:
    struct Entry {
        std::shared_ptr<const Contract> contract;
        std::string origin;
    };

    AnalysisResult checkAnalysis(const Contract &contract) const;

    void insert(const std::shared_ptr<const Contract> &contract, const std::string &origin);

    bool strictAnalysis_;
    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
};

}  // namespace CLE
