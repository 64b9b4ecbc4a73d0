// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "orchestration/ContractRegistry.h"
#include "common/ContractErrors.h"
#include "common/Logger.h"
#include "parsing/ContractParser.h"
#include <stdexcept>

namespace CLE {

std::string ValidationReport::firstError() const {
    if (failures.empty()) {
        return "";
    }
    const auto &failure = failures.front();
    std::string message = failure.contractName.empty() ? failure.path : "contract '" + failure.contractName + "'";
    if (!failure.contractName.empty() && !failure.path.empty()) {
        message += " (" + failure.path + ")";
    }
    if (!failure.fieldPath.empty()) {
        message += " at " + failure.fieldPath;
    }
    return message + ": " + failure.message;
}

json ValidationReport::toJson() const {
    json failureList = json::array();
    for (const auto &failure : failures) {
        failureList.push_back(json{{"path", failure.path},
                                   {"contract", failure.contractName},
                                   {"field", failure.fieldPath},
                                   {"message", failure.message}});
    }
    json findingList = json::array();
    for (const auto &finding : findings) {
        for (const auto &line : finding.describe()) {
            findingList.push_back(line);
        }
    }
    return json{{"valid", isValid()}, {"registered", registered}, {"failures", failureList}, {"findings", findingList}};
}

ContractRegistry::ContractRegistry(bool strictAnalysis) : strictAnalysis_(strictAnalysis) {}

std::shared_ptr<const Contract> ContractRegistry::registerDocument(const LoadedDocument &document) {
    auto contract = ContractParser::parse(document.document);
    return registerContract(std::move(contract), document.path);
}

std::shared_ptr<const Contract> ContractRegistry::registerContract(std::shared_ptr<const Contract> contract,
                                                                   const std::string &origin) {
    if (!contract) {
        throw std::invalid_argument("ContractRegistry: contract cannot be null");
    }

    checkAnalysis(*contract);
    insert(contract, origin);
    return contract;
}

void ContractRegistry::insert(const std::shared_ptr<const Contract> &contract, const std::string &origin) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(contract->getName());
    if (it != entries_.end()) {
        LOG_INFO("ContractRegistry: replacing '{}' v{} with v{} from '{}'", contract->getName(),
                 it->second.contract->getVersion().toString(), contract->getVersion().toString(), origin);
    } else {
        LOG_DEBUG("ContractRegistry: registered '{}' v{} from '{}'", contract->getName(),
                  contract->getVersion().toString(), origin);
    }
    entries_[contract->getName()] = Entry{contract, origin};
}

AnalysisResult ContractRegistry::checkAnalysis(const Contract &contract) const {
    AnalysisResult analysis = ContractAnalyzer::analyze(contract);
    if (analysis.isClean()) {
        return analysis;
    }

    const auto findings = analysis.describe();
    if (strictAnalysis_) {
        throw SchemaError(contract.getName(), "states", findings.front());
    }
    for (const auto &finding : findings) {
        LOG_WARN("ContractRegistry: '{}': {}", contract.getName(), finding);
    }
    return analysis;
}

ValidationReport ContractRegistry::validateAll(const std::vector<LoadedDocument> &documents) {
    ValidationReport report;
    std::map<std::string, std::string> seenInBatch;  // name -> path

    for (const auto &document : documents) {
        const std::string declaredName = JsonUtils::getString(document.document, "name");
        try {
            auto contract = ContractParser::parse(document.document);

            auto seen = seenInBatch.find(contract->getName());
            if (seen != seenInBatch.end()) {
                throw SchemaError(contract->getName(), "name", "duplicate contract name, already declared in '" +
                                                                   seen->second + "'");
            }

            AnalysisResult analysis = checkAnalysis(*contract);
            if (!analysis.isClean()) {
                report.findings.push_back(analysis);
            }

            seenInBatch[contract->getName()] = document.path;
            insert(contract, document.path);
            report.registered.push_back(contract->getName());
        } catch (const SchemaError &e) {
            report.failures.push_back(ValidationFailure{document.path,
                                                        e.getContractName().empty() ? declaredName
                                                                                    : e.getContractName(),
                                                        e.getFieldPath(), e.getMessage()});
            LOG_ERROR("ContractRegistry: '{}' rejected: {}", document.path, e.what());
        } catch (const ContractError &e) {
            report.failures.push_back(ValidationFailure{document.path, declaredName, "", e.getDetail()});
            LOG_ERROR("ContractRegistry: '{}' rejected: {}", document.path, e.what());
        }
    }

    LOG_INFO("ContractRegistry: {} of {} documents valid", report.registered.size(), documents.size());
    return report;
}

std::shared_ptr<const Contract> ContractRegistry::find(const std::string &name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(name);
    return it != entries_.end() ? it->second.contract : nullptr;
}

std::shared_ptr<const Contract> ContractRegistry::require(const std::string &name,
                                                          const SemanticVersion &required) const {
    auto contract = find(name);
    if (!contract) {
        throw DependencyError(name, "contract is not registered");
    }
    if (!contract->getVersion().isCompatibleWith(required)) {
        throw VersionMismatchError(name, required.toString(), contract->getVersion().toString());
    }
    return contract;
}

std::string ContractRegistry::originOf(const std::string &name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(name);
    return it != entries_.end() ? it->second.origin : "";
}

std::vector<std::shared_ptr<const Contract>> ContractRegistry::contracts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<const Contract>> result;
    result.reserve(entries_.size());
    for (const auto &[name, entry] : entries_) {
        result.push_back(entry.contract);
    }
    return result;
}

std::vector<std::string> ContractRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto &[name, entry] : entries_) {
        result.push_back(name);
    }
    return result;
}

size_t ContractRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace CLE
