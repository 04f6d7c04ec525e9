#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "util/Expected.hpp"

namespace proclient {

/// Contract granted to a token
struct Contract {
    std::string name;
    std::vector<std::string> entitlements;
    std::vector<std::string> enableByDefault;  // Auto-enabled on attach
};

/**
 * @brief Resolves subscription tokens into contracts
 *
 * lookup() fails with InvalidToken when the token is not recognized.
 * autoAttachToken() hands out the token this machine's image is entitled
 * to; InvalidToken there means the image has no auto-attach support.
 */
class IContractSource {
public:
    virtual ~IContractSource() = default;
    virtual Expected<Contract> lookup(const std::string& token) const = 0;
    virtual Expected<std::string> autoAttachToken() const = 0;
};

/**
 * @brief Contracts read from a local JSON document
 *
 * Format:
 *   { "auto_attach_token": "<token>",
 *     "<token>": { "name": "...", "entitlements": ["esm-infra", ...],
 *                  "enable_by_default": ["esm-infra", ...] } }
 * Only object entries are contracts. The file is read on every lookup so a
 * refresh sees updates.
 */
class FileContractSource : public IContractSource {
public:
    explicit FileContractSource(std::filesystem::path file) : file(std::move(file)) {}
    Expected<Contract> lookup(const std::string& token) const override;
    Expected<std::string> autoAttachToken() const override;

private:
    std::filesystem::path file;
};

/// Fixed token -> contract table, used by tests
class MemoryContractSource : public IContractSource {
public:
    void add(const std::string& token, Contract contract) { contracts[token] = std::move(contract); }
    void setAutoAttachToken(std::string token) { autoToken = std::move(token); }
    Expected<Contract> lookup(const std::string& token) const override;
    Expected<std::string> autoAttachToken() const override;

private:
    std::map<std::string, Contract> contracts;
    std::string autoToken;
};

}
