#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <utility>

#include "util/Expected.hpp"

namespace proclient {

/**
 * @brief Subscription attachment of this machine
 *
 * Owned outside the core: read once at the start of an invocation and
 * written back once at the end when a mutating action changed it.
 */
struct AttachmentState {
    bool attached{false};
    std::string contractName;
    std::string token;
    std::string machineId;
    std::string attachedAt;                 // ISO-8601 UTC
    std::set<std::string> entitlements;     // Services the contract grants
    std::set<std::string> enabledServices;  // Services currently enabled

    bool isEntitled(const std::string& name) const { return entitlements.count(name) != 0; }
    bool isEnabled(const std::string& name) const { return enabledServices.count(name) != 0; }
};

inline bool operator==(const AttachmentState& a, const AttachmentState& b) {
    return a.attached == b.attached && a.contractName == b.contractName && a.token == b.token &&
           a.machineId == b.machineId && a.attachedAt == b.attachedAt && a.entitlements == b.entitlements &&
           a.enabledServices == b.enabledServices;
}

inline bool operator!=(const AttachmentState& a, const AttachmentState& b) { return !(a == b); }

/**
 * @brief Persistence seam for AttachmentState
 *
 * Injected into commands so the engine never reaches for global state.
 */
class IAttachmentStore {
public:
    virtual ~IAttachmentStore() = default;
    /// Load current state; absent state is "unattached", not an error
    virtual Expected<AttachmentState> load() const = 0;
    virtual Expected<void> save(const AttachmentState& state) = 0;
    /// Forget the attachment entirely (detach)
    virtual Expected<void> clear() = 0;
};

/**
 * @brief JSON-backed store at <data_dir>/private/machine-token.json
 *
 * File format:
 *   { "attached": true, "contract_name": "...", "token": "...",
 *     "machine_id": "...", "attached_at": "...",
 *     "entitlements": [...], "enabled_services": [...] }
 * Written atomically with owner-only permissions.
 */
class FileAttachmentStore : public IAttachmentStore {
public:
    explicit FileAttachmentStore(std::filesystem::path dataDir);

    Expected<AttachmentState> load() const override;
    Expected<void> save(const AttachmentState& state) override;
    Expected<void> clear() override;

    const std::filesystem::path& path() const { return tokenPath; }

private:
    std::filesystem::path tokenPath;
};

/// In-process store, used by tests and dry runs
class MemoryAttachmentStore : public IAttachmentStore {
public:
    MemoryAttachmentStore() = default;
    explicit MemoryAttachmentStore(AttachmentState initial) : state(std::move(initial)) {}

    Expected<AttachmentState> load() const override { return state; }
    Expected<void> save(const AttachmentState& s) override {
        state = s;
        ++saves;
        return {};
    }
    Expected<void> clear() override {
        state = AttachmentState{};
        ++saves;
        return {};
    }

    const AttachmentState& current() const { return state; }
    int saveCount() const { return saves; }

private:
    AttachmentState state;
    int saves{0};
};

}
