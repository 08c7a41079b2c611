// Transfer policies: scoped, prioritized rules deciding whether a file may
// be transferred, and the in-memory registry that evaluates them.
#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace openfleet {

enum class PolicyScope { Global, UserGroup, User, Connection, Group };

enum class TransferDirection { Upload, Download, Both, None };

struct TransferPolicy {
    std::string id;
    std::string name;
    PolicyScope scope = PolicyScope::Global;
    std::optional<std::string> scopeId; // absent only for Global
    TransferDirection direction = TransferDirection::Both;
    std::optional<std::uint64_t> maxFileSize;  // bytes; 0 means no limit
    std::optional<std::uint64_t> maxTotalSize; // bytes; stored, not enforced per file
    // nullopt: no list. Entries are matched case-insensitively, leading dot optional.
    std::optional<std::vector<std::string>> allowedExtensions;
    std::optional<std::vector<std::string>> blockedExtensions;
    bool enabled = true;
    int priority = 0; // higher is evaluated first
    std::int64_t createdAtMs = 0;
    std::int64_t updatedAtMs = 0;
};

struct TransferContext {
    std::string userId;
    std::optional<std::int64_t> connectionId;
    std::vector<std::int64_t> groupIds;
    TransferDirection direction = TransferDirection::Upload;
    std::string fileName;
    std::uint64_t fileSize = 0;
};

struct PolicyDecision {
    bool allowed = true;
    std::string reason;                  // set when denied
    std::optional<TransferPolicy> policy; // the rejecting policy
};

struct PolicyQuery {
    std::optional<PolicyScope> scope;
    std::optional<std::string> scopeId;
    std::optional<bool> enabled;
};

// Partial update; only the engaged fields change. Setting scope always
// rewrites scopeId from this update (absent clears it).
struct PolicyUpdate {
    std::optional<std::string> name;
    std::optional<PolicyScope> scope;
    std::optional<std::string> scopeId;
    std::optional<TransferDirection> direction;
    std::optional<std::optional<std::uint64_t>> maxFileSize;
    std::optional<std::optional<std::uint64_t>> maxTotalSize;
    std::optional<std::optional<std::vector<std::string>>> allowedExtensions;
    std::optional<std::optional<std::vector<std::string>>> blockedExtensions;
    std::optional<bool> enabled;
    std::optional<int> priority;
};

const char *policyScopeName(PolicyScope scope);
const char *transferDirectionName(TransferDirection direction);
std::optional<PolicyScope> parsePolicyScope(const std::string &name);
std::optional<TransferDirection> parseTransferDirection(const std::string &name);

// Lower-cased text after the last '.'. A name without a dot is its own
// extension; only a trailing dot yields an empty one.
std::string fileExtension(const std::string &fileName);

// scopeId is required for every scope but Global and forbidden for Global.
bool validateScope(PolicyScope scope, const std::optional<std::string> &scopeId,
                   std::string &err);

// Checks one policy against a context; true when it lets the transfer pass,
// otherwise false with the denial reason naming the policy.
bool applyPolicy(const TransferPolicy &policy, const TransferContext &ctx,
                 std::string &reason);

class PolicyRegistry {
public:
    // Returns the stored policy (with id and timestamps) or nullopt with err.
    std::optional<TransferPolicy> create(TransferPolicy policy, std::string &err);
    bool update(const std::string &id, const PolicyUpdate &changes,
                std::string &err);
    // Global policies can be disabled but never removed.
    bool remove(const std::string &id, std::string &err);

    std::optional<TransferPolicy> get(const std::string &id) const;
    // Ordered by priority (descending), then creation time (newest first).
    std::vector<TransferPolicy> list(const PolicyQuery &query = {}) const;

    // Enabled policies that apply to the given user/connection/groups, in
    // evaluation order.
    std::vector<TransferPolicy>
    effectivePolicies(const std::string &userId,
                      std::optional<std::int64_t> connectionId,
                      const std::vector<std::int64_t> &groupIds = {}) const;

    PolicyDecision evaluate(const TransferContext &ctx) const;

    // Pre-flight gate for transfer surfaces: rejects contexts that do not
    // describe a concrete upload or download, then evaluates.
    PolicyDecision validate(const TransferContext &ctx) const;

    // Restores a persisted policy as is (no uniqueness or scope checks).
    void insertLoaded(TransferPolicy policy);

    std::size_t size() const;

private:
    mutable std::mutex mtx_;
    std::vector<TransferPolicy> policies_; // insertion order
};

} // namespace openfleet
