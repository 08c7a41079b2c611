#include "openfleet/TransferPolicy.hpp"
#include "openfleet/ShellCommand.hpp"
#include "openfleet/TaskTypes.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace openfleet {

const char *policyScopeName(PolicyScope scope) {
    switch (scope) {
    case PolicyScope::Global:
        return "global";
    case PolicyScope::UserGroup:
        return "user_group";
    case PolicyScope::User:
        return "user";
    case PolicyScope::Connection:
        return "connection";
    case PolicyScope::Group:
        return "group";
    }
    return "unknown";
}

const char *transferDirectionName(TransferDirection direction) {
    switch (direction) {
    case TransferDirection::Upload:
        return "upload";
    case TransferDirection::Download:
        return "download";
    case TransferDirection::Both:
        return "both";
    case TransferDirection::None:
        return "none";
    }
    return "unknown";
}

std::optional<PolicyScope> parsePolicyScope(const std::string &name) {
    for (PolicyScope s : {PolicyScope::Global, PolicyScope::UserGroup,
                          PolicyScope::User, PolicyScope::Connection,
                          PolicyScope::Group}) {
        if (name == policyScopeName(s))
            return s;
    }
    return std::nullopt;
}

std::optional<TransferDirection> parseTransferDirection(const std::string &name) {
    for (TransferDirection d :
         {TransferDirection::Upload, TransferDirection::Download,
          TransferDirection::Both, TransferDirection::None}) {
        if (name == transferDirectionName(d))
            return d;
    }
    return std::nullopt;
}

static std::string toLower(std::string s) {
    for (auto &c : s)
        c = (char)std::tolower(static_cast<unsigned char>(c));
    return s;
}

static std::string normalizeExtension(const std::string &ext) {
    std::size_t start = ext.find_first_not_of('.');
    return start == std::string::npos ? std::string()
                                      : toLower(ext.substr(start));
}

static bool listContains(const std::vector<std::string> &list,
                         const std::string &ext) {
    for (const auto &entry : list) {
        if (normalizeExtension(entry) == ext)
            return true;
    }
    return false;
}

std::string fileExtension(const std::string &fileName) {
    const std::size_t dot = fileName.rfind('.');
    if (dot == std::string::npos)
        return toLower(fileName);
    return toLower(fileName.substr(dot + 1));
}

bool validateScope(PolicyScope scope, const std::optional<std::string> &scopeId,
                   std::string &err) {
    const bool hasId = scopeId.has_value() && !scopeId->empty();
    if (scope == PolicyScope::Global) {
        if (hasId) {
            err = "scope_id must not be set for scope global";
            return false;
        }
        return true;
    }
    if (!hasId) {
        err = std::string("scope_id is required for scope ") +
              policyScopeName(scope);
        return false;
    }
    return true;
}

bool applyPolicy(const TransferPolicy &policy, const TransferContext &ctx,
                 std::string &reason) {
    const std::string quoted = "\"" + policy.name + "\"";

    if (policy.direction != TransferDirection::Both &&
        policy.direction != ctx.direction) {
        reason = std::string("Transfer direction ") +
                 transferDirectionName(ctx.direction) +
                 " is blocked by policy " + quoted;
        return false;
    }

    if (policy.maxFileSize.has_value() && *policy.maxFileSize > 0 &&
        ctx.fileSize > *policy.maxFileSize) {
        reason = "File size " + formatBytes(ctx.fileSize) +
                 " exceeds the limit of " + formatBytes(*policy.maxFileSize) +
                 " set by policy " + quoted;
        return false;
    }

    const std::string ext = fileExtension(ctx.fileName);
    if (policy.allowedExtensions.has_value() &&
        !policy.allowedExtensions->empty() &&
        !listContains(*policy.allowedExtensions, ext)) {
        reason = ext.empty() ? "File " + ctx.fileName +
                                   " has no extension and policy " + quoted +
                                   " only allows listed extensions"
                             : "File extension ." + ext +
                                   " is not in the allowed list of policy " +
                                   quoted;
        return false;
    }

    if (policy.blockedExtensions.has_value() &&
        listContains(*policy.blockedExtensions, ext)) {
        reason = "File extension ." + ext + " is blocked by policy " + quoted;
        return false;
    }
    return true;
}

static std::string newPolicyId() {
    const std::string h = randomHex(16);
    return h.substr(0, 8) + "-" + h.substr(8, 4) + "-" + h.substr(12, 4) + "-" +
           h.substr(16, 4) + "-" + h.substr(20);
}

static std::optional<std::string> normalizedScopeId(
    const std::optional<std::string> &scopeId) {
    if (!scopeId.has_value() || scopeId->empty())
        return std::nullopt;
    return scopeId;
}

std::optional<TransferPolicy> PolicyRegistry::create(TransferPolicy policy,
                                                     std::string &err) {
    if (policy.name.empty()) {
        err = "Policy name must not be empty";
        return std::nullopt;
    }
    policy.scopeId = normalizedScopeId(policy.scopeId);
    if (!validateScope(policy.scope, policy.scopeId, err))
        return std::nullopt;

    std::lock_guard<std::mutex> lk(mtx_);
    for (const auto &p : policies_) {
        if (p.name == policy.name) {
            err = "Policy name already exists: " + policy.name;
            return std::nullopt;
        }
    }
    policy.id = newPolicyId();
    policy.createdAtMs = currentTimeMs();
    policy.updatedAtMs = policy.createdAtMs;
    policies_.push_back(policy);
    return policy;
}

bool PolicyRegistry::update(const std::string &id, const PolicyUpdate &changes,
                            std::string &err) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = std::find_if(policies_.begin(), policies_.end(),
                           [&](const TransferPolicy &p) { return p.id == id; });
    if (it == policies_.end()) {
        err = "Policy not found: " + id;
        return false;
    }

    TransferPolicy next = *it;
    if (changes.name.has_value()) {
        if (changes.name->empty()) {
            err = "Policy name must not be empty";
            return false;
        }
        for (const auto &p : policies_) {
            if (p.id != id && p.name == *changes.name) {
                err = "Policy name already exists: " + *changes.name;
                return false;
            }
        }
        next.name = *changes.name;
    }
    if (changes.scope.has_value()) {
        next.scope = *changes.scope;
        next.scopeId = normalizedScopeId(changes.scopeId);
    } else if (changes.scopeId.has_value()) {
        next.scopeId = normalizedScopeId(changes.scopeId);
    }
    if (!validateScope(next.scope, next.scopeId, err))
        return false;
    if (changes.direction.has_value())
        next.direction = *changes.direction;
    if (changes.maxFileSize.has_value())
        next.maxFileSize = *changes.maxFileSize;
    if (changes.maxTotalSize.has_value())
        next.maxTotalSize = *changes.maxTotalSize;
    if (changes.allowedExtensions.has_value())
        next.allowedExtensions = *changes.allowedExtensions;
    if (changes.blockedExtensions.has_value())
        next.blockedExtensions = *changes.blockedExtensions;
    if (changes.enabled.has_value())
        next.enabled = *changes.enabled;
    if (changes.priority.has_value())
        next.priority = *changes.priority;
    next.updatedAtMs = currentTimeMs();
    *it = std::move(next);
    return true;
}

bool PolicyRegistry::remove(const std::string &id, std::string &err) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = std::find_if(policies_.begin(), policies_.end(),
                           [&](const TransferPolicy &p) { return p.id == id; });
    if (it == policies_.end()) {
        err = "Policy not found: " + id;
        return false;
    }
    if (it->scope == PolicyScope::Global) {
        err = "Global policies cannot be deleted; disable them instead";
        return false;
    }
    policies_.erase(it);
    return true;
}

std::optional<TransferPolicy> PolicyRegistry::get(const std::string &id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    for (const auto &p : policies_) {
        if (p.id == id)
            return p;
    }
    return std::nullopt;
}

std::vector<TransferPolicy> PolicyRegistry::list(const PolicyQuery &query) const {
    std::vector<TransferPolicy> out;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (const auto &p : policies_) {
            if (query.scope.has_value() && p.scope != *query.scope)
                continue;
            if (query.scopeId.has_value() && p.scopeId != query.scopeId)
                continue;
            if (query.enabled.has_value() && p.enabled != *query.enabled)
                continue;
            out.push_back(p);
        }
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const TransferPolicy &a, const TransferPolicy &b) {
                         if (a.priority != b.priority)
                             return a.priority > b.priority;
                         return a.createdAtMs > b.createdAtMs;
                     });
    return out;
}

std::vector<TransferPolicy>
PolicyRegistry::effectivePolicies(const std::string &userId,
                                  std::optional<std::int64_t> connectionId,
                                  const std::vector<std::int64_t> &groupIds) const {
    auto matches = [&](const TransferPolicy &p) {
        switch (p.scope) {
        case PolicyScope::Global:
            return true;
        case PolicyScope::User:
            return p.scopeId.has_value() && *p.scopeId == userId;
        case PolicyScope::Connection:
            return connectionId.has_value() && *connectionId > 0 &&
                   p.scopeId.has_value() &&
                   *p.scopeId == std::to_string(*connectionId);
        case PolicyScope::Group:
            for (std::int64_t g : groupIds) {
                if (p.scopeId.has_value() && *p.scopeId == std::to_string(g))
                    return true;
            }
            return false;
        case PolicyScope::UserGroup:
            // No membership source for user groups.
            return false;
        }
        return false;
    };

    std::vector<TransferPolicy> out;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (const auto &p : policies_) {
            if (p.enabled && matches(p))
                out.push_back(p);
        }
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const TransferPolicy &a, const TransferPolicy &b) {
                         if (a.priority != b.priority)
                             return a.priority > b.priority;
                         return std::strcmp(policyScopeName(a.scope),
                                            policyScopeName(b.scope)) < 0;
                     });
    return out;
}

PolicyDecision PolicyRegistry::evaluate(const TransferContext &ctx) const {
    PolicyDecision decision;
    for (const auto &p : effectivePolicies(ctx.userId, ctx.connectionId,
                                           ctx.groupIds)) {
        std::string reason;
        if (!applyPolicy(p, ctx, reason)) {
            decision.allowed = false;
            decision.reason = reason;
            decision.policy = p;
            return decision;
        }
    }
    return decision;
}

PolicyDecision PolicyRegistry::validate(const TransferContext &ctx) const {
    if (ctx.direction != TransferDirection::Upload &&
        ctx.direction != TransferDirection::Download) {
        PolicyDecision d;
        d.allowed = false;
        d.reason = std::string("Invalid transfer direction: ") +
                   transferDirectionName(ctx.direction);
        return d;
    }
    if (ctx.fileName.empty()) {
        PolicyDecision d;
        d.allowed = false;
        d.reason = "File name must not be empty";
        return d;
    }
    return evaluate(ctx);
}

void PolicyRegistry::insertLoaded(TransferPolicy policy) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = std::find_if(policies_.begin(), policies_.end(),
                           [&](const TransferPolicy &p) { return p.id == policy.id; });
    if (it != policies_.end())
        *it = std::move(policy);
    else
        policies_.push_back(std::move(policy));
}

std::size_t PolicyRegistry::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return policies_.size();
}

} // namespace openfleet
