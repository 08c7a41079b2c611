// Transfer policy evaluation and registry tests (run via CTest).
#include "openfleet/TransferPolicy.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

openfleet::TransferPolicy policy(const std::string &name,
                                 openfleet::PolicyScope scope,
                                 std::optional<std::string> scopeId = {}) {
    openfleet::TransferPolicy p;
    p.name = name;
    p.scope = scope;
    p.scopeId = std::move(scopeId);
    return p;
}

openfleet::TransferContext upload(const std::string &file, std::uint64_t size) {
    openfleet::TransferContext ctx;
    ctx.userId = "alice";
    ctx.direction = openfleet::TransferDirection::Upload;
    ctx.fileName = file;
    ctx.fileSize = size;
    return ctx;
}

void test_size_limit(TestContext &t) {
    openfleet::PolicyRegistry reg;
    auto p = policy("upload-cap", openfleet::PolicyScope::Global);
    p.direction = openfleet::TransferDirection::Upload;
    p.maxFileSize = 1000;
    std::string err;
    t.check(reg.create(p, err).has_value(), "global policy should be created");

    auto d = reg.evaluate(upload("big.bin", 2000));
    t.check(!d.allowed, "file over the limit should be denied");
    t.checkContains(d.reason, "\"upload-cap\"", "reason should name the policy");
    t.check(d.policy.has_value() && d.policy->name == "upload-cap",
            "decision should carry the policy");

    d = reg.evaluate(upload("big.bin", 500));
    t.check(d.allowed, "file under the limit should pass");
    t.check(d.reason.empty(), "allowed decision has no reason");
}

void test_zero_size_limit_means_unlimited(TestContext &t) {
    openfleet::PolicyRegistry reg;
    auto p = policy("no-cap", openfleet::PolicyScope::Global);
    p.maxFileSize = 0;
    std::string err;
    reg.create(p, err);
    t.check(reg.evaluate(upload("x.iso", 1ULL << 40)).allowed,
            "max_file_size 0 should not limit");
}

void test_direction(TestContext &t) {
    openfleet::PolicyRegistry reg;
    auto p = policy("download-only", openfleet::PolicyScope::Global);
    p.direction = openfleet::TransferDirection::Download;
    std::string err;
    reg.create(p, err);
    auto d = reg.evaluate(upload("a.txt", 1));
    t.check(!d.allowed, "upload should be blocked by a download-only policy");
    t.checkContains(d.reason, "Transfer direction upload",
                    "reason should name the direction");
    auto down = upload("a.txt", 1);
    down.direction = openfleet::TransferDirection::Download;
    t.check(reg.evaluate(down).allowed, "download should pass");
}

void test_extensions(TestContext &t) {
    openfleet::PolicyRegistry reg;
    auto allow = policy("docs-only", openfleet::PolicyScope::Global);
    allow.allowedExtensions = std::vector<std::string>{".PDF", "txt"};
    auto block = policy("no-exe", openfleet::PolicyScope::Global);
    block.blockedExtensions = std::vector<std::string>{"exe"};
    std::string err;
    reg.create(allow, err);
    reg.create(block, err);

    t.check(reg.evaluate(upload("Report.pdf", 1)).allowed,
            "extension match should ignore case and the leading dot");
    auto d = reg.evaluate(upload("setup.exe", 1));
    t.check(!d.allowed, "exe should be denied");
    d = reg.evaluate(upload("image.png", 1));
    t.check(!d.allowed, "png is not in the allowed list");
    t.checkContains(d.reason, ".png", "reason should name the extension");
    t.check(!reg.evaluate(upload("Makefile", 1)).allowed,
            "a name without a dot is checked as its own extension");
}

void test_allow_list_covers_names_without_extension(TestContext &t) {
    openfleet::PolicyRegistry reg;
    auto p = policy("text-only", openfleet::PolicyScope::Global);
    p.allowedExtensions = std::vector<std::string>{"txt"};
    std::string err;
    t.check(reg.create(p, err).has_value(), "policy should be created");

    t.check(!reg.evaluate(upload("evil.sh", 1)).allowed, "sh is not listed");
    auto d = reg.evaluate(upload("evil", 1));
    t.check(!d.allowed, "a bare name must not slip past the allowed list");
    t.checkContains(d.reason, ".evil", "the whole name is the extension");
    d = reg.evaluate(upload("notes.", 1));
    t.check(!d.allowed, "an empty extension is not in the allowed list");
    t.checkContains(d.reason, "has no extension", "reason for a trailing dot");
    t.check(reg.evaluate(upload("notes.TXT", 1)).allowed, "listed extension");

    openfleet::PolicyRegistry blockOnly;
    auto b = policy("no-exe", openfleet::PolicyScope::Global);
    b.blockedExtensions = std::vector<std::string>{"exe"};
    blockOnly.create(b, err);
    t.check(blockOnly.evaluate(upload("Makefile", 1)).allowed,
            "a block list alone leaves bare names alone");
}

void test_empty_allow_list_allows_everything(TestContext &t) {
    openfleet::PolicyRegistry reg;
    auto p = policy("empty", openfleet::PolicyScope::Global);
    p.allowedExtensions = std::vector<std::string>{};
    std::string err;
    reg.create(p, err);
    t.check(reg.evaluate(upload("a.bin", 1)).allowed,
            "an empty allowed list should not restrict");
}

void test_scope_matching(TestContext &t) {
    openfleet::PolicyRegistry reg;
    std::string err;
    auto user = policy("bob-cap", openfleet::PolicyScope::User, "bob");
    user.maxFileSize = 10;
    auto conn = policy("conn7-cap", openfleet::PolicyScope::Connection, "7");
    conn.maxFileSize = 10;
    auto group = policy("group3-cap", openfleet::PolicyScope::Group, "3");
    group.maxFileSize = 10;
    auto userGroup =
        policy("ug-cap", openfleet::PolicyScope::UserGroup, "3");
    userGroup.maxFileSize = 10;
    t.check(reg.create(user, err).has_value() && reg.create(conn, err).has_value() &&
                reg.create(group, err).has_value() &&
                reg.create(userGroup, err).has_value(),
            "scoped policies should be created");

    auto ctx = upload("a.txt", 100);
    t.check(reg.evaluate(ctx).allowed, "no policy applies to alice alone");

    ctx.userId = "bob";
    t.check(!reg.evaluate(ctx).allowed, "user policy applies to bob");

    ctx.userId = "alice";
    ctx.connectionId = 7;
    t.check(!reg.evaluate(ctx).allowed, "connection policy applies to 7");
    ctx.connectionId = 8;
    t.check(reg.evaluate(ctx).allowed, "connection policy ignores 8");

    ctx.connectionId.reset();
    ctx.groupIds = {1, 3};
    auto d = reg.evaluate(ctx);
    t.check(!d.allowed && d.policy && d.policy->name == "group3-cap",
            "group policy applies through membership");

    ctx.groupIds = {};
    auto effective = reg.effectivePolicies("alice", std::nullopt, {3});
    bool userGroupSeen = false;
    for (const auto &p : effective)
        userGroupSeen = userGroupSeen || p.scope == openfleet::PolicyScope::UserGroup;
    t.check(!userGroupSeen, "user_group policies never apply");
}

void test_disabled_policies_are_skipped(TestContext &t) {
    openfleet::PolicyRegistry reg;
    auto p = policy("off", openfleet::PolicyScope::Global);
    p.maxFileSize = 1;
    p.enabled = false;
    std::string err;
    reg.create(p, err);
    t.check(reg.evaluate(upload("a.txt", 100)).allowed,
            "disabled policy should not deny");
}

void test_priority_order(TestContext &t) {
    openfleet::PolicyRegistry reg;
    std::string err;
    auto low = policy("low", openfleet::PolicyScope::Global);
    low.maxFileSize = 10;
    low.priority = 1;
    auto high = policy("high", openfleet::PolicyScope::Global);
    high.blockedExtensions = std::vector<std::string>{"txt"};
    high.priority = 9;
    reg.create(low, err);
    reg.create(high, err);

    auto d = reg.evaluate(upload("a.txt", 100));
    t.check(!d.allowed && d.policy && d.policy->name == "high",
            "the highest priority policy should decide first");

    const auto listed = reg.list();
    t.check(listed.size() == 2 && listed[0].name == "high",
            "list should be ordered by priority");
}

void test_list_newest_first_on_equal_priority(TestContext &t) {
    openfleet::PolicyRegistry reg;
    std::string err;
    reg.create(policy("first", openfleet::PolicyScope::Global), err);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    reg.create(policy("second", openfleet::PolicyScope::Global), err);
    const auto listed = reg.list();
    t.check(listed.size() == 2 && listed[0].name == "second",
            "equal priority lists the newest first");

    openfleet::PolicyQuery q;
    q.scope = openfleet::PolicyScope::User;
    t.check(reg.list(q).empty(), "scope filter should apply");
}

void test_admin_validation(TestContext &t) {
    openfleet::PolicyRegistry reg;
    std::string err;
    t.check(!reg.create(policy("", openfleet::PolicyScope::Global), err),
            "empty name should be rejected");
    t.check(!reg.create(policy("g", openfleet::PolicyScope::Global, "1"), err),
            "global with scope_id should be rejected");
    t.check(!reg.create(policy("u", openfleet::PolicyScope::User), err),
            "user scope without scope_id should be rejected");
    t.checkContains(err, "scope_id is required", "error should explain");

    auto created = reg.create(policy("dup", openfleet::PolicyScope::Global), err);
    t.check(created.has_value() && !created->id.empty(),
            "created policy should get an id");
    t.check(!reg.create(policy("dup", openfleet::PolicyScope::Global), err),
            "duplicate name should be rejected");
    t.checkContains(err, "already exists", "duplicate error");

    t.check(!reg.remove(created->id, err), "global policy cannot be removed");
    openfleet::PolicyUpdate disable;
    disable.enabled = false;
    t.check(reg.update(created->id, disable, err), "global can be disabled");
    t.check(reg.get(created->id) && !reg.get(created->id)->enabled,
            "update should be visible");

    auto user = reg.create(policy("u1", openfleet::PolicyScope::User, "bob"), err);
    t.check(user.has_value(), "user policy should be created");
    openfleet::PolicyUpdate toGlobal;
    toGlobal.scope = openfleet::PolicyScope::Global;
    t.check(reg.update(user->id, toGlobal, err),
            "changing scope to global clears scope_id");
    t.check(reg.get(user->id) && !reg.get(user->id)->scopeId.has_value(),
            "scope_id should be cleared");

    openfleet::PolicyUpdate toUser;
    toUser.scope = openfleet::PolicyScope::User;
    t.check(!reg.update(user->id, toUser, err),
            "scope change without scope_id should be rejected");

    auto other = reg.create(policy("u2", openfleet::PolicyScope::User, "eve"), err);
    t.check(other.has_value() && reg.remove(other->id, err),
            "scoped policy can be removed");
    t.check(!reg.remove("missing", err), "unknown id cannot be removed");
    t.check(reg.size() == 2, "two policies should remain");
}

void test_validate_gate(TestContext &t) {
    openfleet::PolicyRegistry reg;
    auto ctx = upload("", 1);
    auto d = reg.validate(ctx);
    t.check(!d.allowed, "empty file name should be rejected");

    ctx = upload("a.txt", 1);
    ctx.direction = openfleet::TransferDirection::Both;
    d = reg.validate(ctx);
    t.check(!d.allowed, "direction both is not a concrete transfer");
    t.checkContains(d.reason, "Invalid transfer direction", "reason");

    t.check(reg.validate(upload("a.txt", 1)).allowed,
            "no policies allow everything");
}

void test_file_extension(TestContext &t) {
    t.check(openfleet::fileExtension("a.TAR.GZ") == "gz",
            "last extension, lower-cased");
    t.check(openfleet::fileExtension("README") == "readme",
            "no dot, the whole name");
    t.check(openfleet::fileExtension("notes.").empty(), "trailing dot, empty");
}

} // namespace

int main() {
    TestContext t;
    test_size_limit(t);
    test_zero_size_limit_means_unlimited(t);
    test_direction(t);
    test_extensions(t);
    test_allow_list_covers_names_without_extension(t);
    test_empty_allow_list_allows_everything(t);
    test_scope_matching(t);
    test_disabled_policies_are_skipped(t);
    test_priority_order(t);
    test_list_newest_first_on_equal_priority(t);
    test_admin_validation(t);
    test_validate_gate(t);
    test_file_extension(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] openfleet_policy_tests\n";
    return EXIT_SUCCESS;
}
