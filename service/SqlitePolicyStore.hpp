// Persists transfer policies (table transfer_policies) and restores them
// into a PolicyRegistry at start-up.
#pragma once
#include "SqliteDatabase.hpp"
#include "openfleet/TransferPolicy.hpp"

class SqlitePolicyStore {
public:
    explicit SqlitePolicyStore(SqliteDatabase &db) : db_(db) {}

    bool initSchema(std::string &err);

    // Upsert by id.
    bool save(const openfleet::TransferPolicy &policy, std::string &err);
    bool remove(const std::string &id, std::string &err);

    // Rows with an unknown scope or direction are skipped; malformed
    // extension lists load as "no list". Both are logged. Returns the number
    // of policies placed in the registry through loaded.
    bool loadInto(openfleet::PolicyRegistry &registry, int &loaded,
                  std::string &err);

private:
    SqliteDatabase &db_;
};
