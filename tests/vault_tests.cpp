#include <algorithm>
#include <cassert>
#include <string>
#include <thread>
#include <vector>

#include "db.hpp"
#include "password_generator.hpp"
#include "test_support.hpp"
#include "vault.hpp"

namespace
{
CredentialEntry entry(const std::string& title, const std::string& username, const std::string& password)
{
    CredentialEntry e;
    e.title = title;
    e.username = username;
    e.password = password;
    return e;
}

void test_lifecycle(VaultContext& ctx)
{
    CredentialEntry e;
    e.title = "github";
    e.username = "alice";
    e.url = "https://github.com";
    e.generate = true;

    CredentialRecord created;
    assert(vault_create(ctx, e, created) == VaultStatus::OK);
    assert(created.id > 0);
    assert(created.password.size() == 16);

    CredentialRecord got;
    assert(vault_get_one(ctx, "github", "alice", got) == VaultStatus::OK);
    assert(got.id == created.id);
    assert(got.url == "https://github.com");
    assert(got.password == created.password);
    assert(got.password.size() == 16);
    assert(in_alphabet(got.password, password_alphabet()));

    CredentialUpdate u;
    u.title = "github";
    u.username = "alice";
    u.url = "https://github.com/alice";
    CredentialRecord updated;
    assert(vault_update(ctx, u, updated) == VaultStatus::OK);

    assert(vault_get_one(ctx, "github", "alice", got) == VaultStatus::OK);
    assert(got.url == "https://github.com/alice");
    assert(got.password == created.password);
    assert(got.title == "github" && got.username == "alice");
    assert(updated.url == got.url);

    assert(vault_delete(ctx, "github", "alice") == VaultStatus::OK);
    assert(vault_get_one(ctx, "github", "alice", got) == VaultStatus::NOT_FOUND);
    assert(vault_delete(ctx, "github", "alice") == VaultStatus::NOT_FOUND);
}

void test_uniqueness(VaultContext& ctx)
{
    CredentialRecord rec;
    assert(vault_create(ctx, entry("mail", "bob", "pw-one"), rec) == VaultStatus::OK);
    assert(vault_create(ctx, entry("mail", "bob", "pw-two"), rec) == VaultStatus::DUPLICATE_ENTRY);
    assert(vault_create(ctx, entry("mail", "carol", "pw-three"), rec) == VaultStatus::OK);

    // the losing insert did not overwrite anything
    assert(vault_get_one(ctx, "mail", "bob", rec) == VaultStatus::OK);
    assert(rec.password == "pw-one");
    assert(rec.url == DEFAULT_URL);
}

void test_list_by_title(VaultContext& ctx)
{
    CredentialRecord rec;
    assert(vault_create(ctx, entry("bank", "u1", "a"), rec) == VaultStatus::OK);
    assert(vault_create(ctx, entry("bank", "u2", "b"), rec) == VaultStatus::OK);
    assert(vault_create(ctx, entry("bank", "u3", "c"), rec) == VaultStatus::OK);

    std::vector<CredentialRecord> recs;
    assert(vault_list_by_title(ctx, "bank", recs) == VaultStatus::OK);
    assert(recs.size() == 3);
    assert(recs[0].username == "u1" && recs[0].password == "a");
    assert(recs[1].username == "u2" && recs[1].password == "b");
    assert(recs[2].username == "u3" && recs[2].password == "c");
    assert(recs[0].id < recs[1].id && recs[1].id < recs[2].id);

    assert(vault_list_by_title(ctx, "no-such-title", recs) == VaultStatus::NOT_FOUND);
    assert(recs.empty());

    std::vector<std::string> titles;
    assert(vault_list_titles(ctx, titles) == VaultStatus::OK);
    assert(titles.size() == 2);
    assert(std::find(titles.begin(), titles.end(), "bank") != titles.end());
    assert(std::find(titles.begin(), titles.end(), "mail") != titles.end());
}

void test_update_rules(VaultContext& ctx)
{
    CredentialRecord rec;
    assert(vault_create(ctx, entry("shop", "dave", "old-pass"), rec) == VaultStatus::OK);

    CredentialUpdate u;
    u.title = "shop";
    u.username = "dave";
    u.password = std::string("new-pass");
    assert(vault_update(ctx, u, rec) == VaultStatus::OK);
    assert(rec.password == "new-pass");
    assert(rec.url == DEFAULT_URL);

    // generation wins over a supplied password
    u.password = std::string("ignored");
    u.generate = true;
    assert(vault_update(ctx, u, rec) == VaultStatus::OK);
    assert(rec.password != "ignored");
    assert(rec.password.size() == static_cast<size_t>(DEFAULT_GENERATED_LEN));

    CredentialUpdate missing;
    missing.title = "shop";
    missing.username = "erin";
    missing.password = std::string("whatever");
    assert(vault_update(ctx, missing, rec) == VaultStatus::NOT_FOUND);
    assert(vault_get_one(ctx, "shop", "erin", rec) == VaultStatus::NOT_FOUND);
}

void test_invalid_input(VaultContext& ctx)
{
    CredentialRecord rec;
    assert(vault_create(ctx, entry("", "x", "p"), rec) == VaultStatus::INVALID_ARGUMENT);
    assert(vault_create(ctx, entry("t", "   ", "p"), rec) == VaultStatus::INVALID_ARGUMENT);
    assert(vault_create(ctx, entry("t\tab", "x", "p"), rec) == VaultStatus::INVALID_ARGUMENT);
    assert(vault_create(ctx, entry(std::string(MAX_TITLE_LEN + 1, 't'), "x", "p"), rec) == VaultStatus::INVALID_ARGUMENT);
    assert(vault_create(ctx, entry("t", "x", ""), rec) == VaultStatus::INVALID_ARGUMENT);
    assert(vault_create(ctx, entry("t", "x", "line\nbreak"), rec) == VaultStatus::INVALID_ARGUMENT);

    CredentialEntry no_password;
    no_password.title = "t";
    no_password.username = "x";
    assert(vault_create(ctx, no_password, rec) == VaultStatus::INVALID_ARGUMENT);

    std::vector<CredentialRecord> recs;
    assert(vault_list_by_title(ctx, "t", recs) == VaultStatus::NOT_FOUND);
}

void test_ids_never_reused(VaultContext& ctx)
{
    CredentialRecord first, second;
    assert(vault_create(ctx, entry("ids", "one", "p1"), first) == VaultStatus::OK);
    assert(vault_delete(ctx, "ids", "one") == VaultStatus::OK);
    assert(vault_create(ctx, entry("ids", "one", "p1"), second) == VaultStatus::OK);
    assert(second.id > first.id);
}

void test_stale_key_aborts_whole_read(const std::string& db)
{
    VaultContext current(db);
    assert(current.cipher.init(secret("current master")) == VaultStatus::OK);
    VaultContext stale(db);
    assert(stale.cipher.init(secret("stale master")) == VaultStatus::OK);

    CredentialRecord rec;
    assert(vault_create(current, entry("cloud", "a", "pa"), rec) == VaultStatus::OK);
    assert(vault_create(current, entry("cloud", "b", "pb"), rec) == VaultStatus::OK);
    assert(vault_create(stale, entry("cloud", "c", "pc"), rec) == VaultStatus::OK);
    assert(vault_create(current, entry("cloud", "d", "pd"), rec) == VaultStatus::OK);

    std::vector<CredentialRecord> recs;
    assert(vault_list_by_title(current, "cloud", recs) == VaultStatus::INVALID_CREDENTIALS);
    assert(recs.empty());

    assert(vault_get_one(current, "cloud", "a", rec) == VaultStatus::OK);
    assert(vault_get_one(current, "cloud", "c", rec) == VaultStatus::INVALID_CREDENTIALS);
    assert(vault_get_one(stale, "cloud", "c", rec) == VaultStatus::OK);
    assert(rec.password == "pc");

    // a url-only update of a row the current key cannot open still commits
    // and says so
    CredentialUpdate url_only;
    url_only.title = "cloud";
    url_only.username = "c";
    url_only.url = std::string("https://cloud.example/c");
    CredentialRecord updated;
    assert(vault_update(current, url_only, updated) == VaultStatus::OK);
    assert(updated.url == "https://cloud.example/c");
    assert(updated.title == "cloud" && updated.username == "c");
    assert(updated.password.empty());
    assert(vault_get_one(stale, "cloud", "c", rec) == VaultStatus::OK);
    assert(rec.url == "https://cloud.example/c");
    assert(rec.password == "pc");
    assert(updated.id == rec.id);

    // a new password re-keys the row under the current key
    CredentialUpdate rekey;
    rekey.title = "cloud";
    rekey.username = "c";
    rekey.password = std::string("pc-new");
    assert(vault_update(current, rekey, updated) == VaultStatus::OK);
    assert(updated.password == "pc-new");
    assert(updated.url == "https://cloud.example/c");
    assert(vault_get_one(current, "cloud", "c", rec) == VaultStatus::OK);
    assert(rec.password == "pc-new");

    // put the stale row back for the all-or-nothing checks below
    assert(vault_delete(current, "cloud", "c") == VaultStatus::OK);
    assert(vault_create(stale, entry("cloud", "c", "pc"), rec) == VaultStatus::OK);
    assert(vault_list_by_title(current, "cloud", recs) == VaultStatus::INVALID_CREDENTIALS);
    assert(recs.empty());

    // corrupted ciphertext reads the same as a wrong key
    DbConnection conn(db);
    assert(conn.exec("UPDATE passwords SET password = 'AAAA' || password"
                     " WHERE title = 'cloud' AND username = 'a'", "test"));
    assert(vault_get_one(current, "cloud", "a", rec) == VaultStatus::INVALID_CREDENTIALS);
}

void test_uninitialized_cipher(const std::string& db)
{
    VaultContext ctx(db);
    CredentialRecord rec;
    std::vector<CredentialRecord> recs;
    assert(vault_create(ctx, entry("locked", "x", "p"), rec) == VaultStatus::UNINITIALIZED);
    assert(vault_get_one(ctx, "mail", "bob", rec) == VaultStatus::UNINITIALIZED);
    assert(vault_list_by_title(ctx, "mail", recs) == VaultStatus::UNINITIALIZED);

    CredentialUpdate u;
    u.title = "mail";
    u.username = "bob";
    u.url = std::string("https://example.org");
    assert(vault_update(ctx, u, rec) == VaultStatus::UNINITIALIZED);
}

void test_concurrent_create_same_pair(VaultContext& ctx)
{
    std::vector<VaultStatus> results(8, VaultStatus::STORAGE_ERROR);
    std::vector<std::thread> workers;
    for (size_t i = 0; i < results.size(); ++i) {
        workers.emplace_back([&ctx, &results, i] {
            CredentialRecord rec;
            results[i] = vault_create(ctx, entry("race", "same", "pw" + std::to_string(i)), rec);
        });
    }
    for (auto& w : workers) w.join();

    int created = 0;
    int duplicates = 0;
    for (VaultStatus st : results) {
        if (st == VaultStatus::OK) created++;
        if (st == VaultStatus::DUPLICATE_ENTRY) duplicates++;
    }
    assert(created == 1);
    assert(duplicates == static_cast<int>(results.size()) - 1);
}
}  // namespace

int main()
{
    TempDir dir;
    if (!init_test_env(dir)) return 1;

    const std::string db = dir.file("vault.db");
    assert(migrate_schema(db) == VaultStatus::OK);

    VaultContext ctx(db);
    assert(ctx.cipher.init(secret("abcd")) == VaultStatus::OK);

    test_lifecycle(ctx);
    test_uniqueness(ctx);
    test_list_by_title(ctx);
    test_update_rules(ctx);
    test_invalid_input(ctx);
    test_ids_never_reused(ctx);
    test_uninitialized_cipher(db);
    test_concurrent_create_same_pair(ctx);

    const std::string db2 = dir.file("stale.db");
    assert(migrate_schema(db2) == VaultStatus::OK);
    test_stale_key_aborts_whole_read(db2);
    return 0;
}
