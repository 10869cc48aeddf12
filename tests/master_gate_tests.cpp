#include <cassert>
#include <string>

#include "db.hpp"
#include "master_gate.hpp"
#include "test_support.hpp"
#include "vault.hpp"

namespace
{
PasswordPrompt scripted(ScriptedPrompt& script)
{
    return [&script](const char* prompt, SecureBuffer& out) { return script(prompt, out); };
}

void test_first_run_setup(const std::string& db)
{
    std::string stored;
    assert(load_master_hash(db, stored) == VaultStatus::OK);
    assert(stored.empty());

    // "abc" is one short, "abcd" is the minimum
    ScriptedPrompt script{{"abc", "abcd", "abcd"}};
    MasterGate gate(db, scripted(script));
    assert(gate.state() == GateState::UNINITIALIZED);

    SecureBuffer master;
    assert(gate.open(master) == VaultStatus::OK);
    assert(gate.state() == GateState::READY);
    assert(master.str() == "abcd");
    assert(script.asked.size() == 3);
    assert(script.asked[0] == "Create master password: ");
    assert(script.asked[1] == "Create master password: ");
    assert(script.asked[2] == "Confirm master password: ");

    assert(load_master_hash(db, stored) == VaultStatus::OK);
    assert(stored.size() == HASH_LEN * 2);
    assert(stored.find("abcd") == std::string::npos);

    // settled gates do not reopen
    SecureBuffer again;
    assert(gate.open(again) != VaultStatus::OK);
}

void test_setup_mismatch_loops(const TempDir& dir)
{
    const std::string db = dir.file("mismatch.db");
    assert(migrate_schema(db) == VaultStatus::OK);

    ScriptedPrompt script{{"first-try", "first-trx", "second", "second"}};
    MasterGate gate(db, scripted(script));
    SecureBuffer master;
    assert(gate.open(master) == VaultStatus::OK);
    assert(master.str() == "second");
    assert(script.next == 4);
}

void test_setup_counts_characters_not_bytes(const TempDir& dir)
{
    const std::string db = dir.file("utf8.db");
    assert(migrate_schema(db) == VaultStatus::OK);

    // three characters in six bytes, then four characters
    ScriptedPrompt script{{"\xC3\xA4\xC3\xB6\xC3\xBC", "\xC3\xA4\xC3\xB6\xC3\xBC!", "\xC3\xA4\xC3\xB6\xC3\xBC!"}};
    MasterGate gate(db, scripted(script));
    SecureBuffer master;
    assert(gate.open(master) == VaultStatus::OK);
    assert(script.next == 3);
}

void test_setup_input_closed(const TempDir& dir)
{
    const std::string db = dir.file("closed.db");
    assert(migrate_schema(db) == VaultStatus::OK);

    ScriptedPrompt script{{"abcd"}};
    MasterGate gate(db, scripted(script));
    SecureBuffer master;
    assert(gate.open(master) == VaultStatus::IO_ERROR);
    assert(gate.state() == GateState::AWAITING_SETUP);

    std::string stored;
    assert(load_master_hash(db, stored) == VaultStatus::OK);
    assert(stored.empty());
}

void test_verification(const std::string& db)
{
    {
        ScriptedPrompt script{{"abcd"}};
        MasterGate gate(db, scripted(script));
        SecureBuffer master;
        assert(gate.open(master) == VaultStatus::OK);
        assert(gate.state() == GateState::READY);
        assert(gate.attempts() == 1);
        assert(script.asked[0] == "Master password: ");
        assert(master.str() == "abcd");
    }
    {
        ScriptedPrompt script{{"nope", "abcd "}};
        script.answers.push_back("abcd");
        MasterGate gate(db, scripted(script));
        SecureBuffer master;
        assert(gate.open(master) == VaultStatus::OK);
        assert(gate.attempts() == 3);
    }
    {
        ScriptedPrompt script{{"wrong1", "wrong2", "wrong3", "abcd"}};
        MasterGate gate(db, scripted(script));
        SecureBuffer master;
        assert(gate.open(master) == VaultStatus::LOCKED);
        assert(gate.state() == GateState::LOCKED);
        assert(gate.attempts() == MAX_VERIFY_ATTEMPTS);
        assert(script.next == 3);
        assert(master.empty());
        assert(gate.open(master) == VaultStatus::LOCKED);
    }
    {
        ScriptedPrompt script{{"wrong1"}};
        MasterGate gate(db, scripted(script));
        SecureBuffer master;
        assert(gate.open(master) == VaultStatus::IO_ERROR);
        assert(gate.state() == GateState::AWAITING_VERIFICATION);
    }
}

void test_master_record_is_immutable(const std::string& db)
{
    std::string before;
    assert(load_master_hash(db, before) == VaultStatus::OK);

    assert(store_master_hash(db, std::string(HASH_LEN * 2, '0')) == VaultStatus::DUPLICATE_ENTRY);

    DbConnection conn(db);
    assert(conn.ok());
    assert(!conn.exec("UPDATE master_password SET hash = 'x'", "test"));
    assert(!conn.exec("DELETE FROM master_password", "test"));
    assert(!conn.exec("INSERT INTO master_password (id, hash) VALUES (2, 'x')", "test"));

    std::string after;
    assert(load_master_hash(db, after) == VaultStatus::OK);
    assert(after == before);
}

void test_unlock_vault(const std::string& db)
{
    {
        VaultContext ctx(db);
        ScriptedPrompt script{{"abcd"}};
        assert(unlock_vault(ctx, scripted(script)) == VaultStatus::OK);
        assert(ctx.cipher.initialized());
    }
    {
        VaultContext ctx(db);
        ScriptedPrompt script{{"x1xx", "x2xx", "x3xx"}};
        assert(unlock_vault(ctx, scripted(script)) == VaultStatus::LOCKED);
        assert(!ctx.cipher.initialized());
    }
}
}  // namespace

int main()
{
    TempDir dir;
    if (!init_test_env(dir)) return 1;

    const std::string db = dir.file("vault.db");
    assert(migrate_schema(db) == VaultStatus::OK);
    // idempotent
    assert(migrate_schema(db) == VaultStatus::OK);

    test_first_run_setup(db);
    test_setup_mismatch_loops(dir);
    test_setup_counts_characters_not_bytes(dir);
    test_setup_input_closed(dir);
    test_verification(db);
    test_master_record_is_immutable(db);
    test_unlock_vault(db);
    return 0;
}
