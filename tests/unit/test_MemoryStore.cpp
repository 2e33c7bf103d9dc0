#include <gtest/gtest.h>

#include "support/TestEnv.hpp"
#include "db/MemoryStore.hpp"

using namespace fdx;
using namespace fdx::db;
using fdx::fs::model::Entry;

namespace {

identities::model::User makeUser(const std::string& name) {
    identities::model::User u;
    u.id = util::generateUUID();
    u.username = name;
    u.display_name = name;
    u.password_hash = "x";
    u.created_at = u.updated_at = util::now();
    return u;
}

Entry makeEntry(const std::string& author, const std::string& parent = Entry::ROOT_ID) {
    Entry e;
    e.id = util::generateUUID();
    e.name = "e";
    e.author_id = author;
    e.parent_id = parent;
    e.created_at = e.updated_at = util::now();
    return e;
}

audit::model::Transaction makeTxn(const std::string& entry, const std::string& actor) {
    audit::model::Transaction t;
    t.id = util::generateUUID();
    t.entry_id = entry;
    t.actor_id = actor;
    t.action = audit::model::Transaction::Action::Add;
    t.created_at = util::now();
    return t;
}

}

TEST(MemoryStoreTest, Exec_ReturnsResultAndCommits) {
    MemoryStore store;
    const auto user = makeUser("a");

    const auto id = store.exec("test", [&](Work& work) {
        work.insertUser(user);
        return user.id;
    });

    EXPECT_EQ(id, user.id);
    EXPECT_EQ(store.snapshot().users.size(), 1u);
}

TEST(MemoryStoreTest, Exec_RollsBackWhenWorkThrows) {
    MemoryStore store;
    const auto user = makeUser("a");

    EXPECT_THROW(store.exec("test", [&](Work& work) {
        work.insertUser(user);
        work.insertEntry(makeEntry(user.id));
        throw std::logic_error("abort");
    }), std::logic_error);

    const auto snap = store.snapshot();
    EXPECT_TRUE(snap.users.empty());
    EXPECT_TRUE(snap.entries.empty());
}

TEST(MemoryStoreTest, ForeignKeys_AreEnforced) {
    MemoryStore store;
    EXPECT_THROW(store.exec("test", [&](Work& work) { work.insertEntry(makeEntry("nobody")); }), std::runtime_error);

    const auto user = makeUser("a");
    store.exec("test", [&](Work& work) { work.insertUser(user); });
    EXPECT_THROW(store.exec("test", [&](Work& work) { work.insertTransaction(makeTxn("no-entry", user.id)); }),
                 std::runtime_error);
}

TEST(MemoryStoreTest, Usernames_AreUnique) {
    MemoryStore store;
    store.exec("test", [&](Work& work) { work.insertUser(makeUser("same")); });
    EXPECT_THROW(store.exec("test", [&](Work& work) { work.insertUser(makeUser("same")); }), std::runtime_error);
    EXPECT_EQ(store.snapshot().users.size(), 1u);
}

TEST(MemoryStoreTest, DeleteUser_Cascades) {
    MemoryStore store;
    const auto alice = makeUser("alice");
    const auto bob = makeUser("bob");
    const auto bobsEntry = makeEntry(bob.id);

    store.exec("seed", [&](Work& work) {
        work.insertUser(alice);
        work.insertUser(bob);
        const auto entry = makeEntry(alice.id);
        work.insertEntry(entry);
        work.insertEntry(bobsEntry);
        work.insertTransaction(makeTxn(entry.id, alice.id));
        work.insertTransaction(makeTxn(bobsEntry.id, alice.id));
        work.insertTransaction(makeTxn(bobsEntry.id, bob.id));

        auth::model::Session s;
        s.id = "s1";
        s.user_id = alice.id;
        s.created_at = util::now();
        s.valid_until = s.created_at + 60;
        work.insertSession(s);
    });

    store.exec("delete", [&](Work& work) { work.deleteUser(alice.id); });

    const auto snap = store.snapshot();
    EXPECT_EQ(snap.users.size(), 1u);
    ASSERT_EQ(snap.entries.size(), 1u);
    EXPECT_EQ(snap.entries.begin()->first, bobsEntry.id);
    ASSERT_EQ(snap.transactions.size(), 1u);
    EXPECT_EQ(snap.transactions.front().actor_id, bob.id);
    EXPECT_TRUE(snap.sessions.empty());
}

TEST(MemoryStoreTest, DeleteEntry_DropsItsTransactions) {
    MemoryStore store;
    const auto user = makeUser("a");
    const auto entry = makeEntry(user.id);

    store.exec("seed", [&](Work& work) {
        work.insertUser(user);
        work.insertEntry(entry);
        work.insertTransaction(makeTxn(entry.id, user.id));
    });
    store.exec("delete", [&](Work& work) { work.deleteEntry(entry.id); });

    EXPECT_TRUE(store.snapshot().transactions.empty());
    EXPECT_FALSE(store.exec("find", [&](Work& work) { return work.findEntry(entry.id); }).has_value());
}
