#include <gtest/gtest.h>

#include "support/TestEnv.hpp"
#include "db/Janitor.hpp"
#include "fs/EntryManager.hpp"
#include "auth/SessionManager.hpp"

#include <thread>

using namespace fdx;
using namespace std::chrono_literals;

namespace {

config::Config zeroRetentionConfig() {
    auto cfg = config::ConfigRegistry::get();
    cfg.auditing.trash_retention = std::chrono::days(0);
    return cfg;
}

}

class JanitorTest : public ::testing::Test {
protected:
    test::MemoryEnv env{zeroRetentionConfig()};
    identities::model::User user = env.addUser("jan");

    void seedExpiredSessionAndOldTrash() {
        auth::model::Session s;
        s.id = util::generateUUID();
        s.user_id = user.id;
        s.created_at = util::now() - 600;
        s.valid_until = util::now() - 60;

        fs::model::Entry e;
        e.id = util::generateUUID();
        e.name = "old";
        e.author_id = user.id;
        e.is_deleted = true;
        e.is_deleted_since = util::now() - 100;
        e.created_at = e.updated_at = util::now() - 200;

        env.deps->store->exec("test::seed", [&](db::Work& work) {
            work.insertSession(s);
            work.insertEntry(e);
        });
    }
};

TEST_F(JanitorTest, Sweep_PurgesExpiredSessionsAndOldTrash) {
    seedExpiredSessionAndOldTrash();
    const auto live = env.deps->entryManager->addEntry("keep", fs::model::Entry::Type::Directory, user.id);

    env.deps->janitor->sweep();

    const auto snap = env.store->snapshot();
    EXPECT_TRUE(snap.sessions.empty());
    ASSERT_EQ(snap.entries.size(), 1u);
    EXPECT_EQ(snap.entries.begin()->first, live.id);
    EXPECT_EQ(snap.tombstones.size(), 1u);
}

TEST_F(JanitorTest, Start_SweepsInBackgroundUntilStopped) {
    seedExpiredSessionAndOldTrash();
    auto& janitor = *env.deps->janitor;

    janitor.start();
    EXPECT_TRUE(janitor.isRunning());

    bool purged = false;
    for (int i = 0; i < 200 && !purged; ++i) {
        const auto snap = env.store->snapshot();
        purged = snap.sessions.empty() && snap.entries.empty();
        if (!purged) std::this_thread::sleep_for(10ms);
    }

    janitor.stop();
    EXPECT_TRUE(purged);
    EXPECT_FALSE(janitor.isRunning());
}

TEST_F(JanitorTest, Stop_DoesNotWaitOutTheSweepInterval) {
    seedExpiredSessionAndOldTrash();
    auto& janitor = *env.deps->janitor;
    ASSERT_GE(zeroRetentionConfig().auditing.sweep_interval, std::chrono::minutes(1));

    janitor.start();
    bool purged = false;
    for (int i = 0; i < 200 && !purged; ++i) {
        purged = env.store->snapshot().sessions.empty();
        if (!purged) std::this_thread::sleep_for(10ms);
    }
    ASSERT_TRUE(purged);

    const auto before = std::chrono::steady_clock::now();
    janitor.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - before, 2s);
    EXPECT_FALSE(janitor.isRunning());
}
