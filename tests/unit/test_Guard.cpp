#include <gtest/gtest.h>

#include "support/TestEnv.hpp"
#include "error/Error.hpp"
#include "fs/EntryManager.hpp"
#include "rbac/Guard.hpp"

using namespace fdx;
using namespace fdx::fs;
using namespace fdx::fs::model;
using namespace fdx::error;

class GuardTest : public ::testing::Test {
protected:
    test::MemoryEnv env;
    EntryManager& entries = *env.deps->entryManager;
    rbac::Guard& guard = *env.deps->guard;
    identities::model::User alice = env.addUser("alice");
    identities::model::User bob = env.addUser("bob");
    identities::model::User carol = env.addUser("carol");

    Entry entryWith(const rbac::EntryPermission permission, std::vector<std::string> members = {}) {
        const auto e = entries.addEntry("doc", Entry::Type::Directory, alice.id);
        EntryUpdate u;
        u.permission = permission;
        u.permission_inclusive = std::move(members);
        return entries.updateEntry(e.id, u, alice.id);
    }
};

TEST_F(GuardTest, AuthorPassesEvenOnPrivate) {
    const auto e = entryWith(rbac::EntryPermission::Private);
    EXPECT_EQ(guard.requireView(e.id, alice.id).id, e.id);
    EXPECT_EQ(guard.requireModify(e.id, alice.id).id, e.id);
    EXPECT_EQ(guard.requireAuthor(e.id, alice.id).id, e.id);
}

TEST_F(GuardTest, StrangerIsDeniedOnPrivate) {
    const auto e = entryWith(rbac::EntryPermission::Private);
    EXPECT_THROW(guard.requireView(e.id, bob.id), PermissionDenied);
    EXPECT_THROW(guard.requireModify(e.id, bob.id), PermissionDenied);
    EXPECT_THROW(guard.requireAuthor(e.id, bob.id), NotAuthor);
}

TEST_F(GuardTest, PublicIsReadableByAllButWritableByMembersOnly) {
    const auto e = entryWith(rbac::EntryPermission::Public, {bob.id});
    EXPECT_NO_THROW(guard.requireView(e.id, carol.id));
    EXPECT_THROW(guard.requireModify(e.id, carol.id), PermissionDenied);
    EXPECT_NO_THROW(guard.requireModify(e.id, bob.id));
}

TEST_F(GuardTest, InclusiveReadonlyLetsMembersViewOnly) {
    const auto e = entryWith(rbac::EntryPermission::InclusiveReadonly, {bob.id});
    EXPECT_NO_THROW(guard.requireView(e.id, bob.id));
    EXPECT_THROW(guard.requireModify(e.id, bob.id), PermissionDenied);
    EXPECT_THROW(guard.requireView(e.id, carol.id), PermissionDenied);
}

TEST_F(GuardTest, UnknownUserOrEntryPropagates) {
    const auto e = entryWith(rbac::EntryPermission::Public);
    EXPECT_THROW(guard.requireView(e.id, "ghost"), UserNotFound);
    EXPECT_THROW(guard.requireView("missing", bob.id), EntryNotFound);
}

TEST_F(GuardTest, RequireAuthorResolvesUserFirst) {
    const auto e = entryWith(rbac::EntryPermission::Private);
    EXPECT_THROW(guard.requireAuthor(e.id, "ghost"), UserNotFound);
    EXPECT_THROW(guard.requireModify(e.id, "ghost"), UserNotFound);
    EXPECT_THROW(guard.requireAuthor("missing", alice.id), EntryNotFound);
}

TEST_F(GuardTest, MembershipChangeIsSeenImmediately) {
    const auto e = entryWith(rbac::EntryPermission::Inclusive);
    EXPECT_THROW(guard.requireView(e.id, bob.id), PermissionDenied);

    EntryUpdate u;
    u.permission_inclusive = std::vector<std::string>{bob.id};
    (void) entries.updateEntry(e.id, u, alice.id);

    EXPECT_NO_THROW(guard.requireModify(e.id, bob.id));
}
