#include <gtest/gtest.h>

#include "fs/model/Entry.hpp"
#include "rbac/Evaluator.hpp"
#include "rbac/Permission.hpp"

using namespace fdx::rbac;
using namespace fdx::fs::model;

namespace {

struct MatrixRow {
    EntryPermission permission;
    bool member;
    bool canView;
    bool canModify;
};

const MatrixRow kMatrix[] = {
    {EntryPermission::Private,           false, false, false},
    {EntryPermission::Private,           true,  false, false},
    {EntryPermission::Public,            false, true,  false},
    {EntryPermission::Public,            true,  true,  true},
    {EntryPermission::PublicReadonly,    false, true,  false},
    {EntryPermission::PublicReadonly,    true,  true,  false},
    {EntryPermission::Inclusive,         false, false, false},
    {EntryPermission::Inclusive,         true,  true,  true},
    {EntryPermission::InclusiveReadonly, false, false, false},
    {EntryPermission::InclusiveReadonly, true,  true,  false},
    {EntryPermission::Other,             false, false, false},
    {EntryPermission::Other,             true,  false, false},
};

}

class PermissionMatrixTest : public ::testing::TestWithParam<MatrixRow> {};

TEST_P(PermissionMatrixTest, MatchesTable) {
    const auto& row = GetParam();

    Entry e;
    e.author_id = "author";
    e.permission = row.permission;
    e.permission_inclusive = {"someone-else"};
    if (row.member) e.permission_inclusive.push_back("user");

    EXPECT_EQ(Evaluator::canView(e, "user"), row.canView) << to_string(row.permission) << " member=" << row.member;
    EXPECT_EQ(Evaluator::canModify(e, "user"), row.canModify) << to_string(row.permission) << " member=" << row.member;
}

INSTANTIATE_TEST_SUITE_P(AllModes, PermissionMatrixTest, ::testing::ValuesIn(kMatrix));

TEST(PermissionTest, AuthorIsNotSpecialToEvaluator) {
    Entry e;
    e.author_id = "author";
    e.permission = EntryPermission::Private;
    EXPECT_FALSE(Evaluator::canView(e, "author"));
    EXPECT_FALSE(Evaluator::canModify(e, "author"));
}

TEST(PermissionTest, StringRoundTripUsesSnakeCase) {
    EXPECT_EQ(to_string(EntryPermission::PublicReadonly), "public_readonly");
    EXPECT_EQ(entryPermissionFromString("inclusive_readonly"), EntryPermission::InclusiveReadonly);
    EXPECT_THROW(entryPermissionFromString("world_writable"), std::invalid_argument);
}
