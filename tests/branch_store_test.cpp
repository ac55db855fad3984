#include "branch_store.hpp"
#include "test_utils.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace branch_eqs;
using namespace branch_eqs::test_utils;

TEST(BranchStoreTest, StartsWithOneSelfBoundBranch) {
    BranchStore store({ "x", "y" });
    EXPECT_EQ(store.count(), 1);
    EXPECT_EQ(store.current_index(), 0);
    EXPECT_FALSE(store.locked());

    std::vector<std::string> const expected = { "x", "y" };
    EXPECT_EQ(store.variables(), expected);
    EXPECT_TRUE(store.has_variable("x"));
    EXPECT_FALSE(store.has_variable("z"));
    EXPECT_EQ(store.get("x"), Expression(x));
    EXPECT_EQ(store.get("y"), Expression(y));
}

TEST(BranchStoreTest, AddVariables) {
    BranchStore store;
    EXPECT_TRUE(store.variables().empty());
    store.add_variables({ "x" });
    store.add_variables({ "y", "z" });
    EXPECT_EQ(store.variables().size(), 3);
    EXPECT_EQ(store.get("z"), Expression(z));

    EXPECT_THROW(store.add_variables({ "x" }), std::invalid_argument);
    EXPECT_THROW(BranchStore({ "a", "a" }), std::invalid_argument);

    store.create();
    EXPECT_TRUE(store.locked());
    EXPECT_THROW(store.add_variables({ "w" }), std::logic_error);
}

TEST(BranchStoreTest, CreateCopiesBindings) {
    BranchStore store({ "x", "y" });
    store.set("x", Expression(2.0));

    std::size_t const copy = store.create();
    EXPECT_EQ(copy, 1);
    EXPECT_EQ(store.count(), 2);
    EXPECT_EQ(store.get("x", copy), Expression(2.0));

    // Deep copy: writing one branch leaves the other alone
    store.set("y", Expression(5.0), copy);
    EXPECT_EQ(store.get("y", 0), Expression(y));
    EXPECT_EQ(store.get("y", copy), Expression(5.0));

    // Copy from an explicit branch
    std::size_t const third = store.create(copy);
    EXPECT_EQ(store.get("y", third), Expression(5.0));

    // Ids are distinct and stable
    EXPECT_NE(store.id_at(0), store.id_at(1));
    EXPECT_NE(store.id_at(1), store.id_at(2));
    EXPECT_EQ(store.index_of(store.id_at(2)), std::optional<std::size_t>(2));
}

TEST(BranchStoreTest, RemoveAdjustsCursor) {
    BranchStore store({ "x" });
    store.create();
    store.create();
    for (std::size_t i = 0; i < 3; ++i) { store.set("x", Expression(static_cast<double>(i)), i); }
    std::size_t const removed_id = store.id_at(0);

    // Removing a branch before the cursor keeps the same branch current
    store.set_current(2);
    store.remove(0);
    EXPECT_EQ(store.count(), 2);
    EXPECT_EQ(store.current_index(), 1);
    EXPECT_EQ(store.get("x"), Expression(2.0));
    EXPECT_FALSE(store.index_of(removed_id).has_value());

    // Removing the current last branch clamps the cursor
    store.remove(1);
    EXPECT_EQ(store.current_index(), 0);
    EXPECT_EQ(store.get("x"), Expression(1.0));

    // The last branch cannot go
    EXPECT_THROW(store.remove(0), std::logic_error);
    EXPECT_THROW(store.remove(3), std::out_of_range);
}

TEST(BranchStoreTest, RotateWrapsAround) {
    BranchStore store({ "x" });
    store.create();
    store.create();
    store.rotate();
    EXPECT_EQ(store.current_index(), 1);
    store.rotate();
    store.rotate();
    EXPECT_EQ(store.current_index(), 0);

    EXPECT_THROW(store.set_current(5), std::out_of_range);
}

TEST(BranchStoreTest, SetAllBranchesAndUniformity) {
    BranchStore store({ "x", "y" });
    store.create();
    EXPECT_TRUE(store.is_uniform("x"));

    store.set("x", Expression(1.0), 1);
    EXPECT_FALSE(store.is_uniform("x"));

    store.set_all_branches("x", Expression(4.0));
    EXPECT_TRUE(store.is_uniform("x"));
    EXPECT_EQ(store.get("x", 0), Expression(4.0));
    EXPECT_EQ(store.get("x", 1), Expression(4.0));

    std::vector<Bindings> const all = store.all_bindings();
    ASSERT_EQ(all.size(), 2);
    EXPECT_EQ(all[0].at("x"), Expression(4.0));
    EXPECT_EQ(all[1].at("y"), Expression(y));
}

TEST(BranchStoreTest, UnknownNamesAndIndices) {
    BranchStore store({ "x" });
    EXPECT_THROW((void)store.get("nope"), std::invalid_argument);
    EXPECT_THROW(store.set("nope", Expression(1.0)), std::invalid_argument);
    EXPECT_THROW(store.set_all_branches("nope", Expression(1.0)), std::invalid_argument);
    EXPECT_THROW((void)store.is_uniform("nope"), std::invalid_argument);
    EXPECT_THROW((void)store.get("x", 1), std::out_of_range);
    EXPECT_THROW((void)store.bindings(4), std::out_of_range);
    EXPECT_THROW(store.create(2), std::out_of_range);
}

TEST(BranchStoreTest, FingerprintFollowsContent) {
    BranchStore store({ "x", "y" });
    store.create();
    EXPECT_EQ(store.fingerprint(0), store.fingerprint(1));

    store.set("x", Expression(3.0), 1);
    EXPECT_NE(store.fingerprint(0), store.fingerprint(1));

    store.set("x", Expression(3.0), 0);
    EXPECT_EQ(store.fingerprint(0), store.fingerprint(1));
}
