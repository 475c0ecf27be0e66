#include <gtest/gtest.h>

#include "../identity/identity_store.hpp"

TEST(IdentityStoreTest, AddAndGet) {
    IdentityStore store;
    ASSERT_EQ(store.add("alice", {1.0f, 0.0f}), StoreStatus::Ok);

    auto alice = store.get("alice");
    ASSERT_TRUE(alice.has_value());
    EXPECT_EQ(alice->name, "alice");
    EXPECT_EQ(alice->embedding, (std::vector<float>{1.0f, 0.0f}));
    EXPECT_TRUE(store.contains("alice"));
    EXPECT_FALSE(store.get("bob").has_value());
}

TEST(IdentityStoreTest, EmptyNameIsRejected) {
    IdentityStore store;
    EXPECT_EQ(store.add("", {1.0f}), StoreStatus::DuplicateOrInvalid);
    EXPECT_EQ(store.size(), 0u);
}

TEST(IdentityStoreTest, ListKeepsRegistrationOrder) {
    IdentityStore store;
    store.add("carol", {1.0f});
    store.add("alice", {2.0f});
    store.add("bob", {3.0f});

    auto infos = store.list();
    ASSERT_EQ(infos.size(), 3u);
    EXPECT_EQ(infos[0].name, "carol");
    EXPECT_EQ(infos[1].name, "alice");
    EXPECT_EQ(infos[2].name, "bob");
}

TEST(IdentityStoreTest, ReRegistrationReplacesAndMovesToEnd) {
    IdentityStore store;
    store.add("alice", {1.0f, 1.0f});
    store.add("bob", {2.0f});
    store.add("alice", {5.0f});

    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(store.get("alice")->embedding, (std::vector<float>{5.0f}));

    auto snapshot = store.snapshot();
    ASSERT_EQ(snapshot.size(), 2u);
    EXPECT_EQ(snapshot[0].name, "bob");
    EXPECT_EQ(snapshot[1].name, "alice");
}

TEST(IdentityStoreTest, RemoveUnknownNameIsNotFound) {
    IdentityStore store;
    store.add("alice", {1.0f});

    EXPECT_EQ(store.remove("bob"), StoreStatus::NotFound);
    EXPECT_EQ(store.remove("alice"), StoreStatus::Ok);
    EXPECT_TRUE(store.list().empty());
    EXPECT_EQ(store.remove("alice"), StoreStatus::NotFound);
}
