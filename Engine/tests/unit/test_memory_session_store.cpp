#include <gtest/gtest.h>
#include <storage/memory_session_store.hpp>
#include <core/errors.hpp>
#include "../test_events.hpp"

using namespace Sessionizer;
using namespace Sessionizer::Testing;

namespace {

SessionedEvent row(const std::string& user, const std::string& when, int64_t seq,
                   std::optional<Payload> payload = Payload{{"k", "v"}}) {
    SessionedEvent s;
    static_cast<Event&>(s) = ev(user, "a", "web", when);
    s.payload = std::move(payload);
    s.is_user_action = true;
    s.session_group_seq = seq;
    s.session_start_time = s.timestamp;
    s.session_id = user + "#web#" + when;
    s.pdate = TimeUtil::to_date(s.timestamp);
    return s;
}

RecomputationScope scope_of(std::vector<PartitionKey> keys, const std::string& context_start) {
    RecomputationScope scope;
    scope.keys = std::move(keys);
    scope.context_start = date(context_start);
    scope.rewrite_start = scope.context_start + Days(1);
    return scope;
}

} // namespace

TEST(MemorySessionStoreTest, MergeCountsInsertsUpdatesAndUnchanged) {
    MemorySessionStore store;
    auto scope = scope_of({{"u1", "web"}}, "2024-03-01");

    auto first = store.merge(scope, {row("u1", "2024-03-02 10:00:00", 1), row("u1", "2024-03-03 10:00:00", 2)});
    EXPECT_EQ(first.inserted, 2u);
    EXPECT_EQ(first.partitions, 2u);

    auto second = store.merge(scope, {row("u1", "2024-03-02 10:00:00", 1), row("u1", "2024-03-03 10:00:00", 7)});
    EXPECT_EQ(second.inserted, 0u);
    EXPECT_EQ(second.updated, 1u);
    EXPECT_EQ(second.unchanged, 1u);
    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(store.writes_to(date("2024-03-02")), 1u);
    EXPECT_EQ(store.writes_to(date("2024-03-03")), 2u);
}

TEST(MemorySessionStoreTest, MissingPayloadKeepsStoredPayload) {
    MemorySessionStore store;
    auto scope = scope_of({{"u1", "web"}}, "2024-03-01");
    store.merge(scope, {row("u1", "2024-03-02 10:00:00", 1)});

    auto stats = store.merge(scope, {row("u1", "2024-03-02 10:00:00", 1, std::nullopt)});
    EXPECT_EQ(stats.unchanged, 1u);

    auto rows = store.snapshot();
    ASSERT_EQ(rows.size(), 1u);
    ASSERT_TRUE(rows[0].payload.has_value());
    EXPECT_EQ(rows[0].payload->at(0).second, "v");
}

TEST(MemorySessionStoreTest, MergeKeepsRowsOutsideStagedPartitions) {
    MemorySessionStore store;
    store.bootstrap({
        row("u1", "2024-03-01 10:00:00", 1),
        row("u1", "2024-03-02 10:00:00", 2),
        row("u2", "2024-03-02 12:00:00", 1),
        row("u2", "2024-03-03 10:00:00", 2),
    });

    auto scope = scope_of({{"u1", "web"}}, "2024-03-01");
    auto stats = store.merge(scope, {row("u1", "2024-03-02 11:00:00", 2), row("u1", "2024-03-04 09:00:00", 3)});
    EXPECT_EQ(stats.inserted, 2u);
    EXPECT_EQ(stats.partitions, 2u);

    EXPECT_EQ(store.size(), 6u);
    EXPECT_EQ(store.partition_count(), 4u);
    EXPECT_EQ(store.timeline({"u1", "web"}).size(), 4u);
    EXPECT_EQ(store.timeline({"u2", "web"}).size(), 2u);
    EXPECT_EQ(store.writes_to(date("2024-03-01")), 1u);
    EXPECT_EQ(store.writes_to(date("2024-03-03")), 1u);
    EXPECT_EQ(store.writes_to(date("2024-03-02")), 2u);
}

TEST(MemorySessionStoreTest, LoadScopeReturnsContextRowsAndAnchors) {
    MemorySessionStore store;
    store.bootstrap({
        row("u1", "2024-02-20 10:00:00", 1),
        row("u1", "2024-02-28 10:00:00", 2),
        row("u1", "2024-03-02 10:00:00", 3),
        row("u2", "2024-03-02 10:00:00", 1),
        row("u3", "2024-02-01 10:00:00", 1),
    });

    auto slice = store.load_scope(scope_of({{"u1", "web"}, {"u3", "web"}}, "2024-03-01"));
    ASSERT_EQ(slice.rows.size(), 1u);
    EXPECT_EQ(slice.rows[0].session_group_seq, 3);

    ASSERT_EQ(slice.anchors.size(), 2u);
    EXPECT_EQ(slice.anchors[0].user_id, "u1");
    EXPECT_EQ(slice.anchors[0].timestamp, ts("2024-02-28 10:00:00"));
    EXPECT_EQ(slice.anchors[1].user_id, "u3");
}

TEST(MemorySessionStoreTest, ConflictLeavesStateUntouched) {
    MemorySessionStore store;
    auto scope = scope_of({{"u1", "web"}}, "2024-03-01");
    store.merge(scope, {row("u1", "2024-03-02 10:00:00", 1)});
    auto before = store.snapshot();

    store.simulate_conflict_on_next_merge();
    EXPECT_THROW(store.merge(scope, {row("u1", "2024-03-02 10:00:00", 9)}), MergeConflictError);
    EXPECT_EQ(store.snapshot(), before);

    EXPECT_NO_THROW(store.merge(scope, {row("u1", "2024-03-02 10:00:00", 9)}));
    EXPECT_EQ(store.snapshot()[0].session_group_seq, 9);
}

TEST(MemorySessionStoreTest, BootstrapReplacesEverything) {
    MemorySessionStore store;
    store.bootstrap({row("u1", "2024-03-02 10:00:00", 1), row("u2", "2024-03-03 10:00:00", 1)});
    auto stats = store.bootstrap({row("u9", "2024-03-05 10:00:00", 1)});

    EXPECT_EQ(stats.inserted, 1u);
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.partition_count(), 1u);
    EXPECT_EQ(store.timeline({"u9", "web"}).size(), 1u);
    EXPECT_TRUE(store.timeline({"u1", "web"}).empty());
}
