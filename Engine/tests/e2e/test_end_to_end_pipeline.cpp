/**
 * @file test_end_to_end_pipeline.cpp
 * @brief Daily runs of the engine over in-memory batches and an in-memory cleaned layer
 */

#include <gtest/gtest.h>
#include <pipeline/session_engine.hpp>
#include <storage/memory_session_store.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include "../test_events.hpp"
#include <map>

using namespace Sessionizer;
using namespace Sessionizer::Testing;

namespace {

RunParams params_for(Date d, bool first_run = false, bool dry_run = false) {
    RunParams p;
    p.process_date = d;
    p.is_first_run = first_run;
    p.dry_run = dry_run;
    return p;
}

std::string at(Date d, int minute, int second = 0) {
    return TimeUtil::format_timestamp(TimeUtil::start_of(d) + std::chrono::minutes(minute) +
                                      std::chrono::seconds(second));
}

// Ten days of traffic for six users on two products, with a few late arrivals per day
std::map<Date, std::vector<Event>> generate_days(Date first, int days) {
    static const char* k_events[] = {"a", "b", "c", "view", "heartbeat"};
    std::map<Date, std::vector<Event>> out;

    for (int day = 0; day < days; ++day) {
        const Date d = first + Days(day);
        auto& batch = out[d];
        for (int user = 0; user < 6; ++user) {
            for (int k = 0; k < 12; ++k) {
                const int minute = (user * 37 + day * 11 + k * k * 13 + k * 53) % 1440;
                batch.push_back(ev("u" + std::to_string(user), k_events[(user + k) % 5],
                                   k % 3 ? "web" : "app", at(d, minute), {{"src", "gen"}}));
            }
        }
        if (day >= 3) {
            // Late events two days back, placed on odd seconds so they never collide with on-time ones
            const Date late = d - Days(2);
            batch.push_back(ev("u1", "a", "web", at(late, (day * 97) % 1440, 7), {{"src", "late"}}));
            batch.push_back(ev("u4", "view", "app", at(late, (day * 61) % 1440, 13), {{"src", "late"}}));
        }
        // An exact redelivery of an earlier row
        batch.push_back(batch.front());
    }
    return out;
}

class EnginePipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::set_level(Logger::Level::Warning);
    }

    void TearDown() override {
        Logger::set_level(Logger::Level::Info);
    }

    EngineConfig config;
    MemoryBatchSource source;
    MemorySessionStore store;
};

} // namespace

TEST_F(EnginePipelineTest, BootstrapSessionizesWholeBatch) {
    const Date d = date("2024-03-01");
    source.put(d, {
        ev("u1", "a", "web", "2024-03-01 10:00:00"),
        ev("u1", "b", "web", "2024-03-01 10:20:00"),
        ev("u1", "a", "web", "2024-03-01 11:05:00"),
        ev("u1", "a", "web", "2024-03-01 11:05:00"),
        ev("u2", "x", "app", "2024-03-01 09:00:00"),
    });

    SessionEngine engine(config, source, store);
    RunReport report = engine.run(params_for(d, true));

    EXPECT_TRUE(report.bootstrap);
    EXPECT_EQ(report.raw_rows, 5u);
    EXPECT_EQ(report.duplicates_collapsed, 1u);
    EXPECT_EQ(report.scope_keys, 2u);
    EXPECT_EQ(report.rows_recomputed, 4u);
    EXPECT_EQ(report.sessions_started, 3u);
    EXPECT_EQ(report.merge.inserted, 4u);

    auto u1 = store.timeline({"u1", "web"});
    EXPECT_EQ(seqs(u1), (std::vector<int64_t>{1, 1, 2}));
    EXPECT_EQ(u1[2].session_id, "u1#web#2024-03-01 11:05:00");
    EXPECT_FALSE(store.timeline({"u2", "app"})[0].is_user_action);
}

TEST_F(EnginePipelineTest, RerunIsIdempotent) {
    const Date d1 = date("2024-03-01");
    const Date d2 = date("2024-03-02");
    source.put(d1, {ev("u1", "a", "web", "2024-03-01 23:50:00")});
    source.put(d2, {ev("u1", "b", "web", "2024-03-02 00:10:00"), ev("u1", "a", "web", "2024-03-02 08:00:00")});

    SessionEngine engine(config, source, store);
    engine.run(params_for(d1, true));
    engine.run(params_for(d2));
    auto after_first = store.snapshot();

    RunReport again = engine.run(params_for(d2));
    EXPECT_EQ(store.snapshot(), after_first);
    EXPECT_EQ(again.merge.inserted, 0u);
    EXPECT_EQ(again.merge.updated, 0u);
    EXPECT_EQ(again.merge.unchanged, again.merge.staged);
}

TEST_F(EnginePipelineTest, SessionContinuesAcrossMidnightAndRuns) {
    const Date d1 = date("2024-03-01");
    const Date d2 = date("2024-03-02");
    source.put(d1, {ev("u1", "a", "web", "2024-03-01 23:45:00")});
    source.put(d2, {ev("u1", "a", "web", "2024-03-02 00:15:00"), ev("u1", "a", "web", "2024-03-02 00:45:00.000001")});

    SessionEngine engine(config, source, store);
    engine.run(params_for(d1, true));
    engine.run(params_for(d2));

    auto rows = store.timeline({"u1", "web"});
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(new_flags(rows), (std::vector<bool>{true, false, true}));
    EXPECT_EQ(seqs(rows), (std::vector<int64_t>{1, 1, 2}));
    EXPECT_EQ(rows[1].pdate, d2);
    EXPECT_EQ(rows[1].session_start_time, ts("2024-03-01 23:45:00"));
    EXPECT_EQ(rows[1].session_id, rows[0].session_id);
    EXPECT_EQ(rows[1].time_diff, Duration(std::chrono::minutes(30)));
}

TEST_F(EnginePipelineTest, LateArrivalMergesSessions) {
    const Date d1 = date("2024-03-01");
    const Date d2 = date("2024-03-02");
    source.put(d1, {ev("u1", "a", "web", "2024-03-01 10:00:00"), ev("u1", "a", "web", "2024-03-01 11:00:00")});
    source.put(d2, {ev("u1", "b", "web", "2024-03-01 10:30:00"), ev("u1", "a", "web", "2024-03-02 09:00:00")});

    SessionEngine engine(config, source, store);
    engine.run(params_for(d1, true));
    EXPECT_EQ(seqs(store.timeline({"u1", "web"})), (std::vector<int64_t>{1, 2}));

    RunReport report = engine.run(params_for(d2));
    EXPECT_EQ(report.merge.inserted, 2u);
    EXPECT_EQ(report.merge.updated, 1u);
    EXPECT_EQ(report.merge.unchanged, 1u);

    auto rows = store.timeline({"u1", "web"});
    ASSERT_EQ(rows.size(), 4u);
    EXPECT_EQ(seqs(rows), (std::vector<int64_t>{1, 1, 1, 2}));
    EXPECT_EQ(rows[2].session_id, "u1#web#2024-03-01 10:00:00");
    EXPECT_FALSE(rows[2].is_new_session);
}

TEST_F(EnginePipelineTest, LateArrivalMovesPersistedSessionStartEarlier) {
    const Date d1 = date("2024-03-01");
    const Date d2 = date("2024-03-02");
    source.put(d1, {ev("u1", "a", "web", "2024-03-01 10:00:00"), ev("u1", "b", "web", "2024-03-01 10:20:00")});
    source.put(d2, {ev("u1", "c", "web", "2024-03-01 09:45:00"), ev("u1", "a", "web", "2024-03-02 09:00:00")});

    SessionEngine engine(config, source, store);
    engine.run(params_for(d1, true));
    ASSERT_EQ(store.timeline({"u1", "web"})[1].session_id, "u1#web#2024-03-01 10:00:00");

    RunReport report = engine.run(params_for(d2));
    EXPECT_EQ(report.merge.inserted, 2u);
    EXPECT_EQ(report.merge.updated, 2u);

    auto rows = store.timeline({"u1", "web"});
    ASSERT_EQ(rows.size(), 4u);
    EXPECT_EQ(seqs(rows), (std::vector<int64_t>{1, 1, 1, 2}));
    for (size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(rows[i].session_id, "u1#web#2024-03-01 09:45:00") << "row " << i;
        EXPECT_EQ(rows[i].session_start_time, ts("2024-03-01 09:45:00")) << "row " << i;
    }
    EXPECT_TRUE(rows[0].is_new_session);
    EXPECT_FALSE(rows[1].is_new_session);
    ASSERT_TRUE(rows[1].time_diff.has_value());
    EXPECT_EQ(*rows[1].time_diff, Duration(std::chrono::minutes(15)));

    // Same layer as sessionizing everything in one bootstrap
    MemoryBatchSource full_source;
    std::vector<Event> all = source.read(d1).events;
    for (const auto& e : source.read(d2).events) all.push_back(e);
    full_source.put(d2, all);
    MemorySessionStore full_store;
    SessionEngine(config, full_source, full_store).run(params_for(d2, true));
    EXPECT_EQ(store.snapshot(), full_store.snapshot());
}

TEST_F(EnginePipelineTest, RunTouchesOnlyKeysInBatch) {
    const Date d1 = date("2024-03-01");
    const Date d2 = date("2024-03-02");
    source.put(d1, {ev("u1", "a", "web", "2024-03-01 10:00:00"), ev("u2", "a", "web", "2024-03-01 10:00:00")});
    source.put(d2, {ev("u2", "a", "web", "2024-03-02 10:00:00")});

    SessionEngine engine(config, source, store);
    engine.run(params_for(d1, true));
    auto u1_before = store.timeline({"u1", "web"});

    RunReport report = engine.run(params_for(d2));
    EXPECT_EQ(report.scope_keys, 1u);
    EXPECT_EQ(report.merge.staged, 2u);
    EXPECT_EQ(report.merge.inserted, 1u);
    EXPECT_EQ(store.timeline({"u1", "web"}), u1_before);
    EXPECT_EQ(store.writes_to(d1), 1u);
}

TEST_F(EnginePipelineTest, IncrementalRunsMatchFullRecomputation) {
    const Date first = date("2024-03-01");
    const int days = 10;
    auto batches = generate_days(first, days);

    for (const auto& [d, events] : batches) source.put(d, events);
    SessionEngine engine(config, source, store);
    for (const auto& [d, events] : batches) {
        engine.run(params_for(d, d == first));
    }

    std::vector<Event> all;
    for (const auto& [d, events] : batches) all.insert(all.end(), events.begin(), events.end());
    const Date last = first + Days(days - 1);

    MemoryBatchSource full_source;
    full_source.put(last, all);
    MemorySessionStore full_store;
    SessionEngine(config, full_source, full_store).run(params_for(last, true));

    auto incremental = store.snapshot();
    auto full = full_store.snapshot();
    ASSERT_EQ(incremental.size(), full.size());
    for (size_t i = 0; i < full.size(); ++i) {
        EXPECT_EQ(incremental[i], full[i]) << "row " << i << " " << incremental[i].user_id << " "
                                           << TimeUtil::format_timestamp(incremental[i].timestamp);
    }
}

TEST_F(EnginePipelineTest, OutputDoesNotDependOnThreadCount) {
    const Date first = date("2024-03-01");
    auto batches = generate_days(first, 4);
    for (const auto& [d, events] : batches) source.put(d, events);

    EngineConfig single = config;
    single.threads = 1;
    EngineConfig many = config;
    many.threads = 8;

    MemorySessionStore other;
    SessionEngine a(single, source, store);
    SessionEngine b(many, source, other);
    for (const auto& [d, events] : batches) {
        a.run(params_for(d, d == first));
        b.run(params_for(d, d == first));
    }
    EXPECT_EQ(store.snapshot(), other.snapshot());
}

TEST_F(EnginePipelineTest, MergeConflictLeavesLayerUnchanged) {
    const Date d1 = date("2024-03-01");
    const Date d2 = date("2024-03-02");
    source.put(d1, {ev("u1", "a", "web", "2024-03-01 10:00:00")});
    source.put(d2, {ev("u1", "a", "web", "2024-03-01 10:20:00")});

    SessionEngine engine(config, source, store);
    engine.run(params_for(d1, true));
    auto before = store.snapshot();

    store.simulate_conflict_on_next_merge();
    EXPECT_THROW(engine.run(params_for(d2)), MergeConflictError);
    EXPECT_EQ(store.snapshot(), before);

    // The orchestrator retries the same date
    engine.run(params_for(d2));
    EXPECT_EQ(store.size(), 2u);
}

TEST_F(EnginePipelineTest, LookbackBeyondRetentionFailsWithoutWriting) {
    const Date d1 = date("2024-03-01");
    const Date d2 = date("2024-03-20");
    source.put(d1, {ev("u1", "a", "web", "2024-03-01 10:00:00")});
    source.put(d2, {ev("u1", "a", "web", "2024-03-02 10:00:00"), ev("u2", "a", "web", "2024-03-20 10:00:00")});

    SessionEngine engine(config, source, store);
    engine.run(params_for(d1, true));
    auto before = store.snapshot();

    EXPECT_THROW(engine.run(params_for(d2)), ScopeResolutionError);
    EXPECT_EQ(store.snapshot(), before);
}

TEST_F(EnginePipelineTest, DryRunWritesNothing) {
    const Date d = date("2024-03-01");
    source.put(d, {ev("u1", "a", "web", "2024-03-01 10:00:00")});

    SessionEngine engine(config, source, store);
    RunReport report = engine.run(params_for(d, true, true));

    EXPECT_EQ(report.rows_recomputed, 1u);
    EXPECT_EQ(report.merge.staged, 0u);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(EnginePipelineTest, ConflictingPayloadsFollowSchemaPolicy) {
    const Date d = date("2024-03-01");
    source.put(d, {
        ev("u1", "a", "web", "2024-03-01 10:00:00", {{"k", "1"}}),
        ev("u1", "a", "web", "2024-03-01 10:00:00", {{"k", "2"}}),
        ev("u1", "b", "web", "2024-03-01 10:05:00", {{"k", "1"}}),
    });

    config.schema_policy = SchemaPolicy::RejectBatch;
    EXPECT_THROW(SessionEngine(config, source, store).run(params_for(d, true)), SchemaViolationError);
    EXPECT_EQ(store.size(), 0u);

    config.schema_policy = SchemaPolicy::RejectRows;
    RunReport report = SessionEngine(config, source, store).run(params_for(d, true));
    EXPECT_EQ(report.conflicts_rejected, 2u);
    ASSERT_EQ(store.size(), 1u);
    EXPECT_EQ(store.snapshot()[0].event_id, "b");
}

TEST_F(EnginePipelineTest, EmptyBatchIsNoOp) {
    const Date d1 = date("2024-03-01");
    source.put(d1, {ev("u1", "a", "web", "2024-03-01 10:00:00")});

    SessionEngine engine(config, source, store);
    engine.run(params_for(d1, true));

    RunReport report = engine.run(params_for(date("2024-03-02")));
    EXPECT_EQ(report.scope_keys, 0u);
    EXPECT_EQ(report.merge.staged, 0u);
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(EnginePipelineTest, InvalidConfigFailsBeforeReading) {
    config.extended_lookback_days = config.lookback_days;
    SessionEngine engine(config, source, store);
    EXPECT_THROW(engine.run(params_for(date("2024-03-01"))), ConfigError);
}
