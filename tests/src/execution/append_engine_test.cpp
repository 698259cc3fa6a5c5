#include <gtest/gtest.h>
#include <chronicle/execution/append_engine.hpp>
#include <chronicle/execution/verification_engine.hpp>
#include <chronicle/testing/chain_helpers.hpp>
#include <chronicle/testing/store_fixture.hpp>

#include <set>
#include <thread>
#include <vector>

namespace {

using namespace chronicle::schema;
using chronicle::execution::append_engine;
using chronicle::execution::retry_policy;
using chronicle::execution::verification_engine;

class append_engine_test : public chronicle::testing::store_fixture {};

TEST_F(append_engine_test, entries_link_from_genesis) {
  auto engine = append_engine{storage(), retry_policy{},
                              chronicle::testing::make_step_clock()};

  auto first = engine.append(
      "tenant-a", chronicle::testing::make_event("alice", "create",
                                                 {{"title", "draft"}}));
  auto second = engine.append(
      "tenant-a", chronicle::testing::make_event("bob", "update", {{"x", 1}}));
  auto third = engine.append(
      "tenant-a", chronicle::testing::make_event("alice", "delete"));
  ASSERT_TRUE(first.ok()) << first.log;
  ASSERT_TRUE(second.ok()) << second.log;
  ASSERT_TRUE(third.ok()) << third.log;

  EXPECT_EQ(first.entry->sequence, 0u);
  EXPECT_EQ(first.entry->previous_hash, kGenesisSentinel);
  EXPECT_EQ(second.entry->sequence, 1u);
  EXPECT_EQ(second.entry->previous_hash, first.entry->entry_hash);
  EXPECT_EQ(third.entry->sequence, 2u);
  EXPECT_EQ(third.entry->previous_hash, second.entry->entry_hash);
  EXPECT_EQ(first.attempts, 1u);

  EXPECT_EQ(first.entry->timestamp, chronicle::testing::kEpoch);
  EXPECT_EQ(second.entry->timestamp, chronicle::testing::kEpoch + 1'000'000);
  EXPECT_EQ(first.entry->payload, R"({"title":"draft"})");

  EXPECT_EQ(stored_entry("tenant-a", 1), *second.entry);

  auto verdict = verification_engine{storage()}.verify("tenant-a");
  EXPECT_TRUE(verdict.valid());
  EXPECT_EQ(verdict.covered, (sequence_range{0, 2}));
  EXPECT_EQ(verdict.tip_hash, third.entry->entry_hash);
}

TEST_F(append_engine_test, chains_are_independent) {
  auto engine = append_engine{storage()};
  chronicle::testing::append_events(engine, "tenant-a", 3);
  auto other = engine.append(
      "tenant-b", chronicle::testing::make_event("carol", "create"));
  ASSERT_TRUE(other.ok());
  EXPECT_EQ(other.entry->sequence, 0u);
  EXPECT_EQ(other.entry->previous_hash, kGenesisSentinel);
}

TEST_F(append_engine_test, caller_timestamp_is_kept) {
  auto engine = append_engine{storage()};
  auto event = chronicle::testing::make_event("alice", "create");
  event.timestamp = chronicle::testing::kEpoch + 42;
  auto result = engine.append("tenant-a", event);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.entry->timestamp, chronicle::testing::kEpoch + 42);
}

TEST_F(append_engine_test, unencodable_payload_leaves_chain_unchanged) {
  auto engine = append_engine{storage()};
  auto result = engine.append(
      "tenant-a", chronicle::testing::make_event("alice", "update",
                                                 {{"ratio", 0.25}}));
  EXPECT_EQ(result.code, error_code::serialization_error);
  EXPECT_FALSE(result.entry.has_value());

  auto bad_text = chronicle::testing::make_event("alice", "update");
  bad_text.resource_id = "doc-\xff";
  EXPECT_EQ(engine.append("tenant-a", bad_text).code,
            error_code::serialization_error);

  auto head = storage().get_head("tenant-a");
  ASSERT_TRUE(head.ok());
  EXPECT_FALSE(head.value.has_value());
}

TEST_F(append_engine_test, empty_chain_id_is_rejected) {
  auto engine = append_engine{storage()};
  auto result =
      engine.append("", chronicle::testing::make_event("alice", "create"));
  EXPECT_EQ(result.code, error_code::invalid_argument);
}

TEST_F(append_engine_test, concurrent_appends_never_fork) {
  auto engine = append_engine{storage()};
  constexpr auto kThreads = 8;
  constexpr auto kPerThread = 25;

  auto threads = std::vector<std::thread>{};
  for (auto t = 0; t < kThreads; ++t) {
    threads.emplace_back([&engine, t] {
      for (auto i = 0; i < kPerThread; ++i) {
        auto result = engine.append(
            "tenant-a", chronicle::testing::make_event(
                            "writer-" + std::to_string(t), "update",
                            {{"i", i}}));
        EXPECT_TRUE(result.ok()) << result.log;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  auto head = storage().get_head("tenant-a");
  ASSERT_TRUE(head.value.has_value());
  EXPECT_EQ(head.value->sequence, sequence_t{kThreads * kPerThread - 1});

  auto verdict = verification_engine{storage()}.verify("tenant-a");
  EXPECT_TRUE(verdict.valid()) << verdict.detail;
  EXPECT_EQ(verdict.entries_checked, uint64_t{kThreads * kPerThread});
}

TEST_F(append_engine_test, separate_engines_resolve_conflicts_by_retry) {
  auto policy = retry_policy{64, std::chrono::milliseconds{1},
                             std::chrono::milliseconds{4}};
  auto left = append_engine{storage(), policy};
  auto right = append_engine{storage(), policy};
  constexpr auto kPerEngine = 40;

  auto run = [](append_engine& engine, const std::string& actor) {
    for (auto i = 0; i < kPerEngine; ++i) {
      auto result = engine.append(
          "tenant-a", chronicle::testing::make_event(actor, "update",
                                                     {{"i", i}}));
      EXPECT_TRUE(result.ok()) << result.log;
    }
  };
  auto first = std::thread{[&] { run(left, "left"); }};
  auto second = std::thread{[&] { run(right, "right"); }};
  first.join();
  second.join();

  auto sequences = std::set<sequence_t>{};
  auto outcome = storage().for_each_in_range(
      "tenant-a", 0, chronicle::storage::kOpenEnded,
      [&](const audit_entry_t& entry) {
        sequences.insert(entry.sequence);
        return true;
      });
  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(sequences.size(), std::size_t{2 * kPerEngine});
  EXPECT_TRUE(verification_engine{storage()}.verify("tenant-a").valid());
}

TEST_F(append_engine_test, persistent_conflict_exhausts_retries) {
  auto engine = append_engine{
      storage(), retry_policy{3, std::chrono::milliseconds{1},
                              std::chrono::milliseconds{1}}};
  auto entries = chronicle::testing::append_events(engine, "tenant-a", 2);
  ASSERT_EQ(entries.size(), 2u);

  // An entry at head + 1 that the head pointer never learned about.
  auto orphan = entries.back();
  orphan.sequence = 2;
  overwrite_entry(orphan);

  auto result = engine.append(
      "tenant-a", chronicle::testing::make_event("alice", "update"));
  EXPECT_EQ(result.code, error_code::concurrent_append_conflict);
  EXPECT_EQ(result.attempts, 3u);
  EXPECT_FALSE(result.entry.has_value());
}

TEST_F(append_engine_test, zero_attempt_policy_still_tries_once) {
  auto engine = append_engine{storage(), retry_policy{0}};
  EXPECT_EQ(engine.policy().max_attempts, 1u);
  EXPECT_TRUE(engine
                  .append("tenant-a",
                          chronicle::testing::make_event("alice", "create"))
                  .ok());
}

}  // namespace
