#include <gtest/gtest.h>
#include <chronicle/crypto/merkle.hpp>
#include <chronicle/execution/append_engine.hpp>
#include <chronicle/execution/checkpoint_exporter.hpp>
#include <chronicle/execution/checkpoint_manager.hpp>
#include <chronicle/execution/verification_engine.hpp>
#include <chronicle/testing/chain_helpers.hpp>
#include <chronicle/testing/store_fixture.hpp>

#include <fstream>
#include <limits>
#include <string>
#include <vector>

namespace {

using namespace chronicle::schema;
using chronicle::execution::append_engine;
using chronicle::execution::checkpoint_manager;
using chronicle::execution::checkpoint_policy;

/// Exporter whose availability the test switches.
class switchable_exporter final
    : public chronicle::execution::checkpoint_exporter {
 public:
  bool export_checkpoint(const checkpoint_t& value,
                         std::string& error) override {
    if (!available) {
      error = "witness unreachable";
      return false;
    }
    delivered.push_back(value);
    return true;
  }

  std::string destination() const override { return "memory:test"; }

  bool available{true};
  std::vector<checkpoint_t> delivered;
};

class checkpoint_manager_test : public chronicle::testing::store_fixture {
 protected:
  void SetUp() override {
    chronicle::testing::store_fixture::SetUp();
    engine_.emplace(storage());
  }

  void TearDown() override {
    engine_.reset();
    chronicle::testing::store_fixture::TearDown();
  }

  std::vector<audit_entry_t> append(const std::size_t count) {
    return chronicle::testing::append_events(*engine_, "tenant-a", count);
  }

  static std::vector<hash32_t> entry_hashes(
      const std::vector<audit_entry_t>& entries) {
    auto hashes = std::vector<hash32_t>{};
    for (const auto& entry : entries) {
      hashes.push_back(entry.entry_hash);
    }
    return hashes;
  }

  std::optional<append_engine> engine_;
  switchable_exporter exporter_;
  chronicle::testing::manual_clock clock_;
};

TEST_F(checkpoint_manager_test, witnesses_current_head) {
  auto entries = append(3);
  auto manager = checkpoint_manager{storage(), exporter_, checkpoint_policy{},
                                    clock_.source()};

  auto result = manager.checkpoint("tenant-a");
  ASSERT_EQ(result.code, error_code::ok) << result.log;
  EXPECT_TRUE(result.created);
  ASSERT_TRUE(result.checkpoint.has_value());
  EXPECT_EQ(result.checkpoint->sequence, 2u);
  EXPECT_EQ(result.checkpoint->root_hash, entries[2].entry_hash);
  EXPECT_EQ(result.checkpoint->created_at, chronicle::testing::kEpoch);
  EXPECT_TRUE(result.checkpoint->exported);
  EXPECT_EQ(result.checkpoint->export_destination, "memory:test");
  EXPECT_EQ(result.checkpoint->export_attempts, 1u);

  ASSERT_EQ(exporter_.delivered.size(), 1u);
  auto listed = manager.list_checkpoints("tenant-a");
  ASSERT_TRUE(listed.ok());
  ASSERT_EQ(listed.value.size(), 1u);
  EXPECT_TRUE(listed.value[0].exported);
}

TEST_F(checkpoint_manager_test, merkle_root_extends_across_checkpoints) {
  auto entries = append(3);
  auto manager = checkpoint_manager{storage(), exporter_, checkpoint_policy{},
                                    clock_.source()};
  auto first = manager.checkpoint("tenant-a");
  ASSERT_TRUE(first.ok()) << first.log;
  EXPECT_EQ(first.checkpoint->merkle_root,
            chronicle::crypto::merkle_root(entry_hashes(entries)));
  EXPECT_EQ(first.checkpoint->merkle_peaks.size(), 2u);

  auto more = append(4);
  entries.insert(entries.end(), more.begin(), more.end());
  auto second = manager.checkpoint("tenant-a");
  ASSERT_TRUE(second.ok()) << second.log;
  EXPECT_EQ(second.checkpoint->sequence, 6u);
  EXPECT_EQ(second.checkpoint->merkle_root,
            chronicle::crypto::merkle_root(entry_hashes(entries)));
  EXPECT_EQ(exporter_.delivered.back().merkle_root,
            second.checkpoint->merkle_root);
}

TEST_F(checkpoint_manager_test, forged_merkle_state_is_refused) {
  append(3);
  auto manager = checkpoint_manager{storage(), exporter_, checkpoint_policy{},
                                    clock_.source()};
  auto first = manager.checkpoint("tenant-a");
  ASSERT_TRUE(first.ok()) << first.log;

  auto forged = *first.checkpoint;
  forged.merkle_peaks[0] = chronicle::testing::make_hash(9);
  auto encoder = chronicle::schema::encoding::scale_encoder_t{};
  write_raw(key::make_checkpoint_key("tenant-a", forged.sequence),
            encoder.encode(forged));

  append(2);
  auto second = manager.checkpoint("tenant-a");
  EXPECT_EQ(second.code, error_code::chain_integrity_error);
  EXPECT_FALSE(second.created);
  EXPECT_EQ(exporter_.delivered.size(), 1u);
}

TEST_F(checkpoint_manager_test, unchanged_head_reuses_checkpoint) {
  append(2);
  auto manager = checkpoint_manager{storage(), exporter_, checkpoint_policy{},
                                    clock_.source()};
  auto first = manager.checkpoint("tenant-a");
  auto second = manager.checkpoint("tenant-a");
  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(second.ok());
  EXPECT_TRUE(first.created);
  EXPECT_FALSE(second.created);
  EXPECT_EQ(second.checkpoint->sequence, first.checkpoint->sequence);
  EXPECT_EQ(exporter_.delivered.size(), 1u);

  append(1);
  auto third = manager.checkpoint("tenant-a");
  ASSERT_TRUE(third.ok());
  EXPECT_TRUE(third.created);
  EXPECT_EQ(third.checkpoint->sequence, 2u);
}

TEST_F(checkpoint_manager_test, failed_export_is_kept_and_retried) {
  append(2);
  auto manager = checkpoint_manager{storage(), exporter_, checkpoint_policy{},
                                    clock_.source()};

  exporter_.available = false;
  auto failed = manager.checkpoint("tenant-a");
  EXPECT_EQ(failed.code, error_code::checkpoint_export_failure);
  EXPECT_EQ(failed.log, "witness unreachable");
  ASSERT_TRUE(failed.checkpoint.has_value());
  EXPECT_FALSE(failed.checkpoint->exported);

  auto pending = manager.list_checkpoints("tenant-a");
  ASSERT_EQ(pending.value.size(), 1u);
  EXPECT_FALSE(pending.value[0].exported);
  EXPECT_EQ(pending.value[0].export_attempts, 1u);

  exporter_.available = true;
  auto retried = manager.checkpoint("tenant-a");
  EXPECT_EQ(retried.code, error_code::ok) << retried.log;
  EXPECT_EQ(retried.retried_exports, 1u);
  EXPECT_FALSE(retried.created);
  ASSERT_TRUE(retried.checkpoint.has_value());
  EXPECT_TRUE(retried.checkpoint->exported);
  EXPECT_EQ(retried.checkpoint->export_attempts, 2u);
  EXPECT_EQ(exporter_.delivered.size(), 1u);
}

TEST_F(checkpoint_manager_test, long_pending_export_is_reported_stale) {
  append(1);
  auto manager = checkpoint_manager{
      storage(), exporter_,
      checkpoint_policy{1000, std::chrono::seconds{60}}, clock_.source()};

  exporter_.available = false;
  auto first = manager.checkpoint("tenant-a");
  EXPECT_EQ(first.code, error_code::checkpoint_export_failure);
  EXPECT_TRUE(first.stale.empty());

  clock_.advance(std::chrono::minutes{2});
  auto later = manager.checkpoint_if_due("tenant-a");
  EXPECT_EQ(later.code, error_code::checkpoint_export_failure);
  ASSERT_EQ(later.stale.size(), 1u);
  EXPECT_EQ(later.stale[0].sequence, 0u);
}

TEST_F(checkpoint_manager_test, due_only_after_interval) {
  auto manager = checkpoint_manager{storage(), exporter_,
                                    checkpoint_policy{5}, clock_.source()};

  append(4);
  auto early = manager.checkpoint_if_due("tenant-a");
  EXPECT_TRUE(early.ok());
  EXPECT_FALSE(early.created);
  EXPECT_FALSE(early.checkpoint.has_value());

  append(1);
  auto due = manager.checkpoint_if_due("tenant-a");
  ASSERT_TRUE(due.ok()) << due.log;
  EXPECT_TRUE(due.created);
  EXPECT_EQ(due.checkpoint->sequence, 4u);

  append(4);
  auto not_yet = manager.checkpoint_if_due("tenant-a");
  EXPECT_FALSE(not_yet.created);
  EXPECT_EQ(not_yet.checkpoint->sequence, 4u);

  append(1);
  auto next = manager.checkpoint_if_due("tenant-a");
  EXPECT_TRUE(next.created);
  EXPECT_EQ(next.checkpoint->sequence, 9u);
}

TEST_F(checkpoint_manager_test, widest_interval_is_never_due_again) {
  auto manager = checkpoint_manager{
      storage(), exporter_,
      checkpoint_policy{std::numeric_limits<uint64_t>::max()},
      clock_.source()};

  append(3);
  EXPECT_FALSE(manager.checkpoint_if_due("tenant-a").created);
  auto explicit_checkpoint = manager.checkpoint("tenant-a");
  ASSERT_TRUE(explicit_checkpoint.created) << explicit_checkpoint.log;
  EXPECT_EQ(explicit_checkpoint.checkpoint->sequence, 2u);

  append(2);
  auto later = manager.checkpoint_if_due("tenant-a");
  EXPECT_TRUE(later.ok()) << later.log;
  EXPECT_FALSE(later.created);
  EXPECT_EQ(later.checkpoint->sequence, 2u);
  EXPECT_EQ(exporter_.delivered.size(), 1u);
}

TEST_F(checkpoint_manager_test, empty_chain_cannot_be_witnessed) {
  auto manager = checkpoint_manager{storage(), exporter_};
  EXPECT_EQ(manager.checkpoint("tenant-a").code, error_code::chain_empty);
  EXPECT_EQ(manager.checkpoint_if_due("tenant-a").code, error_code::ok);
  EXPECT_EQ(manager.checkpoint("").code, error_code::invalid_argument);
}

TEST_F(checkpoint_manager_test, tampered_head_is_refused) {
  auto entries = append(3);
  auto tampered = entries[2];
  tampered.payload = R"({"n":42})";
  overwrite_entry(tampered);

  auto manager = checkpoint_manager{storage(), exporter_};
  auto result = manager.checkpoint("tenant-a");
  EXPECT_EQ(result.code, error_code::chain_integrity_error);
  EXPECT_FALSE(result.checkpoint.has_value());
  EXPECT_TRUE(exporter_.delivered.empty());
}

TEST_F(checkpoint_manager_test, file_artifact_anchors_verification) {
  auto entries = append(5);
  const auto export_path = path_ + ".checkpoints.jsonl";
  auto exporter = chronicle::execution::file_exporter{export_path};
  auto manager = checkpoint_manager{storage(), exporter, checkpoint_policy{},
                                    clock_.source()};
  auto result = manager.checkpoint("tenant-a");
  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_EQ(result.checkpoint->export_destination, "file:" + export_path);

  auto input = std::ifstream{export_path};
  auto line = std::string{};
  ASSERT_TRUE(static_cast<bool>(std::getline(input, line)));
  auto error = std::string{};
  auto anchor = chronicle::execution::parse_artifact(line, error);
  ASSERT_TRUE(anchor.has_value()) << error;
  EXPECT_EQ(anchor->chain_id, "tenant-a");
  EXPECT_EQ(anchor->sequence, 4u);
  EXPECT_EQ(anchor->root_hash, entries[4].entry_hash);
  EXPECT_EQ(anchor->merkle_root, result.checkpoint->merkle_root);
  EXPECT_EQ(anchor->created_at, chronicle::testing::kEpoch);

  auto verdict = chronicle::execution::verification_engine{storage()}.verify(
      "tenant-a", anchor);
  EXPECT_TRUE(verdict.valid()) << verdict.detail;
  chronicle::testing::remove_path(export_path);
}

TEST(checkpoint_artifact, file_exporter_appends_one_line_per_checkpoint) {
  const auto export_path =
      chronicle::testing::make_db_path("chronicle_export") + ".jsonl";
  auto exporter = chronicle::execution::file_exporter{export_path};
  auto value = checkpoint_t{};
  value.chain_id = "tenant-a";
  value.root_hash = chronicle::testing::make_hash(4);
  value.created_at = chronicle::testing::kEpoch;

  auto error = std::string{};
  for (sequence_t sequence : {3u, 8u}) {
    value.sequence = sequence;
    ASSERT_TRUE(exporter.export_checkpoint(value, error)) << error;
  }

  auto input = std::ifstream{export_path};
  auto sequences = std::vector<sequence_t>{};
  auto line = std::string{};
  while (std::getline(input, line)) {
    auto anchor = chronicle::execution::parse_artifact(line, error);
    ASSERT_TRUE(anchor.has_value()) << error;
    EXPECT_EQ(anchor->root_hash, value.root_hash);
    sequences.push_back(anchor->sequence);
  }
  EXPECT_EQ(sequences, (std::vector<sequence_t>{3, 8}));
  chronicle::testing::remove_path(export_path);
}

TEST(checkpoint_artifact, unreachable_export_file_fails) {
  auto exporter = chronicle::execution::file_exporter{
      chronicle::testing::make_db_path("chronicle_missing") +
      "/nested/checkpoints.jsonl"};
  auto value = checkpoint_t{};
  value.chain_id = "tenant-a";
  auto error = std::string{};
  EXPECT_FALSE(exporter.export_checkpoint(value, error));
  EXPECT_NE(error.find("failed opening"), std::string::npos) << error;
}

TEST(checkpoint_artifact, malformed_lines_are_rejected) {
  auto error = std::string{};
  EXPECT_FALSE(
      chronicle::execution::parse_artifact("not json", error).has_value());
  EXPECT_FALSE(chronicle::execution::parse_artifact(
      R"({"chain_id":"a","sequence":1})", error).has_value());
  EXPECT_FALSE(chronicle::execution::parse_artifact(
      R"({"chain_id":"a","sequence":-1,"root_hash":"00"})", error).has_value());
  EXPECT_FALSE(chronicle::execution::parse_artifact(
      R"({"chain_id":"a","sequence":1,"root_hash":"abcd"})", error).has_value());
  EXPECT_EQ(error, "checkpoint artifact root_hash is not 32 hex-encoded bytes");

  const auto root = std::string(64, 'a');
  EXPECT_FALSE(chronicle::execution::parse_artifact(
      R"({"chain_id":"a","sequence":1,"root_hash":")" + root +
          R"(","merkle_root":7})", error).has_value());
  EXPECT_EQ(error,
            "checkpoint artifact merkle_root is not 32 hex-encoded bytes");
}

}  // namespace
