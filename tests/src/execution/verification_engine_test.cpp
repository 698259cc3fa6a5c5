#include <gtest/gtest.h>
#include <chronicle/crypto/merkle.hpp>
#include <chronicle/execution/append_engine.hpp>
#include <chronicle/execution/verification_engine.hpp>
#include <chronicle/testing/chain_helpers.hpp>
#include <chronicle/testing/store_fixture.hpp>

#include <stop_token>
#include <vector>

namespace {

using namespace chronicle::schema;
using chronicle::execution::append_engine;
using chronicle::execution::verification_engine;

class verification_engine_test : public chronicle::testing::store_fixture {
 protected:
  std::vector<audit_entry_t> build_chain(const std::size_t count,
                                         const std::string& chain_id =
                                             "tenant-a") {
    auto engine = append_engine{storage(), chronicle::execution::retry_policy{},
                                chronicle::testing::make_step_clock()};
    return chronicle::testing::append_events(engine, chain_id, count);
  }

  checkpoint_t make_checkpoint(const audit_entry_t& entry) {
    auto value = checkpoint_t{};
    value.chain_id = entry.chain_id;
    value.sequence = entry.sequence;
    value.root_hash = entry.entry_hash;
    value.created_at = chronicle::testing::kEpoch;
    return value;
  }

  /// Persist a checkpoint at `entries[sequence]` witnessing the Merkle root
  /// of every entry up to it.
  checkpoint_t store_checkpoint(const std::vector<audit_entry_t>& entries,
                                const sequence_t sequence) {
    auto hashes = std::vector<hash32_t>{};
    for (sequence_t i = 0; i <= sequence; ++i) {
      hashes.push_back(entries[i].entry_hash);
    }
    auto value = make_checkpoint(entries[sequence]);
    value.merkle_root = chronicle::crypto::merkle_root(hashes);
    EXPECT_EQ(storage().append_checkpoint(value),
              chronicle::storage::store_status::ok);
    return value;
  }

  void expect_broken(const verification_result_t& result,
                     const sequence_t sequence,
                     const integrity_failure reason) {
    EXPECT_EQ(result.status, verification_status::broken) << result.detail;
    EXPECT_EQ(result.code, error_code::chain_integrity_error);
    EXPECT_EQ(result.first_bad_sequence, std::optional<sequence_t>{sequence});
    EXPECT_EQ(result.reason, reason) << result.detail;
  }
};

TEST_F(verification_engine_test, untouched_chain_is_valid) {
  auto entries = build_chain(10);
  auto engine = verification_engine{storage()};
  auto result = engine.verify("tenant-a");
  EXPECT_TRUE(result.valid()) << result.detail;
  EXPECT_EQ(result.code, error_code::ok);
  EXPECT_EQ(result.entries_checked, 10u);
  EXPECT_EQ(result.covered, (sequence_range{0, 9}));
  EXPECT_EQ(result.tip_hash, entries.back().entry_hash);
  EXPECT_FALSE(result.first_bad_sequence.has_value());
}

TEST_F(verification_engine_test, empty_chain_is_valid_without_range) {
  auto result = verification_engine{storage()}.verify("tenant-empty");
  EXPECT_TRUE(result.valid());
  EXPECT_EQ(result.entries_checked, 0u);
  EXPECT_FALSE(result.covered.has_value());
}

TEST_F(verification_engine_test, repeated_runs_agree) {
  build_chain(5);
  auto engine = verification_engine{storage()};
  EXPECT_EQ(engine.verify("tenant-a"), engine.verify("tenant-a"));
}

TEST_F(verification_engine_test, edited_payload_is_a_hash_mismatch) {
  auto engine = append_engine{storage(), chronicle::execution::retry_policy{},
                              chronicle::testing::make_step_clock()};
  for (const auto* op : {"create", "update", "delete"}) {
    auto appended = engine.append(
        "tenant-a", chronicle::testing::make_event("alice", op, {{"op", op}}));
    ASSERT_TRUE(appended.ok()) << appended.log;
  }
  auto verifier = verification_engine{storage()};
  auto before = verifier.verify("tenant-a");
  EXPECT_TRUE(before.valid()) << before.detail;
  EXPECT_EQ(before.covered, (sequence_range{0, 2}));

  auto tampered = stored_entry("tenant-a", 1);
  ASSERT_EQ(tampered.payload, R"({"op":"update"})");
  tampered.payload = R"({"op":"update","x":1})";
  overwrite_entry(tampered);

  auto result = verifier.verify("tenant-a");
  expect_broken(result, 1, integrity_failure::hash_mismatch);
  EXPECT_EQ(result.covered, (sequence_range{0, 0}));
}

TEST_F(verification_engine_test, respelled_payload_is_a_hash_mismatch) {
  build_chain(3);
  auto original = stored_entry("tenant-a", 1);
  ASSERT_EQ(original.payload, R"({"n":1})");

  auto spaced = original;
  spaced.payload = R"({ "n" : 1 })";
  overwrite_entry(spaced);
  expect_broken(verification_engine{storage()}.verify("tenant-a"), 1,
                integrity_failure::hash_mismatch);
}

TEST_F(verification_engine_test, duplicate_payload_key_is_a_hash_mismatch) {
  build_chain(3);
  auto forged = stored_entry("tenant-a", 1);
  // Parses to {"n":1} because the last duplicate wins.
  forged.payload = R"({"n":"FORGED","n":1})";
  overwrite_entry(forged);
  auto engine = verification_engine{storage()};
  expect_broken(engine.verify("tenant-a"), 1,
                integrity_failure::hash_mismatch);
  EXPECT_FALSE(engine.lookup("tenant-a", forged.entry_hash).hash_verified);
}

TEST_F(verification_engine_test, edited_actor_is_a_hash_mismatch) {
  build_chain(4);
  auto tampered = stored_entry("tenant-a", 3);
  tampered.actor_id = "mallory";
  overwrite_entry(tampered);
  expect_broken(verification_engine{storage()}.verify("tenant-a"), 3,
                integrity_failure::hash_mismatch);
}

TEST_F(verification_engine_test, deleted_middle_entry_breaks_linkage) {
  build_chain(5);
  delete_entry("tenant-a", 2);
  expect_broken(verification_engine{storage()}.verify("tenant-a"), 2,
                integrity_failure::linkage_mismatch);
}

TEST_F(verification_engine_test, deleted_genesis_is_reported) {
  build_chain(3);
  delete_entry("tenant-a", 0);
  expect_broken(verification_engine{storage()}.verify("tenant-a"), 0,
                integrity_failure::genesis_missing);
}

TEST_F(verification_engine_test, deleted_tip_is_reported) {
  build_chain(3);
  delete_entry("tenant-a", 2);
  expect_broken(verification_engine{storage()}.verify("tenant-a"), 2,
                integrity_failure::linkage_mismatch);
}

TEST_F(verification_engine_test, rehashed_genesis_without_sentinel_is_caught) {
  build_chain(2);
  auto forged = stored_entry("tenant-a", 0);
  forged.previous_hash = chronicle::testing::make_hash(1);
  overwrite_entry(chronicle::testing::rehash(forged));
  expect_broken(verification_engine{storage()}.verify("tenant-a"), 0,
                integrity_failure::genesis_missing);
}

TEST_F(verification_engine_test, relinked_entry_is_a_linkage_mismatch) {
  auto entries = build_chain(4);
  // Entry 2 rewritten to follow entry 0, as if entry 1 had been cut out.
  auto forged = entries[2];
  forged.previous_hash = entries[0].entry_hash;
  overwrite_entry(chronicle::testing::rehash(forged));
  expect_broken(verification_engine{storage()}.verify("tenant-a"), 2,
                integrity_failure::linkage_mismatch);
}

TEST_F(verification_engine_test, grafted_entry_has_unknown_predecessor) {
  auto entries = build_chain(3);
  auto forged = entries[1];
  forged.previous_hash = chronicle::testing::make_hash(77);
  overwrite_entry(chronicle::testing::rehash(forged));
  expect_broken(verification_engine{storage()}.verify("tenant-a"), 1,
                integrity_failure::unknown_predecessor);
}

TEST_F(verification_engine_test, entry_from_another_chain_is_rejected) {
  build_chain(3);
  auto foreign = build_chain(3, "tenant-b");
  // Stored under tenant-a but still claiming tenant-b.
  write_entry_at("tenant-a", 1, foreign[1]);
  expect_broken(verification_engine{storage()}.verify("tenant-a"), 1,
                integrity_failure::linkage_mismatch);
}

TEST_F(verification_engine_test, anchored_walk_matches_full_walk) {
  auto entries = build_chain(8);
  auto engine = verification_engine{storage()};
  auto full = engine.verify("tenant-a");
  auto anchored = engine.verify("tenant-a", make_checkpoint(entries[4]));

  ASSERT_TRUE(full.valid());
  ASSERT_TRUE(anchored.valid()) << anchored.detail;
  EXPECT_EQ(anchored.tip_hash, full.tip_hash);
  EXPECT_EQ(anchored.covered, (sequence_range{4, 7}));
  EXPECT_EQ(anchored.entries_checked, 4u);

  auto at_tip = engine.verify("tenant-a", make_checkpoint(entries[7]));
  EXPECT_TRUE(at_tip.valid());
  EXPECT_EQ(at_tip.covered, (sequence_range{7, 7}));
}

TEST_F(verification_engine_test, anchored_walk_still_catches_later_edits) {
  auto entries = build_chain(6);
  auto tampered = entries[5];
  tampered.action = "erase";
  overwrite_entry(tampered);
  expect_broken(verification_engine{storage()}.verify(
                    "tenant-a", make_checkpoint(entries[2])),
                5, integrity_failure::hash_mismatch);
}

TEST_F(verification_engine_test, rewritten_history_contradicts_checkpoint) {
  auto entries = build_chain(4);
  auto witness = make_checkpoint(entries[2]);

  // Rewrite the whole chain consistently: a full walk cannot tell.
  auto previous = kGenesisSentinel;
  for (auto entry : entries) {
    entry.action = "rewritten";
    entry.previous_hash = previous;
    entry = chronicle::testing::rehash(entry);
    overwrite_entry(entry);
    previous = entry.entry_hash;
  }

  auto engine = verification_engine{storage()};
  EXPECT_TRUE(engine.verify("tenant-a").valid());
  expect_broken(engine.verify("tenant-a", witness), 2,
                integrity_failure::checkpoint_mismatch);
}

TEST_F(verification_engine_test, anchor_past_tip_is_a_mismatch) {
  auto entries = build_chain(2);
  auto witness = make_checkpoint(entries[1]);
  witness.sequence = 9;
  expect_broken(verification_engine{storage()}.verify("tenant-a", witness), 9,
                integrity_failure::checkpoint_mismatch);

  auto foreign = make_checkpoint(entries[1]);
  foreign.chain_id = "tenant-b";
  auto result = verification_engine{storage()}.verify("tenant-a", foreign);
  EXPECT_EQ(result.status, verification_status::error);
  EXPECT_EQ(result.code, error_code::invalid_argument);
}

TEST_F(verification_engine_test, stop_request_cancels_walk) {
  build_chain(5);
  auto source = std::stop_source{};
  source.request_stop();
  auto result = verification_engine{storage()}.verify("tenant-a", std::nullopt,
                                                      source.get_token());
  EXPECT_TRUE(result.cancelled);
  EXPECT_EQ(result.entries_checked, 0u);
  EXPECT_FALSE(result.first_bad_sequence.has_value());
}

TEST_F(verification_engine_test, stop_during_walk_keeps_verified_prefix) {
  auto entries = build_chain(20);
  auto source = std::stop_source{};
  auto seen = std::vector<sequence_t>{};
  auto result = verification_engine{storage()}.verify(
      "tenant-a", std::nullopt, source.get_token(),
      [&](const sequence_t sequence) {
        seen.push_back(sequence);
        if (sequence == 6) {
          source.request_stop();
        }
      });

  EXPECT_TRUE(result.cancelled);
  EXPECT_EQ(result.status, verification_status::valid);
  EXPECT_EQ(result.covered, (sequence_range{0, 6}));
  EXPECT_EQ(result.entries_checked, 7u);
  EXPECT_EQ(result.tip_hash, entries[6].entry_hash);
  EXPECT_FALSE(result.first_bad_sequence.has_value());
  EXPECT_EQ(seen.size(), 7u);
}

TEST_F(verification_engine_test, segmented_walk_agrees_with_full_walk) {
  auto entries = build_chain(40);
  auto checkpoints = std::vector<checkpoint_t>{
      make_checkpoint(entries[29]), make_checkpoint(entries[9]),
      make_checkpoint(entries[19]), make_checkpoint(entries[9])};
  auto engine = verification_engine{storage()};

  auto full = engine.verify("tenant-a");
  auto segmented = engine.verify_segments("tenant-a", checkpoints, 3);
  EXPECT_TRUE(segmented.valid()) << segmented.detail;
  EXPECT_EQ(segmented.entries_checked, full.entries_checked);
  EXPECT_EQ(segmented.covered, full.covered);
  EXPECT_EQ(segmented.tip_hash, full.tip_hash);

  auto tampered = entries[23];
  tampered.payload = R"({"n":999})";
  overwrite_entry(tampered);
  auto broken = engine.verify_segments("tenant-a", checkpoints, 4);
  expect_broken(broken, 23, integrity_failure::hash_mismatch);
  expect_broken(engine.verify("tenant-a"), 23,
                integrity_failure::hash_mismatch);
}

TEST_F(verification_engine_test, segmented_walk_checks_witnessed_roots) {
  auto entries = build_chain(12);
  auto forged = make_checkpoint(entries[5]);
  forged.root_hash = chronicle::testing::make_hash(3);
  auto result = verification_engine{storage()}.verify_segments(
      "tenant-a", {forged}, 2);
  expect_broken(result, 5, integrity_failure::checkpoint_mismatch);
}

TEST_F(verification_engine_test, status_summarizes_chain) {
  auto entries = build_chain(3);
  ASSERT_EQ(storage().append_checkpoint(make_checkpoint(entries[1])),
            chronicle::storage::store_status::ok);

  auto status = verification_engine{storage()}.chain_status("tenant-a");
  EXPECT_EQ(status.code, error_code::ok);
  EXPECT_EQ(status.length, 3u);
  EXPECT_EQ(status.tip_hash, entries[2].entry_hash);
  EXPECT_EQ(status.created_at,
            std::optional<timestamp_microseconds_t>{entries[0].timestamp});
  ASSERT_TRUE(status.latest_checkpoint.has_value());
  EXPECT_EQ(status.latest_checkpoint->sequence, 1u);
  EXPECT_TRUE(status.verification.valid());

  auto tampered = entries[0];
  tampered.resource_id = "doc-9";
  overwrite_entry(tampered);
  auto broken = verification_engine{storage()}.chain_status("tenant-a");
  EXPECT_EQ(broken.code, error_code::chain_integrity_error);
  EXPECT_EQ(broken.verification.first_bad_sequence,
            std::optional<sequence_t>{0});
}

TEST_F(verification_engine_test, lookup_proves_inclusion) {
  auto entries = build_chain(3);
  auto engine = verification_engine{storage()};

  auto found = engine.lookup("tenant-a", entries[1].entry_hash);
  EXPECT_EQ(found.code, error_code::ok);
  ASSERT_TRUE(found.entry.has_value());
  EXPECT_EQ(found.entry->sequence, 1u);
  EXPECT_TRUE(found.hash_verified);

  auto missing = engine.lookup("tenant-a", chronicle::testing::make_hash(9));
  EXPECT_EQ(missing.code, error_code::not_found);

  auto tampered = entries[1];
  tampered.payload = R"({"n":5})";
  overwrite_entry(tampered);
  auto stale = engine.lookup("tenant-a", entries[1].entry_hash);
  EXPECT_EQ(stale.code, error_code::ok);
  EXPECT_FALSE(stale.hash_verified);

  delete_entry("tenant-a", 2);
  auto dangling = engine.lookup("tenant-a", entries[2].entry_hash);
  EXPECT_EQ(dangling.code, error_code::chain_integrity_error);
}

TEST_F(verification_engine_test, lookup_proof_reaches_covering_checkpoint) {
  auto entries = build_chain(7);
  auto early = store_checkpoint(entries, 3);
  auto late = store_checkpoint(entries, 6);
  auto engine = verification_engine{storage()};

  auto found = engine.lookup("tenant-a", entries[2].entry_hash);
  ASSERT_EQ(found.code, error_code::ok) << found.log;
  ASSERT_TRUE(found.proof.has_value());
  EXPECT_EQ(found.proof->checkpoint_sequence, std::optional<sequence_t>{3});
  EXPECT_EQ(found.proof->leaf_index, 2u);
  EXPECT_EQ(found.proof->tree_size, 4u);
  EXPECT_EQ(found.proof->merkle_root, early.merkle_root);
  EXPECT_TRUE(chronicle::crypto::verify_inclusion(
      entries[2].entry_hash, found.proof->leaf_index, found.proof->tree_size,
      found.proof->path, early.merkle_root));

  auto later = engine.lookup("tenant-a", entries[5].entry_hash);
  ASSERT_TRUE(later.proof.has_value()) << later.log;
  EXPECT_EQ(later.proof->checkpoint_sequence, std::optional<sequence_t>{6});
  EXPECT_TRUE(chronicle::crypto::verify_inclusion(
      entries[5].entry_hash, 5, 7, later.proof->path, late.merkle_root));
  EXPECT_FALSE(chronicle::crypto::verify_inclusion(
      entries[4].entry_hash, 5, 7, later.proof->path, late.merkle_root));
}

TEST_F(verification_engine_test, lookup_past_last_checkpoint_proves_to_head) {
  auto entries = build_chain(3);
  store_checkpoint(entries, 1);
  auto engine = verification_engine{storage()};

  auto found = engine.lookup("tenant-a", entries[2].entry_hash);
  ASSERT_EQ(found.code, error_code::ok) << found.log;
  ASSERT_TRUE(found.proof.has_value());
  EXPECT_FALSE(found.proof->checkpoint_sequence.has_value());
  EXPECT_EQ(found.proof->tree_size, 3u);
  EXPECT_EQ(found.proof->merkle_root,
            chronicle::crypto::merkle_root(std::vector<hash32_t>{
                entries[0].entry_hash, entries[1].entry_hash,
                entries[2].entry_hash}));
  EXPECT_TRUE(chronicle::crypto::verify_inclusion(
      entries[2].entry_hash, 2, 3, found.proof->path,
      found.proof->merkle_root));
}

TEST_F(verification_engine_test, lookup_flags_rewritten_history) {
  auto entries = build_chain(4);
  store_checkpoint(entries, 3);

  auto forged = entries[1];
  forged.payload = R"({"n":100})";
  forged = chronicle::testing::rehash(forged);
  overwrite_entry(forged);

  auto found = verification_engine{storage()}.lookup("tenant-a",
                                                     entries[0].entry_hash);
  EXPECT_EQ(found.code, error_code::chain_integrity_error);
  EXPECT_NE(found.log.find("seq 3"), std::string::npos) << found.log;
  EXPECT_FALSE(found.proof.has_value());
  EXPECT_TRUE(found.hash_verified);
}

}  // namespace
