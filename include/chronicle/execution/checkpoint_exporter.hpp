#pragma once

#include <chronicle/schema/checkpoint.hpp>
#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace chronicle::execution {

/// Destination outside the store's trust boundary that receives checkpoint
/// witnesses.
class checkpoint_exporter {
 public:
  virtual ~checkpoint_exporter() = default;

  /// Deliver the artifact of `value`. On failure returns false and fills
  /// `error`; the caller keeps the checkpoint pending and retries later.
  virtual bool export_checkpoint(const chronicle::schema::checkpoint_t& value,
                                 std::string& error) = 0;

  /// Human-readable destination recorded on exported checkpoints.
  virtual std::string destination() const = 0;
};

/// Appends one JSON line per checkpoint to a file and fsyncs it before
/// reporting success.
class file_exporter final : public checkpoint_exporter {
 public:
  explicit file_exporter(std::filesystem::path path);

  bool export_checkpoint(const chronicle::schema::checkpoint_t& value,
                         std::string& error) override;
  std::string destination() const override;

 private:
  std::filesystem::path path_;
  std::mutex mutex_;
};

/// `{"chain_id", "sequence", "root_hash", "merkle_root", "timestamp"}` with
/// both hashes in lowercase hex.
nlohmann::json make_artifact(const chronicle::schema::checkpoint_t& value);

/// Parse one exported line back into a trust anchor for verification. Only
/// the witnessed fields are populated.
std::optional<chronicle::schema::checkpoint_t> parse_artifact(
    const std::string_view& line,
    std::string& error);

}  // namespace chronicle::execution
