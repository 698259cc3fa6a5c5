#include <spdlog/spdlog.h>
#include <chronicle/execution/checkpoint_exporter.hpp>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <string_view>
#include <system_error>

using namespace chronicle::schema;

namespace chronicle::execution {

namespace {

/// Owns a POSIX file descriptor.
struct file_descriptor final {
  int fd{-1};

  explicit file_descriptor(const int value) : fd{value} {}
  file_descriptor(const file_descriptor&) = delete;
  file_descriptor& operator=(const file_descriptor&) = delete;
  ~file_descriptor() {
    if (fd >= 0) {
      ::close(fd);
    }
  }
};

}  // namespace

file_exporter::file_exporter(std::filesystem::path path)
    : path_{std::move(path)} {}

bool file_exporter::export_checkpoint(const checkpoint_t& value,
                                      std::string& error) {
  auto lock = std::scoped_lock{mutex_};
  auto file = file_descriptor{
      ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644)};
  if (file.fd < 0) {
    error = "failed opening checkpoint export file '" + path_.string() +
            "': " + std::system_category().message(errno);
    return false;
  }

  auto line = make_artifact(value).dump() + '\n';
  auto remaining = std::string_view{line};
  while (!remaining.empty()) {
    auto written = ::write(file.fd, remaining.data(), remaining.size());
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      error = "failed writing checkpoint export file '" + path_.string() +
              "': " + std::system_category().message(errno);
      return false;
    }
    remaining.remove_prefix(static_cast<std::size_t>(written));
  }
  if (::fsync(file.fd) != 0) {
    error = "failed syncing checkpoint export file '" + path_.string() +
            "': " + std::system_category().message(errno);
    return false;
  }
  spdlog::info("Exported checkpoint chain '{}' seq {} to '{}'", value.chain_id,
               value.sequence, path_.string());
  return true;
}

std::string file_exporter::destination() const {
  return "file:" + path_.string();
}

nlohmann::json make_artifact(const checkpoint_t& value) {
  return nlohmann::json{
      {"chain_id", value.chain_id},
      {"sequence", value.sequence},
      {"root_hash", to_hex(value.root_hash)},
      {"merkle_root", to_hex(value.merkle_root)},
      {"timestamp", value.created_at},
  };
}

std::optional<checkpoint_t> parse_artifact(const std::string_view& line,
                                           std::string& error) {
  auto artifact = nlohmann::json::parse(line, nullptr, false);
  if (artifact.is_discarded() || !artifact.is_object()) {
    error = "checkpoint artifact is not a JSON object";
    return std::nullopt;
  }

  auto chain_id = artifact.find("chain_id");
  auto sequence = artifact.find("sequence");
  auto root_hash = artifact.find("root_hash");
  auto merkle_root = artifact.find("merkle_root");
  auto timestamp = artifact.find("timestamp");
  if (chain_id == artifact.end() || !chain_id->is_string() ||
      chain_id->get_ref<const std::string&>().empty()) {
    error = "checkpoint artifact is missing chain_id";
    return std::nullopt;
  }
  if (sequence == artifact.end() || !sequence->is_number_unsigned()) {
    error = "checkpoint artifact is missing sequence";
    return std::nullopt;
  }
  if (root_hash == artifact.end() || !root_hash->is_string()) {
    error = "checkpoint artifact is missing root_hash";
    return std::nullopt;
  }
  auto root = try_make_hash32(root_hash->get_ref<const std::string&>());
  if (!root) {
    error = "checkpoint artifact root_hash is not 32 hex-encoded bytes";
    return std::nullopt;
  }

  auto value = checkpoint_t{};
  value.chain_id = chain_id->get<std::string>();
  value.sequence = sequence->get<sequence_t>();
  value.root_hash = *root;
  if (merkle_root != artifact.end()) {
    auto merkle = std::optional<hash32_t>{};
    if (merkle_root->is_string()) {
      merkle = try_make_hash32(merkle_root->get_ref<const std::string&>());
    }
    if (!merkle) {
      error = "checkpoint artifact merkle_root is not 32 hex-encoded bytes";
      return std::nullopt;
    }
    value.merkle_root = *merkle;
  }
  if (timestamp != artifact.end() && timestamp->is_number_unsigned()) {
    value.created_at = timestamp->get<timestamp_microseconds_t>();
  }
  value.exported = true;
  return value;
}

}  // namespace chronicle::execution
