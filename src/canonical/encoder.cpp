#include <chronicle/canonical/encoder.hpp>
#include <chronicle/crypto/hash.hpp>
#include <chronicle/schema/encoding/scale/encoder.hpp>

#include <cstdint>
#include <exception>
#include <limits>
#include <string>

using namespace chronicle::schema;

namespace chronicle::canonical {

namespace {

using encoder_t = chronicle::schema::encoding::scale_encoder_t;

enum class value_tag : uint8_t {
  null = 0x00,
  boolean_false = 0x01,
  boolean_true = 0x02,
  integer = 0x03,
  large_unsigned = 0x04,
  string = 0x05,
  array = 0x06,
  object = 0x07,
};

void put_tag(const value_tag tag, bytes_t& out) {
  out.push_back(static_cast<uint8_t>(tag));
}

bool encode_text(encoder_t& encoder,
                 const std::string_view field,
                 const std::string& value,
                 bytes_t& out,
                 std::string& error) {
  if (!is_valid_utf8(value)) {
    error = std::string{field} + " is not valid UTF-8";
    return false;
  }
  encoder.encode(value, out);
  return true;
}

bool encode_value(encoder_t& encoder,
                  const nlohmann::json& value,
                  const std::size_t depth,
                  bytes_t& out,
                  std::string& error) {
  if (depth > kMaxPayloadDepth) {
    error = "payload nesting exceeds supported depth";
    return false;
  }
  switch (value.type()) {
    case nlohmann::json::value_t::null:
      put_tag(value_tag::null, out);
      return true;
    case nlohmann::json::value_t::boolean:
      put_tag(value.get<bool>() ? value_tag::boolean_true
                                : value_tag::boolean_false,
              out);
      return true;
    case nlohmann::json::value_t::number_integer:
      put_tag(value_tag::integer, out);
      encoder.encode(value.get<int64_t>(), out);
      return true;
    case nlohmann::json::value_t::number_unsigned: {
      // Parsed JSON yields unsigned for non-negative literals; values that fit
      // int64 must encode exactly like their signed construction.
      auto unsigned_value = value.get<uint64_t>();
      if (unsigned_value <=
          static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        put_tag(value_tag::integer, out);
        encoder.encode(static_cast<int64_t>(unsigned_value), out);
      } else {
        put_tag(value_tag::large_unsigned, out);
        encoder.encode(unsigned_value, out);
      }
      return true;
    }
    case nlohmann::json::value_t::string: {
      put_tag(value_tag::string, out);
      return encode_text(encoder, "payload string",
                         value.get_ref<const std::string&>(), out, error);
    }
    case nlohmann::json::value_t::array: {
      put_tag(value_tag::array, out);
      encoder.encode(static_cast<uint64_t>(value.size()), out);
      for (const auto& item : value) {
        if (!encode_value(encoder, item, depth + 1, out, error)) {
          return false;
        }
      }
      return true;
    }
    case nlohmann::json::value_t::object: {
      // nlohmann::json objects are std::map backed, so items() iterates in
      // bytewise key order regardless of insertion order.
      put_tag(value_tag::object, out);
      encoder.encode(static_cast<uint64_t>(value.size()), out);
      for (const auto& [key, item] : value.items()) {
        if (!encode_text(encoder, "payload key", key, out, error)) {
          return false;
        }
        if (!encode_value(encoder, item, depth + 1, out, error)) {
          return false;
        }
      }
      return true;
    }
    case nlohmann::json::value_t::number_float:
      error = "payload contains a floating point number";
      return false;
    case nlohmann::json::value_t::binary:
      error = "payload contains a binary value";
      return false;
    case nlohmann::json::value_t::discarded:
    default:
      error = "payload contains an unsupported value";
      return false;
  }
}

}  // namespace

bool is_valid_utf8(const std::string_view& text) {
  auto index = std::size_t{0};
  while (index < text.size()) {
    auto lead = static_cast<uint8_t>(text[index]);
    auto length = std::size_t{0};
    auto code_point = uint32_t{0};
    if (lead < 0x80u) {
      ++index;
      continue;
    } else if ((lead & 0xE0u) == 0xC0u) {
      length = 2;
      code_point = lead & 0x1Fu;
    } else if ((lead & 0xF0u) == 0xE0u) {
      length = 3;
      code_point = lead & 0x0Fu;
    } else if ((lead & 0xF8u) == 0xF0u) {
      length = 4;
      code_point = lead & 0x07u;
    } else {
      return false;
    }
    if (index + length > text.size()) {
      return false;
    }
    for (std::size_t i = 1; i < length; ++i) {
      auto continuation = static_cast<uint8_t>(text[index + i]);
      if ((continuation & 0xC0u) != 0x80u) {
        return false;
      }
      code_point = (code_point << 6u) | (continuation & 0x3Fu);
    }
    // Overlong forms, surrogates and out-of-range code points.
    if ((length == 2 && code_point < 0x80u) ||
        (length == 3 && code_point < 0x800u) ||
        (length == 4 && code_point < 0x10000u) || code_point > 0x10FFFFu ||
        (code_point >= 0xD800u && code_point <= 0xDFFFu)) {
      return false;
    }
    index += length;
  }
  return true;
}

std::optional<bytes_t> encode(const audit_entry_t& entry,
                              const nlohmann::json& payload,
                              std::string& error) {
  auto encoder = encoder_t{};
  auto out = bytes_t{};
  out.reserve(256);

  encoder.encode(std::string{kDomainTag}, out);
  if (!encode_text(encoder, "chain_id", entry.chain_id, out, error)) {
    return std::nullopt;
  }
  encoder.encode(entry.sequence, out);
  encoder.encode(entry.timestamp, out);
  if (!encode_text(encoder, "actor_id", entry.actor_id, out, error) ||
      !encode_text(encoder, "action", entry.action, out, error) ||
      !encode_text(encoder, "resource_type", entry.resource_type, out,
                   error) ||
      !encode_text(encoder, "resource_id", entry.resource_id, out, error)) {
    return std::nullopt;
  }
  if (!encode_value(encoder, payload, 0, out, error)) {
    return std::nullopt;
  }
  return out;
}

std::optional<bytes_t> encode(const audit_entry_t& entry, std::string& error) {
  auto payload = nlohmann::json{};
  try {
    payload = nlohmann::json::parse(entry.payload);
  } catch (const nlohmann::json::exception& ex) {
    error = std::string{"stored payload is not valid JSON: "} + ex.what();
    return std::nullopt;
  }
  // Stored text must be the compact form of the hashed value; other
  // spellings (extra whitespace, escapes, duplicate keys) parse alike.
  auto canonical_text = payload_text(payload, error);
  if (!canonical_text) {
    return std::nullopt;
  }
  if (*canonical_text != entry.payload) {
    error = "stored payload text is not in canonical form";
    return std::nullopt;
  }
  return encode(entry, payload, error);
}

std::optional<bytes_t> encode_payload(const nlohmann::json& payload,
                                      std::string& error) {
  auto encoder = encoder_t{};
  auto out = bytes_t{};
  if (!encode_value(encoder, payload, 0, out, error)) {
    return std::nullopt;
  }
  return out;
}

std::optional<std::string> payload_text(const nlohmann::json& payload,
                                        std::string& error) {
  if (!encode_payload(payload, error)) {
    return std::nullopt;
  }
  try {
    return payload.dump();
  } catch (const nlohmann::json::exception& ex) {
    error = ex.what();
    return std::nullopt;
  }
}

std::optional<hash32_t> compute_entry_hash(const audit_entry_t& entry,
                                           std::string& error) {
  auto canonical = encode(entry, error);
  if (!canonical) {
    return std::nullopt;
  }
  return chronicle::crypto::entry_hash(
      entry.previous_hash, bytes_view_t{canonical->data(), canonical->size()});
}

}  // namespace chronicle::canonical
