#include <chronicle/schema/encoding/scale/checkpoint.hpp>

using namespace chronicle::schema;

namespace chronicle::schema::encoding::scale {

void encode(checkpoint<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.chain_id, encoder);
  encode(o.sequence, encoder);
  encode(o.root_hash, encoder);
  encode(o.merkle_root, encoder);
  encode(o.merkle_peaks, encoder);
  encode(o.created_at, encoder);
  encode(o.exported, encoder);
  encode(o.exported_at, encoder);
  encode(o.export_destination, encoder);
  encode(o.export_attempts, encoder);
}

void decode(checkpoint<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.chain_id, decoder);
  decode(o.sequence, decoder);
  decode(o.root_hash, decoder);
  decode(o.merkle_root, decoder);
  decode(o.merkle_peaks, decoder);
  decode(o.created_at, decoder);
  decode(o.exported, decoder);
  decode(o.exported_at, decoder);
  decode(o.export_destination, decoder);
  decode(o.export_attempts, decoder);
}

}  // namespace chronicle::schema::encoding::scale
