#include <chronicle/schema/encoding/scale/audit_entry.hpp>

using namespace chronicle::schema;

namespace chronicle::schema::encoding::scale {

void encode(audit_entry<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.chain_id, encoder);
  encode(o.sequence, encoder);
  encode(o.timestamp, encoder);
  encode(o.actor_id, encoder);
  encode(o.action, encoder);
  encode(o.resource_type, encoder);
  encode(o.resource_id, encoder);
  encode(o.payload, encoder);
  encode(o.previous_hash, encoder);
  encode(o.entry_hash, encoder);
}

void decode(audit_entry<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.chain_id, decoder);
  decode(o.sequence, decoder);
  decode(o.timestamp, decoder);
  decode(o.actor_id, decoder);
  decode(o.action, decoder);
  decode(o.resource_type, decoder);
  decode(o.resource_id, decoder);
  decode(o.payload, decoder);
  decode(o.previous_hash, decoder);
  decode(o.entry_hash, decoder);
}

}  // namespace chronicle::schema::encoding::scale
