#pragma once

#include <chronicle/schema/audit_entry.hpp>
#include <scale/scale.hpp>

namespace chronicle::schema::encoding::scale {

void encode(chronicle::schema::audit_entry<1>&& o, ::scale::Encoder& encoder);
void decode(chronicle::schema::audit_entry<1>&& o, ::scale::Decoder& decoder);

}  // namespace chronicle::schema::encoding::scale
