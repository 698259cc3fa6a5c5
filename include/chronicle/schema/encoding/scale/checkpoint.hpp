#pragma once

#include <chronicle/schema/checkpoint.hpp>
#include <scale/scale.hpp>

namespace chronicle::schema::encoding::scale {

void encode(chronicle::schema::checkpoint<1>&& o, ::scale::Encoder& encoder);
void decode(chronicle::schema::checkpoint<1>&& o, ::scale::Decoder& decoder);

}  // namespace chronicle::schema::encoding::scale
