#pragma once

#include <chronicle/schema/primitives.hpp>
#include <chronicle/storage/rocksdb/storage.hpp>
#include <functional>

namespace chronicle::execution {

using store_t =
    chronicle::storage::storage<chronicle::storage::rocksdb_storage_tag>;

/// Source of entry and checkpoint timestamps, in epoch microseconds.
using time_source_t =
    std::function<chronicle::schema::timestamp_microseconds_t()>;

chronicle::schema::timestamp_microseconds_t system_now();

}  // namespace chronicle::execution
