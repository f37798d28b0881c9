#pragma once

#include <cstdint>
#include <string>

namespace prefixid::db::model {

/*
  Persistent counter row.

  - segment_key is the primary key; one row per counter series.
  - value is the next value to hand out (pooled: low end of the next block).
  - value only moves forward, through CompareAndSwapCounter.
*/

struct CounterRecord {
  std::string segment_key;
  int64_t     value = 0;
};

}
