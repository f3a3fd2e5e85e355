// chartscan/values/value_merger.hpp - Deep merge of values mappings
#pragma once

#include <vector>

#include "chartscan/values/value.hpp"

namespace chartscan
{

/**
 * Merge `source` into `target` in place.
 *
 * For every key of `source`:
 * - both sides are mappings: merge recursively
 * - otherwise `source[k]` replaces `target[k]` wholesale (sequences included)
 *
 * `source` is never modified. Values taken from it are deep copies, so the
 * merged mapping shares no nested state with any of its inputs.
 */
void merge_values(ValueMapping & target, const ValueMapping & source);

/**
 * Merge `sources` in order, lowest precedence first.
 */
[[nodiscard]] ValueMapping merge_all(const std::vector<ValueMapping> & sources);

}  // namespace chartscan
