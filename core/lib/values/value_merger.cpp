// chartscan/values/value_merger.cpp - Deep merge implementation
//
#include "chartscan/values/value_merger.hpp"

namespace chartscan
{

void merge_values(ValueMapping & target, const ValueMapping & source)
{
  for (const auto & [key, value] : source) {
    const auto it = target.find(key);
    if (it != target.end() && it->second.is_mapping() && value.is_mapping()) {
      merge_values(it->second.as_mapping(), value.as_mapping());
      continue;
    }
    // Copy-assignment clones the whole subtree.
    if (it != target.end()) {
      it->second = value;
    } else {
      target.emplace(key, value);
    }
  }
}

ValueMapping merge_all(const std::vector<ValueMapping> & sources)
{
  ValueMapping merged;
  for (const auto & source : sources) {
    merge_values(merged, source);
  }
  return merged;
}

}  // namespace chartscan
