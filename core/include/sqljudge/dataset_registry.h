#pragma once

#include <map>
#include <string>
#include <vector>

#include "sqljudge/config.h"

namespace sqljudge {

/// Immutable map from dataset key to connection parameters.
/// Built once at startup; all methods are const and safe for concurrent readers.
class DatasetRegistry {
 public:
  /// Registers datasets, rejecting duplicate keys, empty keys and writable credentials.
  explicit DatasetRegistry(const std::vector<DatasetConfig>& datasets);

  /// Returns the connection descriptor for an active dataset.
  /// Throws JudgeError{UnknownDataset} when the key is missing or inactive.
  const ConnectionDescriptor& resolve(const std::string& key) const;
  /// Returns the full dataset entry under the same rules as resolve().
  const DatasetConfig& dataset(const std::string& key) const;
  /// True when the key names an active dataset.
  bool contains(const std::string& key) const;
  /// Active dataset keys in lexical order.
  std::vector<std::string> keys() const;
  /// Every registered dataset, active or not.
  std::vector<DatasetConfig> all() const;

 private:
  std::map<std::string, DatasetConfig> datasets_;
};

}  // namespace sqljudge
