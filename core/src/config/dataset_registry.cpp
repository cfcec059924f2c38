#include "sqljudge/dataset_registry.h"

#include "sqljudge/errors.h"

namespace sqljudge {

DatasetRegistry::DatasetRegistry(const std::vector<DatasetConfig>& datasets) {
  for (const auto& ds : datasets) {
    if (ds.key.empty()) {
      throw JudgeError(ErrorKind::InternalFault, "Dataset key must not be empty");
    }
    if (!ds.connection.read_only) {
      throw JudgeError(ErrorKind::InternalFault,
                       "Dataset '" + ds.key + "' is not configured with a read-only credential");
    }
    if (ds.connection.limits.pool_size == 0 || ds.connection.limits.max_rows == 0 ||
        ds.connection.limits.timeout_ms <= 0) {
      throw JudgeError(ErrorKind::InternalFault,
                       "Dataset '" + ds.key + "' has non-positive execution limits");
    }
    DatasetConfig entry = ds;
    entry.connection.dataset_key = ds.key;
    if (!datasets_.emplace(ds.key, std::move(entry)).second) {
      throw JudgeError(ErrorKind::InternalFault, "Duplicate dataset key '" + ds.key + "'");
    }
  }
}

const DatasetConfig& DatasetRegistry::dataset(const std::string& key) const {
  auto it = datasets_.find(key);
  if (it == datasets_.end()) {
    throw JudgeError(ErrorKind::UnknownDataset, "Unknown dataset: " + key);
  }
  if (!it->second.active) {
    throw JudgeError(ErrorKind::UnknownDataset, "Dataset is not active: " + key);
  }
  return it->second;
}

const ConnectionDescriptor& DatasetRegistry::resolve(const std::string& key) const {
  return dataset(key).connection;
}

bool DatasetRegistry::contains(const std::string& key) const {
  auto it = datasets_.find(key);
  return it != datasets_.end() && it->second.active;
}

std::vector<std::string> DatasetRegistry::keys() const {
  std::vector<std::string> out;
  for (const auto& kv : datasets_) {
    if (kv.second.active) out.push_back(kv.first);
  }
  return out;
}

std::vector<DatasetConfig> DatasetRegistry::all() const {
  std::vector<DatasetConfig> out;
  out.reserve(datasets_.size());
  for (const auto& kv : datasets_) out.push_back(kv.second);
  return out;
}

}  // namespace sqljudge
