#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sqljudge {

/// Per-dataset execution bounds; dataset entries override the config defaults.
struct ExecutionLimits {
  int timeout_ms = 3000;
  size_t max_rows = 5000;
  size_t pool_size = 4;
  int acquire_timeout_ms = 500;
};

/// Knobs of the result equality policy.
/// Two floats are equal when |a-b| <= abs OR |a-b| <= rel * max(|a|, |b|).
struct ComparisonPolicy {
  double float_abs_tolerance = 1e-6;
  double float_rel_tolerance = 1e-9;
  bool case_insensitive_text = false;
  bool case_insensitive_columns = false;
  /// Canonicalize untyped text that parses as an ISO-8601 timestamp.
  bool temporal_text_detection = true;
  size_t preview_rows = 5;
};

enum class ReferenceCachePolicy { Cached, Fresh };

/// Controls how reference results are obtained for each judgment.
struct ReferencePolicy {
  ReferenceCachePolicy policy = ReferenceCachePolicy::Cached;
  int64_t ttl_ms = 300000;
  size_t max_entries = 128;
  /// Run reference and candidate concurrently when the reference is not cached.
  bool concurrent = true;
};

/// Where and how to reach a dataset's backing store.
/// read_only MUST be true; the registry refuses anything else.
struct ConnectionDescriptor {
  std::string dataset_key;
  std::string backend = "sqlite";
  std::string host;
  int port = 0;
  std::string database;
  std::string user;
  std::string password;
  bool read_only = true;
  ExecutionLimits limits;
};

/// Static description of one practice dataset.
struct DatasetConfig {
  std::string key;
  std::string name;
  std::string description;
  bool active = true;
  ConnectionDescriptor connection;
  ComparisonPolicy comparison;
};

struct JudgeConfig {
  ExecutionLimits defaults;
  ComparisonPolicy comparison;
  ReferencePolicy reference;
  std::vector<DatasetConfig> datasets;
};

/// Parses a JSON configuration document, merging dataset overrides over defaults.
/// MUST throw JudgeError{InternalFault} with the offending field on malformed input.
JudgeConfig parse_judge_config(const std::string& json_text);
/// Reads and parses a configuration file; relative dataset paths resolve
/// against the file's directory.
JudgeConfig load_judge_config(const std::string& path);

}  // namespace sqljudge
