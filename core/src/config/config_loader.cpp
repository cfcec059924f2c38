#include "sqljudge/config.h"

#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

#include <nlohmann/json.hpp>

#include "sqljudge/errors.h"
#include "sqljudge/log.h"
#include "util/string_util.h"

namespace sqljudge {

namespace {

using json = nlohmann::json;

[[noreturn]] void fail(const std::string& field, const std::string& problem) {
  throw JudgeError(ErrorKind::InternalFault, "Invalid judge config: " + field + " " + problem);
}

const json* find_field(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return nullptr;
  return &*it;
}

std::string read_string(const json& obj, const char* key, const std::string& path,
                        const std::string& fallback) {
  const json* value = find_field(obj, key);
  if (!value) return fallback;
  if (!value->is_string()) fail(path + "." + key, "must be a string");
  return value->get<std::string>();
}

bool read_bool(const json& obj, const char* key, const std::string& path, bool fallback) {
  const json* value = find_field(obj, key);
  if (!value) return fallback;
  if (!value->is_boolean()) fail(path + "." + key, "must be true or false");
  return value->get<bool>();
}

int64_t read_positive(const json& obj, const char* key, const std::string& path,
                      int64_t fallback) {
  const json* value = find_field(obj, key);
  if (!value) return fallback;
  if (!value->is_number_integer()) fail(path + "." + key, "must be an integer");
  const int64_t v = value->get<int64_t>();
  if (v <= 0) fail(path + "." + key, "must be positive");
  return v;
}

double read_tolerance(const json& obj, const char* key, const std::string& path, double fallback) {
  const json* value = find_field(obj, key);
  if (!value) return fallback;
  if (!value->is_number()) fail(path + "." + key, "must be a number");
  const double v = value->get<double>();
  if (!(v >= 0.0)) fail(path + "." + key, "must be zero or positive");
  return v;
}

ExecutionLimits read_limits(const json& obj, const std::string& path, const ExecutionLimits& base) {
  ExecutionLimits out = base;
  out.timeout_ms = static_cast<int>(read_positive(obj, "timeout_ms", path, base.timeout_ms));
  out.max_rows = static_cast<size_t>(
      read_positive(obj, "max_rows", path, static_cast<int64_t>(base.max_rows)));
  out.pool_size = static_cast<size_t>(
      read_positive(obj, "pool_size", path, static_cast<int64_t>(base.pool_size)));
  out.acquire_timeout_ms =
      static_cast<int>(read_positive(obj, "acquire_timeout_ms", path, base.acquire_timeout_ms));
  return out;
}

ComparisonPolicy read_comparison(const json& obj, const std::string& path,
                                 const ComparisonPolicy& base) {
  ComparisonPolicy out = base;
  out.float_abs_tolerance =
      read_tolerance(obj, "float_abs_tolerance", path, base.float_abs_tolerance);
  out.float_rel_tolerance =
      read_tolerance(obj, "float_rel_tolerance", path, base.float_rel_tolerance);
  out.case_insensitive_text =
      read_bool(obj, "case_insensitive_text", path, base.case_insensitive_text);
  out.case_insensitive_columns =
      read_bool(obj, "case_insensitive_columns", path, base.case_insensitive_columns);
  out.temporal_text_detection =
      read_bool(obj, "temporal_text_detection", path, base.temporal_text_detection);
  out.preview_rows = static_cast<size_t>(
      read_positive(obj, "preview_rows", path, static_cast<int64_t>(base.preview_rows)));
  return out;
}

ReferencePolicy read_reference(const json& obj) {
  ReferencePolicy out;
  const std::string policy = util::to_lower(read_string(obj, "policy", "reference", "cached"));
  if (policy == "cached") {
    out.policy = ReferenceCachePolicy::Cached;
  } else if (policy == "fresh") {
    out.policy = ReferenceCachePolicy::Fresh;
  } else {
    fail("reference.policy", "must be \"cached\" or \"fresh\"");
  }
  out.ttl_ms = read_positive(obj, "ttl_ms", "reference", out.ttl_ms);
  out.max_entries = static_cast<size_t>(
      read_positive(obj, "max_entries", "reference", static_cast<int64_t>(out.max_entries)));
  out.concurrent = read_bool(obj, "concurrent", "reference", out.concurrent);
  return out;
}

DatasetConfig read_dataset(const json& obj, const std::string& path, const JudgeConfig& base) {
  if (!obj.is_object()) fail(path, "must be an object");
  DatasetConfig ds;
  ds.key = util::trim_ws(read_string(obj, "key", path, ""));
  if (ds.key.empty()) fail(path + ".key", "is required");
  ds.name = read_string(obj, "name", path, ds.key);
  ds.description = read_string(obj, "description", path, "");
  ds.active = read_bool(obj, "active", path, true);

  ConnectionDescriptor& conn = ds.connection;
  conn.dataset_key = ds.key;
  conn.backend = util::to_lower(read_string(obj, "backend", path, "sqlite"));
  conn.host = read_string(obj, "host", path, "");
  conn.database = read_string(obj, "database", path, "");
  if (conn.database.empty()) fail(path + ".database", "is required");
  conn.user = read_string(obj, "user", path, "");
  conn.password = read_string(obj, "password", path, "");
  if (const json* port = find_field(obj, "port")) {
    if (!port->is_number_integer() || port->get<int64_t>() < 0 || port->get<int64_t>() > 65535) {
      fail(path + ".port", "must be an integer in [0, 65535]");
    }
    conn.port = port->get<int>();
  }
  conn.read_only = read_bool(obj, "read_only", path, false);
  if (!conn.read_only) {
    fail(path + ".read_only", "must be true; datasets are only reachable through read-only credentials");
  }
  conn.limits = read_limits(obj, path, base.defaults);
  ds.comparison = read_comparison(obj, path, base.comparison);
  return ds;
}

}  // namespace

JudgeConfig parse_judge_config(const std::string& json_text) {
  json root;
  try {
    root = json::parse(json_text);
  } catch (const json::parse_error& ex) {
    throw JudgeError(ErrorKind::InternalFault,
                     std::string("Invalid judge config: malformed JSON: ") + ex.what());
  }
  if (!root.is_object()) fail("document", "must be a JSON object");

  JudgeConfig config;
  if (const json* defaults = find_field(root, "defaults")) {
    if (!defaults->is_object()) fail("defaults", "must be an object");
    config.defaults = read_limits(*defaults, "defaults", config.defaults);
  }
  if (const json* comparison = find_field(root, "comparison")) {
    if (!comparison->is_object()) fail("comparison", "must be an object");
    config.comparison = read_comparison(*comparison, "comparison", config.comparison);
  }
  if (const json* reference = find_field(root, "reference")) {
    if (!reference->is_object()) fail("reference", "must be an object");
    config.reference = read_reference(*reference);
  }

  const json* datasets = find_field(root, "datasets");
  if (!datasets || !datasets->is_array()) fail("datasets", "must be an array");
  std::set<std::string> keys;
  for (size_t i = 0; i < datasets->size(); ++i) {
    const std::string path = "datasets[" + std::to_string(i) + "]";
    DatasetConfig ds = read_dataset((*datasets)[i], path, config);
    if (!keys.insert(ds.key).second) fail(path + ".key", "duplicates '" + ds.key + "'");
    config.datasets.push_back(std::move(ds));
  }
  return config;
}

JudgeConfig load_judge_config(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw JudgeError(ErrorKind::InternalFault, "Failed to open judge config: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  JudgeConfig config = parse_judge_config(buffer.str());

  // WHY: configs ship next to their dataset files, so relative paths follow the config.
  const std::filesystem::path base = std::filesystem::path(path).parent_path();
  for (auto& ds : config.datasets) {
    std::string& database = ds.connection.database;
    if (ds.connection.backend != "sqlite" || database == ":memory:" ||
        database.rfind("file:", 0) == 0) {
      continue;
    }
    std::filesystem::path db_path(database);
    if (db_path.is_relative() && !base.empty()) {
      database = (base / db_path).lexically_normal().string();
    }
  }
  log::info("loaded " + std::to_string(config.datasets.size()) + " dataset(s) from " + path);
  return config;
}

}  // namespace sqljudge
