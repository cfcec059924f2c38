#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>

#include "sqljudge/config.h"
#include "sqljudge/dataset_registry.h"
#include "sqljudge/executor.h"
#include "sqljudge/reference_cache.h"
#include "sqljudge/verdict.h"

namespace sqljudge {

/// One learner submission against one question.
struct JudgeRequest {
  std::string dataset_key;
  std::string reference_sql;
  std::string candidate_sql;
  std::optional<int> timeout_ms;
};

enum class JudgeStage { Start, ExecutingReference, ExecutingCandidate, Comparing, Done };

const char* judge_stage_name(JudgeStage stage);

using StageObserver = std::function<void(JudgeStage)>;

/// Public entry point of the engine.
/// judge() is safe to call from many threads; the only shared mutable state is the
/// executor's pool accounting and the reference cache.
class Judge {
 public:
  Judge(std::shared_ptr<const DatasetRegistry> registry,
        std::shared_ptr<SandboxedExecutor> executor,
        ReferencePolicy reference_policy = {});

  /// Builds registry, executor and cache from a loaded configuration.
  static std::unique_ptr<Judge> from_config(const JudgeConfig& config);

  /// Runs reference and candidate, compares them, and always returns exactly one Verdict.
  Verdict judge(const JudgeRequest& request);

  /// Receives every stage transition of every request. Set before concurrent use.
  void set_stage_observer(StageObserver observer);

  /// Cancels in-flight executions; later judge() calls return Error/InternalFault.
  void shutdown();

  const DatasetRegistry& registry() const { return *registry_; }
  SandboxedExecutor& executor() { return *executor_; }
  ReferenceCache& reference_cache() { return cache_; }

 private:
  Verdict run(const JudgeRequest& request);
  void notify(JudgeStage stage) const;
  void track(const std::shared_ptr<CancelToken>& token);
  void untrack(const std::shared_ptr<CancelToken>& token);

  std::shared_ptr<const DatasetRegistry> registry_;
  std::shared_ptr<SandboxedExecutor> executor_;
  ReferencePolicy reference_policy_;
  ReferenceCache cache_;
  StageObserver observer_;
  std::atomic<bool> shutting_down_{false};
  std::mutex inflight_mu_;
  std::unordered_set<std::shared_ptr<CancelToken>> inflight_;
};

}  // namespace sqljudge
