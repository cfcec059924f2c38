#include "sqljudge/judge.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <future>
#include <utility>

#include "sqljudge/comparator.h"
#include "sqljudge/errors.h"
#include "sqljudge/log.h"
#include "sqljudge/normalizer.h"
#include "sqljudge/statement_filter.h"
#include "util/string_util.h"

namespace sqljudge {

namespace {

struct Execution {
  std::shared_ptr<const ResultTable> table;
  int64_t elapsed_ms = 0;
  bool from_cache = false;
};

JudgeError to_judge_error(std::exception_ptr eptr) {
  try {
    std::rethrow_exception(eptr);
  } catch (const JudgeError& e) {
    return e;
  } catch (const std::exception& e) {
    return JudgeError(ErrorKind::InternalFault, std::string("Internal error: ") + e.what());
  }
}

/// Runs one side; `out.elapsed_ms` is set even when the statement throws.
void timed_execute(SandboxedExecutor& executor,
                   const ConnectionDescriptor& target,
                   const std::string& sql,
                   const ExecuteOptions& options,
                   Execution& out) {
  ExecutionStats stats;
  ExecuteOptions timed = options;
  timed.stats = &stats;
  struct Record {
    Execution& execution;
    const ExecutionStats& measured;
    ~Record() { execution.elapsed_ms = measured.elapsed_ms; }
  } record{out, stats};
  out.table = std::make_shared<const ResultTable>(executor.execute(target, sql, timed));
}

ResultPreview make_result_preview(const ResultTable& table, size_t limit) {
  ResultPreview preview;
  preview.columns = table.columns;
  preview.total_rows = table.rows.size();
  const size_t n = std::min(limit, table.rows.size());
  for (size_t i = 0; i < n; ++i) {
    std::vector<std::string> row;
    row.reserve(table.rows[i].size());
    for (const auto& value : table.rows[i]) row.push_back(value_to_display(value));
    preview.rows.push_back(std::move(row));
  }
  return preview;
}

Verdict error_verdict(const JudgeError& error, const std::string& sql, bool reference) {
  Verdict verdict;
  verdict.status = VerdictStatus::Error;
  verdict.reason = error.kind();
  verdict.message = reference ? "Reference query failed: " + std::string(error.what()) : error.what();
  verdict.diagnostics.push_back(make_error_diagnostic(sql, error));
  if (error.kind() == ErrorKind::InternalFault) {
    log::error(verdict.message);
  }
  return verdict;
}

/// Error verdict for a failed side, carrying whatever timing both sides reached.
Verdict side_error_verdict(const JudgeError& error, const JudgeRequest& request, bool reference,
                           const Execution& reference_run, const Execution& candidate_run) {
  Verdict verdict =
      error_verdict(error, reference ? request.reference_sql : request.candidate_sql, reference);
  verdict.elapsed_ms = candidate_run.elapsed_ms;
  verdict.reference_elapsed_ms = reference_run.elapsed_ms;
  verdict.reference_from_cache = reference_run.from_cache;
  return verdict;
}

/// Completion state shared by the two concurrent executions of one request.
struct PairState {
  std::mutex mu;
  std::condition_variable cv;
  int finished = 0;
  Execution reference;
  Execution candidate;
  std::exception_ptr first_error;
  bool first_error_is_reference = false;
};

}  // namespace

const char* judge_stage_name(JudgeStage stage) {
  switch (stage) {
    case JudgeStage::Start:
      return "Start";
    case JudgeStage::ExecutingReference:
      return "ExecutingReference";
    case JudgeStage::ExecutingCandidate:
      return "ExecutingCandidate";
    case JudgeStage::Comparing:
      return "Comparing";
    case JudgeStage::Done:
      return "Done";
  }
  return "Unknown";
}

Judge::Judge(std::shared_ptr<const DatasetRegistry> registry,
             std::shared_ptr<SandboxedExecutor> executor,
             ReferencePolicy reference_policy)
    : registry_(std::move(registry)),
      executor_(std::move(executor)),
      reference_policy_(reference_policy),
      cache_(reference_policy.max_entries, std::chrono::milliseconds(reference_policy.ttl_ms)) {
  if (!registry_ || !executor_) {
    throw JudgeError(ErrorKind::InternalFault, "Judge requires a registry and an executor");
  }
}

std::unique_ptr<Judge> Judge::from_config(const JudgeConfig& config) {
  auto registry = std::make_shared<const DatasetRegistry>(config.datasets);
  auto executor = std::make_shared<SandboxedExecutor>(registry);
  log::info("judge ready with " + std::to_string(registry->keys().size()) + " active dataset(s)");
  return std::make_unique<Judge>(std::move(registry), std::move(executor), config.reference);
}

void Judge::set_stage_observer(StageObserver observer) { observer_ = std::move(observer); }

void Judge::notify(JudgeStage stage) const {
  log::debug(std::string("judge stage ") + judge_stage_name(stage));
  if (observer_) observer_(stage);
}

void Judge::track(const std::shared_ptr<CancelToken>& token) {
  std::lock_guard<std::mutex> lock(inflight_mu_);
  inflight_.insert(token);
}

void Judge::untrack(const std::shared_ptr<CancelToken>& token) {
  std::lock_guard<std::mutex> lock(inflight_mu_);
  inflight_.erase(token);
}

void Judge::shutdown() {
  shutting_down_.store(true);
  {
    std::lock_guard<std::mutex> lock(inflight_mu_);
    for (const auto& token : inflight_) token->cancel();
  }
  executor_->shutdown();
  log::info("judge shut down");
}

Verdict Judge::judge(const JudgeRequest& request) {
  notify(JudgeStage::Start);
  Verdict verdict;
  if (shutting_down_.load()) {
    verdict = error_verdict(JudgeError(ErrorKind::InternalFault, "judge is shutting down"),
                            request.candidate_sql, false);
  } else {
    try {
      verdict = run(request);
    } catch (const JudgeError& e) {
      verdict = error_verdict(e, request.candidate_sql, false);
    } catch (const std::exception& e) {
      verdict = error_verdict(JudgeError(ErrorKind::InternalFault, std::string("Internal error: ") + e.what()),
                              request.candidate_sql, false);
    }
  }
  notify(JudgeStage::Done);
  return verdict;
}

Verdict Judge::run(const JudgeRequest& request) {
  // Fail-fast preconditions: nothing executes until these pass.
  if (util::is_blank(request.candidate_sql)) {
    throw JudgeError(ErrorKind::InvalidRequest, "Candidate SQL is empty");
  }
  if (util::is_blank(request.reference_sql)) {
    return error_verdict(JudgeError(ErrorKind::InvalidRequest, "Reference SQL is empty"),
                         request.reference_sql, true);
  }
  const DatasetConfig& dataset = registry_->dataset(request.dataset_key);
  if (request.timeout_ms.has_value() && *request.timeout_ms <= 0) {
    throw JudgeError(ErrorKind::InvalidRequest, "Timeout must be a positive number of milliseconds");
  }
  enforce_read_only(request.candidate_sql);

  auto token = std::make_shared<CancelToken>();
  track(token);
  struct Untrack {
    Judge* self;
    std::shared_ptr<CancelToken> token;
    ~Untrack() { self->untrack(token); }
  } untrack_guard{this, token};

  ExecuteOptions options;
  options.timeout_ms = request.timeout_ms;
  options.cancel = token;

  const bool use_cache = reference_policy_.policy == ReferenceCachePolicy::Cached;
  Execution reference;
  Execution candidate;
  if (use_cache) {
    if (auto hit = cache_.lookup(dataset.key, request.reference_sql); hit.has_value()) {
      reference.table = hit->table;
      reference.elapsed_ms = hit->elapsed_ms;
      reference.from_cache = true;
    }
  }

  // WHY: with a single pooled connection the two sides would only queue on each other.
  const bool concurrent = reference_policy_.concurrent && dataset.connection.limits.pool_size >= 2;
  if (!reference.from_cache && concurrent) {
    auto state = std::make_shared<PairState>();
    auto launch = [&, state](bool is_reference) {
      return std::async(std::launch::async, [this, &dataset, &request, &options, state, token,
                                             is_reference]() {
        const std::string& sql = is_reference ? request.reference_sql : request.candidate_sql;
        Execution out;
        std::exception_ptr error;
        try {
          timed_execute(*executor_, dataset.connection, sql, options, out);
        } catch (...) {
          error = std::current_exception();
        }
        {
          std::lock_guard<std::mutex> lock(state->mu);
          if (error && !state->first_error) {
            state->first_error = error;
            state->first_error_is_reference = is_reference;
          }
          if (is_reference) {
            state->reference = std::move(out);
          } else {
            state->candidate = std::move(out);
          }
          ++state->finished;
        }
        // The sibling is no longer needed once either side fails.
        if (error) token->cancel();
        state->cv.notify_all();
      });
    };
    notify(JudgeStage::ExecutingReference);
    std::future<void> ref_task = launch(true);
    notify(JudgeStage::ExecutingCandidate);
    std::future<void> cand_task = launch(false);
    {
      std::unique_lock<std::mutex> lock(state->mu);
      state->cv.wait(lock, [&] { return state->first_error || state->finished == 2; });
    }
    ref_task.wait();
    cand_task.wait();
    if (state->first_error) {
      return side_error_verdict(to_judge_error(state->first_error), request,
                                state->first_error_is_reference, state->reference, state->candidate);
    }
    reference = std::move(state->reference);
    candidate = std::move(state->candidate);
  } else {
    notify(JudgeStage::ExecutingReference);
    if (!reference.from_cache) {
      try {
        timed_execute(*executor_, dataset.connection, request.reference_sql, options, reference);
      } catch (const JudgeError& e) {
        return side_error_verdict(e, request, true, reference, candidate);
      }
    }
    notify(JudgeStage::ExecutingCandidate);
    try {
      timed_execute(*executor_, dataset.connection, request.candidate_sql, options, candidate);
    } catch (const JudgeError& e) {
      return side_error_verdict(e, request, false, reference, candidate);
    }
  }

  if (use_cache && !reference.from_cache) {
    cache_.store(dataset.key, request.reference_sql, reference.table, reference.elapsed_ms);
  }

  notify(JudgeStage::Comparing);
  NormalizedTable normalized_reference;
  try {
    normalized_reference = normalize(*reference.table, dataset.comparison);
  } catch (const JudgeError& e) {
    return side_error_verdict(e, request, true, reference, candidate);
  }
  NormalizedTable normalized_candidate;
  try {
    normalized_candidate = normalize(*candidate.table, dataset.comparison);
  } catch (const JudgeError& e) {
    return side_error_verdict(e, request, false, reference, candidate);
  }

  Verdict verdict = compare(normalized_reference, normalized_candidate);
  verdict.elapsed_ms = candidate.elapsed_ms;
  verdict.reference_elapsed_ms = reference.elapsed_ms;
  verdict.reference_from_cache = reference.from_cache;
  verdict.result_preview = make_result_preview(*candidate.table, dataset.comparison.preview_rows);
  return verdict;
}

}  // namespace sqljudge
