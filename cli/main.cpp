#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "sqljudge/sqljudge.h"
#include "export/export_sinks.h"
#include "render/table_renderer.h"
#include "cli_args.h"
#include "cli_utils.h"

using namespace sqljudge::cli;

namespace {

constexpr int kExitPass = 0;
constexpr int kExitFail = 1;
constexpr int kExitUsage = 2;
constexpr int kExitError = 3;

int exit_code_for(const sqljudge::Verdict& verdict) {
  switch (verdict.status) {
    case sqljudge::VerdictStatus::Pass:
      return kExitPass;
    case sqljudge::VerdictStatus::Fail:
      return kExitFail;
    case sqljudge::VerdictStatus::Error:
      return kExitError;
  }
  return kExitError;
}

void print_error(const std::string& sql, const sqljudge::JudgeError& error, const std::string& format) {
  std::vector<sqljudge::Diagnostic> diagnostics{sqljudge::make_error_diagnostic(sql, error)};
  if (format == "json") {
    std::cout << sqljudge::render_diagnostics_json(diagnostics) << std::endl;
  } else {
    std::cerr << sqljudge::error_kind_name(error.kind()) << ": " << error.what() << "\n"
              << sqljudge::render_diagnostics_text(diagnostics);
  }
}

int run_lint(const CliOptions& options) {
  std::vector<sqljudge::Diagnostic> diagnostics = sqljudge::lint_statement(options.lint_sql);
  if (options.format == "json") {
    std::cout << sqljudge::render_diagnostics_json(diagnostics) << std::endl;
  } else if (diagnostics.empty()) {
    std::cout << "No diagnostics." << std::endl;
  } else {
    std::cout << sqljudge::render_diagnostics_text(diagnostics) << std::endl;
  }
  return diagnostics.empty() ? kExitPass : kExitFail;
}

int run_list_datasets(const sqljudge::JudgeConfig& config) {
  for (const auto& ds : config.datasets) {
    std::cout << ds.key;
    if (!ds.name.empty()) std::cout << "\t" << ds.name;
    if (!ds.active) std::cout << "\t(inactive)";
    std::cout << "\n";
  }
  return kExitPass;
}

int run_describe(sqljudge::Judge& judge, const CliOptions& options) {
  try {
    sqljudge::DatasetPreview preview = judge.executor().describe_dataset(options.dataset);
    if (options.format == "json") {
      std::cout << sqljudge::render::render_dataset_preview_json(preview) << std::endl;
    } else {
      std::cout << sqljudge::render::render_dataset_preview(preview, sqljudge::render::TableOptions{});
    }
    return kExitPass;
  } catch (const sqljudge::JudgeError& e) {
    print_error("", e, options.format);
    return kExitError;
  }
}

int run_single_query(sqljudge::Judge& judge, const CliOptions& options) {
  try {
    sqljudge::ExecuteOptions exec;
    exec.timeout_ms = options.timeout_ms;
    const sqljudge::ConnectionDescriptor& target = judge.registry().resolve(options.dataset);
    sqljudge::ResultTable table = judge.executor().execute(target, options.run_sql, exec);
    if (!options.export_path.empty()) {
      std::string error;
      if (!export_table(table, options.export_path, error)) {
        std::cerr << "Error: " << error << std::endl;
        return kExitUsage;
      }
      std::cout << "Wrote " << table.rows.size() << " row(s) to " << options.export_path << std::endl;
      return kExitPass;
    }
    if (options.format == "json") {
      write_json(table, std::cout);
    } else {
      std::cout << sqljudge::render::render_table(table, sqljudge::render::TableOptions{});
    }
    return kExitPass;
  } catch (const sqljudge::JudgeError& e) {
    print_error(options.run_sql, e, options.format);
    return kExitError;
  }
}

int run_judge(sqljudge::Judge& judge, const CliOptions& options) {
  sqljudge::JudgeRequest request;
  request.dataset_key = options.dataset;
  request.timeout_ms = options.timeout_ms;
  try {
    request.reference_sql = resolve_sql(options.reference, options.reference_file);
    request.candidate_sql = resolve_sql(options.candidate, options.candidate_file);
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << std::endl;
    return kExitUsage;
  }
  sqljudge::Verdict verdict = judge.judge(request);
  if (options.format == "json") {
    std::cout << sqljudge::render_verdict_json(verdict) << std::endl;
  } else {
    std::cout << sqljudge::render_verdict_text(verdict);
  }
  return exit_code_for(verdict);
}

}  // namespace

/// Entry point that parses CLI options and dispatches to one mode.
/// MUST preserve exit codes for script usage and MUST not hide fatal errors.
int main(int argc, char** argv) {
  if (argc == 1) {
    print_startup_help(std::cout);
    return kExitPass;
  }
  CliOptions options;
  std::string arg_error;
  if (!parse_cli_args(argc, argv, options, arg_error)) {
    std::cerr << arg_error << "\n";
    return kExitUsage;
  }
  if (options.show_help) {
    print_help(std::cout);
    return kExitPass;
  }
  if (options.show_version) {
    std::cout << "sqljudge " << sqljudge::version_string() << std::endl;
    return kExitPass;
  }
  if (options.lint) return run_lint(options);

  const std::string config_path = resolve_config_path(options);
  if (config_path.empty()) {
    std::cerr << "Missing --config (or set SQLJUDGE_CONFIG)\n";
    return kExitUsage;
  }
  sqljudge::JudgeConfig config;
  try {
    config = sqljudge::load_judge_config(config_path);
  } catch (const sqljudge::JudgeError& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitUsage;
  }
  if (options.list_datasets) return run_list_datasets(config);

  std::unique_ptr<sqljudge::Judge> judge;
  try {
    judge = sqljudge::Judge::from_config(config);
  } catch (const sqljudge::JudgeError& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitUsage;
  }

  int status = kExitUsage;
  if (options.describe) {
    status = run_describe(*judge, options);
  } else if (options.run) {
    status = run_single_query(*judge, options);
  } else if (!options.reference.empty() || !options.reference_file.empty()) {
    status = run_judge(*judge, options);
  } else {
    print_help(std::cerr);
  }
  judge->shutdown();
  return status;
}
