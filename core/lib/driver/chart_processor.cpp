// chartscan/driver/chart_processor.cpp - Chart scan driver implementation
//
#include "chartscan/driver/chart_processor.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <atomic>
#include <system_error>
#include <thread>
#include <utility>

#include "chartscan/analysis/reference_resolver.hpp"
#include "chartscan/basic/diagnostic.hpp"
#include "chartscan/basic/logger.hpp"
#include "chartscan/chart/chart_manifest.hpp"
#include "chartscan/driver/dependency_guard.hpp"
#include "chartscan/templates/reference_extractor.hpp"
#include "chartscan/values/value_merger.hpp"
#include "chartscan/values/values_loader.hpp"

namespace fs = std::filesystem;

namespace chartscan
{

namespace
{

bool check_values_files_exist(const std::vector<fs::path> & values_files, DiagnosticBag & diags)
{
  bool all_exist = true;
  for (const auto & f : values_files) {
    std::error_code ec;
    if (!fs::exists(f, ec)) {
      diags.report_error(ErrorKind::ConfigError, "Values file does not exist: " + f.string());
      all_exist = false;
    }
  }
  return all_exist;
}

/// Returns true if helm reported failure.
bool lint_chart(
  HelmClient & helm, const fs::path & chart_dir, const std::vector<fs::path> & values_files,
  DiagnosticBag & diags)
{
  const ToolOutput out = helm.lint(chart_dir, values_files);
  if (out.success) {
    return false;
  }
  for (auto & line : parse_error_lines(out.output)) {
    diags.report_error(ErrorKind::ExternalToolError, std::move(line));
  }
  for (auto & line : filter_marked_lines(out.output, k_warning_marker)) {
    diags.report_warning(ErrorKind::ExternalToolError, std::move(line));
  }
  return true;
}

ValueMapping load_and_merge_values(
  const fs::path & chart_dir, const std::vector<fs::path> & values_files, DiagnosticBag & diags)
{
  ValueMapping merged;
  const fs::path chart_values = chart_dir / k_chart_values_file_name;

  std::error_code ec;
  const fs::file_status st = fs::status(chart_values, ec);
  if (fs::exists(st)) {
    ValuesLoadResult loaded = load_values_file(chart_values);
    if (!loaded.success) {
      diags.report_error(loaded.error_kind, "Error loading values.yaml: " + loaded.error)
        .with_location(chart_values);
    } else {
      merge_values(merged, loaded.values);
    }
  } else if (ec && ec != std::errc::no_such_file_or_directory) {
    diags.report_error(ErrorKind::LoadError, "Error checking values.yaml: " + ec.message())
      .with_location(chart_values);
  }

  for (const auto & f : values_files) {
    if (f == chart_values) {
      continue;
    }
    ValuesLoadResult loaded = load_values_file(f);
    if (!loaded.success) {
      diags
        .report_error(
          loaded.error_kind, "Error loading additional values file " + f.string() + ": " + loaded.error)
        .with_location(f);
      continue;
    }
    merge_values(merged, loaded.values);
  }

  return merged;
}

ChartResult make_result(const fs::path & chart_dir, const DiagnosticBag & diags)
{
  ChartResult result;
  result.path = chart_dir.string();
  result.errors = diags.error_messages();
  result.success = result.errors.empty();
  return result;
}

}  // namespace

const char * to_string(ChartStage stage) noexcept
{
  switch (stage) {
    case ChartStage::Pending:
      return "Pending";
    case ChartStage::DependenciesResolved:
      return "DependenciesResolved";
    case ChartStage::Linted:
      return "Linted";
    case ChartStage::TemplatesParsed:
      return "TemplatesParsed";
    case ChartStage::ValuesLoaded:
      return "ValuesLoaded";
    case ChartStage::Resolved:
      return "Resolved";
    case ChartStage::Done:
      return "Done";
  }
  return "Done";
}

// ============================================================================
// ResultCollector / ScanReport
// ============================================================================

void ResultCollector::add(ChartResult result)
{
  const std::lock_guard<std::mutex> lock(mutex_);
  if (!result.success) {
    ++invalid_count_;
  }
  results_.push_back(std::move(result));
}

std::vector<ChartResult> ResultCollector::take_results()
{
  const std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ChartResult> out = std::move(results_);
  results_.clear();
  return out;
}

int ResultCollector::invalid_count() const
{
  const std::lock_guard<std::mutex> lock(mutex_);
  return invalid_count_;
}

void ScanReport::sort_by_path()
{
  std::stable_sort(results.begin(), results.end(), [](const ChartResult & a, const ChartResult & b) {
    return a.path < b.path;
  });
}

// ============================================================================
// ChartProcessor
// ============================================================================

ChartProcessor::ChartProcessor(HelmClient & helm, ScanOptions options, Logger * logger)
: helm_(helm), options_(std::move(options)), logger_(logger)
{
}

void ChartProcessor::enter_stage(
  const fs::path & chart_dir, ChartStage & current, ChartStage next) const
{
  current = next;
  if (logger_ != nullptr) {
    logger_->verbose("{}: {}", chart_dir.string(), to_string(next));
  }
}

ChartResult ChartProcessor::finish(const fs::path & chart_dir, const DiagnosticBag & diags) const
{
  if (logger_ != nullptr) {
    for (const auto & d : diags.errors()) {
      if (!d.location && !d.help_message) {
        continue;
      }
      std::string where = chart_dir.string();
      if (d.location) {
        where = d.location->has_line()
                  ? fmt::format("{}:{}", d.location->file.string(), d.location->line)
                  : d.location->file.string();
      }
      logger_->verbose("{}: {} [{}]", where, d.message, to_string(d.kind));
      if (d.help_message) {
        std::string help = *d.help_message;
        while (!help.empty() && (help.back() == '\n' || help.back() == '\r')) {
          help.pop_back();
        }
        if (!help.empty()) {
          logger_->verbose("{}: help: {}", chart_dir.string(), help);
        }
      }
    }
  }
  return make_result(chart_dir, diags);
}

ChartResult ChartProcessor::scan_chart(const fs::path & chart_dir) const
{
  try {
    return run_pipeline(chart_dir);
  } catch (const std::exception & e) {
    DiagnosticBag diags;
    diags.report_error(
      ErrorKind::InternalError, "Internal error while scanning chart: " + std::string(e.what()));
    return make_result(chart_dir, diags);
  }
}

ChartResult ChartProcessor::run_pipeline(const fs::path & chart_dir) const
{
  DiagnosticBag diags;
  ChartStage stage = ChartStage::Pending;

  if (chart_dir.empty()) {
    diags.report_error(ErrorKind::ConfigError, "Chart path is empty");
    enter_stage(chart_dir, stage, ChartStage::Done);
    return finish(chart_dir, diags);
  }

  if (logger_ != nullptr) {
    logger_->info("Scanning: {}", chart_dir.string());
  }

  // Declared before any helm call so cleanup runs on every path out.
  DependencyArtifactsGuard dependency_artifacts(chart_dir);

  // 1. Dependencies (short-circuits)
  if (!resolve_dependencies(helm_, chart_dir, dependency_artifacts, diags)) {
    enter_stage(chart_dir, stage, ChartStage::Done);
    return finish(chart_dir, diags);
  }
  enter_stage(chart_dir, stage, ChartStage::DependenciesResolved);

  // 2. Operator values files must exist (short-circuits)
  if (!check_values_files_exist(options_.values_files, diags)) {
    enter_stage(chart_dir, stage, ChartStage::Done);
    return finish(chart_dir, diags);
  }

  // 3. Lint
  if (lint_chart(helm_, chart_dir, options_.values_files, diags) && logger_ != nullptr) {
    logger_->verbose("{}: helm lint reported failure", chart_dir.string());
    for (const auto & w : diags.warnings()) {
      logger_->warn("{}: {}", chart_dir.string(), w.message);
    }
  }
  enter_stage(chart_dir, stage, ChartStage::Linted);

  // 4. Templates
  TemplateScanResult templates = scan_templates(chart_dir);
  diags.merge(std::move(templates.diagnostics));
  enter_stage(chart_dir, stage, ChartStage::TemplatesParsed);

  // 5. Values
  ValueMapping values = load_and_merge_values(chart_dir, options_.values_files, diags);
  enter_stage(chart_dir, stage, ChartStage::ValuesLoaded);

  // 6. Resolution
  std::vector<std::string> undefined = check_references(templates.references, values);
  for (const auto & msg : undefined) {
    diags.report_error(ErrorKind::UndefinedValue, msg);
  }
  enter_stage(chart_dir, stage, ChartStage::Resolved);

  ChartResult result = finish(chart_dir, diags);
  result.values = std::move(values);
  result.undefined_values = std::move(undefined);

  enter_stage(chart_dir, stage, ChartStage::Done);
  if (logger_ != nullptr) {
    logger_->verbose(
      "{}: {} reference(s), {} error(s)", chart_dir.string(), templates.references.size(),
      result.errors.size());
  }
  return result;
}

unsigned ChartProcessor::worker_count(size_t chart_count) const noexcept
{
  if (chart_count == 0) {
    return 0;
  }
  unsigned jobs = options_.jobs;
  if (jobs == 0) {
    jobs = std::max(1U, std::thread::hardware_concurrency());
  }
  return static_cast<unsigned>(std::min<size_t>(jobs, chart_count));
}

ScanReport ChartProcessor::scan_charts(const std::vector<fs::path> & chart_dirs) const
{
  const auto start = std::chrono::steady_clock::now();

  ResultCollector collector;
  std::atomic<size_t> next{0};

  auto worker = [&]() {
    for (;;) {
      const size_t index = next.fetch_add(1);
      if (index >= chart_dirs.size()) {
        return;
      }
      collector.add(scan_chart(chart_dirs[index]));
    }
  };

  // The calling thread is one of the workers.
  const unsigned workers = worker_count(chart_dirs.size());
  std::vector<std::thread> threads;
  if (workers > 1) {
    threads.reserve(workers - 1);
    for (unsigned i = 1; i < workers; ++i) {
      try {
        threads.emplace_back(worker);
      } catch (const std::system_error & e) {
        if (logger_ != nullptr) {
          logger_->warn("could not start worker thread: {}", e.what());
        }
        break;
      }
    }
  }
  worker();
  for (auto & t : threads) {
    t.join();
  }

  ScanReport report;
  report.invalid_charts = collector.invalid_count();
  report.results = collector.take_results();
  report.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
    std::chrono::steady_clock::now() - start);
  return report;
}

}  // namespace chartscan
