#include "datahub/scheduler/job_tracker.hpp"
#include "datahub/util/log.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <exception>
#include <utility>

namespace datahub {

JobTracker::JobTracker(Options options, ITaskCatalog &catalog,
                       IExecutionBackend &backend,
                       CompletionQueue &completions, IAuditSink &audit,
                       IStateRepository *state)
    : options_(std::move(options)), catalog_(catalog), backend_(backend),
      completions_(completions), audit_(audit), state_(state),
      factory_(store_), resolver_(store_),
      dispatcher_(store_, backend_, options_.queues,
                  options_.default_queue_concurrency),
      monitor_(store_, factory_, backend_, options_.kill_grace) {
  resolver_.set_on_ready([this](Instance &inst) { dispatcher_.enqueue(inst); });
  resolver_.set_on_terminal(
      [this](Instance &inst, TimePoint now) { handle_terminal(inst, now); });
  dispatcher_.set_on_terminal(
      [this](Instance &inst, TimePoint now) { handle_terminal(inst, now); });
  monitor_.set_on_terminal(
      [this](Instance &inst, TimePoint now) { handle_terminal(inst, now); });
  monitor_.set_on_activated(
      [this](Instance &inst, TimePoint now) { resolver_.evaluate(inst, now); });
}

JobTracker::~JobTracker() { stop(); }

auto JobTracker::restore() -> Result<void> {
  if (state_ == nullptr) {
    return ok();
  }
  auto loaded = state_->load();
  if (!loaded) {
    return fail(loaded.error());
  }
  if (auto r = store_.restore(std::move(loaded->instances)); !r) {
    return r;
  }
  trigger_.restore(loaded->marks);
  dispatcher_.rebuild();
  persisted_version_ = store_.version();
  marks_dirty_ = false;
  log::info("Restored {} instance(s), {} trigger mark(s)", store_.size(),
            loaded->marks.size());
  return ok();
}

auto JobTracker::refresh_graph(TickStats &stats) -> void {
  auto snapshot = catalog_.snapshot();
  if (!snapshot) {
    log::error("Catalog snapshot failed: {}, keeping previous graph",
               snapshot.error().message());
    return;
  }
  if (graph_revision_ && *graph_revision_ == snapshot->revision) {
    return;
  }

  graph_ = DependencyGraph::build(std::move(snapshot->tasks));
  graph_revision_ = snapshot->revision;
  log::debug("Dependency graph rebuilt: {} task(s), {} schedulable",
             graph_.size(), graph_.topological_order().size());

  // Only issues that were not present in the previous graph are reported.
  ankerl::unordered_dense::set<std::string> current;
  for (const auto &issue : graph_.issues()) {
    auto key = issue.key();
    if (!reported_issues_.contains(key)) {
      ++stats.new_issues;
      audit_.on_integrity_issue(issue);
    }
    current.insert(std::move(key));
  }
  reported_issues_ = std::move(current);
}

auto JobTracker::apply_report(const ExecutionReport &report, TimePoint now)
    -> bool {
  auto *inst = store_.find(report.instance_id);
  if (inst == nullptr) {
    log::warn("Report for unknown instance {}", report.instance_id);
    return false;
  }
  if (inst->state != InstanceState::Running) {
    log::debug("Ignoring late report for {} in state {}", inst->id,
               to_string_view(inst->state));
    return false;
  }

  // Once a kill was requested the outcome no longer matters.
  if (inst->kill_requested_at) {
    return monitor_.complete_kill(*inst, now);
  }

  if (report.outcome == ExecutionOutcome::Success) {
    if (!store_.transition(*inst, InstanceState::Succeeded, now,
                           FailureReason::None, report.message)) {
      return false;
    }
    handle_terminal(*inst, now);
    return true;
  }

  if (!store_.transition(*inst, InstanceState::Failed, now,
                         FailureReason::ExecutionFailure, report.message)) {
    return false;
  }
  handle_terminal(*inst, now);
  return true;
}

auto JobTracker::apply_reports(TimePoint now, TickStats &stats) -> void {
  for (const auto &report : completions_.drain()) {
    try {
      if (apply_report(report, now)) {
        ++stats.reports_applied;
      }
    } catch (const std::exception &e) {
      log::error("Failed to apply report for {}: {}", report.instance_id,
                 e.what());
    }
  }
}

auto JobTracker::fire_due_tasks(TimePoint now, TickStats &stats) -> void {
  for (const auto idx : graph_.topological_order()) {
    const auto &task = graph_.task(idx);
    try {
      auto cycle = trigger_.due(task, now);
      if (!cycle) {
        continue;
      }
      auto created = factory_.create(task, *cycle, graph_, now);
      if (!created && created.error() != make_error_code(Error::AlreadyExists)) {
        log::error("Failed to create instance of {}: {}", task.id,
                   created.error().message());
        continue;
      }
      trigger_.mark(task.id, *cycle);
      marks_dirty_ = true;
      if (created) {
        ++stats.fired;
        log::info("Fired {} for cycle {}", task.id, (*created)->cycle_id);
      }
    } catch (const std::exception &e) {
      log::error("Trigger failed for {}: {}", task.id, e.what());
    }
  }
}

auto JobTracker::handle_terminal(Instance &instance, TimePoint now) -> void {
  audit_.on_instance_terminal(instance);
  dispatcher_.on_finished(instance);
  if (is_failure(instance.state) && monitor_.schedule_retry(instance, now)) {
    return;
  }
  resolver_.on_parent_terminal(instance, graph_, now);
}

auto JobTracker::tick(TimePoint now) -> TickStats {
  TickStats stats;
  ++ticks_;

  refresh_graph(stats);
  apply_reports(now, stats);
  fire_due_tasks(now, stats);
  stats.resolved = resolver_.sweep(now);
  stats.monitor = monitor_.run(now);
  stats.dispatch = dispatcher_.dispatch(now);

  if (state_ != nullptr &&
      (marks_dirty_ || store_.version() != persisted_version_)) {
    if (auto r = persist(now); r) {
      stats.persisted = true;
    } else {
      log::error("Failed to persist tracker state: {}", r.error().message());
    }
  }
  return stats;
}

auto JobTracker::persist(TimePoint now) -> Result<void> {
  if (state_ == nullptr) {
    return ok();
  }
  TrackerState state{.instances = store_.snapshot(),
                     .marks = trigger_.marks(),
                     .saved_at = now};
  if (auto r = state_->save(state); !r) {
    return r;
  }
  persisted_version_ = store_.version();
  marks_dirty_ = false;
  return ok();
}

auto JobTracker::skip(const InstanceId &id, TimePoint now) -> Result<void> {
  auto *inst = store_.find(id);
  if (inst == nullptr) {
    return fail(Error::NotFound);
  }
  if (inst->state != InstanceState::Waiting) {
    return fail(Error::InvalidState);
  }
  if (auto r = store_.transition(*inst, InstanceState::Skipped, now,
                                 FailureReason::OperatorSkipped,
                                 "skipped by operator");
      !r) {
    return r;
  }
  log::info("Operator skipped {}", id);
  handle_terminal(*inst, now);
  return ok();
}

auto JobTracker::stats() const -> TrackerStats {
  return TrackerStats{
      .ticks = ticks_,
      .tasks = graph_.size(),
      .excluded_tasks = graph_.size() - graph_.topological_order().size(),
      .instances = store_.size(),
      .by_state = store_.state_counts(),
      .queues = dispatcher_.queue_stats(),
  };
}

auto JobTracker::run_loop() -> boost::asio::awaitable<void> {
  while (running_.load(std::memory_order_acquire)) {
    try {
      tick(Clock::now());
    } catch (const std::exception &e) {
      log::error("Tick failed: {}", e.what());
    }

    timer_->expires_after(options_.tick_interval);
    boost::system::error_code ec;
    co_await timer_->async_wait(
        boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec == boost::asio::error::operation_aborted) {
      co_return;
    }
    if (ec) {
      log::warn("Tracker timer wait failed: {}", ec.message());
      co_return;
    }
  }
}

auto JobTracker::start(boost::asio::io_context &io) -> Result<void> {
  if (running_.exchange(true, std::memory_order_acq_rel)) {
    return fail(Error::AlreadyExists);
  }
  if (auto r = restore(); !r) {
    running_.store(false, std::memory_order_release);
    return r;
  }
  timer_ = std::make_unique<boost::asio::steady_timer>(io);
  boost::asio::co_spawn(io, run_loop(), boost::asio::detached);
  log::info("Job tracker started, tick interval {} ms",
            options_.tick_interval.count());
  return ok();
}

auto JobTracker::stop() -> void {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  if (timer_) {
    timer_->cancel();
  }
  log::info("Job tracker stopped after {} tick(s)", ticks_);
}

} // namespace datahub
