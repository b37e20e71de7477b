#include "datahub/app/application.hpp"
#include "datahub/util/log.hpp"

#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <utility>

namespace datahub {

auto tracker_options(const SystemConfig &config) -> JobTracker::Options {
  JobTracker::Options options{
      .tick_interval =
          std::chrono::milliseconds(config.tracker.tick_interval_ms),
      .kill_grace = std::chrono::seconds(config.tracker.kill_grace_period_sec),
      .default_queue_concurrency = config.tracker.default_queue_concurrency,
  };
  for (const auto &queue : config.queues) {
    options.queues.emplace(queue.name, queue.concurrency);
  }
  return options;
}

Application::Application(SystemConfig config) : config_(std::move(config)) {}

Application::~Application() { stop(); }

auto Application::init() -> Result<void> {
  catalog_ = std::make_unique<TomlTaskCatalog>(config_.catalog.path);

  switch (config_.backend.mode) {
  case BackendMode::DryRun:
    backend_ = create_dry_run_backend(
        io_, completions_,
        std::chrono::milliseconds(config_.backend.simulated_duration_ms));
    break;
  }

  audit_.add(std::make_unique<LogAuditSink>());
  if (!config_.audit.file.empty()) {
    auto sink = JsonLinesAuditSink::open(config_.audit.file);
    if (!sink) {
      log::error("Cannot open audit file {}: {}", config_.audit.file,
                 sink.error().message());
      return fail(sink.error());
    }
    audit_.add(std::move(*sink));
  }

  if (!config_.tracker.state_file.empty()) {
    auto lock = StateFileLock::acquire(config_.tracker.state_file);
    if (!lock) {
      log::error("Cannot lock state file {}: {}", config_.tracker.state_file,
                 lock.error().message());
      return fail(lock.error());
    }
    state_lock_.emplace(std::move(*lock));
    state_ =
        std::make_unique<JsonFileStateRepository>(config_.tracker.state_file);
  } else {
    log::warn("No state_file configured, tracker state is not persisted");
  }

  tracker_ = std::make_unique<JobTracker>(tracker_options(config_), *catalog_,
                                          *backend_, completions_, audit_,
                                          state_.get());
  log::info("Initialized: catalog={}, backend={}, queues={}",
            config_.catalog.path, to_string_view(config_.backend.mode),
            config_.queues.size());
  return ok();
}

auto Application::run() -> Result<void> {
  if (!tracker_) {
    return fail(Error::SystemNotRunning);
  }
  if (auto r = tracker_->start(io_); !r) {
    return r;
  }
  running_.store(true, std::memory_order_release);

  boost::asio::signal_set signals(io_, SIGINT, SIGTERM);
  signals.async_wait([this](const boost::system::error_code &ec, int signo) {
    if (ec) {
      return;
    }
    log::info("Received signal {}, shutting down", signo);
    stop();
  });

  io_.run();

  if (auto r = tracker_->persist(Clock::now()); !r) {
    log::error("Final state save failed: {}", r.error().message());
    return r;
  }
  return ok();
}

auto Application::run_once() -> Result<TickStats> {
  if (!tracker_) {
    return fail(Error::SystemNotRunning);
  }
  if (auto r = tracker_->restore(); !r) {
    return fail(r.error());
  }
  auto stats = tracker_->tick(Clock::now());
  // Let a zero-duration dry run finish, then apply its reports.
  io_.poll();
  if (completions_.size() > 0) {
    stats = tracker_->tick(Clock::now());
  }
  if (auto r = tracker_->persist(Clock::now()); !r) {
    return fail(r.error());
  }
  return ok(stats);
}

auto Application::stop() noexcept -> void {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  if (tracker_) {
    tracker_->stop();
  }
  io_.stop();
}

} // namespace datahub
