#include "datahub/executor/backend.hpp"
#include "datahub/util/log.hpp"

#include <boost/asio/steady_timer.hpp>

#include <ankerl/unordered_dense.h>

#include <memory>
#include <utility>

namespace datahub {

namespace {

class DryRunBackend final : public IExecutionBackend {
public:
  DryRunBackend(boost::asio::io_context &io, CompletionQueue &completions,
                std::chrono::milliseconds duration)
      : io_(io), completions_(completions), duration_(duration) {}

  ~DryRunBackend() override {
    for (auto &[id, pending] : pending_) {
      pending.timer->cancel();
    }
  }

  auto submit(const DispatchRequest &request) -> Result<void> override {
    if (pending_.contains(request.instance_id)) {
      return fail(Error::AlreadyExists);
    }

    log::info("[dry-run] {} {} (mirror {}, queue {})", request.instance_id,
              to_string_view(request.op), request.mirror_id, request.queue);

    auto timer = std::make_shared<boost::asio::steady_timer>(io_);
    timer->expires_after(duration_);
    ExecutionReport report{.instance_id = request.instance_id,
                           .task_id = request.task_id,
                           .cycle_id = request.cycle_id,
                           .attempt = request.attempt,
                           .outcome = ExecutionOutcome::Success,
                           .started_at = Clock::now()};
    pending_.emplace(request.instance_id, Pending{timer, report});

    timer->async_wait([this, id = request.instance_id,
                       timer](const boost::system::error_code &ec) {
      if (ec == boost::asio::error::operation_aborted) {
        return;
      }
      finish(id, ExecutionOutcome::Success, "dry run");
    });
    return ok();
  }

  auto kill(const InstanceId &instance_id) -> void override {
    auto it = pending_.find(instance_id);
    if (it == pending_.end()) {
      return;
    }
    it->second.timer->cancel();
    finish(instance_id, ExecutionOutcome::Failure, "killed");
  }

private:
  struct Pending {
    std::shared_ptr<boost::asio::steady_timer> timer;
    ExecutionReport report;
  };

  auto finish(const InstanceId &id, ExecutionOutcome outcome,
              std::string message) -> void {
    auto it = pending_.find(id);
    if (it == pending_.end()) {
      return;
    }
    auto report = std::move(it->second.report);
    pending_.erase(it);
    report.outcome = outcome;
    report.finished_at = Clock::now();
    report.message = std::move(message);
    completions_.push(std::move(report));
  }

  boost::asio::io_context &io_;
  CompletionQueue &completions_;
  std::chrono::milliseconds duration_;
  ankerl::unordered_dense::map<InstanceId, Pending> pending_;
};

} // namespace

auto create_dry_run_backend(boost::asio::io_context &io,
                            CompletionQueue &completions,
                            std::chrono::milliseconds simulated_duration)
    -> std::unique_ptr<IExecutionBackend> {
  return std::make_unique<DryRunBackend>(io, completions, simulated_duration);
}

} // namespace datahub
