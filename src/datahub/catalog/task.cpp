#include "datahub/catalog/task.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace datahub {

auto parse_condition(std::string_view text) -> Result<ConditionKind> {
  auto token = boost::algorithm::to_lower_copy(
      boost::algorithm::trim_copy(std::string(text)));
  if (token.empty() || token == "success") {
    return ok(ConditionKind::Success);
  }
  if (token == "force") {
    return ok(ConditionKind::Force);
  }
  return fail(Error::UnknownCondition);
}

auto operator_name(const TaskPayload &payload) -> std::string_view {
  if (const auto *real = std::get_if<RealPayload>(&payload)) {
    return to_string_view(real->op);
  }
  return "virtual";
}

auto validate_task(const Task &task) -> Result<void> {
  if (!is_valid_id_text(task.id.value())) {
    return fail(Error::InvalidArgument);
  }
  const auto &policy = task.policy;
  if (policy.queue.empty() || policy.retries < 0 ||
      policy.retry_delay.count() < 0 || policy.pending_timeout.count() < 0 ||
      policy.running_timeout.count() < 0) {
    return fail(Error::InvalidArgument);
  }
  for (const auto &parent : task.parents) {
    if (!is_valid_id_text(parent.task.value())) {
      return fail(Error::InvalidArgument);
    }
  }
  return ok();
}

} // namespace datahub
