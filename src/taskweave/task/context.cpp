#include "taskweave/task/context.hpp"

#include <mutex>

namespace taskweave {

auto SharedContext::set(std::string key, JsonValue value) -> void {
  std::unique_lock lock(mu_);
  values_.insert_or_assign(std::move(key), std::move(value));
}

auto SharedContext::get(std::string_view key) const
    -> std::optional<JsonValue> {
  std::shared_lock lock(mu_);
  if (auto it = values_.find(key); it != values_.end()) {
    return it->second;
  }
  return std::nullopt;
}

auto SharedContext::contains(std::string_view key) const -> bool {
  std::shared_lock lock(mu_);
  return values_.contains(key);
}

auto SharedContext::remove(std::string_view key) -> bool {
  std::unique_lock lock(mu_);
  if (auto it = values_.find(key); it != values_.end()) {
    values_.erase(it);
    return true;
  }
  return false;
}

auto SharedContext::keys() const -> std::vector<std::string> {
  std::shared_lock lock(mu_);
  std::vector<std::string> out;
  out.reserve(values_.size());
  for (const auto &[key, _] : values_) {
    out.push_back(key);
  }
  return out;
}

auto SharedContext::set_artifact(std::string name, std::string location)
    -> void {
  std::unique_lock lock(mu_);
  artifacts_.insert_or_assign(std::move(name), std::move(location));
}

auto SharedContext::get_artifact(std::string_view name) const
    -> std::optional<std::string> {
  std::shared_lock lock(mu_);
  if (auto it = artifacts_.find(name); it != artifacts_.end()) {
    return it->second;
  }
  return std::nullopt;
}

TaskContext::TaskContext(std::string task_name, WorkflowId workflow_id,
                         std::shared_ptr<SharedContext> shared,
                         std::shared_ptr<const StringMap<JsonValue>> parameters,
                         std::shared_ptr<const std::atomic<bool>> cancelled)
    : task_name_(std::move(task_name)), workflow_id_(std::move(workflow_id)),
      shared_(std::move(shared)), parameters_(std::move(parameters)),
      cancelled_(std::move(cancelled)) {}

auto TaskContext::set_input(std::string name, JsonValue value) -> void {
  inputs_.insert_or_assign(std::move(name), std::move(value));
}

auto TaskContext::get_input(std::string_view name) const -> const JsonValue * {
  auto it = inputs_.find(name);
  return it != inputs_.end() ? &it->second : nullptr;
}

auto TaskContext::set_variable(std::string name, JsonValue value) -> void {
  variables_.insert_or_assign(std::move(name), std::move(value));
}

auto TaskContext::get_variable(std::string_view name) const
    -> const JsonValue * {
  auto it = variables_.find(name);
  return it != variables_.end() ? &it->second : nullptr;
}

auto TaskContext::parameter(std::string_view key) const -> const JsonValue * {
  if (!parameters_) {
    return nullptr;
  }
  auto it = parameters_->find(key);
  return it != parameters_->end() ? &it->second : nullptr;
}

auto TaskContext::is_cancelled() const noexcept -> bool {
  return cancelled_ && cancelled_->load(std::memory_order_acquire);
}

WorkflowContext::WorkflowContext(WorkflowId workflow_id,
                                 std::string workflow_name)
    : workflow_id_(std::move(workflow_id)),
      workflow_name_(std::move(workflow_name)),
      shared_(std::make_shared<SharedContext>()),
      parameters_(std::make_shared<StringMap<JsonValue>>()),
      cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

auto WorkflowContext::create_task_context(std::string task_name) const
    -> TaskContext {
  return TaskContext{std::move(task_name), workflow_id_, shared_, parameters_,
                     cancelled_};
}

auto WorkflowContext::store_task_output(std::string task_name,
                                        JsonValue output) -> void {
  std::unique_lock lock(outputs_mu_);
  task_outputs_.insert_or_assign(std::move(task_name), std::move(output));
}

auto WorkflowContext::get_task_output(std::string_view task_name) const
    -> std::optional<JsonValue> {
  std::shared_lock lock(outputs_mu_);
  if (auto it = task_outputs_.find(task_name); it != task_outputs_.end()) {
    return it->second;
  }
  return std::nullopt;
}

auto WorkflowContext::task_outputs() const -> StringMap<JsonValue> {
  std::shared_lock lock(outputs_mu_);
  return task_outputs_;
}

auto WorkflowContext::set_parameter(std::string key, JsonValue value) -> void {
  parameters_->insert_or_assign(std::move(key), std::move(value));
}

auto WorkflowContext::get_parameter(std::string_view key) const
    -> const JsonValue * {
  auto it = parameters_->find(key);
  return it != parameters_->end() ? &it->second : nullptr;
}

auto WorkflowContext::cancel() noexcept -> void {
  cancelled_->store(true, std::memory_order_release);
}

auto WorkflowContext::is_cancelled() const noexcept -> bool {
  return cancelled_->load(std::memory_order_acquire);
}

} // namespace taskweave
