#include "execution_context.hpp"

#include <utility>

namespace tasksync {

namespace {

thread_local execution_context t_current_context;
thread_local std::shared_ptr<scheduling_context> t_current_scheduling_context;

} // namespace

execution_context execution_context::capture() { return t_current_context; }

void execution_context::restore(const execution_context &ctx) {
  t_current_context = ctx;
}

void execution_context::set_value(const std::string &key, std::string value) {
  auto copy = t_current_context.values_
                  ? std::make_shared<value_map>(*t_current_context.values_)
                  : std::make_shared<value_map>();
  (*copy)[key] = std::move(value);
  t_current_context = execution_context(std::move(copy));
}

std::optional<std::string>
execution_context::get_value(const std::string &key) {
  const auto &values = t_current_context.values_;
  if (!values)
    return std::nullopt;
  auto it = values->find(key);
  if (it == values->end())
    return std::nullopt;
  return it->second;
}

void execution_context::clear() { t_current_context = execution_context(); }

std::shared_ptr<scheduling_context> scheduling_context::current() {
  return t_current_scheduling_context;
}

void scheduling_context::set_current(std::shared_ptr<scheduling_context> ctx) {
  t_current_scheduling_context = std::move(ctx);
}

} // namespace tasksync
