// envres/registry/environment_registry.cpp - Named environment registry
#include "envres/registry/environment_registry.hpp"

#include <fmt/core.h>

#include <utility>

namespace envres
{

Result<void> EnvironmentRegistry::register_descriptor(ImmutableDescriptor descriptor)
{
  const std::lock_guard<std::mutex> lock(mutex_);

  const std::string & name = descriptor.name();
  if (index_.find(name) != index_.end()) {
    return fail(
      ErrorKind::DuplicateName, codes::k_duplicate_name, name, "",
      fmt::format("environment '{}' is already registered", name));
  }

  index_.emplace(name, ordered_.size());
  ordered_.push_back(std::move(descriptor));
  return {};
}

Result<ImmutableDescriptor> EnvironmentRegistry::lookup(std::string_view name) const
{
  const std::lock_guard<std::mutex> lock(mutex_);

  auto it = index_.find(name);
  if (it == index_.end()) {
    return fail(
      ErrorKind::NotFound, codes::k_not_found, std::string(name), "",
      fmt::format("environment '{}' is not defined", name));
  }
  return ordered_[it->second];
}

std::vector<ImmutableDescriptor> EnvironmentRegistry::all() const
{
  const std::lock_guard<std::mutex> lock(mutex_);
  return ordered_;
}

std::vector<std::string> EnvironmentRegistry::names() const
{
  const std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> result;
  result.reserve(ordered_.size());
  for (const auto & d : ordered_) {
    result.push_back(d.name());
  }
  return result;
}

size_t EnvironmentRegistry::size() const
{
  const std::lock_guard<std::mutex> lock(mutex_);
  return ordered_.size();
}

}  // namespace envres
