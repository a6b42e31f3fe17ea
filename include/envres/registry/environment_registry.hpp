// envres/registry/environment_registry.hpp - Named environment registry
//
// Owns the resolved descriptors of one resolution run. Append-only; names are
// unique. Registration and lookup are serialised by an internal mutex.
//
#pragma once

#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "envres/basic/error.hpp"
#include "envres/emit/descriptor_emitter.hpp"

namespace envres
{

/// Transparent hash functor for string_view heterogeneous lookup
struct RegistryHash
{
  using is_transparent = void;
  size_t operator()(std::string_view sv) const noexcept
  {
    return std::hash<std::string_view>{}(sv);
  }
};

/// Transparent equality functor for string_view heterogeneous lookup
struct RegistryEqual
{
  using is_transparent = void;
  bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

class EnvironmentRegistry
{
public:
  EnvironmentRegistry() = default;

  // Non-copyable, non-movable (owns the mutex)
  EnvironmentRegistry(const EnvironmentRegistry &) = delete;
  EnvironmentRegistry & operator=(const EnvironmentRegistry &) = delete;

  /**
   * Register a resolved descriptor.
   *
   * @return DuplicateNameError if the name is already present; the earlier
   *         registration is kept unchanged
   */
  Result<void> register_descriptor(ImmutableDescriptor descriptor);

  /**
   * Look up an environment by name.
   *
   * @return The descriptor, or NotFoundError
   */
  [[nodiscard]] Result<ImmutableDescriptor> lookup(std::string_view name) const;

  /// Every registered descriptor in registration (declaration) order
  [[nodiscard]] std::vector<ImmutableDescriptor> all() const;

  [[nodiscard]] std::vector<std::string> names() const;

  [[nodiscard]] size_t size() const;

  [[nodiscard]] bool empty() const { return size() == 0; }

private:
  mutable std::mutex mutex_;
  std::vector<ImmutableDescriptor> ordered_;
  std::unordered_map<std::string, size_t, RegistryHash, RegistryEqual> index_;
};

}  // namespace envres
