// envres/driver/resolver.cpp - Resolution driver implementation
//
#include "envres/driver/resolver.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>

#include "envres/merge/merger.hpp"
#include "envres/reference/reference_resolver.hpp"

namespace envres
{

namespace
{

SchemaValidator make_validator(const ResolveOptions & options)
{
  ValidationOptions v;
  v.mode = ValidationMode::Overlay;
  v.max_timeout_seconds = options.max_timeout_seconds;
  return SchemaValidator(v);
}

Result<ImmutableDescriptor> resolve_with_base(
  const EnvironmentOverlay & base, const RawEnvironment & environment,
  const SchemaValidator & validator)
{
  auto overlay = validator.validate(environment);
  if (!overlay) {
    return std::unexpected(std::move(overlay.error()));
  }

  auto merged = merge(base, *overlay);
  if (!merged) {
    return std::unexpected(std::move(merged.error()));
  }

  if (auto r = validator.check_invariants(*merged); !r) {
    return std::unexpected(std::move(r.error()));
  }

  auto resolved = resolve_references(std::move(*merged));
  if (!resolved) {
    return std::unexpected(std::move(resolved.error()));
  }

  return emit(std::move(*resolved));
}

/// Requested names, deduplicated, in request order
std::vector<std::string> unique_names(const std::vector<std::string> & names)
{
  std::vector<std::string> out;
  for (const auto & n : names) {
    if (std::find(out.begin(), out.end(), n) == out.end()) {
      out.push_back(n);
    }
  }
  return out;
}

}  // namespace

Result<ImmutableDescriptor> Resolver::resolve_environment(
  const RawEnvironment * defaults, const RawEnvironment & environment,
  const ResolveOptions & options)
{
  const SchemaValidator validator = make_validator(options);

  EnvironmentOverlay base;
  base.name = k_defaults_key;
  if (defaults != nullptr) {
    auto d = validator.validate(*defaults);
    if (!d) {
      return std::unexpected(std::move(d.error()));
    }
    base = std::move(*d);
  }

  return resolve_with_base(base, environment, validator);
}

Result<ImmutableDescriptor> Resolver::re_resolve(
  const ImmutableDescriptor & descriptor, const ResolveOptions & options)
{
  const RawEnvironment raw{descriptor.name(), to_raw(descriptor.get()), {}};
  return resolve_environment(nullptr, raw, options);
}

ResolveResult Resolver::resolve_document(
  const RawDocument & document, const ResolveOptions & options)
{
  ResolveResult result;
  result.registry = std::make_unique<EnvironmentRegistry>();

  const SchemaValidator validator = make_validator(options);

  // Defaults are shared by every environment; an invalid block fails the run.
  EnvironmentOverlay base;
  base.name = k_defaults_key;
  if (document.defaults) {
    auto d = validator.validate(*document.defaults);
    if (!d) {
      result.diagnostics.add(d.error().to_diagnostic());
      return result;
    }
    base = std::move(*d);
  }

  // Select environments (every block carrying a requested name, so that
  // duplicated names reach the registry and are rejected there)
  std::vector<const RawEnvironment *> selected;
  if (options.environments.empty()) {
    for (const auto & env : document.environments) {
      selected.push_back(&env);
    }
  } else {
    for (const auto & name : unique_names(options.environments)) {
      bool found = false;
      for (const auto & env : document.environments) {
        if (env.name == name) {
          selected.push_back(&env);
          found = true;
        }
      }
      if (!found) {
        result.diagnostics.report_error(name, fmt::format("environment '{}' is not defined", name))
          .with_code(codes::k_not_found)
          .with_note(std::string(to_string(ErrorKind::NotFound)))
          .with_help(
            document.environments.empty()
              ? std::string("the document declares no environments")
              : fmt::format("declared environments: {}", fmt::join(document.names(), ", ")));
      }
    }
  }

  if (document.environments.empty() && options.environments.empty()) {
    result.diagnostics.report_warning("", "document declares no environments");
  }

  // Resolve (pure, per environment; each slot written by exactly one worker)
  std::vector<std::optional<Result<ImmutableDescriptor>>> slots(selected.size());

  const auto worker_count = static_cast<unsigned>(std::max<size_t>(
    1, std::min<size_t>(options.jobs == 0 ? 1 : options.jobs, selected.size())));

  if (worker_count <= 1) {
    for (size_t i = 0; i < selected.size(); ++i) {
      if (options.verbose) {
        fmt::print(stderr, "Resolving: {}\n", selected[i]->name);
      }
      slots[i] = resolve_with_base(base, *selected[i], validator);
    }
  } else {
    std::atomic<size_t> next_job{0};
    std::atomic_bool had_error{false};
    std::mutex error_mutex;
    std::string first_error;

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (unsigned w = 0; w < worker_count; ++w) {
      workers.emplace_back([&]() {
        for (;;) {
          const size_t idx = next_job.fetch_add(1);
          if (idx >= selected.size()) break;
          try {
            slots[idx] = resolve_with_base(base, *selected[idx], validator);
          } catch (const std::exception & e) {
            const std::lock_guard<std::mutex> lock(error_mutex);
            if (!had_error.exchange(true)) {
              first_error = e.what();
            }
          }
        }
      });
    }
    for (auto & t : workers) {
      t.join();
    }
    if (had_error) {
      throw std::runtime_error(first_error);
    }
  }

  // Register from this thread, in declaration order
  for (size_t i = 0; i < selected.size(); ++i) {
    auto & slot = *slots[i];
    if (!slot) {
      result.diagnostics.add(slot.error().to_diagnostic());
      continue;
    }
    if (auto r = result.registry->register_descriptor(std::move(*slot)); !r) {
      result.diagnostics.add(r.error().to_diagnostic());
      continue;
    }
    if (options.verbose) {
      fmt::print(stderr, "Resolved: {}\n", selected[i]->name);
    }
  }

  result.success = !result.diagnostics.has_errors();
  return result;
}

ResolveResult Resolver::resolve_file(
  const std::filesystem::path & path, const ResolveOptions & options)
{
  if (options.verbose) {
    fmt::print(stderr, "Loading: {}\n", path.string());
  }

  const DocumentLoadResult loaded = load_document(path);
  if (!loaded.success) {
    ResolveResult result;
    result.registry = std::make_unique<EnvironmentRegistry>();
    result.diagnostics.report_error("", loaded.error)
      .with_code(codes::k_load)
      .with_note(std::string(to_string(ErrorKind::Load)));
    return result;
  }

  return resolve_document(loaded.document, options);
}

}  // namespace envres
