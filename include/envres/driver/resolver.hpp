// envres/driver/resolver.hpp - Resolution driver
//
// Single entry point for the resolution pipeline.
// Used by the CLI and can be embedded into deployment tooling.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "envres/basic/diagnostic.hpp"
#include "envres/basic/error.hpp"
#include "envres/emit/descriptor_emitter.hpp"
#include "envres/loader/document_loader.hpp"
#include "envres/registry/environment_registry.hpp"
#include "envres/schema/schema_validator.hpp"

namespace envres
{

// ============================================================================
// Resolve Options
// ============================================================================

struct ResolveOptions
{
  /// Environments to resolve; empty means every environment in the document
  std::vector<std::string> environments;

  /// Worker threads used to resolve environments (1 = resolve inline)
  unsigned jobs = 1;

  /// Upper bound for resourceLimits.timeoutSeconds
  int64_t max_timeout_seconds = k_default_max_timeout_seconds;

  /// Print progress to stderr
  bool verbose = false;
};

// ============================================================================
// Resolve Result
// ============================================================================

struct ResolveResult
{
  /// Whether every requested environment resolved (no errors)
  bool success = false;

  /// Collected diagnostics, one per failed environment
  DiagnosticBag diagnostics;

  /// Successfully resolved environments in declaration order
  std::unique_ptr<EnvironmentRegistry> registry;
};

// ============================================================================
// Resolver
// ============================================================================

/**
 * Resolver driver that runs the full pipeline per environment:
 *
 * 1. Schema validation of the defaults block and the environment block
 * 2. Defaults merge
 * 3. Cross-field invariant check on the merged descriptor
 * 4. Reference resolution
 * 5. Emission of the immutable descriptor
 * 6. Registration (coordinating thread, declaration order)
 *
 * Environments are independent: a failure in one is recorded as a
 * diagnostic and the others still resolve.
 */
class Resolver
{
public:
  /**
   * Resolve the environments of a loaded document.
   */
  [[nodiscard]] static ResolveResult resolve_document(
    const RawDocument & document, const ResolveOptions & options);

  /**
   * Load a document file and resolve its environments.
   */
  [[nodiscard]] static ResolveResult resolve_file(
    const std::filesystem::path & path, const ResolveOptions & options);

  /**
   * Run steps 1-5 for one environment block.
   *
   * @param defaults Shared defaults block, or nullptr when the document has none
   */
  [[nodiscard]] static Result<ImmutableDescriptor> resolve_environment(
    const RawEnvironment * defaults, const RawEnvironment & environment,
    const ResolveOptions & options);

  /**
   * Resolve an already-resolved descriptor again (no defaults).
   *
   * Yields an equal descriptor for any output of resolve_environment().
   */
  [[nodiscard]] static Result<ImmutableDescriptor> re_resolve(
    const ImmutableDescriptor & descriptor, const ResolveOptions & options);
};

}  // namespace envres
