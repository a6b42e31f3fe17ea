// envres/schema/schema_validator.hpp - Structural validation of environment blocks
//
// Turns one raw environment block into a typed EnvironmentOverlay, or reports
// the first rule it violates (fail-fast).
//
#pragma once

#include <cstdint>

#include "envres/basic/error.hpp"
#include "envres/loader/document_loader.hpp"
#include "envres/model/descriptor.hpp"

namespace envres
{

enum class ValidationMode {
  /// Standalone block: every required field and cross-field rule is checked
  Complete,
  /// One side of a defaults merge: required-field and cross-field checks are
  /// deferred to the merger and check_invariants()
  Overlay,
};

struct ValidationOptions
{
  ValidationMode mode = ValidationMode::Complete;

  /// Upper bound for resourceLimits.timeoutSeconds
  int64_t max_timeout_seconds = k_default_max_timeout_seconds;
};

/**
 * Schema validator for raw environment blocks.
 *
 * Checks run in this order and stop at the first failure:
 *   (a) required fields present           (Complete mode only)
 *   (b) type of every known field
 *   (c) value ranges and value shapes
 *   (d) cross-field rules                 (Complete mode only)
 *   (e) key uniqueness inside the block
 *
 * Keys that are not part of the schema are carried into
 * EnvironmentOverlay::extensions without validation.
 */
class SchemaValidator
{
public:
  explicit SchemaValidator(ValidationOptions options = {}) : options_(options) {}

  /**
   * Validate one block.
   *
   * @param raw Block as produced by the document loader
   * @return Typed overlay, or a ValidationError naming the field path
   */
  [[nodiscard]] Result<EnvironmentOverlay> validate(const RawEnvironment & raw) const;

  /**
   * Re-check the rules that span both sides of a merge on a merged descriptor.
   *
   * Fails with a ValidationError (cross-field or range).
   */
  [[nodiscard]] Result<void> check_invariants(const EnvironmentDescriptor & descriptor) const;

  [[nodiscard]] const ValidationOptions & options() const noexcept { return options_; }

private:
  ValidationOptions options_;
};

}  // namespace envres
