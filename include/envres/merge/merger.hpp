// envres/merge/merger.hpp - Defaults/override merge
#pragma once

#include "envres/basic/error.hpp"
#include "envres/model/descriptor.hpp"

namespace envres
{

/**
 * Overlay an environment onto the shared defaults.
 *
 * Merge policy:
 * - scalar fields: present in overrides replaces defaults, absent inherits
 * - network / resourceLimits / observability: merged field by field
 * - environmentVariables / buildMetadata / extension fields: key-wise union,
 *   override wins per key
 * - subnetIds / securityGroupIds / excludedPackages: replaced wholesale
 *
 * Only one level of inheritance exists; the result takes its name from
 * overrides.
 *
 * @return Concrete descriptor (references not yet resolved), or a
 *         MissingFieldError naming the first required field set on neither side
 */
[[nodiscard]] Result<EnvironmentDescriptor> merge(
  const EnvironmentOverlay & defaults, const EnvironmentOverlay & overrides);

/**
 * Turn a descriptor back into an overlay holding every field it sets.
 *
 * merge(EnvironmentOverlay{}, to_overlay(d)) reproduces d minus its
 * resolved reference handles.
 */
[[nodiscard]] EnvironmentOverlay to_overlay(const EnvironmentDescriptor & descriptor);

}  // namespace envres
