// envres/emit/descriptor_emitter.hpp - Immutable descriptor and serialization
//
// ImmutableDescriptor is the value handed to the deployment engine: a cheap
// to copy handle on shared const state. The serializers write the canonical
// document form, which parses back into an equal descriptor.
//
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "envres/loader/document_loader.hpp"
#include "envres/model/descriptor.hpp"

namespace envres
{

class ImmutableDescriptor
{
public:
  explicit ImmutableDescriptor(EnvironmentDescriptor descriptor)
  : state_(std::make_shared<const EnvironmentDescriptor>(std::move(descriptor)))
  {
  }

  [[nodiscard]] const EnvironmentDescriptor & get() const noexcept { return *state_; }
  [[nodiscard]] const EnvironmentDescriptor & operator*() const noexcept { return *state_; }
  [[nodiscard]] const EnvironmentDescriptor * operator->() const noexcept { return state_.get(); }

  [[nodiscard]] const std::string & name() const noexcept { return state_->name; }

  /// Parsed secrets location (set once references are resolved)
  [[nodiscard]] const std::optional<SecretsLocation> & secrets_location() const noexcept
  {
    return state_->secrets_location;
  }

  [[nodiscard]] const std::optional<CertificateHandle> & certificate() const noexcept
  {
    return state_->certificate;
  }

  /// Field-wise equality of the underlying descriptors
  [[nodiscard]] bool operator==(const ImmutableDescriptor & other) const
  {
    return state_ == other.state_ || *state_ == *other.state_;
  }

private:
  std::shared_ptr<const EnvironmentDescriptor> state_;
};

/**
 * Freeze a resolved descriptor.
 */
[[nodiscard]] ImmutableDescriptor emit(EnvironmentDescriptor descriptor);

/**
 * Canonical raw form of one environment block (schema fields in a fixed
 * order, then extension fields). Resolved handles are not part of it.
 */
[[nodiscard]] RawValue to_raw(const EnvironmentDescriptor & descriptor);

/**
 * Raw form for the deployment engine: the canonical block plus a
 * "resolvedReferences" object with the parsed bucket, secrets location and
 * certificate components.
 */
[[nodiscard]] RawValue to_deployment_raw(const ImmutableDescriptor & descriptor);

/**
 * Serialize descriptors as one document keyed by environment name.
 */
[[nodiscard]] std::string serialize_document(
  const std::vector<ImmutableDescriptor> & descriptors, DocumentFormat format);

/**
 * Serialize a single descriptor as a one-environment document.
 */
[[nodiscard]] std::string serialize(const ImmutableDescriptor & descriptor, DocumentFormat format);

/**
 * Render a raw value in the requested format.
 */
[[nodiscard]] std::string render(const RawValue & value, DocumentFormat format);

}  // namespace envres
