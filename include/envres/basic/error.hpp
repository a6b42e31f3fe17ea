// envres/basic/error.hpp - Typed resolution errors
//
// Every core operation is fail-fast and returns std::expected<T, ResolveError>.
// The driver converts errors into Diagnostics for reporting.
//
#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "envres/basic/diagnostic.hpp"

namespace envres
{

enum class ErrorKind : uint8_t {
  Load,           ///< Document could not be read or parsed
  Validation,     ///< Missing, mistyped, out-of-range or malformed field
  MissingField,   ///< Required field absent after the defaults merge
  Reference,      ///< Malformed location/identifier string
  DuplicateName,  ///< Two environments share a name
  NotFound,       ///< Lookup of an unknown environment name
};

/// Diagnostic codes (see `envres check` output)
namespace codes
{
inline constexpr const char * k_load = "E0001";
inline constexpr const char * k_required = "E0101";
inline constexpr const char * k_type = "E0102";
inline constexpr const char * k_range = "E0103";
inline constexpr const char * k_cross_field = "E0104";
inline constexpr const char * k_duplicate_key = "E0105";
inline constexpr const char * k_malformed = "E0106";
inline constexpr const char * k_missing_field = "E0201";
inline constexpr const char * k_reference = "E0301";
inline constexpr const char * k_duplicate_name = "E0401";
inline constexpr const char * k_not_found = "E0402";
}  // namespace codes

struct ResolveError
{
  ErrorKind kind = ErrorKind::Validation;
  std::string code;
  std::string environment;
  std::string field_path;
  std::string message;

  /// Human-readable one-liner: "<environment>.<field>: <message>"
  [[nodiscard]] std::string describe() const;

  [[nodiscard]] Diagnostic to_diagnostic() const;
};

template <typename T>
using Result = std::expected<T, ResolveError>;

/**
 * Build an unexpected ResolveError in one expression.
 *
 *   return fail(ErrorKind::Reference, codes::k_reference, env, "certificateRef", "...");
 */
[[nodiscard]] std::unexpected<ResolveError> fail(
  ErrorKind kind, std::string code, std::string environment, std::string field_path,
  std::string message);

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

}  // namespace envres
