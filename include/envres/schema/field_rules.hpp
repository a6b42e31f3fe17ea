// envres/schema/field_rules.hpp - Syntactic rules for individual field values
//
// Pure predicates shared by the schema validator and the reference resolver.
//
#pragma once

#include <string_view>

namespace envres::rules
{

/// Cloud region code, e.g. "us-east-1", "eu-west-2", "us-gov-west-1"
[[nodiscard]] bool is_valid_region(std::string_view region);

/// Fully-qualified hostname: at least two dot-separated labels of
/// [A-Za-z0-9-], 1-63 chars each, no leading/trailing '-', 253 chars total.
[[nodiscard]] bool is_valid_hostname(std::string_view host);

/// Storage bucket name: 3-63 chars of [a-z0-9.-], alphanumeric at both ends,
/// no "..", ".-" or "-.", and not formatted as an IPv4 address.
[[nodiscard]] bool is_valid_bucket_name(std::string_view name);

/// "subnet-" followed by 8 or 17 lowercase hex digits
[[nodiscard]] bool is_valid_subnet_id(std::string_view id);

/// "sg-" followed by 8 or 17 lowercase hex digits
[[nodiscard]] bool is_valid_security_group_id(std::string_view id);

/// URI scheme: [a-z][a-z0-9+.-]*
[[nodiscard]] bool is_valid_scheme(std::string_view scheme);

}  // namespace envres::rules
