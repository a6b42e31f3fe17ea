// envres/schema/field_rules.cpp - Syntactic field rules
#include "envres/schema/field_rules.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <string>

namespace envres::rules
{

namespace
{

bool is_lower_alnum(char c)
{
  return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

bool is_digit(char c) { return c >= '0' && c <= '9'; }

bool looks_like_ipv4(std::string_view s)
{
  int parts = 0;
  size_t start = 0;
  while (start <= s.size()) {
    const size_t dot = s.find('.', start);
    const size_t end = (dot == std::string_view::npos) ? s.size() : dot;
    const std::string_view part = s.substr(start, end - start);
    if (part.empty() || part.size() > 3 || !std::all_of(part.begin(), part.end(), is_digit)) {
      return false;
    }
    ++parts;
    if (dot == std::string_view::npos) {
      break;
    }
    start = dot + 1;
  }
  return parts == 4;
}

bool is_valid_label(std::string_view label)
{
  if (label.empty() || label.size() > 63) {
    return false;
  }
  if (label.front() == '-' || label.back() == '-') {
    return false;
  }
  return std::all_of(label.begin(), label.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-';
  });
}

}  // namespace

bool is_valid_region(std::string_view region)
{
  static const std::regex k_region(R"(^[a-z]{2}(-gov|-iso[a-z]?)?-[a-z]+-[0-9]$)");
  return std::regex_match(region.begin(), region.end(), k_region);
}

bool is_valid_hostname(std::string_view host)
{
  if (!host.empty() && host.back() == '.') {
    host.remove_suffix(1);
  }
  if (host.empty() || host.size() > 253) {
    return false;
  }

  int labels = 0;
  std::string_view last_label;
  size_t start = 0;
  while (true) {
    const size_t dot = host.find('.', start);
    const size_t end = (dot == std::string_view::npos) ? host.size() : dot;
    const std::string_view label = host.substr(start, end - start);
    if (!is_valid_label(label)) {
      return false;
    }
    ++labels;
    last_label = label;
    if (dot == std::string_view::npos) {
      break;
    }
    start = dot + 1;
  }

  // Top-level label must not be all-numeric (rules out bare IPv4 addresses)
  const bool numeric_tld = std::all_of(last_label.begin(), last_label.end(), is_digit);
  return labels >= 2 && !numeric_tld;
}

bool is_valid_bucket_name(std::string_view name)
{
  if (name.size() < 3 || name.size() > 63) {
    return false;
  }
  if (!is_lower_alnum(name.front()) || !is_lower_alnum(name.back())) {
    return false;
  }
  const bool charset_ok = std::all_of(name.begin(), name.end(), [](char c) {
    return is_lower_alnum(c) || c == '.' || c == '-';
  });
  if (!charset_ok) {
    return false;
  }
  if (
    name.find("..") != std::string_view::npos || name.find(".-") != std::string_view::npos ||
    name.find("-.") != std::string_view::npos) {
    return false;
  }
  return !looks_like_ipv4(name);
}

bool is_valid_subnet_id(std::string_view id)
{
  static const std::regex k_subnet(R"(^subnet-([0-9a-f]{8}|[0-9a-f]{17})$)");
  return std::regex_match(id.begin(), id.end(), k_subnet);
}

bool is_valid_security_group_id(std::string_view id)
{
  static const std::regex k_security_group(R"(^sg-([0-9a-f]{8}|[0-9a-f]{17})$)");
  return std::regex_match(id.begin(), id.end(), k_security_group);
}

bool is_valid_scheme(std::string_view scheme)
{
  if (scheme.empty() || scheme.front() < 'a' || scheme.front() > 'z') {
    return false;
  }
  return std::all_of(scheme.begin(), scheme.end(), [](char c) {
    return is_lower_alnum(c) || c == '+' || c == '.' || c == '-';
  });
}

}  // namespace envres::rules
