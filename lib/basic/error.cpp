// envres/basic/error.cpp - Typed resolution errors
#include "envres/basic/error.hpp"

#include <utility>

namespace envres
{

std::string ResolveError::describe() const
{
  std::string where = environment;
  if (!field_path.empty()) {
    where += where.empty() ? field_path : "." + field_path;
  }
  if (where.empty()) {
    return message;
  }
  return where + ": " + message;
}

Diagnostic ResolveError::to_diagnostic() const
{
  Diagnostic d;
  d.severity = Severity::Error;
  d.code = code;
  d.message = message;
  d.environment = environment;
  d.field_path = field_path;
  d.notes.push_back(std::string(to_string(kind)));
  return d;
}

std::unexpected<ResolveError> fail(
  ErrorKind kind, std::string code, std::string environment, std::string field_path,
  std::string message)
{
  ResolveError e;
  e.kind = kind;
  e.code = std::move(code);
  e.environment = std::move(environment);
  e.field_path = std::move(field_path);
  e.message = std::move(message);
  return std::unexpected(std::move(e));
}

std::string_view to_string(ErrorKind kind) noexcept
{
  switch (kind) {
    case ErrorKind::Load:
      return "LoadError";
    case ErrorKind::Validation:
      return "ValidationError";
    case ErrorKind::MissingField:
      return "MissingFieldError";
    case ErrorKind::Reference:
      return "ReferenceError";
    case ErrorKind::DuplicateName:
      return "DuplicateNameError";
    case ErrorKind::NotFound:
      return "NotFoundError";
  }
  return "UnknownError";
}

}  // namespace envres
