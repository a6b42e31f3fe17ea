// envres/loader/document_loader.hpp - Interchange document loading
//
// Parses a deployment document (JSON or YAML) keyed by environment name into
// ordered raw environment blocks. Declaration order is kept, duplicate
// environment names are kept as separate blocks, and duplicate keys inside a
// block are recorded by path instead of being silently collapsed.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "envres/model/descriptor.hpp"

namespace envres
{

enum class DocumentFormat {
  Json,
  Yaml,
};

/// Reserved top-level key holding the shared defaults block
inline constexpr const char * k_defaults_key = "defaults";

/**
 * One environment block as it appears in the document.
 */
struct RawEnvironment
{
  std::string name;

  /// Untyped body (normally an object)
  RawValue body;

  /// Dotted paths (relative to the block) of keys that appeared more than once
  std::vector<std::string> duplicate_keys;
};

struct RawDocument
{
  /// Shared defaults block, if the document declares one
  std::optional<RawEnvironment> defaults;

  /// Environment blocks in declaration order
  std::vector<RawEnvironment> environments;

  /// File the document was read from (empty for in-memory documents)
  std::filesystem::path source_path;

  /// First block with the given name, or nullptr
  [[nodiscard]] const RawEnvironment * find(std::string_view name) const;

  /// Environment names in declaration order (duplicates included)
  [[nodiscard]] std::vector<std::string> names() const;
};

/**
 * Result of loading a document.
 */
struct DocumentLoadResult
{
  /// Loaded document (only valid if success == true)
  RawDocument document;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static DocumentLoadResult ok(RawDocument doc)
  {
    DocumentLoadResult r;
    r.document = std::move(doc);
    r.success = true;
    return r;
  }

  static DocumentLoadResult fail(std::string msg)
  {
    DocumentLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Parse a document held in memory.
 *
 * @param text Document text
 * @param format Interchange format of the text
 */
[[nodiscard]] DocumentLoadResult parse_document(std::string_view text, DocumentFormat format);

/**
 * Read and parse a document file.
 *
 * The format is chosen from the extension (.json, .yaml, .yml); other
 * extensions are parsed as JSON when the first non-blank character is '{',
 * otherwise as YAML.
 */
[[nodiscard]] DocumentLoadResult load_document(const std::filesystem::path & path);

[[nodiscard]] std::optional<DocumentFormat> format_from_extension(
  const std::filesystem::path & path);

}  // namespace envres
