// envres/loader/document_loader.cpp - JSON/YAML document loading
//
// JSON goes through nlohmann's SAX interface so that duplicate keys can be
// observed; the DOM parser keeps only one of them.
//
#include "envres/loader/document_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace envres
{

namespace
{

std::string join_path(const std::string & base, const std::string & key)
{
  return base.empty() ? key : base + "." + key;
}

// ============================================================================
// JSON (SAX)
// ============================================================================

struct TopLevelEntry
{
  std::string name;
  RawValue body;
  std::vector<std::string> duplicate_keys;
};

class DocumentSax final : public nlohmann::json_sax<RawValue>
{
public:
  bool null() override { return add_value(RawValue(nullptr)); }
  bool boolean(bool val) override { return add_value(RawValue(val)); }
  bool number_integer(number_integer_t val) override { return add_value(RawValue(val)); }
  bool number_unsigned(number_unsigned_t val) override { return add_value(RawValue(val)); }
  bool number_float(number_float_t val, const string_t & /*unused*/) override
  {
    return add_value(RawValue(val));
  }
  bool string(string_t & val) override { return add_value(RawValue(std::move(val))); }
  bool binary(binary_t & val) override { return add_value(RawValue::binary(std::move(val))); }

  bool start_object(std::size_t /*elements*/) override
  {
    return open_frame(RawValue::object());
  }

  bool key(string_t & val) override
  {
    Frame & frame = stack_.back();
    if (!frame.seen_keys.insert(val).second && stack_.size() > 1) {
      pending_duplicates_.push_back(join_path(frame.path, val));
    }
    frame.pending_key = val;
    return true;
  }

  bool end_object() override { return close_frame(); }

  bool start_array(std::size_t /*elements*/) override
  {
    return open_frame(RawValue::array());
  }

  bool end_array() override { return close_frame(); }

  bool parse_error(
    std::size_t /*position*/, const std::string & /*last_token*/,
    const nlohmann::detail::exception & ex) override
  {
    error_ = ex.what();
    return false;
  }

  [[nodiscard]] const std::string & error() const { return error_; }
  [[nodiscard]] std::vector<TopLevelEntry> & entries() { return entries_; }

private:
  struct Frame
  {
    RawValue value;
    std::string path;
    std::string pending_key;
    std::unordered_set<std::string> seen_keys;
  };

  bool open_frame(RawValue value)
  {
    if (stack_.empty()) {
      if (!value.is_object()) {
        error_ = "top-level value must be an object keyed by environment name";
        return false;
      }
      stack_.push_back(Frame{std::move(value), "", "", {}});
      return true;
    }

    std::string path;
    if (stack_.size() > 1) {
      const Frame & parent = stack_.back();
      if (parent.value.is_array()) {
        path = parent.path + "[" + std::to_string(parent.value.size()) + "]";
      } else {
        path = join_path(parent.path, parent.pending_key);
      }
    }
    stack_.push_back(Frame{std::move(value), std::move(path), "", {}});
    return true;
  }

  bool close_frame()
  {
    RawValue value = std::move(stack_.back().value);
    stack_.pop_back();
    if (stack_.empty()) {
      return true;  // document root closed
    }
    return add_value(std::move(value));
  }

  bool add_value(RawValue value)
  {
    if (stack_.empty()) {
      error_ = "top-level value must be an object keyed by environment name";
      return false;
    }

    Frame & parent = stack_.back();
    if (stack_.size() == 1) {
      entries_.push_back(
        TopLevelEntry{parent.pending_key, std::move(value), std::move(pending_duplicates_)});
      pending_duplicates_.clear();
      return true;
    }

    if (parent.value.is_array()) {
      parent.value.push_back(std::move(value));
    } else {
      parent.value[parent.pending_key] = std::move(value);
    }
    return true;
  }

  std::vector<Frame> stack_;
  std::vector<TopLevelEntry> entries_;
  std::vector<std::string> pending_duplicates_;
  std::string error_;
};

// ============================================================================
// YAML
// ============================================================================

bool is_yaml_null(const std::string & s)
{
  return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
}

std::optional<bool> yaml_bool(const std::string & s)
{
  if (s == "true" || s == "True" || s == "TRUE") return true;
  if (s == "false" || s == "False" || s == "FALSE") return false;
  return std::nullopt;
}

RawValue yaml_scalar(const YAML::Node & node)
{
  const std::string & text = node.Scalar();

  // Quoted scalars carry the non-specific tag "!" and are always strings.
  if (node.Tag() == "!") {
    return RawValue(text);
  }

  if (is_yaml_null(text)) {
    return RawValue(nullptr);
  }
  if (auto b = yaml_bool(text)) {
    return RawValue(*b);
  }

  const char * first = text.data();
  const char * last = text.data() + text.size();
  const char * digits = (*first == '+') ? first + 1 : first;

  int64_t i = 0;
  auto [iptr, iec] = std::from_chars(digits, last, i);
  if (iec == std::errc{} && iptr == last) {
    return RawValue(i);
  }

  if (std::isdigit(static_cast<unsigned char>(*digits)) != 0 || *digits == '-' || *digits == '.') {
    double d = 0.0;
    auto [dptr, dec] = std::from_chars(digits, last, d);
    if (dec == std::errc{} && dptr == last) {
      return RawValue(d);
    }
  }

  return RawValue(text);
}

RawValue yaml_to_raw(
  const YAML::Node & node, const std::string & path, std::vector<std::string> & duplicates)
{
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      return RawValue(nullptr);
    case YAML::NodeType::Scalar:
      return yaml_scalar(node);
    case YAML::NodeType::Sequence: {
      RawValue arr = RawValue::array();
      for (const auto & item : node) {
        const std::string item_path = path + "[" + std::to_string(arr.size()) + "]";
        arr.push_back(yaml_to_raw(item, item_path, duplicates));
      }
      return arr;
    }
    case YAML::NodeType::Map: {
      RawValue obj = RawValue::object();
      std::unordered_set<std::string> seen;
      for (const auto & kv : node) {
        const std::string key = kv.first.as<std::string>();
        const std::string child_path = join_path(path, key);
        if (!seen.insert(key).second) {
          duplicates.push_back(child_path);
        }
        obj[key] = yaml_to_raw(kv.second, child_path, duplicates);
      }
      return obj;
    }
  }
  return RawValue(nullptr);
}

DocumentLoadResult parse_yaml(std::string_view text, std::vector<TopLevelEntry> & entries)
{
  YAML::Node root;
  try {
    root = YAML::Load(std::string(text));
  } catch (const YAML::Exception & e) {
    return DocumentLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  if (!root.IsMap()) {
    return DocumentLoadResult::fail("top-level value must be an object keyed by environment name");
  }

  try {
    for (const auto & kv : root) {
      TopLevelEntry entry;
      entry.name = kv.first.as<std::string>();
      entry.body = yaml_to_raw(kv.second, "", entry.duplicate_keys);
      entries.push_back(std::move(entry));
    }
  } catch (const YAML::Exception & e) {
    return DocumentLoadResult::fail("failed to read YAML: " + std::string(e.what()));
  }

  // yaml-cpp passes scalar bytes through unchecked; the JSON parser rejects
  // invalid UTF-8, so YAML input must meet the same bar.
  for (const auto & entry : entries) {
    try {
      (void)RawValue(entry.name).dump();
      (void)entry.body.dump();
    } catch (const RawValue::type_error & e) {
      return DocumentLoadResult::fail(
        "failed to read YAML: environment '" + entry.name + "': " + std::string(e.what()));
    }
  }

  return DocumentLoadResult::ok({});
}

DocumentLoadResult parse_json(std::string_view text, std::vector<TopLevelEntry> & entries)
{
  DocumentSax sax;
  const bool ok = RawValue::sax_parse(std::string(text), &sax);
  if (!ok) {
    const std::string & err = sax.error();
    return DocumentLoadResult::fail(
      "failed to parse JSON: " + (err.empty() ? std::string("unexpected input") : err));
  }
  entries = std::move(sax.entries());
  return DocumentLoadResult::ok({});
}

}  // namespace

// ============================================================================
// RawDocument
// ============================================================================

const RawEnvironment * RawDocument::find(std::string_view name) const
{
  for (const auto & env : environments) {
    if (env.name == name) {
      return &env;
    }
  }
  return nullptr;
}

std::vector<std::string> RawDocument::names() const
{
  std::vector<std::string> result;
  result.reserve(environments.size());
  for (const auto & env : environments) {
    result.push_back(env.name);
  }
  return result;
}

// ============================================================================
// Loading API
// ============================================================================

DocumentLoadResult parse_document(std::string_view text, DocumentFormat format)
{
  std::vector<TopLevelEntry> entries;
  DocumentLoadResult parsed =
    (format == DocumentFormat::Json) ? parse_json(text, entries) : parse_yaml(text, entries);
  if (!parsed.success) {
    return parsed;
  }

  RawDocument doc;
  for (auto & entry : entries) {
    RawEnvironment env{std::move(entry.name), std::move(entry.body), std::move(entry.duplicate_keys)};
    if (env.name == k_defaults_key) {
      if (doc.defaults) {
        return DocumentLoadResult::fail("'defaults' is declared more than once");
      }
      doc.defaults = std::move(env);
      continue;
    }
    doc.environments.push_back(std::move(env));
  }

  return DocumentLoadResult::ok(std::move(doc));
}

std::optional<DocumentFormat> format_from_extension(const std::filesystem::path & path)
{
  const std::string ext = path.extension().string();
  if (ext == ".json") {
    return DocumentFormat::Json;
  }
  if (ext == ".yaml" || ext == ".yml") {
    return DocumentFormat::Yaml;
  }
  return std::nullopt;
}

DocumentLoadResult load_document(const std::filesystem::path & path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(path)) {
    return DocumentLoadResult::fail("descriptor file not found: " + path.string());
  }

  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    return DocumentLoadResult::fail("failed to open descriptor file: " + path.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  const std::string text = buffer.str();

  DocumentFormat format = DocumentFormat::Yaml;
  if (auto by_ext = format_from_extension(path)) {
    format = *by_ext;
  } else {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first != std::string::npos && text[first] == '{') {
      format = DocumentFormat::Json;
    }
  }

  DocumentLoadResult result = parse_document(text, format);
  if (!result.success) {
    result.error = path.string() + ": " + result.error;
    return result;
  }
  result.document.source_path = fs::absolute(path);
  return result;
}

}  // namespace envres
