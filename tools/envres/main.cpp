// envres - Environment Configuration Resolver Command Line Interface
//
// Usage:
//   envres check   [file] [--env NAME]...
//   envres resolve [file] [--env NAME]... [-o DIR] [--format json|yaml]
//   envres list    [file]
//   envres show    [file] --env NAME
//   envres init    [dir]
//
#include <fmt/core.h>
#include <fmt/ostream.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "envres/basic/diagnostic_printer.hpp"
#include "envres/driver/resolver.hpp"
#include "envres/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

constexpr const char * k_resolved_document_stem = "envres.resolved";

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "Environment Configuration Resolver v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check [file]             Validate and resolve every environment\n"
            << "  resolve [file]           Write one descriptor per environment plus\n"
            << "                           envres.resolved.<ext> keyed by environment\n"
            << "  list [file]              List the environments declared in a document\n"
            << "  show [file] --env NAME   Print a summary of one resolved environment\n"
            << "  init [dir]               Write a starter envres.yaml and deploy.json\n\n"
            << "Options:\n"
            << "  --env <name>             Restrict to an environment (repeatable)\n"
            << "  -o, --output <dir>       Output directory for resolve\n"
            << "  --format <json|yaml>     Output format for resolve\n"
            << "  -j, --jobs <n>           Resolve environments on n worker threads\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n\n"
            << "Without a file argument the document named in envres.yaml is used.\n";
}

void print_diagnostics(const envres::DiagnosticBag & diagnostics, const std::string & source_name)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  envres::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics, source_name);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string output_path;
  std::string format;
  std::vector<std::string> environments;
  unsigned jobs = 0;  // 0 = take from envres.yaml (or 1)
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        args.output_path = argv[++i];
      }
    } else if (arg == "--env" || arg == "-e") {
      if (i + 1 < argc) {
        args.environments.emplace_back(argv[++i]);
      }
    } else if (arg == "--format") {
      if (i + 1 < argc) {
        args.format = argv[++i];
      }
    } else if (arg == "-j" || arg == "--jobs") {
      if (i + 1 < argc) {
        const long n = std::strtol(argv[++i], nullptr, 10);
        if (n < 1) {
          args.error = fmt::format("invalid job count '{}'", argv[i]);
        } else {
          args.jobs = static_cast<unsigned>(n);
        }
      }
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    } else {
      args.error = fmt::format("unexpected argument '{}'", arg);
    }
  }

  return args;
}

// ============================================================================
// Invocation setup
// ============================================================================

/// Everything a command needs after combining arguments and envres.yaml
struct Invocation
{
  fs::path document;
  fs::path output_dir = "resolved";
  envres::DocumentFormat format = envres::DocumentFormat::Json;
  envres::ResolveOptions options;
};

bool prepare(const CommandArgs & args, Invocation & inv)
{
  if (args.input_file.empty()) {
    // Project mode: find envres.yaml
    auto config_path = envres::find_project_config(fs::current_path());
    if (!config_path) {
      std::cerr << "error: no " << envres::k_project_config_file_name
                << " found in current directory or parents\n";
      return false;
    }

    const auto config_result = envres::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_path->string() << ": " << config_result.error << "\n";
      return false;
    }

    const auto & config = config_result.config;
    if (args.verbose && !config.project.name.empty()) {
      fmt::print(stderr, "Project: {}\n", config.project.name);
    }

    inv.document = config.descriptors_path();
    inv.output_dir = config.output_path();
    inv.format = config.resolver.format;
    inv.options.jobs = config.resolver.jobs;
    inv.options.max_timeout_seconds = config.resolver.max_timeout_seconds;
  } else {
    // Single file mode
    inv.document = fs::absolute(args.input_file);
  }

  if (!fs::exists(inv.document)) {
    std::cerr << "error: file not found: " << inv.document.string() << "\n";
    return false;
  }

  if (!args.output_path.empty()) {
    inv.output_dir = args.output_path;
  }
  if (!args.format.empty()) {
    auto format = envres::parse_format(args.format);
    if (!format) {
      std::cerr << "error: unknown format '" << args.format << "' (expected json or yaml)\n";
      return false;
    }
    inv.format = *format;
  }
  if (args.jobs != 0) {
    inv.options.jobs = args.jobs;
  }
  inv.options.environments = args.environments;
  inv.options.verbose = args.verbose;
  return true;
}

std::string display_name(const CommandArgs & args, const Invocation & inv)
{
  return args.input_file.empty() ? inv.document.filename().string() : args.input_file;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  Invocation inv;
  if (!prepare(args, inv)) {
    return 1;
  }

  const auto result = envres::Resolver::resolve_file(inv.document, inv.options);

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics, display_name(args, inv));
  }

  if (!result.success) {
    return 1;
  }

  std::cout << display_name(args, inv) << ": OK (" << result.registry->size()
            << (result.registry->size() == 1 ? " environment" : " environments") << ")\n";
  return 0;
}

int cmd_resolve(const CommandArgs & args)
{
  Invocation inv;
  if (!prepare(args, inv)) {
    return 1;
  }

  const auto result = envres::Resolver::resolve_file(inv.document, inv.options);

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics, display_name(args, inv));
  }

  // Environments that resolved are written even when others failed
  const char * extension = inv.format == envres::DocumentFormat::Json ? ".json" : ".yaml";
  try {
    if (!result.registry->empty()) {
      fs::create_directories(inv.output_dir);
    }
    for (const auto & descriptor : result.registry->all()) {
      const fs::path out_path = inv.output_dir / (descriptor.name() + extension);
      std::ofstream out(out_path);
      if (!out.is_open()) {
        std::cerr << "error: failed to open output file: " << out_path.string() << "\n";
        return 1;
      }
      out << envres::render(envres::to_deployment_raw(descriptor), inv.format);
      std::cerr << "Generated: " << out_path.string() << "\n";
    }

    // Per-environment files are bare blocks for the deployment engine; the
    // keyed document can be read back by check/resolve.
    if (!result.registry->empty()) {
      const fs::path doc_path = inv.output_dir / (std::string(k_resolved_document_stem) + extension);
      std::ofstream out(doc_path);
      if (!out.is_open()) {
        std::cerr << "error: failed to open output file: " << doc_path.string() << "\n";
        return 1;
      }
      out << envres::serialize_document(result.registry->all(), inv.format);
      std::cerr << "Generated: " << doc_path.string() << "\n";
    }
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  return result.success ? 0 : 1;
}

int cmd_list(const CommandArgs & args)
{
  Invocation inv;
  if (!prepare(args, inv)) {
    return 1;
  }

  const auto loaded = envres::load_document(inv.document);
  if (!loaded.success) {
    envres::DiagnosticBag diags;
    diags.report_error("", loaded.error).with_code(envres::codes::k_load);
    print_diagnostics(diags, display_name(args, inv));
    return 1;
  }

  for (const auto & name : loaded.document.names()) {
    std::cout << name << "\n";
  }
  return 0;
}

void print_summary(const envres::ImmutableDescriptor & descriptor)
{
  const auto & d = descriptor.get();

  fmt::print("{}\n", d.name);
  fmt::print("  region:            {}\n", d.region);
  fmt::print("  project:           {}\n", d.project);
  fmt::print("  runtime version:   {}\n", d.runtime_version);
  fmt::print(
    "  resource limits:   {} MB, {} s\n", d.resource_limits.memory_size_mb,
    d.resource_limits.timeout_seconds);
  if (d.domain) {
    fmt::print("  domain:            {}\n", *d.domain);
  }
  if (d.keep_warm) {
    fmt::print("  keep warm:         {}\n", *d.keep_warm ? "yes" : "no");
  }
  if (d.observability) {
    if (d.observability->log_level) {
      fmt::print("  log level:         {}\n", envres::to_string(*d.observability->log_level));
    }
    if (d.observability->tracing_enabled) {
      fmt::print(
        "  tracing:           {}\n", *d.observability->tracing_enabled ? "enabled" : "disabled");
    }
  }
  if (d.network) {
    if (d.network->subnet_ids) {
      fmt::print("  subnets:           {}\n", d.network->subnet_ids->size());
    }
    if (d.network->security_group_ids) {
      fmt::print("  security groups:   {}\n", d.network->security_group_ids->size());
    }
  }

  fmt::print("  references:\n");
  if (d.storage_bucket) {
    fmt::print("    storage bucket:  {}\n", d.storage_bucket->name);
  }
  if (const auto & secrets = descriptor.secrets_location()) {
    fmt::print(
      "    secrets:         scheme={} bucket={} key={}\n", secrets->scheme, secrets->bucket,
      secrets->key);
  }
  if (const auto & cert = descriptor.certificate()) {
    fmt::print(
      "    certificate:     partition={} region={} account={} id={}\n", cert->partition,
      cert->region, cert->account_id, cert->certificate_id);
  }

  if (!d.environment_variables.empty()) {
    fmt::print("  environment variables:\n");
    for (const auto & [key, value] : d.environment_variables) {
      fmt::print("    {}={}\n", key, value);
    }
  }
  if (!d.build_metadata.empty()) {
    fmt::print("  build metadata:\n");
    for (const auto & [key, value] : d.build_metadata) {
      fmt::print("    {}={}\n", key, value);
    }
  }
  if (!d.extensions.empty()) {
    fmt::print("  extension fields:\n");
    for (const auto & [key, value] : d.extensions) {
      fmt::print("    {}: {}\n", key, value.dump());
    }
  }
}

int cmd_show(const CommandArgs & args)
{
  if (args.environments.size() != 1) {
    std::cerr << "error: exactly one --env is required\n";
    std::cerr << "usage: envres show [file] --env <name>\n";
    return 1;
  }

  Invocation inv;
  if (!prepare(args, inv)) {
    return 1;
  }

  const auto result = envres::Resolver::resolve_file(inv.document, inv.options);

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics, display_name(args, inv));
  }

  auto descriptor = result.registry->lookup(args.environments.front());
  if (!result.success || !descriptor) {
    return 1;
  }

  print_summary(*descriptor);
  return 0;
}

int cmd_init(const CommandArgs & args)
{
  const fs::path project_dir =
    args.input_file.empty() ? fs::current_path() : fs::absolute(args.input_file);

  const fs::path config_path = project_dir / envres::k_project_config_file_name;
  const fs::path document_path = project_dir / "deploy.json";

  if (fs::exists(config_path)) {
    std::cerr << "error: file already exists: " << config_path.string() << "\n";
    return 1;
  }
  if (fs::exists(document_path)) {
    std::cerr << "error: file already exists: " << document_path.string() << "\n";
    return 1;
  }

  try {
    fs::create_directories(project_dir);

    // Create envres.yaml
    std::ofstream config(config_path);
    config << "project:\n"
           << "  name: '" << project_dir.filename().string() << "'\n\n"
           << "resolver:\n"
           << "  descriptors: 'deploy.json'\n"
           << "  output_dir: 'resolved'\n"
           << "  format: 'json'\n"
           << "  jobs: 1\n"
           << "  max_timeout_seconds: " << envres::k_default_max_timeout_seconds << "\n";
    config.close();

    // Create deploy.json
    std::ofstream document(document_path);
    document << R"({
  "defaults": {
    "region": "us-east-1",
    "project": "my-service",
    "runtimeVersion": "nodejs20.x",
    "resourceLimits": { "memorySizeMB": 512, "timeoutSeconds": 30 },
    "environmentVariables": { "LOG_FORMAT": "json" }
  },
  "dev": {
    "storageBucketRef": "my-service-dev-artifacts",
    "secretsLocationRef": "s3://my-service-dev-secrets/secrets.json",
    "environmentVariables": { "STAGE": "dev" },
    "observability": { "logLevel": "DEBUG", "tracingEnabled": false }
  },
  "production": {
    "storageBucketRef": "my-service-prod-artifacts",
    "secretsLocationRef": "s3://my-service-prod-secrets/secrets.json",
    "domain": "api.example.com",
    "certificateRef": "arn:aws:acm:us-east-1:123456789012:certificate/0a1b2c3d-4e5f-6789-abcd-ef0123456789",
    "environmentVariables": { "STAGE": "production" },
    "resourceLimits": { "memorySizeMB": 1024 },
    "keepWarm": true
  }
}
)";
    document.close();

    std::cout << "Initialized envres project in " << project_dir.string() << "\n";
    std::cout << "\nNext steps:\n"
              << "  envres check\n"
              << "  envres resolve\n";

    return 0;
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    print_usage(argv[0]);
    return 1;
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  if (args.command == "resolve") {
    return cmd_resolve(args);
  }

  if (args.command == "list") {
    return cmd_list(args);
  }

  if (args.command == "show") {
    return cmd_show(args);
  }

  if (args.command == "init") {
    return cmd_init(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
