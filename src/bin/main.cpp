#include <mimegate/content.hpp>
#include <mimegate/expat_reader.hpp>
#include <mimegate/media_type.hpp>
#include <mimegate/registry.hpp>
#include <mimegate/validate.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_io = 2;
static constexpr int exit_registry = 3;
static constexpr int exit_rejected = 4;

struct cli_options {
  std::vector<std::string> media_types;
  std::string registry_file;
  bool json = false;
  bool classify = false;
  bool read_stdin = false;
  bool list_registry = false;
  bool show_help = false;
  bool show_version = false;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: mimegate [options] [media-type ...]\n"
     << "\n"
     << "Validates media types and prints their canonical form. With no\n"
     << "media types on the command line, reads one per line from stdin.\n"
     << "\n"
     << "Options:\n"
     << "  -r <file>         Registry override file (merged over built-ins)\n"
     << "  --json            Print one JSON object per input\n"
     << "  --classify        Include the content class (text or binary)\n"
     << "  --stdin           Read media types from stdin\n"
     << "  --list-registry   Print the assembled registry and exit\n"
     << "  -h, --help        Show this help message\n"
     << "  --version         Show version information\n";
}

static void
print_version(std::ostream& os) {
  os << "mimegate " << MIMEGATE_VERSION << "\n";
}

static cli_options
parse_args(int argc, char* argv[]) {
  cli_options opts;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
      return opts;
    }

    if (arg == "--version") {
      opts.show_version = true;
      return opts;
    }

    if (arg == "--json") {
      opts.json = true;
      continue;
    }

    if (arg == "--classify") {
      opts.classify = true;
      continue;
    }

    if (arg == "--stdin") {
      opts.read_stdin = true;
      continue;
    }

    if (arg == "--list-registry") {
      opts.list_registry = true;
      continue;
    }

    if (arg == "-r") {
      if (i + 1 >= argc) {
        std::cerr << "mimegate: -r requires an argument\n";
        std::exit(exit_usage);
      }
      opts.registry_file = argv[++i];
      continue;
    }

    // "--" ends option processing; an empty argument is the empty media type.
    if (arg == "--") {
      for (++i; i < argc; ++i)
        opts.media_types.push_back(argv[i]);
      break;
    }

    if (!arg.empty() && arg[0] == '-') {
      std::cerr << "mimegate: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    opts.media_types.push_back(arg);
  }

  if (opts.media_types.empty()) opts.read_stdin = true;

  return opts;
}

static std::string
read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << "mimegate: cannot open file: " << path << "\n";
    std::exit(exit_io);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static nlohmann::json
constraint_to_json(const mimegate::value_constraint& c) {
  nlohmann::json j;
  j["match"] = std::string(mimegate::to_string(c.match));
  j["case"] = std::string(mimegate::to_string(c.case_rule));
  j["values"] = c.values;
  return j;
}

static void
list_registry(const mimegate::registry& reg, bool json) {
  if (json) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [key, entry] : reg.entries()) {
      nlohmann::json params = nlohmann::json::object();
      for (const auto& [name, c] : entry.parameters)
        params[name] = constraint_to_json(c);
      out[key] = params;
    }
    std::cout << out.dump(2) << "\n";
    return;
  }

  for (const auto& [key, entry] : reg.entries()) {
    if (entry.parameters.empty()) {
      std::cout << key << "\t(no parameters)\n";
      continue;
    }
    for (const auto& [name, c] : entry.parameters) {
      std::cout << key << '\t' << name << '\t' << mimegate::to_string(c.match)
                << '\t' << mimegate::to_string(c.case_rule);
      for (const auto& v : c.values)
        std::cout << '\t' << v;
      std::cout << '\n';
    }
  }
}

static std::string
content_class_of(const std::string& canonical) {
  auto parsed = mimegate::tokenize(canonical);
  auto cls = mimegate::classify(std::get<mimegate::media_type>(parsed));
  return std::string(mimegate::to_string(cls));
}

// Prints one verdict; returns true when accepted.
static bool
report(const std::string& raw, const mimegate::registry& reg,
       const cli_options& opts) {
  auto result = mimegate::validate(raw, reg);

  if (opts.json) {
    nlohmann::json j;
    j["input"] = raw;
    j["accepted"] = result.accepted();
    if (result) {
      if (result.canonical()) {
        j["canonical"] = *result.canonical();
        if (opts.classify) j["class"] = content_class_of(*result.canonical());
      } else {
        j["canonical"] = nullptr;
      }
    } else {
      const auto& err = result.error();
      j["reason"] = std::string(mimegate::to_string(err.reason));
      j["token"] = err.token;
      j["message"] = err.message();
      if (err.detail)
        j["detail"] = std::string(mimegate::to_string(*err.detail));
    }
    std::cout << j.dump() << "\n";
    return result.accepted();
  }

  if (!result) {
    const auto& err = result.error();
    std::cout << "rejected " << mimegate::to_string(err.reason) << ' '
              << err.token << "\n";
    std::cerr << "mimegate: rejected '" << raw << "': " << err.message()
              << "\n";
    return false;
  }

  if (!result.canonical()) {
    std::cout << "ok -\n";
    return true;
  }

  std::cout << "ok " << *result.canonical();
  if (opts.classify) std::cout << ' ' << content_class_of(*result.canonical());
  std::cout << "\n";
  return true;
}

static int
run(const cli_options& opts) {
  // Assemble the registry once; from here on it is only read.
  auto assembled = mimegate::registry::defaults();
  if (!opts.registry_file.empty()) {
    std::string xml = read_file(opts.registry_file);
    try {
      mimegate::expat_reader reader(xml);
      assembled.merge(mimegate::registry::load(reader));
    } catch (const std::exception& e) {
      std::cerr << "mimegate: error loading registry " << opts.registry_file
                << ": " << e.what() << "\n";
      return exit_registry;
    }
  }
  const mimegate::registry& reg = assembled;

  if (opts.list_registry) {
    list_registry(reg, opts.json);
    return exit_success;
  }

  bool all_accepted = true;
  for (const auto& raw : opts.media_types)
    all_accepted = report(raw, reg, opts) && all_accepted;

  if (opts.read_stdin) {
    std::string line;
    while (std::getline(std::cin, line)) {
      if (!line.empty() && line.back() == '\r') line.pop_back();
      all_accepted = report(line, reg, opts) && all_accepted;
    }
  }

  return all_accepted ? exit_success : exit_rejected;
}

int
main(int argc, char* argv[]) {
  cli_options opts = parse_args(argc, argv);

  if (opts.show_help) {
    print_usage(std::cerr);
    return exit_success;
  }

  if (opts.show_version) {
    print_version(std::cerr);
    return exit_success;
  }

  return run(opts);
}
