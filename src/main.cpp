#include "app/corpus_generator.hpp"
#include "app/sample_protocol.hpp"
#include "fuzz/fuzz.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <cstdint>
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <limits>
#include <string>
#include <vector>

namespace {

// Guards against typos that would fill a disk
constexpr size_t kMaxEntries = 10'000'000;
constexpr size_t kMaxRecordSize = 16 * 1024 * 1024;
constexpr size_t kMaxMutations = 10'000;
constexpr size_t kMaxThreads = 1024;

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Generates a seed corpus of sample protocol records.\n"
      << "\n"
      << "Options:\n"
      << "  --outdir=<path>      Output directory (default: ./corpus)\n"
      << "  --count=<n>          Number of entries (default: 16)\n"
      << "  --seed=<n>           Base seed; entry i uses seed + i (default: 0)\n"
      << "  --max-size=<bytes>   Byte budget per generated record (default: 256)\n"
      << "  --endian=<order>     little|big (default: little)\n"
      << "  --mutations=<n>      Mutated descendants per entry (default: 0)\n"
      << "  --threads=<n>        Worker threads (default: hardware concurrency)\n"
      << "  --config=<file>      Mutator configuration JSON\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: codec, generate, mutate, registry, app, all\n"
      << "                       Can be comma-separated: --debug=generate,mutate\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

// Value of "--name=value", or nullptr when arg is a different option
const char *option_value(const std::string &arg, const std::string &name) {
  const std::string prefix = name + "=";
  if (arg.compare(0, prefix.size(), prefix) == 0) {
    return arg.c_str() + prefix.size();
  }
  return nullptr;
}

bool parse_size_option(const std::string &arg, const char *value, size_t min, size_t max,
                       size_t &out) {
  auto parsed = shapefuzz::util::SafeParseSize(value, min, max);
  if (!parsed) {
    std::cerr << "Error: Invalid value in " << arg << std::endl;
    std::cerr << "Expected a number between " << min << " and " << max << std::endl;
    return false;
  }
  out = *parsed;
  return true;
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    shapefuzz::app::CorpusConfig config;
    std::string log_level = "info";
    std::vector<std::string> debug_components;
    std::string config_path;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      const char *value = nullptr;

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << shapefuzz::GetFullVersionString() << std::endl;
        std::cout << shapefuzz::GetCopyrightString() << std::endl;
        return 0;
      } else if ((value = option_value(arg, "--outdir"))) {
        config.outdir = value;
      } else if ((value = option_value(arg, "--count"))) {
        if (!parse_size_option(arg, value, 1, kMaxEntries, config.count)) {
          return 1;
        }
      } else if ((value = option_value(arg, "--seed"))) {
        auto seed = shapefuzz::util::SafeParseUInt64(value, 0, std::numeric_limits<uint64_t>::max());
        if (!seed) {
          std::cerr << "Error: Invalid seed: " << value << std::endl;
          return 1;
        }
        config.seed = *seed;
      } else if ((value = option_value(arg, "--max-size"))) {
        if (!parse_size_option(arg, value, 0, kMaxRecordSize, config.max_size)) {
          return 1;
        }
      } else if ((value = option_value(arg, "--endian"))) {
        auto order = shapefuzz::codec::ParseEndianness(value);
        if (!order) {
          std::cerr << "Error: Unknown byte order: " << value << " (use little or big)" << std::endl;
          return 1;
        }
        config.endianness = *order;
      } else if ((value = option_value(arg, "--mutations"))) {
        if (!parse_size_option(arg, value, 0, kMaxMutations, config.mutations)) {
          return 1;
        }
      } else if ((value = option_value(arg, "--threads"))) {
        if (!parse_size_option(arg, value, 0, kMaxThreads, config.threads)) {
          return 1;
        }
      } else if ((value = option_value(arg, "--config"))) {
        config_path = value;
      } else if ((value = option_value(arg, "--loglevel"))) {
        log_level = value;
      } else if ((value = option_value(arg, "--debug"))) {
        auto components = shapefuzz::util::SplitComponents(value);
        debug_components.insert(debug_components.end(), components.begin(), components.end());
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    shapefuzz::util::LogManager::Initialize(log_level);

    for (const auto &component : debug_components) {
      if (component == "all") {
        shapefuzz::util::LogManager::SetLogLevel("trace");
      } else {
        shapefuzz::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    if (!config_path.empty()) {
      auto loaded = shapefuzz::fuzz::LoadMutatorConfig(config_path);
      if (!loaded) {
        std::cerr << "Error: Cannot load mutator config: " << config_path << std::endl;
        shapefuzz::util::LogManager::Shutdown();
        return 1;
      }
      config.mutator = *loaded;
    }

    int exit_code = 0;
    {
      shapefuzz::fuzz::ShapeRegistry registry;
      shapefuzz::app::RegisterSampleProtocol(registry);
      registry.Freeze();

      shapefuzz::app::CorpusGenerator generator(registry, config);
      const auto stats = generator.Run();
      if (!stats.ok()) {
        LOG_APP_ERROR("{} corpus files could not be written", stats.files_failed);
        exit_code = 1;
      }
    }

    shapefuzz::util::LogManager::Shutdown();
    return exit_code;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    shapefuzz::util::LogManager::Shutdown();
    return 1;
  }
}
