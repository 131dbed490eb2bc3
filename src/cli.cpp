#include <iostream>
#include <string>
#include <vector>

#include "preflight/harness.hpp"
#include "preflight/jsonlite.hpp"
#include "preflight/log.hpp"
#include "preflight/remove.hpp"
#include "preflight/sandbox.hpp"
#include "preflight/types.hpp"
#include "preflight/version.hpp"

namespace {

void usage() {
  std::cerr << "usage:\n"
               "  preflight validate <binary> <vMAJOR.MINOR.PATCH> [--json] [--verbose]\n"
               "  preflight compare <version-a> <version-b>\n"
               "  preflight tweak-config <node-home>\n"
               "  preflight remove <path>\n"
               "  preflight version\n";
}

bool has_flag(int argc, char **argv, const std::string &flag) {
  for (int i = 1; i < argc; ++i) {
    if (flag == argv[i])
      return true;
  }
  return false;
}

// Arguments that are not --flags, command name first.
std::vector<std::string> positionals(int argc, char **argv) {
  std::vector<std::string> out;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]).rfind("--", 0) == 0)
      continue;
    out.emplace_back(argv[i]);
  }
  return out;
}

}  // namespace

int main(int argc, char **argv) {
  const auto args = positionals(argc, argv);
  if (args.empty()) {
    usage();
    return 2;
  }
  const std::string &cmd = args[0];

  auto config = preflight::HarnessConfig::from_env();
  if (has_flag(argc, argv, "--verbose"))
    config.verbose = true;
  preflight::log::set_verbose(config.verbose);
  preflight::log::set_event_log(config.event_log_path);

  if (cmd == "validate") {
    if (args.size() != 3) {
      usage();
      return 2;
    }
    preflight::CandidateBinary candidate{args[1], args[2]};
    const auto report = preflight::validate_candidate(candidate, config);
    if (has_flag(argc, argv, "--json"))
      std::cout << preflight::report_to_json(report) << "\n";
    return report.ok ? 0 : 1;
  }

  if (cmd == "compare") {
    if (args.size() != 3) {
      usage();
      return 2;
    }
    const bool before = preflight::version::precedes(args[1], args[2]);
    std::cout << "{\"a\":\"" << preflight::jsonlite::escape(args[1])
              << "\",\"b\":\"" << preflight::jsonlite::escape(args[2])
              << "\",\"precedes\":" << (before ? "true" : "false") << "}\n";
    return 0;
  }

  if (cmd == "tweak-config") {
    if (args.size() != 2) {
      usage();
      return 2;
    }
    if (auto err = preflight::tweak_config(args[1])) {
      preflight::log::error(err->describe());
      return 1;
    }
    return 0;
  }

  if (cmd == "remove") {
    if (args.size() != 2) {
      usage();
      return 2;
    }
    std::string relocated;
    if (auto err = preflight::force_remove(args[1], &relocated)) {
      preflight::log::error(err->describe());
      return 1;
    }
    if (!relocated.empty())
      std::cout << relocated << "\n";
    return 0;
  }

  if (cmd == "version") {
    std::cout << preflight::version::manifest_to_json(
                     preflight::version::current_manifest())
              << "\n";
    return 0;
  }

  usage();
  return 2;
}
