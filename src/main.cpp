// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#include "application.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <iostream> // CLI output and early errors before logger initialized

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options] <command> [args]\n"
      << "\n"
      << "Commands:\n"
      << "  add-link <target-hex> [tag]   Link an entry on the current chunk\n"
      << "  index <text> [time] [tag]     Store text and link it at time (default: now)\n"
      << "  current                       Current chunk and its links\n"
      << "  latest                        Most recent committed chunk and its links\n"
      << "  span <from> <until>           Committed chunks covering a time span\n"
      << "  links <chunk-index>           Link records reachable from a chunk\n"
      << "  params                        Show network parameters\n"
      << "\n"
      << "Options:\n"
      << "  --datadir=<path>     Data directory (default: ~/.timechunk)\n"
      << "  --regtest            Use regression test network (short chunks)\n"
      << "  --testnet            Use test network\n"
      << "  --params=<file>      Load network definition from JSON file\n"
      << "  --agent=<hex>        Act as this agent id (default: datadir identity)\n"
      << "  --index=<name>       Named index to operate on (default: default)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: warn\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: chunk, link, validation, store, app, all\n"
      << "                       Can be comma-separated: --debug=link,validation\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    timechunk::app::AppConfig config;
    config.datadir = timechunk::util::get_default_datadir();
    std::string log_level = "warn";
    std::vector<std::string> debug_components;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (!positional.empty() || arg.rfind("--", 0) != 0) {
        positional.push_back(arg);
      } else if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << timechunk::GetFullVersionString() << std::endl;
        std::cout << timechunk::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--datadir=") == 0) {
        config.datadir = arg.substr(10);
      } else if (arg == "--regtest") {
        config.network_type = timechunk::chunk::NetworkType::REGTEST;
      } else if (arg == "--testnet") {
        config.network_type = timechunk::chunk::NetworkType::TESTNET;
      } else if (arg.find("--params=") == 0) {
        config.params_file = arg.substr(9);
      } else if (arg.find("--agent=") == 0) {
        config.agent_hex = arg.substr(8);
      } else if (arg.find("--index=") == 0) {
        config.index_name = arg.substr(8);
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=link,validation
        std::string components = arg.substr(8);
        size_t pos = 0;
        while (pos < components.length()) {
          size_t comma = components.find(',', pos);
          if (comma == std::string::npos) {
            debug_components.push_back(components.substr(pos));
            break;
          }
          debug_components.push_back(components.substr(pos, comma - pos));
          pos = comma + 1;
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    if (positional.empty()) {
      print_usage(argv[0]);
      return 1;
    }

    // Log to the console (stderr keeps stdout clean for JSON)
    timechunk::util::LogManager::Initialize(log_level);
    for (const auto &component : debug_components) {
      if (component == "all") {
        timechunk::util::LogManager::SetLogLevel("trace");
      } else {
        timechunk::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    timechunk::app::Application app(config);
    if (!app.initialize()) {
      LOG_ERROR("Failed to initialize application");
      timechunk::util::LogManager::Shutdown();
      return 1;
    }

    const std::string command = positional.front();
    const std::vector<std::string> args(positional.begin() + 1, positional.end());

    nlohmann::json result;
    try {
      result = app.run_command(command, args);
    } catch (const std::invalid_argument &e) {
      std::cerr << "Error: " << e.what() << std::endl;
      print_usage(argv[0]);
      timechunk::util::LogManager::Shutdown();
      return 1;
    }

    // Tags are opaque bytes; invalid UTF-8 is replaced in the printed "tag"
    // ("tag_hex" is exact)
    std::cout << result.dump(2, ' ', false,
                             nlohmann::json::error_handler_t::replace)
              << std::endl;

    const bool saved = app.shutdown();
    timechunk::util::LogManager::Shutdown();

    if (!saved) {
      return 1;
    }
    return result.is_object() && result.contains("error") ? 1 : 0;

  } catch (const std::exception &e) {
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    timechunk::util::LogManager::Shutdown();
    return 1;
  }
}
