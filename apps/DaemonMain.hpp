#pragma once
/** @file  DaemonMain.hpp
 *  @brief Shared `main()` plumbing: command line, config, logger, run loop.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <exception>
#include <iostream>
#include <memory>
#include <string>

// Hearo headers
#include "core/Config.hpp"
#include "core/ConfigLoader.hpp"
#include "core/Daemon.hpp"
#include "core/Logger.hpp"

namespace hearo::apps {

  struct DaemonArgs {
    std::string configPath{ core::ConfigLoader::kDefaultPath };
    bool verbose{ false };
    bool help{ false };
  };

  /// `[-v|--verbose] [config.json]`
  inline DaemonArgs parseArgs(int argc, char** argv) {
    DaemonArgs args;
    for (int i = 1; i < argc; ++i) {
      const std::string a = argv[i];
      if (a == "-v" || a == "--verbose")
        args.verbose = true;
      else if (a == "-h" || a == "--help")
        args.help = true;
      else
        args.configPath = a;
    }
    return args;
  }

  /**
 * Load the configuration, set up \p log from its `log` section and run the
 * daemon returned by \p make. @returns the process exit status.
 */
  template <typename Make> int runDaemon(int argc, char** argv, core::Logger& log, Make&& make) {
    const auto args = parseArgs(argc, argv);
    if (args.help) {
      std::cout << "usage: " << argv[0] << " [-v|--verbose] [config.json]\n";
      return 0;
    }

    core::HearoConfig cfg;
    try {
      cfg = core::parseConfig(core::ConfigLoader(args.configPath).load());
    } catch (const std::exception& e) {
      log.error(std::string("configuration: ") + e.what());
      return 1;
    }

    if (args.verbose) {
      log.setLevel(core::LogLevel::Debug);
    } else if (auto level = core::parseLevel(cfg.log.level)) {
      log.setLevel(*level);
    } else {
      log.warn("unknown log level '" + cfg.log.level + "', using info");
    }
    if (!cfg.log.file.empty() && !log.openFile(cfg.log.file, cfg.log.maxBytes, cfg.log.backups))
      log.warn("cannot open log file " + cfg.log.file + ", console only");

    try {
      std::unique_ptr<core::Daemon> daemon = make(cfg);
      core::Daemon::installSignalHandlers();
      return daemon->run();
    } catch (const std::exception& e) {
      log.error(std::string("fatal: ") + e.what());
      log.flush();
      return 1;
    }
  }

} // namespace hearo::apps
