#include <cstdlib>
#include <iostream>

#include "cli/Cli.hpp"
#include "cli/CliOptions.hpp"
#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"

int main(int argc, char* argv[]) {
  try {
    // ── Step 1: Parse the command line ───────────────────────────────────
    auto coOpts = fleet::cli::parseArgs(argc, argv);

    // ── Step 2: Load configuration and apply CLI overrides ───────────────
    auto cfgApp = fleet::common::Config::load();
    coOpts.applyTo(cfgApp);

    fleet::common::Logger::init(cfgApp.sLogLevel);
    auto spLog = fleet::common::Logger::get();
    spLog->debug("Configuration loaded (parallel={}, serial={}, fail_percent={}, dry={})",
                 cfgApp.iParallel, cfgApp.bSerial, cfgApp.iFailPercent, cfgApp.bDryRun);

    // ── Step 3: Evaluate and execute ─────────────────────────────────────
    const int iExitCode = fleet::cli::run(coOpts, cfgApp, std::cout, std::cerr);
    fleet::common::Logger::shutdown();
    return iExitCode;
  } catch (const fleet::common::ValidationError& ex) {
    std::cerr << "[error] " << ex.what() << "\n\n";
    fleet::cli::printHelp(std::cerr);
    return ex._iExitCode;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
