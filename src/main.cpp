// File: src/main.cpp
#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>

#include "cpupool/HandlerRegistry.hpp"
#include "cpupool/TaskError.hpp"
#include "cpupool/TaskPool.hpp"
#include "cpupool/handlers/Builtins.hpp"
#include "cpupool/handlers/FileTasks.hpp"
#include "cpupool/rt/ShutdownCoordinator.hpp"
#include "cpupool/util/Config.hpp"
#include "cpupool/util/Logger.hpp"
#include "cpupool/util/Metrics.hpp"

namespace {

void usage(const char* argv0) {
  std::cerr
    << "usage: " << argv0 << " [-c config] hash <files...>\n"
    << "       " << argv0 << " [-c config] analyze <files...>\n"
    << "       " << argv0 << " [-c config] compress <outdir> <files...>\n"
    << "       " << argv0 << " [-c config] search <pattern> <files...>\n";
}

struct Command {
  std::string configPath;
  std::string verb;
  std::string arg;                 // outdir / pattern
  std::vector<std::string> files;
};

bool parseArgs(int argc, char* argv[], Command& cmd) {
  int i = 1;
  if (i + 1 < argc && std::string(argv[i]) == "-c") {
    cmd.configPath = argv[i + 1];
    i += 2;
  }
  if (i >= argc) return false;
  cmd.verb = argv[i++];

  if (cmd.verb == "compress" || cmd.verb == "search") {
    if (i >= argc) return false;
    cmd.arg = argv[i++];
  } else if (cmd.verb != "hash" && cmd.verb != "analyze") {
    return false;
  }

  for (; i < argc; ++i) cmd.files.emplace_back(argv[i]);
  return !cmd.files.empty();
}

std::vector<std::string> runCommand(const Command& cmd, cpupool::TaskPool& pool) {
  cpupool::handlers::FileTasks files(pool);
  if (cmd.verb == "hash")     return files.hashFiles(cmd.files);
  if (cmd.verb == "analyze")  return files.analyzeCodeFiles(cmd.files);
  if (cmd.verb == "compress") return files.compressFiles(cmd.files, cmd.arg);
  return files.searchInFiles(cmd.files, cmd.arg);
}

} // namespace

int main(int argc, char* argv[]) {
  using namespace cpupool::util;

  Command cmd;
  if (!parseArgs(argc, argv, cmd)) {
    usage(argv[0]);
    return 2;
  }

  // ---------------------------
  // 1) Config + logger
  // ---------------------------
  Config cfg;
  if (!cmd.configPath.empty() && !cfg.loadFromFile(cmd.configPath)) {
    std::cerr << "[config] failed to load file: " << cmd.configPath << "\n";
    return 2;
  }

  logger().setLevel(parseLevel(cfg.logLevel));
  logger().setFormatJson(cfg.logFormat == "json");
  if (!cfg.logFile.empty() && !logger().setFile(cfg.logFile)) {
    std::cerr << "[config] cannot open log file " << cfg.logFile << ", logging to stdout\n";
  }

  logger().log(LogLevel::Info, "boot", {
    {"command", cmd.verb}, {"files", std::to_string(cmd.files.size())}
  });

  // ---------------------------
  // 2) Pool + shutdown sequencing
  // ---------------------------
  auto registry = std::make_shared<cpupool::HandlerRegistry>();
  cpupool::handlers::registerBuiltinHandlers(*registry);

  cpupool::TaskPool pool(cfg, registry);
  cpupool::rt::ShutdownCoordinator shutdown;

  if (cfg.enableMetrics) {
    const auto secs = static_cast<unsigned>(std::max(1L, cfg.metricsIntervalMs / 1000));
    MetricRegistry::instance().startReporter(secs);
    shutdown.registerStep("metrics-reporter", 90, []{ MetricRegistry::instance().stopReporter(); });
  }
  shutdown.registerStep("pool-shutdown", 80, [&pool]{ pool.shutdown(); });

  // ---------------------------
  // 3) Signals -> ordered stop
  // ---------------------------
  boost::asio::io_context ioc;
  boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code& ec, int signo) {
    if (ec) return;
    logger().log(LogLevel::Warn, "signal received, stopping", { {"signal", std::to_string(signo)} });
    shutdown.stop();
  });

  // ---------------------------
  // 4) Run the job off the signal thread
  // ---------------------------
  std::atomic<int> exitCode{EXIT_SUCCESS};
  std::thread job([&] {
    try {
      for (const auto& line : runCommand(cmd, pool)) std::cout << line << "\n";
      std::cout.flush();
    } catch (const cpupool::TaskError& ex) {
      logger().log(LogLevel::Error, ex.what(), { {"kind", cpupool::errorKindName(ex.kind())} });
      exitCode = EXIT_FAILURE;
    } catch (const std::exception& ex) {
      logger().log(LogLevel::Error, std::string("command failed: ") + ex.what());
      exitCode = EXIT_FAILURE;
    }
    boost::asio::post(ioc, [&signals]{
      boost::system::error_code ignored;
      signals.cancel(ignored);
    });
  });

  try {
    ioc.run();
  } catch (const std::exception& ex) {
    logger().log(LogLevel::Error, std::string("io_context exception: ") + ex.what());
    exitCode = EXIT_FAILURE;
  }
  job.join();

  // Ensure shutdown steps run even on natural exit
  if (shutdown.stop() > 0) exitCode = EXIT_FAILURE;

  const auto m = pool.poolMetrics();
  logger().log(LogLevel::Info, "stopped", {
    {"completed", std::to_string(m.completedTasks)}, {"failed", std::to_string(m.failedTasks)}
  });
  return exitCode.load();
}
