#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/services.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"
#include "internal/util/uuid.hpp"

using aggregator::observability::IntField;
using aggregator::observability::StringField;
using aggregator::runtime::Server;

namespace {

constexpr char kDefaultBindAddress[] = "0.0.0.0:50061";

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

void PrintUsage() {
  std::cerr << "Usage: batch-aggregator [--check] <config.yaml>\n"
            << "       batch-aggregator [--check] --config <config.yaml>\n"
            << "  --check   validate the configuration and exit\n";
}

struct Options {
  std::string config_path;
  bool        check_only = false;
};

bool ParseArgs(int argc, char** argv, Options& options) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--check") {
      options.check_only = true;
    } else if (arg == "--config" && i + 1 < argc) {
      options.config_path = argv[++i];
    } else if (options.config_path.empty() && arg.rfind("--", 0) != 0) {
      options.config_path = arg;
    } else {
      return false;
    }
  }
  return !options.config_path.empty();
}

} // namespace

int main(int argc, char** argv) {
  Options options;
  if (!ParseArgs(argc, argv, options)) {
    PrintUsage();
    return 1;
  }

  try {
    auto config = aggregator::config::ConfigLoader::LoadFromYaml(options.config_path);

    if (options.check_only) {
      std::cout << "config ok: " << options.config_path << "\n"
                << "  database:  " << (config.database().has_sqlite() ? "sqlite " + config.database().sqlite().path() : std::string("memory")) << "\n"
                << "  owner:     " << config.access().owner() << "\n"
                << "  providers: " << config.access().providers_size() << "\n";
      return 0;
    }

    aggregator::observability::InitializeLogging(config);

    auto rt = aggregator::factory::BuildRuntime(config);

    const auto bind_address = config.server().bind_address().empty() ? std::string(kDefaultBindAddress) : config.server().bind_address();
    Server     server(bind_address, aggregator::grpc::BuildServices(rt));

    // Handlers go in before Start() so an early signal still shuts down cleanly.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    AGGREGATOR_LOG_INFO("batch aggregator started", {IntField("port", server.Port()), StringField("instance_id", aggregator::util::ToString(rt.instance_id)),
                                                       IntField("providers", config.access().providers_size())});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(250));

    AGGREGATOR_LOG_INFO("shutting down batch aggregator", {IntField("pending_requests", static_cast<int64_t>(rt.aggregator->Stats().pending_requests))});

    server.Stop();
    rt.Shutdown();
    aggregator::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    AGGREGATOR_LOG_ERROR("fatal error", {StringField("error", e.what())});
    aggregator::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
