/* @file main.cpp
 * @brief susresd: wires the Linux collaborators and serves the control socket
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

// third-party headers
#include <nlohmann/json.hpp>

// SusRes headers
#include "core/ConfigLoader.hpp"
#include "core/ControlService.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/NotificationManager.hpp"
#include "core/SuspendConfig.hpp"
#include "core/SuspendCoordinator.hpp"
#include "io/ControlSocket.hpp"
#include "io/EntropySource.hpp"
#include "io/MessageChannel.hpp"
#include "io/PowerGateway.hpp"
#include "io/SwapClient.hpp"
#include "io/TokenSlot.hpp"

using namespace susres;

namespace {

  std::atomic<bool> g_stop{ false };

  void onSignal(int) { g_stop.store(true); }

  constexpr std::chrono::milliseconds kAcceptPoll{ 200 };
  constexpr std::chrono::milliseconds kClientIdle{ 2000 };

  core::SuspendConfig loadConfig(int argc, char** argv) {
    if (argc < 2)
      return core::SuspendConfig{};
    core::ConfigLoader loader(argv[1]);
    return core::SuspendConfig::fromJson(loader.load());
  }

  // one client at a time: a SUSPEND runs to completion before the next request is read
  void serveClient(io::MessageChannel& client, core::ControlService& service) {
    while (!g_stop.load() && client.isOpen()) {
      auto request = client.readLine(kClientIdle);
      if (!request)
        return;
      if (!client.writeLine(service.handle(*request)))
        return;
    }
  }

} // namespace

int main(int argc, char** argv) {
  core::SuspendConfig config;
  try {
    config = loadConfig(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "susresd: " << e.what() << '\n';
    return 1;
  }

  auto logger = std::make_shared<core::Logger>();
  try {
    logger->startNewRun(config.logPath);
  } catch (const std::exception& e) {
    std::cerr << "susresd: " << e.what() << ", continuing without event log\n";
  }

  auto errorMonitor = std::make_shared<core::ErrorMonitor>();
  errorMonitor->registerEscalation([logger](const std::string& msg) {
    logger->log(core::LogLevel::Error, "ErrorMonitor", msg);
    std::cerr << msg << '\n';
  });

  core::Platform platform;
  platform.entropy = std::make_shared<io::DevRandomSource>(config.entropyDevice);
  platform.tokenSlot = std::make_shared<io::FileTokenSlot>(config.tokenSlotPath);
  auto gateway = std::make_shared<io::SysfsPowerGateway>(config.powerStatePath, config.bootHandoffPath);
  platform.gateway = gateway;
  if (config.options.swap)
    platform.swap = std::make_shared<io::ChannelSwapClient>(std::make_unique<io::MessageChannel>(),
                                                            config.swapAddress, config.ackTimeout);

  auto notifier = std::make_unique<core::NotificationManager>(
      errorMonitor, [](const std::string&) { return std::make_unique<io::MessageChannel>(); });

  try {
    core::SuspendCoordinator coordinator(config, platform, std::move(notifier), errorMonitor, logger);
    coordinator.initialize(gateway->takeBootContext());

    core::ControlService service(coordinator);
    io::ControlSocket control;
    if (!control.listen(config.controlSocket)) {
      std::cerr << "susresd: cannot listen on " << config.controlSocket << '\n';
      logger->finishRun();
      return 1;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
    logger->log(core::LogLevel::Info, "susresd", "listening on " + config.controlSocket);

    while (!g_stop.load()) {
      auto client = control.accept(kAcceptPoll);
      if (client)
        serveClient(*client, service);
    }

    logger->log(core::LogLevel::Info, "susresd", "shutting down");
  } catch (const std::exception& e) {
    std::cerr << "susresd: " << e.what() << '\n';
    logger->finishRun();
    return 1;
  }

  logger->finishRun();
  return 0;
}
