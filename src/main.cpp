#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <memory>
#include <string>
#include <vector>

#include "hostlink/hostlink.hpp"

namespace {

std::atomic<bool> g_shutdown{false};

} // namespace

int main(int argc, char **argv) {
  hostlink::bridge_options options;
  try {
    options = hostlink::parse_flags(std::vector<std::string>(argv + 1, argv + argc));
    hostlink::set_log_level(options.log_level);
  } catch (const std::invalid_argument &e) {
    hostlink::logger()->error("{}", e.what());
    return 2;
  }

  std::signal(SIGINT, [](int) { g_shutdown.store(true); });
  std::signal(SIGTERM, [](int) { g_shutdown.store(true); });

  // the thread that drives the loop below is the host thread
  hostlink::host_loop loop;
  hostlink::host_context ctx("SampleScene");
  ctx.world.create_entity("Main Camera")->set_tag("MainCamera");
  ctx.world.create_entity("Directional Light");

  auto registry = std::make_shared<hostlink::command_registry>();
  hostlink::register_core_commands(*registry, ctx);
  hostlink::register_workflow_commands(*registry, ctx, options);

  hostlink::main_thread_executor executor(
      loop, std::chrono::milliseconds(options.invocation_timeout_ms));
  hostlink::bridge_server server(executor, registry, options);
  try {
    server.start();
  } catch (const std::exception &e) {
    hostlink::logger()->error("cannot start bridge: {}", e.what());
    return 1;
  }
  hostlink::logger()->info("{} commands registered, scene '{}'",
                           registry->size(), ctx.world.name());

  while (!g_shutdown.load())
    loop.tick(std::chrono::milliseconds(16));

  server.stop();
  loop.stop();
  return 0;
}
