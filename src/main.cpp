/*
 * CloudRun - Streamed Code Execution in Ephemeral Sandboxes
 * One WebSocket session per execution, one Docker container per run
 */

#include "config.h"
#include "docker_engine.h"
#include "environment_registry.h"
#include "errors.h"
#include "execution_orchestrator.h"
#include "http_server.h"
#include "rate_limiter.h"
#include "sandbox_manager.h"
#include "streaming_session.h"
#include "websocket.h"
#include <json/json.h>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>
#include <unistd.h>

using namespace cloudrun;

namespace {

EnvironmentRegistry load_registry(const ServiceConfig& config) {
    if (config.environments_file.empty()) {
        return EnvironmentRegistry::with_builtins();
    }
    return EnvironmentRegistry::from_json_file(config.environments_file);
}

// Best effort: a failed pull is retried on first use
void pre_pull(SandboxManager& sandboxes, const EnvironmentRegistry& registry) {
    for (const auto& image : registry.runtime_images()) {
        try {
            std::cout << "[Server] Pulling " << image << "..." << std::endl;
            sandboxes.ensure_image(image);
        } catch (const ProvisioningError& e) {
            std::cerr << "[Server] " << e.what() << std::endl;
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    // Peers that vanish mid-write must not kill the process
    signal(SIGPIPE, SIG_IGN);

    ServiceConfig config;
    try {
        config = ServiceConfig::load(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << std::endl;
        print_usage(argv[0]);
        return 2;
    }
    if (config.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    std::cout << "CloudRun " << CLOUDRUN_VERSION << " - Sandboxed Code Execution" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;

    std::unique_ptr<EnvironmentRegistry> registry;
    try {
        registry = std::make_unique<EnvironmentRegistry>(load_registry(config));
    } catch (const ValidationError& e) {
        std::cerr << "[Server] " << e.what() << std::endl;
        return 1;
    }

    auto engine = std::make_shared<DockerCliEngine>(config.docker_binary);
    try {
        std::cout << "[Server] Docker engine " << engine->ping() << std::endl;
    } catch (const EngineError& e) {
        std::cerr << "[Server] Docker is not reachable: " << e.what() << std::endl;
        return 1;
    }

    SandboxManagerConfig sandbox_config;
    sandbox_config.max_concurrent_sandboxes = config.max_concurrent_sandboxes;
    sandbox_config.user = std::to_string(getuid()) + ":" + std::to_string(getgid());
    SandboxManager sandboxes(engine, sandbox_config);

    // Containers left behind by a previous run of the service
    sandboxes.reap_orphans();

    if (config.pre_pull_images) {
        pre_pull(sandboxes, *registry);
    }

    ExecutionOrchestrator orchestrator(*registry, sandboxes, config.orchestrator_config());
    RateLimiter rate_limiter(config.rate_limits);

    std::cout << "Languages:";
    for (const auto& id : registry->list_environments()) {
        std::cout << " " << id;
    }
    std::cout << std::endl;
    std::cout << "Limits: " << config.run_limits.wall_clock_timeout.count() / 1000 << "s, "
              << config.run_limits.memory_limit_bytes / (1024 * 1024) << "MB, "
              << config.max_concurrent_sandboxes << " concurrent sandboxes" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;

    HttpServer server(config.port);

    // GET /health - liveness probe
    server.route("GET", "/health", [](const HttpRequest&) {
        Json::Value body;
        body["status"] = "ok";
        body["version"] = CLOUDRUN_VERSION;

        Json::StreamWriterBuilder writer;
        writer["indentation"] = "";

        HttpResponse resp;
        resp.body = Json::writeString(writer, body);
        return resp;
    });

    // WS /ws/execute - one streamed execution (plus follow-ups) per connection
    server.websocket_route("/ws/execute", [&](int client_fd, const HttpRequest& req) {
        auto transport = std::make_shared<WebSocketTransport>(client_fd);
        StreamingSession session(transport, orchestrator, config.session, &rate_limiter,
                                 req.client_ip);
        session.run();
    });

    // Forget idle clients; stray containers expire by themselves
    std::thread([&rate_limiter]() {
        while (true) {
            std::this_thread::sleep_for(std::chrono::minutes(5));
            rate_limiter.cleanup_old_entries();
        }
    }).detach();

    std::cout << "Starting server on port " << config.port << "..." << std::endl;
    std::cout << "  GET  /health       - Service status" << std::endl;
    std::cout << "  WS   /ws/execute   - Execute code with streamed output" << std::endl;
    std::cout << std::endl;

    try {
        server.start();
    } catch (const std::exception& e) {
        std::cerr << "[Server] " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
