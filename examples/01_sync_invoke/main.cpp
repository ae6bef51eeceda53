// Example 01: Synchronous Invocation
//
// Fetch a JSON document over HTTP, blocking until the response arrives.
// Non-2xx statuses come back as typed errors that still carry the response.

#include <wirecall/client/invocation.hpp>
#include <wirecall/log/spdlog_logger.hpp>
#include <wirecall/transport/cpr_transport.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

using namespace wirecall;

int main() {
    std::cout << "=== Synchronous Invocation Example ===\n\n";

    const char* url_env = std::getenv("WIRECALL_URL");
    const std::string url = url_env ? url_env : "https://httpbin.org/json";
    std::cout << "Target: " << url << "\n\n";

    // 1. Route library logs to spdlog
    set_logger(make_spdlog_console_logger(log_level_from_env()));

    // 2. Transport and dispatcher
    TransportConfig transport_config;
    transport_config.with_connect_timeout(std::chrono::seconds(5))
                    .with_user_agent("wirecall-example/1.0");
    auto transport = std::make_shared<CprTransport>(transport_config);

    ClientConfig client_config;
    client_config.with_read_timeout(std::chrono::seconds(10));
    InvocationDispatcher dispatcher(transport, client_config);
    std::cout << "Transport: " << dispatcher.name() << "\n";

    // 3. GET as JSON
    OutboundRequest request("GET", url);
    request.header("Accept", "application/json");

    auto document = dispatcher.invoke<Json>(request);
    if (!document) {
        const auto& error = document.error();
        std::cerr << "Invocation failed: " << error.message << "\n";
        if (error.response != nullptr) {
            auto body = error.response->read_text();
            if (body) {
                std::cerr << "Response body: " << *body << "\n";
            }
        }
        return 1;
    }
    std::cout << document->dump(2) << "\n\n";

    // 4. A missing resource maps to NotFound
    auto missing = dispatcher.invoke(OutboundRequest("GET", url + "/does-not-exist"));
    if (!missing && missing.error().is(HttpStatusKind::NotFound)) {
        std::cout << "Missing resource reported as NotFound (" << *missing.error().http_status << ")\n";
    }

    dispatcher.close();
    std::cout << "Done.\n";
    return 0;
}
