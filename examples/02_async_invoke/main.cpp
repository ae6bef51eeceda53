// Example 02: Asynchronous Invocation
//
// Submit several requests at once, stream a request body, and cancel a
// slow request while it is in flight.

#include <wirecall/client/invocation.hpp>
#include <wirecall/log/spdlog_logger.hpp>
#include <wirecall/transport/cpr_transport.hpp>

#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace wirecall;

int main() {
    std::cout << "=== Asynchronous Invocation Example ===\n\n";

    const char* base_env = std::getenv("WIRECALL_BASE_URL");
    const std::string base = base_env ? base_env : "https://httpbin.org";

    set_logger(make_spdlog_async_console_logger(log_level_from_env()));

    auto transport = std::make_shared<CprTransport>(TransportConfig{}.with_worker_threads(4));
    InvocationDispatcher dispatcher(transport, ClientConfig{}.with_async_threads(2));

    // 1. Fan out
    std::vector<std::shared_ptr<PendingInvocation<Json>>> pending;
    for (int i = 0; i < 3; ++i) {
        InvocationCallback<Json> callback;
        callback.on_completed = [i](const Json&) {
            std::cout << "  request " << i << " completed\n";
        };
        callback.on_failed = [i](const InvocationError& error) {
            std::cout << "  request " << i << " failed: " << error.message << "\n";
        };
        pending.push_back(dispatcher.submit<Json>(
            OutboundRequest("GET", base + "/get?n=" + std::to_string(i)), std::move(callback)));
    }
    for (auto& p : pending) {
        auto result = p->get();
        if (result) {
            std::cout << "  url: " << (*result)["url"].get<std::string>() << "\n";
        }
    }

    // 2. Streaming upload, sent chunked while the writer runs
    OutboundRequest upload("POST", base + "/post");
    upload.entity(Entity::streaming([](EntitySink& sink) {
        for (int line = 0; line < 100; ++line) {
            sink.write("line " + std::to_string(line) + "\n");
        }
    }, "text/plain"));
    upload.property(property::EntityProcessing, "CHUNKED");

    auto echoed = dispatcher.submit<Json>(upload)->get();
    if (echoed) {
        std::cout << "\nUploaded " << (*echoed)["data"].get<std::string>().size() << " bytes\n";
    } else {
        std::cout << "\nUpload failed: " << echoed.error().message << "\n";
    }

    // 3. Cancel a slow request
    auto slow = dispatcher.submit(OutboundRequest("GET", base + "/delay/5"));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    const bool cancelled = slow->cancel();
    std::cout << "\nSlow request cancelled: " << (cancelled ? "yes" : "no (already done)") << "\n";
    std::cout << "State: " << to_string(slow->state()) << "\n";

    dispatcher.close();
    return 0;
}
