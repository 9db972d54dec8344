#include "retry.hpp"
#include <algorithm>
#include <thread>
#include "../../core/logger/logger.hpp"
#include "../../core/types/constants.hpp"

namespace Fetchium {
namespace Network {
namespace Http {

using namespace Fetchium::Core;

namespace {
constexpr std::chrono::milliseconds WAIT_SLICE{50};
}  // namespace

bool is_transient(const Response& response) {
    if (response.error_type == ErrorType::Cancelled)
        return false;
    if (response.error_type != ErrorType::None)
        return true;
    return response.status_code == static_cast<long>(HTTPCode::TooManyRequests)
           || response.status_code >= static_cast<long>(MaxCode::ServerError);
}

bool wait_for_retry(std::chrono::milliseconds delay, const Proxy::TransportConfig& transport) {
    auto deadline = std::chrono::steady_clock::now() + delay;
    while (std::chrono::steady_clock::now() < deadline) {
        if (transport.cancelled())
            return false;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(std::min(left, WAIT_SLICE));
    }
    return !transport.cancelled();
}

Response get_with_retry(HttpClient&                   client,
                        const std::string&            url,
                        const RetryPolicy&            policy,
                        const Proxy::TransportConfig& transport) {
    Response res;
    int      attempts = std::max(1, policy.max_attempts);
    client.set_transport(transport);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        std::string log_msg = "Fetching: " + url;
        if (attempt > 1)
            log_msg += " [Retry " + std::to_string(attempt) + "]";
        Logger::info(log_msg);

        res = client.get(url);
        if (res.success || !is_transient(res))
            return res;

        if (attempt == attempts) {
            Logger::error("Failed: " + url + " - Max retries (" + res.error + ")");
            break;
        }
        Logger::warn("Request failed (" + res.error + "), backing off: " + url);
        if (!wait_for_retry(get_backoff_time(attempt, policy.backoff_base), transport)) {
            res.success    = false;
            res.error      = "cancelled";
            res.error_type = ErrorType::Cancelled;
            break;
        }
    }
    return res;
}

}  // namespace Http
}  // namespace Network
}  // namespace Fetchium
