#pragma once
#include <chrono>
#include <string>
#include "http_client.hpp"

namespace Fetchium {
namespace Network {
namespace Http {

struct RetryPolicy {
    int                       max_attempts = 3;
    std::chrono::milliseconds backoff_base{1000};
};

// Worth another attempt: transport faults, throttling and server-side errors.
bool is_transient(const Response& response);

// GET through transport with bounded exponential backoff on transient failures.
// Returns the last response.
Response get_with_retry(HttpClient&                    client,
                        const std::string&             url,
                        const RetryPolicy&             policy,
                        const Proxy::TransportConfig&  transport);

// Sleeps for delay in short slices, returning false early if the transport gets cancelled.
bool wait_for_retry(std::chrono::milliseconds delay, const Proxy::TransportConfig& transport);

}  // namespace Http
}  // namespace Network
}  // namespace Fetchium
