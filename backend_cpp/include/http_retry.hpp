#pragma once
#include <chrono>
#include <memory>
#include <thread>
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include "KeyManager.hpp"

namespace campus_rag {

// Re-issues the request on 429/503 with a growing cooldown. The factory is called
// again on every attempt so a rotated key is picked up.
template<typename Func>
cpr::Response perform_request_with_retry(Func request_factory,
                                         const std::shared_ptr<KeyManager>& km,
                                         int max_retries = 4) {
    cpr::Response r;
    for (int i = 0; i < max_retries; ++i) {
        r = request_factory();
        if (r.status_code == 200) return r;
        if (r.status_code == 429 || r.status_code == 503) {
            spdlog::warn("Service returned {} ({}), cooling down (attempt {}/{})",
                         r.status_code, (r.status_code == 429 ? "quota" : "overload"), i + 1, max_retries);
            if (km) km->report_rate_limit();
            if (i + 1 < max_retries) {
                std::this_thread::sleep_for(std::chrono::milliseconds(2000 + (i * 1000)));
            }
            continue;
        }
        break;
    }
    return r;
}

} // namespace campus_rag
