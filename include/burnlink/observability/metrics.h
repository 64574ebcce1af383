#pragma once

#include <cstddef>
#include <string>

namespace burnlink::observability {

/// @brief Render Prometheus-style metrics for a minimal `/metrics` endpoint.
std::string RenderMetrics(std::size_t live_links);
/// @brief Record a completed HTTP request for metrics.
void RecordRequest(int status_code, long long latency_ms);

void RecordLinkCreated();
void RecordDownloadGranted();
void RecordDownloadDenied();
/// @brief Count a registry removal under its reason (expired or exhausted).
void RecordLinkRemoved(bool expired);
void RecordBlobDeleteFailure();
void RecordSweep(std::size_t removed);

}  // namespace burnlink::observability
