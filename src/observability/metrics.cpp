#include "burnlink/observability/metrics.h"

#include <atomic>
#include <cstdint>

namespace burnlink::observability {
namespace {
std::atomic<std::uint64_t> g_total_requests{0};
std::atomic<std::uint64_t> g_requests_2xx{0};
std::atomic<std::uint64_t> g_requests_4xx{0};
std::atomic<std::uint64_t> g_requests_5xx{0};
std::atomic<std::uint64_t> g_latency_ms_total{0};

std::atomic<std::uint64_t> g_links_created{0};
std::atomic<std::uint64_t> g_downloads_granted{0};
std::atomic<std::uint64_t> g_downloads_denied{0};
std::atomic<std::uint64_t> g_links_expired{0};
std::atomic<std::uint64_t> g_links_exhausted{0};
std::atomic<std::uint64_t> g_blob_delete_failures{0};
std::atomic<std::uint64_t> g_sweeps{0};
std::atomic<std::uint64_t> g_swept_links{0};

std::string Counter(const std::string& name, const std::string& help,
                    const std::atomic<std::uint64_t>& value) {
    return "# HELP " + name + " " + help + "\n# TYPE " + name + " counter\n" + name + " " +
           std::to_string(value.load(std::memory_order_relaxed)) + "\n";
}
}  // namespace

void RecordRequest(int status_code, long long latency_ms) {
    g_total_requests.fetch_add(1, std::memory_order_relaxed);
    g_latency_ms_total.fetch_add(static_cast<std::uint64_t>(latency_ms),
                                 std::memory_order_relaxed);
    if (status_code >= 200 && status_code < 300) {
        g_requests_2xx.fetch_add(1, std::memory_order_relaxed);
    } else if (status_code >= 400 && status_code < 500) {
        g_requests_4xx.fetch_add(1, std::memory_order_relaxed);
    } else if (status_code >= 500) {
        g_requests_5xx.fetch_add(1, std::memory_order_relaxed);
    }
}

void RecordLinkCreated() { g_links_created.fetch_add(1, std::memory_order_relaxed); }
void RecordDownloadGranted() { g_downloads_granted.fetch_add(1, std::memory_order_relaxed); }
void RecordDownloadDenied() { g_downloads_denied.fetch_add(1, std::memory_order_relaxed); }
void RecordLinkRemoved(bool expired) {
    (expired ? g_links_expired : g_links_exhausted).fetch_add(1, std::memory_order_relaxed);
}
void RecordBlobDeleteFailure() {
    g_blob_delete_failures.fetch_add(1, std::memory_order_relaxed);
}

void RecordSweep(std::size_t removed) {
    g_sweeps.fetch_add(1, std::memory_order_relaxed);
    g_swept_links.fetch_add(removed, std::memory_order_relaxed);
}

std::string RenderMetrics(std::size_t live_links) {
    return "# HELP burnlink_up 1 if server is up\n"
           "# TYPE burnlink_up gauge\n"
           "burnlink_up 1\n"
           "# HELP burnlink_links_live Links currently held in the registry\n"
           "# TYPE burnlink_links_live gauge\n"
           "burnlink_links_live " + std::to_string(live_links) + "\n" +
           Counter("burnlink_http_requests_total", "Total HTTP requests processed",
                   g_total_requests) +
           Counter("burnlink_http_requests_2xx", "Total 2xx responses", g_requests_2xx) +
           Counter("burnlink_http_requests_4xx", "Total 4xx responses", g_requests_4xx) +
           Counter("burnlink_http_requests_5xx", "Total 5xx responses", g_requests_5xx) +
           Counter("burnlink_http_request_latency_ms_sum", "Sum of request latencies in ms",
                   g_latency_ms_total) +
           Counter("burnlink_links_created_total", "Links published", g_links_created) +
           Counter("burnlink_downloads_granted_total", "Downloads granted",
                   g_downloads_granted) +
           Counter("burnlink_downloads_denied_total", "Download attempts refused",
                   g_downloads_denied) +
           "# HELP burnlink_links_removed_total Links removed from the registry\n"
           "# TYPE burnlink_links_removed_total counter\n"
           "burnlink_links_removed_total{reason=\"expired\"} " +
           std::to_string(g_links_expired.load(std::memory_order_relaxed)) + "\n" +
           "burnlink_links_removed_total{reason=\"exhausted\"} " +
           std::to_string(g_links_exhausted.load(std::memory_order_relaxed)) + "\n" +
           Counter("burnlink_blob_delete_failures_total", "Blob deletions that failed",
                   g_blob_delete_failures) +
           Counter("burnlink_sweeps_total", "Expiry sweeps run", g_sweeps) +
           Counter("burnlink_swept_links_total", "Links removed by the expiry sweeper",
                   g_swept_links);
}

}  // namespace burnlink::observability
