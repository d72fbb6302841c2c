// utils/influx.cpp
#include "influx.hpp"
#include "logging.hpp"
#include <curl/curl.h>
#include <chrono>
#include <sstream>
#include <stdexcept>

namespace utils {

// ============================================================================
// Private Implementation (Pimpl)
// ============================================================================

struct InfluxClient::Impl {
    CURL* curl = nullptr;
    struct curl_slist* headers = nullptr;
    std::string write_url;
    std::string auth_header;

    Impl() {
        curl = curl_easy_init();
        if (!curl) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
    }

    ~Impl() {
        if (headers) {
            curl_slist_free_all(headers);
        }
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

// ============================================================================
// Callback for ignoring HTTP response body
// ============================================================================

static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    // Discard response body (we only care about HTTP status code)
    (void)contents;
    (void)userp;
    return size * nmemb;
}

static std::string quoted(const char* s) {
    return std::string("\"") + s + "\"";
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

InfluxClient::InfluxClient(const Config& config)
    : config_(config)
    , last_write_time_(-1.0e9)  // Force first write
    , impl_(std::make_unique<Impl>())
{
    if (!config_.enabled) {
        LOG_INFO("[InfluxDB] Client created but disabled (use --influx flag to enable)");
        return;
    }

    std::ostringstream url_builder;
    url_builder << config_.url << "/api/v2/write"
                << "?org=" << config_.org
                << "&bucket=" << config_.bucket
                << "&precision=ns";
    impl_->write_url = url_builder.str();

    impl_->headers = curl_slist_append(impl_->headers, "Content-Type: text/plain; charset=utf-8");

    if (!config_.token.empty()) {
        impl_->auth_header = "Authorization: Token " + config_.token;
        impl_->headers = curl_slist_append(impl_->headers, impl_->auth_header.c_str());
        LOG_INFO("[InfluxDB] Authentication enabled (token configured)");
    } else {
        LOG_WARN("[InfluxDB] No authentication token provided - writes may fail!");
    }

    curl_easy_setopt(impl_->curl, CURLOPT_URL, impl_->write_url.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_HTTPHEADER, impl_->headers);
    curl_easy_setopt(impl_->curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(impl_->curl, CURLOPT_TIMEOUT, 5L);

    LOG_INFO("[InfluxDB] Client initialized: url=%s org=%s bucket=%s interval=%.0fms",
             config_.url.c_str(), config_.org.c_str(), config_.bucket.c_str(),
             config_.write_interval_s * 1000.0);
}

InfluxClient::~InfluxClient() {
    if (config_.enabled) {
        flush();
        LOG_INFO("[InfluxDB] Client shutdown (%d writes)", write_count_);
    }
}

// ============================================================================
// Public Interface
// ============================================================================

bool InfluxClient::write_bay_statuses(const bay::BayStatusMap& statuses, double loop_time) {
    if (!config_.enabled) {
        return false;
    }

    // Rate limiting: only write every write_interval_s
    if ((loop_time - last_write_time_) < config_.write_interval_s) {
        return false;
    }
    last_write_time_ = loop_time;

    const int64_t timestamp_ns = wall_clock_time_ns();

    std::ostringstream line_protocol;
    for (const auto& [bay_id, status] : statuses) {
        line_protocol << build_bay_state_line(status, timestamp_ns) << "\n";
        if (status.snapshot) {
            for (const auto& zone : status.snapshot->lateral) {
                line_protocol << build_bay_lateral_line(bay_id, zone, timestamp_ns) << "\n";
            }
        }
    }

    const std::string body = line_protocol.str();
    if (body.empty()) {
        return false;
    }
    return send_to_influx(body);
}

void InfluxClient::flush() {
    // Writes are not buffered
}

// ============================================================================
// Line Protocol Builders
// ============================================================================

std::string InfluxClient::escape_tag(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == ' ' || c == ',' || c == '=') {
            out += '\\';
        }
        out += c;
    }
    return out;
}

std::string InfluxClient::build_bay_state_line(const bay::BayStatus& status, int64_t timestamp_ns) {
    std::ostringstream line;

    line << "bay_state,bay=" << escape_tag(status.bay_id);

    line << " ";
    if (status.snapshot) {
        const auto& range = status.snapshot->range;
        if (range.raw) {
            line << "range=" << range.raw->value() << ",";
        }
        if (range.adjusted) {
            line << "adjusted=" << range.adjusted->value() << ",";
        }
        if (range.fraction) {
            line << "fraction=" << *range.fraction << ",";
        }
        line << "range_status=" << quoted(bay::to_string(range.status)) << ",";
    }
    line << "lifecycle=" << quoted(bay::to_string(status.lifecycle)) << ","
         << "activity=" << quoted(bay::to_string(status.activity)) << ","
         << "occupancy=" << quoted(bay::to_string(status.occupancy)) << ","
         << "motion=" << quoted(bay::to_string(status.motion));

    line << " " << timestamp_ns;
    return line.str();
}

std::string InfluxClient::build_bay_lateral_line(const std::string& bay_id,
                                                 const bay::LateralZoneResult& zone,
                                                 int64_t timestamp_ns) {
    std::ostringstream line;

    line << "bay_lateral,bay=" << escape_tag(bay_id) << ",zone=" << escape_tag(zone.zone_id);

    line << " status=" << quoted(bay::to_string(zone.status));
    if (zone.deviation) {
        line << ",deviation=" << zone.deviation->magnitude.value()
             << ",direction=" << quoted(bay::to_string(zone.deviation->direction))
             << ",severity=" << quoted(bay::to_string(zone.deviation->severity));
    }

    line << " " << timestamp_ns;
    return line.str();
}

// ============================================================================
// HTTP Communication
// ============================================================================

bool InfluxClient::send_to_influx(const std::string& line_protocol) {
    curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDS, line_protocol.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(line_protocol.size()));

    CURLcode res = curl_easy_perform(impl_->curl);

    if (res != CURLE_OK) {
        LOG_ERROR("[InfluxDB] Write failed: CURL error: %s", curl_easy_strerror(res));
        return false;
    }

    long http_code = 0;
    curl_easy_getinfo(impl_->curl, CURLINFO_RESPONSE_CODE, &http_code);

    if (http_code != 204) {  // InfluxDB returns 204 No Content on success
        LOG_ERROR("[InfluxDB] Write failed: HTTP %ld (expected 204)", http_code);
        return false;
    }

    write_count_++;
    if (write_count_ == 1) {
        LOG_INFO("[InfluxDB] First write successful");
    } else if (write_count_ % 60 == 0) {
        LOG_INFO("[InfluxDB] Successfully wrote %d batches", write_count_);
    }

    return true;
}

// ============================================================================
// Time Conversion
// ============================================================================

int64_t InfluxClient::wall_clock_time_ns() {
    auto now = std::chrono::system_clock::now();
    auto nanoseconds = std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch());
    return nanoseconds.count();
}

} // namespace utils
