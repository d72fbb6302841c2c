// utils/influx.hpp
#pragma once

#include "bay/bay_status.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace utils {

/**
 * InfluxDB Client for time-series logging of bay state
 *
 * Logs the same per-bay state as the CSV output, for live dashboards.
 * Only enabled when the --influx flag is set.
 *
 * Write interval: 1s by default (rate-limited on loop time)
 *
 * Organization: bayassist
 * Bucket: bays
 *
 * Measurement schema:
 *   - bay_state:   tag bay;       fields range, adjusted, fraction, lifecycle,
 *                                 activity, occupancy, motion
 *   - bay_lateral: tags bay,zone; fields status, deviation, direction, severity
 */
class InfluxClient {
public:
    struct Config {
        std::string url = "http://localhost:8086";  // InfluxDB server URL
        std::string token = "";                      // Authentication token (optional for local)
        std::string org = "bayassist";               // Organization name
        std::string bucket = "bays";                 // Bucket name
        double write_interval_s = 1.0;
        bool enabled = false;                        // Only enabled with --influx flag
    };

    /**
     * Initialize InfluxDB client
     *
     * @param config InfluxDB configuration
     * @throws std::runtime_error if libcurl cannot be initialized
     */
    explicit InfluxClient(const Config& config);

    ~InfluxClient();

    InfluxClient(const InfluxClient&) = delete;
    InfluxClient& operator=(const InfluxClient&) = delete;

    /**
     * Write one point per bay (plus one per evaluated lateral zone)
     *
     * @param statuses Status of every bay this cycle
     * @param loop_time Current loop time (rate limiting only)
     * @return true if data was written, false if skipped or failed
     */
    bool write_bay_statuses(const bay::BayStatusMap& statuses, double loop_time);

    /**
     * Flush any buffered writes immediately
     */
    void flush();

    bool is_enabled() const { return config_.enabled; }

    const Config& get_config() const { return config_; }

    // ========================================================================
    // Line protocol builders
    // ========================================================================

    /**
     * Measurement: bay_state
     * Distances are reported in the bay's unit system.
     */
    static std::string build_bay_state_line(const bay::BayStatus& status, int64_t timestamp_ns);

    /**
     * Measurement: bay_lateral
     * Deviation fields are only present for evaluated zones.
     */
    static std::string build_bay_lateral_line(const std::string& bay_id,
                                              const bay::LateralZoneResult& zone,
                                              int64_t timestamp_ns);

    // Escape spaces, commas and equals signs in tag values
    static std::string escape_tag(const std::string& value);

    /**
     * Current wall clock time in nanoseconds since the Unix epoch
     */
    static int64_t wall_clock_time_ns();

private:
    Config config_;
    double last_write_time_;
    int write_count_ = 0;

    // Implementation details hidden (pimpl pattern)
    struct Impl;
    std::unique_ptr<Impl> impl_;

    /**
     * Send line protocol data to InfluxDB
     *
     * @param line_protocol Concatenated line protocol strings
     * @return true if write succeeded, false otherwise
     */
    bool send_to_influx(const std::string& line_protocol);
};

} // namespace utils
