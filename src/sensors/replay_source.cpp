// src/sensors/replay_source.cpp
#include "sensors/replay_source.hpp"
#include "utils/csv.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <stdexcept>

namespace sensors {

ReadingFault ReplaySource::parse_fault(const std::string& s) {
    const std::string v = utils::CsvReader::to_lower(s);
    if (v == "fault") return ReadingFault::Fault;
    if (v == "out_of_range" || v == "toofar") return ReadingFault::OutOfRange;
    if (v == "not_ranging") return ReadingFault::NotRanging;
    return ReadingFault::Timeout;
}

bool ReplaySource::load(const std::string& csv_path) {
    utils::CsvReader csv;
    if (!csv.open(csv_path)) {
        LOG_ERROR("[Replay] Cannot open %s", csv_path.c_str());
        return false;
    }

    for (const char* required : {"t_s", "sensor_id", "value", "unit"}) {
        if (!csv.has_col(required)) {
            LOG_ERROR("[Replay] %s: missing column '%s'", csv_path.c_str(), required);
            return false;
        }
    }

    rows_.clear();
    next_ = 0;
    skipped_ = 0;

    std::vector<std::string> row;
    while (csv.read_row(row)) {
        ReplayRow r;
        r.sensor_id = csv.get(row, "sensor_id");

        try {
            r.t_s = utils::CsvReader::to_double(csv.get(row, "t_s"));
        } catch (const std::exception&) {
            LOG_WARN("[Replay] %s:%zu: bad timestamp, row skipped", csv_path.c_str(), csv.line_no());
            ++skipped_;
            continue;
        }

        if (r.sensor_id.empty()) {
            LOG_WARN("[Replay] %s:%zu: empty sensor_id, row skipped", csv_path.c_str(), csv.line_no());
            ++skipped_;
            continue;
        }

        const std::string value = csv.get(row, "value");
        if (value.empty()) {
            r.reading = SensorReading::invalid(r.t_s, parse_fault(csv.get(row, "fault")));
        } else {
            double magnitude = 0.0;
            try {
                magnitude = utils::CsvReader::to_double(value);
            } catch (const std::exception&) {
                LOG_WARN("[Replay] %s:%zu: bad value '%s', row skipped",
                         csv_path.c_str(), csv.line_no(), value.c_str());
                ++skipped_;
                continue;
            }

            units::Quantity q = units::cm(0.0);
            try {
                q = units::Quantity(magnitude, csv.get(row, "unit"));
            } catch (const units::UnitError& e) {
                LOG_ERROR("[Replay] %s:%zu: %s", csv_path.c_str(), csv.line_no(), e.what());
                rows_.clear();
                return false;
            }
            if (q.dimension() != units::Dimension::Distance) {
                LOG_WARN("[Replay] %s:%zu: unit '%s' is not a distance, row skipped",
                         csv_path.c_str(), csv.line_no(), units::to_string(q.unit()));
                ++skipped_;
                continue;
            }
            r.reading = SensorReading::valid(q, r.t_s);
        }

        rows_.push_back(std::move(r));
    }

    std::stable_sort(rows_.begin(), rows_.end(),
                     [](const ReplayRow& a, const ReplayRow& b) { return a.t_s < b.t_s; });

    LOG_INFO("[Replay] Loaded %zu rows from %s (%zu skipped, %.2fs)",
             rows_.size(), csv_path.c_str(), skipped_, end_time());
    return true;
}

std::vector<std::pair<std::string, SensorReading>> ReplaySource::poll(double t) {
    std::vector<std::pair<std::string, SensorReading>> out;
    while (next_ < rows_.size() && rows_[next_].t_s <= t) {
        out.emplace_back(rows_[next_].sensor_id, rows_[next_].reading);
        ++next_;
    }
    return out;
}

} // namespace sensors
