#include "SimClock.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>
#include <stdexcept>
#include <algorithm>

namespace prediction {

    SimClock::SimClock() {}

    void SimClock::initialize(const std::string& startDate) {
        startEpochMs_ = parseDate(startDate);
        simTimeMs_ = 0;
        day_ = 0;
        stamps_ = 0;
    }

    void SimClock::beginDay(Day day) {
        if (day < day_) {
            throw std::logic_error("SimClock cannot move back from day " +
                std::to_string(day_) + " to day " + std::to_string(day));
        }
        day_ = day;
        // A very busy day may spill past its nominal end; keep stamps monotonic
        simTimeMs_ = std::max(simTimeMs_, static_cast<Timestamp>(std::max(day - 1, 0)) * MS_PER_DAY);
    }

    Timestamp SimClock::stamp() {
        Timestamp t = simTimeMs_;
        simTimeMs_++;
        stamps_++;
        return t;
    }

    Timestamp SimClock::parseDate(const std::string& dateStr) {
        std::tm tm = {};
        std::istringstream ss(dateStr);
        ss >> std::get_time(&tm, "%Y-%m-%d");
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse date: " + dateStr);
        }
        tm.tm_hour = 0;
        tm.tm_min = 0;
        tm.tm_sec = 0;

        // Use UTC
#ifdef _WIN32
        time_t t = _mkgmtime(&tm);
#else
        time_t t = timegm(&tm);
#endif

        return static_cast<Timestamp>(t) * 1000;
    }

    std::string SimClock::formatDate(Timestamp ms) {
        time_t t = static_cast<time_t>(ms / 1000);
        std::tm tm;
#ifdef _WIN32
        gmtime_s(&tm, &t);
#else
        gmtime_r(&t, &tm);
#endif

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%d");
        return ss.str();
    }

    std::string SimClock::formatDateTime(Timestamp ms) {
        time_t t = static_cast<time_t>(ms / 1000);
        std::tm tm;
#ifdef _WIN32
        gmtime_s(&tm, &t);
#else
        gmtime_r(&t, &tm);
#endif

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

} // namespace prediction
