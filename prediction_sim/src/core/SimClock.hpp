#pragma once

#include <cstdint>
#include <string>
#include "Types.hpp"

namespace prediction {

    // Logical clock. Timestamps are simulated milliseconds since game start:
    // day d (1-based) begins at (d - 1) * MS_PER_DAY and every stamped event
    // advances by one ms.
    // The host wall clock is never consulted.
    class SimClock {
    public:
        static constexpr Timestamp MS_PER_DAY = 86400000;

        SimClock();

        // Anchor for rendering dates ("YYYY-MM-DD"); does not affect timestamps
        void initialize(const std::string& startDate);

        // Move to the start of `day` (never backwards)
        void beginDay(Day day);

        // Current timestamp, then advance by one ms
        Timestamp stamp();

        Timestamp getSimTime() const { return simTimeMs_; }
        Day getDay() const { return day_; }
        uint64_t getStampCount() const { return stamps_; }
        Timestamp getStartEpoch() const { return startEpochMs_; }

        // Parse ISO date string "YYYY-MM-DD" to epoch ms
        static Timestamp parseDate(const std::string& dateStr);

        // Format epoch ms as ISO date string
        static std::string formatDate(Timestamp ms);

        // Format epoch ms as full ISO datetime
        static std::string formatDateTime(Timestamp ms);

        // Calendar date of the current simulated day
        std::string currentDateString() const { return formatDate(startEpochMs_ + simTimeMs_); }

        // Calendar date of an arbitrary logical timestamp
        std::string dateOf(Timestamp simTime) const { return formatDate(startEpochMs_ + simTime); }

    private:
        Timestamp startEpochMs_ = 0;
        Timestamp simTimeMs_ = 0;
        Day day_ = 0;
        uint64_t stamps_ = 0;
    };

} // namespace prediction
