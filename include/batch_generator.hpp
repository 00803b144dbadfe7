#pragma once
#include "ephemeris.hpp"
#include "phase.hpp"
#include "horizon_finder.hpp"
#include "eclipse.hpp"
#include "time_utils.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lc {
    // One calendar day of output. Eclipse fields come from the eclipse-by-date
    // reduction, not from this day's own search.
    struct DayRecord {
        CivilDate date;            // local calendar date
        Instant anchor;            // local anchor time as UTC
        PhaseLabel phase;
        double illumination;
        HorizonResult horizon;
        EclipseEvent eclipse;
        bool supermoon;
    };

    struct DatedEclipse {
        CivilDate date;            // local date of the eclipse instant
        EclipseEvent event;
    };

    using EclipseByDate = std::map<CivilDate, EclipseEvent>;

    // Deeper eclipse wins; equal depth keeps the earlier instant so the result
    // does not depend on the order days were processed in.
    bool preferEclipse(const EclipseEvent& candidate, const EclipseEvent& current);
    void mergeEclipse(EclipseByDate& acc, const DatedEclipse& e);
    EclipseByDate reduceEclipses(const std::vector<DatedEclipse>& found);

    struct BatchOptions {
        std::string timezone = "America/New_York";
        int anchor_hour = 23;
        double illumination_trigger = 85.0;
        double supermoon_km = 360000.0;
        HorizonStrategy strategy = HorizonStrategy::DISCRETE_EVENT;
        int threads = 1;
    };

    HorizonStrategy strategyFromName(const std::string& name);

    class BatchGenerator {
    public:
        struct DayComputation {
            DayRecord record;
            std::optional<DatedEclipse> eclipse;
        };
        using ProgressFn = std::function<void(long done, long total)>;

        BatchGenerator(const Ephemeris& eph, const ObserverLocation& obs, BatchOptions options = BatchOptions());
        BatchGenerator(const BatchGenerator&) = delete;
        BatchGenerator& operator=(const BatchGenerator&) = delete;

        // days consecutive local dates starting at first, chronological
        std::vector<DayRecord> generate(const CivilDate& first, long days, const ProgressFn& progress = nullptr) const;
        std::vector<DayRecord> generateRange(const CivilDate& first, const CivilDate& last, const ProgressFn& progress = nullptr) const;

        // Map step for a single local date; independent of every other day
        DayComputation computeDay(const CivilDate& date) const;

        const BatchOptions& options() const { return options_; }
        const TimeZone& zone() const { return zone_; }

    private:
        const Ephemeris& eph_;
        ObserverLocation observer_;
        BatchOptions options_;
        TimeZone zone_;
        HorizonFinder finder_;
        EclipseDetector detector_;
        NightWindowSampler sampler_;

        std::vector<DayComputation> computeAll(const CivilDate& first, long days, const ProgressFn& progress) const;
    };
}
