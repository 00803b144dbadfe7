#include "batch_generator.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "thread_pool.hpp"
#include <future>

namespace lc {
    bool preferEclipse(const EclipseEvent& candidate, const EclipseEvent& current) {
        if (candidate.depth != current.depth) return candidate.depth > current.depth;
        if (candidate.time && current.time) return *candidate.time < *current.time;
        return false;
    }

    void mergeEclipse(EclipseByDate& acc, const DatedEclipse& e) {
        auto it = acc.find(e.date);
        if (it == acc.end()) acc.emplace(e.date, e.event);
        else if (preferEclipse(e.event, it->second)) it->second = e.event;
    }

    EclipseByDate reduceEclipses(const std::vector<DatedEclipse>& found) {
        EclipseByDate acc;
        for (const auto& e : found) mergeEclipse(acc, e);
        return acc;
    }

    HorizonStrategy strategyFromName(const std::string& name) {
        if (name == "discrete") return HorizonStrategy::DISCRETE_EVENT;
        if (name == "bisection") return HorizonStrategy::BISECTION;
        throw ConfigError("unknown horizon strategy '" + name + "' (use discrete or bisection)");
    }

    BatchGenerator::BatchGenerator(const Ephemeris& eph, const ObserverLocation& obs, BatchOptions options)
        : eph_(eph),
          observer_(obs),
          options_(std::move(options)),
          zone_(options_.timezone),
          finder_(eph, obs, options_.strategy, Body::MOON),
          detector_(eph),
          sampler_(detector_) {
        if (options_.anchor_hour < 0 || options_.anchor_hour > 23)
            throw ConfigError("anchor hour must be 0-23, got " + std::to_string(options_.anchor_hour));
        if (options_.threads < 1)
            throw ConfigError("thread count must be at least 1");
        if (options_.illumination_trigger < 0.0 || options_.illumination_trigger > 100.0)
            throw ConfigError("illumination trigger must be within [0, 100]");
    }

    BatchGenerator::DayComputation BatchGenerator::computeDay(const CivilDate& date) const {
        Instant anchor = zone_.toUtc(date, options_.anchor_hour);

        double elong = eph_.elongation(anchor);
        PhaseInfo phase = PhaseClassifier::evaluate(elong);

        bool supermoon = false;
        if (phase.label == PhaseLabel::FULL_MOON)
            supermoon = eph_.geocentricDistance(Body::MOON, anchor) <= options_.supermoon_km;

        HorizonResult horizon = finder_.findDay(anchor);

        std::optional<DatedEclipse> eclipse;
        if (phase.illumination > options_.illumination_trigger) {
            EclipseEvent ev = sampler_.search(horizon, utcDayStart(anchor));
            if (ev.found()) eclipse = DatedEclipse{zone_.localDate(*ev.time), ev};
        }

        return {DayRecord{date, anchor, phase.label, phase.illumination, horizon, EclipseEvent(), supermoon}, eclipse};
    }

    std::vector<BatchGenerator::DayComputation> BatchGenerator::computeAll(const CivilDate& first, long days, const ProgressFn& progress) const {
        std::vector<DayComputation> out;
        out.reserve(static_cast<size_t>(days));
        long step = (days >= 10) ? days / 10 : 1;

        auto report = [&](long done) {
            if (progress) progress(done, days);
            if (done % step == 0 || done == days) {
                Logger::info("Batch: " + std::to_string(done) + "/" + std::to_string(days) + " days");
            }
        };

        if (options_.threads == 1) {
            for (long i = 0; i < days; ++i) {
                out.push_back(computeDay(addDays(first, i)));
                report(i + 1);
            }
            return out;
        }

        ThreadPool pool(static_cast<size_t>(options_.threads));
        std::vector<std::future<DayComputation>> pending;
        pending.reserve(static_cast<size_t>(days));
        for (long i = 0; i < days; ++i) {
            CivilDate d = addDays(first, i);
            pending.push_back(pool.enqueue([this, d]() { return computeDay(d); }));
        }
        // Collected in date order so progress output is the same as the sequential run
        for (long i = 0; i < days; ++i) {
            out.push_back(pending[static_cast<size_t>(i)].get());
            report(i + 1);
        }
        return out;
    }

    std::vector<DayRecord> BatchGenerator::generate(const CivilDate& first, long days, const ProgressFn& progress) const {
        if (days < 0) throw ConfigError("day count must not be negative");
        Logger::info("Batch: generating " + std::to_string(days) + " days from " + formatDate(first) +
                     " (" + zone_.name() + ", anchor " + std::to_string(options_.anchor_hour) + ":00)");

        std::vector<DayComputation> computed = computeAll(first, days, progress);

        std::vector<DatedEclipse> found;
        for (const auto& c : computed) {
            if (c.eclipse) found.push_back(*c.eclipse);
        }
        EclipseByDate by_date = reduceEclipses(found);

        std::vector<DayRecord> records;
        records.reserve(computed.size());
        for (auto& c : computed) {
            DayRecord r = c.record;
            auto it = by_date.find(r.date);
            if (it != by_date.end()) r.eclipse = it->second;
            records.push_back(r);
        }

        Logger::info("Batch: done, " + std::to_string(records.size()) + " records, " +
                     std::to_string(by_date.size()) + " eclipse dates");
        return records;
    }

    std::vector<DayRecord> BatchGenerator::generateRange(const CivilDate& first, const CivilDate& last, const ProgressFn& progress) const {
        if (last < first) throw ConfigError("range end " + formatDate(last) + " is before start " + formatDate(first));
        return generate(first, daysBetween(first, last) + 1, progress);
    }
}
