#pragma once

#include <memory>
#include <cstdint>

#include "mrac/io/kpi.hpp"
#include "mrac/core/time.hpp"
#include "mrac/core/types.hpp"
#include "mrac/core/fault.hpp"
#include "mrac/core/result.hpp"

#ifndef MRAC_FB_SCHEMA_DIR
#define MRAC_FB_SCHEMA_DIR "tools/evidence_recorder/schemas"
#endif

namespace mrac::tools{

    struct RecorderOptions{
        const char* out_dir{"evidence"};            // output directory for segments
        const char* schema_dir{MRAC_FB_SCHEMA_DIR}; // FlatBuffer binary schema location (mcap backend)
        std::size_t segment_max_mb{256};            // rotation size threshold
        std::size_t fsync_n_mb{16};                 // between fsync calls
        int tick_decimation{1};                     // write every Nth tick; KPIs still see every tick
        enum FsyncPolicy{EverySegment, EveryNMB} fsync_policy{EveryNMB};
        long long dt_ns_hint{0};                    // loop period; inferred from the first two ticks when 0
        const char* run_id{""};                     // eg: cubic_tracking or sweep_017
        const char* plant_id{""};                   // eg: cubic(a=1.5,b=2,d=0.5)
        const char* integrator{""};                 // integrator name used by the run
    };

    // // Reporting subscriber: consumes TickRecords, writes evidence segments
    class Recorder{
        public:
            // // backend chosen at build time: JSONL by default, MCAP with MRAC_RECORDER_BACKEND_MCAP
            [[nodiscard]] static std::unique_ptr<Recorder> open(const RecorderOptions& opt);

            virtual ~Recorder() = default;

            // logs compiler/git/version metadata
            virtual void write_buildinfo() = 0;

            // maps monotonic clock to UTC for audit correlation
            virtual void write_time_anchor(std::int64_t epoch_mono_ns,
                                           std::int64_t epoch_utc_ns) = 0;

            // per tick evidence
            virtual void write_tick(const TickRecord& r) = 0;

            // terminal failure of the run, if any
            virtual void write_fault(const Fault& f) = 0;

            // aggregated counters + accumulated tracking KPIs
            virtual void write_kpi(const KpiCounters& kpi) = 0;

            // roll output files based on size/limits
            virtual void rotate_if_needed() = 0;

            // force fsync
            virtual void flush() = 0;

            // // plugs straight into Hooks::on_tick with user = the recorder
            static void tick_sink(const TickRecord& r, void* user){
                auto* rec = static_cast<Recorder*>(user);
                rec->write_tick(r);
                rec->rotate_if_needed();
            }
    };
} // namespace mrac::tools
