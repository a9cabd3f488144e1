#include <atomic>   // thread safe counter for filenames
#include <cstdio>   // FILE*, for open, write and flush work
#include <ctime>    // for conversion of time format
#include <string>
#include <chrono>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <string_view>

#include "mrac/io/kpi.hpp"
#include "mrac/version.hpp"
#include "mrac/core/time.hpp"
#include "mrac/core/fault.hpp"
#include "mrac/core/status.hpp"
#include "mrac/tools/recorder.hpp"

#include "kpi_calc.hpp"         // KPI accum
#include "env_buildinfo.hpp"    // BuildInfoPack

#if defined(_WIN32)
    #include <io.h>     // _commit
#else
    #include <fcntl.h>
    #include <unistd.h>     // fsync
    #include <sys/stat.h>
    #include <sys/types.h>
#endif

#ifndef GIT_SHA
#define GIT_SHA "unknown"
#endif

/*
JSONL backend for Recorder
one JSON object per line, tagged with a channel:
  /mrac/buildinfo, /mrac/time_anchor, /mrac/tick, /mrac/fault, /mrac/kpi_report
Rotates files by size and fsyncs periodically
*/

namespace fs = std::filesystem;
namespace mrac::tools{
    #if MRAC_RECORDER_BACKEND_MCAP
        std::unique_ptr<Recorder> make_mcap_recorder(const RecorderOptions& opt);
    #endif

    // // YYYYMMDD_HHMMSS in UTC -> time stamped segment names
    static inline std::string utc_timestamp_filename(){
        using namespace std::chrono;
        auto now = system_clock::now();
        std::time_t t = system_clock::to_time_t(now);
        std::tm tm{};
        #if defined(_WIN32)
            gmtime_s(&tm, &t);
        #else
            gmtime_r(&t, &tm);
        #endif
        char buf[32];

        std::snprintf(
            buf, sizeof(buf), "%04d%02d%02d_%02d%02d%02d",
            tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
            tm.tm_hour, tm.tm_min, tm.tm_sec
        );

        return std::string(buf);
    }

    static inline std::string jesc(std::string_view s){
        std::string o;
        o.reserve(s.size() + 8);
        for (char c : s){
            switch (c){
                case '"':  o += "\\\""; break;
                case '\\': o += "\\\\"; break;
                case '\n': o += "\\n";  break;
                case '\r': o += "\\r";  break;
                case '\t': o += "\\t";  break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20){
                        char u[8];
                        std::snprintf(u, sizeof(u), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                        o += u;
                    }
                    else o.push_back(c);
            }
        }
        return o;
    }

    // // JSONL backend
    class RecorderJsonl final : public Recorder{
        public:
            explicit RecorderJsonl(const RecorderOptions& opt) : cfg_{}{

                // // NULL GUARD C string
                cfg_.out_dir = opt.out_dir ? opt.out_dir : "evidence";
                cfg_.segment_max_mb = opt.segment_max_mb;
                cfg_.fsync_policy = (opt.fsync_policy == RecorderOptions::EverySegment) ? FsyncPolicy::EverySegment : FsyncPolicy::EveryNMB;
                cfg_.fsync_n_mb = opt.fsync_n_mb;
                cfg_.tick_decimation = opt.tick_decimation;

                // identity
                cfg_.run_id = opt.run_id ? opt.run_id : "";
                cfg_.plant_id = opt.plant_id ? opt.plant_id : "";
                cfg_.integrator = opt.integrator ? opt.integrator : "";

                dt_ns_hint_ = opt.dt_ns_hint;
                std::error_code ec;
                fs::create_directories(cfg_.out_dir, ec);
                if (ec) std::fprintf(stderr, "mrac_recorder: create_directories(%s): %s\n", cfg_.out_dir.c_str(), ec.message().c_str());
            }

            // // Flushes and fsyncs then closes the file
            ~RecorderJsonl() override{
                close_current_();
            }

            void write_buildinfo() override{
                ensure_open_();
                auto bi = detail::make_buildinfo(
                    static_cast<std::uint64_t>(dt_ns_hint_ > 0 ? dt_ns_hint_ : 0),
                    cfg_.run_id.c_str(),
                    cfg_.plant_id.c_str(),
                    cfg_.integrator.c_str(),
                    static_cast<std::uint32_t>(cfg_.tick_decimation)
                );

                std::string line;
                line.reserve(512);

                line += R"({"ch":"/mrac/buildinfo","body":{)";
                line += R"("mrac_version":")"   + jesc(bi.mrac_version)       + R"(",)";
                line += R"("git_sha":")"        + jesc(bi.git_sha)            + R"(",)";
                line += R"("compiler":")"       + jesc(bi.compiler)           + R"(",)";
                line += R"("flags":")"          + jesc(bi.flags)              + R"(",)";
                line += R"("scalar_type":")"    + jesc(bi.scalar_type)        + R"(",)";
                line += R"("dt_ns":)"           + std::to_string(bi.dt_ns)    + ",";
                line += R"("run_id":")"         + jesc(bi.run_id)             + R"(",)";
                line += R"("plant_id":")"       + jesc(bi.plant_id)           + R"(",)";
                line += R"("integrator":")"     + jesc(bi.integrator)         + R"(",)";
                line += R"("tick_decimation":)" + std::to_string(static_cast<unsigned>(bi.tick_decimation));
                line += R"(}})";

                write_line_(line);
            }

            void write_time_anchor(std::int64_t epoch_mono_ns, std::int64_t epoch_utc_ns) override{
                ensure_open_();
                std::string line;
                line.reserve(192);
                line += R"({"ch":"/mrac/time_anchor","body":{"clock_domain":"MONO","epoch_mono_ns":)";
                line += std::to_string(static_cast<long long>(epoch_mono_ns));
                line += R"(,"epoch_utc_ns":)";
                line += std::to_string(static_cast<long long>(epoch_utc_ns));
                line += R"(}})";
                write_line_(line);
            }

            void write_tick(const TickRecord& r) override{
                ensure_open_();

                // infer loop period once from the first positive delta
                if (dt_ns_hint_ == 0 && prev_t_ >= 0){
                    const long long d = static_cast<long long>(r.time_ns - prev_t_);
                    if (d > 0) dt_ns_hint_ = d;
                }
                prev_t_ = r.time_ns;

                // // KPIs see every tick, decimation only thins the file
                acc_.on_tick(static_cast<double>(r.t), static_cast<double>(dt_ns_hint_) * 1e-9,
                             static_cast<double>(r.yr), static_cast<double>(r.y),
                             static_cast<double>(r.u), r.degenerate);
                if (decim_skip_()) return;

                std::string line;
                line.reserve(256);
                line += R"({"ch":"/mrac/tick","body":{"seq":)";
                line += std::to_string(static_cast<unsigned long long>(++seq_));
                line += R"(,"tick":)";       line += std::to_string(static_cast<unsigned long long>(r.tick));
                line += R"(,"t_ns":)";       line += std::to_string(static_cast<long long>(r.time_ns));
                line += R"(,"y":)";          line += to_num_(r.y);
                line += R"(,"yr":)";         line += to_num_(r.yr);
                line += R"(,"u":)";          line += to_num_(r.u);
                line += R"(,"a_hat":)";      line += to_num_(r.a_hat);
                line += R"(,"b_hat":)";      line += to_num_(r.b_hat);
                line += R"(,"degenerate":)"; line += (r.degenerate ? "true" : "false");
                line += R"(}})";
                write_line_(line);
            }

            void write_fault(const Fault& f) override{
                if (!f.active()) return;
                ensure_open_();

                std::string line;
                line.reserve(192);
                line += R"({"ch":"/mrac/fault","body":{)";
                line += R"("status":")"  + std::string(to_string(f.status)) + R"(",)";
                line += R"("source":")"  + std::string(to_string(f.source)) + R"(",)";
                line += R"("tick":)"     + std::to_string(static_cast<unsigned long long>(f.tick)) + ",";
                line += R"("t_ns":)"     + std::to_string(static_cast<long long>(f.t)) + ",";
                line += R"("index":)"    + std::to_string(static_cast<unsigned long long>(f.index)) + ",";
                line += R"("value":)"    + to_num_(f.value);
                line += R"(}})";
                write_line_(line);
            }

            void write_kpi(const KpiCounters& k) override{
                ensure_open_();

                std::string line;
                line.reserve(320);
                line += R"({"ch":"/mrac/kpi_report","body":{)";
                line += R"("updates":)"          + std::to_string(static_cast<unsigned long long>(k.updates)) + ",";
                line += R"("degenerate_ticks":)" + std::to_string(static_cast<unsigned long long>(k.degenerate_ticks)) + ",";
                line += R"("divergences":)"      + std::to_string(static_cast<unsigned long long>(k.divergences)) + ",";
                line += R"("cancellations":)"    + std::to_string(static_cast<unsigned long long>(k.cancellations)) + ",";
                line += R"("iae":)"              + to_num_(acc_.iae) + ",";
                line += R"("itae":)"             + to_num_(acc_.itae) + ",";
                line += R"("tvu":)"              + to_num_(acc_.tvu) + ",";
                line += R"("max_abs_error":)"    + to_num_(acc_.max_abs_e) + ",";
                line += R"("recorded_ticks":)"   + std::to_string(static_cast<unsigned long long>(acc_.ticks)) + ",";
                line += R"("recorded_degenerate":)" + std::to_string(static_cast<unsigned long long>(acc_.degenerate_ticks));
                line += R"(}})";
                write_line_(line);
            }

            /*
            Rotate when file grows beyond limit
            otherwise rolling fsync every N MiB to bound loss on crash
            */
            void rotate_if_needed() override{
                if (!fp_) return;
                const std::size_t max_bytes = cfg_.segment_max_mb * 1024ull * 1024ull;
                if (written_bytes_ >= max_bytes){
                    rotate_segment_();
                } else if (cfg_.fsync_policy == FsyncPolicy::EveryNMB){
                    const std::size_t nbyte = cfg_.fsync_n_mb * 1024ull * 1024ull;
                    if ((written_bytes_ - last_fsync_mark_) >= nbyte){
                        sync_();
                        last_fsync_mark_ = written_bytes_;
                    }
                }
            }

            void flush() override{
                if (!fp_) return;
                sync_();
            }

        private:
            enum class FsyncPolicy{EverySegment, EveryNMB};

            struct RecorderConfig{
                std::string out_dir;
                std::size_t segment_max_mb{256};
                FsyncPolicy fsync_policy{FsyncPolicy::EveryNMB};
                std::size_t fsync_n_mb{16};
                int tick_decimation{1};
                std::string run_id;
                std::string plant_id;
                std::string integrator;
            };

            void sync_(){
                ::fflush(fp_);
                #if defined(_WIN32)
                    _commit(_fileno(fp_));
                #else
                    ::fsync(fileno(fp_));
                #endif
            }

            // append one line; short writes are reported once per segment
            void write_line_(const std::string &line){
                if (!fp_) return;
                const std::string out = line + "\n";
                const std::size_t n = std::fwrite(out.data(), 1, out.size(), fp_);
                written_bytes_ += n;
                if (n != out.size() && !short_write_reported_){
                    std::fprintf(stderr, "mrac_recorder: short write on '%s'\n", current_path_.c_str());
                    short_write_reported_ = true;
                }
            }

            // unique name: GIT_SHA + UTC time + process wide counter
            static std::string make_filename_(const std::string& dir){
                static std::atomic<std::uint64_t> seq{0};
                const std::string ts = utc_timestamp_filename();
                const std::uint64_t s = seq.fetch_add(1, std::memory_order_relaxed);
                return (fs::path(dir) / ("mrac_" + std::string(GIT_SHA) + "_" + ts + "_" + std::to_string(s) + ".jsonl")).string();
            }

            void ensure_open_(){
                if (fp_) return;
                open_new_file_();
            }

            // Open new seg then write a meta line first
            void open_new_file_(){
                current_path_ = make_filename_(cfg_.out_dir);
                fp_ = std::fopen(current_path_.c_str(), "wb");
                written_bytes_ = 0;
                last_fsync_mark_ = 0;
                short_write_reported_ = false;

                if (!fp_){
                    std::fprintf(stderr, "mrac_recorder: failed to open '%s'\n", current_path_.c_str());
                    return;
                }

                std::string meta;
                meta.reserve(256);
                meta += R"({"meta":{"schema_backend":"jsonl","dt_ns":)";
                meta += std::to_string(static_cast<long long>(dt_ns_hint_));
                meta += R"(,"mrac_version":")" + std::string(mrac::kVersionStr) + R"(",)";
                meta += R"("git_sha":")" + std::string(GIT_SHA) + R"(","segment":)";
                meta += std::to_string(static_cast<unsigned long long>(segment_++));
                meta += R"(}})";
                write_line_(meta);

                seq_ = 0; // reset per seg
            }

            void close_current_(){
                if (!fp_) return;
                sync_();
                std::fclose(fp_);
                fp_ = nullptr;
            }

            void rotate_segment_(){
                close_current_();
                open_new_file_();
            }

            // JSON has no NaN/inf -> null
            static inline std::string to_num_(double v){
                if (!std::isfinite(v)) return "null";
                char buf[64];
                std::snprintf(buf, sizeof(buf), "%.17g", v);
                return std::string(buf);
            }

            // write only every Nth tick
            bool decim_skip_(){
                if (cfg_.tick_decimation <= 1) return false;
                return (tick_index_++ % static_cast<std::uint64_t>(cfg_.tick_decimation)) != 0;
            }

        private:
            RecorderConfig cfg_;
            std::FILE* fp_{nullptr};
            std::string current_path_{};

            std::size_t written_bytes_{0};
            std::size_t last_fsync_mark_{0};
            bool short_write_reported_{false};

            long long dt_ns_hint_{0};
            long long prev_t_{-1};

            std::uint64_t seq_{0};
            std::uint64_t segment_{0};
            std::uint64_t tick_index_{0};

            detail::KpiAcc acc_{};
    };

    // // Factory
    std::unique_ptr<Recorder> Recorder::open(const RecorderOptions& opt){
        #if MRAC_RECORDER_BACKEND_MCAP
            return make_mcap_recorder(opt);
        #else
            return std::unique_ptr<Recorder>(new RecorderJsonl(opt));
        #endif
    }

} // namespace mrac::tools
