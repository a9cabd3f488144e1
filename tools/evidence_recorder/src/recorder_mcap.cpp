#include <atomic>
#include <vector>
#include <chrono>
#include <cstdio>
#include <string>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <string_view>

#include "kpi_calc.hpp"         // KPI accum
#include "env_buildinfo.hpp"    // BuildInfo from flags

#include "mrac/io/kpi.hpp"
#include "mrac/version.hpp"
#include "mrac/core/fault.hpp"
#include "mrac/core/status.hpp"
#include "mrac/tools/recorder.hpp"

// // value check gate -> compile mcap + flatbuffers
#if MRAC_RECORDER_BACKEND_MCAP
    // // this TU carries the header-only writer; no compressors linked
    #define MCAP_IMPLEMENTATION
    #define MCAP_COMPRESSION_NO_LZ4
    #define MCAP_COMPRESSION_NO_ZSTD

    #if defined(__GNUC__)
        #  pragma GCC diagnostic push
        #  pragma GCC diagnostic ignored "-Wshadow"
    #endif

    #include <mcap/writer.hpp>

    #if defined(__GNUC__)
        #  pragma GCC diagnostic pop
    #endif

    #include <flatbuffers/flatbuffers.h>

    #include "hash.hpp"

    // generated by flatc from schemas/mrac_metrics.fbs
    #include "mrac_metrics_generated.h"
#endif

#ifndef GIT_SHA
#define GIT_SHA "unknown"
#endif

namespace fs = std::filesystem;

namespace mrac::tools{
    #if MRAC_RECORDER_BACKEND_MCAP
        using namespace std::chrono;

        static constexpr const char* kBfbsName = "mrac_metrics.bfbs";

        static inline std::string utc_ns_string(){
            auto now = system_clock::now();
            auto ns = duration_cast<nanoseconds>(now.time_since_epoch()).count();
            return std::to_string(static_cast<long long>(ns));
        }

        // // which kernel clock the monotonic anchor came from
        static inline std::string kernel_clocksource(){
            #if defined(__linux__)
                const char* p = "/sys/devices/system/clocksource/clocksource0/current_clocksource";
                if (std::FILE* f = std::fopen(p, "rb")){
                    char buf[128];
                    std::size_t n = std::fread(buf, 1, sizeof(buf) - 1, f);
                    const bool err = std::ferror(f);
                    std::fclose(f);
                    if (err) return "unknown";
                    buf[n] = 0;
                    for (std::size_t i=0; i<n; ++i){
                        if (buf[i] == '\n' || buf[i] == '\r'){
                            buf[i] = 0;
                            break;
                        }
                    }
                    return *buf ? std::string(buf) : std::string("unknown");
                }
                return "unknown";
            #elif defined(_WIN32)
                return "QPC";
            #elif defined(__APPLE__)
                return "mach_absolute_time";
            #else
                return "unknown";
            #endif
        }

        static inline std::vector<std::uint8_t> read_file_bin(const std::string& p){
            std::FILE* f = std::fopen(p.c_str(), "rb");
            if (!f) return {};
            std::vector<std::uint8_t> b;
            b.reserve(4096);
            std::uint8_t buf[4096];
            std::size_t n;
            while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) b.insert(b.end(), buf, buf + n);
            std::fclose(f);
            return b;
        }

        class RecorderMcap final : public Recorder{
            public:
                explicit RecorderMcap(const RecorderOptions& opt) : cfg_{}, builder_(1024){
                    cfg_.out_dir = opt.out_dir ? opt.out_dir : "evidence";
                    cfg_.schema_dir = opt.schema_dir ? opt.schema_dir : MRAC_FB_SCHEMA_DIR;
                    cfg_.segment_max_mb = opt.segment_max_mb;
                    cfg_.fsync_n_mb = opt.fsync_n_mb;
                    cfg_.tick_decimation = opt.tick_decimation;
                    cfg_.dt_ns_hint = opt.dt_ns_hint;
                    cfg_.fsync_every_segment = (opt.fsync_policy == RecorderOptions::EverySegment);
                    cfg_.run_id = opt.run_id ? opt.run_id : "";
                    cfg_.plant_id = opt.plant_id ? opt.plant_id : "";
                    cfg_.integrator = opt.integrator ? opt.integrator : "";

                    std::error_code ec;
                    fs::create_directories(cfg_.out_dir, ec);

                    bfbs_ = read_file_bin((fs::path(cfg_.schema_dir) / kBfbsName).string());
                    if (bfbs_.empty()){
                        std::fprintf(stderr, "mrac_mcap: schema '%s' not found under '%s'\n", kBfbsName, cfg_.schema_dir.c_str());
                    }

                    open_new_file_();
                }

                ~RecorderMcap() override{
                    close_current_();
                }

                void write_buildinfo() override{
                    if (!open_) return;
                    auto bi = detail::make_buildinfo(
                        static_cast<std::uint64_t>(cfg_.dt_ns_hint > 0 ? cfg_.dt_ns_hint : 0),
                        cfg_.run_id.c_str(),
                        cfg_.plant_id.c_str(),
                        cfg_.integrator.c_str(),
                        static_cast<std::uint32_t>(cfg_.tick_decimation)
                    );

                    builder_.Reset();
                    auto fb = mrac::metrics::CreateBuildInfo(
                        builder_,
                        builder_.CreateString(bi.mrac_version),
                        builder_.CreateString(bi.git_sha),
                        builder_.CreateString(bi.compiler),
                        builder_.CreateString(bi.flags),
                        builder_.CreateString(bi.scalar_type),
                        static_cast<std::uint64_t>(bi.dt_ns),
                        builder_.CreateString(bi.run_id),
                        builder_.CreateString(bi.plant_id),
                        builder_.CreateString(bi.integrator),
                        static_cast<std::uint32_t>(bi.tick_decimation)
                    );
                    builder_.Finish(fb);

                    publish_(ch_build_, static_cast<std::uint64_t>(mono_anchor_ns_ > 0 ? mono_anchor_ns_ : 0));
                }

                // // Bind monotonic to UTC and stamp provenance as file metadata
                void write_time_anchor(std::int64_t epoch_mono_ns, std::int64_t epoch_utc_ns) override{
                    if (!open_) return;
                    mono_anchor_ns_ = epoch_mono_ns;

                    mcap::KeyValueMap meta;
                    meta["schema_backend"] = "flatbuffers";
                    meta["clock_domain"]   = "MONO";
                    meta["monotonic_to_utc_ns"] =
                        std::string("{\"epoch_mono_ns\":") + std::to_string(epoch_mono_ns) +
                        ",\"epoch_utc_ns\":" + std::to_string(epoch_utc_ns) + "}";
                    meta["kernel_clocksource"] = kernel_clocksource();
                    meta["dt_ns"]        = std::to_string(cfg_.dt_ns_hint > 0 ? cfg_.dt_ns_hint : 0);
                    meta["mrac_version"] = mrac::kVersionStr;
                    meta["git_sha"]      = GIT_SHA;

                    if (!bfbs_.empty()){
                        const auto d = hash::blake3_256(bfbs_.data(), bfbs_.size());
                        meta["schema_registry_snapshot"] =
                            std::string("[{\"name\":\"") + kBfbsName + "\",\"version\":\"1\",\"blake3\":\"" +
                            hash::to_hex({d.data(), d.size()}) + "\"}]";
                    }

                    mcap::Metadata md;
                    md.name = "mrac";
                    md.metadata = std::move(meta);
                    report_(writer_.write(md), "metadata");
                }

                void write_tick(const TickRecord& r) override{
                    if (!open_) return;

                    if (cfg_.dt_ns_hint == 0 && last_tick_t_ >= 0 && r.time_ns > last_tick_t_){
                        cfg_.dt_ns_hint = r.time_ns - last_tick_t_;
                    }
                    last_tick_t_ = r.time_ns;

                    // // KPIs see every tick, decimation only thins the file
                    acc_.on_tick(static_cast<double>(r.t), static_cast<double>(cfg_.dt_ns_hint) * 1e-9,
                                 static_cast<double>(r.yr), static_cast<double>(r.y),
                                 static_cast<double>(r.u), r.degenerate);
                    if (cfg_.tick_decimation > 1 && (tick_index_++ % static_cast<std::uint64_t>(cfg_.tick_decimation)) != 0) return;

                    builder_.Reset();
                    auto tk = mrac::metrics::CreateTick(
                        builder_,
                        static_cast<std::uint64_t>(++tick_seq_),
                        static_cast<std::uint64_t>(r.tick),
                        static_cast<std::int64_t>(r.time_ns),
                        static_cast<double>(r.y),
                        static_cast<double>(r.yr),
                        static_cast<double>(r.u),
                        static_cast<double>(r.a_hat),
                        static_cast<double>(r.b_hat),
                        r.degenerate
                    );
                    builder_.Finish(tk);

                    publish_(ch_tick_, log_time_(r.time_ns));
                }

                void write_fault(const Fault& f) override{
                    if (!open_ || !f.active()) return;

                    builder_.Reset();
                    auto ft = mrac::metrics::CreateFault(
                        builder_,
                        builder_.CreateString(to_string(f.status)),
                        static_cast<mrac::metrics::FaultSource>(static_cast<std::uint8_t>(f.source)),
                        static_cast<std::uint64_t>(f.tick),
                        static_cast<std::int64_t>(f.t),
                        static_cast<std::uint64_t>(f.index),
                        static_cast<double>(f.value)
                    );
                    builder_.Finish(ft);

                    publish_(ch_fault_, log_time_(f.t));
                }

                void write_kpi(const KpiCounters& k) override{
                    if (!open_) return;

                    builder_.Reset();
                    auto kp = mrac::metrics::CreateKpi(
                        builder_,
                        static_cast<std::uint64_t>(k.updates),
                        static_cast<std::uint64_t>(k.degenerate_ticks),
                        static_cast<std::uint64_t>(k.divergences),
                        static_cast<std::uint64_t>(k.cancellations),
                        acc_.iae, acc_.itae, acc_.tvu, acc_.max_abs_e,
                        static_cast<std::uint64_t>(acc_.ticks)
                    );
                    builder_.Finish(kp);

                    publish_(ch_kpi_, prev_t_ >= 0 ? static_cast<std::uint64_t>(prev_t_) : 0ull);
                }

                void rotate_if_needed() override{
                    if (!open_) return;
                    const std::size_t max_bytes = cfg_.segment_max_mb * 1024ull * 1024ull;

                    std::error_code ec;
                    const auto sz = fs::file_size(mcap_path_, ec);

                    if (!ec && sz >= max_bytes){
                        rotate_segment_();
                        return;
                    }

                    if (!cfg_.fsync_every_segment){
                        const std::size_t nbytes = cfg_.fsync_n_mb * 1024ull * 1024ull;
                        if (!ec && (sz - last_fsync_mark_) >= nbytes){
                            flush();
                            last_fsync_mark_ = sz;
                        }
                    }
                }

                void flush() override{
                    // // the writer owns its FILE*; data reaches disk on close()
                }

            private:
                struct RecorderConfig{
                    std::string out_dir;
                    std::string schema_dir;
                    std::size_t segment_max_mb{256};
                    std::size_t fsync_n_mb{16};
                    bool fsync_every_segment{false};
                    int tick_decimation{1};
                    long long dt_ns_hint{0};
                    std::string run_id;
                    std::string plant_id;
                    std::string integrator;
                };

                static void report_(const mcap::Status& st, const char* what){
                    if (!st.ok()) std::fprintf(stderr, "mrac_mcap: %s write failed: %s\n", what, st.message.c_str());
                }

                // // MCAP wants non-decreasing log times; bump collisions by 1 ns
                std::uint64_t log_time_(std::int64_t t){
                    if (prev_t_ >= 0 && t <= prev_t_) prev_t_ += 1;
                    else prev_t_ = t;
                    return static_cast<std::uint64_t>(prev_t_);
                }

                // // wraps the finished builder buffer in an mcap message
                void publish_(mcap::ChannelId ch, std::uint64_t t){
                    mcap::Message msg;
                    msg.channelId = ch;
                    msg.sequence = static_cast<std::uint32_t>(seq_++);
                    msg.logTime = t;
                    msg.publishTime = t;
                    msg.data = reinterpret_cast<const std::byte*>(builder_.GetBufferPointer());
                    msg.dataSize = builder_.GetSize();
                    report_(writer_.write(msg), "message");
                }

                static std::string make_filename_(const std::string& dir, const char* ext){
                    static std::atomic<std::uint64_t> seq{0};
                    const std::string utcns = utc_ns_string();
                    const std::uint64_t s = seq.fetch_add(1, std::memory_order_relaxed);
                    return (fs::path(dir) / ("mrac_" + std::string(GIT_SHA) + "_" + utcns + "_" + std::to_string(s) + ext)).string();
                }

                void open_new_file_(){
                    mcap_path_ = make_filename_(cfg_.out_dir, ".mcap");
                    sidecar_path_ = mcap_path_;
                    sidecar_path_.replace_extension(".sidecar.json");

                    mcap::McapWriterOptions wopt("mrac");
                    wopt.noStatistics = true;
                    wopt.compression = mcap::Compression::None;

                    auto st = writer_.open(mcap_path_.string(), wopt);
                    if (!st.ok()){
                        // // no evidence -> no audit, but never take the process down
                        std::fprintf(stderr, "mrac_mcap: open failed: %s\n", st.message.c_str());
                        open_ = false;
                        return;
                    }
                    open_ = true;

                    last_fsync_mark_ = 0;
                    seq_ = 1;
                    tick_seq_ = 0;
                    register_schemas_channels_();
                }

                void close_current_(){
                    if (!open_) return;
                    writer_.close();
                    open_ = false;

                    // // BLAKE3-256 over the closed segment and over the schema it was written with
                    const auto blake = hash::blake3_256_file(mcap_path_.string().c_str());
                    const auto blake_hex = hash::to_hex({blake.data(), blake.size()});
                    const auto schema = hash::blake3_256(bfbs_.data(), bfbs_.size());
                    const auto schema_hex = hash::to_hex({schema.data(), schema.size()});

                    if (std::FILE* sc = std::fopen(sidecar_path_.string().c_str(), "wb")){
                        std::string j;
                        j += R"({"payload_hash":{"alg":"BLAKE3-256","value":")" + blake_hex + R"("},)";
                        j += R"("bfbs_hashes":[{"name":")" + std::string(kBfbsName) + R"(","alg":"BLAKE3-256","value":")" + schema_hex + R"("}]})";
                        if (std::fwrite(j.data(), 1, j.size(), sc) != j.size()){
                            std::fprintf(stderr, "mrac_mcap: short write on '%s'\n", sidecar_path_.string().c_str());
                        }
                        std::fclose(sc);
                    }
                    else{
                        std::fprintf(stderr, "mrac_mcap: failed to open sidecar '%s'\n", sidecar_path_.string().c_str());
                    }
                }

                void register_schemas_channels_(){
                    const std::string_view bfbs(reinterpret_cast<const char*>(bfbs_.data()), bfbs_.size());

                    mcap::Schema sBuild("mrac.metrics.BuildInfo", "flatbuffer", bfbs);
                    mcap::Schema sTick ("mrac.metrics.Tick",      "flatbuffer", bfbs);
                    mcap::Schema sFault("mrac.metrics.Fault",     "flatbuffer", bfbs);
                    mcap::Schema sKpi  ("mrac.metrics.Kpi",       "flatbuffer", bfbs);

                    // // addSchema/addChannel assign ids in place
                    writer_.addSchema(sBuild);
                    writer_.addSchema(sTick);
                    writer_.addSchema(sFault);
                    writer_.addSchema(sKpi);

                    mcap::Channel ch;
                    ch.messageEncoding = "flatbuffer";

                    ch.topic = "/mrac/buildinfo";
                    ch.schemaId = sBuild.id;
                    writer_.addChannel(ch);
                    ch_build_ = ch.id;

                    ch.topic = "/mrac/tick";
                    ch.schemaId = sTick.id;
                    writer_.addChannel(ch);
                    ch_tick_ = ch.id;

                    ch.topic = "/mrac/fault";
                    ch.schemaId = sFault.id;
                    writer_.addChannel(ch);
                    ch_fault_ = ch.id;

                    ch.topic = "/mrac/kpi_report";
                    ch.schemaId = sKpi.id;
                    writer_.addChannel(ch);
                    ch_kpi_ = ch.id;
                }

                void rotate_segment_(){
                    close_current_();
                    open_new_file_();
                    prev_t_ = -1;
                }

            private:
                RecorderConfig cfg_{};
                std::vector<std::uint8_t> bfbs_{};

                fs::path mcap_path_{};
                fs::path sidecar_path_{};
                bool open_{false};

                std::size_t last_fsync_mark_{0};

                long long mono_anchor_ns_{0};
                long long prev_t_{-1};          // last log time written to this segment
                long long last_tick_t_{-1};     // last raw tick time, for dt inference
                std::uint64_t seq_{1};
                std::uint64_t tick_seq_{0};
                std::uint64_t tick_index_{0};

                mcap::McapWriter writer_;
                flatbuffers::FlatBufferBuilder builder_;
                detail::KpiAcc acc_{};

                mcap::ChannelId ch_build_{0}, ch_tick_{0}, ch_fault_{0}, ch_kpi_{0};
        };

    #endif

    std::unique_ptr<Recorder> make_mcap_recorder(const RecorderOptions& opt) {
        #if MRAC_RECORDER_BACKEND_MCAP
            return std::unique_ptr<Recorder>(new RecorderMcap(opt));
        #else
            (void)opt;
            return nullptr;
        #endif
    }
} // namespace mrac::tools
