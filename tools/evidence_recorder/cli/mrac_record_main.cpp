#include <ctime>
#include <chrono>
#include <cstdio>
#include <string>
#include <cstdlib>
#include <cstring>
#include <filesystem>

#include "mrac/io/kpi.hpp"
#include "mrac/core/time.hpp"
#include "mrac/core/result.hpp"
#include "mrac/tools/recorder.hpp"

namespace fs = std::filesystem;
using namespace mrac;
using namespace mrac::tools;

static void usage(){
    std::fprintf(
        stderr,
        "mrac_record --out <dir> --schema-dir <dir> --tick-decim N "
        "--segment-max-mb 256 --fsync-policy {every_segment|every_n_mb} --fsync-n-mb 16 "
        "--dt-ns <n> --run-id <str> --plant-id <str> --integrator <str> --stdin-csv\n"
        "CSV (if --stdin-csv): t,y,yr,u,a_hat,b_hat[,degenerate]   (t in seconds, lines that don't parse are skipped)\n"
    );
}

// system clock -> epoch ns
static inline long long now_utc_ns(){
    using namespace std::chrono;
    return duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count();
}

// monotonic source for the time anchor
static inline long long now_mono_ns(){
    using namespace std::chrono;
    return duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count();
}

int main(int argc, char** argv){
    const char* out_dir = "evidence";
    const char* schema_dir = MRAC_FB_SCHEMA_DIR;
    int tick_decim = 1;
    int segment_mb = 256;
    const char* fsync_policy = "every_n_mb";
    int fsync_n_mb = 16;
    bool stdin_csv = false;
    long long dt_ns_hint = 0;
    const char* run_id = "";
    const char* plant_id = "";
    const char* integrator = "";

    for (int i=1; i<argc; i++){
             if (!std::strcmp(argv[i], "--out") && i+1<argc) out_dir = argv[++i];
        else if (!std::strcmp(argv[i], "--schema-dir") && i+1<argc) schema_dir = argv[++i];
        else if (!std::strcmp(argv[i], "--tick-decim") && i+1<argc) tick_decim = std::atoi(argv[++i]);
        else if (!std::strcmp(argv[i], "--segment-max-mb") && i+1<argc) segment_mb = std::atoi(argv[++i]);
        else if (!std::strcmp(argv[i], "--fsync-policy") && i+1<argc) fsync_policy = argv[++i];
        else if (!std::strcmp(argv[i], "--fsync-n-mb") && i+1<argc) fsync_n_mb = std::atoi(argv[++i]);
        else if (!std::strcmp(argv[i], "--dt-ns") && i+1<argc) dt_ns_hint = std::atoll(argv[++i]);
        else if (!std::strcmp(argv[i], "--run-id") && i+1<argc) run_id = argv[++i];
        else if (!std::strcmp(argv[i], "--plant-id") && i+1<argc) plant_id = argv[++i];
        else if (!std::strcmp(argv[i], "--integrator") && i+1<argc) integrator = argv[++i];
        else if (!std::strcmp(argv[i], "--stdin-csv")) stdin_csv = true;
        else{
            usage();
            return 2;
        }
    }

    if (std::strcmp(fsync_policy, "every_segment") != 0 && std::strcmp(fsync_policy, "every_n_mb") != 0){
        std::fprintf(stderr, "mrac_record: unknown --fsync-policy '%s'\n", fsync_policy);
        usage();
        return 2;
    }

    {
        std::error_code ec;
        fs::create_directories(out_dir, ec);
        if (ec) std::fprintf(stderr, "mrac_record: warn: create_directories(%s): %s\n",
                             out_dir, ec.message().c_str());
    }

    RecorderOptions opt;
    opt.out_dir = out_dir;
    opt.schema_dir = schema_dir;
    opt.segment_max_mb = (segment_mb > 0) ? static_cast<std::size_t>(segment_mb) : 256;
    opt.fsync_n_mb = (fsync_n_mb > 0) ? static_cast<std::size_t>(fsync_n_mb) : 16;
    opt.tick_decimation = (tick_decim > 0) ? tick_decim : 1;
    opt.fsync_policy = (
        std::strcmp(fsync_policy, "every_segment") == 0 ?
        RecorderOptions::EverySegment : RecorderOptions::EveryNMB
    );
    opt.dt_ns_hint = dt_ns_hint;
    opt.run_id = run_id;
    opt.plant_id = plant_id;
    opt.integrator = integrator;

    auto rec = Recorder::open(opt);
    if (!rec){
        std::fprintf(stderr, "mrac_record: no recorder backend available\n");
        return 1;
    }
    rec->write_buildinfo();
    rec->write_time_anchor(now_mono_ns(), now_utc_ns());

    KpiCounters kpi{};
    std::uint64_t skipped = 0;
    if (stdin_csv){
        char line[512];
        std::uint64_t tick = 0;
        while (std::fgets(line, sizeof(line), stdin)){
            line[std::strcspn(line, "\r\n")] = 0;

            double t=0, y=0, yr=0, u=0, a_hat=0, b_hat=0;
            int degenerate = 0;
            const int n = std::sscanf(
                line, " %lf , %lf , %lf , %lf , %lf , %lf , %d",
                &t, &y, &yr, &u, &a_hat, &b_hat, &degenerate
            );
            if (n < 6){
                ++skipped;
                continue;
            }

            TickRecord r{};
            r.tick = tick++;
            r.time_ns = from_seconds(static_cast<Scalar>(t));
            r.t = static_cast<Scalar>(t);
            r.y = static_cast<Scalar>(y);
            r.yr = static_cast<Scalar>(yr);
            r.u = static_cast<Scalar>(u);
            r.a_hat = static_cast<Scalar>(a_hat);
            r.b_hat = static_cast<Scalar>(b_hat);
            r.degenerate = (n == 7 && degenerate != 0);

            Recorder::tick_sink(r, rec.get());
            ++kpi.updates;
            if (r.degenerate) ++kpi.degenerate_ticks;
        }
    }

    rec->write_kpi(kpi);
    rec->flush();

    if (skipped) std::fprintf(stderr, "mrac_record: skipped %llu unparsable lines\n", static_cast<unsigned long long>(skipped));
    return 0;
}
