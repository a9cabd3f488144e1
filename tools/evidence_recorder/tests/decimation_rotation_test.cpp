#include <string>
#include <cassert>
#include <filesystem>

#include "mrac/tools/recorder.hpp"
#include "recorder_test_util.hpp"

namespace fs = std::filesystem;
using namespace mrac;
using namespace mrac::tools;
using namespace mrac::tools::test;

int main(){
    #if MRAC_RECORDER_BACKEND_MCAP
        return 0;
    #else

    // // decimation thins the file, KPIs still see every tick
    {
        const char* out_dir = "evidence_decim";
        fs::remove_all(out_dir);

        RecorderOptions opt;
        opt.out_dir = out_dir;
        opt.tick_decimation = 10;

        {
            auto rec = Recorder::open(opt);
            for (std::uint64_t k=0; k<100; ++k) Recorder::tick_sink(make_tick(k), rec.get());
            rec->write_kpi({});
        }

        const auto files = files_with_ext(out_dir, ".jsonl");
        assert(files.size() == 1);
        const std::string s = readall(files[0]);
        assert(count_substr(s, R"("ch":"/mrac/tick")") == 10);
        assert(s.find(R"("recorded_ticks":100)") != std::string::npos);
    }

    // // size based rotation: 1 MiB segments
    {
        const char* out_dir = "evidence_rot";
        fs::remove_all(out_dir);

        RecorderOptions opt;
        opt.out_dir = out_dir;
        opt.segment_max_mb = 1;
        opt.dt_ns_hint = 10'000'000;

        {
            auto rec = Recorder::open(opt);
            rec->write_buildinfo();
            // // ~200 bytes per line -> well past 1 MiB
            for (std::uint64_t k=0; k<20000; ++k) Recorder::tick_sink(make_tick(k), rec.get());
            rec->write_kpi({});
        }

        const auto files = files_with_ext(out_dir, ".jsonl");
        assert(files.size() >= 2);

        std::size_t ticks = 0;
        for (const auto& f : files){
            const std::string s = readall(f);
            // // every segment opens with its own meta line
            assert(s.rfind(R"({"meta":{"schema_backend":"jsonl")", 0) == 0);
            ticks += count_substr(s, R"("ch":"/mrac/tick")");
        }
        assert(ticks == 20000);
    }

    return 0;
    #endif
}
