#include <cmath>
#include <string>
#include <cassert>
#include <limits>
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

    const char* out_dir = "evidence_jsonl";
    fs::remove_all(out_dir);

    RecorderOptions opt;
    opt.out_dir = out_dir;
    opt.dt_ns_hint = 10'000'000;
    opt.run_id = "unit \"quoted\"";
    opt.integrator = "rk4";

    {
        auto rec = Recorder::open(opt);
        assert(rec);
        rec->write_buildinfo();

        for (std::uint64_t k=0; k<5; ++k) Recorder::tick_sink(make_tick(k), rec.get());

        TickRecord bad = make_tick(5);
        bad.u = std::numeric_limits<Scalar>::quiet_NaN();
        rec->write_tick(bad);

        Fault f{};
        f.status = Status::kNumericDivergence;
        f.source = FaultSource::kControl;
        f.tick = 5;
        f.t = bad.time_ns;
        f.value = bad.u;
        rec->write_fault(f);

        // // inactive fault writes nothing
        rec->write_fault(Fault{});

        KpiCounters k{};
        k.updates = 5;
        k.divergences = 1;
        rec->write_kpi(k);
        rec->flush();
    } // dtor closes the segment

    const auto files = files_with_ext(out_dir, ".jsonl");
    assert(files.size() == 1);
    const std::string s = readall(files[0]);

    assert(s.find(R"("schema_backend":"jsonl")") != std::string::npos);
    assert(s.find(R"("run_id":"unit \"quoted\"")") != std::string::npos);
    assert(s.find(R"("integrator":"rk4")") != std::string::npos);

    assert(count_substr(s, R"("ch":"/mrac/tick")") == 6);
    assert(s.find(R"("tick":0,"t_ns":0,"y":1,"yr":1.5,"u":-0.25,"a_hat":0.10000000000000001,"b_hat":0.5,"degenerate":false)") != std::string::npos);

    // // non-finite values are written as null, never as bare nan
    assert(s.find(R"("u":null)") != std::string::npos);
    assert(s.find("nan") == std::string::npos);

    assert(count_substr(s, R"("ch":"/mrac/fault")") == 1);
    assert(s.find(R"("status":"numeric_divergence","source":"control","tick":5)") != std::string::npos);

    assert(s.find(R"("ch":"/mrac/kpi_report")") != std::string::npos);
    assert(s.find(R"("updates":5,"degenerate_ticks":0,"divergences":1)") != std::string::npos);
    assert(s.find(R"("recorded_ticks":6)") != std::string::npos);

    return 0;
    #endif
}
