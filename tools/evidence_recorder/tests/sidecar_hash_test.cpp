#include <string>
#include <cassert>
#include <filesystem>

#include "hash.hpp"
#include "mrac/tools/recorder.hpp"
#include "recorder_test_util.hpp"

int main(){
    #if !MRAC_RECORDER_BACKEND_MCAP
        return 0;
    #else

    namespace fs = std::filesystem;
    using namespace mrac::tools;
    using namespace mrac::tools::test;

    const char* out_dir = "evidence_sidecar";
    fs::remove_all(out_dir);

    RecorderOptions opt;
    opt.out_dir = out_dir;
    opt.dt_ns_hint = 10'000'000;

    {
        auto rec = Recorder::open(opt);
        rec->write_time_anchor(111, 222);
        rec->write_buildinfo();
        for (std::uint64_t k=0; k<10; ++k) rec->write_tick(make_tick(k));
        rec->write_kpi({});
        rec->flush();
    } // close writes the sidecar

    const auto mcaps = files_with_ext(out_dir, ".mcap");
    const auto sidecars = files_with_ext(out_dir, ".json");
    assert(mcaps.size() == 1 && sidecars.size() == 1);

    const auto d = hash::blake3_256_file(mcaps[0].string().c_str());
    const auto hex = hash::to_hex({d.data(), d.size()});

    const std::string s = readall(sidecars[0]);
    assert(s.find(R"("alg":"BLAKE3-256")") != std::string::npos);
    assert(s.find(hex) != std::string::npos);
    return 0;
    #endif
}
