#include <bit>
#include <vector>
#include <cstdint>
#include <cassert>

#include "mrac/all.hpp"
#include "util/alloc_interposer.hpp"
#include "util/loop_fixtures.hpp"

using namespace mrac;
using namespace mrac::adaptive;
using mrac_test::nominal_config;
using mrac_test::nominal_plant;
using mrac_test::RecordCapture;
using mrac_test::CaptureLogger;

// // serialise every field bit for bit, padding excluded
static void append(std::vector<std::uint64_t>& out, const TickRecord& r){
    out.push_back(r.tick);
    out.push_back(static_cast<std::uint64_t>(r.time_ns));
    out.push_back(std::bit_cast<std::uint64_t>(r.t));
    out.push_back(std::bit_cast<std::uint64_t>(r.y));
    out.push_back(std::bit_cast<std::uint64_t>(r.yr));
    out.push_back(std::bit_cast<std::uint64_t>(r.u));
    out.push_back(std::bit_cast<std::uint64_t>(r.a_hat));
    out.push_back(std::bit_cast<std::uint64_t>(r.b_hat));
    out.push_back(r.degenerate ? 1u : 0u);
}

static std::vector<std::uint64_t> run_once(integrators::IStepIntegrator& integ,
                                           AdaptationMode mode = AdaptationMode::kIncrement){
    MracConfig cfg = nominal_config();
    cfg.adaptation = mode;
    models::CubicPlant plant(nominal_plant());
    signals::Sine sine{};
    RecordCapture cap;
    CaptureLogger logger;

    // // pre-allocate the arena and the record sink before start()
    alignas(64) std::byte buffer[4096];
    MemoryArena arena(buffer, sizeof(buffer));
    AdaptiveLoopScheduler loop;
    Hooks hooks{&RecordCapture::sink, &cap, &logger};

    [[maybe_unused]] auto st = loop.init(Dims{.ny=1, .nu=1, .nx=1}, arena, hooks);
    assert(st == Status::kOK);
    st = loop.configure(cfg, plant, integ, sine.signal(), basis::cubic());
    assert(st == Status::kOK);
    cap.records.reserve(loop.total_ticks());

    const Scalar y0[1]{0.1};
    const Scalar yr0[1]{0.0};
    st = loop.start(y0, yr0);
    assert(st == Status::kOK);

    // // snapshot allocation counters after warmup allocations
    mrac_test::reset_alloc_stats();
    auto new0 = mrac_test::new_count();
    auto newA0 = mrac_test::new_aligned_count();

    auto res = loop.run();

    auto new1 = mrac_test::new_count();
    auto newA1 = mrac_test::new_aligned_count();

    // // no alloc allowed during ticks
    assert(new1 == new0);
    assert(newA1 == newA0);

    assert(res.has_value());
    assert(cap.records.size() == 1000);

    std::vector<std::uint64_t> bytes;
    bytes.reserve(cap.records.size() * 9 + 2);
    for (const auto& r : cap.records) append(bytes, r);
    bytes.push_back(std::bit_cast<std::uint64_t>(res.value().y_final));
    bytes.push_back(std::bit_cast<std::uint64_t>(res.value().yr_final));
    return bytes;
}

int main(){
    {
        integrators::RK4 a_int, b_int;
        auto a = run_once(a_int);
        auto b = run_once(b_int);
        assert(a.size() == b.size());
        // // bit-exact determinism within same build
        assert(a == b);
    }
    {
        integrators::DormandPrince45 a_int, b_int;
        auto a = run_once(a_int, AdaptationMode::kGradientFlow);
        auto b = run_once(b_int, AdaptationMode::kGradientFlow);
        assert(a == b);
    }
    {
        // // same integrator object reused across runs
        integrators::ForwardEuler euler;
        auto a = run_once(euler, AdaptationMode::kGradientFlow);
        auto b = run_once(euler, AdaptationMode::kGradientFlow);
        assert(a == b);
    }

    return 0;
}
