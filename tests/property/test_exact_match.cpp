#include <cmath>
#include <vector>
#include <algorithm>
#include <cassert>

#include "mrac/all.hpp"
#include "util/loop_fixtures.hpp"

using namespace mrac;
using namespace mrac::adaptive;
using mrac_test::RecordCapture;
using mrac_test::MatchedPlant;
using mrac_test::FrozenAdaptationLaw;

/*
to check: with a_hat = a_true, b_hat = b_true, k_r = br / b_true and no disturbance the plant
follows the reference model, and the residual error is a discretisation effect (shrinks with dt).
The plant is dy/dt = -ar*y + a*y^3 + b*u so that the cubic term is the only thing the law cancels.
*/

static Scalar max_tracking_error(Scalar dt, ReferenceSignal r){
    const Scalar a_true = 1.5;
    const Scalar b_true = 1.0;

    MracConfig cfg{};
    cfg.a_hat0 = a_true;
    cfg.b_hat0 = b_true;
    cfg.gamma_a = 1e-9;
    cfg.gamma_b = 1e-9;
    cfg.ar = 3.0;
    cfg.br = 3.0;
    cfg.k_r = cfg.br / b_true;
    cfg.dt = dt;
    cfg.horizon = 10.0;

    MatchedPlant plant(cfg.ar, a_true, b_true);
    integrators::RK4 rk4;
    FrozenAdaptationLaw frozen;
    RecordCapture cap;

    alignas(64) std::byte buf[4096];
    MemoryArena arena(buf, sizeof(buf));
    AdaptiveLoopScheduler loop;

    Hooks hooks{};
    hooks.on_tick = &RecordCapture::sink;
    hooks.user = &cap;

    [[maybe_unused]] Status st = loop.init(Dims{.ny=1, .nu=1, .nx=1}, arena, hooks);
    assert(st == Status::kOK);
    st = loop.configure(cfg, plant, rk4, r, basis::cubic());
    assert(st == Status::kOK);
    loop.set_adaptation_law(&frozen);
    cap.records.reserve(loop.total_ticks());

    const Scalar zero[1]{0.0};
    st = loop.start(zero, zero);
    assert(st == Status::kOK);

    auto res = loop.run();
    assert(res.has_value());
    assert(frozen.calls == loop.total_ticks());
    assert(loop.estimate().a_hat == a_true && loop.estimate().b_hat == b_true);

    Scalar worst = 0;
    for (const auto& rec : cap.records){
        assert(!rec.degenerate);
        worst = std::max(worst, std::abs(rec.yr - rec.y));
    }
    worst = std::max(worst, std::abs(res.value().yr_final - res.value().y_final));
    return worst;
}

int main(){
    signals::Sine sine{};
    signals::Constant half{0.5};

    // // sinusoid: u is held over the tick, so the error is first order in dt
    const Scalar coarse = max_tracking_error(0.01, sine.signal());
    const Scalar fine = max_tracking_error(0.001, sine.signal());
    assert(coarse < 1e-2);
    assert(fine < 1e-3);
    assert(coarse / fine > 5.0);

    // // constant reference
    const Scalar c_coarse = max_tracking_error(0.01, half.signal());
    const Scalar c_fine = max_tracking_error(0.001, half.signal());
    assert(c_coarse < 1e-3);
    assert(c_fine < c_coarse);

    return 0;
}
