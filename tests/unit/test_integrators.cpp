#include <cmath>
#include <limits>
#include <cassert>
#include <cstring>
#include <cstddef>
#include <numbers>

#include "mrac/integrators/euler.hpp"
#include "mrac/integrators/rk4.hpp"
#include "mrac/integrators/dopri45.hpp"

using namespace mrac;
using namespace mrac::integrators;

/*
to check: convergence order of the fixed step schemes, DP45 accuracy and non-convergence report,
status propagation from the rhs and the entry guards of step().
*/

// // dx = lambda * x, lambda passed through the cookie
static Status decay(Scalar /*t*/, std::span<const Scalar> x, std::span<Scalar> dx, void* user) noexcept{
    const Scalar lambda = *static_cast<const Scalar*>(user);
    for (std::size_t i=0; i<x.size(); ++i) dx[i] = lambda * x[i];
    return Status::kOK;
}

// // dx = [x1, -x0]: harmonic oscillator
static Status oscillator(Scalar /*t*/, std::span<const Scalar> x, std::span<Scalar> dx, void* /*user*/) noexcept{
    dx[0] = x[1];
    dx[1] = -x[0];
    return Status::kOK;
}

static Status poisoned(Scalar /*t*/, std::span<const Scalar> /*x*/, std::span<Scalar> dx, void* /*user*/) noexcept{
    for (auto& v : dx) v = std::numeric_limits<Scalar>::quiet_NaN();
    return Status::kOK;
}

static Status refusing(Scalar /*t*/, std::span<const Scalar> /*x*/, std::span<Scalar> /*dx*/, void* user) noexcept{
    return *static_cast<const Status*>(user);
}

// // |x(1) - e^-1| for dx = -x on n uniform steps
static Scalar decay_error(IStepIntegrator& integ, int n){
    Scalar lambda = -1.0;
    Scalar x[1]{1.0};
    const Scalar h = 1.0 / n;
    for (int k=0; k<n; ++k){
        [[maybe_unused]] Status st = integ.step({&decay, &lambda}, k * h, h, x);
        assert(st == Status::kOK);
    }
    return std::abs(x[0] - std::exp(-1.0));
}

int main(){
    alignas(64) std::byte buf[8192];
    MemoryArena arena(buf, sizeof(buf));

    ForwardEuler euler;
    RK4 rk4;
    DormandPrince45 dp;

    // // step() before init()
    {
        Scalar lambda = -1.0;
        Scalar x[1]{1.0};
        assert(euler.step({&decay, &lambda}, 0.0, 0.1, x) == Status::kNotReady);
        assert(rk4.step({&decay, &lambda}, 0.0, 0.1, x) == Status::kNotReady);
        assert(dp.step({&decay, &lambda}, 0.0, 0.1, x) == Status::kNotReady);
        assert(euler.init(0, arena) == Status::kInvalidArg);
    }

    assert(euler.init(1, arena) == Status::kOK);
    assert(rk4.init(1, arena) == Status::kOK);
    assert(dp.init(1, arena) == Status::kOK);
    assert(euler.dim() == 1 && rk4.dim() == 1 && dp.dim() == 1);
    assert(std::strcmp(euler.name(), "euler") == 0 && euler.order() == 1);
    assert(std::strcmp(rk4.name(), "rk4") == 0 && rk4.order() == 4);
    assert(std::strcmp(dp.name(), "dopri45") == 0 && dp.order() == 5);

    // // orders: halving h divides the error by ~2^p
    {
        const Scalar r_euler = decay_error(euler, 10) / decay_error(euler, 20);
        assert(r_euler > 1.8 && r_euler < 2.3);

        const Scalar r_rk4 = decay_error(rk4, 10) / decay_error(rk4, 20);
        assert(r_rk4 > 14.0 && r_rk4 < 18.5);

        assert(decay_error(dp, 10) < 1e-7);
        assert(decay_error(dp, 1) < 1e-5);
    }

    // // entry guards
    {
        Scalar lambda = -1.0;
        Scalar two[2]{1.0, 1.0};
        Scalar one[1]{1.0};
        IStepIntegrator* all[3]{&euler, &rk4, &dp};
        for (IStepIntegrator* integ : all){
            assert(integ->step({&decay, &lambda}, 0.0, 0.1, two) == Status::kInvalidArg);
            assert(integ->step(OdeRhs{}, 0.0, 0.1, one) == Status::kInvalidArg);
            assert(integ->step({&decay, &lambda}, 0.0, 0.0, one) == Status::kInvalidArg);
            assert(integ->step({&decay, &lambda}, 0.0, -0.1, one) == Status::kInvalidArg);
            assert(integ->step({&decay, &lambda}, 0.0, std::numeric_limits<Scalar>::quiet_NaN(), one) == Status::kInvalidArg);
        }
    }

    // // rhs status comes back unchanged
    {
        Scalar one[1]{1.0};
        for (Status want : {Status::kPreconditionFail, Status::kIntegratorFailure, Status::kInvalidArg}){
            Status s = want;
            assert(euler.step({&refusing, &s}, 0.0, 0.1, one) == want);
            assert(rk4.step({&refusing, &s}, 0.0, 0.1, one) == want);
            assert(dp.step({&refusing, &s}, 0.0, 0.1, one) == want);
        }
    }

    // // NaN rhs: fixed step schemes hand back a non-finite state, DP45 cannot converge
    {
        Scalar x[1]{1.0};
        assert(euler.step({&poisoned, nullptr}, 0.0, 0.1, x) == Status::kOK);
        assert(!is_finite(x[0]));

        x[0] = 1.0;
        assert(rk4.step({&poisoned, nullptr}, 0.0, 0.1, x) == Status::kOK);
        assert(!is_finite(x[0]));

        x[0] = 1.0;
        assert(dp.step({&poisoned, nullptr}, 0.0, 0.1, x) == Status::kIntegratorFailure);
    }

    // // 2-state oscillator keeps dimensionality and energy over one period
    {
        RK4 osc;
        assert(osc.init(2, arena) == Status::kOK);
        Scalar x[2]{1.0, 0.0};
        const int n = 628;
        const Scalar h = 2.0 * std::numbers::pi / n;
        for (int k=0; k<n; ++k) assert(osc.step({&oscillator, nullptr}, k * h, h, x) == Status::kOK);
        assert(std::abs(x[0] - 1.0) < 1e-6);
        assert(std::abs(x[1]) < 1e-6);
    }

    // // DP45 shrinks substeps inside one outer step and stays deterministic
    {
        Scalar lambda = -50.0;
        Scalar a[1]{1.0};
        Scalar b[1]{1.0};
        assert(dp.step({&decay, &lambda}, 0.0, 0.5, a) == Status::kOK);
        const auto substeps = dp.last_substeps();
        assert(substeps > 1);
        assert(std::abs(a[0] - std::exp(-25.0)) < 1e-8);
        assert(dp.step({&decay, &lambda}, 0.0, 0.5, b) == Status::kOK);
        assert(dp.last_substeps() == substeps);
        assert(a[0] == b[0]);
    }

    // // stiff beyond the substep budget -> non-convergence
    {
        Dopri45Options opt{};
        opt.max_substeps = 200;
        DormandPrince45 tight(opt);
        assert(tight.init(1, arena) == Status::kOK);
        Scalar lambda = -1e6;
        Scalar x[1]{1.0};
        assert(tight.step({&decay, &lambda}, 0.0, 0.01, x) == Status::kIntegratorFailure);
        assert(tight.last_substeps() == 200);
    }

    // // invalid options are refused at init
    {
        Dopri45Options opt{};
        opt.atol = 0.0;
        DormandPrince45 broken(opt);
        assert(broken.init(1, arena) == Status::kInvalidArg);
    }

    // // arena exhaustion
    {
        alignas(64) std::byte tiny[32];
        MemoryArena small(tiny, sizeof(tiny));
        DormandPrince45 hungry;
        assert(hungry.init(1, small) == Status::kNoMem);
        assert(hungry.dim() == 0);
    }

    return 0;
}
