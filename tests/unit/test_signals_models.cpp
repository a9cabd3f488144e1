#include <cmath>
#include <limits>
#include <cassert>
#include <cstring>

#include "mrac/all.hpp"
#include "util/loop_fixtures.hpp"

using namespace mrac;

/*
to check: built in reference signals, basis functions, example plants, status/fault strings and
the fixed buffer logger.
*/

int main(){
    // // signals
    {
        signals::Constant c{0.75};
        const ReferenceSignal r = c.signal();
        assert(r.valid());
        assert(r(0.0) == 0.75 && r(123.0) == 0.75);

        signals::Step s{1.0, -1.0, 2.0};
        assert(s.signal()(0.999) == -1.0);
        assert(s.signal()(1.0) == 2.0);
        assert(s.signal()(5.0) == 2.0);

        signals::Sine def{};
        assert(def.signal()(0.0) == 0.0);
        assert(std::abs(def.signal()(1.0) - std::sin(1.0)) < 1e-15);

        signals::Sine shaped{2.0, 3.0, 0.5, 1.0};
        assert(std::abs(shaped.signal()(0.2) - (1.0 + 2.0 * std::sin(3.0 * 0.2 + 0.5))) < 1e-15);

        // // the object is the cookie: edits show through the bound signal
        c.value = -4.0;
        assert(r(0.0) == -4.0);

        assert(!ReferenceSignal{}.valid());
    }

    // // basis
    {
        assert(basis::cubic()(2.0) == 8.0);
        assert(basis::cubic()(-0.5) == -0.125);
        assert(basis::identity()(-3.0) == -3.0);
        assert(!Basis{}.valid());
    }

    // // plants
    {
        models::CubicPlant cubic(mrac_test::nominal_plant());
        assert(cubic.dim() == 1);
        assert(cubic.params().a == 1.5 && cubic.params().b == 2.0 && cubic.params().d == 0.5);

        Scalar x[1]{2.0};
        Scalar dx[1]{};
        assert(cubic.rhs(0.0, x, 0.25, dx) == Status::kOK);
        assert(dx[0] == -1.5 * 8.0 + 2.0 * 0.25 + 0.5);

        Scalar two[2]{};
        assert(cubic.rhs(0.0, two, 0.0, dx) == Status::kInvalidArg);

        models::FirstOrderPlant lin({2.0, 0.5, -1.0});
        assert(lin.dim() == 1);
        assert(lin.rhs(0.0, x, 4.0, dx) == Status::kOK);
        assert(dx[0] == -2.0 * 2.0 + 0.5 * 4.0 - 1.0);
    }

    // // strings
    {
        assert(std::strcmp(to_string(Status::kNumericDivergence), "numeric_divergence") == 0);
        assert(std::strcmp(to_string(Status::kIntegratorFailure), "integrator_failure") == 0);
        assert(std::strcmp(to_string(Status::kCancelled), "cancelled") == 0);
        assert(std::strcmp(to_string(FaultSource::kPlantState), "plant_state") == 0);
        assert(std::strcmp(to_string(FaultSource::kEstimate), "estimate") == 0);
        assert(std::strcmp(to_string(LogLevel::kWarn), "WARN") == 0);

        Fault f{};
        assert(!f.active());
        f.source = FaultSource::kControl;
        assert(f.active());
    }

    // // finiteness helpers
    {
        const Scalar ok[3]{0.0, 1.0, -2.0};
        const Scalar bad[3]{0.0, std::numeric_limits<Scalar>::infinity(), 1.0};
        assert(first_non_finite(ok) == 3);
        assert(first_non_finite(bad) == 1);

        adaptive::ParameterEstimate est{1.0, 2.0};
        assert(adaptive::non_finite_component(est) == 2);
        est.b_hat = std::numeric_limits<Scalar>::quiet_NaN();
        assert(adaptive::non_finite_component(est) == 1);
        est.a_hat = std::numeric_limits<Scalar>::quiet_NaN();
        assert(adaptive::non_finite_component(est) == 0);
    }

    // // logger: formatted into a fixed buffer, null sink is a no-op
    {
        mrac_test::CaptureLogger logger;
        log_fmt(&logger, LogLevel::kWarn, 0, "tick %d: %s", 42, "degenerate");
        log_fmt(nullptr, LogLevel::kError, 0, "dropped %d", 1);
        assert(logger.count(LogLevel::kWarn) == 1);
        assert(logger.count(LogLevel::kError) == 0);
        assert(logger.contains("tick 42: degenerate"));
    }

    return 0;
}
