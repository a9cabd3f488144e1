#pragma once

#include <cstdint>

#include "mrac/core/types.hpp"
#include "mrac/core/config.hpp"
#include "mrac/core/time.hpp"
#include "mrac/core/status.hpp"
#include "mrac/adaptive/control_law.hpp"
#include "mrac/adaptive/adaptation_law.hpp"
#include "mrac/adaptive/reference_model.hpp"

namespace mrac::adaptive{

    // // horizon * 1e9 and tick * dt must stay inside t_ns (int64 ns, ~292 years)
    inline constexpr Scalar kMaxHorizonSeconds = Scalar(9.0e9);

    // // Full run configuration. Plain aggregate; validate() before handing it to the scheduler
    struct MracConfig{
        // // initial estimates
        Scalar a_hat0{0};
        Scalar b_hat0{0};

        // // adaptation gains, strictly positive
        Scalar gamma_a{0};
        Scalar gamma_b{0};

        // // feedforward gain on r(t); nominally br / b_true, which the controller cannot know
        Scalar k_r{0};

        Scalar epsilon{Scalar(kDefaultEpsilon)};

        // // fixed step and run length in seconds
        Scalar dt{0};
        Scalar horizon{0};

        // // reference model
        Scalar ar{0};
        Scalar br{0};

        // // adaptation extras, off by default
        Scalar sigma{0};
        Scalar theta_max{0};

        // // update form; kGradientFlow is the dt-scaled descending variant
        AdaptationMode adaptation{AdaptationMode::kIncrement};
    };

    // // kOK or kInvalidArg; on rejection *reason names the offending field
    [[nodiscard]] inline Status validate(const MracConfig& c, const char** reason = nullptr) noexcept{
        auto reject = [reason](const char* what) noexcept{
            if (reason) *reason = what;
            return Status::kInvalidArg;
        };
        auto positive = [](Scalar v) noexcept{ return v > Scalar(0) && is_finite(v); };

        if (!is_finite(c.a_hat0)) return reject("a_hat0");
        if (!is_finite(c.b_hat0)) return reject("b_hat0");
        if (!positive(c.gamma_a)) return reject("gamma_a");
        if (!positive(c.gamma_b)) return reject("gamma_b");
        if (!is_finite(c.k_r)) return reject("k_r");
        if (!positive(c.epsilon)) return reject("epsilon");
        if (!positive(c.dt)) return reject("dt");
        if (!positive(c.horizon)) return reject("horizon");
        if (c.horizon > kMaxHorizonSeconds) return reject("horizon");
        if (c.dt > c.horizon) return reject("horizon");
        if (!positive(c.ar)) return reject("ar");
        if (!positive(c.br)) return reject("br");
        if (!(c.sigma >= Scalar(0)) || !is_finite(c.sigma)) return reject("sigma");
        if (!(c.theta_max >= Scalar(0)) || !is_finite(c.theta_max)) return reject("theta_max");
        if (c.adaptation != AdaptationMode::kGradientFlow &&
            c.adaptation != AdaptationMode::kIncrement) return reject("adaptation");
        // // dt must survive the round trip to integer nanoseconds
        if (from_seconds(c.dt) <= 0) return reject("dt");
        if (from_seconds(c.horizon) < from_seconds(c.dt)) return reject("horizon");

        if (reason) *reason = nullptr;
        return Status::kOK;
    }

    // // whole ticks that fit in the horizon, counted on the nanosecond grid: never past the horizon.
    // // 10 s / 0.01 s -> 1000, 0.015 s / 0.01 s -> 1. Only meaningful for a validated config
    inline std::uint64_t tick_count(const MracConfig& c) noexcept{
        const dt_ns step = from_seconds(c.dt);
        const t_ns span = from_seconds(c.horizon);
        return (step > 0 && span > 0) ? static_cast<std::uint64_t>(span / step) : 0;
    }

    inline AdaptationConfig adaptation_config(const MracConfig& c) noexcept{
        return {c.gamma_a, c.gamma_b, c.dt, c.sigma, c.theta_max, c.adaptation};
    }

    inline ReferenceModelConfig reference_model_config(const MracConfig& c) noexcept{
        return {c.ar, c.br};
    }

    inline ControlLawConfig control_law_config(const MracConfig& c, Basis basis, ReferenceSignal r) noexcept{
        return {c.k_r, c.epsilon, basis, r};
    }

} // namespace mrac::adaptive
