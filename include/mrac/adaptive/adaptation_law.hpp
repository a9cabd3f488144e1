#pragma once

#include <algorithm>
#include <cstdint>

#include "mrac/core/types.hpp"
#include "mrac/core/status.hpp"
#include "mrac/adaptive/estimate.hpp"

namespace mrac::adaptive{

    // // Inputs of one adaptation step; u is the control applied in the same tick
    struct AdaptationInput{
        Scalar e{0};    // yr - y at tick start
        Scalar phi{0};  // phi(y) at tick start
        Scalar u{0};
    };

    class IAdaptationLaw{
        public:
            virtual ~IAdaptationLaw() = default;

            // // exactly once per tick, after the control law
            virtual void update(ParameterEstimate& est, const AdaptationInput& in) noexcept = 0;
    };

    // // kIncrement (default): per-tick increment with the raw error sign, no dt factor
    // //   a_hat += gamma_a * e * phi,       b_hat += gamma_b * e * u
    // // kGradientFlow: d(theta)/dt = -gamma * e * de/d(theta), held over one tick of length dt
    // //   a_hat -= dt * gamma_a * e * phi,  b_hat -= dt * gamma_b * e * u
    enum class AdaptationMode : uint8_t { kIncrement = 0, kGradientFlow = 1 };

    inline const char* to_string(AdaptationMode m) noexcept{
        switch (m){
            case AdaptationMode::kIncrement:    return "increment";
            case AdaptationMode::kGradientFlow: return "gradient_flow";
        }
        return "unknown";
    }

    struct AdaptationConfig{
        Scalar gamma_a{0};
        Scalar gamma_b{0};
        Scalar dt{0};          // tick length [s], used by kGradientFlow
        Scalar sigma{0};       // leakage, 0 = off
        Scalar theta_max{0};   // projection bound, 0 = off
        AdaptationMode mode{AdaptationMode::kIncrement};
    };

    // // MIT-rule gradient law, see AdaptationMode for the two update forms
    // // optional leakage (-sigma * theta, scaled like the gradient term) and symmetric
    // // projection into [-theta_max, theta_max]
    class GradientAdaptationLaw final : public IAdaptationLaw{
        public:
            [[nodiscard]] Status configure(const AdaptationConfig& cfg) noexcept{
                if (!(cfg.gamma_a > Scalar(0)) || !(cfg.gamma_b > Scalar(0))) return Status::kInvalidArg;
                if (!is_finite(cfg.gamma_a) || !is_finite(cfg.gamma_b)) return Status::kInvalidArg;
                if (!(cfg.sigma >= Scalar(0)) || !is_finite(cfg.sigma)) return Status::kInvalidArg;
                if (!(cfg.theta_max >= Scalar(0)) || !is_finite(cfg.theta_max)) return Status::kInvalidArg;
                if (cfg.mode == AdaptationMode::kGradientFlow){
                    if (!(cfg.dt > Scalar(0)) || !is_finite(cfg.dt)) return Status::kInvalidArg;
                } else if (cfg.mode != AdaptationMode::kIncrement){
                    return Status::kInvalidArg;
                }
                cfg_ = cfg;
                return Status::kOK;
            }

            void update(ParameterEstimate& est, const AdaptationInput& in) noexcept override{
                const bool flow = cfg_.mode == AdaptationMode::kGradientFlow;
                // // flow: de/da_hat ~ +phi, de/db_hat ~ +u for b_hat > 0, descend on e^2/2
                const Scalar dir = flow ? Scalar(-1) : Scalar(1);
                const Scalar h   = flow ? cfg_.dt : Scalar(1);

                Scalar da = dir * cfg_.gamma_a * in.e * in.phi;
                Scalar db = dir * cfg_.gamma_b * in.e * in.u;

                if (cfg_.sigma > Scalar(0)){
                    da -= cfg_.sigma * est.a_hat;
                    db -= cfg_.sigma * est.b_hat;
                }

                da *= h;
                db *= h;

                est.a_hat += da;
                est.b_hat += db;

                if (cfg_.theta_max > Scalar(0)){
                    est.a_hat = std::clamp(est.a_hat, -cfg_.theta_max, cfg_.theta_max);
                    est.b_hat = std::clamp(est.b_hat, -cfg_.theta_max, cfg_.theta_max);
                }
            }

            const AdaptationConfig& config() const noexcept{ return cfg_; }

        private:
            AdaptationConfig cfg_{};
    };

} // namespace mrac::adaptive
