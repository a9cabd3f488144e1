#pragma once

#include <cmath>

#include "mrac/core/types.hpp"
#include "mrac/core/status.hpp"
#include "mrac/core/signal.hpp"
#include "mrac/core/config.hpp"
#include "mrac/adaptive/estimate.hpp"

namespace mrac::adaptive{

    struct ControlOutput{
        Scalar u{0};
        Scalar phi{0};          // phi(y), reused by the adaptation law in the same tick
        bool degenerate{false}; // |b_hat| < epsilon -> u forced to 0
    };

    class IControlLaw{
        public:
            virtual ~IControlLaw() = default;

            // // pure: must not mutate estimates or plant state
            virtual ControlOutput compute(Scalar t, Scalar y, const ParameterEstimate& est) const noexcept = 0;
    };

    struct ControlLawConfig{
        Scalar k_r{0};
        Scalar epsilon{Scalar(kDefaultEpsilon)};
        Basis basis{};
        ReferenceSignal r{};
    };

    // // u = (k_r * r(t) - a_hat * phi(y)) / b_hat, with u = 0 whenever |b_hat| < epsilon
    class FeedbackLinearizingLaw final : public IControlLaw{
        public:
            [[nodiscard]] Status configure(const ControlLawConfig& cfg) noexcept{
                if (!is_finite(cfg.k_r)) return Status::kInvalidArg;
                if (!(cfg.epsilon > Scalar(0)) || !is_finite(cfg.epsilon)) return Status::kInvalidArg;
                if (!cfg.basis.valid() || !cfg.r.valid()) return Status::kInvalidArg;
                cfg_ = cfg;
                return Status::kOK;
            }

            ControlOutput compute(Scalar t, Scalar y, const ParameterEstimate& est) const noexcept override{
                ControlOutput out{};
                out.phi = cfg_.basis(y);

                // // never divide by a near-zero b_hat
                if (!(std::abs(est.b_hat) >= cfg_.epsilon)){
                    out.u = Scalar(0);
                    out.degenerate = true;
                    return out;
                }

                out.u = (cfg_.k_r * cfg_.r(t) - est.a_hat * out.phi) / est.b_hat;
                return out;
            }

            const ControlLawConfig& config() const noexcept{ return cfg_; }

        private:
            ControlLawConfig cfg_{};
    };

} // namespace mrac::adaptive
