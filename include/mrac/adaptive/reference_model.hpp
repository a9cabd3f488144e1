#pragma once

#include <span>

#include "mrac/core/types.hpp"
#include "mrac/core/status.hpp"
#include "mrac/core/signal.hpp"
#include "mrac/integrators/integrator.hpp"

namespace mrac::adaptive{

    struct ReferenceModelConfig{
        Scalar ar{0};   // pole, > 0 for a stable model
        Scalar br{0};   // input gain, > 0
    };

    // // Desired closed loop behaviour: dyr/dt = -ar * yr + br * r(t), componentwise
    class ReferenceModel{
        public:
            [[nodiscard]] Status configure(const ReferenceModelConfig& cfg, ReferenceSignal r) noexcept{
                if (!(cfg.ar > Scalar(0)) || !(cfg.br > Scalar(0))) return Status::kInvalidArg;
                if (!is_finite(cfg.ar) || !is_finite(cfg.br)) return Status::kInvalidArg;
                if (!r.valid()) return Status::kInvalidArg;
                cfg_ = cfg;
                r_ = r;
                configured_ = true;
                return Status::kOK;
            }

            // // pure; dyr and yr must have the same size
            [[nodiscard]] Status derivative(Scalar t, std::span<const Scalar> yr, std::span<Scalar> dyr) const noexcept{
                if (!configured_) return Status::kNotReady;
                if (yr.size() != dyr.size()) return Status::kInvalidArg;
                const Scalar drive = cfg_.br * r_(t);
                for (std::size_t i=0; i<yr.size(); ++i) dyr[i] = -cfg_.ar * yr[i] + drive;
                return Status::kOK;
            }

            // // bind as an integrator rhs
            integrators::OdeRhs rhs() noexcept{
                return {&ReferenceModel::thunk, this};
            }

            Scalar ar() const noexcept{ return cfg_.ar; }
            Scalar br() const noexcept{ return cfg_.br; }
            const ReferenceSignal& signal() const noexcept{ return r_; }
            bool configured() const noexcept{ return configured_; }

        private:
            static Status thunk(Scalar t, std::span<const Scalar> x, std::span<Scalar> dx, void* user) noexcept{
                return static_cast<const ReferenceModel*>(user)->derivative(t, x, dx);
            }

            ReferenceModelConfig cfg_{};
            ReferenceSignal r_{};
            bool configured_{false};
    };

} // namespace mrac::adaptive
