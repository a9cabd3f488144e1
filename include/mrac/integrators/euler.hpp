#pragma once

#include "mrac/integrators/integrator.hpp"

namespace mrac::integrators{

    // // x <- x + dt * f(t, x)
    class ForwardEuler final : public IStepIntegrator{
        public:
            [[nodiscard]] Status init(std::size_t n, MemoryArena& arena) noexcept override{
                n_ = 0;
                Scalar* bufs[1]{};
                Status st = detail::carve(arena, n, bufs, 1);
                if (st != Status::kOK) return st;
                k_ = bufs[0];
                n_ = n;
                return Status::kOK;
            }

            [[nodiscard]] Status step(const OdeRhs& f, Scalar t, Scalar dt, std::span<Scalar> x) noexcept override{
                Status st = detail::check_step(n_ != 0, n_, f, dt, x);
                if (st != Status::kOK) return st;

                st = f(t, x, {k_, n_});
                if (st != Status::kOK) return st;

                for (std::size_t i=0; i<n_; ++i) x[i] += dt * k_[i];
                return Status::kOK;
            }

            std::size_t dim() const noexcept override{ return n_; }
            const char* name() const noexcept override{ return "euler"; }
            int order() const noexcept override{ return 1; }

        private:
            std::size_t n_{0};
            Scalar* k_{nullptr};
    };

} // namespace mrac::integrators
