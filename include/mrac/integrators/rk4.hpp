#pragma once

#include "mrac/integrators/integrator.hpp"

namespace mrac::integrators{

    // // Classic 4 stage Runge-Kutta, fixed step
    class RK4 final : public IStepIntegrator{
        public:
            [[nodiscard]] Status init(std::size_t n, MemoryArena& arena) noexcept override{
                n_ = 0;
                Scalar* bufs[5]{};
                Status st = detail::carve(arena, n, bufs, 5);
                if (st != Status::kOK) return st;
                k1_ = bufs[0]; k2_ = bufs[1]; k3_ = bufs[2]; k4_ = bufs[3]; tmp_ = bufs[4];
                n_ = n;
                return Status::kOK;
            }

            [[nodiscard]] Status step(const OdeRhs& f, Scalar t, Scalar dt, std::span<Scalar> x) noexcept override{
                Status st = detail::check_step(n_ != 0, n_, f, dt, x);
                if (st != Status::kOK) return st;

                const Scalar half = Scalar(0.5) * dt;
                std::span<const Scalar> tmp(tmp_, n_);

                st = f(t, x, {k1_, n_});
                if (st != Status::kOK) return st;

                for (std::size_t i=0; i<n_; ++i) tmp_[i] = x[i] + half * k1_[i];
                st = f(t + half, tmp, {k2_, n_});
                if (st != Status::kOK) return st;

                for (std::size_t i=0; i<n_; ++i) tmp_[i] = x[i] + half * k2_[i];
                st = f(t + half, tmp, {k3_, n_});
                if (st != Status::kOK) return st;

                for (std::size_t i=0; i<n_; ++i) tmp_[i] = x[i] + dt * k3_[i];
                st = f(t + dt, tmp, {k4_, n_});
                if (st != Status::kOK) return st;

                const Scalar w = dt / Scalar(6);
                for (std::size_t i=0; i<n_; ++i){
                    x[i] += w * (k1_[i] + Scalar(2) * k2_[i] + Scalar(2) * k3_[i] + k4_[i]);
                }
                return Status::kOK;
            }

            std::size_t dim() const noexcept override{ return n_; }
            const char* name() const noexcept override{ return "rk4"; }
            int order() const noexcept override{ return 4; }

        private:
            std::size_t n_{0};
            Scalar* k1_{nullptr};
            Scalar* k2_{nullptr};
            Scalar* k3_{nullptr};
            Scalar* k4_{nullptr};
            Scalar* tmp_{nullptr};
    };

} // namespace mrac::integrators
