#pragma once

#include <cmath>
#include <cstdint>
#include <algorithm>

#include "mrac/integrators/integrator.hpp"

namespace mrac::integrators{

    struct Dopri45Options{
        Scalar rtol{Scalar(1e-6)};
        Scalar atol{Scalar(1e-9)};
        Scalar safety{Scalar(0.9)};
        Scalar min_step{Scalar(1e-12)};       // substep below this -> kIntegratorFailure
        std::uint32_t max_substeps{10000};    // accepted + rejected substeps per step()
    };

    inline bool valid(const Dopri45Options& o) noexcept{
        return o.rtol >= Scalar(0) && o.atol > Scalar(0)
            && o.safety > Scalar(0) && o.safety <= Scalar(1)
            && o.min_step > Scalar(0) && o.max_substeps > 0
            && is_finite(o.rtol) && is_finite(o.atol) && is_finite(o.min_step);
    }

    // // Dormand-Prince 5(4) tableau
    namespace dp45{
        inline constexpr double c2 = 1.0/5.0, c3 = 3.0/10.0, c4 = 4.0/5.0, c5 = 8.0/9.0;

        inline constexpr double a21 = 1.0/5.0;
        inline constexpr double a31 = 3.0/40.0,        a32 = 9.0/40.0;
        inline constexpr double a41 = 44.0/45.0,       a42 = -56.0/15.0,      a43 = 32.0/9.0;
        inline constexpr double a51 = 19372.0/6561.0,  a52 = -25360.0/2187.0, a53 = 64448.0/6561.0, a54 = -212.0/729.0;
        inline constexpr double a61 = 9017.0/3168.0,   a62 = -355.0/33.0,     a63 = 46732.0/5247.0, a64 = 49.0/176.0, a65 = -5103.0/18656.0;

        // // 5th order weights (also row 7 of the tableau)
        inline constexpr double b1 = 35.0/384.0, b3 = 500.0/1113.0, b4 = 125.0/192.0, b5 = -2187.0/6784.0, b6 = 11.0/84.0;

        // // 5th minus 4th order weights -> local error estimate
        inline constexpr double e1 = 35.0/384.0 - 5179.0/57600.0;
        inline constexpr double e3 = 500.0/1113.0 - 7571.0/16695.0;
        inline constexpr double e4 = 125.0/192.0 - 393.0/640.0;
        inline constexpr double e5 = -2187.0/6784.0 + 92097.0/339200.0;
        inline constexpr double e6 = 11.0/84.0 - 187.0/2100.0;
        inline constexpr double e7 = -1.0/40.0;
    } // namespace dp45

    // // Embedded error control inside one fixed outer step. Each step() starts with h = dt and
    // // shrinks/grows substeps until t + dt is reached, so the result only depends on (t, dt, x)
    class DormandPrince45 final : public IStepIntegrator{
        public:
            DormandPrince45() = default;
            explicit DormandPrince45(const Dopri45Options& opt) noexcept : opt_(opt) {}

            [[nodiscard]] Status init(std::size_t n, MemoryArena& arena) noexcept override{
                n_ = 0;
                if (!valid(opt_)) return Status::kInvalidArg;
                Scalar* bufs[9]{};
                Status st = detail::carve(arena, n, bufs, 9);
                if (st != Status::kOK) return st;
                for (std::size_t i=0; i<7; ++i) k_[i] = bufs[i];
                tmp_ = bufs[7];
                y_new_ = bufs[8];
                n_ = n;
                return Status::kOK;
            }

            [[nodiscard]] Status step(const OdeRhs& f, Scalar t, Scalar dt, std::span<Scalar> x) noexcept override{
                Status st = detail::check_step(n_ != 0, n_, f, dt, x);
                if (st != Status::kOK) return st;

                last_substeps_ = 0;
                last_rejects_ = 0;

                const Scalar t_end = t + dt;
                Scalar t_cur = t;
                Scalar h = dt;

                while (true){
                    bool last = false;
                    // // never leave a sliver shorter than min_step for the next substep
                    if (h >= t_end - t_cur - opt_.min_step){
                        h = t_end - t_cur;
                        last = true;
                    }
                    if (h < opt_.min_step) return Status::kIntegratorFailure;
                    if (last_substeps_ >= opt_.max_substeps) return Status::kIntegratorFailure;
                    ++last_substeps_;

                    Scalar err = 0;
                    st = attempt(f, t_cur, h, x, err);
                    if (st != Status::kOK) return st;

                    if (!is_finite(err)){
                        // // blown up stage -> cut hard and retry
                        ++last_rejects_;
                        h *= Scalar(0.2);
                        continue;
                    }

                    if (err <= Scalar(1)){
                        for (std::size_t i=0; i<n_; ++i) x[i] = y_new_[i];
                        if (last) break;
                        t_cur += h;
                        const Scalar grow = (err < Scalar(1e-10))
                            ? Scalar(5)
                            : std::min(Scalar(5), opt_.safety * static_cast<Scalar>(std::pow(err, Scalar(-0.2))));
                        h *= grow;
                    }
                    else{
                        ++last_rejects_;
                        h *= std::max(Scalar(0.2), opt_.safety * static_cast<Scalar>(std::pow(err, Scalar(-0.25))));
                    }
                }
                return Status::kOK;
            }

            std::size_t dim() const noexcept override{ return n_; }
            const char* name() const noexcept override{ return "dopri45"; }
            int order() const noexcept override{ return 5; }

            const Dopri45Options& options() const noexcept{ return opt_; }

            // // diagnostics of the most recent step()
            std::uint32_t last_substeps() const noexcept{ return last_substeps_; }
            std::uint32_t last_rejects() const noexcept{ return last_rejects_; }

        private:
            // // one trial substep of size h from (t, x): fills y_new_ and the max-norm of the scaled error
            Status attempt(const OdeRhs& f, Scalar t, Scalar h, std::span<const Scalar> x, Scalar& err) noexcept{
                using namespace dp45;
                const std::span<const Scalar> tmp(tmp_, n_);
                Scalar* k1 = k_[0]; Scalar* k2 = k_[1]; Scalar* k3 = k_[2]; Scalar* k4 = k_[3];
                Scalar* k5 = k_[4]; Scalar* k6 = k_[5]; Scalar* k7 = k_[6];
                Status st;

                st = f(t, x, {k1, n_});
                if (st != Status::kOK) return st;

                for (std::size_t i=0; i<n_; ++i) tmp_[i] = x[i] + h * Scalar(a21 * k1[i]);
                st = f(t + Scalar(c2) * h, tmp, {k2, n_});
                if (st != Status::kOK) return st;

                for (std::size_t i=0; i<n_; ++i) tmp_[i] = x[i] + h * Scalar(a31 * k1[i] + a32 * k2[i]);
                st = f(t + Scalar(c3) * h, tmp, {k3, n_});
                if (st != Status::kOK) return st;

                for (std::size_t i=0; i<n_; ++i) tmp_[i] = x[i] + h * Scalar(a41 * k1[i] + a42 * k2[i] + a43 * k3[i]);
                st = f(t + Scalar(c4) * h, tmp, {k4, n_});
                if (st != Status::kOK) return st;

                for (std::size_t i=0; i<n_; ++i){
                    tmp_[i] = x[i] + h * Scalar(a51 * k1[i] + a52 * k2[i] + a53 * k3[i] + a54 * k4[i]);
                }
                st = f(t + Scalar(c5) * h, tmp, {k5, n_});
                if (st != Status::kOK) return st;

                for (std::size_t i=0; i<n_; ++i){
                    tmp_[i] = x[i] + h * Scalar(a61 * k1[i] + a62 * k2[i] + a63 * k3[i] + a64 * k4[i] + a65 * k5[i]);
                }
                st = f(t + h, tmp, {k6, n_});
                if (st != Status::kOK) return st;

                for (std::size_t i=0; i<n_; ++i){
                    y_new_[i] = x[i] + h * Scalar(b1 * k1[i] + b3 * k3[i] + b4 * k4[i] + b5 * k5[i] + b6 * k6[i]);
                }
                st = f(t + h, {y_new_, n_}, {k7, n_});
                if (st != Status::kOK) return st;

                Scalar err_max = 0;
                for (std::size_t i=0; i<n_; ++i){
                    const Scalar err_i = std::abs(h * Scalar(e1 * k1[i] + e3 * k3[i] + e4 * k4[i]
                                                          + e5 * k5[i] + e6 * k6[i] + e7 * k7[i]));
                    const Scalar scale = opt_.atol + opt_.rtol * std::max(std::abs(x[i]), std::abs(y_new_[i]));
                    const Scalar r = err_i / scale;
                    // // NaN must win the max
                    if (!is_finite(r)){
                        err_max = r;
                        break;
                    }
                    err_max = std::max(err_max, r);
                }
                err = err_max;
                return Status::kOK;
            }

            Dopri45Options opt_{};
            std::size_t n_{0};
            Scalar* k_[7]{};
            Scalar* tmp_{nullptr};
            Scalar* y_new_{nullptr};
            std::uint32_t last_substeps_{0};
            std::uint32_t last_rejects_{0};
    };

} // namespace mrac::integrators
