#pragma once

#include <span>

#include "mrac/core/plant.hpp"

namespace mrac::models{

    struct CubicPlantParams{
        Scalar a{0};   // cubic damping
        Scalar b{0};   // input gain
        Scalar d{0};   // constant disturbance
    };

    // // dy/dt = -a * y^3 + b * u + d; scalar state
    class CubicPlant final : public IPlant{
        public:
            CubicPlant() = default;
            explicit CubicPlant(const CubicPlantParams& p) noexcept : p_(p) {}

            std::size_t dim() const noexcept override{
                return 1;
            }

            [[nodiscard]] Status rhs(Scalar /*t*/, std::span<const Scalar> x, Scalar u, std::span<Scalar> dx) noexcept override{
                if (x.size() != 1 || dx.size() != 1) return Status::kInvalidArg;
                const Scalar y = x[0];
                dx[0] = -p_.a * y * y * y + p_.b * u + p_.d;
                return Status::kOK;
            }

            const CubicPlantParams& params() const noexcept{ return p_; }

        private:
            CubicPlantParams p_{};
    };

} // namespace mrac::models
