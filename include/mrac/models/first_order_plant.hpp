#pragma once

#include <span>

#include "mrac/core/plant.hpp"

namespace mrac::models{

    struct FirstOrderPlantParams{
        Scalar a{0};
        Scalar b{0};
        Scalar d{0};
    };

    // // dy/dt = -a * y + b * u + d; pairs with basis::identity
    class FirstOrderPlant final : public IPlant{
        public:
            FirstOrderPlant() = default;
            explicit FirstOrderPlant(const FirstOrderPlantParams& p) noexcept : p_(p) {}

            std::size_t dim() const noexcept override{
                return 1;
            }

            [[nodiscard]] Status rhs(Scalar /*t*/, std::span<const Scalar> x, Scalar u, std::span<Scalar> dx) noexcept override{
                if (x.size() != 1 || dx.size() != 1) return Status::kInvalidArg;
                dx[0] = -p_.a * x[0] + p_.b * u + p_.d;
                return Status::kOK;
            }

            const FirstOrderPlantParams& params() const noexcept{ return p_; }

        private:
            FirstOrderPlantParams p_{};
    };

} // namespace mrac::models
