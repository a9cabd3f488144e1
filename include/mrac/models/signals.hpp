#pragma once

#include <cmath>

#include "mrac/core/signal.hpp"

// // Built in reference signals. Each object must outlive the ReferenceSignal bound to it
namespace mrac::signals{

    struct Constant{
        Scalar value{0};

        static Scalar eval(Scalar /*t*/, const void* user) noexcept{
            return static_cast<const Constant*>(user)->value;
        }

        ReferenceSignal signal() const noexcept{
            return {&Constant::eval, this};
        }
    };

    // // before for t < t0, after from t0 on
    struct Step{
        Scalar t0{0};
        Scalar before{0};
        Scalar after{1};

        static Scalar eval(Scalar t, const void* user) noexcept{
            const auto* s = static_cast<const Step*>(user);
            return (t < s->t0) ? s->before : s->after;
        }

        ReferenceSignal signal() const noexcept{
            return {&Step::eval, this};
        }
    };

    // // offset + amplitude * sin(omega * t + phase); defaults give sin(t)
    struct Sine{
        Scalar amplitude{1};
        Scalar omega{1};
        Scalar phase{0};
        Scalar offset{0};

        static Scalar eval(Scalar t, const void* user) noexcept{
            const auto* s = static_cast<const Sine*>(user);
            return s->offset + s->amplitude * std::sin(s->omega * t + s->phase);
        }

        ReferenceSignal signal() const noexcept{
            return {&Sine::eval, this};
        }
    };

} // namespace mrac::signals
