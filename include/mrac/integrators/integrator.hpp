#pragma once

#include <span>
#include <cstddef>

#include "mrac/core/types.hpp"
#include "mrac/core/status.hpp"
#include "mrac/core/memory_arena.hpp"

namespace mrac::integrators{

    // //                 dx = f(t, x); user = whatever the caller bound (plant + held u, reference model, ...)
    using RhsFn = Status(*)(Scalar t, std::span<const Scalar> x, std::span<Scalar> dx, void* user) noexcept;

    // // Right hand side as seen by an integrator: function pointer + cookie, no std::function on the tick path
    struct OdeRhs{
        RhsFn fn{nullptr};
        void* user{nullptr};

        [[nodiscard]] Status operator()(Scalar t, std::span<const Scalar> x, std::span<Scalar> dx) const noexcept{
            return fn(t, x, dx, user);
        }

        bool valid() const noexcept{
            return fn != nullptr;
        }
    };

    // // Single step integrator: advances x in place over [t, t+dt], keeps x.size()
    // // A non-kOK status from the rhs is returned unchanged and x is left in an unspecified state
    class IStepIntegrator{
        public:
            virtual ~IStepIntegrator() = default;

            // // carve stage scratch for an n dimensional state out of the arena
            [[nodiscard]] virtual Status init(std::size_t n, MemoryArena& arena) noexcept = 0;

            [[nodiscard]] virtual Status step(const OdeRhs& f, Scalar t, Scalar dt, std::span<Scalar> x) noexcept = 0;

            virtual std::size_t dim() const noexcept = 0;
            virtual const char* name() const noexcept = 0;
            virtual int order() const noexcept = 0;
    };

    namespace detail{
        // // carve `count` scratch vectors of length n; all or nothing
        inline Status carve(MemoryArena& arena, std::size_t n, Scalar** bufs, std::size_t count) noexcept{
            if (n == 0) return Status::kInvalidArg;
            for (std::size_t i=0; i<count; ++i){
                bufs[i] = arena.allocate_array<Scalar>(n);
                if (!bufs[i]) return Status::kNoMem;
            }
            return Status::kOK;
        }

        // // shared entry guard for step()
        inline Status check_step(bool ready, std::size_t n, const OdeRhs& f, Scalar dt, std::span<Scalar> x) noexcept{
            if (!ready) return Status::kNotReady;
            if (!f.valid() || x.size() != n) return Status::kInvalidArg;
            if (!(dt > Scalar(0)) || !is_finite(dt)) return Status::kInvalidArg;
            return Status::kOK;
        }
    } // namespace detail

} // namespace mrac::integrators
