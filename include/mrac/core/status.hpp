#pragma once

#include <cstdint>

namespace mrac{
    enum class Status : std::uint8_t{
        kOK = 0,
        kInvalidArg,         // configuration rejected before the run
        kPreconditionFail,   // call made outside its valid window (eg: stepping past the horizon)
        kNotReady,           // lifecycle: not started, or halted by a terminal fault
        kNoMem,              // arena exhausted
        kNumericDivergence,  // non-finite control, estimate or state
        kIntegratorFailure,  // step integrator could not converge over [t, t+dt]
        kCancelled,          // run stopped at a tick boundary on request
    };

    inline constexpr const char* to_string(Status s) noexcept{
        switch (s){
            case Status::kOK:                return "ok";
            case Status::kInvalidArg:        return "invalid_arg";
            case Status::kPreconditionFail:  return "precondition_fail";
            case Status::kNotReady:          return "not_ready";
            case Status::kNoMem:             return "no_mem";
            case Status::kNumericDivergence: return "numeric_divergence";
            case Status::kIntegratorFailure: return "integrator_failure";
            case Status::kCancelled:         return "cancelled";
        }
        return "unknown";
    }

} // namespace mrac
