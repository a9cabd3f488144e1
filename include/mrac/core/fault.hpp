#pragma once
#include <cstddef>
#include <cstdint>

#include "mrac/core/time.hpp"
#include "mrac/core/types.hpp"
#include "mrac/core/status.hpp"

namespace mrac{
    // // Which quantity stopped the run
    enum class FaultSource : std::uint8_t{
        kNone = 0,
        kControl,          // u came out non-finite
        kEstimate,         // a_hat (index 0) or b_hat (index 1) non-finite after adaptation
        kPlantState,       // plant state non-finite after the plant step
        kReferenceState,   // reference state non-finite after the reference step
        kPlantStep,        // integrator or plant collaborator failed during the plant step
        kReferenceStep,    // integrator failed during the reference step
        kCancelled,        // cancel request observed at a tick boundary
    };

    inline constexpr const char* to_string(FaultSource s) noexcept{
        switch (s){
            case FaultSource::kNone:           return "none";
            case FaultSource::kControl:        return "control";
            case FaultSource::kEstimate:       return "estimate";
            case FaultSource::kPlantState:     return "plant_state";
            case FaultSource::kReferenceState: return "reference_state";
            case FaultSource::kPlantStep:      return "plant_step";
            case FaultSource::kReferenceStep:  return "reference_step";
            case FaultSource::kCancelled:      return "cancelled";
        }
        return "unknown";
    }

    // // Terminal failure report: the tick that failed and the offending value
    struct Fault{
        Status status{Status::kOK};
        FaultSource source{FaultSource::kNone};
        std::uint64_t tick{0};    // index of the tick that failed (0-based)
        t_ns t{0};                // tick start time
        std::size_t index{0};     // component of the offending vector
        Scalar value{0};          // offending value (NaN/inf for divergence)

        bool active() const noexcept{
            return source != FaultSource::kNone;
        }
    };

} // namespace mrac
