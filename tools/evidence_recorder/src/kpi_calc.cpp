#include <cmath>
#include <algorithm>

#include "kpi_calc.hpp"

namespace mrac::tools::detail{
    void KpiAcc::on_tick(double t_s, double dt_s, double yr, double y, double u, bool degenerate) noexcept{
        const double e = std::abs(yr - y);

        // // left rectangle: e sampled at tick start holds over [t, t+dt]
        if (std::isfinite(e)){
            iae += e * dt_s;
            itae += t_s * e * dt_s;
            max_abs_e = std::max(max_abs_e, e);
        }

        if (have_u && std::isfinite(u)) tvu += std::abs(u - last_u);
        last_u = u;
        have_u = true;

        ++ticks;
        if (degenerate) ++degenerate_ticks;
    }

    void KpiAcc::reset() noexcept{
        iae = itae = tvu = max_abs_e = 0.0;
        last_u = 0.0;
        have_u = false;
        ticks = 0;
        degenerate_ticks = 0;
    }
} // namespace mrac::tools::detail
