#pragma once

#include "mrac/version.hpp"
#include "mrac/visibility.hpp"
#include "mrac/core/config.hpp"
#include "mrac/core/types.hpp"
#include "mrac/core/time.hpp"
#include "mrac/core/status.hpp"
#include "mrac/core/expected.hpp"
#include "mrac/core/memory_arena.hpp"
#include "mrac/core/signal.hpp"
#include "mrac/core/plant.hpp"
#include "mrac/core/clock.hpp"
#include "mrac/core/fault.hpp"
#include "mrac/core/health.hpp"
#include "mrac/core/result.hpp"
#include "mrac/io/kpi.hpp"
#include "mrac/io/logger.hpp"
#include "mrac/integrators/integrator.hpp"
#include "mrac/integrators/euler.hpp"
#include "mrac/integrators/rk4.hpp"
#include "mrac/integrators/dopri45.hpp"
#include "mrac/adaptive/estimate.hpp"
#include "mrac/adaptive/reference_model.hpp"
#include "mrac/adaptive/control_law.hpp"
#include "mrac/adaptive/adaptation_law.hpp"
#include "mrac/adaptive/mrac_config.hpp"
#include "mrac/adaptive/adaptive_loop.hpp"
#include "mrac/models/cubic_plant.hpp"
#include "mrac/models/first_order_plant.hpp"
#include "mrac/models/signals.hpp"
#include "mrac/models/basis.hpp"
