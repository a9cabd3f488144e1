#pragma once

#include <span>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <cstddef>

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
#include "mrac/adaptive/estimate.hpp"
#include "mrac/adaptive/mrac_config.hpp"
#include "mrac/adaptive/control_law.hpp"
#include "mrac/adaptive/adaptation_law.hpp"
#include "mrac/adaptive/reference_model.hpp"

namespace mrac::adaptive{

    // //  Optional callbacks: default none
    struct Hooks{
        TickSink on_tick{nullptr};
        void* user{nullptr};
        LoggerSink* logger{nullptr};
    };

    // // Fixed step MRAC loop. Per tick, in this order and never otherwise:
    // //   control (tick start estimate) -> adaptation (same u) -> plant step (u held) -> reference step -> clock -> record
    // // Lifecycle: init -> configure -> start -> step/run -> stop/reset
    class AdaptiveLoopScheduler{
        public:
            AdaptiveLoopScheduler() = default;
            AdaptiveLoopScheduler(const AdaptiveLoopScheduler&) = delete;
            AdaptiveLoopScheduler& operator=(const AdaptiveLoopScheduler&) = delete;

            // // SISO only: ny == nu == 1; nx is the plant (and reference) state dimension
            [[nodiscard]] Status init(const Dims& dims, MemoryArena& arena, const Hooks& hooks = {}) noexcept{
                initialized_ = configured_ = started_ = halted_ = false;

                if (dims.ny != 1 || dims.nu != 1 || dims.nx == 0) return Status::kInvalidArg;

                dims_ = dims;
                hooks_ = hooks;
                arena_ = &arena;

                // // plant state, reference state + their start() snapshots for reset()
                x_   = arena.allocate_array<Scalar>(dims.nx);
                yr_  = arena.allocate_array<Scalar>(dims.nx);
                x0_  = arena.allocate_array<Scalar>(dims.nx);
                yr0_ = arena.allocate_array<Scalar>(dims.nx);
                if (!x_ || !yr_ || !x0_ || !yr0_) return Status::kNoMem;

                scratch_begin_ = scratch_end_ = arena.used();
                initialized_ = true;
                return Status::kOK;
            }

            // // Validates everything before the run can start; integrator scratch is carved here.
            // // Reconfiguring reuses the scratch region of the previous configure() when it is still the
            // // arena's tail; if the caller carved from the arena in between, fresh scratch is carved after it
            [[nodiscard]] Status configure(
                const MracConfig& cfg,
                IPlant& plant,
                integrators::IStepIntegrator& integrator,
                ReferenceSignal r,
                Basis basis) noexcept{

                    configured_ = started_ = halted_ = false;
                    if (!initialized_) return Status::kNotReady;

                    const char* why = nullptr;
                    if (validate(cfg, &why) != Status::kOK){
                        log_fmt(hooks_.logger, LogLevel::kError, 0, "config rejected: %s", why ? why : "?");
                        return Status::kInvalidArg;
                    }
                    if (!r.valid() || !basis.valid()){
                        log_fmt(hooks_.logger, LogLevel::kError, 0, "config rejected: %s", r.valid() ? "basis" : "reference signal");
                        return Status::kInvalidArg;
                    }
                    if (plant.dim() != dims_.nx){
                        log_fmt(hooks_.logger, LogLevel::kError, 0, "config rejected: plant dim %zu != nx %zu", plant.dim(), dims_.nx);
                        return Status::kInvalidArg;
                    }

                    Status st = ref_.configure(reference_model_config(cfg), r);
                    if (st != Status::kOK) return st;
                    st = law_.configure(control_law_config(cfg, basis, r));
                    if (st != Status::kOK) return st;
                    st = adapt_.configure(adaptation_config(cfg));
                    if (st != Status::kOK) return st;

                    // // scratch always comes from this loop's arena, never from a previous owner's
                    if (arena_->used() == scratch_end_) arena_->rewind(scratch_begin_);
                    else scratch_begin_ = arena_->used();
                    st = integrator.init(dims_.nx, *arena_);
                    scratch_end_ = arena_->used();
                    if (st != Status::kOK){
                        log_fmt(hooks_.logger, LogLevel::kError, 0, "integrator %s init failed: %s", integrator.name(), to_string(st));
                        return st;
                    }

                    cfg_ = cfg;
                    plant_ = &plant;
                    integrator_ = &integrator;
                    clock_.dt = from_seconds(cfg.dt);
                    clock_.rewind();
                    total_ticks_ = tick_count(cfg);

                    configured_ = true;
                    return Status::kOK;
            }

            // // Swap in another law (tests, experiments); nullptr restores the built-in one. Not owned
            void set_control_law(const IControlLaw* law) noexcept{
                control_override_ = law;
            }

            void set_adaptation_law(IAdaptationLaw* law) noexcept{
                adapt_override_ = law;
            }

            // // arms the loop with initial plant and reference states, estimates from config
            [[nodiscard]] Status start(std::span<const Scalar> y0, std::span<const Scalar> yr0) noexcept{
                if (!configured_) return Status::kNotReady;
                if (y0.size() != dims_.nx || yr0.size() != dims_.nx) return Status::kInvalidArg;
                if (first_non_finite(y0) != y0.size() || first_non_finite(yr0) != yr0.size()) return Status::kInvalidArg;

                for (std::size_t i=0; i<dims_.nx; ++i){
                    x0_[i] = y0[i];
                    yr0_[i] = yr0[i];
                }
                rewind_();
                started_ = true;

                log_fmt(hooks_.logger, LogLevel::kInfo, 0, "run start: %llu ticks, dt=%g s, integrator=%s",
                     static_cast<unsigned long long>(total_ticks_), static_cast<double>(cfg_.dt), integrator_->name());
                return Status::kOK;
            }

            // // One tick. kPreconditionFail once the horizon is reached, kNotReady before start() or after a fault
            [[nodiscard]] Status step() noexcept{
                if (!started_ || halted_) return Status::kNotReady;
                if (clock_.tick >= total_ticks_) return Status::kPreconditionFail;

                const t_ns tn = clock_.now();
                const Scalar t = to_seconds(tn);
                const Scalar dt = clock_.dt_seconds();
                const std::span<Scalar> x(x_, dims_.nx);
                const std::span<Scalar> yr(yr_, dims_.nx);

                // // 0- cancellation is only honoured between ticks; the request is consumed here
                if (cancel_.exchange(false, std::memory_order_acq_rel)){
                    ++kpi_.cancellations;
                    return fail_(Status::kCancelled, FaultSource::kCancelled, tn, 0, Scalar(0));
                }

                // // tick start snapshot; everything below is computed from these
                const Scalar y_k = x_[0];
                const Scalar yr_k = yr_[0];
                const Scalar e = yr_k - y_k;

                // // 1- control from the estimate as it stands at tick start
                const IControlLaw& law = control_override_ ? *control_override_ : static_cast<const IControlLaw&>(law_);
                const ControlOutput co = law.compute(t, y_k, est_);
                if (!is_finite(co.u)) return fail_(Status::kNumericDivergence, FaultSource::kControl, tn, 0, co.u);

                // // 2- adaptation with that same u
                IAdaptationLaw& adapt = adapt_override_ ? *adapt_override_ : static_cast<IAdaptationLaw&>(adapt_);
                adapt.update(est_, AdaptationInput{e, co.phi, co.u});
                const std::size_t bad_est = non_finite_component(est_);
                if (bad_est < 2){
                    return fail_(Status::kNumericDivergence, FaultSource::kEstimate, tn, bad_est,
                                 bad_est == 0 ? est_.a_hat : est_.b_hat);
                }

                // // 3- plant over [t, t+dt] with u held (zero order hold)
                PlantDrive drive{plant_, co.u};
                Status st = integrator_->step({&PlantDrive::thunk, &drive}, t, dt, x);
                if (st != Status::kOK) return fail_(st, FaultSource::kPlantStep, tn, 0, Scalar(0));
                const std::size_t bad_x = first_non_finite(x);
                if (bad_x < x.size()) return fail_(Status::kNumericDivergence, FaultSource::kPlantState, tn, bad_x, x[bad_x]);

                // // 4- reference model through the same integrator
                st = integrator_->step(ref_.rhs(), t, dt, yr);
                if (st != Status::kOK) return fail_(st, FaultSource::kReferenceStep, tn, 0, Scalar(0));
                const std::size_t bad_r = first_non_finite(yr);
                if (bad_r < yr.size()) return fail_(Status::kNumericDivergence, FaultSource::kReferenceState, tn, bad_r, yr[bad_r]);

                // // 5- clock
                const std::uint64_t k = clock_.tick;
                clock_.advance();

                track_health_(k, tn, e, co.degenerate);
                ++kpi_.updates;
                if (co.degenerate) ++kpi_.degenerate_ticks;

                // // 6- record
                if (hooks_.on_tick){
                    TickRecord rec{};
                    rec.tick = k;
                    rec.time_ns = tn;
                    rec.t = t;
                    rec.y = y_k;
                    rec.yr = yr_k;
                    rec.u = co.u;
                    rec.a_hat = est_.a_hat;
                    rec.b_hat = est_.b_hat;
                    rec.degenerate = co.degenerate;
                    hooks_.on_tick(rec, hooks_.user);
                }
                return Status::kOK;
            }

            // // Runs the remaining ticks up to the horizon
            [[nodiscard]] Expected<RunSummary> run() noexcept{
                if (!started_ || halted_) return Expected<RunSummary>::failure(Status::kNotReady);

                while (clock_.tick < total_ticks_){
                    const Status st = step();
                    if (st != Status::kOK) return Expected<RunSummary>::failure(st);
                }

                log_fmt(hooks_.logger, LogLevel::kInfo, clock_.now(), "run complete: %llu ticks, |yr-y|=%g, a_hat=%g, b_hat=%g",
                     static_cast<unsigned long long>(clock_.tick),
                     static_cast<double>(std::abs(yr_[0] - x_[0])),
                     static_cast<double>(est_.a_hat), static_cast<double>(est_.b_hat));
                return Expected<RunSummary>::success(summary());
            }

            [[nodiscard]] Status stop() noexcept{
                started_ = false;
                return Status::kOK;
            }

            // // back to the start() states and configured estimates; arena untouched
            [[nodiscard]] Status reset() noexcept{
                if (!configured_) return Status::kNotReady;
                rewind_();
                return Status::kOK;
            }

            // // thread safe; observed at the next tick boundary, including tick 0.
            // // A pending request survives start() and reset() until a step() consumes it
            void request_cancel() noexcept{
                cancel_.store(true, std::memory_order_release);
            }

            RunSummary summary() const noexcept{
                RunSummary s{};
                s.ticks = clock_.tick;
                s.t_final = clock_.seconds();
                s.y_final = x_ ? x_[0] : Scalar(0);
                s.yr_final = yr_ ? yr_[0] : Scalar(0);
                s.a_hat = est_.a_hat;
                s.b_hat = est_.b_hat;
                s.health = health_;
                return s;
            }

            const ParameterEstimate& estimate() const noexcept{ return est_; }
            std::span<const Scalar> plant_state() const noexcept{ return {x_, x_ ? dims_.nx : 0}; }
            std::span<const Scalar> reference_state() const noexcept{ return {yr_, yr_ ? dims_.nx : 0}; }
            const LoopHealth& health() const noexcept{ return health_; }
            const KpiCounters& kpi() const noexcept{ return kpi_; }
            const Fault& fault() const noexcept{ return fault_; }
            const SimulationClock& clock() const noexcept{ return clock_; }
            const MracConfig& config() const noexcept{ return cfg_; }
            std::uint64_t total_ticks() const noexcept{ return total_ticks_; }
            bool finished() const noexcept{ return started_ && !halted_ && clock_.tick >= total_ticks_; }
            bool halted() const noexcept{ return halted_; }

        private:
            // // binds the plant and the held u into an integrator rhs
            struct PlantDrive{
                IPlant* plant;
                Scalar u;

                static Status thunk(Scalar t, std::span<const Scalar> x, std::span<Scalar> dx, void* user) noexcept{
                    auto* d = static_cast<PlantDrive*>(user);
                    return d->plant->rhs(t, x, d->u, dx);
                }
            };

            void rewind_() noexcept{
                for (std::size_t i=0; i<dims_.nx; ++i){
                    x_[i] = x0_[i];
                    yr_[i] = yr0_[i];
                }
                est_ = ParameterEstimate{cfg_.a_hat0, cfg_.b_hat0};
                clock_.rewind();
                health_.clear();
                fault_ = Fault{};
                halted_ = false;
                degenerate_since_ = 0;
            }

            void track_health_(std::uint64_t k, t_ns tn, Scalar e, bool degenerate) noexcept{
                const Scalar abs_e = std::abs(e);
                ++health_.ticks;
                health_.last_abs_error = abs_e;
                if (abs_e > health_.max_abs_error) health_.max_abs_error = abs_e;

                if (degenerate){
                    ++health_.degenerate_ticks;
                    if (!health_.degenerate_active){
                        degenerate_since_ = k;
                        log_fmt(hooks_.logger, LogLevel::kWarn, tn, "degenerate control at tick %llu: |b_hat| < %g, u forced to 0",
                             static_cast<unsigned long long>(k), static_cast<double>(cfg_.epsilon));
                    }
                }
                else if (health_.degenerate_active){
                    log_fmt(hooks_.logger, LogLevel::kWarn, tn, "degenerate control cleared at tick %llu after %llu ticks",
                         static_cast<unsigned long long>(k), static_cast<unsigned long long>(k - degenerate_since_));
                }
                health_.degenerate_active = degenerate;
            }

            // // terminal: records the fault, halts the loop, reports
            Status fail_(Status st, FaultSource src, t_ns tn, std::size_t index, Scalar value) noexcept{
                fault_.status = st;
                fault_.source = src;
                fault_.tick = clock_.tick;
                fault_.t = tn;
                fault_.index = index;
                fault_.value = value;
                halted_ = true;
                if (st != Status::kCancelled) ++kpi_.divergences;

                log_fmt(hooks_.logger, LogLevel::kError, tn, "run aborted at tick %llu: %s in %s[%zu] (value=%g)",
                     static_cast<unsigned long long>(fault_.tick), to_string(st), to_string(src), index,
                     static_cast<double>(value));
                return st;
            }

            Dims dims_{};
            Hooks hooks_{};
            MemoryArena* arena_{nullptr};
            MracConfig cfg_{};

            IPlant* plant_{nullptr};
            integrators::IStepIntegrator* integrator_{nullptr};
            ReferenceModel ref_{};
            FeedbackLinearizingLaw law_{};
            GradientAdaptationLaw adapt_{};
            const IControlLaw* control_override_{nullptr};
            IAdaptationLaw* adapt_override_{nullptr};

            // // per run state; buffers live in the arena
            Scalar* x_{nullptr};
            Scalar* yr_{nullptr};
            Scalar* x0_{nullptr};
            Scalar* yr0_{nullptr};
            std::size_t scratch_begin_{0};
            std::size_t scratch_end_{0};
            ParameterEstimate est_{};
            SimulationClock clock_{};
            std::uint64_t total_ticks_{0};

            LoopHealth health_{};
            KpiCounters kpi_{};
            Fault fault_{};
            std::uint64_t degenerate_since_{0};

            bool initialized_{false};
            bool configured_{false};
            bool started_{false};
            bool halted_{false};
            std::atomic<bool> cancel_{false};
    };

} // namespace mrac::adaptive
