#include <chrono> // to measure time
#include <vector>
#include <cstdio>
#include <cstdlib>
#include <algorithm>
#include <cassert>
#include <cstring>

#include "mrac/all.hpp"

// platform specific includes
#if defined(_WIN32)
    #include <windows.h>
#elif defined(__linux__)
    #include <pthread.h>
    #include <sched.h>
    #include <unistd.h>
    #include <sys/mman.h>
#endif

using namespace mrac;
using namespace mrac::adaptive;

/*
On Linux: forces this thread to run only on CPU core 0
On Windows: same idea with SetThreadAffinityMask
Aim: To reduce jitter from OS Scheduling (thread hops cores, caches flush -> noisy timings)
*/
// CPU pinning (best effort)
static void pin_thread_best_effort(){
#if defined(__linux__)
    cpu_set_t set;
    CPU_ZERO(&set);
    CPU_SET(0, &set);
    pthread_setaffinity_np(pthread_self(), sizeof(set), &set);
#elif defined(_WIN32)
    SetThreadAffinityMask(GetCurrentThread(), 1);
#endif
}

// // Latency percentiles + min/max
struct Stats {
    double p50, p95, p99, p999, jmin, jmax;
};

// // sort timing
static Stats summarize(std::vector<double>& ns){
    std::sort(ns.begin(), ns.end());
    const std::size_t n = ns.size();
    assert(n > 0);

    auto q = [&](double p) -> double {
        const double pos = p * static_cast<double>(n - 1u);
        return ns[static_cast<std::size_t>(pos)];
    };

    return {q(0.50), q(0.95), q(0.99), q(0.999), ns.front(), ns.back()};
}

int main(int argc, char** argv){
    // Defaults
    int iters = 20000;
    const char* integ_name = "rk4";
    bool opt_no_header = false;

    if (argc > 1) iters = std::atoi(argv[1]);
    if (argc > 2) integ_name = argv[2];
    for (int i = 3; i < argc; ++i){
        if (std::strcmp(argv[i], "--no-header") == 0) opt_no_header = true;
    }
    if (iters <= 0) return 2;

    integrators::ForwardEuler euler;
    integrators::RK4 rk4;
    integrators::DormandPrince45 dopri;
    integrators::IStepIntegrator* integ = &rk4;
    if (!std::strcmp(integ_name, "euler")) integ = &euler;
    else if (!std::strcmp(integ_name, "dopri45")) integ = &dopri;
    else if (std::strcmp(integ_name, "rk4") != 0) return 2;

    pin_thread_best_effort();

    constexpr int BATCH = 64; // amortize timer cost
    constexpr int WARMUP = 10000;

    MracConfig cfg{};
    cfg.a_hat0 = 0.1;
    cfg.b_hat0 = 0.5;
    cfg.gamma_a = 0.1;
    cfg.gamma_b = 0.2;
    cfg.k_r = 1.5;
    cfg.dt = 0.001;
    cfg.ar = 3.0;
    cfg.br = 3.0;
    // // long horizon: the dt-scaled form stays bounded for the whole measurement
    cfg.adaptation = AdaptationMode::kGradientFlow;
    // // enough ticks for warmup + every batch
    cfg.horizon = cfg.dt * (static_cast<double>(WARMUP) + static_cast<double>(iters) * BATCH + 1.0);

    models::CubicPlant plant({1.5, 2.0, 0.5});
    signals::Sine sine{};

    alignas(64) std::byte buf[4096];
    MemoryArena arena(buf, sizeof(buf));
    AdaptiveLoopScheduler loop;

    if (loop.init(Dims{.ny = 1, .nu = 1, .nx = 1}, arena) != Status::kOK) return 3;
    if (loop.configure(cfg, plant, *integ, sine.signal(), basis::cubic()) != Status::kOK) return 3;

    const Scalar y0[1]{0.1};
    const Scalar yr0[1]{0.0};
    if (loop.start(y0, yr0) != Status::kOK) return 4;

#if defined(__linux__)
    mlockall(MCL_CURRENT | MCL_FUTURE);
#endif

    // warmup caches, branch predictors, memory, first calls are noisy
    for (int k = 0; k < WARMUP; ++k){
        if (loop.step() != Status::kOK) return 5;
    }

    using clk = std::chrono::steady_clock;
    bool failed = false;

    auto run_loop = [&](bool do_tick) {
        std::vector<double> ns(static_cast<std::size_t>(iters));
        for (int k = 0; k < iters; ++k) {
            auto t0 = clk::now();
            for (int j = 0; j < BATCH; ++j){
                if (do_tick && loop.step() != Status::kOK) failed = true;
            }
            auto t1 = clk::now();
            ns[static_cast<std::size_t>(k)] =
                std::chrono::duration<double, std::nano>(t1 - t0).count() / static_cast<double>(BATCH);
        }
        return summarize(ns);
    };

    auto S_null = run_loop(false);
    auto S_tick = run_loop(true);
    if (failed){
        std::fprintf(stderr, "bench_mrac_tick: loop stopped: %s at tick %llu\n",
                     to_string(loop.fault().status), static_cast<unsigned long long>(loop.fault().tick));
        return 6;
    }

    Stats S_net{
        S_tick.p50 - S_null.p50,
        S_tick.p95 - S_null.p95,
        S_tick.p99 - S_null.p99,
        S_tick.p999 - S_null.p999,
        S_tick.jmin - S_null.jmin,
        S_tick.jmax - S_null.jmax
    };

    if (!opt_no_header){
        std::puts("label, integrator, dt_ns, iters, p50, p95, p99, p999, jmin, jmax");
    }

    auto report = [&](const Stats& S, const char* label){
        std::printf("%s, %s, %lld, %d, %.3f, %.3f, %.3f, %.3f, %.3f, %.3f\n",
                    label, integ->name(), static_cast<long long>(loop.clock().dt), iters,
                    S.p50, S.p95, S.p99, S.p999, S.jmin, S.jmax);
    };

    report(S_null, "null");
    report(S_tick, "tick");
    report(S_net,  "net");

    return 0;
}
