#include <cmath>
#include <algorithm>
#include <functional>
#include <vector>
#include <thread>
#include <random>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "mrac/all.hpp"

using namespace mrac;
using namespace mrac::adaptive;

/*
Monte-Carlo sweep over the initial plant state y0 for the nominal cubic plant.
Every run owns its arena, plant, integrator, scheduler and estimate -> one std::thread per run,
nothing shared. Prints one row per run plus the worst final tracking error and the number of
runs that stopped on a fault.
*/

struct SweepRun{
    Scalar y0{0};
    AdaptationMode mode{AdaptationMode::kIncrement};
    Status status{Status::kOK};
    RunSummary summary{};
    Fault fault{};
};

static void run_one(SweepRun& out){
    MracConfig cfg{};
    cfg.a_hat0 = 0.1;
    cfg.b_hat0 = 0.5;
    cfg.gamma_a = 0.1;
    cfg.gamma_b = 0.2;
    cfg.k_r = 1.5;
    cfg.dt = 0.01;
    cfg.horizon = 10.0;
    cfg.ar = 3.0;
    cfg.br = 3.0;
    cfg.adaptation = out.mode;

    models::CubicPlant plant({1.5, 2.0, 0.5});
    integrators::RK4 rk4;
    signals::Sine sine{};

    alignas(64) std::byte buf[4096];
    MemoryArena arena(buf, sizeof(buf));
    AdaptiveLoopScheduler loop;

    Status st = loop.init(Dims{.ny=1, .nu=1, .nx=1}, arena);
    if (st == Status::kOK) st = loop.configure(cfg, plant, rk4, sine.signal(), basis::cubic());

    const Scalar y0[1]{out.y0};
    const Scalar yr0[1]{0.0};
    if (st == Status::kOK) st = loop.start(y0, yr0);
    if (st != Status::kOK){
        out.status = st;
        return;
    }

    auto res = loop.run();
    out.status = res.status();
    out.summary = loop.summary();
    out.fault = loop.fault();
}

int main(int argc, char** argv){
    int runs = 16;
    unsigned seed = 7;
    double spread = 1.0;
    AdaptationMode mode = AdaptationMode::kIncrement;
    bool bad_mode = false;

    if (argc > 1) runs = std::atoi(argv[1]);
    if (argc > 2) seed = static_cast<unsigned>(std::strtoul(argv[2], nullptr, 10));
    if (argc > 3) spread = std::atof(argv[3]);
    if (argc > 4){
        if (!std::strcmp(argv[4], "gradient_flow")) mode = AdaptationMode::kGradientFlow;
        else bad_mode = std::strcmp(argv[4], "increment") != 0;
    }
    if (runs <= 0 || !(spread > 0.0) || bad_mode){
        std::fprintf(stderr, "mrac_initial_condition_sweep [runs>0] [seed] [spread>0] [increment|gradient_flow]\n");
        return 2;
    }

    // // y0 ~ U(-spread, spread), drawn up front so the set only depends on the seed
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> dist(-spread, spread);
    std::vector<SweepRun> results(static_cast<std::size_t>(runs));
    for (auto& r : results){
        r.y0 = dist(rng);
        r.mode = mode;
    }

    std::vector<std::thread> workers;
    workers.reserve(results.size());
    for (auto& r : results) workers.emplace_back(run_one, std::ref(r));
    for (auto& w : workers) w.join();

    std::printf("adaptation = %s\n", to_string(mode));
    std::puts("run, y0, status, ticks, y_final, yr_final, abs_e, a_hat, b_hat, fault");
    Scalar worst = 0;
    int failed = 0;
    for (std::size_t i=0; i<results.size(); ++i){
        const SweepRun& r = results[i];
        const Scalar abs_e = std::abs(r.summary.yr_final - r.summary.y_final);
        if (r.status == Status::kOK) worst = std::max(worst, abs_e);
        else ++failed;
        std::printf("%zu, %.6f, %s, %llu, %.6f, %.6f, %.6f, %.6f, %.6f, %s\n",
                    i, r.y0, to_string(r.status), static_cast<unsigned long long>(r.summary.ticks),
                    r.summary.y_final, r.summary.yr_final, abs_e, r.summary.a_hat, r.summary.b_hat,
                    to_string(r.fault.source));
    }
    std::printf("worst final |e| = %.6f, failed runs = %d/%d\n", worst, failed, runs);
    return failed == 0 ? 0 : 3;
}
