#include <cmath>
#include <chrono>
#include <cstdio>
#include <memory>
#include <cstring>
#include <cstdlib>

#include "mrac/all.hpp"
#include "mrac/tools/recorder.hpp"

using namespace mrac;
using namespace mrac::adaptive;

/*
Nominal MRAC run on the cubic plant dy/dt = -1.5 y^3 + 2 u + 0.5
1. reference model dyr/dt = -3 yr + 3 sin(t)
2. u = (1.5 sin(t) - a_hat y^3) / b_hat   (u = 0 when |b_hat| < 1e-6)
3. MIT-rule adaptation of a_hat, b_hat with the same u (per-tick increment; --adaptation gradient_flow for the dt-scaled form)
4. plant + reference advanced by the chosen integrator, 1000 ticks of 10 ms
Writes t,y,yr,u,a_hat,b_hat,degenerate as CSV and, with --evidence, a recorder segment.
*/

struct Outputs{
    std::FILE* csv{nullptr};
    tools::Recorder* recorder{nullptr};
    int progress_every{100};

    static void sink(const TickRecord& r, void* user){
        auto* o = static_cast<Outputs*>(user);
        if (o->csv){
            std::fprintf(o->csv, "%.9f,%.9f,%.9f,%.9f,%.9f,%.9f,%d\n",
                         r.t, r.y, r.yr, r.u, r.a_hat, r.b_hat, r.degenerate ? 1 : 0);
        }
        if (o->recorder) tools::Recorder::tick_sink(r, o->recorder);
        if (o->progress_every > 0 && r.tick % static_cast<std::uint64_t>(o->progress_every) == 0){
            std::printf("%llu, t=%.2f, y=%.6f, yr=%.6f, u=%.6f, a_hat=%.6f, b_hat=%.6f\n",
                        static_cast<unsigned long long>(r.tick), r.t, r.y, r.yr, r.u, r.a_hat, r.b_hat);
        }
    }
};

static void usage(){
    std::fprintf(stderr,
        "mrac_cubic_tracking [--csv <file>] [--evidence <dir>] [--integrator euler|rk4|dopri45] "
        "[--adaptation increment|gradient_flow] [--horizon <s>] [--quiet]\n");
}

int main(int argc, char** argv){
    const char* csv_path = "mrac_cubic_tracking.csv";
    const char* evidence_dir = nullptr;
    const char* integ_name = "rk4";
    const char* adaptation = "increment";
    double horizon = 10.0;
    bool quiet = false;

    for (int i=1; i<argc; ++i){
             if (!std::strcmp(argv[i], "--csv") && i+1<argc) csv_path = argv[++i];
        else if (!std::strcmp(argv[i], "--evidence") && i+1<argc) evidence_dir = argv[++i];
        else if (!std::strcmp(argv[i], "--integrator") && i+1<argc) integ_name = argv[++i];
        else if (!std::strcmp(argv[i], "--adaptation") && i+1<argc) adaptation = argv[++i];
        else if (!std::strcmp(argv[i], "--horizon") && i+1<argc) horizon = std::atof(argv[++i]);
        else if (!std::strcmp(argv[i], "--quiet")) quiet = true;
        else{
            usage();
            return 2;
        }
    }

    MracConfig cfg{};
    cfg.a_hat0 = 0.1;
    cfg.b_hat0 = 0.5;
    cfg.gamma_a = 0.1;
    cfg.gamma_b = 0.2;
    cfg.k_r = 1.5;
    cfg.dt = 0.01;
    cfg.horizon = horizon;
    cfg.ar = 3.0;
    cfg.br = 3.0;

    if (!std::strcmp(adaptation, "gradient_flow")) cfg.adaptation = AdaptationMode::kGradientFlow;
    else if (std::strcmp(adaptation, "increment") != 0){
        usage();
        return 2;
    }

    integrators::ForwardEuler euler;
    integrators::RK4 rk4;
    integrators::DormandPrince45 dopri;
    integrators::IStepIntegrator* integ = nullptr;
    if (!std::strcmp(integ_name, "euler")) integ = &euler;
    else if (!std::strcmp(integ_name, "rk4")) integ = &rk4;
    else if (!std::strcmp(integ_name, "dopri45")) integ = &dopri;
    else{
        usage();
        return 2;
    }

    models::CubicPlant plant({1.5, 2.0, 0.5});
    signals::Sine sine{};
    StderrLogger logger(LogLevel::kInfo);

    Outputs out{};
    out.progress_every = quiet ? 0 : 100;
    out.csv = std::fopen(csv_path, "w");
    if (!out.csv){
        std::fprintf(stderr, "mrac_cubic_tracking: cannot open %s\n", csv_path);
        return 1;
    }
    std::fputs("t,y,yr,u,a_hat,b_hat,degenerate\n", out.csv);

    std::unique_ptr<tools::Recorder> recorder;
    if (evidence_dir){
        tools::RecorderOptions ropt{};
        ropt.out_dir = evidence_dir;
        ropt.dt_ns_hint = from_seconds(cfg.dt);
        ropt.run_id = "cubic_tracking";
        ropt.plant_id = "cubic(a=1.5,b=2,d=0.5)";
        ropt.integrator = integ->name();
        recorder = tools::Recorder::open(ropt);
        if (!recorder){
            std::fprintf(stderr, "mrac_cubic_tracking: recorder unavailable for %s\n", evidence_dir);
            std::fclose(out.csv);
            return 1;
        }
        using namespace std::chrono;
        recorder->write_buildinfo();
        recorder->write_time_anchor(duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count(),
                                    duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count());
        out.recorder = recorder.get();
    }

    alignas(64) std::byte buf[4096];
    MemoryArena arena(buf, sizeof(buf));
    AdaptiveLoopScheduler loop;
    Hooks hooks{&Outputs::sink, &out, &logger};

    Status st = loop.init(Dims{.ny=1, .nu=1, .nx=1}, arena, hooks);
    if (st == Status::kOK) st = loop.configure(cfg, plant, *integ, sine.signal(), basis::cubic());

    const Scalar y0[1]{0.1};
    const Scalar yr0[1]{0.0};
    if (st == Status::kOK) st = loop.start(y0, yr0);
    if (st != Status::kOK){
        std::fprintf(stderr, "mrac_cubic_tracking: setup failed: %s\n", to_string(st));
        std::fclose(out.csv);
        return 1;
    }

    auto res = loop.run();

    if (recorder){
        if (loop.fault().active()) recorder->write_fault(loop.fault());
        recorder->write_kpi(loop.kpi());
        recorder->flush();
    }
    std::fclose(out.csv);

    if (!res.has_value()){
        const Fault& f = loop.fault();
        std::fprintf(stderr, "run failed: %s at tick %llu (%s[%zu] = %g)\n",
                     to_string(res.status()), static_cast<unsigned long long>(f.tick),
                     to_string(f.source), f.index, static_cast<double>(f.value));
        return 3;
    }

    const RunSummary& s = res.value();
    std::printf("final: ticks=%llu t=%.2f y=%.6f yr=%.6f |e|=%.6f a_hat=%.6f b_hat=%.6f max|e|=%.6f degenerate=%llu\n",
                static_cast<unsigned long long>(s.ticks), s.t_final, s.y_final, s.yr_final,
                std::abs(s.yr_final - s.y_final), s.a_hat, s.b_hat, s.health.max_abs_error,
                static_cast<unsigned long long>(s.health.degenerate_ticks));
    return 0;
}
