#include <vector>
#include <sstream>
#include <cstddef>

#include "env_buildinfo.hpp"
#include "mrac/version.hpp"
#include "mrac/core/types.hpp"

#ifndef GIT_SHA
#define GIT_SHA "unknown"
#endif

namespace mrac::tools::detail{
    static const char* compiler_string(){
        #if defined(__clang__)
            return "clang " __clang_version__;
        #elif defined(__GNUC__)
            return "gcc " __VERSION__;
        #elif defined(_MSC_VER)
            #define MRAC_MSVC_TOSTR2(x) #x
            #define MRAC_MSVC_TOSTR(x) MRAC_MSVC_TOSTR2(x)
            static const char* s = "msvc " MRAC_MSVC_TOSTR(_MSC_VER);
            return s;
        #else
            return "unknown";
        #endif
    }

    static const char* scalar_string(){
        #if defined(MRAC_SCALAR_FLOAT)
            return "float";
        #else
            return "double";
        #endif
    }

    static std::string flags_string(){
        std::vector<const char*> f;

        #if defined(MRAC_NO_EXCEPTIONS)
            f.push_back("no-exceptions");
        #endif

        #if defined(MRAC_NO_RTTI)
            f.push_back("no-rtti");
        #endif

        // // bit identical replays need strict IEEE math
        #if defined(__FAST_MATH__)
            f.push_back("fast-math-ON");
        #else
            f.push_back("fast-math-OFF");
        #endif

        #ifdef NDEBUG
            f.push_back("release");
        #else
            f.push_back("debug");
        #endif

        std::ostringstream oss;
        for (std::size_t i=0; i<f.size(); ++i){
            if (i) oss << ' ';
            oss << f[i];
        }
        return oss.str();
    }

    BuildInfoPack make_buildinfo(std::uint64_t dt_ns, const char* run_id, const char* plant_id,
                                 const char* integrator, std::uint32_t tick_decimation){
        BuildInfoPack bi;
        bi.mrac_version = mrac::kVersionStr;
        bi.git_sha = GIT_SHA;
        bi.compiler = compiler_string();
        bi.flags = flags_string();
        bi.scalar_type = scalar_string();
        bi.dt_ns = dt_ns;
        bi.run_id = run_id ? run_id : "";
        bi.plant_id = plant_id ? plant_id : "";
        bi.integrator = integrator ? integrator : "";
        bi.tick_decimation = tick_decimation;
        return bi;
    }
} // namespace mrac::tools::detail
