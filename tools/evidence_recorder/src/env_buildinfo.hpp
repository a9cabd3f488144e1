#pragma once

#include <cstdint>
#include <string>

namespace mrac::tools::detail{

    struct BuildInfoPack{
        std::string mrac_version;
        std::string git_sha;
        std::string compiler;
        std::string flags;
        std::string scalar_type;
        std::uint64_t dt_ns{0};
        std::string run_id;
        std::string plant_id;
        std::string integrator;
        std::uint64_t tick_decimation{0};
    };

    BuildInfoPack make_buildinfo(std::uint64_t dt_ns, const char* run_id, const char* plant_id,
                                 const char* integrator, std::uint32_t tick_decimation);

} // namespace mrac::tools::detail
