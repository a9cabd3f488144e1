#include "mrac/version.hpp"
#include "mrac/visibility.hpp"

extern "C"{
    MRAC_API const char* mrac_version_string() noexcept {
        return mrac::kVersionStr;
    }
}
