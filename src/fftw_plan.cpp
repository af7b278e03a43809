#include "openchi/fftw_plan.hpp"

namespace open_chi {

std::mutex& fftw_planner_mutex()
{
    static std::mutex m;
    return m;
}

} // end of namespace open_chi
