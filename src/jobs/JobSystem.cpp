#include "jobs/JobSystem.h"

#include <spdlog/spdlog.h>

namespace orbis::jobs {

JobSystem& JobSystem::Instance()
{
    static JobSystem instance;
    return instance;
}

JobSystem::JobSystem()
{
    spdlog::debug("JobSystem: taskflow executor with {} workers", _executor.num_workers());
}

JobSystem::~JobSystem() = default;

} // namespace orbis::jobs
