#include "ProcessOwnerProbe.hpp"
#include <boost/log/trivial.hpp>
#include <cerrno>
#include <signal.h>
#include <cstring>
#include <limits>
#include <sys/types.h>

namespace creak {

namespace {

// kill(2) treats 0 and negative pids as process groups.
bool isValidPid(qint64 pid)
{
    return pid > 0 && pid <= std::numeric_limits<pid_t>::max();
}

} // namespace

bool ProcessOwnerProbe::isAlive(qint64 pid) const
{
    if (!isValidPid(pid))
        return false;
    if (::kill(static_cast<pid_t>(pid), 0) == 0)
        return true;
    // EPERM: the process exists but belongs to another user
    return errno == EPERM;
}

IOwnerProbe::Termination ProcessOwnerProbe::requestTermination(qint64 pid)
{
    if (!isValidPid(pid))
        return Termination::NoSuchProcess;
    if (::kill(static_cast<pid_t>(pid), SIGTERM) == 0)
        return Termination::Delivered;

    const int err = errno;
    if (err == ESRCH)
        return Termination::NoSuchProcess;

    BOOST_LOG_TRIVIAL(warning) << "ProcessOwnerProbe: SIGTERM to pid " << pid
                               << " failed: " << std::strerror(err);
    return Termination::Failed;
}

ProcessOwnerProbe* ProcessOwnerProbe::instance()
{
    static ProcessOwnerProbe probe;
    return &probe;
}

} // namespace creak
