#include "TerminationListener.hpp"
#include <QSocketNotifier>
#include <boost/log/trivial.hpp>
#include <cerrno>
#include <cstring>
#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>

namespace creak {

namespace {

int g_signalFds[2] = {-1, -1};

constexpr int HANDLED_SIGNALS[] = {SIGTERM, SIGINT};

} // namespace

TerminationListener::TerminationListener(QObject* parent)
    : QObject(parent)
{
}

TerminationListener::~TerminationListener()
{
    if (!notifier_)
        return;

    for (int sig : HANDLED_SIGNALS)
        ::signal(sig, SIG_DFL);

    delete notifier_;
    notifier_ = nullptr;
    ::close(g_signalFds[0]);
    ::close(g_signalFds[1]);
    g_signalFds[0] = g_signalFds[1] = -1;
}

bool TerminationListener::install()
{
    if (g_signalFds[0] != -1) {
        BOOST_LOG_TRIVIAL(warning) << "TerminationListener: already installed";
        return false;
    }

    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0, g_signalFds) != 0) {
        const int err = errno;
        BOOST_LOG_TRIVIAL(error) << "TerminationListener: socketpair failed: " << std::strerror(err);
        g_signalFds[0] = g_signalFds[1] = -1;
        return false;
    }

    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = &TerminationListener::handleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;

    for (int sig : HANDLED_SIGNALS) {
        if (::sigaction(sig, &action, nullptr) != 0) {
            const int err = errno;
            BOOST_LOG_TRIVIAL(error) << "TerminationListener: sigaction(" << sig << ") failed: "
                                     << std::strerror(err);
            ::close(g_signalFds[0]);
            ::close(g_signalFds[1]);
            g_signalFds[0] = g_signalFds[1] = -1;
            return false;
        }
    }

    notifier_ = new QSocketNotifier(g_signalFds[1], QSocketNotifier::Read, this);
    connect(notifier_, &QSocketNotifier::activated, this, &TerminationListener::onSignalReadable);
    return true;
}

void TerminationListener::handleSignal(int signalNumber)
{
    // Async-signal-safe: one write, errno preserved. If the socket is full a
    // wake-up is already pending, so a failed write loses nothing.
    const int savedErrno = errno;
    const char byte = static_cast<char>(signalNumber);
    const ssize_t written = ::write(g_signalFds[0], &byte, 1);
    Q_UNUSED(written);
    errno = savedErrno;
}

void TerminationListener::onSignalReadable()
{
    char byte = 0;
    while (::read(g_signalFds[1], &byte, 1) == 1) {
        BOOST_LOG_TRIVIAL(debug) << "TerminationListener: received signal " << static_cast<int>(byte);
        emit terminationRequested(static_cast<int>(byte));
    }
}

} // namespace creak
