#include <QCoreApplication>
#include <QGuiApplication>
#include <QTextStream>
#include <QTimer>
#include <boost/log/trivial.hpp>
#include "core/CommandLine.hpp"
#include "core/Logging.hpp"
#include "core/StyleConfig.hpp"
#include "core/popup/PopupLifecycle.hpp"
#include "core/popup/TerminationListener.hpp"
#include "core/services/ControlCommandHandler.hpp"
#include "core/state/StateStore.hpp"
#include "ui/PopupWindow.hpp"

namespace {

constexpr int EXIT_USAGE = 2;

QString joinIds(const QList<quint64>& ids)
{
    QStringList parts;
    for (quint64 id : ids)
        parts.append(QString::number(id));
    return parts.join(QLatin1String(", "));
}

int runListActive(const creak::Invocation& invocation)
{
    QTextStream out(stdout);
    QTextStream err(stderr);

    creak::StateStore store(creak::StateStore::resolveDirectory(invocation.options.stateDir));
    if (!store.open()) {
        err << "creak: " << store.errorString() << Qt::endl;
        return 1;
    }

    creak::ControlCommandHandler handler(&store);
    bool ok = false;
    const auto records = handler.listActive(&ok);
    if (!ok) {
        err << "creak: " << store.errorString() << Qt::endl;
        return 1;
    }
    out << creak::ControlCommandHandler::toJson(records);
    out.flush();
    return 0;
}

int runClear(const creak::Invocation& invocation)
{
    QTextStream out(stdout);
    QTextStream err(stderr);

    creak::StateStore store(creak::StateStore::resolveDirectory(invocation.options.stateDir));
    if (!store.open()) {
        err << "creak: " << store.errorString() << Qt::endl;
        return 1;
    }

    creak::ControlCommandHandler handler(&store);
    const creak::ClearReport report = handler.clear(invocation.clearBy, invocation.clearValue);
    if (report.storeError) {
        err << "creak: " << report.errorString << Qt::endl;
        return 1;
    }

    if (!report.notExited.isEmpty())
        err << "creak: owner did not exit, removed record(s): " << joinIds(report.notExited) << Qt::endl;
    if (!report.failed.isEmpty())
        err << "creak: could not remove record(s): " << joinIds(report.failed) << Qt::endl;

    out << "cleared " << report.cleared() << " notification(s)" << Qt::endl;
    return report.succeeded() ? 0 : 1;
}

int runShow(int argc, char* argv[], const creak::Invocation& invocation)
{
    QGuiApplication app(argc, argv);
    app.setApplicationName("creak");
    app.setQuitOnLastWindowClosed(false);

    const creak::PopupOptions& options = invocation.options;
    creak::StateStore store(creak::StateStore::resolveDirectory(options.stateDir));
    creak::PopupWindow window(options.style);
    creak::PopupLifecycle lifecycle(options, &store, &window);

    creak::TerminationListener termination;
    if (!termination.install())
        BOOST_LOG_TRIVIAL(warning) << "creak: termination signals will not clear this popup cleanly";
    QObject::connect(&termination, &creak::TerminationListener::terminationRequested,
                     &lifecycle, &creak::PopupLifecycle::expire);
    QObject::connect(&lifecycle, &creak::PopupLifecycle::finished,
                     &app, &QCoreApplication::exit, Qt::QueuedConnection);

    QTimer::singleShot(0, &lifecycle, &creak::PopupLifecycle::start);
    const int code = app.exec();

    if (code != 0)
        QTextStream(stderr) << "creak: " << lifecycle.errorString() << Qt::endl;
    return code;
}

} // namespace

int main(int argc, char *argv[])
{
    creak::initLogging();

    // Parsing needs an application instance for QCommandLineParser; display
    // requests get a QGuiApplication of their own afterwards.
    creak::Invocation invocation;
    {
        QCoreApplication probe(argc, argv);
        probe.setApplicationName("creak");

        creak::CommandLine commandLine(creak::StyleConfig::configHome());
        if (!commandLine.parse(probe.arguments())) {
            QTextStream(stderr) << "creak: " << commandLine.errorString() << Qt::endl;
            return EXIT_USAGE;
        }
        invocation = commandLine.invocation();

        switch (invocation.command) {
        case creak::Invocation::Command::Help:
            QTextStream(stdout) << commandLine.helpText();
            return 0;
        case creak::Invocation::Command::ListActive:
            return runListActive(invocation);
        case creak::Invocation::Command::Clear:
            return runClear(invocation);
        case creak::Invocation::Command::Show:
            break;
        }
    }

    return runShow(argc, argv, invocation);
}
