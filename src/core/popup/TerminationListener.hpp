#pragma once

#include <QObject>

class QSocketNotifier;

namespace creak {

/// Delivers SIGTERM and SIGINT to the Qt event loop.
///
/// The signal handler only writes the signal number to a socketpair; the
/// read end is watched by a QSocketNotifier, so terminationRequested() is
/// emitted on the main thread like any other event. Only one listener can be
/// installed per process.
class TerminationListener : public QObject {
    Q_OBJECT
public:
    explicit TerminationListener(QObject* parent = nullptr);
    ~TerminationListener() override;

    bool install();
    bool isInstalled() const { return notifier_ != nullptr; }

signals:
    void terminationRequested(int signalNumber);

private slots:
    void onSignalReadable();

private:
    static void handleSignal(int signalNumber);

    QSocketNotifier* notifier_ = nullptr;
};

} // namespace creak
