#pragma once

#include "core/PopupOptions.hpp"
#include <QObject>
#include <QString>
#include <QTimer>
#include <memory>

namespace creak {

class IPopupSurface;
class RecordHandle;
class StateStore;

/// Drives one popup process from placement to teardown.
///
///   Pending -> Registered -> Displayed -> Expiring -> Removed
///
/// In Displayed the controller waits in the event loop for the timeout, an
/// expire() call (termination signal or click), whichever comes first. Every
/// trigger goes through the same Expiring step: the surface is destroyed
/// before the record is removed. finished() reports the process exit status.
class PopupLifecycle : public QObject {
    Q_OBJECT
public:
    enum State {
        Pending = 0,
        Registered,
        Displayed,
        Expiring,
        Removed
    };
    Q_ENUM(State)

    enum ExitCode {
        ExitOk = 0,
        ExitFailure = 1
    };

    /// `store` and `surface` are not owned and must outlive the controller.
    PopupLifecycle(const PopupOptions& options, StateStore* store, IPopupSurface* surface,
                   QObject* parent = nullptr);
    ~PopupLifecycle() override;

    State state() const { return state_; }
    quint64 recordId() const { return recordId_; }
    int offset() const { return offset_; }
    QString errorString() const { return errorString_; }

public slots:
    void start();
    void expire();

signals:
    void stateChanged(creak::PopupLifecycle::State state);
    void finished(int exitCode);

private:
    void setState(State state);
    void fail(const QString& message);

    PopupOptions options_;
    StateStore* store_;
    IPopupSurface* surface_;
    std::unique_ptr<RecordHandle> handle_;
    QTimer timeoutTimer_;
    State state_ = Pending;
    quint64 recordId_ = 0;
    int offset_ = 0;
    QString errorString_;
};

} // namespace creak
