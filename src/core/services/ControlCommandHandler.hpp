#pragma once

#include "core/state/StateStore.hpp"
#include <QByteArray>
#include <QList>
#include <QString>

namespace creak {

class IOwnerProbe;

struct ClearReport {
    int matched = 0;
    int graceful = 0;            // owner removed its own record after SIGTERM
    int forced = 0;              // removed on the owner's behalf
    QList<quint64> notExited;    // signaled, but still present after the grace period
    QList<quint64> failed;       // could not be removed at all
    bool storeError = false;
    QString errorString;

    int cleared() const { return graceful + forced; }
    bool succeeded() const { return !storeError && failed.isEmpty(); }
};

/// Implements `list active` and `clear by name|class|id`.
///
/// Clearing never blocks for long: matched owners get SIGTERM and a bounded
/// grace period to tear down and remove their own records; whatever is left
/// afterwards is removed here.
class ControlCommandHandler {
public:
    static constexpr int DEFAULT_GRACE_MS = 2000;
    static constexpr int POLL_INTERVAL_MS = 25;

    /// Neither pointer is owned. `probe` nullptr selects the kill(2) based probe.
    explicit ControlCommandHandler(StateStore* store, IOwnerProbe* probe = nullptr);

    void setGracePeriod(int ms) { graceMs_ = ms; }

    QList<NotificationRecord> listActive(bool* ok = nullptr);
    ClearReport clear(StateStore::Selector by, const QString& value);

    /// Indented JSON array, one object per record.
    static QByteArray toJson(const QList<NotificationRecord>& records);

private:
    bool forceRemove(const NotificationRecord& record, ClearReport& report);

    StateStore* store_;
    IOwnerProbe* probe_;
    int graceMs_ = DEFAULT_GRACE_MS;
};

} // namespace creak
