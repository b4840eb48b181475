#pragma once

#include "NotificationRecord.hpp"
#include <QByteArray>
#include <QList>
#include <QString>
#include <functional>
#include <memory>

class QDir;

namespace creak {

class IOwnerProbe;
class RecordHandle;

/// Directory of per-notification record files shared by every creak process.
///
/// Each active popup owns one file `<id>.record`. There is no lock: records
/// are published with link(2) from a private temporary file, which is atomic
/// and fails if the name is taken, and removed with unlink(2). A concurrent
/// list() therefore sees either a complete record or nothing.
///
/// Records whose owner is gone are not an error. list() drops them from its
/// result and reclaims the file on the owner's behalf.
class StateStore {
public:
    enum class Selector {
        Name,
        Class,
        Id
    };

    static constexpr int MAX_REGISTER_ATTEMPTS = 64;
    /// A record this far past its own timeout is reclaimed even if the pid is alive.
    static constexpr qint64 EXPIRY_GRACE_MS = 10000;

    /// `probe` is not owned; nullptr selects the kill(2) based probe.
    explicit StateStore(const QString& directory, IOwnerProbe* probe = nullptr);

    /// $XDG_STATE_HOME/creak, falling back to ~/.local/state/creak.
    static QString defaultDirectory();
    static QString resolveDirectory(const QString& overridePath);

    QString directory() const { return directory_; }
    QString recordPath(quint64 id) const;

    /// Creates the directory if needed. False if it cannot be created or read.
    bool open();

    /// Assigns `record.id` and publishes the record. Returns nullptr on I/O
    /// failure (see errorString()); id collisions are retried internally.
    std::unique_ptr<RecordHandle> registerRecord(NotificationRecord& record);

    /// Live records in id order. Stale and undecodable records are left out
    /// and reclaimed best-effort. `ok` is set to false if the directory
    /// cannot be read.
    QList<NotificationRecord> list(bool* ok = nullptr);

    QList<NotificationRecord> find(Selector by, const QString& value, bool* ok = nullptr);

    /// Removes record `id` only if `owned` accepts the bytes the file holds at
    /// that moment. The file is moved aside before the check and put back if
    /// it is not ours, so a record another process published under the same
    /// id is never deleted. An absent record counts as removed. False only if
    /// the file could not be moved.
    bool removeIf(quint64 id, const std::function<bool(const QByteArray&)>& owned);

    /// Deletes whatever `<id>.record` holds. Idempotent; removing an absent
    /// record succeeds. Owners use remove(record) instead.
    bool remove(quint64 id);

    /// removeIf() for the registration `record` was made by. Ids are reused,
    /// so the file is deleted only if it still holds that registration.
    bool remove(const NotificationRecord& record);

    QString errorString() const { return errorString_; }

private:
    bool publish(NotificationRecord& record);
    bool isStale(const NotificationRecord& record, qint64 nowMs) const;
    bool takeIf(const QString& path, const std::function<bool(const QByteArray&)>& owned);
    void restore(const QString& aside, const QString& path, const QByteArray& bytes);
    void reclaim(const QString& path, const QByteArray& staleBytes);
    void sweepTemporaries(const QDir& dir);
    quint64 nextCandidateId(const QDir& dir) const;
    QString temporaryPath(const QString& kind, const QString& detail) const;

    QString directory_;
    IOwnerProbe* probe_;
    QString errorString_;
};

/// Ownership of one registered record. Releasing (or destroying) the handle
/// removes the record, unless it was already removed and its id handed to a
/// newer popup. The store must outlive the handle.
class RecordHandle {
public:
    RecordHandle(StateStore* store, const NotificationRecord& record);
    ~RecordHandle();

    RecordHandle(const RecordHandle&) = delete;
    RecordHandle& operator=(const RecordHandle&) = delete;

    quint64 id() const { return record_.id; }
    const NotificationRecord& record() const { return record_; }
    bool isReleased() const { return released_; }

    /// Removes the record now. Returns false if the store could not delete it.
    bool release();

private:
    StateStore* store_;
    NotificationRecord record_;
    bool released_ = false;
};

} // namespace creak
