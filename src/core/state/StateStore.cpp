#include "StateStore.hpp"
#include "IOwnerProbe.hpp"
#include "ProcessOwnerProbe.hpp"
#include "RecordCodec.hpp"
#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRandomGenerator>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace creak {

namespace {

const QString RECORD_SUFFIX = QStringLiteral(".record");
const QString PENDING_PREFIX = QStringLiteral(".pending-");
const QString RECLAIM_PREFIX = QStringLiteral(".reclaim-");

QByteArray nativePath(const QString& path)
{
    return QFile::encodeName(path);
}

// "<id>.record" -> id, 0 if the name is not a record file name.
quint64 idFromFileName(const QString& fileName)
{
    if (!fileName.endsWith(RECORD_SUFFIX))
        return 0;
    bool ok = false;
    const quint64 id = fileName.left(fileName.size() - RECORD_SUFFIX.size()).toULongLong(&ok);
    return ok ? id : 0;
}

bool matches(const NotificationRecord& record, StateStore::Selector by, const QString& value)
{
    switch (by) {
    case StateStore::Selector::Name:
        return !record.name.isEmpty() && record.name == value;
    case StateStore::Selector::Class:
        return !record.className.isEmpty() && record.className == value;
    case StateStore::Selector::Id: {
        bool ok = false;
        const quint64 id = value.toULongLong(&ok);
        return ok && record.id == id;
    }
    }
    return false;
}

} // namespace

StateStore::StateStore(const QString& directory, IOwnerProbe* probe)
    : directory_(directory)
    , probe_(probe ? probe : ProcessOwnerProbe::instance())
{
}

QString StateStore::defaultDirectory()
{
    QString base = qEnvironmentVariable("XDG_STATE_HOME");
    if (base.isEmpty())
        base = QDir::homePath() + "/.local/state";
    return base + "/creak";
}

QString StateStore::resolveDirectory(const QString& overridePath)
{
    return overridePath.isEmpty() ? defaultDirectory() : overridePath;
}

QString StateStore::recordPath(quint64 id) const
{
    return QDir(directory_).filePath(QString::number(id) + RECORD_SUFFIX);
}

QString StateStore::temporaryPath(const QString& kind, const QString& detail) const
{
    return QDir(directory_).filePath(QStringLiteral("%1%2-%3-%4")
        .arg(kind)
        .arg(QCoreApplication::applicationPid())
        .arg(detail)
        .arg(QRandomGenerator::global()->generate(), 8, 16, QLatin1Char('0')));
}

bool StateStore::open()
{
    if (directory_.isEmpty()) {
        errorString_ = QStringLiteral("no state directory configured");
        return false;
    }
    if (!QDir().mkpath(directory_)) {
        errorString_ = QStringLiteral("cannot create state directory %1").arg(directory_);
        return false;
    }
    QFileInfo info(directory_);
    if (!info.isDir() || !info.isReadable() || !info.isWritable()) {
        errorString_ = QStringLiteral("state directory %1 is not accessible").arg(directory_);
        return false;
    }
    return true;
}

quint64 StateStore::nextCandidateId(const QDir& dir) const
{
    quint64 highest = 0;
    for (const auto& entry : dir.entryList({QStringLiteral("*") + RECORD_SUFFIX}, QDir::Files))
        highest = std::max(highest, idFromFileName(entry));
    return highest + 1;
}

std::unique_ptr<RecordHandle> StateStore::registerRecord(NotificationRecord& record)
{
    if (!open() || !publish(record))
        return nullptr;
    return std::make_unique<RecordHandle>(this, record);
}

bool StateStore::publish(NotificationRecord& record)
{
    QDir dir(directory_);
    quint64 candidate = nextCandidateId(dir);

    for (int attempt = 0; attempt < MAX_REGISTER_ATTEMPTS; ++attempt, ++candidate) {
        record.id = candidate;
        const QByteArray bytes = RecordCodec::encode(record);
        const QString tempPath = temporaryPath(PENDING_PREFIX, QString::number(candidate));

        QFile temp(tempPath);
        if (!temp.open(QIODevice::WriteOnly | QIODevice::NewOnly)) {
            errorString_ = QStringLiteral("cannot write %1: %2").arg(tempPath, temp.errorString());
            return false;
        }
        if (temp.write(bytes) != bytes.size() || !temp.flush()) {
            errorString_ = QStringLiteral("cannot write %1: %2").arg(tempPath, temp.errorString());
            temp.close();
            temp.remove();
            return false;
        }
        temp.close();

        // link(2) publishes the complete file under its final name, or fails
        // with EEXIST if another process already holds this id.
        const QString finalPath = recordPath(candidate);
        const int rc = ::link(nativePath(tempPath).constData(), nativePath(finalPath).constData());
        const int linkError = errno;
        ::unlink(nativePath(tempPath).constData());

        if (rc == 0) {
            BOOST_LOG_TRIVIAL(debug) << "StateStore: registered record " << candidate
                                     << " at " << edgeName(record.edge).toStdString()
                                     << " offset " << record.offset;
            return true;
        }
        if (linkError != EEXIST) {
            errorString_ = QStringLiteral("cannot publish %1: %2")
                               .arg(finalPath, QString::fromLocal8Bit(std::strerror(linkError)));
            return false;
        }
        BOOST_LOG_TRIVIAL(debug) << "StateStore: id " << candidate << " taken, retrying";
    }

    errorString_ = QStringLiteral("no free record id after %1 attempts").arg(MAX_REGISTER_ATTEMPTS);
    return false;
}

bool StateStore::isStale(const NotificationRecord& record, qint64 nowMs) const
{
    if (record.ownerPid != QCoreApplication::applicationPid() && !probe_->isAlive(record.ownerPid))
        return true;
    const qint64 expiresAt = record.expiresAtMs();
    return expiresAt > 0 && nowMs > expiresAt + EXPIRY_GRACE_MS;
}

QList<NotificationRecord> StateStore::list(bool* ok)
{
    if (ok)
        *ok = false;

    QFileInfo info(directory_);
    if (!info.isDir() || !info.isReadable()) {
        errorString_ = QStringLiteral("cannot read state directory %1").arg(directory_);
        return {};
    }

    QDir dir(directory_);
    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    QList<NotificationRecord> records;

    for (const auto& entry : dir.entryList({QStringLiteral("*") + RECORD_SUFFIX}, QDir::Files)) {
        const QString path = dir.filePath(entry);
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly)) {
            // Removed by its owner between the listing and the open.
            if (file.exists()) {
                BOOST_LOG_TRIVIAL(warning) << "StateStore: cannot read " << path.toStdString()
                                           << ": " << file.errorString().toStdString();
            }
            continue;
        }
        const QByteArray bytes = file.readAll();
        file.close();

        NotificationRecord record;
        QString decodeError;
        if (!RecordCodec::decode(bytes, record, &decodeError)) {
            BOOST_LOG_TRIVIAL(info) << "StateStore: reclaiming undecodable " << entry.toStdString()
                                    << " (" << decodeError.toStdString() << ")";
            reclaim(path, bytes);
            continue;
        }
        if (record.id != idFromFileName(entry)) {
            BOOST_LOG_TRIVIAL(info) << "StateStore: reclaiming " << entry.toStdString()
                                    << " holding record " << record.id;
            reclaim(path, bytes);
            continue;
        }
        if (isStale(record, now)) {
            BOOST_LOG_TRIVIAL(info) << "StateStore: reclaiming stale record " << record.id
                                    << " of pid " << record.ownerPid;
            reclaim(path, bytes);
            continue;
        }
        records.append(record);
    }

    sweepTemporaries(dir);

    std::sort(records.begin(), records.end(),
              [](const NotificationRecord& a, const NotificationRecord& b) { return a.id < b.id; });

    if (ok)
        *ok = true;
    return records;
}

QList<NotificationRecord> StateStore::find(Selector by, const QString& value, bool* ok)
{
    QList<NotificationRecord> result;
    for (const auto& record : list(ok)) {
        if (matches(record, by, value))
            result.append(record);
    }
    return result;
}

bool StateStore::remove(quint64 id)
{
    const QString path = recordPath(id);
    if (::unlink(nativePath(path).constData()) == 0)
        return true;
    const int err = errno;
    if (err == ENOENT)
        return true;
    errorString_ = QStringLiteral("cannot remove %1: %2")
                       .arg(path, QString::fromLocal8Bit(std::strerror(err)));
    return false;
}

bool StateStore::removeIf(quint64 id, const std::function<bool(const QByteArray&)>& owned)
{
    return takeIf(recordPath(id), owned);
}

bool StateStore::remove(const NotificationRecord& record)
{
    return removeIf(record.id, [&record](const QByteArray& current) {
        NotificationRecord held;
        return RecordCodec::decode(current, held) && held.isSameRegistration(record);
    });
}

bool StateStore::takeIf(const QString& path, const std::function<bool(const QByteArray&)>& owned)
{
    // Move the file out of the way first so a record that was re-registered
    // under the same name since the caller looked at it is never deleted.
    const QString aside = temporaryPath(RECLAIM_PREFIX, QFileInfo(path).fileName());
    if (::rename(nativePath(path).constData(), nativePath(aside).constData()) != 0) {
        const int err = errno;
        if (err == ENOENT)
            return true;
        errorString_ = QStringLiteral("cannot remove %1: %2")
                           .arg(path, QString::fromLocal8Bit(std::strerror(err)));
        return false;
    }

    QFile moved(aside);
    QByteArray current;
    if (moved.open(QIODevice::ReadOnly)) {
        current = moved.readAll();
        moved.close();
    }

    if (owned(current)) {
        ::unlink(nativePath(aside).constData());
        return true;
    }

    BOOST_LOG_TRIVIAL(debug) << "StateStore: " << path.toStdString()
                             << " holds another record, restoring it";
    restore(aside, path, current);
    return true;
}

void StateStore::restore(const QString& aside, const QString& path, const QByteArray& bytes)
{
    if (::link(nativePath(aside).constData(), nativePath(path).constData()) == 0) {
        ::unlink(nativePath(aside).constData());
        return;
    }
    const int err = errno;

    NotificationRecord record;
    if (err != EEXIST || !RecordCodec::decode(bytes, record)) {
        BOOST_LOG_TRIVIAL(warning) << "StateStore: cannot restore " << path.toStdString()
                                   << ": " << std::strerror(err);
        ::unlink(nativePath(aside).constData());
        return;
    }

    // The name was taken again while the file was aside. The popup is still
    // on screen, so it gets a new id rather than losing its record.
    const quint64 previousId = record.id;
    if (publish(record)) {
        BOOST_LOG_TRIVIAL(warning) << "StateStore: record " << previousId << " of pid "
                                   << record.ownerPid << " lost its id while being restored,"
                                   << " republished as " << record.id;
    } else {
        BOOST_LOG_TRIVIAL(warning) << "StateStore: record " << previousId << " of pid "
                                   << record.ownerPid << " lost while being restored: "
                                   << errorString_.toStdString();
    }
    ::unlink(nativePath(aside).constData());
}

void StateStore::reclaim(const QString& path, const QByteArray& staleBytes)
{
    const bool taken = takeIf(path, [&staleBytes](const QByteArray& current) {
        return current == staleBytes;
    });
    if (!taken)
        BOOST_LOG_TRIVIAL(warning) << "StateStore: cannot reclaim: " << errorString_.toStdString();
}

void StateStore::sweepTemporaries(const QDir& dir)
{
    const QStringList leftovers = dir.entryList(
        {PENDING_PREFIX + "*", RECLAIM_PREFIX + "*"}, QDir::Files | QDir::Hidden);

    for (const auto& entry : leftovers) {
        // .pending-<pid>-... / .reclaim-<pid>-...
        bool ok = false;
        const qint64 pid = entry.section(QLatin1Char('-'), 1, 1).toLongLong(&ok);
        if (!ok || pid == QCoreApplication::applicationPid() || probe_->isAlive(pid))
            continue;
        BOOST_LOG_TRIVIAL(debug) << "StateStore: removing leftover " << entry.toStdString();
        ::unlink(nativePath(dir.filePath(entry)).constData());
    }
}

RecordHandle::RecordHandle(StateStore* store, const NotificationRecord& record)
    : store_(store)
    , record_(record)
{
}

RecordHandle::~RecordHandle()
{
    if (!released_)
        release();
}

bool RecordHandle::release()
{
    if (released_)
        return true;
    released_ = true;
    if (!store_->remove(record_)) {
        BOOST_LOG_TRIVIAL(warning) << "StateStore: " << store_->errorString().toStdString();
        return false;
    }
    return true;
}

} // namespace creak
