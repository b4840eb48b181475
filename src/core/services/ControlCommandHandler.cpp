#include "ControlCommandHandler.hpp"
#include "core/state/IOwnerProbe.hpp"
#include "core/state/ProcessOwnerProbe.hpp"
#include <QCoreApplication>
#include <QDeadlineTimer>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QThread>
#include <boost/log/trivial.hpp>
#include <algorithm>

namespace creak {

ControlCommandHandler::ControlCommandHandler(StateStore* store, IOwnerProbe* probe)
    : store_(store)
    , probe_(probe ? probe : ProcessOwnerProbe::instance())
{
}

QList<NotificationRecord> ControlCommandHandler::listActive(bool* ok)
{
    return store_->list(ok);
}

bool ControlCommandHandler::forceRemove(const NotificationRecord& record, ClearReport& report)
{
    // Only the matched registration: the id may already belong to a new popup.
    if (store_->remove(record)) {
        ++report.forced;
        return true;
    }
    BOOST_LOG_TRIVIAL(error) << "ControlCommandHandler: " << store_->errorString().toStdString();
    report.failed.append(record.id);
    return false;
}

ClearReport ControlCommandHandler::clear(StateStore::Selector by, const QString& value)
{
    ClearReport report;

    bool ok = false;
    const QList<NotificationRecord> matches = store_->find(by, value, &ok);
    if (!ok) {
        report.storeError = true;
        report.errorString = store_->errorString();
        return report;
    }
    report.matched = matches.size();

    QList<NotificationRecord> signaled;
    for (const auto& record : matches) {
        if (record.ownerPid == QCoreApplication::applicationPid()) {
            forceRemove(record, report);
            continue;
        }

        switch (probe_->requestTermination(record.ownerPid)) {
        case IOwnerProbe::Termination::Delivered:
            signaled.append(record);
            break;
        case IOwnerProbe::Termination::NoSuchProcess:
            BOOST_LOG_TRIVIAL(debug) << "ControlCommandHandler: owner of record " << record.id
                                     << " is gone, removing it directly";
            forceRemove(record, report);
            break;
        case IOwnerProbe::Termination::Failed:
            report.notExited.append(record.id);
            forceRemove(record, report);
            break;
        }
    }

    // Wait for the signaled owners to remove their own records.
    QDeadlineTimer deadline(graceMs_);
    while (!signaled.isEmpty()) {
        bool listed = false;
        const QList<NotificationRecord> live = store_->list(&listed);
        if (!listed)
            break;

        for (auto it = signaled.begin(); it != signaled.end();) {
            const bool present = std::any_of(live.begin(), live.end(),
                [&](const NotificationRecord& r) { return r.isSameRegistration(*it); });
            if (present) {
                ++it;
            } else {
                ++report.graceful;
                it = signaled.erase(it);
            }
        }

        if (signaled.isEmpty() || deadline.hasExpired())
            break;
        QThread::msleep(POLL_INTERVAL_MS);
    }

    for (const auto& record : signaled) {
        BOOST_LOG_TRIVIAL(warning) << "ControlCommandHandler: pid " << record.ownerPid
                                   << " did not remove record " << record.id << " in time";
        report.notExited.append(record.id);
        forceRemove(record, report);
    }

    return report;
}

QByteArray ControlCommandHandler::toJson(const QList<NotificationRecord>& records)
{
    QJsonArray array;
    for (const auto& record : records) {
        QJsonObject obj;
        obj["id"] = static_cast<double>(record.id);
        obj["name"] = record.name.isEmpty() ? QJsonValue() : QJsonValue(record.name);
        obj["class"] = record.className.isEmpty() ? QJsonValue() : QJsonValue(record.className);
        obj["edge"] = edgeName(record.edge);
        obj["offset"] = record.offset;
        obj["width"] = record.size.width();
        obj["height"] = record.size.height();
        obj["created_at"] = static_cast<double>(record.createdAtMs);
        obj["timeout_ms"] = static_cast<double>(record.timeoutMs);
        obj["pid"] = static_cast<double>(record.ownerPid);
        obj["summary"] = record.summary;
        array.append(obj);
    }
    return QJsonDocument(array).toJson(QJsonDocument::Indented);
}

} // namespace creak
