#include "PopupLifecycle.hpp"
#include "IPopupSurface.hpp"
#include "StackPlacement.hpp"
#include "core/state/StateStore.hpp"
#include <QCoreApplication>
#include <QDateTime>
#include <boost/log/trivial.hpp>
#include <climits>

namespace creak {

PopupLifecycle::PopupLifecycle(const PopupOptions& options, StateStore* store,
                               IPopupSurface* surface, QObject* parent)
    : QObject(parent)
    , options_(options)
    , store_(store)
    , surface_(surface)
{
    timeoutTimer_.setSingleShot(true);
    connect(&timeoutTimer_, &QTimer::timeout, this, &PopupLifecycle::expire);
}

// handle_ removes a record that is still registered
PopupLifecycle::~PopupLifecycle() = default;

void PopupLifecycle::setState(State state)
{
    if (state_ == state)
        return;
    state_ = state;
    emit stateChanged(state);
}

void PopupLifecycle::fail(const QString& message)
{
    errorString_ = message;
    BOOST_LOG_TRIVIAL(error) << "PopupLifecycle: " << message.toStdString();
    setState(Removed);
    emit finished(ExitFailure);
}

void PopupLifecycle::start()
{
    if (state_ != Pending)
        return;

    if (!store_->open()) {
        fail(store_->errorString());
        return;
    }

    const QSize size = surface_->measure(options_.message);

    QList<NotificationRecord> siblings;
    if (options_.stack) {
        bool ok = false;
        siblings = store_->list(&ok);
        if (!ok) {
            fail(store_->errorString());
            return;
        }
    }
    offset_ = stackOffset(options_.edge, siblings, options_.stackGap, options_.defaultOffset);

    NotificationRecord record;
    record.name = options_.name;
    record.className = options_.className;
    record.edge = options_.edge;
    record.offset = offset_;
    record.size = size;
    record.createdAtMs = QDateTime::currentMSecsSinceEpoch();
    record.timeoutMs = options_.timeoutMs;
    record.ownerPid = QCoreApplication::applicationPid();
    record.summary = messageSummary(options_.message);

    handle_ = store_->registerRecord(record);
    if (!handle_) {
        fail(store_->errorString());
        return;
    }
    recordId_ = handle_->id();
    setState(Registered);

    const QRect geometry = popupGeometry(surface_->screenGeometry(), options_.edge, size,
                                         options_.edgeMargin, offset_, options_.defaultOffset);
    surface_->setDismissHandler([this]() { expire(); });
    if (!surface_->createSurface(geometry, options_.edge, options_.message)) {
        // Never leave a record behind for a popup that did not appear.
        if (!handle_->release())
            BOOST_LOG_TRIVIAL(warning) << "PopupLifecycle: record " << recordId_
                                       << " left for reclamation";
        handle_.reset();
        fail(QStringLiteral("cannot create popup surface: %1").arg(surface_->errorString()));
        return;
    }

    BOOST_LOG_TRIVIAL(debug) << "PopupLifecycle: record " << recordId_ << " displayed at "
                             << geometry.x() << "," << geometry.y()
                             << " for " << options_.timeoutMs << " ms";
    setState(Displayed);

    if (options_.timeoutMs > 0)
        timeoutTimer_.start(static_cast<int>(qMin<qint64>(options_.timeoutMs, INT_MAX)));
}

void PopupLifecycle::expire()
{
    if (state_ == Pending) {
        // Asked to go away before anything was shown.
        setState(Removed);
        emit finished(ExitOk);
        return;
    }
    if (state_ != Displayed)
        return;

    setState(Expiring);
    timeoutTimer_.stop();
    surface_->destroySurface();

    if (!handle_->release()) {
        // Whoever lists next reclaims the record once this process is gone.
        BOOST_LOG_TRIVIAL(warning) << "PopupLifecycle: leaving record " << recordId_
                                   << " for reclamation";
    }
    handle_.reset();

    setState(Removed);
    emit finished(ExitOk);
}

} // namespace creak
