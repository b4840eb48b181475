#include "RecordCodec.hpp"
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <climits>
#include <cmath>
#include <limits>
#include <sys/types.h>

namespace creak {

namespace {

bool fail(QString* error, const QString& message)
{
    if (error)
        *error = message;
    return false;
}

// Largest magnitude a double holds without losing integer precision (2^53).
constexpr double MAX_EXACT_INTEGER = 9007199254740992.0;

// JSON numbers are doubles; reject anything that is not an exact integer.
bool readInteger(const QJsonObject& obj, const char* key, qint64* out)
{
    const QJsonValue v = obj.value(QLatin1String(key));
    if (!v.isDouble())
        return false;
    const double d = v.toDouble();
    if (!std::isfinite(d) || std::floor(d) != d || std::fabs(d) > MAX_EXACT_INTEGER)
        return false;
    *out = static_cast<qint64>(d);
    return true;
}

bool readInt(const QJsonObject& obj, const char* key, int minimum, int* out)
{
    qint64 value = 0;
    if (!readInteger(obj, key, &value) || value < minimum || value > INT_MAX)
        return false;
    *out = static_cast<int>(value);
    return true;
}

bool readOptionalString(const QJsonObject& obj, const char* key, QString* out)
{
    const QJsonValue v = obj.value(QLatin1String(key));
    if (v.isUndefined() || v.isNull()) {
        out->clear();
        return true;
    }
    if (!v.isString())
        return false;
    *out = v.toString();
    return true;
}

} // namespace

QByteArray RecordCodec::encode(const NotificationRecord& record)
{
    QJsonObject obj;
    obj["format"] = QLatin1String(FORMAT_TAG);
    obj["version"] = FORMAT_VERSION;
    // 64-bit ids do not survive a round trip through a JSON double
    obj["id"] = QString::number(record.id);
    obj["edge"] = edgeName(record.edge);
    obj["offset"] = record.offset;
    obj["width"] = record.size.width();
    obj["height"] = record.size.height();
    obj["created_at"] = static_cast<double>(record.createdAtMs);
    obj["timeout_ms"] = static_cast<double>(record.timeoutMs);
    obj["pid"] = static_cast<double>(record.ownerPid);
    if (!record.name.isEmpty())
        obj["name"] = record.name;
    if (!record.className.isEmpty())
        obj["class"] = record.className;
    if (!record.summary.isEmpty())
        obj["summary"] = record.summary;

    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

bool RecordCodec::decode(const QByteArray& bytes, NotificationRecord& record, QString* error)
{
    if (bytes.trimmed().isEmpty())
        return fail(error, QStringLiteral("empty record"));

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(bytes, &parseError);
    if (parseError.error != QJsonParseError::NoError)
        return fail(error, QStringLiteral("invalid JSON at offset %1: %2")
                               .arg(parseError.offset).arg(parseError.errorString()));
    if (!doc.isObject())
        return fail(error, QStringLiteral("record is not a JSON object"));

    const QJsonObject obj = doc.object();
    if (obj.value("format").toString() != QLatin1String(FORMAT_TAG))
        return fail(error, QStringLiteral("missing or foreign format tag"));

    qint64 version = 0;
    if (!readInteger(obj, "version", &version) || version != FORMAT_VERSION)
        return fail(error, QStringLiteral("unsupported record version"));

    NotificationRecord r;

    bool idOk = false;
    r.id = obj.value("id").toString().toULongLong(&idOk);
    if (!idOk || r.id == 0)
        return fail(error, QStringLiteral("missing or invalid id"));

    if (!edgeFromName(obj.value("edge").toString(), &r.edge))
        return fail(error, QStringLiteral("unknown edge '%1'").arg(obj.value("edge").toString()));

    int offset = 0, width = 0, height = 0;
    if (!readInt(obj, "offset", INT_MIN, &offset)
        || !readInt(obj, "width", 0, &width)
        || !readInt(obj, "height", 0, &height))
        return fail(error, QStringLiteral("missing or invalid geometry"));
    r.offset = offset;
    r.size = QSize(width, height);

    if (!readInteger(obj, "created_at", &r.createdAtMs)
        || !readInteger(obj, "timeout_ms", &r.timeoutMs)
        || !readInteger(obj, "pid", &r.ownerPid))
        return fail(error, QStringLiteral("missing or invalid timing/owner fields"));
    if (r.createdAtMs < 0)
        return fail(error, QStringLiteral("negative creation time"));
    if (r.timeoutMs < 0 || r.timeoutMs > INT_MAX)
        return fail(error, QStringLiteral("timeout out of range"));
    if (r.ownerPid <= 0 || r.ownerPid > std::numeric_limits<pid_t>::max())
        return fail(error, QStringLiteral("owner pid %1 out of range").arg(r.ownerPid));

    if (!readOptionalString(obj, "name", &r.name)
        || !readOptionalString(obj, "class", &r.className)
        || !readOptionalString(obj, "summary", &r.summary))
        return fail(error, QStringLiteral("tag fields must be strings"));

    record = r;
    return true;
}

} // namespace creak
