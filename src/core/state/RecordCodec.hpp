#pragma once

#include "NotificationRecord.hpp"
#include <QByteArray>
#include <QString>

namespace creak {

/// Serializes a NotificationRecord to the bytes stored in one record file.
///
/// The encoding is a compact JSON object tagged with "format": "creak-record"
/// and a version number, so a file that fails to decode can be told apart
/// from a file that simply is not a record.
class RecordCodec {
public:
    static constexpr int FORMAT_VERSION = 1;
    static constexpr const char* FORMAT_TAG = "creak-record";

    static QByteArray encode(const NotificationRecord& record);

    /// Returns false on truncated or malformed input; `record` is left untouched
    /// and `error` (if given) describes the problem.
    static bool decode(const QByteArray& bytes, NotificationRecord& record, QString* error = nullptr);
};

} // namespace creak
