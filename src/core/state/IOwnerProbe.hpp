#pragma once

#include <QtGlobal>

namespace creak {

/// Liveness check and termination request for the process owning a record.
/// Implementations must be cheap: the store probes every record it lists.
class IOwnerProbe {
public:
    enum class Termination {
        Delivered,
        NoSuchProcess,
        Failed
    };

    virtual ~IOwnerProbe() = default;

    virtual bool isAlive(qint64 pid) const = 0;

    /// Ask the owner to tear its popup down. Does not wait.
    virtual Termination requestTermination(qint64 pid) = 0;
};

} // namespace creak
