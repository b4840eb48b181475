#pragma once

#include "IOwnerProbe.hpp"

namespace creak {

/// IOwnerProbe backed by kill(2): signal 0 for liveness, SIGTERM to terminate.
class ProcessOwnerProbe : public IOwnerProbe {
public:
    bool isAlive(qint64 pid) const override;
    Termination requestTermination(qint64 pid) override;

    static ProcessOwnerProbe* instance();
};

} // namespace creak
