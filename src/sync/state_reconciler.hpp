#pragma once

#include "common/model.hpp"

#include <optional>

namespace vms::sync {

struct Reconciliation {
    bool accepted = false;
    bool statusChanged = false;
    bool inputsChanged = false;
    bool videoListsChanged = false;
    model::Connection connection;
    // What the cache holds afterwards. Video lists in it are the freshly built payload.
    model::Snapshot snapshot;
};

class StateReconciler {
public:
    // Snapshots not strictly newer than the cached one are rejected. A forced pass reports
    // every part as changed so subscribers get one confirming emission.
    Reconciliation reconcile(const model::Connection &current, const std::optional<model::Snapshot> &cached,
                             const model::Snapshot &incoming, bool forced) const;

    // Deep copy into new containers with normalised selection; shares no storage with the input.
    static model::VideoLists rebuild(const model::VideoLists &lists);
    static model::InputList rebuild(const model::InputList &inputs);
};

}  // namespace vms::sync
