#include "state_reconciler.hpp"

namespace vms::sync {

namespace {

model::VideoListItem copy_item(const model::VideoListItem &item) {
    model::VideoListItem result;
    result.key = item.key;
    result.number = item.number;
    result.title = item.title;
    result.type = item.type;
    result.state = item.state;
    result.selected = item.selected;
    result.enabled = item.enabled;
    return result;
}

}  // namespace

model::VideoLists StateReconciler::rebuild(const model::VideoLists &lists) {
    model::VideoLists result;
    result.reserve(lists.size());
    for (const auto &list : lists) {
        model::VideoListInput fresh;
        fresh.key = list.key;
        fresh.number = list.number;
        fresh.title = list.title;
        fresh.type = list.type;
        fresh.state = list.state;
        fresh.selectedIndex = list.selectedIndex;
        fresh.items.reserve(list.items.size());
        for (const auto &item : list.items) {
            fresh.items.push_back(copy_item(item));
        }
        model::normalize_selection(fresh);
        result.push_back(std::move(fresh));
    }
    return result;
}

model::InputList StateReconciler::rebuild(const model::InputList &inputs) {
    model::InputList result;
    result.reserve(inputs.size());
    for (const auto &input : inputs) {
        result.push_back(input);
    }
    return result;
}

Reconciliation StateReconciler::reconcile(const model::Connection &current, const std::optional<model::Snapshot> &cached,
                                          const model::Snapshot &incoming, bool forced) const {
    Reconciliation result;
    if (cached && incoming.sequence <= cached->sequence) {
        return result;
    }
    result.accepted = true;

    model::Connection next = current;
    next.status = model::ConnectionStatus::Connected;
    next.activeInput = incoming.status.activeInput;
    next.previewInput = incoming.status.previewInput;
    next.version = incoming.status.version;
    next.edition = incoming.status.edition;
    next.preset = incoming.status.preset;
    next.lastError.reset();

    const model::VideoLists normalized = rebuild(incoming.videoLists);

    result.statusChanged = forced || next != current || !cached || cached->status != incoming.status;
    result.inputsChanged = forced || !cached || cached->inputs != incoming.inputs;
    result.videoListsChanged = forced || !cached || cached->videoLists != normalized;

    result.connection = next;
    result.snapshot.host = incoming.host;
    result.snapshot.sequence = incoming.sequence;
    result.snapshot.status = incoming.status;
    if (result.inputsChanged) {
        result.snapshot.inputs = rebuild(incoming.inputs);
    } else {
        result.snapshot.inputs = cached->inputs;
    }
    // Unchanged lists keep the cached graph; a change always publishes the new one.
    result.snapshot.videoLists = result.videoListsChanged ? normalized : cached->videoLists;
    return result;
}

}  // namespace vms::sync
