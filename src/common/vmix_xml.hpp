#pragma once

#include "common/model.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QString>

#include <optional>

namespace vms::protocol {

// The part of the vMix state document this application consumes.
struct VmixState {
    model::StatusFields status;
    model::InputList inputs;
    model::VideoLists videoLists;
};

std::optional<VmixState> parse_state(const QByteArray &xml, QString *error = nullptr);

}  // namespace vms::protocol
