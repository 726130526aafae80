#pragma once

#include "sync/model/Layout.hpp"

namespace rcs::sync {

// Mount detection is reduced to the presence of the device root directory.
[[nodiscard]] bool isDeviceConnected(const model::Layout& layout);

// Throws sync::Error(DeviceNotConnected).
void requireDevice(const model::Layout& layout);

}
