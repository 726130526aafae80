#include "sync/Device.hpp"
#include "sync/Error.hpp"
#include "fs/ops.hpp"

namespace rcs::sync {

bool isDeviceConnected(const model::Layout& layout) {
    return fs::ops::isDir(layout.deviceRoot);
}

void requireDevice(const model::Layout& layout) {
    if (!isDeviceConnected(layout))
        throw Error(ErrorKind::DeviceNotConnected, "BOSS RC-202 not found at " + layout.deviceRoot.string());
}

}
