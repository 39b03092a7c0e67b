/// @file version.cpp
/// @brief Version constants for mudhost

#include <mudhost/core/version.hpp>

namespace mudhost_core {

Version server_version() {
    return Version{0, 3, 0};
}

} // namespace mudhost_core
