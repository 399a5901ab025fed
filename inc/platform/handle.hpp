/**
 * Native OS input handle
 */

#pragma once

#ifdef _WIN32
#include <windows.h>
#endif

namespace ttyin {
namespace platform {

#ifdef _WIN32
using NativeHandle = HANDLE;
#else
using NativeHandle = int;  // File descriptor
#endif

} // namespace platform
} // namespace ttyin
