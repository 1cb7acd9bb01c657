#pragma once

namespace platform {

// Detach from the controlling terminal; stdio goes to /dev/null.
void daemonize();

} // namespace platform
