#include "runtime/state.h"

namespace chitty {

std::atomic<bool> g_running_flag{true};

}  // namespace chitty
