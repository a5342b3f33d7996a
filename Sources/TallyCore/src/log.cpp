#include "tally/log.hpp"

namespace tally {

// Single definition shared by every translation unit.
std::atomic<log_level> g_log_level{log_level::off};

} // namespace tally
