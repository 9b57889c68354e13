#include "anchorlog/log.hpp"

namespace anchorlog {

std::atomic<log_level> g_log_level{log_level::warn};

} // namespace anchorlog
