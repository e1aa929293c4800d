#pragma once

#include <string>

namespace nhdsync::util::log {

// Maps trace|debug|info|warn|error|critical onto the shared logger. Unknown
// names fall back to info.
void set_level(const std::string& level);

void debug(const std::string& message);
void info(const std::string& message);
void warn(const std::string& message);
void error(const std::string& message);

}  // namespace nhdsync::util::log
