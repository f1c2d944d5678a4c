#pragma once
#include <string>

namespace cloudrun {

// Random identifier "<prefix><12 lowercase hex chars>", e.g. "exec_3fa9c01b77de".
// Throws CloudrunError if the system RNG is unavailable.
std::string generate_id(const std::string& prefix);

// Container name for one sandbox of an execution
std::string container_name(const std::string& language_id,
                           const std::string& execution_id,
                           const std::string& purpose);

} // namespace cloudrun
