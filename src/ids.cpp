#include "ids.h"
#include "errors.h"
#include "file_utils.h"
#include <openssl/rand.h>
#include <cctype>

namespace cloudrun {

std::string generate_id(const std::string& prefix) {
    unsigned char bytes[6];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw CloudrunError("failed to generate random id");
    }
    return prefix + FileUtils::bytes_to_hex(bytes, sizeof(bytes));
}

std::string container_name(const std::string& language_id,
                           const std::string& execution_id,
                           const std::string& purpose) {
    // Docker names allow [a-zA-Z0-9_.-]
    std::string safe_language;
    for (char c : language_id) {
        unsigned char uc = static_cast<unsigned char>(c);
        safe_language += (std::isalnum(uc) || c == '_' || c == '.' || c == '-') ? c : '_';
    }
    std::string name = "cloudrun_" + safe_language + "_" + execution_id;
    if (!purpose.empty()) {
        name += "_" + purpose;
    }
    return name;
}

} // namespace cloudrun
