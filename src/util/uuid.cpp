#include "lore/util/uuid.hpp"

#include <iomanip>
#include <sstream>
#include <openssl/err.h>
#include <openssl/rand.h>

namespace lore {
namespace util {

Expected<std::string> generate_uuid() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        char reason[256];
        ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
        return tl::unexpected(Error{ErrorCode::Unknown, "Failed to gather random bytes for UUID", std::string(reason)});
    }

    // Set version 4
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    // Set variant
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

} // namespace util
} // namespace lore
