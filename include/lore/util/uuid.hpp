#pragma once

#include "../types.hpp"
#include <string>

namespace lore {
namespace util {

/**
 * @brief Random RFC 4122 version-4 UUID in canonical lowercase form
 *
 * Drawn from OpenSSL's CSPRNG, so it is also suitable for API keys.
 */
Expected<std::string> generate_uuid();

} // namespace util
} // namespace lore
