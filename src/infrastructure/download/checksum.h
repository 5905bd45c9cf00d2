#ifndef MRT_CHECKSUM_H
#define MRT_CHECKSUM_H

#include <string>

#include "mrt/core/mrt_types.h"

namespace mrt {

/**
 * @brief SHA-256 of a file as lowercase hex
 *
 * @return MRT_SUCCESS, MRT_ERROR_FILE_IO, MRT_ERROR_INTERNAL (digest failure)
 */
mrt_result_t sha256_file(const std::string& path, std::string* out_hex);

// Case-insensitive hex comparison
bool checksum_matches(const std::string& expected, const std::string& actual);

}  // namespace mrt

#endif  // MRT_CHECKSUM_H
