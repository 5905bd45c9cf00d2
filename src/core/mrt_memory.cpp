/**
 * @file mrt_memory.cpp
 * @brief modelrt - Memory Helpers
 */

#include <cstdlib>
#include <cstring>

#include "mrt/core/mrt_types.h"

extern "C" {

void* mrt_alloc(size_t size) {
    return malloc(size == 0 ? 1 : size);
}

void mrt_free(void* ptr) {
    free(ptr);
}

char* mrt_strdup(const char* str) {
    if (str == nullptr) {
        return nullptr;
    }
    size_t len = strlen(str);
    char* copy = static_cast<char*>(malloc(len + 1));
    if (copy != nullptr) {
        memcpy(copy, str, len + 1);
    }
    return copy;
}

}  // extern "C"
