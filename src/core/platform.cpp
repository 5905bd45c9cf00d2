/**
 * @file platform.cpp
 * @brief modelrt - Platform Services Implementation
 */

#include "core/platform.h"

#include <chrono>
#include <filesystem>
#include <system_error>

#if defined(__linux__)
#include <sys/sysinfo.h>
#endif
#include <unistd.h>

#include "mrt/core/mrt_error.h"

namespace mrt {

Platform::Platform(const mrt_platform_adapter_t* adapter) {
    if (adapter != nullptr) {
        adapter_ = *adapter;
        has_adapter_ = true;
    }
}

int64_t Platform::now_ms() const {
    if (has_adapter_ && adapter_.now_ms) {
        return adapter_.now_ms(adapter_.user_data);
    }
    auto now = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

mrt_result_t Platform::memory_info(mrt_memory_info_t* out_info) const {
    if (out_info == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    if (has_adapter_ && adapter_.get_memory_info) {
        return adapter_.get_memory_info(out_info, adapter_.user_data);
    }

#if defined(__linux__)
    struct sysinfo info;
    if (sysinfo(&info) == 0) {
        out_info->total_bytes = static_cast<uint64_t>(info.totalram) * info.mem_unit;
        out_info->available_bytes = static_cast<uint64_t>(info.freeram) * info.mem_unit;
        return MRT_SUCCESS;
    }
#endif
    long pages = sysconf(_SC_PHYS_PAGES);
    long page_size = sysconf(_SC_PAGE_SIZE);
    if (pages <= 0 || page_size <= 0) {
        mrt_error_set_details("Unable to query device memory");
        return MRT_ERROR_NOT_SUPPORTED;
    }
    out_info->total_bytes = static_cast<uint64_t>(pages) * static_cast<uint64_t>(page_size);
    out_info->available_bytes = out_info->total_bytes;
    return MRT_SUCCESS;
}

mrt_result_t Platform::free_storage(const std::string& path, uint64_t* out_bytes) const {
    if (out_bytes == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    if (has_adapter_ && adapter_.get_free_storage) {
        return adapter_.get_free_storage(path.c_str(), out_bytes, adapter_.user_data);
    }
    std::error_code ec;
    auto space = std::filesystem::space(path, ec);
    if (ec) {
        mrt_error_set_details(ec.message().c_str());
        return MRT_ERROR_FILE_IO;
    }
    *out_bytes = static_cast<uint64_t>(space.available);
    return MRT_SUCCESS;
}

const mrt_http_transport_t* Platform::http_transport() const {
    return has_adapter_ ? adapter_.http_transport : nullptr;
}

}  // namespace mrt
