#pragma once

#include <cstdint>
#include <core/constants.hpp>

// Buffer (flow-control window) and chunk sizes for a transfer of `file_size` bytes.
struct TransferSizing {
    uint64_t buffer;
    uint64_t chunk;
};

inline TransferSizing sizing_for(uint64_t file_size) {
    if (file_size > LARGE_FILE_THRESHOLD)  return {16 * MiB, 4 * MiB};
    if (file_size > MEDIUM_FILE_THRESHOLD) return {8 * MiB, 2 * MiB};
    return {1 * MiB, 1 * MiB};
}
