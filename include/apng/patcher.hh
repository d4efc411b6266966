/**
 * @file patcher.hh
 * @brief Write pass: rewrite frame control records in place
 */

#pragma once

#include <apng/export_apng.h>
#include <apng/options.hh>
#include <apng/walker.hh>

namespace apng {

    class byte_buffer;

    /**
     * @brief Rewrite every fcTL record listed in @p frames
     *
     * Each record is written back at its recorded offset with delay_num
     * replaced by options.delay (when set) and a freshly derived CRC.
     * Bytes outside the recorded records are never touched.
     *
     * @param out Big-endian buffer over a copy of the walked stream
     * @param frames Frame table produced by walk()
     * @param options Patch options
     */
    APNG_EXPORT void patch(byte_buffer& out, const frame_table& frames, const patch_options& options = {});

} // namespace apng
