/**
 * @file retime.hh
 * @brief End to end processing of one APNG file
 */

#pragma once

#include <cstddef>
#include <filesystem>

#include <apng/export_apng.h>
#include <apng/options.hh>

namespace apng {

    /**
     * @struct retime_result
     * @brief Outcome of retime_file()
     */
    struct retime_result {
        std::size_t frames = 0;          ///< fcTL records rewritten
        bool backup_created = false;     ///< False if the backup already existed
        std::filesystem::path backup;    ///< Path of the backup copy
    };

    /**
     * @brief Backup location for @p target ("<target>.bak")
     */
    APNG_EXPORT std::filesystem::path backup_path(const std::filesystem::path& target);

    /**
     * @brief Rewrite the frame delays of one file
     *
     * 1. "<target>.bak" is created from @p target unless it already exists;
     *    an existing backup is never overwritten, so repeated runs always
     *    start from the original bytes.
     * 2. The backup is walked.
     * 3. Only after a successful walk @p target is replaced by a copy of
     *    the backup and patched in place.
     *
     * A failure in the walk leaves both files untouched.
     *
     * @throws io_error on filesystem failures, plus everything walk() throws
     */
    APNG_EXPORT retime_result retime_file(const std::filesystem::path& target, const retime_options& options = {});

} // namespace apng
