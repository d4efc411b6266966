//
// Backup, read pass, restore and write pass for one file.
//

#include <apng/retime.hh>
#include <apng/byte_buffer.hh>
#include <apng/exceptions.hh>
#include <apng/patcher.hh>
#include <apng/walker.hh>

#include <fstream>
#include <system_error>

namespace apng {

    namespace fs = std::filesystem;

    namespace {
        void report(const retime_options& options, const std::string& message) {
            if (options.on_message) {
                options.on_message(message);
            }
        }

        void copy(const fs::path& from, const fs::path& to, const retime_options& options) {
            std::error_code ec;
            fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
            THROW_IO_IF(ec, "Cannot copy ", from, " to ", to, ": ", ec.message());
            report(options, build_error_msg("cp ", from.string(), " ", to.string()));
        }
    }

    fs::path backup_path(const fs::path& target) {
        fs::path result = target;
        result += ".bak";
        return result;
    }

    retime_result retime_file(const fs::path& target, const retime_options& options) {
        retime_result result;
        result.backup = backup_path(target);

        std::error_code ec;
        bool have_backup = fs::exists(result.backup, ec);
        THROW_IO_IF(ec, "Cannot inspect ", result.backup, ": ", ec.message());
        if (!have_backup) {
            copy(target, result.backup, options);
            result.backup_created = true;
        }

        frame_table frames;
        {
            std::fstream source(result.backup, std::ios::in | std::ios::binary);
            THROW_IO_UNLESS(source.is_open(), "Cannot open ", result.backup, " for reading");
            byte_buffer buf(source, byte_order::big);
            frames = walk(buf, options.walk);
        }

        fs::remove(target, ec);
        THROW_IO_IF(ec, "Cannot remove ", target, ": ", ec.message());
        copy(result.backup, target, options);

        {
            std::fstream dest(target, std::ios::in | std::ios::out | std::ios::binary);
            THROW_IO_UNLESS(dest.is_open(), "Cannot open ", target, " for writing");
            byte_buffer buf(dest, byte_order::big);
            patch(buf, frames, options.patch);
            dest.flush();
            THROW_IO_UNLESS(dest.good(), "Failed to flush ", target);
        }

        result.frames = frames.size();
        return result;
    }

} // namespace apng
