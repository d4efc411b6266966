//
// Write pass over a PNG stream.
//

#include <apng/patcher.hh>
#include <apng/byte_buffer.hh>
#include <apng/chunk_types.hh>

namespace apng {

    void patch(byte_buffer& out, const frame_table& frames, const patch_options& options) {
        const auto& fctl = fctl_schema();

        for (const auto& frame : frames) {
            record updated = frame.data;
            if (options.delay) {
                updated.set("delay_num", std::uint64_t{*options.delay});
            }

            if (options.on_write) {
                options.on_write(frame.offset, fctl.finalize(updated, out.order()));
            }

            out.seek(frame.offset);
            fctl.write(out, updated);
        }
    }

} // namespace apng
