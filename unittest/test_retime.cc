//
// End-to-end processing of files on disk, including the backup copy
//

#include <doctest/doctest.h>
#include <apng/retime.hh>
#include <apng/byte_buffer.hh>
#include <apng/chunk_types.hh>
#include <apng/exceptions.hh>
#include <apng/walker.hh>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <vector>

#include "test_utils.hh"

using namespace apng;
namespace fs = std::filesystem;

namespace {
    // Scratch directory removed when the test case ends
    class temp_dir {
    public:
        temp_dir() {
            std::random_device rd;
            m_path = fs::temp_directory_path() / ("apng_unittest_" + std::to_string(rd()));
            fs::create_directories(m_path);
        }

        ~temp_dir() {
            std::error_code ec;
            fs::remove_all(m_path, ec);
        }

        temp_dir(const temp_dir&) = delete;
        temp_dir& operator = (const temp_dir&) = delete;

        const fs::path& path() const { return m_path; }

    private:
        fs::path m_path;
    };

    void write_file(const fs::path& path, const bytes& data) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }

    bytes read_file(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        return to_bytes(text);
    }

    std::vector<std::uint64_t> delays_of(const fs::path& path) {
        std::fstream file(path, std::ios::in | std::ios::binary);
        byte_buffer buf(file, byte_order::big);
        std::vector<std::uint64_t> result;
        for (const auto& frame : walk(buf)) {
            result.push_back(frame.data.get_uint("delay_num"));
        }
        return result;
    }

    bytes sample_animation() {
        fctl_fields first;
        first.sequence_number = 0;
        first.delay_num = 5;
        fctl_fields second;
        second.sequence_number = 1;
        second.delay_num = 9;

        return make_png({
            make_chunk(chunk_id::IHDR, ihdr_payload()),
            make_chunk(chunk_id::acTL, actl_payload(2, 0)),
            make_chunk(chunk_id::fcTL, fctl_payload(first)),
            make_chunk(chunk_id::IDAT, bytes(16, std::byte{1})),
            make_chunk(chunk_id::fcTL, fctl_payload(second)),
            make_chunk(chunk_id::fdAT, bytes(20, std::byte{2})),
            make_chunk(chunk_id::IEND, {})
        });
    }
}

TEST_CASE("retime - backup path") {
    CHECK(backup_path("dir/anim.png") == fs::path("dir/anim.png.bak"));
}

TEST_CASE("retime - first run creates the backup and patches the target") {
    temp_dir tmp;
    auto target = tmp.path() / "anim.png";
    auto original = sample_animation();
    write_file(target, original);

    std::vector<std::string> messages;
    retime_options options;
    options.patch.delay = 12;
    options.on_message = [&](std::string_view m) { messages.emplace_back(m); };

    auto result = retime_file(target, options);
    CHECK(result.frames == 2);
    CHECK(result.backup_created);
    CHECK(result.backup == backup_path(target));

    CHECK(read_file(result.backup) == original);
    CHECK(delays_of(target) == std::vector<std::uint64_t>{12, 12});
    CHECK(read_file(target).size() == original.size());

    // Backup creation and restore of the target
    REQUIRE(messages.size() == 2);
    CHECK(messages[0].rfind("cp ", 0) == 0);
}

TEST_CASE("retime - repeated runs start from the backup") {
    temp_dir tmp;
    auto target = tmp.path() / "anim.png";
    auto original = sample_animation();
    write_file(target, original);

    retime_options options;
    options.patch.delay = 10;
    CHECK(retime_file(target, options).backup_created);
    CHECK(delays_of(target) == std::vector<std::uint64_t>{10, 10});

    options.patch.delay = 40;
    auto second = retime_file(target, options);
    CHECK_FALSE(second.backup_created);
    CHECK(delays_of(target) == std::vector<std::uint64_t>{40, 40});
    CHECK(read_file(backup_path(target)) == original);

    SUBCASE("no override restores the original timing") {
        retime_file(target, retime_options{});
        CHECK(read_file(target) == original);
    }

    SUBCASE("an edited target is replaced by the backup") {
        write_file(target, to_bytes("not a png anymore"));
        options.patch.delay = 2;
        retime_file(target, options);
        CHECK(delays_of(target) == std::vector<std::uint64_t>{2, 2});
    }
}

TEST_CASE("retime - parse failures leave the target untouched") {
    temp_dir tmp;
    auto target = tmp.path() / "broken.png";
    auto broken = make_png({
        make_chunk(chunk_id::IHDR, ihdr_payload()),
        make_chunk("zTXt", to_bytes("compressed")),
        make_chunk(chunk_id::IEND, {})
    });
    write_file(target, broken);

    retime_options options;
    options.patch.delay = 1;
    CHECK_THROWS_AS(retime_file(target, options), unknown_chunk_error);
    CHECK(read_file(target) == broken);
    CHECK(read_file(backup_path(target)) == broken);
}

TEST_CASE("retime - missing input") {
    temp_dir tmp;
    CHECK_THROWS_AS(retime_file(tmp.path() / "absent.png"), io_error);
    CHECK_FALSE(fs::exists(tmp.path() / "absent.png.bak"));
}
