// Unit tests for corpus file IO
#include <catch2/catch_test_macros.hpp>
#include "util/files.hpp"
#include <filesystem>

using namespace shapefuzz::util;

TEST_CASE("File utilities", "[util][files]") {
    // Create a temporary test directory
    auto test_dir = std::filesystem::temp_directory_path() / "shapefuzz_files_test";
    std::filesystem::remove_all(test_dir);

    SECTION("ensure_directory creates directories") {
        auto subdir = test_dir / "sub" / "nested";
        REQUIRE(ensure_directory(subdir));
        REQUIRE(std::filesystem::exists(subdir));
        REQUIRE(std::filesystem::is_directory(subdir));
        REQUIRE(ensure_directory(subdir));
    }

    SECTION("atomic_write_file creates file") {
        ensure_directory(test_dir);
        auto file_path = test_dir / "entry.bin";

        std::vector<uint8_t> data = {0x01, 0x02, 0x03, 0x04};
        REQUIRE(atomic_write_file(file_path, data));
        REQUIRE(std::filesystem::exists(file_path));
        REQUIRE(std::filesystem::file_size(file_path) == 4);
    }

    SECTION("read_file retrieves written data") {
        ensure_directory(test_dir);
        auto file_path = test_dir / "entry2.bin";

        std::vector<uint8_t> original = {0xDE, 0xAD, 0xBE, 0xEF};
        REQUIRE(atomic_write_file(file_path, original));

        auto read_data = read_file(file_path);
        REQUIRE(read_data == original);
    }

    SECTION("atomic_write_file overwrites existing file") {
        ensure_directory(test_dir);
        auto file_path = test_dir / "entry3.bin";

        std::vector<uint8_t> data1 = {0x01, 0x02};
        std::vector<uint8_t> data2 = {0x03, 0x04, 0x05};

        REQUIRE(atomic_write_file(file_path, data1));
        REQUIRE(atomic_write_file(file_path, data2));

        auto result = read_file(file_path);
        REQUIRE(result == data2);
    }

    SECTION("Empty entries are valid corpus files") {
        ensure_directory(test_dir);
        auto file_path = test_dir / "empty.bin";

        REQUIRE(atomic_write_file(file_path, std::vector<uint8_t>{}));
        REQUIRE(std::filesystem::exists(file_path));
        REQUIRE(read_file(file_path).empty());
    }

    SECTION("No temporary files are left behind") {
        ensure_directory(test_dir);
        for (int i = 0; i < 5; ++i) {
            REQUIRE(atomic_write_file(test_dir / ("e" + std::to_string(i) + ".bin"),
                                      std::vector<uint8_t>{static_cast<uint8_t>(i)}));
        }
        size_t count = 0;
        for (const auto& entry : std::filesystem::directory_iterator(test_dir)) {
            REQUIRE(entry.path().extension() == ".bin");
            ++count;
        }
        REQUIRE(count == 5);
    }

    SECTION("read_file returns empty on non-existent file") {
        auto file_path = test_dir / "nonexistent.bin";
        auto result = read_file(file_path);
        REQUIRE(result.empty());
    }

    SECTION("read_file refuses files above the limit") {
        ensure_directory(test_dir);
        auto file_path = test_dir / "big.bin";
        REQUIRE(atomic_write_file(file_path, std::vector<uint8_t>(64, 0xAA)));
        REQUIRE(read_file(file_path, 32).empty());
        REQUIRE(read_file(file_path, 64).size() == 64);
    }

    SECTION("atomic_write_file creates missing parents") {
        auto file_path = test_dir / "missing" / "entry.bin";
        REQUIRE(atomic_write_file(file_path, std::vector<uint8_t>{0x01}));
        REQUIRE(read_file(file_path) == std::vector<uint8_t>{0x01});
    }

    SECTION("atomic_write_file fails when the parent is a file") {
        ensure_directory(test_dir);
        auto blocker = test_dir / "blocker";
        REQUIRE(atomic_write_file(blocker, std::vector<uint8_t>{0x01}));
        REQUIRE_FALSE(atomic_write_file(blocker / "entry.bin", std::vector<uint8_t>{0x02}));
    }

    // Cleanup
    std::filesystem::remove_all(test_dir);
}
