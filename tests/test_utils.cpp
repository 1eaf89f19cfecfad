#include <catch2/catch_all.hpp>
#include <filesystem>
#include <string>
#include "utils.h"

namespace fs = std::filesystem;

TEST_CASE("String helpers", "[utils]") {
    SECTION("truncate_with_ellipsis") {
        REQUIRE(truncate_with_ellipsis("short", 10) == "short");
        REQUIRE(truncate_with_ellipsis("a_very_long_file_name.jpg", 10) == "a_very_...");
        REQUIRE(truncate_with_ellipsis("a_very_long_file_name.jpg", 3) == "a_very_long_file_name.jpg");
    }

    SECTION("to_lowercase") {
        REQUIRE(to_lowercase("IMG_0042.JPG") == "img_0042.jpg");
        REQUIRE(to_lowercase("") == "");
    }
}

TEST_CASE("Path helpers", "[utils]") {
    SECTION("normalize_path_separators") {
        REQUIRE(normalize_path_separators("C:\\Photos\\2024\\a.jpg") == "C:/Photos/2024/a.jpg");
        REQUIRE(normalize_path_separators("/already/forward") == "/already/forward");
    }

    SECTION("get_relative_path strips the root") {
        REQUIRE(get_relative_path("/photos/trip/a.jpg", "/photos") == "trip/a.jpg");
        REQUIRE(get_relative_path("/photos/trip/a.jpg", "/photos/") == "trip/a.jpg");
        REQUIRE(get_relative_path("C:\\photos\\a.jpg", "C:\\photos") == "a.jpg");
    }

    SECTION("Directory path without trailing slash does not match siblings") {
        REQUIRE(get_relative_path("/photos_old/a.jpg", "/photos") == "/photos_old/a.jpg");
    }

    SECTION("format_file_size") {
        REQUIRE(format_file_size(512) == "512 bytes");
        REQUIRE(format_file_size(2048) == "2.0 KB");
        REQUIRE(format_file_size(5 * 1024 * 1024 + 512 * 1024) == "5.5 MB");
    }
}

TEST_CASE("Supported image extensions", "[utils]") {
    REQUIRE(is_supported_image(fs::path("a.jpg")));
    REQUIRE(is_supported_image(fs::path("dir/B.JPEG")));
    REQUIRE(is_supported_image(fs::path("c.png")));
    REQUIRE(is_supported_image(fs::path("scan.pgm")));
    REQUIRE_FALSE(is_supported_image(fs::path("notes.txt")));
    REQUIRE_FALSE(is_supported_image(fs::path("raw.cr2")));
    REQUIRE_FALSE(is_supported_image(fs::path("no_extension")));
    REQUIRE_FALSE(is_supported_image(fs::path(".jpg")));

    for (const auto& extension : supported_image_extensions()) {
        REQUIRE(extension[0] == '.');
        REQUIRE(extension == to_lowercase(extension));
    }
}
