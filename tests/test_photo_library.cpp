#include <catch2/catch_all.hpp>
#include <algorithm>
#include <atomic>
#include <filesystem>
#include "photo_library.h"
#include "test_helpers.h"

namespace fs = std::filesystem;

TEST_CASE("scan_directory finds decodable images recursively", "[library]") {
    TempDirectory temp("photo_vault_scan");
    temp.write_file("b.jpg");
    temp.write_file("a.PNG", "0123456789");
    temp.write_file("holiday/beach.jpeg");
    temp.write_file("holiday/notes.txt");
    temp.write_file("deep/nested/dir/c.bmp");
    temp.write_file("no_extension");

    std::atomic<bool> cancel{ false };
    std::atomic<size_t> progress{ 0 };
    auto photos = PhotoLibrary::scan_directory(temp.path().u8string(), cancel, progress);

    REQUIRE(photos.size() == 4);
    REQUIRE(progress == 4);
    REQUIRE(photos[0].id == "a.PNG");
    REQUIRE(photos[1].id == "b.jpg");
    REQUIRE(photos[2].id == "deep/nested/dir/c.bmp");
    REQUIRE(photos[3].id == "holiday/beach.jpeg");

    REQUIRE(photos[0].name == "a.PNG");
    REQUIRE(photos[0].size == 10);
    REQUIRE_FALSE(photos[0].synthetic);
    REQUIRE(fs::exists(photos[2].full_path));

    SECTION("Cancelled scans stop early") {
        cancel = true;
        auto cancelled = PhotoLibrary::scan_directory(temp.path().u8string(), cancel, progress);
        REQUIRE(cancelled.empty());
    }

    SECTION("Missing directory yields nothing") {
        auto missing = PhotoLibrary::scan_directory((temp.path() / "missing").u8string(), cancel, progress);
        REQUIRE(missing.empty());
    }
}

TEST_CASE("PhotoLibrary background scan publishes on poll", "[library]") {
    TempDirectory temp("photo_vault_library");
    temp.write_file("one.jpg");
    temp.write_file("two.png");

    PhotoLibrary library;
    REQUIRE_FALSE(library.start_scan((temp.path() / "missing").u8string()));
    REQUIRE_FALSE(library.start_scan(""));

    REQUIRE(library.start_scan(temp.path().u8string()));
    REQUIRE(wait_until([&]() { return library.poll(); }));
    REQUIRE_FALSE(library.is_scanning());
    REQUIRE(library.size() == 2);
    REQUIRE(library.root_directory() == temp.path().u8string());

    std::vector<ItemId> ids = library.ids();
    REQUIRE(ids.size() == 2);
    REQUIRE(ids[0] == "one.jpg");

    REQUIRE(library.find("two.png") != nullptr);
    REQUIRE(library.find("two.png")->name == "two.png");
    REQUIRE(library.find("three.png") == nullptr);
    REQUIRE(library.at(1)->id == "two.png");
    REQUIRE(library.at(2) == nullptr);
    REQUIRE(library.at(-1) == nullptr);

    // Nothing new to publish
    REQUIRE_FALSE(library.poll());
}

TEST_CASE("PhotoLibrary demo collection", "[library]") {
    PhotoLibrary library;
    library.load_demo(1500);

    REQUIRE(library.size() == 1500);
    REQUIRE(library.root_directory().empty());
    REQUIRE(library.at(0)->id == "demo/000000");
    REQUIRE(library.at(1499)->id == "demo/001499");
    REQUIRE(library.at(0)->synthetic);
    REQUIRE(library.find("demo/000042")->name == "Photo 43");

    // Ids are unique and ordered
    std::vector<ItemId> ids = library.ids();
    REQUIRE(std::is_sorted(ids.begin(), ids.end()));
    REQUIRE(std::adjacent_find(ids.begin(), ids.end()) == ids.end());

    library.load_demo(0);
    REQUIRE(library.size() == 0);
}
