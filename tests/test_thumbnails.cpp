#include <catch2/catch_all.hpp>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include "image_data.h"
#include "test_helpers.h"
#include "thumbnail_loader.h"

namespace {

ImageData solid_image(int width, int height, unsigned char value) {
    ImageData image;
    image.width = width;
    image.height = height;
    image.pixels.assign(static_cast<size_t>(width) * height * 4, value);
    return image;
}

// Decoder that blocks until released, so tests control what is still queued
class GatedDecoder {
public:
    ImageData decode(const ThumbnailRequest& request) {
        std::unique_lock<std::mutex> lock(mutex_);
        started_++;
        condition_.wait(lock, [this]() { return open_; });
        if (request.id.rfind("bad", 0) == 0) {
            return ImageData();
        }
        return solid_image(4, 4, 200);
    }

    void open() {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = true;
        condition_.notify_all();
    }

    int started() {
        std::lock_guard<std::mutex> lock(mutex_);
        return started_;
    }

private:
    std::mutex mutex_;
    std::condition_variable condition_;
    bool open_ = false;
    int started_ = 0;
};

ThumbnailRequest make_request(const std::string& id) {
    ThumbnailRequest request;
    request.id = id;
    return request;
}

}

TEST_CASE("fit_dimensions keeps aspect and never upscales", "[image]") {
    int width = 0;
    int height = 0;

    fit_dimensions(1000, 500, 384, width, height);
    REQUIRE(width == 384);
    REQUIRE(height == 192);

    fit_dimensions(300, 1200, 384, width, height);
    REQUIRE(width == 96);
    REQUIRE(height == 384);

    fit_dimensions(100, 50, 384, width, height);
    REQUIRE(width == 100);
    REQUIRE(height == 50);

    fit_dimensions(0, 50, 384, width, height);
    REQUIRE(width == 0);
}

TEST_CASE("downscale_rgba averages source pixels", "[image]") {
    ImageData source;
    source.width = 4;
    source.height = 2;
    source.pixels.resize(4 * 2 * 4);
    // Left half black, right half white
    for (int y = 0; y < 2; ++y) {
        for (int x = 0; x < 4; ++x) {
            unsigned char value = x < 2 ? 0 : 255;
            for (int c = 0; c < 4; ++c) {
                source.pixels[(y * 4 + x) * 4 + c] = value;
            }
        }
    }

    ImageData result = downscale_rgba(source, 2);
    REQUIRE(result.is_valid());
    REQUIRE(result.width == 2);
    REQUIRE(result.height == 1);
    REQUIRE(result.pixels[0] == 0);
    REQUIRE(result.pixels[4] == 255);

    SECTION("Images that fit are returned as is") {
        ImageData same = downscale_rgba(source, 16);
        REQUIRE(same.width == 4);
        REQUIRE(same.pixels == source.pixels);
    }

    SECTION("Invalid input yields an invalid image") {
        ImageData broken;
        broken.width = 2;
        broken.height = 2;
        REQUIRE_FALSE(downscale_rgba(broken, 1).is_valid());
    }
}

TEST_CASE("generate_demo_image is deterministic per seed", "[image]") {
    ImageData a = generate_demo_image("demo/000001", 32, 40);
    ImageData b = generate_demo_image("demo/000001", 32, 40);
    REQUIRE(a.is_valid());
    REQUIRE(a.width == 32);
    REQUIRE(a.height == 40);
    REQUIRE(a.pixels == b.pixels);
    REQUIRE(a.pixels[3] == 255);
    REQUIRE_FALSE(generate_demo_image("x", 0, 10).is_valid());
}

TEST_CASE("ThumbnailLoader decodes requests on workers", "[thumbnails]") {
    ThumbnailLoader loader([](const ThumbnailRequest& request) {
        return request.id == "bad" ? ImageData() : solid_image(8, 8, 100);
    }, 2, 16);
    REQUIRE(loader.start());

    REQUIRE(loader.request(make_request("one")));
    REQUIRE(loader.request(make_request("bad")));

    std::vector<ThumbnailResult> results;
    REQUIRE(wait_until([&]() {
        auto batch = loader.take_completed(16);
        results.insert(results.end(), batch.begin(), batch.end());
        return results.size() == 2;
    }));

    for (const auto& result : results) {
        if (result.id == "one") {
            REQUIRE(result.success);
            REQUIRE(result.image.width == 8);
        }
        else {
            REQUIRE_FALSE(result.success);
        }
    }
    REQUIRE(loader.outstanding_count() == 0);

    // Taken ids may be requested again
    REQUIRE(loader.request(make_request("one")));
    loader.stop();
    REQUIRE(loader.outstanding_count() == 0);
}

TEST_CASE("ThumbnailLoader bounds outstanding work", "[thumbnails]") {
    GatedDecoder decoder;
    ThumbnailLoader loader([&decoder](const ThumbnailRequest& request) { return decoder.decode(request); }, 1, 3);
    REQUIRE(loader.start());

    REQUIRE(loader.request(make_request("a")));
    REQUIRE(wait_until([&]() { return decoder.started() == 1; }));

    REQUIRE(loader.request(make_request("b")));
    REQUIRE(loader.request(make_request("c")));

    SECTION("Duplicates and overflow are refused") {
        REQUIRE_FALSE(loader.request(make_request("b")));
        REQUIRE_FALSE(loader.request(make_request("d")));
        REQUIRE(loader.outstanding_count() == 3);
        REQUIRE(loader.queued_count() == 2);
    }

    SECTION("Queued requests can be cancelled") {
        REQUIRE(loader.cancel("b"));
        REQUIRE_FALSE(loader.cancel("a"));  // Already decoding
        REQUIRE_FALSE(loader.is_outstanding("b"));
        REQUIRE(loader.request(make_request("d")));
    }

    SECTION("cancel_except keeps only wanted ids") {
        std::unordered_set<ItemId> keep = { "c" };
        REQUIRE(loader.cancel_except(keep) == 1);
        REQUIRE(loader.queued_count() == 1);
        REQUIRE(loader.is_outstanding("a"));
        REQUIRE(loader.is_outstanding("c"));
    }

    SECTION("Newest request is decoded next") {
        decoder.open();
        std::vector<ThumbnailResult> results;
        REQUIRE(wait_until([&]() {
            auto batch = loader.take_completed(8);
            results.insert(results.end(), batch.begin(), batch.end());
            return results.size() == 3;
        }));
        REQUIRE(results[0].id == "a");
        REQUIRE(results[1].id == "c");
        REQUIRE(results[2].id == "b");
    }

    decoder.open();
    loader.stop();
}

TEST_CASE("ThumbnailLoader refuses to start without a decoder", "[thumbnails]") {
    ThumbnailLoader loader(DecodeFunction(), 1, 4);
    REQUIRE_FALSE(loader.start());
    REQUIRE_FALSE(loader.is_running());
}

TEST_CASE("ThumbnailLoader stops cleanly right after starting", "[thumbnails]") {
    // Workers may still be entering their wait when stop() runs
    for (int cycle = 0; cycle < 200; ++cycle) {
        ThumbnailLoader loader([](const ThumbnailRequest&) { return solid_image(2, 2, 10); }, 4, 8);
        REQUIRE(loader.start());
        if (cycle % 2 == 0) {
            REQUIRE(loader.request(make_request("item")));
        }
        loader.stop();
        REQUIRE_FALSE(loader.is_running());
        REQUIRE(loader.outstanding_count() == 0);
    }
}

TEST_CASE("ThumbnailRetryTracker remembers failures across scrolling", "[thumbnails]") {
    ThumbnailRetryTracker failures(2, 3);
    REQUIRE_FALSE(failures.has_given_up("broken"));
    REQUIRE(failures.attempts("broken") == 0);

    REQUIRE_FALSE(failures.record_failure("broken"));
    REQUIRE(failures.attempts("broken") == 1);
    REQUIRE(failures.record_failure("broken"));
    REQUIRE(failures.has_given_up("broken"));

    // Further failures keep the item given up without growing the count
    REQUIRE(failures.record_failure("broken"));
    REQUIRE(failures.attempts("broken") == 2);

    SECTION("A successful decode forgets earlier failures") {
        REQUIRE_FALSE(failures.record_failure("flaky"));
        failures.forget("flaky");
        REQUIRE(failures.attempts("flaky") == 0);
        REQUIRE(failures.size() == 1);
    }

    SECTION("Memory is bounded, least recently failed forgotten first") {
        REQUIRE_FALSE(failures.record_failure("a"));
        REQUIRE_FALSE(failures.record_failure("b"));
        REQUIRE(failures.size() == 3);
        REQUIRE_FALSE(failures.record_failure("c"));
        REQUIRE(failures.size() == 3);
        REQUIRE_FALSE(failures.has_given_up("broken"));
        REQUIRE(failures.attempts("a") == 1);
        REQUIRE(failures.attempts("c") == 1);
    }

    SECTION("clear forgets everything") {
        failures.clear();
        REQUIRE(failures.size() == 0);
        REQUIRE_FALSE(failures.has_given_up("broken"));
    }
}
