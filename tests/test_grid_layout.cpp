#include <catch2/catch_all.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include "grid/column_layout.h"
#include "grid/grid_composer.h"
#include "grid/row_virtualizer.h"
#include "grid/viewport_tracker.h"

TEST_CASE("compute_column_count fits columns to the container", "[grid][layout]") {
    SECTION("Wide container is capped at the requested count") {
        REQUIRE(compute_column_count(1200.0f, 4, 250.0f, 16.0f) == 4);
        REQUIRE(compute_column_count(5000.0f, 4, 250.0f, 16.0f) == 4);
    }

    SECTION("Narrower containers drop columns") {
        REQUIRE(compute_column_count(800.0f, 4, 250.0f, 16.0f) == 3);
        REQUIRE(compute_column_count(531.0f, 4, 250.0f, 16.0f) == 2);
        REQUIRE(compute_column_count(500.0f, 4, 250.0f, 16.0f) == 1);
    }

    SECTION("Exact fit counts the column") {
        // Two items plus one gap
        REQUIRE(compute_column_count(516.0f, 4, 250.0f, 16.0f) == 2);
        REQUIRE(compute_column_count(515.9f, 4, 250.0f, 16.0f) == 1);
    }

    SECTION("Unusable widths yield a single column") {
        REQUIRE(compute_column_count(0.0f, 4, 250.0f, 16.0f) == 1);
        REQUIRE(compute_column_count(-100.0f, 4, 250.0f, 16.0f) == 1);
        REQUIRE(compute_column_count(std::numeric_limits<float>::quiet_NaN(), 4, 250.0f, 16.0f) == 1);
        REQUIRE(compute_column_count(100.0f, 4, 250.0f, 16.0f) == 1);
    }

    SECTION("Requested count below one is treated as one") {
        REQUIRE(compute_column_count(1200.0f, 0, 250.0f, 16.0f) == 1);
        REQUIRE(compute_column_count(1200.0f, -3, 250.0f, 16.0f) == 1);
    }
}

TEST_CASE("ColumnLayout tracks width and column geometry", "[grid][layout]") {
    ColumnLayout layout(4, 250.0f, 16.0f);
    REQUIRE(layout.column_count() == 1);

    REQUIRE(layout.update_width(1200.0f));
    REQUIRE(layout.column_count() == 4);
    REQUIRE(layout.column_width() == Catch::Approx(288.0f));
    REQUIRE(layout.column_x(0) == Catch::Approx(0.0f));
    REQUIRE(layout.column_x(1) == Catch::Approx(304.0f));
    REQUIRE(layout.column_x(3) == Catch::Approx(912.0f));

    SECTION("Same column count reports no change") {
        REQUIRE_FALSE(layout.update_width(1250.0f));
        REQUIRE(layout.column_count() == 4);
    }

    SECTION("Shrinking reduces columns") {
        REQUIRE(layout.update_width(600.0f));
        REQUIRE(layout.column_count() == 2);
        REQUIRE(layout.column_width() == Catch::Approx(292.0f));
    }

    SECTION("Lowering the requested maximum applies immediately") {
        REQUIRE(layout.set_requested_columns(2));
        REQUIRE(layout.column_count() == 2);
    }
}

TEST_CASE("RowVirtualizer windows rows around the viewport", "[grid][virtualizer]") {
    VirtualizerOptions options;
    options.count = 100;
    options.estimate_size = 376.0f;
    options.overscan = 3;
    RowVirtualizer virtualizer(options);
    virtualizer.set_viewport_size(1000.0f);

    REQUIRE(virtualizer.total_size() == Catch::Approx(37600.0f));

    SECTION("Top of the list") {
        auto range = virtualizer.visible_range();
        REQUIRE(range.first == 0);
        REQUIRE(range.second == 2);

        const auto& rows = virtualizer.get_virtual_rows();
        REQUIRE(rows.size() == 6);
        REQUIRE(rows.front().index == 0);
        REQUIRE(rows.back().index == 5);
        REQUIRE(rows[1].start == Catch::Approx(376.0f));
    }

    SECTION("Middle of the list extends overscan on both sides") {
        virtualizer.set_scroll_offset(3760.0f);
        auto range = virtualizer.visible_range();
        REQUIRE(range.first == 10);
        REQUIRE(range.second == 12);

        const auto& rows = virtualizer.get_virtual_rows();
        REQUIRE(rows.front().index == 7);
        REQUIRE(rows.back().index == 15);
        for (size_t i = 1; i < rows.size(); ++i) {
            REQUIRE(rows[i].index == rows[i - 1].index + 1);
        }
    }

    SECTION("Overscan is clamped at the end") {
        virtualizer.set_scroll_offset(36600.0f);
        const auto& rows = virtualizer.get_virtual_rows();
        REQUIRE(rows.back().index == 99);
    }

    SECTION("Unchanged input returns the cached window") {
        const auto& first = virtualizer.get_virtual_rows();
        uint64_t version = virtualizer.version();
        const auto& second = virtualizer.get_virtual_rows();
        REQUIRE(&first == &second);
        REQUIRE(virtualizer.version() == version);

        virtualizer.set_scroll_offset(10.0f);
        virtualizer.get_virtual_rows();
        // Same rows, same version
        REQUIRE(virtualizer.version() == version);

        virtualizer.set_scroll_offset(2000.0f);
        virtualizer.get_virtual_rows();
        REQUIRE(virtualizer.version() == version + 1);
    }

    SECTION("Measured rows shift later offsets") {
        virtualizer.measure_row(0, 500.0f);
        REQUIRE(virtualizer.is_measured(0));
        REQUIRE(virtualizer.row_span(1).start == Catch::Approx(500.0f));
        REQUIRE(virtualizer.total_size() == Catch::Approx(37724.0f));

        virtualizer.reset_measurements();
        REQUIRE_FALSE(virtualizer.is_measured(0));
        REQUIRE(virtualizer.total_size() == Catch::Approx(37600.0f));
    }

    SECTION("Scroll alignment") {
        REQUIRE(virtualizer.scroll_offset_for_row(10, ScrollAlign::Start) == Catch::Approx(3760.0f));
        REQUIRE(virtualizer.scroll_offset_for_row(10, ScrollAlign::End) == Catch::Approx(4136.0f - 1000.0f));
        REQUIRE(virtualizer.scroll_offset_for_row(10, ScrollAlign::Center) == Catch::Approx(3948.0f - 500.0f));
        // Already fully visible
        REQUIRE(virtualizer.scroll_offset_for_row(1, ScrollAlign::Auto) == Catch::Approx(0.0f));
        // Clamped to the scrollable range
        REQUIRE(virtualizer.scroll_offset_for_row(99, ScrollAlign::Start) == Catch::Approx(36600.0f));
        REQUIRE(virtualizer.scroll_offset_for_row(500, ScrollAlign::Start) == Catch::Approx(36600.0f));
    }
}

TEST_CASE("RowVirtualizer offsets stay exact for fractional row sizes", "[grid][virtualizer]") {
    // Zoomed item heights are rarely representable in float
    auto expected_offset = [](double rows, float estimate) {
        return static_cast<float>(rows * static_cast<double>(estimate));
    };

    for (float estimate : { 300.8f, 451.2f, 376.0f }) {
        for (int count : { 25000, 125000 }) {
            VirtualizerOptions options;
            options.count = count;
            options.estimate_size = estimate;
            options.overscan = 3;
            RowVirtualizer virtualizer(options);
            virtualizer.set_viewport_size(1000.0f);

            REQUIRE(virtualizer.total_size() == expected_offset(count, estimate));
            for (int row = 0; row < count; row += 997) {
                REQUIRE(virtualizer.row_span(row).start == expected_offset(row, estimate));
            }
            REQUIRE(virtualizer.row_span(count - 1).start == expected_offset(count - 1, estimate));

            // The last row is reachable and rendered at the bottom of the range
            virtualizer.scroll_to_row(count - 1, ScrollAlign::End);
            const auto& rows = virtualizer.get_virtual_rows();
            REQUIRE_FALSE(rows.empty());
            REQUIRE(rows.back().index == count - 1);
        }
    }

    SECTION("Rows after a measurement continue from the measured end") {
        const float estimate = 300.8f;
        VirtualizerOptions options;
        options.count = 25000;
        options.estimate_size = estimate;
        RowVirtualizer virtualizer(options);

        virtualizer.measure_row(10, 500.0f);
        double measured_end = 10.0 * estimate + 500.0;
        REQUIRE(virtualizer.row_span(10).start == expected_offset(10, estimate));
        REQUIRE(virtualizer.row_span(11).start == static_cast<float>(measured_end));
        REQUIRE(virtualizer.row_span(24999).start ==
            static_cast<float>(measured_end + 24988.0 * estimate));
        REQUIRE(virtualizer.total_size() == static_cast<float>(measured_end + 24989.0 * estimate));
    }
}

TEST_CASE("compute_column_count over a width sweep", "[grid][layout]") {
    for (int requested = 1; requested <= 8; ++requested) {
        int previous = 1;
        for (int width = -50; width <= 3000; ++width) {
            int columns = compute_column_count(static_cast<float>(width), requested, 250.0f, 16.0f);
            REQUIRE(columns >= 1);
            REQUIRE(columns <= requested);
            REQUIRE(columns >= previous);
            previous = columns;
        }
        REQUIRE(previous == std::min(requested, 11));
    }
}

TEST_CASE("Row composition covers every item exactly once", "[grid][composer]") {
    for (int item_count = 0; item_count <= 600; ++item_count) {
        for (int column_count = 1; column_count <= 12; ++column_count) {
            int row_count = compute_row_count(item_count, column_count);
            REQUIRE(row_count == (item_count + column_count - 1) / column_count);

            int next_index = 0;
            for (int row = 0; row < row_count; ++row) {
                auto cells = cells_for_row(row, column_count, item_count);
                bool last_row = row == row_count - 1;
                int remainder = item_count % column_count;
                size_t expected = last_row && remainder != 0 ? remainder : column_count;
                REQUIRE(cells.size() == expected);

                bool in_order = true;
                for (const auto& cell : cells) {
                    in_order = in_order && cell.global_index == next_index &&
                        cell.column_index == next_index - row * column_count && cell.row_index == row;
                    ++next_index;
                }
                REQUIRE(in_order);
            }
            REQUIRE(next_index == item_count);
            REQUIRE(cells_for_row(row_count, column_count, item_count).empty());
        }
    }
}

TEST_CASE("RowVirtualizer with no rows", "[grid][virtualizer]") {
    RowVirtualizer virtualizer;
    virtualizer.set_viewport_size(800.0f);

    REQUIRE(virtualizer.total_size() == 0.0f);
    REQUIRE(virtualizer.get_virtual_rows().empty());
    auto range = virtualizer.visible_range();
    REQUIRE(range.first == -1);
    REQUIRE(range.second == -1);
    REQUIRE(virtualizer.scroll_offset_for_row(3, ScrollAlign::Start) == 0.0f);
}

TEST_CASE("GridComposer maps rows to item indices", "[grid][composer]") {
    REQUIRE(compute_row_count(103, 4) == 26);
    REQUIRE(compute_row_count(100, 4) == 25);
    REQUIRE(compute_row_count(0, 4) == 0);
    REQUIRE(compute_row_count(5, 0) == 5);

    SECTION("Partial last row") {
        auto cells = cells_for_row(25, 4, 103);
        REQUIRE(cells.size() == 3);
        REQUIRE(cells[0].global_index == 100);
        REQUIRE(cells[2].global_index == 102);
        REQUIRE(cells[2].column_index == 2);
        REQUIRE(cells[2].row_index == 25);
    }

    SECTION("Stale row past the end is empty") {
        REQUIRE(cells_for_row(26, 4, 103).empty());
        REQUIRE(cells_for_row(-1, 4, 103).empty());
    }

    SECTION("Compose is cached until an input changes") {
        std::vector<RowSpan> spans;
        for (int i = 24; i < 26; ++i) {
            RowSpan span;
            span.index = i;
            span.start = i * 376.0f;
            span.size = 376.0f;
            spans.push_back(span);
        }

        GridComposer composer;
        const auto& rows = composer.compose(spans, 1, 103, 4);
        REQUIRE(composer.last_compose_rebuilt());
        REQUIRE(rows.size() == 2);
        REQUIRE(rows[0].cells.size() == 4);
        REQUIRE(rows[1].cells.size() == 3);

        composer.compose(spans, 1, 103, 4);
        REQUIRE_FALSE(composer.last_compose_rebuilt());

        const auto& shrunk = composer.compose(spans, 1, 98, 4);
        REQUIRE(composer.last_compose_rebuilt());
        REQUIRE(shrunk[0].cells.size() == 2);
        REQUIRE(shrunk[1].cells.empty());
    }
}

TEST_CASE("ViewportTracker reports changes and clamps input", "[grid][viewport]") {
    ViewportTracker tracker;
    REQUIRE(tracker.viewport().scroll_offset == 0.0f);

    REQUIRE(tracker.on_scroll(500.0f));
    REQUIRE_FALSE(tracker.on_scroll(500.0f));
    REQUIRE(tracker.viewport().scroll_offset == 500.0f);

    ContainerSize size;
    size.width = 1200.0f;
    size.height = 1000.0f;
    REQUIRE(tracker.on_resize(size));
    REQUIRE_FALSE(tracker.on_resize(size));

    GridRect visible = tracker.viewport().visible_rect();
    REQUIRE(visible.y == 500.0f);
    REQUIRE(visible.bottom() == 1500.0f);
    REQUIRE(visible.width == 1200.0f);

    SECTION("Negative and non-finite values clamp to zero") {
        REQUIRE(tracker.on_scroll(-40.0f));
        REQUIRE(tracker.viewport().scroll_offset == 0.0f);
        REQUIRE_FALSE(tracker.on_scroll(std::numeric_limits<float>::quiet_NaN()));

        ContainerSize broken;
        broken.width = -1.0f;
        broken.height = std::numeric_limits<float>::infinity();
        REQUIRE(tracker.on_resize(broken));
        REQUIRE(tracker.viewport().container_width == 0.0f);
        REQUIRE(tracker.viewport().container_height == 0.0f);
    }
}
