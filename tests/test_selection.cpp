#include <catch2/catch_all.hpp>
#include <memory>
#include <string>
#include "grid/selection_overlay.h"
#include "grid/selection_store.h"

TEST_CASE("SelectionStore toggles membership", "[selection]") {
    SelectionStore store;
    int notifications = 0;
    store.add_listener([&notifications](const SelectionStore&) { notifications++; });

    store.enable_selection_mode();
    REQUIRE(store.selection_mode());
    REQUIRE(notifications == 1);

    REQUIRE(store.toggle("A"));
    REQUIRE(store.toggle("B"));
    REQUIRE_FALSE(store.toggle("A"));

    REQUIRE(store.selected_count() == 1);
    REQUIRE(store.is_selected("B"));
    REQUIRE_FALSE(store.is_selected("A"));
    REQUIRE(notifications == 4);

    SECTION("Enabling twice does not notify") {
        store.enable_selection_mode();
        REQUIRE(notifications == 4);
    }

    SECTION("Leaving selection mode clears") {
        store.disable_selection_mode();
        REQUIRE_FALSE(store.selection_mode());
        REQUIRE(store.selected_count() == 0);
        REQUIRE(notifications == 5);

        store.disable_selection_mode();
        REQUIRE(notifications == 5);
    }

    SECTION("Toggle mode twice") {
        store.toggle_selection_mode();
        store.toggle_selection_mode();
        REQUIRE(store.selection_mode());
        REQUIRE(store.selected_count() == 0);
    }

    SECTION("Clear keeps the mode") {
        store.clear();
        REQUIRE(store.selection_mode());
        REQUIRE(store.selected_count() == 0);
        REQUIRE(notifications == 5);
        store.clear();
        REQUIRE(notifications == 5);
    }
}

TEST_CASE("SelectionStore select_all", "[selection]") {
    SelectionStore store;
    int notifications = 0;
    auto listener_id = store.add_listener([&notifications](const SelectionStore&) { notifications++; });

    store.select_all({ "c", "a", "b" });
    REQUIRE(store.selection_mode());
    REQUIRE(store.selected_count() == 3);
    std::vector<ItemId> expected = { "a", "b", "c" };
    REQUIRE(store.selected_ids() == expected);
    REQUIRE(notifications == 1);

    store.select_all({ "a", "b", "c" });
    REQUIRE(notifications == 1);

    store.remove_listener(listener_id);
    store.toggle("a");
    REQUIRE(notifications == 1);
    REQUIRE(store.add_listener(SelectionStore::Listener()) == 0);
}

TEST_CASE("SelectionOverlay routes clicks by mode", "[selection]") {
    auto store = std::make_shared<SelectionStore>();
    SelectionOverlay overlay(store);

    ItemId clicked;
    int clicked_index = -1;
    int double_clicks = 0;

    SECTION("Without callbacks clicks are ignored") {
        REQUIRE(overlay.handle_click("x", 0) == ClickResult::Ignored);
        REQUIRE(overlay.handle_double_click("x", 0) == ClickResult::Ignored);
    }

    overlay.set_on_item_click([&](const ItemId& id, int index) {
        clicked = id;
        clicked_index = index;
    });
    overlay.set_on_item_double_click([&](const ItemId&, int) { double_clicks++; });

    SECTION("Normal mode forwards to the host") {
        REQUIRE(overlay.handle_click("x", 7) == ClickResult::Forwarded);
        REQUIRE(clicked == "x");
        REQUIRE(clicked_index == 7);
        REQUIRE_FALSE(store->is_selected("x"));

        REQUIRE(overlay.handle_double_click("x", 7) == ClickResult::Forwarded);
        REQUIRE(double_clicks == 1);
    }

    SECTION("Selection mode toggles instead of forwarding") {
        store->enable_selection_mode();
        REQUIRE(overlay.handle_click("x", 7) == ClickResult::Toggled);
        REQUIRE(clicked.empty());
        REQUIRE(overlay.is_selected("x"));

        REQUIRE(overlay.handle_double_click("x", 7) == ClickResult::Ignored);
        REQUIRE(double_clicks == 0);

        REQUIRE(overlay.handle_click("x", 7) == ClickResult::Toggled);
        REQUIRE_FALSE(overlay.is_selected("x"));
    }

    SECTION("Null store falls back to a private one") {
        SelectionOverlay fallback(nullptr);
        REQUIRE(fallback.shared_store() != nullptr);
        REQUIRE_FALSE(fallback.selection_mode());
    }
}
