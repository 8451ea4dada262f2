#include <catch2/catch_test_macros.hpp>

#include "form.h"
#include "test_helpers.h"

static FormSection color_section() {
    FormSection section = FormSection::selection("Color", false);
    section.choice("Red", "red").choice("Blue", "blue").manual().skip();
    return section;
}

static FormState single(const FormSection& section) {
    return FormState(std::vector<FormSection>(1, section), std::vector<std::string>(), std::vector<uint16_t>());
}

// ============================================================================
// Section values
// ============================================================================

TEST_CASE("selection value") {
    FormState state = single(color_section());
    std::string value;

    SECTION("nothing selected") {
        CHECK(!state.current_section().has_value());
    }
    SECTION("choice") {
        state.down();
        state.select_current();
        REQUIRE(state.current_section().value(value));
        CHECK(value == "blue");
    }
    SECTION("manual value wins over the choice") {
        state.select_current();
        state.down();
        state.down();
        REQUIRE(state.is_manual());
        state.set_manual("green");
        REQUIRE(state.current_section().value(value));
        CHECK(value == "green");
        CHECK(state.current_section().selected() == 2);
    }
    SECTION("choice clears a manual value") {
        state.down();
        state.down();
        state.set_manual("green");
        state.up();
        state.select_current();
        REQUIRE(state.current_section().value(value));
        CHECK(value == "blue");
        CHECK(!state.current_section().has_manual_value());
    }
}

TEST_CASE("skip clears selection and manual value") {
    FormState state = single(color_section());
    state.down();
    state.down();
    state.set_manual("green");
    REQUIRE(state.current_section().has_value());

    state.down();
    state.select_current();
    CHECK(!state.current_section().has_value());
    CHECK(!state.current_section().has_selection());
    CHECK(!state.current_section().has_manual_value());
}

TEST_CASE("default selection") {
    FormSection section = FormSection::selection("Forward", true);
    section.choice("localhost", "localhost").choice("db.internal", "db.internal").manual();

    SECTION("choice index is accepted") {
        section.with_default(1);
        std::string value;
        REQUIRE(section.value(value));
        CHECK(value == "db.internal");
    }
    SECTION("manual option is not a default") {
        section.with_default(2);
        CHECK(!section.has_value());
    }
    SECTION("out of range is ignored") {
        section.with_default(9);
        CHECK(!section.has_value());
    }
    SECTION("cursor starts on the default") {
        section.with_default(1);
        FormState state = single(section);
        CHECK(state.item() == 1);
    }
}

TEST_CASE("choice_front keeps the selected option") {
    FormSection section = FormSection::selection("User", true);
    section.choice("deploy", "deploy").with_default(0);
    section.choice_front("alice", "alice");
    REQUIRE(section.options().size() == 2);
    CHECK(section.options()[0].label == "alice");
    std::string value;
    REQUIRE(section.value(value));
    CHECK(value == "deploy");
}

TEST_CASE("text value") {
    SECTION("single field is trimmed") {
        FormState state = single(FormSection::text("Name", true, one_field("Tunnel name")));
        for (char c : std::string("  db ")) {
            state.handle_char(c);
        }
        std::string value;
        REQUIRE(state.current_section().value(value));
        CHECK(value == "db");
    }
    SECTION("whitespace only is absent") {
        FormState state = single(FormSection::text("Name", true, one_field("Tunnel name")));
        state.handle_char(' ');
        CHECK(!state.current_section().has_value());
    }
    SECTION("two fields are all or nothing") {
        std::vector<TextField> fields;
        fields.push_back(TextField("Local port", true));
        fields.push_back(TextField("Remote port", true));
        FormState state = single(FormSection::text("Ports", true, fields));

        for (char c : std::string("8080")) {
            state.handle_char(c);
        }
        CHECK(!state.current_section().has_value());
        std::string first;
        REQUIRE(state.current_section().text_field_value(0, first));
        CHECK(first == "8080");

        state.down();
        for (char c : std::string("443")) {
            state.handle_char(c);
        }
        std::string value;
        REQUIRE(state.current_section().value(value));
        CHECK(value == "8080:443");
    }
}

TEST_CASE("digits-only fields reject other characters") {
    FormState state = single(FormSection::text("Port", true, one_field("Listen port", true)));
    for (char c : std::string("1a0-8 0")) {
        state.handle_char(c);
    }
    CHECK(state.current_section().fields()[0].buffer == "1080");
}

TEST_CASE("backspace") {
    FormState state = single(FormSection::text("Name", true, one_field("Tunnel name")));
    state.handle_char('a');
    state.handle_char('b');
    state.set_error("boom");
    state.handle_backspace();
    CHECK(state.current_section().fields()[0].buffer == "a");
    CHECK(!state.has_error());
    state.handle_backspace();
    state.handle_backspace();
    CHECK(state.current_section().fields()[0].buffer.empty());
}

// ============================================================================
// Navigation
// ============================================================================

TEST_CASE("down onto confirm and back up") {
    FormState state = single(color_section());
    REQUIRE(state.item() == 0);

    state.down();
    state.down();
    state.down();
    CHECK(state.item() == 3);
    CHECK(!state.on_confirm());

    state.down();
    CHECK(state.on_confirm());
    state.down();
    CHECK(state.on_confirm());

    state.up();
    CHECK(!state.on_confirm());
    CHECK(state.item() == 3);

    state.up();
    state.up();
    state.up();
    state.up();
    CHECK(state.item() == 0);
}

TEST_CASE("tab switching") {
    std::vector<FormSection> sections;
    sections.push_back(FormSection::text("Name", true, one_field("Tunnel name")));
    FormSection color = color_section();
    color.with_default(1);
    sections.push_back(color);
    FormState state(sections, std::vector<std::string>(), std::vector<uint16_t>());

    SECTION("cursor is restored to the selected option") {
        state.tab_right();
        CHECK(state.tab() == 1);
        CHECK(state.item() == 1);
    }
    SECTION("edges do not wrap") {
        state.tab_left();
        CHECK(state.tab() == 0);
        state.tab_right();
        state.tab_right();
        CHECK(state.tab() == 1);
    }
    SECTION("blocked while on confirm") {
        state.down();
        REQUIRE(state.on_confirm());
        state.tab_right();
        CHECK(state.tab() == 0);
        CHECK(state.on_confirm());
    }
    SECTION("switching clears the error") {
        state.set_error("Name cannot be empty");
        state.tab_right();
        CHECK(!state.has_error());
    }
    SECTION("active text field is remembered") {
        std::vector<TextField> fields;
        fields.push_back(TextField("Local port", true));
        fields.push_back(TextField("Remote port", true));
        std::vector<FormSection> two;
        two.push_back(FormSection::text("Ports", true, fields));
        two.push_back(color_section());
        FormState ports(two, std::vector<std::string>(), std::vector<uint16_t>());
        ports.down();
        ports.tab_right();
        ports.tab_left();
        CHECK(ports.item() == 1);
        CHECK(ports.current_section().active_field() == 1);
    }
}

TEST_CASE("advance moves to the next tab then confirm") {
    std::vector<FormSection> sections;
    sections.push_back(color_section());
    sections.push_back(color_section());
    FormState state(sections, std::vector<std::string>(), std::vector<uint16_t>());

    state.set_error("stale");
    state.advance_tab();
    CHECK(state.tab() == 1);
    CHECK(!state.has_error());
    CHECK(!state.on_confirm());

    state.advance_tab();
    CHECK(state.tab() == 1);
    CHECK(state.on_confirm());
}

// ============================================================================
// Readiness
// ============================================================================

TEST_CASE("confirm is gated on required tabs") {
    std::vector<FormSection> sections;
    sections.push_back(FormSection::text("Name", true, one_field("Tunnel name")));
    sections.push_back(color_section());
    FormSection host = FormSection::selection("Host", true);
    host.choice("a", "a.example.com").manual();
    sections.push_back(host);
    FormState state(sections, std::vector<std::string>(), std::vector<uint16_t>());

    CHECK(!state.ready());
    CHECK(state.confirm_hint() == "Fill required tabs: Name, Host");

    state.handle_char('x');
    CHECK(state.confirm_hint() == "Fill required tabs: Host");

    state.tab_right();
    state.tab_right();
    state.select_current();
    CHECK(state.ready());
    CHECK(state.confirm_hint().empty());
    CHECK(state.missing_required().empty());
}

TEST_CASE("values omit tabs without a value") {
    std::vector<FormSection> sections;
    sections.push_back(FormSection::text("Name", true, one_field("Tunnel name")));
    sections.push_back(color_section());
    FormState state(sections, std::vector<std::string>(), std::vector<uint16_t>());
    state.handle_char('d');
    state.handle_char('b');

    FormValues values = state.values();
    CHECK(values.size() == 1);
    CHECK(values["Name"] == "db");
    CHECK(values.count("Color") == 0);
}

TEST_CASE("empty form is inert") {
    FormState state(std::vector<FormSection>(), std::vector<std::string>(), std::vector<uint16_t>());
    state.down();
    state.up();
    state.tab_right();
    state.advance_tab();
    state.select_current();
    state.handle_char('a');
    CHECK(state.empty());
    CHECK(state.ready());
    CHECK(state.values().empty());
}
