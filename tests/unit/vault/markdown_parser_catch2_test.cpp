#include <catch2/catch_test_macros.hpp>

#include <loregraph/vault/markdown_parser.h>

#include <algorithm>

using namespace loregraph;
using namespace loregraph::vault;
using nlohmann::json;

namespace {

bool hasLink(const host::DocumentMetadata& md, const std::string& target) {
    return std::any_of(md.links.begin(), md.links.end(),
                       [&](const host::DocumentLink& l) { return l.target == target; });
}

} // namespace

TEST_CASE("Front matter is split from the body", "[vault][parser][catch2]") {
    SECTION("closing dashes") {
        const auto split = splitFrontmatter("---\naliases: [Arin]\n---\n# Arin\nBody\n");
        REQUIRE(split.yaml.has_value());
        CHECK(*split.yaml == "aliases: [Arin]\n");
        CHECK(split.body == "# Arin\nBody\n");
    }

    SECTION("closing dots and CRLF") {
        const auto split = splitFrontmatter("---\r\ntitle: Arin\r\n...\r\nBody");
        REQUIRE(split.yaml.has_value());
        CHECK(*split.yaml == "title: Arin\r\n");
        CHECK(split.body == "Body");
    }

    SECTION("empty block") {
        const auto split = splitFrontmatter("---\n---\nBody");
        REQUIRE(split.yaml.has_value());
        CHECK(split.yaml->empty());
        CHECK(split.body == "Body");
    }

    SECTION("no block") {
        const std::string text = "Intro\n---\nmore";
        const auto split = splitFrontmatter(text);
        CHECK_FALSE(split.yaml.has_value());
        CHECK(split.body == text);
    }

    SECTION("unterminated block is body") {
        const std::string text = "---\ntitle: Arin\nno close";
        const auto split = splitFrontmatter(text);
        CHECK_FALSE(split.yaml.has_value());
        CHECK(split.body == text);
    }
}

TEST_CASE("Front matter YAML maps onto JSON scalars", "[vault][parser][yaml][catch2]") {
    const auto parsed = parseFrontmatterYaml("aliases:\n  - Prince Arin\n  - The Iron Prince\n"
                                             "confidence: 0.84\n"
                                             "rank: 3\n"
                                             "active: true\n"
                                             "quoted: \"80\"\n"
                                             "missing: ~\n"
                                             "relations:\n"
                                             "  - predicate: allied_with\n"
                                             "    target: \"[[Lira]]\"\n");
    REQUIRE(parsed.has_value());
    const auto& fm = parsed.value();
    CHECK(fm["aliases"] == json::array({"Prince Arin", "The Iron Prince"}));
    CHECK(fm["confidence"].is_number_float());
    CHECK(fm["confidence"].get<double>() == 0.84);
    CHECK(fm["rank"] == 3);
    CHECK(fm["active"] == true);
    CHECK(fm["quoted"] == "80");
    CHECK(fm["missing"].is_null());
    REQUIRE(fm["relations"].is_array());
    CHECK(fm["relations"][0]["predicate"] == "allied_with");
    CHECK(fm["relations"][0]["target"] == "[[Lira]]");
}

TEST_CASE("Front matter YAML errors are reported", "[vault][parser][yaml][catch2]") {
    CHECK(parseFrontmatterYaml("").value() == json::object());
    CHECK(parseFrontmatterYaml("  \n").value() == json::object());

    const auto scalar = parseFrontmatterYaml("just a string");
    REQUIRE_FALSE(scalar.has_value());
    CHECK(scalar.error().code == ErrorCode::InvalidData);

    const auto list = parseFrontmatterYaml("- a\n- b\n");
    REQUIRE_FALSE(list.has_value());
    CHECK(list.error().code == ErrorCode::InvalidData);

    const auto broken = parseFrontmatterYaml("aliases: [Arin\n");
    REQUIRE_FALSE(broken.has_value());
    CHECK(broken.error().code == ErrorCode::ParseError);
}

TEST_CASE("Emitted front matter reads back unchanged", "[vault][parser][yaml][catch2]") {
    const json fm{{"aliases", json::array({"Arin", "true", "42"})},
                  {"confidence", 80},
                  {"relations", json::array({json{{"predicate", "allied_with"},
                                                  {"target", "[[Characters/Lira]]"},
                                                  {"confidence", 84}}})},
                  {"empty", json::array()},
                  {"note", " padded "}};
    const auto yaml = emitFrontmatterYaml(fm);
    const auto back = parseFrontmatterYaml(yaml);
    REQUIRE(back.has_value());
    CHECK(back.value() == fm);
}

TEST_CASE("Replacing front matter keeps the body", "[vault][parser][catch2]") {
    const std::string body = "# Arin\n\nKeeps  spacing\r\n";

    SECTION("replace an existing block") {
        const auto out = replaceFrontmatter("---\nold: 1\n---\n" + body, json{{"new", 2}});
        CHECK(out.rfind("---\n", 0) == 0);
        CHECK(out.find("old") == std::string::npos);
        const auto split = splitFrontmatter(out);
        REQUIRE(split.yaml.has_value());
        CHECK(parseFrontmatterYaml(*split.yaml).value() == json{{"new", 2}});
        CHECK(split.body == body);
    }

    SECTION("insert a block") {
        const auto out = replaceFrontmatter(body, json{{"aliases", json::array({"Arin"})}});
        const auto split = splitFrontmatter(out);
        REQUIRE(split.yaml.has_value());
        CHECK(split.body == body);
    }

    SECTION("an empty object removes the block") {
        CHECK(replaceFrontmatter("---\nold: 1\n---\n" + body, json::object()) == body);
    }
}

TEST_CASE("Notes yield wiki and markdown links", "[vault][parser][links][catch2]") {
    const auto note = parseNote("Allied with [[Characters/Lira|Lira the Bold]] and "
                                "![[Maps/Coast.png]].\n"
                                "See [[Kingdom/Valoria#History]] and [the keep](Places/Sunhold%20"
                                "Keep.md \"title\").\n"
                                "External [site](https://example.com) and [mail](mailto:a@b.c) "
                                "and [anchor](#top).\n"
                                "| [[Marek\\|Marek]] | cell |\n");
    const auto& md = note.metadata;

    REQUIRE(hasLink(md, "Characters/Lira"));
    const auto lira = std::find_if(md.links.begin(), md.links.end(),
                                   [](const auto& l) { return l.target == "Characters/Lira"; });
    CHECK(lira->displayText == std::optional<std::string>("Lira the Bold"));
    CHECK(hasLink(md, "Maps/Coast.png"));
    CHECK(hasLink(md, "Kingdom/Valoria#History"));
    CHECK(hasLink(md, "Places/Sunhold Keep.md"));
    CHECK(hasLink(md, "Marek"));
    CHECK_FALSE(hasLink(md, "https://example.com"));
    CHECK_FALSE(hasLink(md, "mailto:a@b.c"));
    CHECK_FALSE(hasLink(md, "#top"));
    CHECK(md.links.size() == 5);
}

TEST_CASE("Notes yield inline and front matter tags", "[vault][parser][tags][catch2]") {
    const auto note = parseNote("---\ntags: [faction, \"#nobility\"]\ntag: war, lore\n---\n"
                                "# Heading\n"
                                "A #noble house (#politics), issue#3 and #123.\n"
                                "Repeated #noble tag.\n");
    const auto& tags = note.metadata.tags;
    const std::vector<std::string> expected{"#noble",    "#politics", "#faction",
                                            "#nobility", "#war",      "#lore"};
    CHECK(tags == expected);
}

TEST_CASE("Notes yield ATX headings", "[vault][parser][headings][catch2]") {
    const auto note = parseNote("# Arin\n"
                                "## Early life ##\n"
                                "   ### Exile\n"
                                "####### too deep\n"
                                "#nospace\n"
                                "Text\n");
    const std::vector<std::string> expected{"Arin", "Early life", "Exile"};
    CHECK(note.metadata.headings == expected);
}

TEST_CASE("Code is ignored when scanning notes", "[vault][parser][catch2]") {
    const auto note = parseNote("Before [[Real]]\n"
                                "```cpp\n"
                                "// [[Fake]] #fake\n"
                                "# Not a heading\n"
                                "~~~\n"
                                "```\n"
                                "~~~\n"
                                "[[AlsoFake]]\n"
                                "~~~\n"
                                "Inline `[[Hidden]] #hidden` but [[Shown]] #shown\n");
    const auto& md = note.metadata;
    CHECK(hasLink(md, "Real"));
    CHECK(hasLink(md, "Shown"));
    CHECK_FALSE(hasLink(md, "Fake"));
    CHECK_FALSE(hasLink(md, "AlsoFake"));
    CHECK_FALSE(hasLink(md, "Hidden"));
    CHECK(md.headings.empty());
    CHECK(md.tags == std::vector<std::string>{"#shown"});
}

TEST_CASE("Malformed front matter is ignored but flagged", "[vault][parser][catch2]") {
    const auto note = parseNote("---\n- just\n- a list\n---\nBody with [[Link]]\n");
    CHECK_FALSE(note.frontmatterValid);
    CHECK(note.metadata.frontmatter == json::object());
    CHECK(hasLink(note.metadata, "Link"));
    CHECK(note.body == "Body with [[Link]]\n");
}
