#include <catch2/catch_test_macros.hpp>

#include <loregraph/config/config_helpers.h>
#include <loregraph/config/settings.h>

#include "../../common/test_helpers_catch2.h"

#include <vector>

using namespace loregraph;
using namespace loregraph::config;
using loregraph::test::ScopedEnvVar;
using loregraph::test::TempDir;

TEST_CASE("Config helpers parse TOML values", "[config][helpers][catch2]") {
    TempDir dir;
    const auto path = dir.write("config.toml", "# loregraph\n"
                                               "top = 1\n"
                                               "[entity_graph]\n"
                                               "max_hops = 3 # inline comment\n"
                                               "alias_fields = [\"aliases\", 'nameAliases']\n"
                                               "label = \"Hall # of records\"\n"
                                               "[vault]\n"
                                               "max_hops = 9\n"
                                               "entity_graph.debug = true\n");

    CHECK(parse_config_value(path, "entity_graph", "max_hops") == "3");
    CHECK(parse_config_value(path, "entity_graph", "label") == "Hall # of records");
    CHECK(parse_config_value(path, "vault", "max_hops") == "9");
    CHECK(parse_config_value(path, "entity_graph", "debug") == "true");
    CHECK(parse_config_value(path, "entity_graph", "missing").empty());
    CHECK(parse_config_value(dir.path() / "nope.toml", "entity_graph", "max_hops").empty());
}

TEST_CASE("Config helpers parse lists and booleans", "[config][helpers][catch2]") {
    CHECK(parse_string_list("[\"aliases\", 'nameAliases', \"\"]") ==
          std::vector<std::string>{"aliases", "nameAliases"});
    CHECK(parse_string_list("relations, links") ==
          std::vector<std::string>{"relations", "links"});
    CHECK(parse_string_list("[\"a,b\", c]") == std::vector<std::string>{"a,b", "c"});
    CHECK(parse_string_list("").empty());

    CHECK(parse_bool("Yes", false));
    CHECK(parse_bool("on", false));
    CHECK_FALSE(parse_bool("0", true));
    CHECK(parse_bool("maybe", true));
    CHECK_FALSE(parse_bool("maybe", false));
}

TEST_CASE("Config path honours overrides", "[config][helpers][catch2]") {
    SECTION("explicit override") {
        CHECK(get_config_path("/tmp/lore.toml") == std::filesystem::path("/tmp/lore.toml"));
    }

    SECTION("environment") {
        ScopedEnvVar env("LOREGRAPH_CONFIG", std::string("/srv/lore/config.toml"));
        CHECK(get_config_path() == std::filesystem::path("/srv/lore/config.toml"));
    }

    SECTION("XDG directory") {
        ScopedEnvVar env("LOREGRAPH_CONFIG", std::nullopt);
        ScopedEnvVar xdg("XDG_CONFIG_HOME", std::string("/home/lore/.cfg"));
        CHECK(get_config_dir() == std::filesystem::path("/home/lore/.cfg/loregraph"));
        CHECK(get_config_path() == std::filesystem::path("/home/lore/.cfg/loregraph/config.toml"));
    }
}

TEST_CASE("Settings load from TOML with defaults", "[config][settings][catch2]") {
    SECTION("missing file yields defaults") {
        TempDir dir;
        const auto loaded = loadSettings(dir.path() / "absent.toml");
        REQUIRE(loaded.has_value());
        CHECK(loaded.value() == GraphSettings{});
    }

    SECTION("recognized keys override defaults") {
        TempDir dir;
        const auto path = dir.write("config.toml", "[entity_graph]\n"
                                                   "alias_fields = [\"aliases\", \"nameAliases\"]\n"
                                                   "semantic_relations = false\n"
                                                   "semantic_fields = relations, bonds\n"
                                                   "semantic_min_confidence = 80\n"
                                                   "semantic_batch_size = 40\n"
                                                   "retrieval = no\n"
                                                   "max_hops = 3\n"
                                                   "max_expanded_docs = oops\n"
                                                   "debug = true\n"
                                                   "[vault]\n"
                                                   "include = [\"Lore/**\"]\n"
                                                   "exclude = [\"Templates/**\", "
                                                   "\"*.canvas.md\"]\n");
        const auto loaded = loadSettings(path);
        REQUIRE(loaded.has_value());
        const auto& s = loaded.value();
        CHECK(s.entityAliasFields == std::vector<std::string>{"aliases", "nameAliases"});
        CHECK_FALSE(s.enableSemanticEntityRelations);
        CHECK(s.semanticEntityRelationFields == std::vector<std::string>{"relations", "bonds"});
        CHECK(s.semanticEntityMinConfidence == 80);
        CHECK(s.semanticEntityBatchSize == 40);
        CHECK_FALSE(s.enableEntityGraphRetrieval);
        CHECK(s.entityGraphMaxHops == 3);
        CHECK(s.entityGraphMaxExpandedDocs == 12);
        CHECK(s.debug);
        CHECK(s.includePatterns == std::vector<std::string>{"Lore/**"});
        CHECK(s.excludePatterns == std::vector<std::string>{"Templates/**", "*.canvas.md"});
    }
}

TEST_CASE("SettingsStore publishes changes to subscribers", "[config][settings][catch2]") {
    SettingsStore store;
    std::vector<std::pair<int, int>> seen;
    const auto id = store.subscribe([&seen, &store](const GraphSettings& prev,
                                                    const GraphSettings& next) {
        // Listeners may read back the current settings
        CHECK(store.get() == next);
        seen.emplace_back(prev.entityGraphMaxHops, next.entityGraphMaxHops);
    });
    CHECK(store.subscriberCount() == 1);

    store.update([](GraphSettings& s) { s.entityGraphMaxHops = 3; });
    CHECK(store.get().entityGraphMaxHops == 3);

    GraphSettings next = store.get();
    next.entityGraphMaxHops = 1;
    store.set(next);

    REQUIRE(seen.size() == 2);
    CHECK(seen[0] == std::pair<int, int>{2, 3});
    CHECK(seen[1] == std::pair<int, int>{3, 1});

    store.unsubscribe(id);
    CHECK(store.subscriberCount() == 0);
    store.update([](GraphSettings& s) { s.debug = true; });
    CHECK(seen.size() == 2);
    CHECK(store.get().debug);
}
