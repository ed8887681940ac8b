#include <catch2/catch_test_macros.hpp>

#include <loregraph/graph/relation_proposal_store.h>

#include <thread>
#include <vector>

using namespace loregraph::graph;
using nlohmann::json;

TEST_CASE("Proposals are extracted from nested payloads", "[graph][proposals][catch2]") {
    const json payload{
        {"type", "semantic_relation_proposals"},
        {"data",
         {{"proposals", json::array({json{{"notePath", "Characters/Arin"},
                                          {"predicate", "ally"},
                                          {"targetPath", "[[Characters/Lira]]"},
                                          {"confidence", 0.84}},
                                     json{{"sourcePath", "Characters/Arin.md"},
                                          {"relation", "rival_of"},
                                          {"target", "Characters/Marek"},
                                          {"confidence", 71}}})}}}};

    const auto proposals = extractProposalsFromPayload(payload);
    REQUIRE(proposals.size() == 2);
    CHECK(proposals[0].predicate == "allied_with");
    CHECK(proposals[0].notePath == "Characters/Arin.md");
    CHECK(proposals[0].targetPath == "Characters/Lira.md");
    CHECK(proposals[0].confidence == 84.0);
    CHECK(proposals[1].predicate == "rival_of");
    CHECK(proposals[1].targetPath == "Characters/Marek.md");
    CHECK(proposals[1].confidence == 71.0);
}

TEST_CASE("Proposals are extracted from tool-call text blocks", "[graph][proposals][catch2]") {
    const std::string text = "I found candidates.\n\n```tool\nsubmitSemanticRelationProposals\n"
                             "{\n  \"proposals\": [\n"
                             "    {\"notePath\": \"Canon Lore/Characters/Arin\", "
                             "\"predicate\": \"locatedIn\", "
                             "\"targetPath\": \"Canon Lore/Places/Grayharbor\", "
                             "\"confidence\": 72},\n"
                             "    {\"notePath\": \"Canon Lore/Characters/Arin\", "
                             "\"predicate\": \"enemy_of\", "
                             "\"targetPath\": \"Canon Lore/Characters/Marek\", "
                             "\"confidence\": 61}\n"
                             "  ]\n}\n```";

    const auto proposals = extractProposalsFromText(text);
    REQUIRE(proposals.size() == 2);
    CHECK(proposals[0].predicate == "located_in");
    CHECK(proposals[1].predicate == "rival_of");
    CHECK(proposals[0].notePath == "Canon Lore/Characters/Arin.md");
}

TEST_CASE("Tool-call proposals are found next to unrelated tool JSON",
          "[graph][proposals][catch2]") {
    const std::string text =
        "{\"tool\":\"search_vault_simple\",\"args\":{\"query\":\"Baelmir\"}}\n\n"
        "```tool\nsubmitSemanticRelationProposals\n[\n"
        "  {\"notePath\":\"Characters/Arin\",\"predicate\":\"ally\","
        "\"targetPath\":\"Characters/Lira\",\"confidence\":81},\n"
        "  {\"notePath\":\"Characters/Arin\",\"predicate\":\"enemy_of\","
        "\"targetPath\":\"Characters/Marek\",\"confidence\":63}\n"
        "]\n```";

    const auto proposals = extractProposalsFromPayload(json(text));
    REQUIRE(proposals.size() == 2);
    CHECK(proposals[0].predicate == "allied_with");
    CHECK(proposals[1].predicate == "rival_of");
}

TEST_CASE("Escaped and encoded JSON payloads are decoded", "[graph][proposals][catch2]") {
    SECTION("backslash-escaped JSON") {
        const std::string text =
            R"({\"proposals\":[{\"notePath\":\"Characters/Arin.md\",\"predicate\":\"vassal_of\",)"
            R"(\"targetPath\":\"Characters/Aenar.md\",\"confidence\":95}]})";
        const auto proposals = extractProposalsFromText(text);
        REQUIRE(proposals.size() == 1);
        CHECK(proposals[0].predicate == "vassal_of");
        CHECK(proposals[0].notePath == "Characters/Arin.md");
    }

    SECTION("ENC: URL-encoded JSON") {
        const std::string text =
            "ENC:%7B%22relations%22%3A%5B%7B%22notePath%22%3A%22Houses%2FVael%22%2C"
            "%22predicate%22%3A%22rules%22%2C%22targetPath%22%3A%22Places%2FMarch%22%7D%5D%7D";
        const auto proposals = extractProposalsFromText(text);
        REQUIRE(proposals.size() == 1);
        CHECK(proposals[0].notePath == "Houses/Vael.md");
        CHECK(proposals[0].predicate == "rules");
        CHECK(proposals[0].targetPath == "Places/March.md");
        CHECK_FALSE(proposals[0].confidence.has_value());
    }

    SECTION("malformed input yields nothing") {
        CHECK(extractProposalsFromText("ENC:%ZZ%").empty());
        CHECK(extractProposalsFromText("{\"proposals\": [").empty());
        CHECK(extractProposalsFromPayload(json(nullptr)).empty());
        CHECK(extractProposalsFromPayload(json(42)).empty());
    }
}

TEST_CASE("Unusable proposal records are dropped", "[graph][proposals][catch2]") {
    const json payload = json::array({
        json{{"notePath", "A"}, {"predicate", "befriends"}, {"targetPath", "B"}},
        json{{"notePath", ""}, {"predicate", "rules"}, {"targetPath", "B"}},
        json{{"notePath", "A"}, {"predicate", "rules"}},
        json{{"notePath", "[[A#Intro|a]]"}, {"predicate", "rules"}, {"targetPath", "B"},
             {"confidence", 140}},
    });
    const auto proposals = extractProposalsFromPayload(payload);
    REQUIRE(proposals.size() == 1);
    CHECK(proposals[0].notePath == "A.md");
    CHECK(proposals[0].targetPath == "B.md");
    CHECK(proposals[0].confidence == 100.0);
}

TEST_CASE("Duplicate proposals keep the more confident entry", "[graph][proposals][catch2]") {
    const json payload = json::array({
        json{{"notePath", "A"}, {"predicate", "rules"}, {"targetPath", "B"}, {"confidence", 80}},
        json{{"notePath", "C"}, {"predicate", "rules"}, {"targetPath", "D"}, {"confidence", 50}},
        json{{"notePath", "A.md"}, {"predicate", "Rules"}, {"targetPath", "B"}, {"confidence", 60}},
        json{{"notePath", "C"}, {"predicate", "rules"}, {"targetPath", "D"}, {"confidence", 90}},
    });
    const auto proposals = extractProposalsFromPayload(payload);
    REQUIRE(proposals.size() == 2);
    CHECK(proposals[0].notePath == "A.md");
    CHECK(proposals[0].confidence == 80.0);
    CHECK(proposals[1].notePath == "C.md");
    CHECK(proposals[1].confidence == 90.0);
}

TEST_CASE("RelationProposalStore ingests tool outputs", "[graph][proposals][store][catch2]") {
    RelationProposalStore store;
    const auto inserted = store.ingestFromToolOutput(
        "extractEntityRelations",
        json(R"({"semanticRelationProposals":[{"notePath":"Characters/Arin.md",)"
             R"("predicate":"allied_with","targetPath":"Characters/Lira.md","confidence":88}]})"));
    CHECK(inserted == 1);
    CHECK(store.size() == 1);

    const auto adapter = makeToolOutputProposalAdapter(store);
    CHECK(adapter.id == "tool-output-semantic-relations");
    REQUIRE(adapter.getProposals);
    const auto proposals = adapter.getProposals();
    REQUIRE(proposals.size() == 1);
    CHECK(proposals[0].sourceField == std::optional<std::string>("tool:extractEntityRelations"));
    CHECK(proposals[0].predicate == "allied_with");

    CHECK(store.ingestFromToolOutput("noise", json("nothing to see here")) == 0);
    store.clear();
    CHECK(store.size() == 0);
    CHECK(adapter.getProposals().empty());
}

TEST_CASE("RelationProposalStore ingests explicit proposals", "[graph][proposals][store][catch2]") {
    RelationProposalStore store;
    const auto accepted = store.ingestProposals(
        {{"Characters/Arin", "ally", "Characters/Lira", 80.0, std::nullopt}},
        "tool:submitSemanticRelationProposals");
    CHECK(accepted == 1);

    auto proposals = store.getAllProposals();
    REQUIRE(proposals.size() == 1);
    CHECK(proposals[0].notePath == "Characters/Arin.md");
    CHECK(proposals[0].targetPath == "Characters/Lira.md");
    CHECK(proposals[0].predicate == "allied_with");
    CHECK(proposals[0].sourceField ==
          std::optional<std::string>("tool:submitSemanticRelationProposals"));

    SECTION("a less confident duplicate is rejected") {
        CHECK(store.ingestProposals({{"Characters/Arin.md", "allied_with", "Characters/Lira", 40.0,
                                      std::string("manual")}},
                                    "tool:x") == 0);
        CHECK(store.getAllProposals()[0].confidence == 80.0);
    }

    SECTION("an equally confident duplicate replaces in place") {
        store.ingestProposals({{"Characters/Marek", "rules", "Places/March", 50.0, {}}}, "tool:x");
        CHECK(store.ingestProposals({{"Characters/Arin.md", "allied_with", "Characters/Lira", 80.0,
                                      std::string("manual")}},
                                    "tool:x") == 1);
        proposals = store.getAllProposals();
        REQUIRE(proposals.size() == 2);
        CHECK(proposals[0].sourceField == std::optional<std::string>("manual"));
        CHECK(proposals[1].notePath == "Characters/Marek.md");
    }
}

TEST_CASE("RelationProposalStore evicts the oldest proposals beyond capacity",
          "[graph][proposals][store][catch2]") {
    RelationProposalStore store;
    std::vector<SemanticRelationProposal> batch;
    for (std::size_t i = 0; i < kMaxStoredProposals + 5; ++i) {
        batch.push_back({"Notes/N" + std::to_string(i), "rules", "Places/P", 75.0, {}});
    }
    store.ingestProposals(batch, "tool:bulk");

    CHECK(store.size() == kMaxStoredProposals);
    const auto proposals = store.getAllProposals();
    CHECK(proposals.front().notePath == "Notes/N5.md");
    CHECK(proposals.back().notePath ==
          "Notes/N" + std::to_string(kMaxStoredProposals + 4) + ".md");
}

TEST_CASE("RelationProposalStore tolerates concurrent ingestion",
          "[graph][proposals][store][concurrency][catch2]") {
    RelationProposalStore store;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&store, t] {
            for (int i = 0; i < 50; ++i) {
                store.ingestProposals({{"T" + std::to_string(t) + "/N" + std::to_string(i),
                                        "rules", "Places/P", 75.0, {}}},
                                      "tool:thread");
            }
        });
    }
    for (auto& thread : threads)
        thread.join();
    CHECK(store.size() == 200);
}
