#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <loregraph/graph/alias_utils.h>
#include <loregraph/graph/frontmatter_utils.h>
#include <loregraph/graph/semantic_predicate.h>
#include <loregraph/graph/types.h>

using namespace loregraph::graph;
using nlohmann::json;

TEST_CASE("Predicate keys normalize casing and separators", "[graph][predicate][catch2]") {
    CHECK(normalizePredicateKey("alliedWith") == "allied_with");
    CHECK(normalizePredicateKey(" Located In ") == "located_in");
    CHECK(normalizePredicateKey("RULED-BY") == "ruled_by");
    CHECK(normalizePredicateKey("--") == "");
    CHECK(normalizePredicateKey("member__of") == "member_of");
}

TEST_CASE("Semantic predicates parse canonical names and aliases", "[graph][predicate][catch2]") {
    CHECK(parseSemanticPredicate("allied_with") == SemanticPredicate::AlliedWith);
    CHECK(parseSemanticPredicate("AlliedWith") == SemanticPredicate::AlliedWith);
    CHECK(parseSemanticPredicate("ally") == SemanticPredicate::AlliedWith);
    CHECK(parseSemanticPredicate("enemy of") == SemanticPredicate::RivalOf);
    CHECK(parseSemanticPredicate("inhabits") == SemanticPredicate::LocatedIn);
    CHECK(parseSemanticPredicate("serves") == SemanticPredicate::MemberOf);
    CHECK_FALSE(parseSemanticPredicate("befriends").has_value());
    CHECK_FALSE(parseSemanticPredicate("").has_value());

    const std::string spelled = "residesIn";
    CHECK(parseSemanticPredicate(spelled) == SemanticPredicate::LocatedIn);

    CHECK(parsePredicateValue(json("rules")) == SemanticPredicate::Rules);
    CHECK_FALSE(parsePredicateValue(json(42)).has_value());
    CHECK_FALSE(parsePredicateValue(json(nullptr)).has_value());

    CHECK(isCanonicalPredicateName("allied_with"));
    CHECK_FALSE(isCanonicalPredicateName("alliedWith"));
}

TEST_CASE("Every canonical predicate round-trips through its name", "[graph][predicate][catch2]") {
    for (auto predicate : kAllSemanticPredicates) {
        INFO(semanticPredicateName(predicate));
        CHECK(parseSemanticPredicate(semanticPredicateName(predicate)) == predicate);
        CHECK(isCanonicalPredicateName(semanticPredicateName(predicate)));
    }
}

TEST_CASE("Relation types convert to and from JSON", "[graph][types][catch2]") {
    CHECK(json(RelationType::HeadingCooccurrence) == "heading_cooccurrence");
    CHECK(json("semantic_frontmatter").get<RelationType>() == RelationType::SemanticFrontmatter);
    CHECK_THROWS(json("telepathy").get<RelationType>());
    CHECK_FALSE(parseRelationType("").has_value());

    EntityEdge edge;
    edge.id = "A.md|semantic_frontmatter:rules|B.md";
    edge.fromId = "A.md";
    edge.toId = "B.md";
    edge.relation = RelationType::SemanticFrontmatter;
    edge.semanticPredicate = SemanticPredicate::Rules;
    edge.confidence = 0.9;
    const json j = edge;
    CHECK(j["relation"] == "semantic_frontmatter");
    CHECK(j["semanticPredicate"] == "rules");
}

TEST_CASE("Aliases normalize brackets, case and whitespace", "[graph][alias][catch2]") {
    CHECK(normalizeAlias("  The  Iron\tPrince ") == "the iron prince");
    CHECK(normalizeAlias("[[Arin]]") == "arin");
    CHECK(normalizeAlias("House (Valoria)") == "house valoria");
    CHECK(normalizeAlias("   ") == "");
}

TEST_CASE("Alias tokenization keeps word characters and non-ASCII bytes",
          "[graph][alias][catch2]") {
    const auto tokens = tokenizeAliasText("sir arin-prime, of caer\xc3\xa9");
    REQUIRE(tokens.size() == 4);
    CHECK(tokens[0] == "sir");
    CHECK(tokens[1] == "arin-prime");
    CHECK(tokens[2] == "of");
    CHECK(tokens[3] == "caer\xc3\xa9");
}

TEST_CASE("Candidate alias terms list the query then n-grams longest first",
          "[graph][alias][catch2]") {
    const auto terms = generateCandidateAliasTerms("who is the iron prince");
    REQUIRE_FALSE(terms.empty());
    CHECK(terms.front() == "who is the iron prince");
    CHECK(terms[1] == "who is the iron");
    CHECK(std::find(terms.begin(), terms.end(), "iron prince") != terms.end());
    CHECK(std::find(terms.begin(), terms.end(), "prince") != terms.end());

    SECTION("single-character tokens are dropped") {
        const auto short_terms = generateCandidateAliasTerms("a b");
        CHECK(std::find(short_terms.begin(), short_terms.end(), "a") == short_terms.end());
        CHECK(std::find(short_terms.begin(), short_terms.end(), "a b") != short_terms.end());
    }

    SECTION("only the first tokens are considered") {
        std::string query;
        for (int i = 0; i < 30; ++i) {
            query += (i ? " w" : "w") + std::to_string(i);
        }
        const auto many = generateCandidateAliasTerms(query);
        CHECK(std::find(many.begin(), many.end(), "w17") != many.end());
        CHECK(std::find(many.begin(), many.end(), "w18") == many.end());
    }
}

TEST_CASE("Term scores favour longer phrases", "[graph][alias][catch2]") {
    CHECK(computeTermScore("arin") == Catch::Approx(11.0));
    CHECK(computeTermScore("the iron prince") == Catch::Approx(33.75));
    CHECK(computeTermScore("iron prince") > computeTermScore("prince"));
    // length contribution is capped at 10
    CHECK(computeTermScore(std::string(80, 'x')) == Catch::Approx(20.0));
}

TEST_CASE("Term scores measure length in code points", "[graph][alias][catch2]") {
    // "caeré": six bytes, five code points
    CHECK(computeTermScore("caer\xC3\xA9") == Catch::Approx(11.25));
    // two CJK characters, three bytes each
    CHECK(computeTermScore("\xE7\x8E\x8B\xE5\x9F\x8E") == Catch::Approx(10.5));
    CHECK(computeTermScore("caer\xC3\xA9") == Catch::Approx(computeTermScore("caere")));
}

TEST_CASE("Truthiness follows loosely-typed front matter", "[graph][frontmatter][catch2]") {
    CHECK_FALSE(isTruthy(json(nullptr)));
    CHECK_FALSE(isTruthy(json(false)));
    CHECK_FALSE(isTruthy(json(0)));
    CHECK_FALSE(isTruthy(json("")));
    CHECK(isTruthy(json("0")));
    CHECK(isTruthy(json::array()));
    CHECK(isTruthy(json::object()));

    const json record{{"predicate", ""}, {"relation", "rules"}, {"type", "allied_with"}};
    const auto* field = firstTruthyField(record, {"predicate", "relation", "type"});
    REQUIRE(field != nullptr);
    CHECK(*field == "rules");
    CHECK(firstTruthyField(record, {"missing"}) == nullptr);
    CHECK(firstTruthyField(json::array(), {"predicate"}) == nullptr);
}

TEST_CASE("Numeric coercion mirrors loose front matter values", "[graph][frontmatter][catch2]") {
    const json n = 0.84;
    const json s = " 80 ";
    const json blank = "  ";
    const json word = "high";
    const json yes = true;
    const json nil = nullptr;
    const json arr = json::array({1});
    CHECK(toNumber(&n) == 0.84);
    CHECK(toNumber(&s) == 80.0);
    CHECK(toNumber(&blank) == 0.0);
    CHECK_FALSE(toNumber(&word).has_value());
    CHECK(toNumber(&yes) == 1.0);
    CHECK(toNumber(&nil) == 0.0);
    CHECK_FALSE(toNumber(&arr).has_value());
    CHECK_FALSE(toNumber(nullptr).has_value());
}

TEST_CASE("Confidence normalizes to fractions and percents", "[graph][frontmatter][catch2]") {
    const json fraction = 0.84;
    const json percent = 80;
    const json huge = 250;
    const json tiny = 0.01;
    const json text = "unknown";

    CHECK(normalizeConfidenceFraction(&fraction, 70) == Catch::Approx(0.84));
    CHECK(normalizeConfidenceFraction(&percent, 70) == Catch::Approx(0.80));
    CHECK(normalizeConfidenceFraction(&huge, 70) == Catch::Approx(1.0));
    CHECK(normalizeConfidenceFraction(&tiny, 70) == Catch::Approx(0.1));
    CHECK(normalizeConfidenceFraction(&text, 75) == Catch::Approx(0.75));
    CHECK(normalizeConfidenceFraction(nullptr, 70) == Catch::Approx(0.70));

    CHECK(normalizeConfidencePercent(&fraction, 70) == 84);
    CHECK(normalizeConfidencePercent(&percent, 70) == 80);
    CHECK(normalizeConfidencePercent(&huge, 70) == 100);
    CHECK(normalizeConfidencePercent(&tiny, 70) == 1);
    CHECK(normalizeConfidencePercent(nullptr, 65) == 65);
}

TEST_CASE("Wiki links are extracted and unwrapped", "[graph][frontmatter][catch2]") {
    const auto targets = extractWikiLinkTargets("Allied with [[Lira|her]] and [[ Marek#Exile ]].");
    REQUIRE(targets.size() == 2);
    CHECK(targets[0] == "Lira");
    CHECK(targets[1] == "Marek");

    CHECK(unwrapWikiLink("[[Lira#Early life|her]]") == std::optional<std::string>("Lira"));
    CHECK_FALSE(unwrapWikiLink("see [[Lira]]").has_value());
    CHECK_FALSE(unwrapWikiLink("Lira").has_value());
}

TEST_CASE("Front matter values yield aliases, references and targets",
          "[graph][frontmatter][catch2]") {
    const json aliases =
        json::array({"Realm of Dawn", json::array({"The Crown"}), 5, "realm of dawn"});
    const auto collected = collectAliasValues(aliases);
    REQUIRE(collected.size() == 2);
    CHECK(collected[0] == "realm of dawn");
    CHECK(collected[1] == "the crown");

    const json fm{{"ally", "[[Places/Sunhold]]"},
                  {"home", "Places/Keep.md"},
                  {"motto", "Dawn rises"},
                  {"nested", json{{"seat", "Kingdom/Valoria"}}}};
    const auto refs = collectReferenceCandidates(fm);
    CHECK(std::find(refs.begin(), refs.end(), "Places/Sunhold") != refs.end());
    CHECK(std::find(refs.begin(), refs.end(), "Places/Keep.md") != refs.end());
    CHECK(std::find(refs.begin(), refs.end(), "Kingdom/Valoria") != refs.end());
    CHECK(std::find(refs.begin(), refs.end(), "Dawn rises") == refs.end());

    const auto targets = collectTargetCandidates(json::array({" Lira ", "[[Marek]] and [[Osk]]"}));
    REQUIRE(targets.size() == 3);
    CHECK(targets[0] == "Lira");
    CHECK(targets[1] == "Marek");
    CHECK(targets[2] == "Osk");
}

TEST_CASE("Configured field lists and bounds are sanitized", "[graph][frontmatter][catch2]") {
    const auto fields = sanitizeFieldList({" aliases ", "", "  ", "nameAliases"});
    REQUIRE(fields.size() == 2);
    CHECK(fields[0] == "aliases");
    CHECK(fields[1] == "nameAliases");

    std::vector<std::string> many(40, "field");
    CHECK(sanitizeFieldList(many).size() == kMaxConfiguredFields);

    CHECK(clampMinimumConfidence(-5) == 0);
    CHECK(clampMinimumConfidence(140) == 100);
    CHECK(clampBatchSize(1) == 5);
    CHECK(clampBatchSize(500) == 200);
    CHECK(clampBatchSize(25) == 25);

    CHECK(fixedPredicateKeys().size() == kAllSemanticPredicates.size());
}
