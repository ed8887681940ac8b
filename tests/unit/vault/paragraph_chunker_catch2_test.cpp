#include <catch2/catch_test_macros.hpp>

#include <loregraph/vault/paragraph_chunker.h>

#include "../../common/in_memory_document_store.h"

using namespace loregraph;
using namespace loregraph::vault;
using loregraph::test::InMemoryDocumentStore;
using loregraph::test::makeMetadata;

TEST_CASE("ParagraphChunker packs paragraphs up to the target size", "[vault][chunker][catch2]") {
    InMemoryDocumentStore store;
    ChunkingConfig config;
    config.targetChunkSize = 40;
    ParagraphChunker chunker(store, config);

    const std::string text = "First paragraph here.\n\n"  // 21 chars
                             "Second one.\n\n\n\n"        // 11 chars
                             "   \n\n"                    // blank
                             "Third paragraph is longer than the target size by itself.\r\n\r\n"
                             "Tail.";
    const auto chunks = chunker.chunkText("Lore/History.md", text);

    REQUIRE(chunks.size() == 3);
    CHECK(chunks[0].content == "First paragraph here.\n\nSecond one.");
    CHECK(chunks[1].content == "Third paragraph is longer than the target size by itself.");
    CHECK(chunks[2].content == "Tail.");
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        CHECK(chunks[i].index == i);
        CHECK(chunks[i].id == "Lore/History.md#" + std::to_string(i));
        CHECK(chunks[i].path == "Lore/History.md");
    }
}

TEST_CASE("ParagraphChunker yields nothing for blank text", "[vault][chunker][catch2]") {
    InMemoryDocumentStore store;
    ParagraphChunker chunker(store);
    CHECK(chunker.chunkText("A.md", "").empty());
    CHECK(chunker.chunkText("A.md", "  \n\n \t\n").empty());
}

TEST_CASE("ParagraphChunker reads notes through the store", "[vault][chunker][catch2]") {
    InMemoryDocumentStore store;
    store.upsert("Characters/Arin.md", 1000, makeMetadata({}, {}, {}),
                 "---\naliases: [Arin]\n---\n# Arin\n\nHeir of Valoria.\n");

    SECTION("front matter is stripped by default") {
        ParagraphChunker chunker(store);
        const auto chunks = chunker.getChunks("Characters/Arin.md");
        REQUIRE(chunks.has_value());
        REQUIRE(chunks.value().size() == 1);
        CHECK(chunks.value()[0].content == "# Arin\n\nHeir of Valoria.");
        CHECK(chunks.value()[0].id == "Characters/Arin.md#0");
    }

    SECTION("front matter can be kept") {
        ChunkingConfig config;
        config.stripFrontmatter = false;
        ParagraphChunker chunker(store, config);
        const auto chunks = chunker.getChunks("Characters/Arin.md");
        REQUIRE(chunks.has_value());
        REQUIRE_FALSE(chunks.value().empty());
        CHECK(chunks.value()[0].content.rfind("---", 0) == 0);
    }

    SECTION("missing notes report the store error") {
        ParagraphChunker chunker(store);
        const auto chunks = chunker.getChunks("Characters/Nobody.md");
        CHECK_FALSE(chunks.has_value());
    }
}
