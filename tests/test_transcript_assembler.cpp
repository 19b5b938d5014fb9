#include <catch2/catch_test_macros.hpp>

#include "transcript/transcript_assembler.hpp"

#include <string>
#include <thread>
#include <vector>

TEST_CASE("TurnBuffer", "[transcript]") {
    TurnBuffer buf;

    SECTION("DrainTrimsAndClears") {
        buf.append("  What is ");
        buf.append("the time?\n");
        REQUIRE(buf.drain_and_clear() == "What is the time?");
        REQUIRE(buf.snapshot().empty());
        REQUIRE(buf.drain_and_clear().empty());
    }

    SECTION("ConcurrentAppendsAllLand") {
        std::vector<std::jthread> writers;
        for (int t = 0; t < 4; t++) {
            writers.emplace_back([&buf] {
                for (int i = 0; i < 250; i++) buf.append("x");
            });
        }
        writers.clear();
        REQUIRE(buf.drain_and_clear().size() == 1000);
    }
}

TEST_CASE("RollingTranscript merge", "[transcript]") {
    RollingTranscript rolling;

    SECTION("FirstTextEmittedWhole") {
        REQUIRE(rolling.merge("hello") == "hello");
        REQUIRE(rolling.text() == "hello");
    }

    SECTION("ExtensionEmitsSuffix") {
        REQUIRE(rolling.merge("hello wor"));
        REQUIRE(rolling.merge("hello world") == "ld");
        REQUIRE(rolling.text() == "hello world");
    }

    SECTION("SameTextTwiceEmitsNothing") {
        REQUIRE(rolling.merge("the quick fox"));
        REQUIRE_FALSE(rolling.merge("the quick fox"));
        REQUIRE_FALSE(rolling.merge("The Quick Fox"));
    }

    SECTION("StalePrefixEmitsNothing") {
        REQUIRE(rolling.merge("hello world"));
        REQUIRE_FALSE(rolling.merge("hello"));
        REQUIRE(rolling.text() == "hello world");
    }

    SECTION("SuffixPrefixOverlap") {
        REQUIRE(rolling.merge("we should meet"));
        REQUIRE(rolling.merge("meet on friday") == " on friday");
        REQUIRE(rolling.text() == "we should meet on friday");
    }

    SECTION("LongestOverlapWins") {
        RollingTranscript& other = rolling;
        REQUIRE(other.merge("xxabab"));
        // "abab" and "ab" both end P and start N; the longer one is used.
        REQUIRE(other.merge("ababz") == "z");
        REQUIRE(other.text() == "xxababz");
    }

    SECTION("MidStringRepeatDropped") {
        REQUIRE(rolling.merge("one two three four"));
        REQUIRE_FALSE(rolling.merge("two three"));
        REQUIRE(rolling.text() == "one two three four");
    }

    SECTION("UnrelatedTextOnNewLine") {
        REQUIRE(rolling.merge("first sentence"));
        REQUIRE(rolling.merge("zzz") == "\nzzz");
        REQUIRE(rolling.text() == "first sentence\nzzz");
    }

    SECTION("RunningTextNeverShrinks") {
        std::vector<std::string> inputs = {
            "so", "so what", "so", "what is", "what is RAII", "nothing like it",
            "so what", "RAII?", "", "it",
        };
        size_t prev = 0;
        for (auto& in : inputs) {
            auto delta = rolling.merge(in);
            if (delta) REQUIRE_FALSE(delta->empty());
            REQUIRE(rolling.text().size() >= prev);
            prev = rolling.text().size();
        }
    }
}

TEST_CASE("TranscriptAssembler", "[transcript]") {
    SECTION("IncrementalDeltasVerbatim") {
        TranscriptAssembler assembler;
        REQUIRE(assembler.on_delta("Is it ") == "Is it ");
        REQUIRE(assembler.on_delta("raining?") == "raining?");
        REQUIRE(assembler.current_turn() == "Is it raining?");
        REQUIRE(assembler.on_turn_complete() == "Is it raining?");
        REQUIRE(assembler.current_turn().empty());
    }

    SECTION("TurnEqualsConcatenationTrimmed") {
        TranscriptAssembler assembler;
        std::vector<std::string> deltas = {" the", " weather", " is nice.", " is it raining?  "};
        std::string expected;
        for (auto& d : deltas) {
            assembler.on_delta(d);
            expected += d;
        }
        REQUIRE(assembler.on_turn_complete() == text_util::trim(expected));
    }

    SECTION("EmptyDeltaIgnored") {
        TranscriptAssembler assembler;
        REQUIRE_FALSE(assembler.on_delta(""));
    }

    SECTION("BlankTurnIsEmpty") {
        TranscriptAssembler assembler;
        assembler.on_delta("   ");
        REQUIRE(assembler.on_turn_complete().empty());
    }

    SECTION("ProviderTranscriptPreferred") {
        TranscriptAssembler assembler;
        assembler.on_delta("wat is");
        REQUIRE(assembler.on_turn_complete(std::string(" What is it? ")) == "What is it?");
        REQUIRE(assembler.current_turn().empty());
    }

    SECTION("BlankProviderTranscriptFallsBack") {
        TranscriptAssembler assembler;
        assembler.on_delta("from deltas");
        REQUIRE(assembler.on_turn_complete(std::string("  ")) == "from deltas");
    }

    SECTION("CumulativeProviderDeduplicated") {
        TranscriptAssembler assembler(true);
        REQUIRE(assembler.on_delta("hello") == "hello");
        REQUIRE(assembler.on_delta("hello wor") == " wor");
        REQUIRE_FALSE(assembler.on_delta("hello wor"));
        REQUIRE(assembler.on_delta("hello world") == "ld");
        REQUIRE(assembler.on_turn_complete() == "hello world");
    }

    SECTION("DiscardTurnKeepsNothing") {
        TranscriptAssembler assembler;
        assembler.on_delta("half");
        assembler.discard_turn();
        assembler.on_delta("whole");
        REQUIRE(assembler.on_turn_complete() == "whole");
    }
}

TEST_CASE("text_util", "[transcript]") {
    REQUIRE(text_util::trim("  a b \n") == "a b");
    REQUIRE(text_util::trim(" \t ").empty());
    REQUIRE(text_util::is_blank(" \r\n"));
    REQUIRE_FALSE(text_util::is_blank(" a "));
    REQUIRE(text_util::to_lower("Is It RAII?") == "is it raii?");
    REQUIRE(text_util::iequals("ABC", "abc"));
    REQUIRE_FALSE(text_util::iequals("abc", "abcd"));
}
