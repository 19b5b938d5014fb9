#include <catch2/catch_test_macros.hpp>

#include "questions/question_trigger.hpp"
#include "test_doubles.hpp"

#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

namespace {

struct RecordingQuestions : QuestionObserver {
    std::mutex m;
    std::condition_variable cv;
    std::vector<std::string> detected;
    std::vector<std::string> chunks;
    std::vector<std::pair<std::string, bool>> completed;
    std::optional<SessionError> last_error;

    void on_question_detected(const std::string& q) override {
        std::lock_guard lock(m);
        detected.push_back(q);
    }
    void on_answer_chunk(const std::string&, const std::string& chunk) override {
        std::lock_guard lock(m);
        chunks.push_back(chunk);
    }
    void on_answer_complete(const std::string& q,
                            const std::expected<void, SessionError>& result) override {
        {
            std::lock_guard lock(m);
            completed.emplace_back(q, result.has_value());
            if (!result) last_error = result.error();
        }
        cv.notify_all();
    }

    bool wait_completed(size_t n) {
        std::unique_lock lock(m);
        return cv.wait_for(lock, 2s, [&] { return completed.size() >= n; });
    }
};

} // namespace

TEST_CASE("extract_question", "[questions]") {
    SECTION("LastQuestionLine") {
        REQUIRE(extract_question("the weather is nice. is it raining?") == "is it raining?");
        REQUIRE(extract_question("Great! So why not?") == "So why not?");
        REQUIRE(extract_question("the weather is nice.\nis it raining?") == "is it raining?");
        REQUIRE(extract_question("why?\nand how?\nno question here") == "and how?");
    }

    SECTION("AbbreviationsDoNotSplit") {
        REQUIRE(extract_question("e.g. is this right?") == "e.g. is this right?");
        REQUIRE(extract_question("Ask Mr. Smith first. Is he in?") == "Is he in?");
        REQUIRE(extract_question("tabs vs. spaces?") == "tabs vs. spaces?");
    }

    SECTION("TruncatedAfterLastQuestionMark") {
        REQUIRE(extract_question("  what? really? okay then") == "what? really?");
        REQUIRE(extract_question("version 2.5 or 3.0?") == "version 2.5 or 3.0?");
    }

    SECTION("NoQuestionMark") {
        REQUIRE_FALSE(extract_question("statement only"));
        REQUIRE_FALSE(extract_question(""));
    }

    SECTION("MinimumLength") {
        REQUIRE(extract_question("ok?") == "ok?");
        REQUIRE(extract_question("  ok?  ") == "ok?");
        REQUIRE_FALSE(extract_question("k?"));
        REQUIRE_FALSE(extract_question(" ?"));
    }
}

TEST_CASE("AnsweredQuestions", "[questions]") {
    AnsweredQuestions answered;

    REQUIRE(answered.try_claim("Is it raining?"));
    REQUIRE_FALSE(answered.try_claim("is IT raining?"));
    REQUIRE(answered.try_claim("Is it snowing?"));
    REQUIRE(answered.size() == 2);

    answered.clear();
    REQUIRE(answered.try_claim("Is it raining?"));
}

TEST_CASE("QuestionTrigger", "[questions]") {
    FakeAnswerStreamer answers;
    RecordingQuestions observer;
    QuestionTrigger trigger(answers, observer);

    SECTION("TurnWithQuestionStreamsAnswer") {
        auto q = trigger.on_turn_complete("So tell me.\nWhat is RAII?");
        REQUIRE(q == "What is RAII?");
        REQUIRE(observer.wait_completed(1));

        std::lock_guard lock(observer.m);
        REQUIRE(observer.detected == std::vector<std::string>{"What is RAII?"});
        REQUIRE(observer.chunks == answers.chunks);
        REQUIRE(observer.completed.front().second);
        REQUIRE(answers.questions() == std::vector<std::string>{"What is RAII?"});
    }

    SECTION("TurnWithoutQuestionIgnored") {
        REQUIRE_FALSE(trigger.on_turn_complete("Nothing to ask."));
        REQUIRE_FALSE(trigger.on_turn_complete(""));
        REQUIRE(answers.questions().empty());
    }

    SECTION("RepeatedQuestionAnsweredOnce") {
        REQUIRE(trigger.on_turn_complete("Is it raining?"));
        REQUIRE_FALSE(trigger.on_turn_complete("IS IT RAINING?"));
        REQUIRE(observer.wait_completed(1));
        trigger.cancel_all();

        REQUIRE(answers.questions().size() == 1);
        REQUIRE(trigger.answered_count() == 1);
    }

    SECTION("AskSkipsExtractionButNotDedup") {
        REQUIRE(trigger.ask("  tell me about move semantics  ") == "tell me about move semantics");
        REQUIRE_FALSE(trigger.ask("Tell me about move semantics"));
        REQUIRE_FALSE(trigger.ask("   "));
        REQUIRE(observer.wait_completed(1));
    }

    SECTION("ResetAllowsRepeatInNewSession") {
        REQUIRE(trigger.on_turn_complete("Is it raining?"));
        REQUIRE(observer.wait_completed(1));
        trigger.reset();
        REQUIRE(trigger.on_turn_complete("Is it raining?"));
        REQUIRE(observer.wait_completed(2));
    }

    SECTION("FailureReported") {
        answers.failure = SessionError{SessionError::Kind::ProviderError, "HTTP 500: oops"};
        REQUIRE(trigger.on_turn_complete("Why?"));
        REQUIRE(observer.wait_completed(1));

        std::lock_guard lock(observer.m);
        REQUIRE_FALSE(observer.completed.front().second);
        REQUIRE(observer.last_error->kind == SessionError::Kind::ProviderError);
    }

    SECTION("CancelAllStopsInFlightAnswers") {
        answers.block_until_stopped = true;
        REQUIRE(trigger.on_turn_complete("Will this finish?"));
        REQUIRE(trigger.on_turn_complete("And this one?"));
        REQUIRE(answers.wait_for_questions(2));
        REQUIRE(trigger.active_answers() == 2);

        trigger.cancel_all();

        REQUIRE(trigger.active_answers() == 0);
        std::lock_guard lock(observer.m);
        REQUIRE(observer.completed.size() == 2);
        REQUIRE(observer.last_error->kind == SessionError::Kind::Cancelled);
    }
}
