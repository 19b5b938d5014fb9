#pragma once

#include "answer/answer_streamer.hpp"
#include "live/session_error.hpp"

#include <atomic>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_set>
#include <vector>

// Last line of `turn` containing '?', cut after its final '?' and trimmed.
// A statement ending in '.' or '!' before the question on that line is
// dropped. Candidates shorter than three characters are rejected.
std::optional<std::string> extract_question(std::string_view turn);

// Questions already answered in this recording session, compared
// case-insensitively.
class AnsweredQuestions {
public:
    // Inserts the question and returns true if it was not present.
    bool try_claim(const std::string& question);
    void clear();
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_set<std::string> seen_;
};

class QuestionObserver {
public:
    virtual ~QuestionObserver() = default;

    virtual void on_question_detected(const std::string& /*question*/) {}
    virtual void on_answer_chunk(const std::string& /*question*/, const std::string& /*chunk*/) {}
    virtual void on_answer_complete(const std::string& /*question*/,
                                    const std::expected<void, SessionError>& /*result*/) {}
};

// Turns completed transcript turns into streamed answers. Each answer runs on
// its own thread with its own stop token, so reconnects or a session
// disconnect do not interrupt it. Observer callbacks for an answer arrive on
// that answer's thread.
class QuestionTrigger {
public:
    QuestionTrigger(AnswerStreamer& answers, QuestionObserver& observer, bool verbose = false);
    ~QuestionTrigger();

    QuestionTrigger(const QuestionTrigger&) = delete;
    QuestionTrigger& operator=(const QuestionTrigger&) = delete;

    // Returns the question that was dispatched, if any.
    std::optional<std::string> on_turn_complete(const std::string& turn);

    // Explicit question. Skips extraction but not deduplication.
    std::optional<std::string> ask(const std::string& question);

    // New recording session: forget answered questions.
    void reset() { answered_.clear(); }

    // Stops and joins every in-flight answer.
    void cancel_all();

    size_t answered_count() const { return answered_.size(); }
    size_t active_answers() const;

private:
    struct Worker {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    std::optional<std::string> dispatch(std::string question);
    void reap_finished();
    void log(const std::string& msg);

    AnswerStreamer& answers_;
    QuestionObserver& observer_;
    bool verbose_;

    AnsweredQuestions answered_;

    mutable std::mutex workers_mutex_;
    std::vector<Worker> workers_;
};
