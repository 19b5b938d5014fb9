#include "questions/question_trigger.hpp"

#include "transcript/transcript_assembler.hpp"

#include <algorithm>
#include <iterator>
#include <print>

namespace {

// True when the word ending `text` reads as an abbreviation ("e.g", "Mr",
// "vs") rather than the end of a sentence.
bool is_abbreviation(std::string_view text) {
    size_t start = text.find_last_of(" \t");
    auto word = start == std::string_view::npos ? text : text.substr(start + 1);
    return word.size() <= 2 || word.find('.') != std::string_view::npos;
}

} // namespace

std::optional<std::string> extract_question(std::string_view turn) {
    std::optional<std::string_view> candidate;

    size_t pos = 0;
    while (pos <= turn.size()) {
        size_t end = turn.find('\n', pos);
        if (end == std::string_view::npos) end = turn.size();
        auto line = turn.substr(pos, end - pos);
        if (line.find('?') != std::string_view::npos) candidate = line;
        pos = end + 1;
    }

    if (!candidate) return std::nullopt;

    auto line = candidate->substr(0, candidate->rfind('?') + 1);

    // Drop statements that precede the question on the same line.
    for (size_t i = line.size(); i-- > 1;) {
        if ((line[i - 1] == '.' || line[i - 1] == '!') &&
            (line[i] == ' ' || line[i] == '\t')) {
            if (line[i - 1] == '.' && is_abbreviation(line.substr(0, i - 1))) continue;
            line.remove_prefix(i);
            break;
        }
    }

    auto question = text_util::trim(line);
    if (question.size() < 3) return std::nullopt;
    return question;
}

bool AnsweredQuestions::try_claim(const std::string& question) {
    std::lock_guard lock(mutex_);
    return seen_.insert(text_util::to_lower(question)).second;
}

void AnsweredQuestions::clear() {
    std::lock_guard lock(mutex_);
    seen_.clear();
}

size_t AnsweredQuestions::size() const {
    std::lock_guard lock(mutex_);
    return seen_.size();
}

QuestionTrigger::QuestionTrigger(AnswerStreamer& answers, QuestionObserver& observer, bool verbose)
    : answers_(answers), observer_(observer), verbose_(verbose) {}

QuestionTrigger::~QuestionTrigger() {
    cancel_all();
}

std::optional<std::string> QuestionTrigger::on_turn_complete(const std::string& turn) {
    if (text_util::is_blank(turn)) return std::nullopt;

    auto question = extract_question(turn);
    if (!question) return std::nullopt;
    return dispatch(std::move(*question));
}

std::optional<std::string> QuestionTrigger::ask(const std::string& question) {
    auto trimmed = text_util::trim(question);
    if (trimmed.empty()) return std::nullopt;
    return dispatch(std::move(trimmed));
}

std::optional<std::string> QuestionTrigger::dispatch(std::string question) {
    if (!answered_.try_claim(question)) {
        log("already answered: " + question);
        return std::nullopt;
    }

    observer_.on_question_detected(question);
    log("answering: " + question);

    reap_finished();

    auto finished = std::make_shared<std::atomic<bool>>(false);
    std::jthread thread([this, question, finished](std::stop_token stop) {
        auto res = answers_.stream(question,
            [this, &question](const std::string& chunk) {
                observer_.on_answer_chunk(question, chunk);
            },
            stop);
        if (!res && res.error().kind != SessionError::Kind::Cancelled) {
            std::println(stderr, "answer: failed for \"{}\": {}", question, res.error().describe());
        }
        observer_.on_answer_complete(question, res);
        finished->store(true, std::memory_order_release);
    });

    std::lock_guard lock(workers_mutex_);
    workers_.push_back(Worker{std::move(thread), std::move(finished)});
    return question;
}

void QuestionTrigger::cancel_all() {
    std::vector<Worker> workers;
    {
        std::lock_guard lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& w : workers) w.thread.request_stop();
    for (auto& w : workers) {
        if (w.thread.joinable()) w.thread.join();
    }
}

size_t QuestionTrigger::active_answers() const {
    std::lock_guard lock(workers_mutex_);
    return static_cast<size_t>(std::count_if(workers_.begin(), workers_.end(), [](const Worker& w) {
        return !w.finished->load(std::memory_order_acquire);
    }));
}

void QuestionTrigger::reap_finished() {
    std::vector<Worker> done;
    {
        std::lock_guard lock(workers_mutex_);
        auto it = std::partition(workers_.begin(), workers_.end(), [](const Worker& w) {
            return !w.finished->load(std::memory_order_acquire);
        });
        std::move(it, workers_.end(), std::back_inserter(done));
        workers_.erase(it, workers_.end());
    }
    // Finished threads return promptly; joining them here keeps the list short.
    for (auto& w : done) {
        if (w.thread.joinable()) w.thread.join();
    }
}

void QuestionTrigger::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[live-answer] questions: {}", msg);
    }
}
