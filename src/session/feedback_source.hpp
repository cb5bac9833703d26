#pragma once

#include <iostream>
#include <string>

namespace autopilot::session {

// Asks a human what was wrong with a proposed final answer.
class FeedbackSource {
public:
    virtual ~FeedbackSource() = default;
    virtual std::string request_feedback(const std::string& proposed_answer) = 0;
};

class ConsoleFeedback : public FeedbackSource {
public:
    ConsoleFeedback(std::istream& in = std::cin, std::ostream& out = std::cout)
        : in_(in), out_(out) {}

    std::string request_feedback(const std::string& proposed_answer) override {
        out_ << "Proposed answer: " << proposed_answer << "\n"
             << "Understood. What was wrong with the proposed answer? " << std::flush;
        std::string line;
        std::getline(in_, line);
        return line;
    }

private:
    std::istream& in_;
    std::ostream& out_;
};

}  // namespace autopilot::session
