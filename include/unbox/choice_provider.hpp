#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace unbox {

// ============================================================================
// Choice Provider
// ============================================================================

/**
 * @brief Source of interactive decisions
 *
 * Every method returns std::nullopt when the user cancels; callers abort the
 * whole unbox run in that case.
 */
class ChoiceProvider {
public:
    virtual ~ChoiceProvider() = default;

    /// Pick one of choices; the answer must be a member of choices
    virtual std::optional<std::string> askChoice(const std::string& message,
                                                 const std::vector<std::string>& choices) = 0;

    /// Yes/no question
    virtual std::optional<bool> askConfirm(const std::string& message,
                                           bool default_answer) = 0;

    /// Informational line shown before a question (e.g. a collision notice)
    virtual void notify(const std::string& /* message */) {}
};

// ============================================================================
// Terminal Prompter
// ============================================================================

/**
 * @brief ChoiceProvider reading answers line by line from a stream
 *
 * Choices are listed with 1-based numbers; an answer may be the number or the
 * exact label. Invalid answers are re-asked. End of input cancels.
 */
class TerminalPrompter : public ChoiceProvider {
public:
    TerminalPrompter(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

    std::optional<std::string> askChoice(const std::string& message,
                                         const std::vector<std::string>& choices) override;

    std::optional<bool> askConfirm(const std::string& message, bool default_answer) override;

    void notify(const std::string& message) override;

private:
    std::optional<std::string> readLine();

    std::istream& in_;
    std::ostream& out_;
};

} // namespace unbox
