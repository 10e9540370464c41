#include "unbox/choice_provider.hpp"

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>

namespace unbox {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace

std::optional<std::string> TerminalPrompter::readLine() {
    std::string line;
    if (!std::getline(in_, line)) {
        return std::nullopt;
    }
    return trim(line);
}

std::optional<std::string> TerminalPrompter::askChoice(const std::string& message,
                                                       const std::vector<std::string>& choices) {
    if (choices.empty()) {
        return std::nullopt;
    }

    out_ << "? " << message << "\n";
    for (size_t i = 0; i < choices.size(); ++i) {
        out_ << "  " << (i + 1) << ") " << choices[i] << "\n";
    }

    while (true) {
        out_ << "Answer [1-" << choices.size() << "]: " << std::flush;

        auto answer = readLine();
        if (!answer) {
            out_ << "\n";
            return std::nullopt;
        }

        // An exact label wins over a list index
        auto it = std::find(choices.begin(), choices.end(), *answer);
        if (it != choices.end()) {
            return *it;
        }

        if (all_digits(*answer) && answer->size() < 10) {
            size_t index = std::stoul(*answer);
            if (index >= 1 && index <= choices.size()) {
                return choices[index - 1];
            }
        }

        out_ << "Please enter a number between 1 and " << choices.size()
             << " or one of the listed names.\n";
    }
}

std::optional<bool> TerminalPrompter::askConfirm(const std::string& message, bool default_answer) {
    while (true) {
        out_ << "? " << message << (default_answer ? " (Y/n) " : " (y/N) ") << std::flush;

        auto answer = readLine();
        if (!answer) {
            out_ << "\n";
            return std::nullopt;
        }

        std::string lowered = to_lower(*answer);
        if (lowered.empty()) return default_answer;
        if (lowered == "y" || lowered == "yes") return true;
        if (lowered == "n" || lowered == "no") return false;

        out_ << "Please answer y or n.\n";
    }
}

void TerminalPrompter::notify(const std::string& message) {
    out_ << message << "\n";
}

} // namespace unbox
