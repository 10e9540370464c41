#pragma once

#include <unbox/choice_provider.hpp>
#include <unbox/platform.hpp>

#include <deque>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace unbox_test {

namespace fs = std::filesystem;

// Helper to create temporary directory
class TempDir {
public:
    TempDir() {
        path_ = fs::temp_directory_path() / ("unbox_test_" + unbox::generate_uuid());
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path() const { return path_.string(); }
    std::string path(const std::string& rel) const { return (path_ / rel).string(); }

private:
    fs::path path_;
};

inline void write_text(const std::string& root, const std::string& rel,
                       const std::string& content) {
    fs::path full = fs::path(root) / rel;
    fs::create_directories(full.parent_path());
    std::ofstream out(full, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_text(const std::string& root, const std::string& rel) {
    std::ifstream in(fs::path(root) / rel, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

inline bool exists(const std::string& root, const std::string& rel) {
    return fs::exists(fs::path(root) / rel);
}

// Answers prompts from queues and records what was asked.
// An exhausted queue answers nullopt (cancel).
class ScriptedChoiceProvider : public unbox::ChoiceProvider {
public:
    struct ChoicePrompt {
        std::string message;
        std::vector<std::string> choices;
    };

    std::deque<std::optional<std::string>> choice_answers;
    std::deque<std::optional<bool>> confirm_answers;

    std::vector<ChoicePrompt> choice_prompts;
    std::vector<std::string> confirm_prompts;
    std::vector<std::string> notices;

    std::optional<std::string> askChoice(const std::string& message,
                                         const std::vector<std::string>& choices) override {
        choice_prompts.push_back({message, choices});
        if (choice_answers.empty()) return std::nullopt;
        auto answer = choice_answers.front();
        choice_answers.pop_front();
        return answer;
    }

    std::optional<bool> askConfirm(const std::string& message, bool /* default_answer */) override {
        confirm_prompts.push_back(message);
        if (confirm_answers.empty()) return std::nullopt;
        auto answer = confirm_answers.front();
        confirm_answers.pop_front();
        return answer;
    }

    void notify(const std::string& message) override {
        notices.push_back(message);
    }
};

} // namespace unbox_test
