#include "isoboot/prompt.hpp"

#include "io/console_progress.hpp"
#include "util/logger.hpp"
#include "util/text_utils.hpp"

#include <istream>
#include <ostream>

namespace isoboot {

Prompter::Prompter(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

std::optional<std::string> Prompter::ReadLine(std::string_view prompt) {
    ClearProgressLine();
    out_ << prompt << std::flush;

    std::string line;
    if (!std::getline(in_, line)) {
        out_ << "\n";
        LogDebug("end of input at prompt, treating as exit");
        return std::nullopt;
    }
    return line;
}

YesNo Prompter::AskYesNo(std::string_view question) {
    const std::string prompt = std::string(question) + " (y/n/exit): ";
    while (true) {
        auto line = ReadLine(prompt);
        if (!line) return YesNo::Exit;

        const std::string answer = ToLower(Trim(*line));
        if (answer == "y" || answer == "yes") return YesNo::Yes;
        if (answer == "n" || answer == "no") return YesNo::No;
        if (answer == kExitKeyword) return YesNo::Exit;

        out_ << "Please answer 'y', 'n', or 'exit'.\n";
    }
}

std::optional<std::string> Prompter::AskText(std::string_view question) {
    auto line = ReadLine(std::string(question) + " (or type 'exit'): ");
    if (!line) return std::nullopt;

    std::string answer = Trim(*line);
    if (ToLower(answer) == kExitKeyword) return std::nullopt;
    return answer;
}

ContinueReply Prompter::AskContinue() {
    while (true) {
        auto line = ReadLine("Press Enter to continue, or type 'exit' to quit: ");
        if (!line) return ContinueReply::Exit;

        const std::string answer = ToLower(Trim(*line));
        if (answer.empty()) return ContinueReply::Continue;
        if (answer == kExitKeyword) return ContinueReply::Exit;

        out_ << "Invalid input. Please press Enter or type 'exit'.\n";
    }
}

} // namespace isoboot
