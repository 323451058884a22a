#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace isoboot {

enum class YesNo { Yes, No, Exit };
enum class ContinueReply { Continue, Exit };

inline constexpr std::string_view kExitKeyword = "exit";

// Every question the tool asks goes through here. Typing "exit" (any case)
// at any prompt, or closing stdin, yields an Exit answer; the process is
// never terminated from inside a prompt.
class Prompter {
public:
    Prompter(std::istream& in, std::ostream& out);

    // "<question> (y/n/exit): ", re-asked until the answer is y, n or exit.
    YesNo AskYesNo(std::string_view question);

    // "<question> (or type 'exit'): ". Returns the trimmed answer with its
    // case preserved, nullopt on exit.
    std::optional<std::string> AskText(std::string_view question);

    // Empty line continues, "exit" quits, anything else is re-asked.
    ContinueReply AskContinue();

    std::ostream& Out() { return out_; }

private:
    // nullopt on end of input.
    std::optional<std::string> ReadLine(std::string_view prompt);

    std::istream& in_;
    std::ostream& out_;
};

} // namespace isoboot
