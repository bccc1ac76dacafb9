#include "security/LlmWrapper.hpp"

#include <cctype>
#include <string_view>
#include <utility>

namespace security {

static const char kOpen[] = "<<<";
static const char kClose[] = ">>>";
static constexpr size_t kDelimLen = 3;

// One left-to-right pass: each "<<<" is cut together with the first ">>>"
// after it on the same line. Returns true when anything was removed.
static bool remove_delimiters_once(std::string& text) {
    const std::string_view in(text);
    std::string out;
    out.reserve(text.size());

    bool removed = false;
    size_t pos = 0;
    while (pos < in.size()) {
        const size_t open = in.find(kOpen, pos);
        if (open == std::string_view::npos) break;

        const size_t body = open + kDelimLen;
        size_t eol = in.find_first_of("\r\n", body);
        if (eol == std::string_view::npos) eol = in.size();

        const size_t close = in.substr(body, eol - body).find(kClose);
        if (close == std::string_view::npos) {
            // no later "<<<" on this line can close either
            out.append(in.substr(pos, eol - pos));
            pos = eol;
            continue;
        }

        out.append(in.substr(pos, open - pos));
        pos = body + close + kDelimLen;
        removed = true;
    }
    if (pos < in.size()) out.append(in.substr(pos));

    if (removed) text = std::move(out);
    return removed;
}

// Case-insensitive (ASCII) comparison of `word` against text at `at`.
static bool matches_at(const std::string& text, size_t at, std::string_view word) {
    if (text.size() - at < word.size()) return false;
    for (size_t i = 0; i < word.size(); ++i) {
        if (std::toupper((unsigned char)text[at + i]) != word[i]) return false;
    }
    return true;
}

static std::string block_role_markers(const std::string& text) {
    static const std::string_view markers[] = {"[SYSTEM]", "[INST]"};

    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        bool hit = false;
        if (text[i] == '[') {
            for (const auto& m : markers) {
                if (!matches_at(text, i, m)) continue;
                out += "[BLOCKED]";
                i += m.size();
                hit = true;
                break;
            }
        }
        if (!hit) out += text[i++];
    }
    return out;
}

std::string wrap_for_downstream_model(const std::string& text) {
    // repeat until no delimiter survives
    std::string body = text;
    while (remove_delimiters_once(body)) {
    }

    body = block_role_markers(body);

    std::string out;
    out.reserve(body.size() + 40);
    out += kResumeStart;
    out += "\n";
    out += body;
    out += "\n";
    out += kResumeEnd;
    return out;
}

}  // namespace security
