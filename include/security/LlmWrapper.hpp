#pragma once
#include <string>

namespace security {

constexpr char kResumeStart[] = "<<<RESUME_START>>>";
constexpr char kResumeEnd[] = "<<<RESUME_END>>>";

// Removes <<<...>>> delimiters (non-greedy, single line) until none remain,
// replaces [SYSTEM] / [INST] (any case) with [BLOCKED], then wraps the
// result between the RESUME_START / RESUME_END sentinel lines.
std::string wrap_for_downstream_model(const std::string& text);

}  // namespace security
