#pragma once

#include <string>
#include <vector>

namespace jsgate {

struct ValidationResult {
    bool valid;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

constexpr size_t kMaxCodeLength = 10000;
constexpr int kMaxBraceDepth = 50;

// Static deny-list scan. Matching is textual and case-insensitive, so comments
// and string literals are scanned too. It is best-effort: identifiers built at
// runtime (concatenation, computed member access) are not detected.
ValidationResult ValidateCode(const std::string& code);

// Drops NUL and other control bytes. Never rewrites the code itself;
// rejecting dangerous constructs is ValidateCode's job.
std::string SanitizeCode(const std::string& code);

// Deepest '{' nesting reached while scanning the text.
int MaxBraceDepth(const std::string& code);

} // namespace jsgate
