#pragma once

#include <string>
#include <vector>

namespace jsgate {

enum class Expectation {
    kBlocked,
    kTimesOut,
    kRuns
};

const char* ExpectationName(Expectation expectation);

struct SecurityExample {
    std::string name;
    std::string description;
    std::string code;
    Expectation expectation;
};

// Known-malicious snippets followed by known-safe ones.
const std::vector<SecurityExample>& SecurityExamples();

} // namespace jsgate
