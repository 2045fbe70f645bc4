#include "src/worker/guard.h"

#include <memory>
#include <vector>

#include <re2/re2.h>

namespace jsgate {

namespace {

const std::vector<std::unique_ptr<RE2>>& BlockedPatterns() {
    static const std::vector<std::unique_ptr<RE2>> patterns = [] {
        const char* const sources[] = {
            R"(\beval\s*\()",
            R"(\bFunction\s*\()",
            R"(\bwindow\b)",
            R"(\bdocument\b)",
            R"(\bfetch\s*\()",
            R"(\bXMLHttpRequest\b)",
            R"(\brequire\s*\()",
            R"(\bimport\s+)",
            R"(\bpostMessage\s*\()",
            R"(\bclose\s*\()",
            R"(\bimportScripts\s*\()",
        };
        RE2::Options options;
        options.set_case_sensitive(false);
        std::vector<std::unique_ptr<RE2>> out;
        for (const char* source : sources) {
            out.push_back(std::make_unique<RE2>(source, options));
        }
        return out;
    }();
    return patterns;
}

} // namespace

bool PassesWorkerGuard(const std::string& code) {
    for (const auto& pattern : BlockedPatterns()) {
        if (RE2::PartialMatch(code, *pattern)) {
            return false;
        }
    }
    return true;
}

} // namespace jsgate
