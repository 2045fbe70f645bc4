#include "src/server/validator.h"

#include <algorithm>
#include <string>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using jsgate::MaxBraceDepth;
using jsgate::SanitizeCode;
using jsgate::ValidateCode;
using jsgate::ValidationResult;
using testing::Contains;
using testing::HasSubstr;

// NOLINTNEXTLINE
TEST(validator, plain_code_is_valid) {
    ValidationResult result = ValidateCode("const x = [1, 2, 3];\nconsole.log(x.map(v => v * 2));");
    EXPECT_TRUE(result.valid);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_TRUE(result.warnings.empty());
}

// NOLINTNEXTLINE
TEST(validator, empty_code_is_invalid) {
    ValidationResult result = ValidateCode("");
    EXPECT_FALSE(result.valid);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0], "Code must be a non-empty string");
}

// NOLINTNEXTLINE
TEST(validator, rejects_dynamic_evaluation) {
    ValidationResult result = ValidateCode("eval('1 + 1')");
    EXPECT_FALSE(result.valid);
    EXPECT_THAT(result.errors, Contains(HasSubstr("Dangerous pattern detected (dynamic evaluation)")));
    EXPECT_THAT(result.errors, Contains("Dangerous function call detected: eval()"));
}

// NOLINTNEXTLINE
TEST(validator, long_whitespace_run_after_keyword_returns) {
    const std::string spaces(1000000, ' ');

    ValidationResult unterminated = ValidateCode("let a = 1; // eval" + spaces + "x");
    EXPECT_TRUE(unterminated.valid);
    EXPECT_THAT(unterminated.warnings, Contains("Code is very long and may cause performance issues"));

    ValidationResult called = ValidateCode("eval" + spaces + "('1')");
    EXPECT_FALSE(called.valid);
    EXPECT_THAT(called.errors, Contains("Dangerous function call detected: eval()"));

    ValidationResult loop = ValidateCode("while" + spaces + "(true) {}");
    EXPECT_THAT(loop.warnings, Contains("Potential infinite loop detected"));
}

// NOLINTNEXTLINE
TEST(validator, matching_is_case_insensitive) {
    EXPECT_FALSE(ValidateCode("EVAL('x')").valid);
    EXPECT_FALSE(ValidateCode("Window.alert(1)").valid);
    // Anonymous function expressions match the constructor signature too.
    EXPECT_FALSE(ValidateCode("const f = function () { return 1; };").valid);
}

// NOLINTNEXTLINE
TEST(validator, comments_and_strings_are_not_exempt) {
    EXPECT_FALSE(ValidateCode("// fetch('http://x')\nconsole.log(1);").valid);
    EXPECT_FALSE(ValidateCode("console.log('localStorage');").valid);
}

// NOLINTNEXTLINE
TEST(validator, errors_follow_declaration_order) {
    ValidationResult result = ValidateCode("window.fetch('x'); eval('y');");
    ASSERT_GE(result.errors.size(), 3u);
    EXPECT_THAT(result.errors[0], HasSubstr("dynamic evaluation"));
    EXPECT_THAT(result.errors[1], HasSubstr("ambient global access"));
    EXPECT_THAT(result.errors[2], HasSubstr("network access"));
}

// NOLINTNEXTLINE
TEST(validator, reports_each_category) {
    struct Case {
        const char* code;
        const char* category;
    };
    const Case cases[] = {
        {"require('fs')", "module loading"},
        {"sessionStorage.clear()", "storage access"},
        {"setTimeout('alert(1)', 10)", "string timer"},
        {"a.constructor = 1", "prototype mutation"},
        {"Reflect.ownKeys({})", "reflection"},
        {"process.exit(1)", "host process access"},
        {"new SharedArrayBuffer(8)", "low-level memory"},
        {"el.innerHTML = 'x'", "DOM mutation"},
        {"addEventListener('click', f)", "event hijacking"},
        {"history.back()", "navigation"},
        {"navigator.clipboard.readText()", "device access"},
        {"debugger;", "debugging construct"},
        {"new BroadcastChannel('c')", "messaging"},
        {"atob('eA==')", "obfuscation"},
        {"const s = '\\x41';", "obfuscation"},
    };
    for (const auto& c : cases) {
        ValidationResult result = ValidateCode(c.code);
        EXPECT_FALSE(result.valid) << c.code;
        EXPECT_THAT(result.errors, Contains(HasSubstr(std::string("(") + c.category + ")"))) << c.code;
    }
}

// NOLINTNEXTLINE
TEST(validator, prototype_pollution_reported_once) {
    ValidationResult result = ValidateCode("const o = {};\no.__proto__.admin = true;\no.__proto__.x = 1;");
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(std::count(result.errors.begin(), result.errors.end(), "Prototype pollution attempt detected"), 1);
}

// NOLINTNEXTLINE
TEST(validator, warnings_do_not_invalidate) {
    ValidationResult loop = ValidateCode("while (true) { break; }");
    EXPECT_TRUE(loop.valid);
    EXPECT_THAT(loop.warnings, Contains("Potential infinite loop detected"));

    EXPECT_THAT(ValidateCode("for (;;) { break; }").warnings, Contains("Potential infinite loop detected"));
    EXPECT_THAT(ValidateCode("for (; true;) { break; }").warnings, Contains("Potential infinite loop detected"));

    std::string long_code = "let total = 0;\n";
    while (long_code.size() <= jsgate::kMaxCodeLength) {
        long_code += "total += 1;\n";
    }
    ValidationResult long_result = ValidateCode(long_code);
    EXPECT_TRUE(long_result.valid);
    EXPECT_THAT(long_result.warnings, Contains("Code is very long and may cause performance issues"));

    std::string deep = std::string(60, '{') + std::string(60, '}');
    ValidationResult deep_result = ValidateCode(deep);
    EXPECT_TRUE(deep_result.valid);
    EXPECT_THAT(deep_result.warnings, Contains("Code has very deep nesting which may cause stack overflow"));
}

// NOLINTNEXTLINE
TEST(validator, validates_twice_identically) {
    const std::string code = "fetch('a'); fetch('b'); document.title = 'x';";
    ValidationResult first = ValidateCode(code);
    ValidationResult second = ValidateCode(code);
    EXPECT_FALSE(first.valid);
    EXPECT_EQ(first.errors, second.errors);
    EXPECT_EQ(first.warnings, second.warnings);

    // A clean input after a dirty one is still clean.
    EXPECT_TRUE(ValidateCode("console.log(1)").valid);
}

// NOLINTNEXTLINE
TEST(validator, brace_depth_is_true_nesting) {
    EXPECT_EQ(MaxBraceDepth("{}{}{}"), 1);
    EXPECT_EQ(MaxBraceDepth("{{}{{}}}"), 3);
    EXPECT_EQ(MaxBraceDepth("}}}{"), 1);
    EXPECT_EQ(MaxBraceDepth("no braces"), 0);
}

// NOLINTNEXTLINE
TEST(validator, sanitize_strips_control_bytes_only) {
    std::string code = std::string("let a = 1;\t\r\n") + '\0' + "\x01\x1b\x7f" + "a += 1;";
    EXPECT_EQ(SanitizeCode(code), "let a = 1;\t\r\na += 1;");
    EXPECT_EQ(SanitizeCode("eval('x')"), "eval('x')");
    EXPECT_EQ(SanitizeCode("caf\xc3\xa9"), "caf\xc3\xa9");
}
