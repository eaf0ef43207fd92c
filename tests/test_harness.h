#pragma once

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>
#include <vector>

namespace Codexforge::Tests {

struct TestResult {
    std::string name;
    bool passed;
};

extern std::vector<TestResult> results;
extern std::string lastError;

#define EXPECT(cond, failMsg)                                  \
    do {                                                       \
        lastError.clear();                                     \
        if (!(cond)) {                                         \
            lastError = failMsg;                               \
            return false;                                      \
        }                                                      \
    } while (0)

#define RUN_TEST(fn)                                           \
    do {                                                       \
        bool ok = fn();                                        \
        results.push_back({#fn, ok});                          \
        std::cout << (ok ? "[ ok ] " : "[FAIL] ") << #fn;      \
        if (!ok) std::cout << " FAILED: " << lastError;        \
        std::cout << "\n";                                     \
    } while (0)

#define SUBCAT(msg)                                                             \
    do {                                                                        \
        std::string str(msg);                                                   \
        std::transform(str.begin(), str.end(), str.begin(), ::toupper);         \
        std::cout << "-------" << str << "--------------\n";                    \
    } while (0)

} // namespace Codexforge::Tests
