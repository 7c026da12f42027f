#pragma once

#include "plan.h"

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace planwarden {

enum class StepStatus {
    OK,
    GENERATION_ERROR,
};

struct StepResult {
    StepStatus status{StepStatus::OK};
    std::string content; // artifact bytes (UTF-8 text)
    std::string error;
};

// A step generator: given the verified plan and one of its step definitions,
// produce the content of that step's artifact. Must not touch the filesystem.
using GeneratorFn = std::function<StepResult(const Plan& plan, const StepDef& step)>;

class GeneratorRegistry {
public:
    // Replaces any generator registered under the same name.
    void registerGenerator(const std::string& name, GeneratorFn fn);
    bool has(const std::string& name) const { return fns_.count(name) > 0; }
    std::vector<std::string> names() const; // sorted

    // Runs the generator named by step.generator. Unknown generators and
    // exceptions escaping a generator come back as GENERATION_ERROR.
    StepResult run(const Plan& plan, const StepDef& step) const;

private:
    std::unordered_map<std::string, GeneratorFn> fns_;
};

} // namespace planwarden
