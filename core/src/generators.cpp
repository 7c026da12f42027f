#include "planwarden/generators.h"

#include <algorithm>
#include <exception>

namespace planwarden {

void GeneratorRegistry::registerGenerator(const std::string& name, GeneratorFn fn) {
    fns_[name] = std::move(fn);
}

std::vector<std::string> GeneratorRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(fns_.size());
    for (const auto& kv : fns_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

StepResult GeneratorRegistry::run(const Plan& plan, const StepDef& step) const {
    auto it = fns_.find(step.generator);
    if (it == fns_.end()) {
        return {StepStatus::GENERATION_ERROR, "", "unknown generator: " + step.generator};
    }
    try {
        return it->second(plan, step);
    } catch (const std::exception& e) {
        return {StepStatus::GENERATION_ERROR, "", step.generator + " threw: " + e.what()};
    }
}

} // namespace planwarden
