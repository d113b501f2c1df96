#include "InvalidationCoordinator.hpp"

#include <utility>
#include <vector>

#include "../errors/CacheErrors.hpp"

void InvalidationCoordinator::registerDependency(const std::string& trigger, const std::set<std::string>& dependents) {
    if (trigger.empty()) {
        throw ConfigurationError("Invalidation rule has an empty trigger cache name");
    }
    if (frozen()) {
        throw ConfigurationError("Invalidation rules are frozen, cannot register rule for '" + trigger + "'");
    }

    RuleTable candidate = rules_;
    auto& targets = candidate[trigger];
    for (const auto& dependent : dependents) {
        if (dependent.empty()) {
            throw ConfigurationError("Invalidation rule for '" + trigger + "' has an empty dependent cache name");
        }
        if (dependent == trigger) {
            throw ConfigurationError("Cache '" + trigger + "' cannot invalidate itself");
        }
        targets.insert(dependent);
    }

    // Any path from a dependent back to the trigger closes a cycle
    for (const auto& dependent : dependents) {
        if (reaches(candidate, dependent, trigger)) {
            throw ConfigurationError("Invalidation rule '" + trigger + "' -> '" + dependent + "' creates a cycle");
        }
    }

    if (candidate[trigger].empty()) {
        candidate.erase(trigger);
    }
    rules_ = std::move(candidate);
}

const std::set<std::string>& InvalidationCoordinator::dependentsOf(const std::string& trigger) const {
    static const std::set<std::string> kNoDependents;
    auto it = rules_.find(trigger);
    return it == rules_.end() ? kNoDependents : it->second;
}

bool InvalidationCoordinator::reaches(const RuleTable& rules, const std::string& from, const std::string& target) {
    std::set<std::string> visited;
    std::vector<std::string> pending{from};
    while (!pending.empty()) {
        std::string current = pending.back();
        pending.pop_back();
        if (current == target) {
            return true;
        }
        if (!visited.insert(current).second) {
            continue;
        }
        auto it = rules.find(current);
        if (it != rules.end()) {
            pending.insert(pending.end(), it->second.begin(), it->second.end());
        }
    }
    return false;
}
