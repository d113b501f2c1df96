#ifndef INVALIDATIONCOORDINATOR_HPP
#define INVALIDATIONCOORDINATOR_HPP

#include <atomic>
#include <map>
#include <set>
#include <string>

// Declarative table of cross-cache invalidation: a write to a trigger cache
// clears every dependent cache. Rules are registered during single-threaded
// setup, then freeze() makes the table read-only and lookups take no lock.
class InvalidationCoordinator {
public:
    using RuleTable = std::map<std::string, std::set<std::string>>;

    // Adds dependents to the trigger's set (never replaces it).
    // Throws ConfigurationError on an empty name, a self-dependency, a cycle,
    // or once frozen; a rejected registration leaves the table untouched.
    void registerDependency(const std::string& trigger, const std::set<std::string>& dependents);

    void freeze() { frozen_.store(true, std::memory_order_release); }
    bool frozen() const { return frozen_.load(std::memory_order_acquire); }

    // Direct dependents of trigger, empty when there are none
    const std::set<std::string>& dependentsOf(const std::string& trigger) const;

    const RuleTable& rules() const { return rules_; }
    bool empty() const { return rules_.empty(); }

private:
    static bool reaches(const RuleTable& rules, const std::string& from, const std::string& target);

    RuleTable rules_;
    std::atomic<bool> frozen_{false};
};

#endif // INVALIDATIONCOORDINATOR_HPP
