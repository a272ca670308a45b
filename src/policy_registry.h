#pragma once

#include <map>
#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>
#include <boost/utility/string_view.hpp>

#include "namespaces.h"
#include "verification_policy.h"
#include "verification_rules.h"

namespace httpsig {

// Named verification policies.
//
// Loaded once, typically from `config/policies.json`, and handed to
// each `Verifier`, which keeps its own copy.
class PolicyRegistry {
public:
    PolicyRegistry() = default;

    // Throw `ConfigError` if the source is missing, is not valid JSON,
    // has fields of the wrong type, names an unknown rule or defines an
    // invalid policy.
    static PolicyRegistry load_file(const fs::path&, const RuleFactory&);
    static PolicyRegistry load_json(boost::string_view, const RuleFactory&);

    // Validates `policy` and replaces any policy with the same name.
    // Throws `VerificationError` (INVALID_POLICY).
    void add(VerificationPolicy policy);
    bool remove(const std::string& name);

    // Throws `VerificationError` (UNKNOWN_POLICY).
    const VerificationPolicy& get(const std::string& name) const;
    const VerificationPolicy* find(const std::string& name) const;

    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;
    size_t size() const { return _policies.size(); }

private:
    std::map<std::string, VerificationPolicy> _policies;
};

} // httpsig namespace
