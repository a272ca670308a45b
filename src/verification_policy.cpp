#include "verification_policy.h"
#include "logger.h"

#include <algorithm>

namespace httpsig {

template<class C, class V>
static bool contains(const C& c, const V& v)
{
    return std::find(c.begin(), c.end(), v) != c.end();
}

bool VerificationPolicy::requires_component(boost::string_view c) const
{
    return contains(required_components, c);
}

bool VerificationPolicy::allows_algorithm(boost::string_view a) const
{
    return contains(allowed_algorithms, a);
}

void validate_policy(const VerificationPolicy& p)
{
    auto fail = [&] (std::string msg) {
        return VerificationError( verification_error::invalid_policy
                                , std::move(msg)
                                , {{"policy", p.name}});
    };

    if (p.name.empty()) throw fail("Policy name must be a non-empty string");

    if (p.allowed_algorithms.empty()) {
        throw fail("Policy must allow at least one algorithm");
    }

    if (p.max_timestamp_age && *p.max_timestamp_age <= 0) {
        throw fail("Maximum timestamp age must be positive");
    }

    for (const auto& c : p.required_components) {
        if (c.empty()) throw fail("Empty required component");
    }

    for (const auto& r : p.custom_rules) {
        if (r.name.empty()) throw fail("Custom rule without a name");
        if (!r.validate && !r.async_validate) {
            throw fail(util::str("Custom rule ", r.name, " has no predicate"));
        }
    }
}

template<class T>
static void append_missing(std::vector<T>& to, const std::vector<T>& from)
{
    for (const auto& v : from) {
        if (!contains(to, v)) to.push_back(v);
    }
}

VerificationPolicy merge_policies( const VerificationPolicy& base
                                 , const VerificationPolicy& override)
{
    VerificationPolicy p = override;

    if (p.name.empty()) p.name = base.name;
    if (p.description.empty()) p.description = base.description;
    if (!p.max_timestamp_age) p.max_timestamp_age = base.max_timestamp_age;

    p.required_components = base.required_components;
    append_missing(p.required_components, override.required_components);

    p.allowed_algorithms = base.allowed_algorithms;
    append_missing(p.allowed_algorithms, override.allowed_algorithms);

    p.custom_rules = base.custom_rules;
    for (const auto& r : override.custom_rules) {
        bool dup = std::any_of(p.custom_rules.begin(), p.custom_rules.end(),
                [&] (const VerificationRule& e) { return e.name == r.name; });
        if (!dup) p.custom_rules.push_back(r);
    }

    return p;
}

RuleResult run_rule( const VerificationRule& rule
                   , const VerificationContext& ctx
                   , asio::yield_context yield)
{
    try {
        if (rule.async_validate) return rule.async_validate(ctx, yield);
        return rule.validate(ctx);
    }
    catch (const std::exception& e) {
        LOG_WARN("Verification rule ", rule.name, " failed with exception: ", e.what());
        return RuleResult{false, util::str("Rule execution failed: ", e.what()), {}};
    }
}

} // httpsig namespace
