#include "policy_registry.h"
#include "logger.h"

#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>

#include <sstream>

namespace httpsig {

using nlohmann::json;

static VerificationPolicy parse_policy( const std::string& name
                                      , const json& j
                                      , const RuleFactory& factory)
{
    if (!j.is_object()) {
        throw ConfigError( config_error::malformed_source
                         , util::str("Policy ", name, " must be an object")
                         , {{"policy", name}});
    }

    VerificationPolicy p;
    p.name = name;

    try {
        p.description             = j.value("description", std::string());
        p.verify_timestamp        = j.value("verify_timestamp", true);
        p.verify_nonce            = j.value("verify_nonce", true);
        p.verify_content_digest   = j.value("verify_content_digest", true);
        p.reject_extra_components = j.value("reject_extra_components", false);

        if (j.contains("max_timestamp_age") && !j["max_timestamp_age"].is_null()) {
            p.max_timestamp_age = j["max_timestamp_age"].get<int64_t>();
        }

        if (j.contains("required_components")) {
            p.required_components = j["required_components"].get<std::vector<std::string>>();
        }

        if (j.contains("allowed_algorithms")) {
            p.allowed_algorithms = j["allowed_algorithms"].get<std::vector<std::string>>();
        }
    }
    catch (const json::exception& e) {
        throw ConfigError( config_error::malformed_source
                         , util::str("Invalid field in policy ", name, ": ", e.what())
                         , {{"policy", name}});
    }

    if (j.contains("custom_rules")) {
        const auto& rs = j["custom_rules"];
        if (!rs.is_array()) {
            throw ConfigError( config_error::malformed_source
                             , util::str("custom_rules of policy ", name, " must be an array")
                             , {{"policy", name}});
        }
        for (const auto& r : rs) p.custom_rules.push_back(factory.make(r));
    }

    try {
        validate_policy(p);
    }
    catch (const VerificationError& e) {
        throw ConfigError(config_error::invalid_policy, e.message(), e.details());
    }

    return p;
}

PolicyRegistry PolicyRegistry::load_json(boost::string_view text, const RuleFactory& factory)
{
    json root;

    try {
        root = json::parse(text.begin(), text.end());
    }
    catch (const json::parse_error& e) {
        throw ConfigError( config_error::malformed_source
                         , util::str("Policy source is not valid JSON: ", e.what()));
    }

    if (!root.is_object()) {
        throw ConfigError( config_error::malformed_source
                         , "Policy source must map policy names to policies");
    }

    PolicyRegistry registry;

    for (auto it = root.begin(); it != root.end(); ++it) {
        auto policy = parse_policy(it.key(), it.value(), factory);
        registry._policies.emplace(it.key(), std::move(policy));
    }

    LOG_DEBUG("Loaded ", registry.size(), " verification policies");
    return registry;
}

PolicyRegistry PolicyRegistry::load_file(const fs::path& path, const RuleFactory& factory)
{
    if (!fs::exists(path)) {
        throw ConfigError( config_error::missing_source
                         , util::str("Policy file not found: ", path.string())
                         , {{"path", path.string()}});
    }

    fs::ifstream in(path);

    if (!in) {
        throw ConfigError( config_error::missing_source
                         , util::str("Failed to open policy file: ", path.string())
                         , {{"path", path.string()}});
    }

    std::stringstream ss;
    ss << in.rdbuf();

    try {
        return load_json(ss.str(), factory);
    }
    catch (const ConfigError& e) {
        auto details = e.details();
        details["path"] = path.string();
        throw ConfigError(static_cast<config_error>(e.code().value()), e.message(), details);
    }
}

void PolicyRegistry::add(VerificationPolicy policy)
{
    validate_policy(policy);
    auto name = policy.name;
    _policies[name] = std::move(policy);
}

bool PolicyRegistry::remove(const std::string& name)
{
    return _policies.erase(name) != 0;
}

const VerificationPolicy* PolicyRegistry::find(const std::string& name) const
{
    auto i = _policies.find(name);
    if (i == _policies.end()) return nullptr;
    return &i->second;
}

const VerificationPolicy& PolicyRegistry::get(const std::string& name) const
{
    if (auto p = find(name)) return *p;

    LOG_WARN("Unknown verification policy: ", name);
    throw VerificationError( verification_error::unknown_policy
                           , util::str("Unknown verification policy: ", name)
                           , {{"policy", name}});
}

bool PolicyRegistry::contains(const std::string& name) const
{
    return _policies.count(name) != 0;
}

std::vector<std::string> PolicyRegistry::names() const
{
    std::vector<std::string> ret;
    for (const auto& p : _policies) ret.push_back(p.first);
    return ret;
}

} // httpsig namespace
