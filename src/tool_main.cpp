#include "tool_config.h"
#include "error.h"
#include "inspector.h"
#include "logger.h"
#include "policy_registry.h"
#include "signature_extractor.h"
#include "signer.h"
#include "verifier.h"
#include "util/crypto.h"

#include <iostream>

using namespace httpsig;
using namespace std;

static int sign(const ToolConfig& cfg)
{
    if (!cfg.private_key()) {
        throw runtime_error("The '--private-key' option is missing");
    }

    auto config = SigningConfigBuilder()
        .profile(cfg.profile())
        .key_id(cfg.key_id())
        .private_key(*cfg.private_key())
        .build();

    SigningOptions options;
    options.nonce = cfg.nonce();
    options.created = cfg.created();

    Signer signer(move(config));
    auto result = signer.sign(cfg.message(), options);

    for (const auto& f : result.headers) {
        cout << f.name_string() << ": " << f.value() << "\n";
    }

    LOG_VERBOSE("Canonical message:\n", result.canonical_message);
    return 0;
}

static int verify(const ToolConfig& cfg)
{
    RuleFactory rules;

    VerifierConfig config;
    config.policies = PolicyRegistry::load_file(cfg.policies_path(), rules);

    Verifier verifier(move(config));

    VerifyOptions options;
    options.policy = cfg.policy();
    options.public_key = cfg.public_key();
    if (!cfg.key_id().empty()) options.key_id = cfg.key_id();

    auto result = verifier.verify(cfg.message(), cfg.signature_headers(), options);

    cout << inspector::generate_diagnostic_report(result) << endl;
    return result.is_valid() ? 0 : 2;
}

static int inspect(const ToolConfig& cfg)
{
    auto headers = cfg.signature_headers();

    cout << inspector::quick_diagnostic(headers) << endl;

    if (!inspector::validate_signature_format(headers)) return 2;

    auto data = extract_signature_data(headers);
    auto report = inspector::analyze_security(data);

    cout << "\nSecurity Level: " << to_string(report.level)
         << " (score " << report.score << ")" << endl;

    for (const auto& s : report.components.security_assessment.strengths) {
        cout << "  + " << s << endl;
    }
    for (const auto& w : report.components.security_assessment.weaknesses) {
        cout << "  - " << w << endl;
    }
    for (const auto& i : report.parameters.insights) {
        cout << "  * " << i << endl;
    }

    return 0;
}

int main(int argc, const char* argv[])
{
    util::crypto_init();

    ToolConfig cfg;

    try {
        cfg = ToolConfig(argc, argv);
    } catch (const std::exception& e) {
        LOG_ABORT(e.what());
        return 1;
    }

    if (cfg.is_help()) {
        cout << "Usage: httpsig-tool (sign|verify|inspect) [OPTION...]" << endl;
        cout << ToolConfig::description() << endl;
        return 0;
    }

    logger.set_threshold(cfg.log_level());
    if (cfg.log_file()) logger.log_to_file(cfg.log_file()->string());

    try {
        switch (cfg.command()) {
            case ToolConfig::Command::sign:    return sign(cfg);
            case ToolConfig::Command::verify:  return verify(cfg);
            case ToolConfig::Command::inspect: return inspect(cfg);
        }
    }
    catch (const Error& e) {
        LOG_ABORT(e.name(), ": ", e.message());
        return 1;
    }
    catch (const std::exception& e) {
        LOG_ABORT(e.what());
        return 1;
    }

    return 1;
}
