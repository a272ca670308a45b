#include "verification_result.h"
#include "util/str.h"

#include <algorithm>

namespace httpsig {

const char* to_string(VerificationStatus s)
{
    switch (s) {
        case VerificationStatus::valid:   return "valid";
        case VerificationStatus::invalid: return "invalid";
        case VerificationStatus::unknown: return "unknown";
        case VerificationStatus::error:   return "error";
    }
    return "unknown";
}

const char* to_string(SecurityLevel l)
{
    switch (l) {
        case SecurityLevel::low:    return "low";
        case SecurityLevel::medium: return "medium";
        case SecurityLevel::high:   return "high";
    }
    return "unknown";
}

std::vector<std::pair<std::string, bool>> VerificationChecks::items() const
{
    return {
        {"format_valid",             format_valid},
        {"cryptographic_valid",      cryptographic_valid},
        {"timestamp_valid",          timestamp_valid},
        {"nonce_valid",              nonce_valid},
        {"content_digest_valid",     content_digest_valid},
        {"component_coverage_valid", component_coverage_valid},
        {"custom_rules_valid",       custom_rules_valid},
    };
}

size_t VerificationChecks::passed() const
{
    auto is = items();
    return std::count_if(is.begin(), is.end(), [] (const auto& i) { return i.second; });
}

static bool is_pseudo_component(const std::string& c)
{
    return !c.empty() && c[0] == '@';
}

ComponentSecurityAssessment assess_component_security(const std::vector<std::string>& covered)
{
    ComponentSecurityAssessment a;

    auto covers = [&] (const char* c) {
        return std::find(covered.begin(), covered.end(), c) != covered.end();
    };

    if (covers("@method")) {
        a.strengths.push_back("HTTP method is covered");
        a.score += 20;
    } else {
        a.weaknesses.push_back("HTTP method not covered");
    }

    if (covers("@target-uri")) {
        a.strengths.push_back("Target URI is covered");
        a.score += 20;
    } else {
        a.weaknesses.push_back("Target URI not covered");
    }

    if (covers("content-digest")) {
        a.strengths.push_back("Content integrity protected");
        a.score += 30;
    } else {
        a.weaknesses.push_back("Content integrity not protected");
    }

    std::vector<std::string> headers;
    for (const auto& c : covered) {
        if (!is_pseudo_component(c) && c != "content-digest") headers.push_back(c);
    }

    if (headers.size() >= 2) {
        a.strengths.push_back(util::str("Good header coverage (", headers.size(), " headers)"));
        a.score += 20;
    } else if (headers.size() == 1) {
        a.score += 10;
    } else {
        a.weaknesses.push_back("Limited header coverage");
    }

    static const std::vector<std::string> security_headers
        = {"authorization", "content-type", "date", "host"};

    std::vector<std::string> covered_security;
    for (const auto& h : headers) {
        if (std::find(security_headers.begin(), security_headers.end(), h)
                != security_headers.end()) {
            covered_security.push_back(h);
        }
    }

    if (!covered_security.empty()) {
        a.strengths.push_back(util::str("Security headers covered: ", util::join(covered_security, ", ")));
        a.score += 5 * covered_security.size();
    }

    if (a.score >= 80)      a.level = SecurityLevel::high;
    else if (a.score >= 50) a.level = SecurityLevel::medium;
    else                    a.level = SecurityLevel::low;

    a.score = std::min(a.score, 100u);
    return a;
}

SecurityAnalysis analyze_security(const VerificationChecks& checks)
{
    SecurityAnalysis s;

    auto concern = [&] (bool ok, const char* c, const char* r) {
        if (ok) return;
        s.concerns.push_back(c);
        s.recommendations.push_back(r);
    };

    concern( checks.cryptographic_valid
           , "Cryptographic signature verification failed"
           , "Verify signature generation and key management");
    concern( checks.timestamp_valid
           , "Timestamp validation failed"
           , "Check system clocks and timestamp policies");
    concern( checks.nonce_valid
           , "Nonce validation failed"
           , "Ensure proper nonce generation and format");
    concern( checks.content_digest_valid
           , "Content digest validation failed"
           , "Verify content integrity and digest calculation");
    concern( checks.component_coverage_valid
           , "Component coverage requirements not met"
           , "Review signature component coverage policy");

    auto passed = checks.passed();

    if (passed == VerificationChecks::count) {
        s.security_level = SecurityLevel::high;
    } else if (passed * 10 >= VerificationChecks::count * 7) {
        s.security_level = SecurityLevel::medium;
    } else {
        s.security_level = SecurityLevel::low;
    }

    return s;
}

VerificationResult VerificationResult::create_error( const sys::error_code& ec
                                                   , std::string message
                                                   , ErrorDetails details
                                                   , PerformanceMetrics performance)
{
    VerificationResult r;
    r.status = VerificationStatus::error;
    r.signature_valid = false;
    r.performance = std::move(performance);
    r.diagnostics.security_analysis.security_level = SecurityLevel::low;
    r.diagnostics.security_analysis.concerns.push_back(util::str("Verification error: ", message));
    r.error = ResultError{code_name(ec), std::move(message), std::move(details)};
    return r;
}

VerificationResult VerificationResult::create_error(const Error& e, PerformanceMetrics performance)
{
    return create_error(e.code(), e.message(), e.details(), std::move(performance));
}

} // httpsig namespace
