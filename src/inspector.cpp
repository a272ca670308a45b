#include "inspector.h"
#include "parse/number.h"
#include "split_string.h"
#include "util/str.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <boost/regex.hpp>

namespace httpsig {

const char* to_string(IssueSeverity s)
{
    switch (s) {
        case IssueSeverity::error:   return "error";
        case IssueSeverity::warning: return "warning";
        case IssueSeverity::info:    return "info";
    }
    return "unknown";
}

namespace inspector {

static const std::vector<std::string> allowed_pseudo_components = {
    "@method", "@target-uri", "@authority", "@scheme", "@request-target"
};

static bool is_pseudo_component(boost::string_view c)
{
    return !c.empty() && c[0] == '@';
}

static boost::optional<std::string> field(const http::fields& headers, boost::string_view name)
{
    auto i = headers.find(name);
    if (i == headers.end()) return boost::none;
    return std::string(i->value());
}

// Empty message if the component is fine.
static std::string check_component(const std::string& c)
{
    if (is_pseudo_component(c)) {
        auto& a = allowed_pseudo_components;
        if (std::find(a.begin(), a.end(), c) == a.end()) {
            return util::str("Unknown pseudo-component: ", c);
        }
        return {};
    }
    if (!is_valid_header_name(c)) {
        return util::str("Invalid header name: ", c);
    }
    return {};
}

static void inspect_signature_input( const std::string& input
                                   , SignatureFormatAnalysis& a)
{
    auto issue = [&] (IssueSeverity s, const char* code, std::string msg, const char* component) {
        a.issues.push_back(FormatIssue{s, code, std::move(msg), component});
    };

    if (input.find('=') == std::string::npos
            || input.find('(') == std::string::npos
            || input.find(')') == std::string::npos) {
        issue( IssueSeverity::error, "INVALID_FORMAT"
             , "Signature-Input header format is invalid", "signature-input");
        return;
    }

    static const boost::regex input_rx("([^=]+)=\\(([^)]*)\\)(;.*)?");
    boost::smatch m;

    if (!boost::regex_match(input, m, input_rx)) {
        issue( IssueSeverity::error, "INVALID_SIGNATURE_INPUT_FORMAT"
             , "Failed to parse signature-input", "signature-input");
        return;
    }

    a.signature_ids.push_back(m[1].str());

    for (auto p : {"created", "keyid", "alg"}) {
        if (input.find(util::str(p, '=')) == std::string::npos) {
            issue( IssueSeverity::error, "MISSING_PARAMETER"
                 , util::str("Missing required parameter: ", p), "signature-input");
        }
    }

    auto list = m[2].str();
    std::vector<std::string> components;

    if (!list.empty() && list.find('"') == std::string::npos) {
        issue( IssueSeverity::warning, "UNQUOTED_COMPONENTS"
             , "Components should be quoted according to RFC 9421", "signature-input");
    }

    for (auto c : SplitString(list, ' ')) {
        if (c.empty()) continue;
        unquote(c);
        components.emplace_back(c);
    }

    std::map<std::string, std::string> params;
    auto params_str = m[3].str();

    for (auto p : SplitString(params_str, ';')) {
        if (p.empty()) continue;
        auto kv = split_string_pair(p, '=');
        auto v = kv.second;
        unquote(v);
        params[std::string(kv.first)] = std::string(v);
    }

    if (params.count("created")) {
        auto created = parse::whole_number<int64_t>(params["created"]);
        if (!created || !is_valid_timestamp(*created)) {
            issue( IssueSeverity::error, "INVALID_TIMESTAMP"
                 , "Invalid created timestamp", "created");
        }
    }

    if (!is_valid_nonce(params["nonce"])) {
        issue( IssueSeverity::warning, "INVALID_NONCE_FORMAT"
             , "Nonce does not follow UUID v4 format", "nonce");
    }

    if (params.count("alg") && params["alg"] != signature_algorithm) {
        issue( IssueSeverity::warning, "UNSUPPORTED_ALGORITHM"
             , util::str("Algorithm ", params["alg"], " is not ed25519"), "alg");
    }

    if (components.empty()) {
        issue( IssueSeverity::error, "NO_COMPONENTS"
             , "No signature components specified", "components");
        return;
    }

    for (const auto& c : components) {
        auto msg = check_component(c);
        if (msg.empty()) continue;
        issue( is_pseudo_component(c) ? IssueSeverity::warning : IssueSeverity::error
             , is_pseudo_component(c) ? "UNKNOWN_PSEUDO_COMPONENT" : "INVALID_HEADER_NAME"
             , msg, "components");
    }
}

static void inspect_signature(const std::string& sig, SignatureFormatAnalysis& a)
{
    static const boost::regex sig_rx("^[^=]+=:[0-9a-fA-F]+:$");
    static const boost::regex hex_rx(":([0-9a-fA-F]+):");

    if (!boost::regex_match(sig, sig_rx)) {
        a.issues.push_back(FormatIssue{ IssueSeverity::error, "INVALID_SIGNATURE_FORMAT"
                                      , "Signature header format is invalid (should be name=:hex:)"
                                      , "signature"});
    }

    boost::smatch m;
    if (boost::regex_search(sig, m, hex_rx)) {
        auto len = m[1].length();
        if (len != 128) {
            a.issues.push_back(FormatIssue{ IssueSeverity::warning, "UNEXPECTED_SIGNATURE_LENGTH"
                                          , util::str("Signature length is ", len
                                                     , " hex chars, expected 128 for Ed25519")
                                          , "signature"});
        }
    }
}

static void inspect_content_digest(const std::string& digest, SignatureFormatAnalysis& a)
{
    static const boost::regex digest_rx("^[^=]+=:[A-Za-z0-9+/]+=*:$");

    if (!boost::regex_match(digest, digest_rx)) {
        a.issues.push_back(FormatIssue{ IssueSeverity::error, "INVALID_CONTENT_DIGEST_FORMAT"
                                      , "Content-Digest header format is invalid"
                                      , "content-digest"});
    }

    auto pos = digest.find("=:");
    auto alg = pos == std::string::npos ? std::string("unknown") : digest.substr(0, pos);

    if (!parse_digest_algorithm(alg)) {
        a.issues.push_back(FormatIssue{ IssueSeverity::warning, "UNSUPPORTED_DIGEST_ALGORITHM"
                                      , util::str("Digest algorithm may not be supported: ", alg)
                                      , "content-digest"});
    }
}

SignatureFormatAnalysis inspect_format(const http::fields& headers)
{
    SignatureFormatAnalysis a;

    auto input  = field(headers, "signature-input");
    auto sig    = field(headers, "signature");
    auto digest = field(headers, "content-digest");

    if (input)  a.signature_headers.push_back("signature-input");
    if (sig)    a.signature_headers.push_back("signature");
    if (digest) a.signature_headers.push_back("content-digest");

    if (!input) {
        a.issues.push_back(FormatIssue{ IssueSeverity::error, "MISSING_SIGNATURE_INPUT"
                                      , "Signature-Input header is required", "signature-input"});
    }

    if (!sig) {
        a.issues.push_back(FormatIssue{ IssueSeverity::error, "MISSING_SIGNATURE"
                                      , "Signature header is required", "signature"});
    }

    if (input)  inspect_signature_input(*input, a);
    if (sig)    inspect_signature(*sig, a);
    if (digest) inspect_content_digest(*digest, a);

    a.is_valid_rfc9421 = std::none_of(a.issues.begin(), a.issues.end(),
            [] (const FormatIssue& i) { return i.severity == IssueSeverity::error; });

    return a;
}

ComponentAnalysis analyze_components(const ExtractedSignatureData& data)
{
    ComponentAnalysis a;

    for (const auto& c : data.covered) {
        auto msg = check_component(c);
        if (msg.empty()) {
            a.valid_components.push_back(c);
        } else {
            a.invalid_components.push_back(ComponentIssue{c, "format", msg});
        }
    }

    for (auto r : {"@method", "@target-uri"}) {
        if (!data.covers(r)) a.missing_components.push_back(r);
    }

    a.security_assessment = assess_component_security(data.covered);
    return a;
}

ParameterValidation validate_parameters(const SignatureParams& p)
{
    ParameterValidation v;

    for (auto name : {"created", "keyid", "alg", "nonce"}) {
        v.parameters[name] = ParameterCheck{};
    }

    auto invalid = [&] (const char* name, std::string msg) {
        v.parameters[name] = ParameterCheck{false, std::move(msg)};
        v.all_valid = false;
    };

    if (!is_valid_timestamp(p.created)) {
        invalid("created", "Invalid timestamp format or value");
    } else {
        auto age = current_timestamp() - p.created;
        if (age > 3600) {
            v.insights.push_back(util::str("Timestamp is ", age / 60, " minutes old"));
        }
        if (age < 0) {
            v.insights.push_back("Timestamp is from the future (possible clock skew)");
        }
    }

    auto keyid = boost::string_view(p.keyid);
    trim_whitespace(keyid);
    if (keyid.empty()) {
        invalid("keyid", "Key ID must be a non-empty string");
    }

    if (p.alg != signature_algorithm) {
        invalid("alg", util::str("Unsupported algorithm: ", p.alg));
    }

    if (!is_valid_nonce(p.nonce)) {
        invalid("nonce", "Invalid nonce format (should be UUID v4)");
    }

    return v;
}

SecurityReport analyze_security(const ExtractedSignatureData& data)
{
    SecurityReport r;
    r.components = analyze_components(data);
    r.parameters = validate_parameters(data.params);
    r.score = r.components.security_assessment.score;
    r.level = r.components.security_assessment.level;

    // Invalid parameters cap the level.
    if (!r.parameters.all_valid && r.level == SecurityLevel::high) {
        r.level = SecurityLevel::medium;
    }

    return r;
}

static std::string check_label(const std::string& name)
{
    // "format_valid" -> "Format Valid"
    std::string out;
    bool start = true;
    for (char c : name) {
        if (c == '_') { out += ' '; start = true; continue; }
        out += start ? char(std::toupper(static_cast<unsigned char>(c))) : c;
        start = false;
    }
    return out;
}

static std::string format_utc(int64_t t)
{
    std::time_t tt = static_cast<std::time_t>(t);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S UTC");
    return ss.str();
}

static std::string upper(const char* s)
{
    std::string out(s);
    for (auto& c : out) c = std::toupper(static_cast<unsigned char>(c));
    return out;
}

std::string generate_diagnostic_report(const VerificationResult& r)
{
    std::ostringstream o;
    o << std::fixed << std::setprecision(2);

    o << "=== RFC 9421 Signature Verification Report ===\n\n";
    o << "Overall Status: " << upper(to_string(r.status)) << "\n";
    o << "Signature Valid: " << (r.signature_valid ? "YES" : "NO") << "\n\n";

    o << "=== Individual Checks ===\n";
    for (const auto& c : r.checks.items()) {
        o << (c.second ? "✓ " : "✗ ") << check_label(c.first) << "\n";
    }
    o << "\n";

    const auto& sig = r.diagnostics.signature_analysis;
    o << "=== Signature Analysis ===\n";
    o << "Algorithm: " << (sig.algorithm.empty() ? "N/A" : sig.algorithm) << "\n";
    o << "Key ID: " << (sig.key_id.empty() ? "N/A" : sig.key_id) << "\n";
    if (sig.created) {
        o << "Created: " << format_utc(sig.created) << "\n";
        o << "Age: " << sig.age << " seconds\n";
    }
    o << "Nonce: " << (sig.nonce.empty() ? "N/A" : sig.nonce) << "\n";
    o << "Covered Components: "
      << (sig.covered_components.empty() ? "None" : util::join(sig.covered_components, ", "))
      << "\n\n";

    const auto& content = r.diagnostics.content_analysis;
    o << "=== Content Analysis ===\n";
    o << "Has Content Digest: " << (content.has_content_digest ? "YES" : "NO") << "\n";
    if (content.digest_algorithm) o << "Digest Algorithm: " << *content.digest_algorithm << "\n";
    o << "Content Size: " << content.content_size << " bytes\n";
    if (content.content_type) o << "Content Type: " << *content.content_type << "\n";
    o << "\n";

    const auto& policy = r.diagnostics.policy_compliance;
    o << "=== Policy Compliance ===\n";
    o << "Policy: " << (policy.policy_name.empty() ? "N/A" : policy.policy_name) << "\n";
    if (!policy.missing_required_components.empty()) {
        o << "Missing Required Components: "
          << util::join(policy.missing_required_components, ", ") << "\n";
    }
    if (!policy.extra_components.empty()) {
        o << "Extra Components: " << util::join(policy.extra_components, ", ") << "\n";
    }

    if (!policy.rule_results.empty()) {
        o << "\n=== Custom Rule Results ===\n";
        for (const auto& rr : policy.rule_results) {
            o << (rr.passed ? "✓ " : "✗ ") << rr.rule_name << ": " << rr.message << "\n";
        }
    }

    const auto& security = r.diagnostics.security_analysis;
    o << "\n=== Security Analysis ===\n";
    o << "Security Level: " << upper(to_string(security.security_level)) << "\n";

    if (!security.concerns.empty()) {
        o << "\nSecurity Concerns:\n";
        for (const auto& c : security.concerns) o << "  - " << c << "\n";
    }

    if (!security.recommendations.empty()) {
        o << "\nRecommendations:\n";
        for (const auto& c : security.recommendations) o << "  - " << c << "\n";
    }

    o << "\n=== Performance ===\n";
    o << "Total Time: " << r.performance.total_time_ms << "ms\n";
    if (!r.performance.step_timings.empty()) {
        o << "Step Timings:\n";
        for (const auto& s : r.performance.step_timings) {
            o << "  - " << s.first << ": " << s.second << "ms\n";
        }
    }

    if (r.error) {
        o << "\n=== Error Details ===\n";
        o << "Code: " << r.error->code << "\n";
        o << "Message: " << r.error->message << "\n";
        if (!r.error->details.empty()) {
            o << "Details:\n";
            for (const auto& d : r.error->details) {
                o << "  - " << d.first << ": " << d.second << "\n";
            }
        }
    }

    auto report = o.str();
    if (!report.empty() && report.back() == '\n') report.pop_back();
    return report;
}

std::string quick_diagnostic(const http::fields& headers)
{
    auto a = inspect_format(headers);

    std::ostringstream o;
    o << "=== Quick Signature Diagnostic ===\n";
    o << "RFC 9421 Compliant: " << (a.is_valid_rfc9421 ? "YES" : "NO") << "\n";
    o << "Signature Headers Found: " << util::join(a.signature_headers, ", ") << "\n";
    o << "Signature IDs: " << util::join(a.signature_ids, ", ");

    if (!a.issues.empty()) {
        o << "\n\nIssues Found:";
        for (const auto& i : a.issues) {
            o << "\n  [" << upper(to_string(i.severity)) << "] " << i.message;
        }
    }

    return o.str();
}

bool validate_signature_format(const http::fields& headers)
{
    return inspect_format(headers).is_valid_rfc9421;
}

} // inspector namespace

} // httpsig namespace
