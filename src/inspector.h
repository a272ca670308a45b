#pragma once

#include <map>
#include <string>
#include <vector>

#include "namespaces.h"
#include "signature_extractor.h"
#include "verification_result.h"

namespace httpsig {

enum class IssueSeverity { error, warning, info };

const char* to_string(IssueSeverity);

struct FormatIssue {
    IssueSeverity severity;
    std::string code;     // e.g. "UNQUOTED_COMPONENTS"
    std::string message;
    std::string component;
};

struct SignatureFormatAnalysis {
    // No issue of severity `error`.
    bool is_valid_rfc9421 = false;
    std::vector<FormatIssue> issues;
    // Which of `signature-input`, `signature` and `content-digest` are present.
    std::vector<std::string> signature_headers;
    std::vector<std::string> signature_ids;
};

struct ComponentIssue {
    std::string component;
    std::string type;
    std::string message;
};

struct ComponentAnalysis {
    std::vector<std::string> valid_components;
    std::vector<ComponentIssue> invalid_components;
    // Recommended components (`@method`, `@target-uri`) not covered.
    std::vector<std::string> missing_components;
    ComponentSecurityAssessment security_assessment;
};

struct ParameterCheck {
    bool valid = true;
    std::string message;
};

struct ParameterValidation {
    bool all_valid = true;
    // Keyed by "created", "keyid", "alg" and "nonce".
    std::map<std::string, ParameterCheck> parameters;
    std::vector<std::string> insights;
};

struct SecurityReport {
    ComponentAnalysis components;
    ParameterValidation parameters;
    SecurityLevel level = SecurityLevel::low;
    unsigned score = 0;
};

// Read-only analysis of signature headers, for debugging.
namespace inspector {

// Lint raw headers: missing headers, unquoted components, wrong
// signature length, unknown pseudo-components, malformed digest.
SignatureFormatAnalysis inspect_format(const http::fields& headers);

ComponentAnalysis analyze_components(const ExtractedSignatureData&);

ParameterValidation validate_parameters(const SignatureParams&);

// Components and parameters together.
SecurityReport analyze_security(const ExtractedSignatureData&);

// Multi-section human-readable report.
std::string generate_diagnostic_report(const VerificationResult&);

// Short report from `inspect_format`.
std::string quick_diagnostic(const http::fields& headers);

bool validate_signature_format(const http::fields& headers);

} // inspector namespace

} // httpsig namespace
