#include "error.h"
#include "util/str.h"

namespace httpsig {

namespace {

struct CodeInfo {
    const char* name;
    const char* message;
};

template<size_t N>
class table_category : public named_error_category {
public:
    table_category(const char* category_name, const CodeInfo (&table)[N])
        : _name(category_name), _table(table)
    {}

    const char* name() const noexcept override {
        return _name;
    }

    std::string message(int e) const override {
        if (auto info = lookup(e)) return info->message;
        return util::str("unknown ", _name, " error");
    }

    const char* code_name(int e) const noexcept override {
        if (auto info = lookup(e)) return info->name;
        return "UNKNOWN_ERROR";
    }

private:
    const CodeInfo* lookup(int e) const noexcept {
        if (e < 1 || static_cast<size_t>(e) > N) return nullptr;
        return &_table[e - 1];
    }

    const char* _name;
    const CodeInfo (&_table)[N];
};

// Entries follow the order of the enumerations in `error.h`.

const CodeInfo signing_codes[] = {
    {"INVALID_CONFIG",               "invalid signing configuration"},
    {"INVALID_PRIVATE_KEY",          "invalid private key"},
    {"INVALID_KEY_ID",               "invalid key identifier"},
    {"INVALID_SIGNATURE_COMPONENTS", "invalid signature components"},
    {"INVALID_NONCE",                "invalid nonce"},
    {"INVALID_TIMESTAMP",            "invalid timestamp"},
    {"MISSING_REQUIRED_HEADER",      "missing required header"},
    {"INVALID_URL",                  "invalid URL"},
    {"CANONICAL_MESSAGE_FAILED",     "canonical message construction failed"},
    {"DIGEST_CALCULATION_FAILED",    "content digest calculation failed"},
    {"SIGNING_FAILED",               "signing failed"},
    {"CRYPTO_ERROR",                 "cryptographic library error"},
};

const CodeInfo verification_codes[] = {
    {"INVALID_CONFIG",                          "invalid verification configuration"},
    {"INVALID_POLICY",                          "invalid verification policy"},
    {"UNKNOWN_POLICY",                          "unknown verification policy"},
    {"INVALID_MESSAGE",                         "invalid message"},
    {"MISSING_SIGNATURE_INPUT",                 "missing Signature-Input header"},
    {"MISSING_SIGNATURE",                       "missing Signature header"},
    {"INVALID_SIGNATURE_FORMAT",                "malformed Signature header"},
    {"INVALID_SIGNATURE_INPUT_FORMAT",          "malformed Signature-Input header"},
    {"SIGNATURE_ID_MISMATCH",                   "signature label mismatch"},
    {"INVALID_CONTENT_DIGEST_FORMAT",           "malformed Content-Digest header"},
    {"PUBLIC_KEY_NOT_FOUND",                    "public key not found"},
    {"KEY_RETRIEVAL_FAILED",                    "public key retrieval failed"},
    {"INVALID_PUBLIC_KEY",                      "invalid public key"},
    {"CRYPTOGRAPHIC_VERIFICATION_FAILED",       "cryptographic verification failed"},
    {"CANONICAL_MESSAGE_RECONSTRUCTION_FAILED", "canonical message reconstruction failed"},
    {"VERIFICATION_FAILED",                     "verification failed"},
    {"RESPONSE_VERIFICATION_FAILED",            "response verification failed"},
    {"REQUEST_VERIFICATION_FAILED",             "request verification failed"},
    {"BATCH_VERIFICATION_ERROR",                "batch verification error"},
    {"MIDDLEWARE_ERROR",                        "verification middleware error"},
};

const CodeInfo config_codes[] = {
    {"MISSING_SOURCE",   "configuration source not found"},
    {"MALFORMED_SOURCE", "malformed configuration source"},
    {"INVALID_POLICY",   "invalid policy definition"},
    {"UNKNOWN_RULE",     "unknown verification rule"},
    {"INVALID_OPTION",   "invalid option"},
    {"INVALID_KEY",      "invalid key material"},
};

} // anonymous namespace

const named_error_category& signing_category() {
    static const table_category c("httpsig_signing", signing_codes);
    return c;
}

const named_error_category& verification_category() {
    static const table_category c("httpsig_verification", verification_codes);
    return c;
}

const named_error_category& config_category() {
    static const table_category c("httpsig_config", config_codes);
    return c;
}

std::string code_name(const sys::error_code& ec) {
    if (auto c = dynamic_cast<const named_error_category*>(&ec.category())) {
        return c->code_name(ec.value());
    }
    return util::str(ec.category().name(), ':', ec.value());
}

} // httpsig namespace
