#pragma once

#include <map>
#include <string>
#include <type_traits>

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include "namespaces.h"

namespace httpsig {

// 0 means success in every enumeration below.

enum class signing_error {
    invalid_config = 1,
    invalid_private_key,
    invalid_key_id,
    invalid_signature_components,
    invalid_nonce,
    invalid_timestamp,
    missing_required_header,
    invalid_url,
    canonical_message_failed,
    digest_calculation_failed,
    signing_failed,
    crypto_error,
};

enum class verification_error {
    invalid_config = 1,
    invalid_policy,
    unknown_policy,
    invalid_message,
    missing_signature_input,
    missing_signature,
    invalid_signature_format,
    invalid_signature_input_format,
    signature_id_mismatch,
    invalid_content_digest_format,
    public_key_not_found,
    key_retrieval_failed,
    invalid_public_key,
    cryptographic_verification_failed,
    canonical_message_reconstruction_failed,
    verification_failed,
    response_verification_failed,
    request_verification_failed,
    batch_verification_error,
    middleware_error,
};

enum class config_error {
    missing_source = 1,
    malformed_source,
    invalid_policy,
    unknown_rule,
    invalid_option,
    invalid_key,
};

// An error category whose codes also have a stable, machine-readable
// name such as `INVALID_NONCE`.
class named_error_category : public sys::error_category {
public:
    virtual const char* code_name(int) const noexcept = 0;
};

const named_error_category& signing_category();
const named_error_category& verification_category();
const named_error_category& config_category();

inline sys::error_code make_error_code(signing_error e) {
    return sys::error_code(static_cast<int>(e), signing_category());
}

inline sys::error_code make_error_code(verification_error e) {
    return sys::error_code(static_cast<int>(e), verification_category());
}

inline sys::error_code make_error_code(config_error e) {
    return sys::error_code(static_cast<int>(e), config_category());
}

// The stable name of a code from this library's categories,
// `<category>:<value>` for any other code.
std::string code_name(const sys::error_code&);

using ErrorDetails = std::map<std::string, std::string>;

// Base of the exceptions thrown by this library.
class Error : public sys::system_error {
public:
    Error(sys::error_code ec, std::string message, ErrorDetails details = {})
        : sys::system_error(ec, message)
        , _message(std::move(message))
        , _details(std::move(details))
    {}

    // E.g. "MISSING_REQUIRED_HEADER".
    std::string name() const { return code_name(code()); }

    // The message without the category description appended by `what()`.
    const std::string& message() const { return _message; }

    const ErrorDetails& details() const { return _details; }

private:
    std::string _message;
    ErrorDetails _details;
};

// Bad signer configuration or invalid input to `sign`.
class SigningError : public Error {
public:
    SigningError(signing_error e, std::string message, ErrorDetails details = {})
        : Error(make_error_code(e), std::move(message), std::move(details))
    {}
};

// Malformed signature headers, unknown policy, unresolvable key.
class VerificationError : public Error {
public:
    VerificationError(verification_error e, std::string message, ErrorDetails details = {})
        : Error(make_error_code(e), std::move(message), std::move(details))
    {}
};

// A configuration source which is missing or invalid.
class ConfigError : public Error {
public:
    ConfigError(config_error e, std::string message, ErrorDetails details = {})
        : Error(make_error_code(e), std::move(message), std::move(details))
    {}
};

} // httpsig namespace

namespace boost { namespace system {
    template<> struct is_error_code_enum<::httpsig::signing_error>
        : public std::true_type {};
    template<> struct is_error_code_enum<::httpsig::verification_error>
        : public std::true_type {};
    template<> struct is_error_code_enum<::httpsig::config_error>
        : public std::true_type {};
}} // boost::system namespace
