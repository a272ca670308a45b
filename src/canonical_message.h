#pragma once

#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "content_digest.h"
#include "message.h"
#include "signature_params.h"

namespace httpsig {

// The exact bytes a signature is computed over.
//
// One line per covered component, `"<name>": <value>`, and a last line
// `"@signature-params": <params>`, joined by `\n` without a trailing
// newline.
struct CanonicalMessage {
    std::vector<std::string> lines;
    // Covered components in emission order, without `@signature-params`.
    std::vector<std::string> covered;
    // The value of the `@signature-params` line, which is also the
    // value of the `Signature-Input` entry.
    std::string signature_params;

    std::string to_string() const;
};

// `"<name>": <value>` with double quotes in `value` escaped.
std::string format_component_line(boost::string_view name, boost::string_view value);

// The `@target-uri` value of `url`.  Throws `SigningError` (INVALID_URL)
// if it is not an absolute http(s) URL.
std::string target_uri(boost::string_view url);

// Emit components in their fixed order: `@method`, `@target-uri`,
// headers in configured order, `content-digest`.
//
// A configured header which is absent from `message` is skipped unless
// `strict` is set, in which case `SigningError` (MISSING_REQUIRED_HEADER)
// is thrown.  If `content-digest` is covered and `digest` is `none`, the
// digest of the message body is computed with SHA-256.
CanonicalMessage build_canonical_message( const SignableMessage& message
                                        , const SignatureComponents& components
                                        , const SignatureParams& params
                                        , const boost::optional<ContentDigest>& digest
                                        , bool strict = false);

// Rebuild the canonical message from wire data only: the components are
// emitted in the order of `covered` and the `content-digest` line takes
// `content_digest_header` as sent.
//
// Throws `VerificationError` (CANONICAL_MESSAGE_RECONSTRUCTION_FAILED)
// when a covered component cannot be produced from `message`.
CanonicalMessage reconstruct_canonical_message( const SignableMessage& message
                                              , const std::vector<std::string>& covered
                                              , const SignatureParams& params
                                              , const boost::optional<std::string>& content_digest_header);

} // httpsig namespace
