#pragma once

#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "canonical_message.h"
#include "content_digest.h"
#include "message.h"
#include "namespaces.h"
#include "signature_params.h"

namespace httpsig {

// Signature data as sent on the wire.  Nothing in here is trusted
// before the signature verifies.
struct ExtractedSignatureData {
    std::string label;
    std::string signature;  // hex as sent
    std::vector<std::string> covered;
    SignatureParams params;
    boost::optional<ContentDigest> content_digest;
    // Exact `Content-Digest` header value, when present.
    boost::optional<std::string> content_digest_header;

    bool covers(boost::string_view component) const;
};

// Parse `Signature-Input`, `Signature` and `Content-Digest`.
//
// Throws `VerificationError` with MISSING_SIGNATURE_INPUT,
// MISSING_SIGNATURE, INVALID_SIGNATURE_INPUT_FORMAT,
// INVALID_SIGNATURE_FORMAT, SIGNATURE_ID_MISMATCH or
// INVALID_CONTENT_DIGEST_FORMAT.
ExtractedSignatureData extract_signature_data(const http::fields& headers);

// True if both signature headers are present.
bool has_signature_headers(const http::fields& headers);

// The canonical message which must have been signed, derived from the
// wire data in `data` and the facts of `message`.
// See `reconstruct_canonical_message`.
CanonicalMessage reconstruct( const SignableMessage& message
                            , const ExtractedSignatureData& data);

} // httpsig namespace
