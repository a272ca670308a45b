#include "signature_extractor.h"
#include "error.h"
#include "parse/number.h"
#include "split_string.h"
#include "util/str.h"

#include <algorithm>
#include <map>

#include <boost/regex.hpp>

namespace httpsig {

bool ExtractedSignatureData::covers(boost::string_view c) const
{
    return std::find(covered.begin(), covered.end(), c) != covered.end();
}

bool has_signature_headers(const http::fields& headers)
{
    return headers.find("signature-input") != headers.end()
        && headers.find("signature") != headers.end();
}

static boost::optional<std::string> field(const http::fields& headers, boost::string_view name)
{
    auto i = headers.find(name);
    if (i == headers.end()) return boost::none;
    return std::string(i->value());
}

static VerificationError input_format_error(const std::string& input, std::string msg)
{
    return VerificationError( verification_error::invalid_signature_input_format
                            , std::move(msg)
                            , {{"signature_input", input}});
}

ExtractedSignatureData extract_signature_data(const http::fields& headers)
{
    auto input = field(headers, "signature-input");
    if (!input) {
        throw VerificationError( verification_error::missing_signature_input
                               , "Signature-Input header not found");
    }

    auto signature = field(headers, "signature");
    if (!signature) {
        throw VerificationError( verification_error::missing_signature
                               , "Signature header not found");
    }

    static const boost::regex input_rx("([^=]+)=\\(([^)]+)\\);(.+)");
    static const boost::regex component_rx("\"([^\"]+)\"");
    static const boost::regex signature_rx("([^=]+)=:([^:]+):");

    boost::smatch m;

    if (!boost::regex_match(*input, m, input_rx)) {
        throw input_format_error(*input, "Invalid Signature-Input header format");
    }

    ExtractedSignatureData data;
    data.label = m[1].str();

    auto list = m[2].str();
    for (boost::sregex_iterator i(list.begin(), list.end(), component_rx), end; i != end; ++i) {
        data.covered.push_back((*i)[1].str());
    }

    std::map<std::string, std::string> params;
    auto params_str = m[3].str();

    for (auto p : SplitString(params_str, ';')) {
        if (p.empty()) continue;
        auto kv = split_string_pair(p, '=');
        auto value = kv.second;
        unquote(value);
        params[std::string(kv.first)] = std::string(value);
    }

    for (auto required : {"created", "keyid", "alg", "nonce"}) {
        if (!params.count(required)) {
            throw input_format_error(*input, util::str("Missing signature parameter: ", required));
        }
    }

    auto created = parse::whole_number<int64_t>(params["created"]);
    if (!created) {
        throw input_format_error(*input, "Signature parameter `created` is not a number");
    }

    data.params.created = *created;
    data.params.keyid = params["keyid"];
    data.params.alg = params["alg"];
    data.params.nonce = params["nonce"];

    if (!boost::regex_match(*signature, m, signature_rx)) {
        throw VerificationError( verification_error::invalid_signature_format
                               , "Invalid Signature header format"
                               , {{"signature", *signature}});
    }

    if (m[1].str() != data.label) {
        throw VerificationError( verification_error::signature_id_mismatch
                               , "Signature label does not match Signature-Input"
                               , {{"signature_input_label", data.label}
                                 ,{"signature_label", m[1].str()}});
    }

    data.signature = m[2].str();

    if (auto digest = field(headers, "content-digest")) {
        data.content_digest = parse_content_digest(*digest);
        data.content_digest_header = std::move(digest);
    }

    return data;
}

CanonicalMessage reconstruct( const SignableMessage& message
                            , const ExtractedSignatureData& data)
{
    return reconstruct_canonical_message( message
                                        , data.covered
                                        , data.params
                                        , data.content_digest_header);
}

} // httpsig namespace
