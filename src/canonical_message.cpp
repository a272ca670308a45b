#include "canonical_message.h"
#include "error.h"
#include "util/str.h"
#include "util/url.h"

namespace httpsig {

std::string CanonicalMessage::to_string() const
{
    return util::join(lines, "\n");
}

std::string format_component_line(boost::string_view name, boost::string_view value)
{
    std::string escaped;
    escaped.reserve(value.size());

    for (char c : value) {
        if (c == '"') escaped += '\\';
        escaped += c;
    }

    return util::str('"', name, "\": ", escaped);
}

std::string target_uri(boost::string_view url)
{
    auto u = util::Url::from(url);

    if (!u) {
        throw SigningError( signing_error::invalid_url
                          , "Invalid URL for @target-uri"
                          , {{"url", std::string(url)}});
    }

    return u->target();
}

static void finish(CanonicalMessage& cm, const SignatureParams& params)
{
    cm.signature_params = format_signature_params(cm.covered, params);
    // Not escaped, the line must equal the `Signature-Input` entry.
    cm.lines.push_back(util::str("\"@signature-params\": ", cm.signature_params));
}

static void emit(CanonicalMessage& cm, boost::string_view name, boost::string_view value)
{
    cm.lines.push_back(format_component_line(name, value));
    cm.covered.emplace_back(name);
}

CanonicalMessage build_canonical_message( const SignableMessage& message
                                        , const SignatureComponents& components
                                        , const SignatureParams& params
                                        , const boost::optional<ContentDigest>& digest
                                        , bool strict)
{
    CanonicalMessage cm;

    if (components.method) {
        emit(cm, "@method", message.method_string());
    }

    if (components.target_uri) {
        emit(cm, "@target-uri", target_uri(message.url()));
    }

    for (const auto& name : components.headers()) {
        auto value = message.header(name);

        if (!value) {
            if (strict) {
                throw SigningError( signing_error::missing_required_header
                                  , util::str("Required header missing: ", name)
                                  , {{"header", name}});
            }
            continue;
        }

        emit(cm, name, *value);
    }

    if (components.content_digest) {
        auto d = digest ? *digest : calculate_content_digest(message.body());
        emit(cm, "content-digest", d.header_value);
    }

    finish(cm, params);
    return cm;
}

CanonicalMessage reconstruct_canonical_message( const SignableMessage& message
                                              , const std::vector<std::string>& covered
                                              , const SignatureParams& params
                                              , const boost::optional<std::string>& content_digest_header)
{
    auto fail = [] (std::string msg, const std::string& component) {
        return VerificationError( verification_error::canonical_message_reconstruction_failed
                                , std::move(msg)
                                , {{"component", component}});
    };

    CanonicalMessage cm;

    for (const auto& c : covered) {
        if (c == "@method") {
            emit(cm, c, message.method_string());
        }
        else if (c == "@target-uri") {
            auto u = util::Url::from(message.url());
            if (!u) throw fail("Invalid URL for @target-uri", c);
            emit(cm, c, u->target());
        }
        else if (c == "content-digest") {
            auto v = content_digest_header ? content_digest_header
                                           : message.header(c);
            if (!v) throw fail("Covered content-digest is missing", c);
            emit(cm, c, *v);
        }
        else if (!c.empty() && c[0] == '@') {
            throw fail(util::str("Unsupported derived component: ", c), c);
        }
        else {
            auto v = message.header(c);
            if (!v) throw fail(util::str("Covered header missing: ", c), c);
            emit(cm, c, *v);
        }
    }

    finish(cm, params);
    return cm;
}

} // httpsig namespace
