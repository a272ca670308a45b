#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>

#include "logger.h"
#include "message.h"
#include "namespaces.h"
#include "signing_config.h"
#include "util/crypto.h"

namespace httpsig {

static const char default_policies_path[] = "config/policies.json";

// Command line (and optional configuration file) of `httpsig-tool`.
class ToolConfig {
public:
    enum class Command { sign, verify, inspect };

    ToolConfig() = default;

    // Throws `std::runtime_error` on invalid options.
    ToolConfig(int argc, const char* argv[]);

    bool is_help() const { return _is_help; }

    static boost::program_options::options_description description();

    Command command() const { return _command; }
    log_level_t log_level() const { return _log_level; }
    const boost::optional<fs::path>& log_file() const { return _log_file; }

    const fs::path& policies_path() const { return _policies_path; }
    const boost::optional<std::string>& policy() const { return _policy; }

    const std::string& key_id() const { return _key_id; }
    const boost::optional<util::Ed25519PrivateKey>& private_key() const { return _private_key; }
    const boost::optional<util::Ed25519PublicKey>& public_key() const { return _public_key; }
    SecurityProfile profile() const { return _profile; }

    const boost::optional<std::string>& nonce() const { return _nonce; }
    const boost::optional<int64_t>& created() const { return _created; }

    // Method, URL, `--header`s and body.
    SignableMessage message() const;

    // `--header`s plus the explicit signature header options.
    http::fields signature_headers() const;

private:
    bool _is_help = false;
    Command _command = Command::inspect;
    log_level_t _log_level = default_log_level();
    boost::optional<fs::path> _log_file;

    fs::path _policies_path = default_policies_path;
    boost::optional<std::string> _policy;

    std::string _key_id;
    boost::optional<util::Ed25519PrivateKey> _private_key;
    boost::optional<util::Ed25519PublicKey> _public_key;
    SecurityProfile _profile = SecurityProfile::standard;

    http::verb _method = http::verb::get;
    std::string _url;
    HeaderList _headers;
    boost::optional<std::string> _body;

    boost::optional<std::string> _signature_input;
    boost::optional<std::string> _signature;
    boost::optional<std::string> _content_digest;

    boost::optional<std::string> _nonce;
    boost::optional<int64_t> _created;
};

} // httpsig namespace
