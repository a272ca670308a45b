#include "tool_config.h"
#include "split_string.h"

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/fstream.hpp>

namespace httpsig {

template<class... Args>
inline
std::runtime_error error(Args&&... args) {
    return std::runtime_error(util::str(std::forward<Args>(args)...));
}

// Helper to avoid writing the name of the option twice.
template<typename T>
static boost::optional<T> as_optional(const boost::program_options::variables_map& vm, const char* name) {
    if (vm.count(name) == 0) {
        return boost::none;
    }
    return vm[name].as<T>();
}

boost::program_options::options_description ToolConfig::description()
{
    using namespace std;
    namespace po = boost::program_options;

    po::options_description general("General options");
    general.add_options()
       ("help", "Produce this help message")
       ("command", po::value<string>(), "One of: sign, verify, inspect")
       ("config", po::value<string>(), "Read further options from this file")
       ("log-level", po::value<string>()->default_value(util::str(default_log_level()))
        , "Set log level: silly, debug, verbose, info, warn, error, abort")
       ("log-file", po::value<string>(), "Also write log messages to this file")
       ;

    po::options_description keys("Key and policy options");
    keys.add_options()
       ("key-id", po::value<string>(), "Key identifier for signing, or for key lookup when verifying")
       ("private-key", po::value<string>(), "Ed25519 private key (64 hex characters)")
       ("public-key", po::value<string>(), "Ed25519 public key (64 hex characters)")
       ("profile", po::value<string>()->default_value("standard")
        , "Signing profile: minimal, standard, strict")
       ("policies", po::value<string>()->default_value(default_policies_path)
        , "JSON file with verification policies")
       ("policy", po::value<string>(), "Verification policy name")
       ("nonce", po::value<string>(), "Fixed signature nonce (version 4 UUID)")
       ("created", po::value<int64_t>(), "Fixed signature timestamp (Unix seconds)")
       ;

    po::options_description message("Message options");
    message.add_options()
       ("method", po::value<string>()->default_value("GET"), "HTTP method")
       ("url", po::value<string>(), "Absolute http(s) URL")
       ("header", po::value<vector<string>>()->composing()
        , "Header field in <NAME>: <VALUE> format (can be used several times)")
       ("body", po::value<string>(), "Message body")
       ("signature-input", po::value<string>(), "Signature-Input header value")
       ("signature", po::value<string>(), "Signature header value")
       ("content-digest", po::value<string>(), "Content-Digest header value")
       ;

    po::options_description desc;
    desc.add(general).add(keys).add(message);
    return desc;
}

ToolConfig::ToolConfig(int argc, const char* argv[])
{
    using namespace std;
    namespace po = boost::program_options;

    auto desc = description();

    po::positional_options_description positional;
    positional.add("command", 1);

    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv)
                .options(desc).positional(positional).run(), vm);
    po::notify(vm);

    if (vm.count("help")) {
        _is_help = true;
        return;
    }

    if (auto path = as_optional<string>(vm, "config")) {
        fs::ifstream conf(*path);
        if (!conf) {
            throw error("Failed to open configuration file: ", *path);
        }
        po::store(po::parse_config_file(conf, desc), vm);
        po::notify(vm);
    }

    {
        auto level = vm["log-level"].as<string>();
        auto ll = parse_log_level(level);
        if (!ll) throw error("Invalid log level: ", level);
        _log_level = *ll;
    }

    if (auto f = as_optional<string>(vm, "log-file")) {
        _log_file = fs::path(*f);
    }

    auto command = as_optional<string>(vm, "command");
    if (!command) throw error("Missing command (sign, verify or inspect)");

    if      (*command == "sign")    _command = Command::sign;
    else if (*command == "verify")  _command = Command::verify;
    else if (*command == "inspect") _command = Command::inspect;
    else throw error("Unknown command: ", *command);

    _policies_path = vm["policies"].as<string>();
    _policy = as_optional<string>(vm, "policy");

    if (auto id = as_optional<string>(vm, "key-id")) _key_id = *id;

    if (auto hex = as_optional<string>(vm, "private-key")) {
        util::crypto_init();
        _private_key = util::Ed25519PrivateKey::from_hex(*hex);
        if (!_private_key) throw error("Invalid private key, expected 64 hex characters");
    }

    if (auto hex = as_optional<string>(vm, "public-key")) {
        util::crypto_init();
        _public_key = util::Ed25519PublicKey::from_hex(*hex);
        if (!_public_key) throw error("Invalid public key, expected 64 hex characters");
    }

    {
        auto p = vm["profile"].as<string>();
        auto profile = parse_security_profile(p);
        if (!profile) throw error("Unknown profile: ", p);
        _profile = *profile;
    }

    _nonce = as_optional<string>(vm, "nonce");
    _created = as_optional<int64_t>(vm, "created");

    {
        auto m = vm["method"].as<string>();
        auto method = parse_method(m);
        if (!method) throw error("Unsupported HTTP method: ", m);
        _method = *method;
    }

    if (auto url = as_optional<string>(vm, "url")) _url = *url;

    if (auto hs = as_optional<vector<string>>(vm, "header")) {
        for (const auto& h : *hs) {
            if (h.find(':') == string::npos) {
                throw error("Invalid header, expected <NAME>: <VALUE>: ", h);
            }
            auto nv = split_string_pair(h, ':');
            if (nv.first.empty()) throw error("Empty header name: ", h);
            _headers.emplace_back(std::string(nv.first), std::string(nv.second));
        }
    }

    _body = as_optional<string>(vm, "body");
    _signature_input = as_optional<string>(vm, "signature-input");
    _signature = as_optional<string>(vm, "signature");
    _content_digest = as_optional<string>(vm, "content-digest");

    if (_command != Command::inspect && _url.empty()) {
        throw error("The '--url' option is missing");
    }
}

SignableMessage ToolConfig::message() const
{
    return SignableMessage(_method, _url, _headers, _body);
}

http::fields ToolConfig::signature_headers() const
{
    http::fields fields;
    for (const auto& h : _headers) fields.set(h.first, h.second);
    if (_signature_input) fields.set("signature-input", *_signature_input);
    if (_signature)       fields.set("signature", *_signature);
    if (_content_digest)  fields.set("content-digest", *_content_digest);
    return fields;
}

} // httpsig namespace
