#include <didwebvh/webvh/url.hpp>
#include <sstream>

namespace didwebvh {

    namespace {

        std::vector<std::string> split(const std::string &text, char separator) {
            std::vector<std::string> parts;
            std::string part;
            std::istringstream stream(text);
            while (std::getline(stream, part, separator)) {
                parts.push_back(part);
            }
            if (!text.empty() && text.back() == separator) {
                parts.emplace_back();
            }
            return parts;
        }

    } // namespace

    dp::Result<WebVHURL, dp::Error> WebVHURL::parseDidUrl(const std::string &url) {
        const std::string prefix(PREFIX);
        std::string rest;
        if (url.compare(0, prefix.size(), prefix) == 0) {
            rest = url.substr(prefix.size());
        } else if (url.compare(0, 4, "did:") == 0) {
            return dp::Result<WebVHURL, dp::Error>::err(
                unsupported_method("Unsupported DID method, expected did:webvh: '" + url + "'"));
        } else {
            rest = url;
        }

        WebVHURL parsed;

        size_t fragment_pos = rest.find('#');
        if (fragment_pos != std::string::npos) {
            parsed.fragment_ = rest.substr(fragment_pos + 1);
            rest = rest.substr(0, fragment_pos);
        }

        size_t query_pos = rest.find('?');
        if (query_pos != std::string::npos) {
            parsed.query_ = rest.substr(query_pos + 1);
            rest = rest.substr(0, query_pos);
        }

        auto parts = split(rest, ':');
        if (parts.size() < 2 || parts[0].empty() || parts[1].empty()) {
            return dp::Result<WebVHURL, dp::Error>::err(
                invalid_method_identifier("Invalid URL: must contain SCID and domain"));
        }

        parsed.scid_ = parts[0];

        const std::string &host = parts[1];
        size_t port_pos = host.find("%3A");
        if (port_pos == std::string::npos) {
            port_pos = host.find("%3a");
        }
        if (port_pos != std::string::npos) {
            parsed.domain_ = host.substr(0, port_pos);
            std::string port = host.substr(port_pos + 3);
            if (port.empty() || port.size() > 5 || port.find_first_not_of("0123456789") != std::string::npos) {
                return dp::Result<WebVHURL, dp::Error>::err(
                    invalid_method_identifier("Invalid URL: port (" + port + ") must be a number"));
            }
            unsigned long value = std::stoul(port);
            if (value > 65535) {
                return dp::Result<WebVHURL, dp::Error>::err(
                    invalid_method_identifier("Invalid URL: port (" + port + ") is out of range"));
            }
            parsed.port_ = static_cast<dp::u16>(value);
        } else {
            parsed.domain_ = host;
        }

        if (parsed.domain_.empty()) {
            return dp::Result<WebVHURL, dp::Error>::err(invalid_method_identifier("Invalid URL: empty domain"));
        }

        bool whois = parts.size() > 2 && parts.back() == "whois";
        size_t path_end = whois ? parts.size() - 1 : parts.size();

        std::string path;
        for (size_t i = 2; i < path_end; ++i) {
            if (parts[i].empty()) {
                return dp::Result<WebVHURL, dp::Error>::err(
                    invalid_method_identifier("Invalid URL: empty path segment"));
            }
            path += "/" + parts[i];
        }
        parsed.path_ = path.empty() ? std::string(DEFAULT_PATH) : path + "/";

        if (whois) {
            parsed.type_ = URLType::WhoIs;
            parsed.file_name_ = WHOIS_FILE;
        }

        return dp::Result<WebVHURL, dp::Error>::ok(parsed);
    }

    std::string WebVHURL::getHttpUrl(const std::optional<std::string> &file_name) const {
        std::string url = domain_ == "localhost" ? "http://" : "https://";
        url += domain_;
        if (port_) {
            url += ":" + std::to_string(*port_);
        }
        url += path_;
        url += file_name ? *file_name : file_name_;
        return url;
    }

    std::string WebVHURL::getDid() const {
        std::string did = std::string(PREFIX) + scid_ + ":" + domain_;
        if (port_) {
            did += "%3A" + std::to_string(*port_);
        }
        if (path_ != DEFAULT_PATH) {
            for (const auto &segment : split(path_, '/')) {
                if (!segment.empty()) {
                    did += ":" + segment;
                }
            }
        }
        return did;
    }

    std::string WebVHURL::toString() const {
        std::string out = getDid();
        if (type_ == URLType::WhoIs) {
            out += ":whois";
        }
        if (query_) {
            out += "?" + *query_;
        }
        if (fragment_) {
            out += "#" + *fragment_;
        }
        return out;
    }

    std::map<std::string, std::string> WebVHURL::getQueryParameters() const {
        std::map<std::string, std::string> params;
        if (!query_) {
            return params;
        }
        for (const auto &pair : split(*query_, '&')) {
            if (pair.empty()) {
                continue;
            }
            size_t eq = pair.find('=');
            if (eq == std::string::npos) {
                params[pair] = "";
            } else {
                params[pair.substr(0, eq)] = pair.substr(eq + 1);
            }
        }
        return params;
    }

} // namespace didwebvh
