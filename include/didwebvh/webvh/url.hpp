#pragma once

#include <datapod/datapod.hpp>
#include <didwebvh/common/error.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace didwebvh {

    /// Kind of resource a did:webvh URL points at
    enum class URLType : dp::u8 {
        DIDDoc = 0, // did.jsonl
        WhoIs = 1,  // whois.vp
    };

    /// Breakdown of a did:webvh DID / DID URL
    /// Format: did:webvh:<scid>:<domain>[%3A<port>][:<path>...][:whois][?query][#fragment]
    class WebVHURL {
      public:
        static constexpr const char *PREFIX = "did:webvh:";
        static constexpr const char *DEFAULT_PATH = "/.well-known/";
        static constexpr const char *LOG_FILE = "did.jsonl";
        static constexpr const char *WITNESS_FILE = "did-witness.json";
        static constexpr const char *WHOIS_FILE = "whois.vp";

        WebVHURL() = default;

        /// Parse a did:webvh DID URL, the "did:webvh:" prefix may already be stripped
        static dp::Result<WebVHURL, dp::Error> parseDidUrl(const std::string &url);

        /// HTTP(S) location of a file for this DID; defaults to the URL's own file
        /// localhost is fetched over plain http
        std::string getHttpUrl(const std::optional<std::string> &file_name = std::nullopt) const;

        /// Full DID URL including whois, query and fragment
        std::string toString() const;

        /// Base DID, no whois, query or fragment
        std::string getDid() const;

        /// Query string split into key/value pairs
        std::map<std::string, std::string> getQueryParameters() const;

        inline URLType getType() const { return type_; }

        inline const std::string &getScid() const { return scid_; }

        inline const std::string &getDomain() const { return domain_; }

        inline std::optional<dp::u16> getPort() const { return port_; }

        inline const std::string &getPath() const { return path_; }

        inline const std::optional<std::string> &getQuery() const { return query_; }

        inline const std::optional<std::string> &getFragment() const { return fragment_; }

        inline const std::string &getFileName() const { return file_name_; }

      private:
        URLType type_ = URLType::DIDDoc;
        std::string scid_;
        std::string domain_;
        std::optional<dp::u16> port_;
        std::string path_ = DEFAULT_PATH;
        std::optional<std::string> query_;
        std::optional<std::string> fragment_;
        std::string file_name_ = LOG_FILE;
    };

} // namespace didwebvh
