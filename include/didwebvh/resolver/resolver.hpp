#pragma once

#include <chrono>
#include <datapod/datapod.hpp>
#include <didwebvh/common/error.hpp>
#include <didwebvh/identity/did_key.hpp>
#include <didwebvh/integrity/data_integrity.hpp>
#include <didwebvh/webvh/log_entry.hpp>
#include <didwebvh/webvh/state.hpp>
#include <didwebvh/webvh/url.hpp>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace didwebvh {

    /// Resolver configuration
    struct ResolverConfig {
        std::chrono::milliseconds timeout{10000}; // shared by the log and witness fetches
    };

    /// Transport used to fetch did.jsonl and did-witness.json
    class Fetcher {
      public:
        virtual ~Fetcher() = default;

        /// Body of the resource at url
        virtual dp::Result<std::string, dp::Error> fetch(const std::string &url) const = 0;
    };

    /// Resolution output: the selected DID Document version and its metadata
    struct ResolvedDID {
        nlohmann::json document;
        MetaData metadata;
    };

    /// did:webvh resolver
    ///
    /// Fetches the log and the witness proofs concurrently under one deadline.
    /// A failed or late log fetch fails the resolution; a failed or late witness
    /// fetch resolves as if no witness proofs were published. Fetches that miss
    /// the deadline are abandoned, never joined.
    class DIDWebVHResolver {
      public:
        explicit DIDWebVHResolver(std::shared_ptr<const Fetcher> fetcher, ResolverConfig config = {});

        DIDWebVHResolver(std::shared_ptr<const Fetcher> fetcher, ResolverConfig config,
                         std::shared_ptr<const DataIntegrity> integrity, std::shared_ptr<const DIDResolver> resolver);

        /// Resolve a did:webvh DID URL
        /// Honours the versionId, versionNumber and versionTime query parameters
        dp::Result<ResolvedDID, dp::Error> resolve(const std::string &did_url) const;

        /// Fetch and validate the full history of a DID
        dp::Result<DIDWebVHState, dp::Error> resolveState(const WebVHURL &url) const;

        inline const ResolverConfig &getConfig() const { return config_; }

      private:
        std::shared_ptr<const Fetcher> fetcher_;
        ResolverConfig config_;
        std::shared_ptr<const DataIntegrity> integrity_;
        std::shared_ptr<const DIDResolver> resolver_;
    };

} // namespace didwebvh
