#include <didwebvh/resolver/resolver.hpp>
#include <future>
#include <iostream>
#include <thread>

namespace didwebvh {

    namespace {

        using FetchResult = dp::Result<std::string, dp::Error>;

        /// Run a fetch on its own detached thread
        std::future<FetchResult> startFetch(std::shared_ptr<const Fetcher> fetcher, std::string url) {
            std::packaged_task<FetchResult()> task([fetcher, url]() { return fetcher->fetch(url); });
            auto future = task.get_future();
            std::thread(std::move(task)).detach();
            return future;
        }

        dp::Result<dp::u32, dp::Error> parseVersionNumber(const std::string &text) {
            if (text.empty() || text.size() > 9 || text.find_first_not_of("0123456789") != std::string::npos) {
                return dp::Result<dp::u32, dp::Error>::err(
                    dp::Error::invalid_argument(dp::String(("Invalid versionNumber: '" + text + "'").c_str())));
            }
            return dp::Result<dp::u32, dp::Error>::ok(static_cast<dp::u32>(std::stoul(text)));
        }

    } // namespace

    DIDWebVHResolver::DIDWebVHResolver(std::shared_ptr<const Fetcher> fetcher, ResolverConfig config)
        : DIDWebVHResolver(std::move(fetcher), config, std::make_shared<EddsaJcs2022>(),
                           std::make_shared<DIDKeyResolver>()) {}

    DIDWebVHResolver::DIDWebVHResolver(std::shared_ptr<const Fetcher> fetcher, ResolverConfig config,
                                       std::shared_ptr<const DataIntegrity> integrity,
                                       std::shared_ptr<const DIDResolver> resolver)
        : fetcher_(std::move(fetcher)), config_(config), integrity_(std::move(integrity)),
          resolver_(std::move(resolver)) {}

    dp::Result<DIDWebVHState, dp::Error> DIDWebVHResolver::resolveState(const WebVHURL &url) const {
        auto deadline = std::chrono::steady_clock::now() + config_.timeout;

        auto log_future = startFetch(fetcher_, url.getHttpUrl(std::string(WebVHURL::LOG_FILE)));
        auto witness_future = startFetch(fetcher_, url.getHttpUrl(std::string(WebVHURL::WITNESS_FILE)));

        if (log_future.wait_until(deadline) != std::future_status::ready) {
            return dp::Result<DIDWebVHState, dp::Error>::err(
                timeout_error("Timed out fetching the DID log for " + url.getDid()));
        }
        auto log_text = log_future.get();
        if (log_text.is_err()) {
            return dp::Result<DIDWebVHState, dp::Error>::err(
                transport_error("Couldn't fetch the DID log for " + url.getDid() + ": " +
                                errorMessage(log_text.error())));
        }

        DIDWebVHState state(integrity_, resolver_);
        auto loaded = state.loadLogEntries(log_text.value());
        if (loaded.is_err()) {
            return dp::Result<DIDWebVHState, dp::Error>::err(loaded.error());
        }

        // Witness proofs are optional, any failure resolves without them
        if (witness_future.wait_until(deadline) != std::future_status::ready) {
            std::cout << "Timed out fetching witness proofs for " << url.getDid() << ", continuing without"
                      << std::endl;
        } else {
            auto witness_text = witness_future.get();
            if (witness_text.is_err()) {
                std::cout << "No witness proofs for " << url.getDid() << ": " << errorMessage(witness_text.error())
                          << std::endl;
            } else {
                auto proofs = state.loadWitnessProofs(witness_text.value());
                if (proofs.is_err()) {
                    std::cout << "Ignoring unreadable witness proofs for " << url.getDid() << ": "
                              << errorMessage(proofs.error()) << std::endl;
                }
            }
        }

        auto validated = state.validate();
        if (validated.is_err()) {
            return dp::Result<DIDWebVHState, dp::Error>::err(validated.error());
        }

        if (state.getScid() != url.getScid()) {
            return dp::Result<DIDWebVHState, dp::Error>::err(
                scid_error("DID log SCID (" + state.getScid() + ") does not match " + url.getScid()));
        }

        return dp::Result<DIDWebVHState, dp::Error>::ok(std::move(state));
    }

    dp::Result<ResolvedDID, dp::Error> DIDWebVHResolver::resolve(const std::string &did_url) const {
        auto url = WebVHURL::parseDidUrl(did_url);
        if (url.is_err()) {
            return dp::Result<ResolvedDID, dp::Error>::err(url.error());
        }
        if (url.value().getType() == URLType::WhoIs) {
            return dp::Result<ResolvedDID, dp::Error>::err(
                unsupported_method("whois resolution is not supported: " + did_url));
        }

        auto state = resolveState(url.value());
        if (state.is_err()) {
            return dp::Result<ResolvedDID, dp::Error>::err(state.error());
        }
        const auto &history = state.value();

        auto query = url.value().getQueryParameters();
        dp::Result<const LogEntryState *, dp::Error> selected = history.getLastEntry();
        if (auto it = query.find("versionId"); it != query.end()) {
            selected = history.getLogEntryByVersionId(it->second);
        } else if (auto it = query.find("versionNumber"); it != query.end()) {
            auto number = parseVersionNumber(it->second);
            if (number.is_err()) {
                return dp::Result<ResolvedDID, dp::Error>::err(number.error());
            }
            selected = history.getLogEntryByVersionNumber(number.value());
        } else if (auto it = query.find("versionTime"); it != query.end()) {
            auto time = parseTimestamp(it->second);
            if (time.is_err()) {
                return dp::Result<ResolvedDID, dp::Error>::err(time.error());
            }
            selected = history.getLogEntryAtTime(time.value());
        }

        if (selected.is_err()) {
            return dp::Result<ResolvedDID, dp::Error>::err(selected.error());
        }

        const LogEntryState *entry = selected.value();
        ResolvedDID resolved;
        resolved.document = entry->log_entry.state;
        if (entry->metadata) {
            resolved.metadata = *entry->metadata;
        }
        // Deactivation of the DID applies to every version
        resolved.metadata.deactivated = history.isDeactivated();
        return dp::Result<ResolvedDID, dp::Error>::ok(resolved);
    }

} // namespace didwebvh
