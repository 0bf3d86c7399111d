#pragma once

#include <cstdint>
#include <datapod/datapod.hpp>
#include <keylock/keylock.hpp>
#include <string>
#include <vector>

namespace didwebvh {

    // ===========================================
    // base58btc / multibase
    // ===========================================

    constexpr const char *BASE58_ALPHABET = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

    /// multibase prefix for base58btc
    constexpr char MULTIBASE_BASE58BTC = 'z';

    /// multihash header for sha2-256 (code 0x12, length 32)
    constexpr uint8_t MULTIHASH_SHA2_256 = 0x12;
    constexpr uint8_t MULTIHASH_SHA2_256_LENGTH = 0x20;

    /// Base58 encoding (Bitcoin alphabet)
    inline std::string base58Encode(const std::vector<uint8_t> &input) {
        size_t leading_zeros = 0;
        for (auto b : input) {
            if (b == 0)
                leading_zeros++;
            else
                break;
        }

        std::vector<uint8_t> digits;
        for (uint8_t byte : input) {
            int carry = byte;
            for (auto &digit : digits) {
                carry += digit * 256;
                digit = carry % 58;
                carry /= 58;
            }
            while (carry > 0) {
                digits.push_back(carry % 58);
                carry /= 58;
            }
        }

        std::string result(leading_zeros, '1');
        for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
            result += BASE58_ALPHABET[*it];
        }
        return result;
    }

    /// Base58 decoding (Bitcoin alphabet)
    inline dp::Result<std::vector<uint8_t>, dp::Error> base58Decode(const std::string &input) {
        static const std::string alphabet(BASE58_ALPHABET);

        size_t leading_ones = 0;
        for (char c : input) {
            if (c == '1')
                leading_ones++;
            else
                break;
        }

        std::vector<uint8_t> bytes;
        for (char c : input) {
            auto index = alphabet.find(c);
            if (index == std::string::npos) {
                return dp::Result<std::vector<uint8_t>, dp::Error>::err(
                    dp::Error::invalid_argument(dp::String((std::string("Invalid base58 character '") + c + "'").c_str())));
            }
            int carry = static_cast<int>(index);
            for (auto &byte : bytes) {
                carry += byte * 58;
                byte = static_cast<uint8_t>(carry & 0xff);
                carry >>= 8;
            }
            while (carry > 0) {
                bytes.push_back(static_cast<uint8_t>(carry & 0xff));
                carry >>= 8;
            }
        }

        std::vector<uint8_t> result(leading_ones, 0);
        result.insert(result.end(), bytes.rbegin(), bytes.rend());
        return dp::Result<std::vector<uint8_t>, dp::Error>::ok(result);
    }

    /// Encode bytes as a base58btc multibase string ("z...")
    inline std::string multibaseEncode(const std::vector<uint8_t> &input) {
        return std::string(1, MULTIBASE_BASE58BTC) + base58Encode(input);
    }

    /// Decode a base58btc multibase string; other bases are rejected
    inline dp::Result<std::vector<uint8_t>, dp::Error> multibaseDecode(const std::string &input) {
        if (input.empty() || input[0] != MULTIBASE_BASE58BTC) {
            return dp::Result<std::vector<uint8_t>, dp::Error>::err(
                dp::Error::invalid_argument(dp::String(("Unsupported multibase encoding: '" + input + "'").c_str())));
        }
        return base58Decode(input.substr(1));
    }

    // ===========================================
    // Hashing
    // ===========================================

    /// SHA-256 digest via keylock
    inline dp::Result<std::vector<uint8_t>, dp::Error> sha256(const std::vector<uint8_t> &data) {
        keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
        auto result = crypto.hash(data);
        if (!result.success) {
            return dp::Result<std::vector<uint8_t>, dp::Error>::err(
                dp::Error::io_error(dp::String(result.error_message.c_str())));
        }
        return dp::Result<std::vector<uint8_t>, dp::Error>::ok(result.data);
    }

    inline dp::Result<std::vector<uint8_t>, dp::Error> sha256(const std::string &data) {
        return sha256(std::vector<uint8_t>(data.begin(), data.end()));
    }

    /// sha2-256 multihash: 0x12 0x20 || digest
    inline dp::Result<std::vector<uint8_t>, dp::Error> multihashSha256(const std::string &data) {
        auto digest = sha256(data);
        if (digest.is_err()) {
            return digest;
        }
        std::vector<uint8_t> out{MULTIHASH_SHA2_256, MULTIHASH_SHA2_256_LENGTH};
        const auto &bytes = digest.value();
        out.insert(out.end(), bytes.begin(), bytes.end());
        return dp::Result<std::vector<uint8_t>, dp::Error>::ok(out);
    }

    /// base58btc multibase of the sha2-256 multihash of data
    /// Used for entry hashes, the SCID and pre-rotation key commitments
    inline dp::Result<std::string, dp::Error> hashToMultibase(const std::string &data) {
        auto mh = multihashSha256(data);
        if (mh.is_err()) {
            return dp::Result<std::string, dp::Error>::err(mh.error());
        }
        return dp::Result<std::string, dp::Error>::ok(multibaseEncode(mh.value()));
    }

} // namespace didwebvh
