#pragma once

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <datapod/datapod.hpp>
#include <didwebvh/common/error.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace didwebvh::jcs {

    namespace detail {

        /// UTF-8 to UTF-16 code units, object keys are ordered on these
        inline std::u16string toUtf16(const std::string &s) {
            std::u16string out;
            size_t i = 0;
            while (i < s.size()) {
                unsigned char c = static_cast<unsigned char>(s[i]);
                uint32_t cp = 0;
                size_t extra = 0;
                if (c < 0x80) {
                    cp = c;
                } else if ((c >> 5) == 0x6) {
                    cp = c & 0x1f;
                    extra = 1;
                } else if ((c >> 4) == 0xe) {
                    cp = c & 0x0f;
                    extra = 2;
                } else {
                    cp = c & 0x07;
                    extra = 3;
                }
                for (size_t k = 1; k <= extra && i + k < s.size(); ++k) {
                    cp = (cp << 6) | (static_cast<unsigned char>(s[i + k]) & 0x3f);
                }
                i += extra + 1;
                if (cp >= 0x10000) {
                    cp -= 0x10000;
                    out.push_back(static_cast<char16_t>(0xd800 + (cp >> 10)));
                    out.push_back(static_cast<char16_t>(0xdc00 + (cp & 0x3ff)));
                } else {
                    out.push_back(static_cast<char16_t>(cp));
                }
            }
            return out;
        }

        /// ECMAScript Number::toString of a finite double
        /// Shortest round-trip digits, plain decimal for 1e-6 <= |d| < 1e21, otherwise e+N / e-N
        inline bool writeNumber(const nlohmann::json &value, std::string &out) {
            if (value.is_number_integer()) {
                out += value.dump();
                return true;
            }
            double d = value.get<double>();
            if (!std::isfinite(d)) {
                return false;
            }
            if (d == 0.0) {
                out += "0";
                return true;
            }

            char buffer[64];
            auto [end, ec] =
                std::to_chars(buffer, buffer + sizeof(buffer), std::fabs(d), std::chars_format::scientific);
            if (ec != std::errc()) {
                return false;
            }
            std::string scientific(buffer, end); // d[.ddd]e(+|-)NN
            auto e_pos = scientific.find('e');
            std::string digits = scientific.substr(0, e_pos);
            digits.erase(std::remove(digits.begin(), digits.end(), '.'), digits.end());
            int k = static_cast<int>(digits.size());
            int n = std::atoi(scientific.c_str() + e_pos + 1) + 1;

            if (d < 0) {
                out += '-';
            }
            if (k <= n && n <= 21) {
                out += digits;
                out.append(static_cast<size_t>(n - k), '0');
            } else if (0 < n && n <= 21) {
                out += digits.substr(0, static_cast<size_t>(n));
                out += '.';
                out += digits.substr(static_cast<size_t>(n));
            } else if (-6 < n && n <= 0) {
                out += "0.";
                out.append(static_cast<size_t>(-n), '0');
                out += digits;
            } else {
                out += digits[0];
                if (k > 1) {
                    out += '.';
                    out += digits.substr(1);
                }
                out += n - 1 < 0 ? "e-" : "e+";
                out += std::to_string(std::abs(n - 1));
            }
            return true;
        }

        inline bool write(const nlohmann::json &value, std::string &out) {
            switch (value.type()) {
            case nlohmann::json::value_t::object: {
                std::vector<std::pair<std::u16string, nlohmann::json::const_iterator>> members;
                members.reserve(value.size());
                for (auto it = value.cbegin(); it != value.cend(); ++it) {
                    members.emplace_back(toUtf16(it.key()), it);
                }
                std::sort(members.begin(), members.end(),
                          [](const auto &a, const auto &b) { return a.first < b.first; });

                out += '{';
                bool first = true;
                for (const auto &[_, it] : members) {
                    if (!first) {
                        out += ',';
                    }
                    first = false;
                    out += nlohmann::json(it.key()).dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
                    out += ':';
                    if (!write(it.value(), out)) {
                        return false;
                    }
                }
                out += '}';
                return true;
            }
            case nlohmann::json::value_t::array: {
                out += '[';
                bool first = true;
                for (const auto &element : value) {
                    if (!first) {
                        out += ',';
                    }
                    first = false;
                    if (!write(element, out)) {
                        return false;
                    }
                }
                out += ']';
                return true;
            }
            case nlohmann::json::value_t::number_integer:
            case nlohmann::json::value_t::number_unsigned:
            case nlohmann::json::value_t::number_float:
                return writeNumber(value, out);
            case nlohmann::json::value_t::discarded:
            case nlohmann::json::value_t::binary:
                return false;
            default:
                out += value.dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
                return true;
            }
        }

    } // namespace detail

    /// RFC 8785 JSON Canonicalization Scheme
    /// Object members sorted by UTF-16 code units, no whitespace, minimal escaping
    inline dp::Result<std::string, dp::Error> canonicalize(const nlohmann::json &value) {
        std::string out;
        try {
            if (!detail::write(value, out)) {
                return dp::Result<std::string, dp::Error>::err(
                    serialization_failed("JSON value cannot be canonicalized"));
            }
        } catch (const nlohmann::json::exception &e) {
            return dp::Result<std::string, dp::Error>::err(
                serialization_failed(std::string("JSON canonicalization failed: ") + e.what()));
        }
        return dp::Result<std::string, dp::Error>::ok(out);
    }

} // namespace didwebvh::jcs
