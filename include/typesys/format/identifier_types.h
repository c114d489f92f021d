/**
 * @file identifier_types.h
 * @brief Native identifier and resource values: Uuid, Url, EmailAddress
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace typesys {
namespace format {

/**
 * @brief 128-bit universally unique identifier
 */
class Uuid {
private:
    std::array<uint8_t, 16> bytes_;

    explicit Uuid(const std::array<uint8_t, 16>& bytes) : bytes_(bytes) {}

public:
    static Uuid fromBytes(const std::array<uint8_t, 16>& bytes) {
        return Uuid(bytes);
    }

    /**
     * @brief Parse the hyphenated 8-4-4-4-12 hex form (either case)
     *
     * Version and variant nibbles are not checked here.
     *
     * @return Uuid, or std::nullopt if the layout is wrong
     */
    static std::optional<Uuid> fromString(const std::string& text);

    /**
     * @brief Generate a random (version 4, RFC 4122 variant) UUID
     */
    static Uuid generateV4();

    [[nodiscard]] const std::array<uint8_t, 16>& getBytes() const noexcept { return bytes_; }

    /// @brief Version nibble (high nibble of byte 6)
    [[nodiscard]] int version() const noexcept { return bytes_[6] >> 4; }

    /**
     * @brief Canonical form
     * @return Lowercase "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx"
     */
    [[nodiscard]] std::string toString() const;

    bool operator==(const Uuid& other) const noexcept { return bytes_ == other.bytes_; }
    bool operator!=(const Uuid& other) const noexcept { return !(*this == other); }
    bool operator<(const Uuid& other) const noexcept { return bytes_ < other.bytes_; }
};

/**
 * @brief URL split into its six generic components
 *
 * scheme://netloc/path;params?query#fragment
 *
 * Parsing never fails: anything that is not recognised as a scheme or
 * network location ends up in the path. Reassembly with toString() yields
 * an equivalent URL (the scheme is lowercased).
 */
class Url {
private:
    std::string scheme_;
    std::string netloc_;
    std::string path_;
    std::string params_;
    std::string query_;
    std::string fragment_;

    Url() = default;

public:
    /**
     * @brief Split a URL string into components
     */
    static Url parse(const std::string& url);

    [[nodiscard]] const std::string& getScheme() const noexcept { return scheme_; }
    [[nodiscard]] const std::string& getNetloc() const noexcept { return netloc_; }
    [[nodiscard]] const std::string& getPath() const noexcept { return path_; }
    [[nodiscard]] const std::string& getParams() const noexcept { return params_; }
    [[nodiscard]] const std::string& getQuery() const noexcept { return query_; }
    [[nodiscard]] const std::string& getFragment() const noexcept { return fragment_; }

    /**
     * @brief Host part of netloc, lowercased, without userinfo, port or IPv6 brackets
     * @return Hostname, or std::nullopt if netloc is empty
     */
    [[nodiscard]] std::optional<std::string> hostname() const;

    /**
     * @brief Port part of netloc
     * @return Port number, or std::nullopt if absent or not a number in 0..65535
     */
    [[nodiscard]] std::optional<int> port() const;

    /**
     * @brief Reassemble the full URL
     */
    [[nodiscard]] std::string toString() const;

    bool operator==(const Url& other) const noexcept {
        return scheme_ == other.scheme_ && netloc_ == other.netloc_ &&
               path_ == other.path_ && params_ == other.params_ &&
               query_ == other.query_ && fragment_ == other.fragment_;
    }

    bool operator!=(const Url& other) const noexcept {
        return !(*this == other);
    }
};

/**
 * @brief Email address that passed EmailFormat validation
 *
 * Holds the validated string unchanged; there is no structural decomposition.
 */
class EmailAddress {
private:
    std::string value_;

    explicit EmailAddress(std::string value) : value_(std::move(value)) {}

public:
    static EmailAddress of(std::string value) {
        return EmailAddress(std::move(value));
    }

    [[nodiscard]] const std::string& getValue() const noexcept { return value_; }

    bool operator==(const EmailAddress& other) const noexcept { return value_ == other.value_; }
    bool operator!=(const EmailAddress& other) const noexcept { return !(*this == other); }
};

} // namespace format
} // namespace typesys
