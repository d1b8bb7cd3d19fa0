/**
 * @file form_data.hpp
 */
#pragma once
#include "dagcheck/common/common.hpp"

#include <string_view>

namespace dagcheck
{

/**
 * @brief Exception thrown when a form body cannot be decoded.
 */
class FormDataError : public std::runtime_error
{
public:
    explicit FormDataError(const std::string& msg)
        : std::runtime_error(msg)
    {}
};

/**
 * @brief Decoded form fields.
 *
 * @details
 * Built from either `application/x-www-form-urlencoded` text (a body or a
 * query string) or a `multipart/form-data` body. A field given more than once
 * keeps its last value.
 *
 * @par Urlencoded
 * Keys and values are percent-decoded and `+` becomes a space. Invalid
 * percent escapes are kept as written.
 *
 * @par Multipart
 * Each part must carry a `Content-Disposition: form-data; name="..."` header.
 * Part contents are taken verbatim; file parts are read like plain fields.
 */
class FormData
{
public:
    FormData() = default;

    /**
     * @brief Parse an urlencoded string such as a request body or query string.
     */
    static FormData parse(std::string_view encoded);

    /**
     * @brief Parse a `multipart/form-data` body.
     * @param body The request body.
     * @param boundary The boundary from the Content-Type header, without `--`.
     * @throw FormDataError if the body does not follow the multipart layout.
     */
    static FormData parse_multipart(std::string_view body, std::string_view boundary);

    /**
     * @brief Extract the `boundary` parameter of a multipart Content-Type.
     * @return The boundary, or `std::nullopt` if absent or empty.
     */
    static std::optional<std::string> multipart_boundary(std::string_view content_type);

    /**
     * @brief Get the value of a field, if present.
     */
    std::optional<std::string> get(const std::string& name) const;

    /**
     * @brief Number of distinct fields.
     */
    size_t size() const noexcept
    {
        return m_fields.size();
    }

    bool empty() const noexcept
    {
        return m_fields.empty();
    }

private:
    std::unordered_map<std::string, std::string> m_fields;
};

/**
 * @brief Percent-decode one urlencoded component.
 */
std::string url_decode(std::string_view encoded);

} // namespace dagcheck
