/**
 * @file form_data.cpp
 */
#include "dagcheck/service/form_data.hpp"

#include <cctype>

namespace dagcheck
{

namespace
{

int hex_value(char c)
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f')
    {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F')
    {
        return c - 'A' + 10;
    }
    return -1;
}

std::string to_lower(std::string_view s)
{
    std::string out(s);
    for (auto& c : out)
    {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

/// Value of a `key=value` parameter in a header, unquoted; empty if absent.
std::string header_parameter(std::string_view header, std::string_view key)
{
    std::string lowered = to_lower(header);
    std::string needle = std::string(key) + "=";
    size_t pos = 0;
    for (;;)
    {
        pos = lowered.find(needle, pos);
        if (pos == std::string::npos)
        {
            return {};
        }
        // Require a parameter boundary, so "name=" does not match "filename="
        if (pos == 0 || lowered[pos - 1] == ';' || lowered[pos - 1] == ' ' ||
            lowered[pos - 1] == '\t')
        {
            break;
        }
        pos += needle.size();
    }

    size_t start = pos + needle.size();
    if (start < header.size() && header[start] == '"')
    {
        size_t end = header.find('"', start + 1);
        if (end == std::string_view::npos)
        {
            return {};
        }
        return std::string(header.substr(start + 1, end - start - 1));
    }
    size_t end = header.find(';', start);
    std::string_view value = header.substr(start, end == std::string_view::npos ? end : end - start);
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t'))
    {
        value.remove_suffix(1);
    }
    return std::string(value);
}

/// Find the Content-Disposition line in a part's header block.
std::string_view disposition_line(std::string_view headers)
{
    size_t start = 0;
    while (start < headers.size())
    {
        size_t end = headers.find("\r\n", start);
        if (end == std::string_view::npos)
        {
            end = headers.size();
        }
        std::string_view line = headers.substr(start, end - start);
        const std::string_view prefix = "content-disposition:";
        if (line.size() >= prefix.size() && to_lower(line.substr(0, prefix.size())) == prefix)
        {
            return line.substr(prefix.size());
        }
        start = end + 2;
    }
    return {};
}

} // namespace

std::string url_decode(std::string_view encoded)
{
    std::string out;
    out.reserve(encoded.size());
    for (size_t i = 0; i < encoded.size(); ++i)
    {
        char c = encoded[i];
        if (c == '+')
        {
            out.push_back(' ');
        }
        else if (c == '%' && i + 2 < encoded.size())
        {
            int hi = hex_value(encoded[i + 1]);
            int lo = hex_value(encoded[i + 2]);
            if (hi < 0 || lo < 0)
            {
                out.push_back(c);
                continue;
            }
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        }
        else
        {
            out.push_back(c);
        }
    }
    return out;
}

FormData FormData::parse(std::string_view encoded)
{
    FormData form;
    size_t start = 0;
    while (start < encoded.size())
    {
        size_t amp = encoded.find('&', start);
        if (amp == std::string_view::npos)
        {
            amp = encoded.size();
        }
        std::string_view pair = encoded.substr(start, amp - start);
        start = amp + 1;
        if (pair.empty())
        {
            continue;
        }

        size_t eq = pair.find('=');
        std::string key = url_decode(pair.substr(0, eq));
        std::string value = eq == std::string_view::npos ? std::string() : url_decode(pair.substr(eq + 1));
        form.m_fields[std::move(key)] = std::move(value);
    }
    return form;
}

FormData FormData::parse_multipart(std::string_view body, std::string_view boundary)
{
    if (boundary.empty())
    {
        throw FormDataError("Multipart boundary is empty");
    }
    const std::string delimiter = "--" + std::string(boundary);
    const std::string part_end = "\r\n" + delimiter;

    size_t pos = body.find(delimiter);
    if (pos == std::string_view::npos)
    {
        throw FormDataError("Multipart body does not contain its boundary");
    }

    FormData form;
    for (;;)
    {
        pos += delimiter.size();
        if (body.compare(pos, 2, "--") == 0)
        {
            break;
        }
        if (body.compare(pos, 2, "\r\n") != 0)
        {
            throw FormDataError("Malformed multipart boundary line");
        }
        pos += 2;

        size_t headers_end = body.find("\r\n\r\n", pos);
        if (headers_end == std::string_view::npos)
        {
            throw FormDataError("Multipart part has no header terminator");
        }
        std::string_view headers = body.substr(pos, headers_end - pos);
        size_t content_start = headers_end + 4;

        size_t content_end = body.find(part_end, content_start);
        if (content_end == std::string_view::npos)
        {
            throw FormDataError("Multipart part is not terminated by the boundary");
        }

        std::string name = header_parameter(disposition_line(headers), "name");
        if (name.empty())
        {
            throw FormDataError("Multipart part has no form-data name");
        }
        form.m_fields[std::move(name)] =
            std::string(body.substr(content_start, content_end - content_start));

        pos = content_end + 2;
    }
    return form;
}

std::optional<std::string> FormData::multipart_boundary(std::string_view content_type)
{
    std::string boundary = header_parameter(content_type, "boundary");
    if (boundary.empty())
    {
        return std::nullopt;
    }
    return boundary;
}

std::optional<std::string> FormData::get(const std::string& name) const
{
    auto it = m_fields.find(name);
    if (it == m_fields.end())
    {
        return std::nullopt;
    }
    return it->second;
}

} // namespace dagcheck
