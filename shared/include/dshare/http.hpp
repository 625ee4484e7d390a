/**
 * DShare - HTTP addressing, response and form-data helpers shared by the transport.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dshare::http
{

    using Headers = std::vector<std::pair<std::string, std::string>>;

    struct Url
    {
        std::string host;
        std::uint16_t port{80};
        std::string base_path;

        // Absolute URL of `target` under this base, e.g. "http://host:8000/prefix/api/upload/start/".
        std::string resolve(std::string_view target) const;
    };

    // Accepts "http://host[:port][/prefix]". Throws std::invalid_argument otherwise.
    Url parse_url(std::string_view text);

    struct Response
    {
        int status{};
        Headers headers;
        std::string body;

        bool ok() const noexcept { return status >= 200 && status < 300; }
        std::optional<std::string> header(std::string_view name) const;
    };

    // Splits one raw "Name: value" header line. Status lines, blank lines and lines without a colon give nullopt.
    std::optional<std::pair<std::string, std::string>> parse_header_line(std::string_view line);

    // One multipart/form-data part. A part with a filename is a file part and sends `data`; otherwise `value`
    // is sent as a plain field. `data` is not owned.
    struct FormPart
    {
        std::string name;
        std::string value;
        std::optional<std::string> filename{};
        std::string content_type{};
        std::span<const std::byte> data{};
    };

    using Form = std::vector<FormPart>;

    // Replaces the characters that would break out of a quoted form-data filename parameter.
    std::string form_safe_filename(std::string_view name);

    std::optional<std::string> filename_from_content_disposition(std::string_view value);

} // namespace dshare::http
