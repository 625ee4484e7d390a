#include "dshare/http.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

namespace dshare::http
{

    namespace
    {
        bool iequals(std::string_view lhs, std::string_view rhs)
        {
            return lhs.size() == rhs.size() &&
                   std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b)
                              { return std::tolower(static_cast<unsigned char>(a)) ==
                                       std::tolower(static_cast<unsigned char>(b)); });
        }

        std::string_view trim(std::string_view value)
        {
            while (!value.empty() && (value.front() == ' ' || value.front() == '\t'))
            {
                value.remove_prefix(1);
            }
            while (!value.empty() && (value.back() == ' ' || value.back() == '\t' || value.back() == '\r' ||
                                      value.back() == '\n'))
            {
                value.remove_suffix(1);
            }
            return value;
        }

        std::uint64_t parse_number(std::string_view text, int base, const char *what)
        {
            text = trim(text);
            std::uint64_t value = 0;
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, base);
            if (ec != std::errc{} || ptr == text.data())
            {
                throw std::runtime_error(std::string("Malformed ") + what + ": '" + std::string(text) + "'");
            }
            return value;
        }

    } // namespace

    Url parse_url(std::string_view text)
    {
        constexpr std::string_view kScheme = "http://";
        if (text.substr(0, kScheme.size()) != kScheme)
        {
            throw std::invalid_argument("Only http:// URLs are supported: " + std::string(text));
        }
        text.remove_prefix(kScheme.size());

        Url url;
        const auto slash = text.find('/');
        auto authority = text.substr(0, slash);
        if (slash != std::string_view::npos)
        {
            auto path = text.substr(slash);
            while (!path.empty() && path.back() == '/')
            {
                path.remove_suffix(1);
            }
            url.base_path = std::string(path);
        }

        const auto colon = authority.rfind(':');
        if (colon != std::string_view::npos)
        {
            const auto port = parse_number(authority.substr(colon + 1), 10, "port");
            if (port == 0 || port > 65535)
            {
                throw std::invalid_argument("Port out of range: " + std::string(authority.substr(colon + 1)));
            }
            url.port = static_cast<std::uint16_t>(port);
            authority = authority.substr(0, colon);
        }
        if (authority.empty())
        {
            throw std::invalid_argument("URL has no host");
        }
        url.host = std::string(authority);
        return url;
    }

    std::string Url::resolve(std::string_view target) const
    {
        std::string out = "http://" + host;
        if (port != 80)
        {
            out.append(":").append(std::to_string(port));
        }
        out.append(base_path).append(target);
        return out;
    }

    std::optional<std::string> Response::header(std::string_view name) const
    {
        for (const auto &[key, value] : headers)
        {
            if (iequals(key, name))
            {
                return value;
            }
        }
        return std::nullopt;
    }

    std::optional<std::pair<std::string, std::string>> parse_header_line(std::string_view line)
    {
        line = trim(line);
        if (line.empty() || line.substr(0, 5) == "HTTP/")
        {
            return std::nullopt;
        }
        const auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0)
        {
            return std::nullopt;
        }
        return std::make_pair(std::string(trim(line.substr(0, colon))), std::string(trim(line.substr(colon + 1))));
    }

    std::string form_safe_filename(std::string_view name)
    {
        std::string safe(name);
        for (auto &ch : safe)
        {
            if (ch == '"' || ch == '\r' || ch == '\n' || ch == '\\')
            {
                ch = '_';
            }
        }
        if (safe.empty())
        {
            safe = "upload.bin";
        }
        return safe;
    }

    std::optional<std::string> filename_from_content_disposition(std::string_view value)
    {
        constexpr std::string_view kKey = "filename=";
        const auto pos = value.find(kKey);
        if (pos == std::string_view::npos)
        {
            return std::nullopt;
        }
        auto rest = trim(value.substr(pos + kKey.size()));
        std::string_view name;
        if (!rest.empty() && rest.front() == '"')
        {
            const auto close = rest.find('"', 1);
            name = rest.substr(1, close == std::string_view::npos ? std::string_view::npos : close - 1);
        }
        else
        {
            name = trim(rest.substr(0, rest.find(';')));
        }
        if (name.empty())
        {
            return std::nullopt;
        }
        // Never let a server-supplied name escape the target directory.
        const auto slash = name.find_last_of("/\\");
        if (slash != std::string_view::npos)
        {
            name = name.substr(slash + 1);
        }
        if (name.empty() || name == "." || name == "..")
        {
            return std::nullopt;
        }
        return std::string(name);
    }

} // namespace dshare::http
