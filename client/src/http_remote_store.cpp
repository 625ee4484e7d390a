#include "dshare/client/http_remote_store.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include "dshare/crypto.hpp"
#include "dshare/protocol.hpp"

namespace dshare::client
{

    namespace
    {
        constexpr std::string_view kDefaultDownloadName = "download.bin";

        struct EasyDeleter
        {
            void operator()(CURL *handle) const noexcept { curl_easy_cleanup(handle); }
        };

        struct MimeDeleter
        {
            void operator()(curl_mime *mime) const noexcept { curl_mime_free(mime); }
        };

        struct HeaderListDeleter
        {
            void operator()(curl_slist *list) const noexcept { curl_slist_free_all(list); }
        };

        std::once_flag &curl_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        CURL *open_easy_handle()
        {
            std::call_once(curl_once_flag(), []()
                           {
                if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
                {
                    throw std::runtime_error("libcurl initialization failed");
                } });
            return curl_easy_init();
        }

        std::size_t collect_body(char *data, std::size_t size, std::size_t count, void *user)
        {
            static_cast<std::string *>(user)->append(data, size * count);
            return size * count;
        }

        std::size_t collect_header(char *data, std::size_t size, std::size_t count, void *user)
        {
            auto &headers = *static_cast<http::Headers *>(user);
            const std::string_view line(data, size * count);
            // An interim reply (100 Continue) is followed by a fresh header block.
            if (line.substr(0, 5) == "HTTP/")
            {
                headers.clear();
            }
            else if (auto header = http::parse_header_line(line))
            {
                headers.push_back(std::move(*header));
            }
            return size * count;
        }

        void check_mime(CURLcode code, const char *what)
        {
            if (code != CURLE_OK)
            {
                throw RemoteError(std::string("Cannot build form ") + what + ": " + curl_easy_strerror(code));
            }
        }

        // One request on its own easy handle. The handle is declared last so it is cleaned up before the
        // header list and form it points at.
        class CurlRequest
        {
        public:
            CurlRequest(const http::Url &base, std::string_view target, const HttpTimeouts &timeouts)
                : url_(base.resolve(target)),
                  request_id_(crypto::random_token(8)),
                  handle_(open_easy_handle())
            {
                if (!handle_)
                {
                    throw RemoteError("Cannot initialize a libcurl handle");
                }
                const auto stall_seconds = std::max<long>(
                    1, static_cast<long>(std::chrono::duration_cast<std::chrono::seconds>(timeouts.io).count()));

                auto *handle = handle_.get();
                curl_easy_setopt(handle, CURLOPT_URL, url_.c_str());
                curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
                curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeouts.connect.count()));
                curl_easy_setopt(handle, CURLOPT_LOW_SPEED_LIMIT, 1L);
                curl_easy_setopt(handle, CURLOPT_LOW_SPEED_TIME, stall_seconds);
                curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, error_.data());
                curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, collect_body);
                curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response_.body);
                curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, collect_header);
                curl_easy_setopt(handle, CURLOPT_HEADERDATA, &response_.headers);

                add_header("X-Request-Id: " + request_id_);
                // Chunk bodies go out without waiting for a 100 Continue.
                add_header("Expect:");
            }

            const std::string &request_id() const { return request_id_; }

            void json_body(std::string body)
            {
                payload_ = std::move(body);
                add_header("Content-Type: application/json");
                add_header("Accept: application/json");
                curl_easy_setopt(handle_.get(), CURLOPT_POSTFIELDS, payload_.c_str());
                curl_easy_setopt(handle_.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(payload_.size()));
            }

            void form_body(const http::Form &form)
            {
                mime_.reset(curl_mime_init(handle_.get()));
                if (!mime_)
                {
                    throw RemoteError("Cannot allocate a form body");
                }
                for (const auto &part : form)
                {
                    auto *field = curl_mime_addpart(mime_.get());
                    if (field == nullptr)
                    {
                        throw RemoteError("Cannot allocate a form part");
                    }
                    check_mime(curl_mime_name(field, part.name.c_str()), "field name");
                    if (part.filename)
                    {
                        check_mime(curl_mime_data(field, reinterpret_cast<const char *>(part.data.data()),
                                                  part.data.size()),
                                   "file data");
                        check_mime(curl_mime_filename(field, http::form_safe_filename(*part.filename).c_str()),
                                   "filename");
                        const auto &type = part.content_type.empty() ? std::string("application/octet-stream")
                                                                     : part.content_type;
                        check_mime(curl_mime_type(field, type.c_str()), "content type");
                    }
                    else
                    {
                        check_mime(curl_mime_data(field, part.value.data(), part.value.size()), "field value");
                    }
                }
                curl_easy_setopt(handle_.get(), CURLOPT_MIMEPOST, mime_.get());
            }

            http::Response perform(const char *method)
            {
                curl_easy_setopt(handle_.get(), CURLOPT_HTTPHEADER, headers_.get());
                const auto code = curl_easy_perform(handle_.get());
                if (code != CURLE_OK)
                {
                    const std::string detail = error_[0] != '\0' ? std::string(error_.data()) : curl_easy_strerror(code);
                    throw RemoteError(std::string(method) + " " + url_ + " failed: " + detail);
                }
                long status = 0;
                curl_easy_getinfo(handle_.get(), CURLINFO_RESPONSE_CODE, &status);
                response_.status = static_cast<int>(status);
                return std::move(response_);
            }

        private:
            void add_header(const std::string &line)
            {
                auto *list = curl_slist_append(headers_.get(), line.c_str());
                if (list == nullptr)
                {
                    throw RemoteError("Cannot allocate request headers");
                }
                if (!headers_)
                {
                    headers_.reset(list);
                }
            }

            std::string url_;
            std::string request_id_;
            std::unique_ptr<curl_slist, HeaderListDeleter> headers_;
            std::unique_ptr<curl_mime, MimeDeleter> mime_;
            std::string payload_;
            http::Response response_;
            std::array<char, CURL_ERROR_SIZE> error_{};
            std::unique_ptr<CURL, EasyDeleter> handle_;
        };

        http::Response run(CurlRequest &request, const char *method, std::string_view target, Logger &logger)
        {
            auto response = request.perform(method);
            logger.log("http", method, " ", target, " [", request.request_id(), "] -> ", response.status);
            return response;
        }
    } // namespace

    HttpRemoteStore::HttpRemoteStore(http::Url base, HttpTimeouts timeouts, Logger logger)
        : base_(std::move(base)),
          timeouts_(timeouts),
          logger_(std::move(logger)) {}

    http::Response HttpRemoteStore::get(std::string_view target)
    {
        CurlRequest request(base_, target, timeouts_);
        return run(request, "GET", target, logger_);
    }

    http::Response HttpRemoteStore::post_json(std::string_view target, const nlohmann::json &body)
    {
        CurlRequest request(base_, target, timeouts_);
        request.json_body(body.dump());
        return run(request, "POST", target, logger_);
    }

    http::Response HttpRemoteStore::post_form(std::string_view target, const http::Form &form)
    {
        CurlRequest request(base_, target, timeouts_);
        request.form_body(form);
        return run(request, "POST", target, logger_);
    }

    nlohmann::json HttpRemoteStore::parse_body(const http::Response &response)
    {
        nlohmann::json json;
        try
        {
            json = nlohmann::json::parse(response.body);
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            throw RemoteError(std::string("Response is not JSON: ") + ex.what(), response.status);
        }
        if (!json.is_object())
        {
            throw RemoteError("Response is not a JSON object", response.status);
        }
        return json;
    }

    protocol::UploadStartResponse HttpRemoteStore::start_upload(const protocol::UploadStartRequest &request)
    {
        const auto response = post_json(protocol::kUploadStartPath, nlohmann::json(request));
        if (!response.ok())
        {
            throw RemoteError("upload start rejected with HTTP " + std::to_string(response.status),
                              response.status);
        }
        try
        {
            return parse_body(response).get<protocol::UploadStartResponse>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw RemoteError(std::string("Malformed upload start response: ") + ex.what(), response.status);
        }
    }

    void HttpRemoteStore::upload_chunk(const protocol::UploadChunkRequest &request)
    {
        const http::Form form{
            {.name = "upload_id", .value = request.upload_id},
            {.name = "index", .value = std::to_string(request.index)},
            {.name = "chunk", .filename = request.filename, .content_type = "application/octet-stream",
             .data = request.data},
        };
        const auto response = post_form(protocol::kUploadChunkPath, form);
        if (!response.ok())
        {
            throw RemoteError("chunk " + std::to_string(request.index) + " rejected with HTTP " +
                                  std::to_string(response.status),
                              response.status);
        }
    }

    CompletionReply HttpRemoteStore::complete_upload(const protocol::UploadCompleteRequest &request)
    {
        const auto response = post_json(protocol::kUploadCompletePath, nlohmann::json(request));
        CompletionReply reply{.http_status = response.status};
        try
        {
            reply.body = parse_body(response).get<protocol::UploadCompleteResponse>();
        }
        catch (const std::exception &ex)
        {
            logger_.log("http", "completion body ignored: ", ex.what());
        }
        return reply;
    }

    void HttpRemoteStore::share_text(const std::string &text)
    {
        const http::Form form{{.name = "text", .value = text}};
        const auto response = post_form(protocol::kShareUploadPath, form);
        if (!response.ok())
        {
            throw RemoteError("text share rejected with HTTP " + std::to_string(response.status), response.status);
        }
    }

    std::string HttpRemoteStore::fetch_shared_text()
    {
        const auto response = get(protocol::kShareTextPath);
        if (!response.ok())
        {
            throw RemoteError("shared text rejected with HTTP " + std::to_string(response.status), response.status);
        }
        try
        {
            return parse_body(response).get<protocol::SharedText>().text;
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw RemoteError(std::string("Malformed shared text response: ") + ex.what(), response.status);
        }
    }

    void HttpRemoteStore::clear_share()
    {
        const auto response = post_json(protocol::kShareClearPath, nlohmann::json::object());
        if (!response.ok())
        {
            throw RemoteError("share clear rejected with HTTP " + std::to_string(response.status), response.status);
        }
        const auto reply = parse_body(response).get<protocol::StatusReply>();
        if (!reply.ok())
        {
            throw RemoteError("share clear answered status '" + reply.status + "'", response.status);
        }
    }

    std::filesystem::path HttpRemoteStore::download_shared(const std::filesystem::path &directory)
    {
        const auto response = get(protocol::kShareDownloadPath);
        if (!response.ok())
        {
            throw RemoteError("download rejected with HTTP " + std::to_string(response.status), response.status);
        }
        if (response.body.empty())
        {
            throw RemoteError("download returned an empty body", response.status);
        }
        const auto content_type = response.header("Content-Type").value_or("");
        if (content_type.find("application/json") != std::string::npos)
        {
            const auto json = parse_body(response);
            if (json.value("status", std::string{}) == "empty")
            {
                throw RemoteError("Nothing is shared right now", response.status);
            }
        }

        std::optional<std::string> name;
        if (const auto disposition = response.header("Content-Disposition"))
        {
            name = http::filename_from_content_disposition(*disposition);
        }
        const auto target = directory / name.value_or(std::string(kDefaultDownloadName));

        std::error_code ec;
        std::filesystem::create_directories(directory, ec);
        if (ec)
        {
            throw std::runtime_error("Cannot create " + directory.string() + ": " + ec.message());
        }
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw std::runtime_error("Cannot write " + target.string());
        }
        out.write(response.body.data(), static_cast<std::streamsize>(response.body.size()));
        if (!out)
        {
            throw std::runtime_error("Write failed for " + target.string());
        }
        logger_.log("http", "saved shared file to ", target.string());
        return target;
    }

} // namespace dshare::client
