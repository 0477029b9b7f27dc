#include "lore/storage/object_store.hpp"
#include "lore/log.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <mutex>
#include <sstream>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

namespace lore {
namespace storage {

namespace detail {

std::string url_encode(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char ch : value) {
        const bool unreserved = (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') ||
                                (ch >= '0' && ch <= '9') ||
                                ch == '-' || ch == '.' || ch == '_' || ch == '~';
        if (unreserved) {
            out.push_back(static_cast<char>(ch));
        } else {
            out.push_back('%');
            out.push_back(hex[ch >> 4]);
            out.push_back(hex[ch & 0x0F]);
        }
    }
    return out;
}

std::string normalize_endpoint(const std::string& endpoint) {
    if (endpoint.empty()) {
        return "https://storage.googleapis.com";
    }
    std::string url = endpoint;
    if (url.find("://") == std::string::npos) {
        url = "http://" + url;
    }
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

} // namespace detail

namespace {

std::once_flag curl_init_flag;

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

struct HttpResponse {
    long status = 0;
    std::string body;
};

std::string openssl_error() {
    char reason[256];
    ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
    return reason;
}

std::string base64url(const std::string& input) {
    std::string out(4 * ((input.size() + 2) / 3) + 1, '\0');
    const int written = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(&out[0]),
        reinterpret_cast<const unsigned char*>(input.data()),
        static_cast<int>(input.size()));
    out.resize(static_cast<size_t>(written));
    for (auto& ch : out) {
        if (ch == '+') ch = '-';
        else if (ch == '/') ch = '_';
    }
    out.erase(std::remove(out.begin(), out.end(), '='), out.end());
    return out;
}

Expected<std::string> sign_rs256(const std::string& pem, const std::string& payload) {
    std::unique_ptr<BIO, decltype(&BIO_free)> bio(
        BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), &BIO_free);
    if (!bio) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "Failed to read private key", openssl_error()});
    }
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key(
        PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr), &EVP_PKEY_free);
    if (!key) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "Invalid service account private key", openssl_error()});
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    size_t sig_len = 0;
    if (!ctx ||
        EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key.get()) != 1 ||
        EVP_DigestSignUpdate(ctx.get(), payload.data(), payload.size()) != 1 ||
        EVP_DigestSignFinal(ctx.get(), nullptr, &sig_len) != 1) {
        return tl::unexpected(Error{ErrorCode::Unknown, "Failed to sign token assertion", openssl_error()});
    }
    std::string signature(sig_len, '\0');
    if (EVP_DigestSignFinal(ctx.get(), reinterpret_cast<unsigned char*>(&signature[0]), &sig_len) != 1) {
        return tl::unexpected(Error{ErrorCode::Unknown, "Failed to sign token assertion", openssl_error()});
    }
    signature.resize(sig_len);
    return signature;
}

// Executes one HTTP request; each call owns its own easy handle.
Expected<HttpResponse> perform_request(
    const std::string& method,
    const std::string& url,
    const std::vector<std::string>& headers,
    const std::string* body,
    std::chrono::milliseconds timeout
) {
    std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        return tl::unexpected(Error{ErrorCode::Unknown, "Failed to initialize HTTP client"});
    }

    curl_slist* header_list = nullptr;
    for (const auto& header : headers) {
        header_list = curl_slist_append(header_list, header.c_str());
    }
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_guard(header_list, &curl_slist_free_all);

    HttpResponse response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    if (body != nullptr) {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body->data());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body->size()));
    } else if (method == "GET") {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    }

    const CURLcode rc = curl_easy_perform(curl.get());
    if (rc == CURLE_OPERATION_TIMEDOUT) {
        return tl::unexpected(Error{ErrorCode::Timeout, "HTTP request timed out", method + " " + url});
    }
    if (rc != CURLE_OK) {
        return tl::unexpected(Error{
            ErrorCode::Unknown,
            std::string("HTTP request failed: ") + curl_easy_strerror(rc),
            method + " " + url
        });
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

/**
 * Supplies bearer tokens for GCS requests.
 */
class TokenProvider {
public:
    static Expected<std::unique_ptr<TokenProvider>> from_file(const std::string& path) {
        auto provider = std::unique_ptr<TokenProvider>(new TokenProvider());
        if (path.empty()) {
            return provider;
        }

        std::ifstream in(path);
        if (!in.is_open()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Failed to open credentials file", path});
        }
        try {
            const auto creds = nlohmann::json::parse(in);
            if (creds.contains("access_token")) {
                provider->static_token_ = creds.at("access_token").get<std::string>();
            } else if (creds.value("type", "") == "service_account") {
                provider->client_email_ = creds.at("client_email").get<std::string>();
                provider->private_key_ = creds.at("private_key").get<std::string>();
                provider->token_uri_ = creds.value("token_uri", "https://oauth2.googleapis.com/token");
            } else {
                return tl::unexpected(Error{
                    ErrorCode::InvalidConfig,
                    "Credentials must contain an access_token or a service account key",
                    path
                });
            }
        } catch (const nlohmann::json::exception& e) {
            return tl::unexpected(Error{
                ErrorCode::InvalidConfig,
                std::string("Invalid credentials file: ") + e.what(),
                path
            });
        }
        return provider;
    }

    /// Authorization header, or nullopt for anonymous access.
    Expected<std::optional<std::string>> authorization(std::chrono::milliseconds timeout) {
        if (!static_token_.empty()) {
            return std::optional<std::string>{"Authorization: Bearer " + static_token_};
        }
        if (client_email_.empty()) {
            return std::optional<std::string>{};
        }

        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = std::chrono::system_clock::now();
        if (cached_token_.empty() || now >= refresh_at_) {
            auto fetched = fetch_token(timeout);
            if (!fetched) {
                return tl::unexpected(fetched.error());
            }
        }
        return std::optional<std::string>{"Authorization: Bearer " + cached_token_};
    }

private:
    TokenProvider() = default;

    // Caller holds mutex_.
    Expected<void> fetch_token(std::chrono::milliseconds timeout) {
        const auto issued = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        const nlohmann::json header = {{"alg", "RS256"}, {"typ", "JWT"}};
        const nlohmann::json claims = {
            {"iss", client_email_},
            {"scope", "https://www.googleapis.com/auth/devstorage.read_write"},
            {"aud", token_uri_},
            {"iat", issued},
            {"exp", issued + 3600}
        };
        const std::string unsigned_jwt = base64url(header.dump()) + "." + base64url(claims.dump());
        auto signature = sign_rs256(private_key_, unsigned_jwt);
        if (!signature) {
            return tl::unexpected(signature.error());
        }

        const std::string form = "grant_type=" +
            detail::url_encode("urn:ietf:params:oauth:grant-type:jwt-bearer") +
            "&assertion=" + unsigned_jwt + "." + base64url(*signature);
        auto response = perform_request(
            "POST", token_uri_, {"Content-Type: application/x-www-form-urlencoded"}, &form, timeout);
        if (!response) {
            return tl::unexpected(response.error());
        }
        if (response->status != 200) {
            return tl::unexpected(Error{
                ErrorCode::InvalidConfig,
                "Token exchange failed with HTTP " + std::to_string(response->status),
                response->body
            });
        }

        try {
            const auto parsed = nlohmann::json::parse(response->body);
            cached_token_ = parsed.at("access_token").get<std::string>();
            const long long expires_in = parsed.value("expires_in", 3600LL);
            refresh_at_ = std::chrono::system_clock::now() +
                          std::chrono::seconds{std::max(0LL, expires_in - 60)};
        } catch (const nlohmann::json::exception& e) {
            return tl::unexpected(Error{
                ErrorCode::Unknown,
                std::string("Invalid token response: ") + e.what()
            });
        }
        log::logger()->debug("Refreshed storage access token account={}", client_email_);
        return {};
    }

    std::string static_token_;
    std::string client_email_;
    std::string private_key_;
    std::string token_uri_;

    std::mutex mutex_;
    std::string cached_token_;
    std::chrono::system_clock::time_point refresh_at_{};
};

class GcsObjectStore : public IObjectStore {
public:
    GcsObjectStore(GcsOptions options, std::unique_ptr<TokenProvider> tokens)
        : options_(std::move(options))
        , endpoint_(detail::normalize_endpoint(options_.endpoint))
        , tokens_(std::move(tokens))
    {}

    Expected<bool> bucket_exists(const Deadline& deadline) override {
        auto response = send("GET", bucket_url(), nullptr, {}, deadline);
        if (!response) {
            return tl::unexpected(response.error());
        }
        if (response->status == 404) {
            return false;
        }
        if (response->status != 200) {
            return tl::unexpected(http_error(*response, ErrorCode::StorageReadFailed, "check bucket"));
        }
        return true;
    }

    Expected<void> create_bucket(const std::string& project_id, const Deadline& deadline) override {
        const std::string body = nlohmann::json{{"name", options_.bucket}}.dump();
        const std::string url = endpoint_ + "/storage/v1/b?project=" + detail::url_encode(project_id);
        auto response = send("POST", url, &body, {"Content-Type: application/json"}, deadline);
        if (!response) {
            return tl::unexpected(response.error());
        }
        // 409: created concurrently by another instance.
        if (response->status != 200 && response->status != 409) {
            return tl::unexpected(http_error(*response, ErrorCode::StorageWriteFailed, "create bucket"));
        }
        return {};
    }

    Expected<void> put_object(
        const std::string& key,
        const std::string& data,
        const std::string& content_type,
        const Deadline& deadline
    ) override {
        const std::string url = endpoint_ + "/upload/storage/v1/b/" + detail::url_encode(options_.bucket) +
                                "/o?uploadType=media&name=" + detail::url_encode(key);
        auto response = send("POST", url, &data, {"Content-Type: " + content_type}, deadline);
        if (!response) {
            return tl::unexpected(response.error());
        }
        if (response->status != 200) {
            return tl::unexpected(http_error(*response, ErrorCode::StorageWriteFailed, "upload " + key));
        }
        return {};
    }

    Expected<std::string> get_object(const std::string& key, const Deadline& deadline) override {
        auto response = send("GET", object_url(key) + "?alt=media", nullptr, {}, deadline);
        if (!response) {
            return tl::unexpected(response.error());
        }
        if (response->status == 404) {
            return tl::unexpected(Error{ErrorCode::NotFound, "Object not found", key});
        }
        if (response->status != 200) {
            return tl::unexpected(http_error(*response, ErrorCode::StorageReadFailed, "download " + key));
        }
        return std::move(response->body);
    }

    Expected<std::vector<ObjectInfo>> list_objects(const std::string& prefix, const Deadline& deadline) override {
        std::vector<ObjectInfo> objects;
        std::string page_token;
        do {
            std::string url = bucket_url() + "/o?prefix=" + detail::url_encode(prefix);
            if (!page_token.empty()) {
                url += "&pageToken=" + detail::url_encode(page_token);
            }
            auto response = send("GET", url, nullptr, {}, deadline);
            if (!response) {
                return tl::unexpected(response.error());
            }
            if (response->status != 200) {
                return tl::unexpected(http_error(*response, ErrorCode::StorageReadFailed, "list " + prefix));
            }

            try {
                const auto page = nlohmann::json::parse(response->body);
                if (page.contains("items")) {
                    for (const auto& item : page.at("items")) {
                        ObjectInfo info;
                        info.name = item.at("name").get<std::string>();
                        // The JSON API encodes uint64 sizes as strings.
                        const auto& size = item.value("size", nlohmann::json("0"));
                        info.size = size.is_string() ? std::stoull(size.get<std::string>())
                                                     : size.get<uint64_t>();
                        objects.push_back(std::move(info));
                    }
                }
                page_token = page.value("nextPageToken", "");
            } catch (const std::exception& e) {
                return tl::unexpected(Error{
                    ErrorCode::StorageReadFailed,
                    std::string("Invalid list response: ") + e.what(),
                    prefix
                });
            }
        } while (!page_token.empty());
        return objects;
    }

    Expected<void> delete_object(const std::string& key, const Deadline& deadline) override {
        auto response = send("DELETE", object_url(key), nullptr, {}, deadline);
        if (!response) {
            return tl::unexpected(response.error());
        }
        if (response->status == 404) {
            return tl::unexpected(Error{ErrorCode::NotFound, "Object not found", key});
        }
        if (response->status != 200 && response->status != 204) {
            return tl::unexpected(http_error(*response, ErrorCode::StorageWriteFailed, "delete " + key));
        }
        return {};
    }

    std::string bucket() const override {
        return options_.bucket;
    }

private:
    std::string bucket_url() const {
        return endpoint_ + "/storage/v1/b/" + detail::url_encode(options_.bucket);
    }

    std::string object_url(const std::string& key) const {
        return bucket_url() + "/o/" + detail::url_encode(key);
    }

    Expected<HttpResponse> send(
        const std::string& method,
        const std::string& url,
        const std::string* body,
        std::vector<std::string> headers,
        const Deadline& deadline
    ) {
        if (auto ok = deadline.check(method + " " + url); !ok) {
            return tl::unexpected(ok.error());
        }
        std::chrono::milliseconds timeout = options_.request_timeout;
        if (auto left = deadline.remaining()) {
            timeout = std::max(std::chrono::milliseconds{1}, std::min(timeout, *left));
        }

        auto auth = tokens_->authorization(timeout);
        if (!auth) {
            return tl::unexpected(auth.error());
        }
        if (auth->has_value()) {
            headers.push_back(**auth);
        }
        return perform_request(method, url, headers, body, timeout);
    }

    static Error http_error(const HttpResponse& response, ErrorCode code, const std::string& what) {
        return Error{
            code,
            "Object store failed to " + what + " (HTTP " + std::to_string(response.status) + ")",
            response.body
        };
    }

    GcsOptions options_;
    std::string endpoint_;
    std::unique_ptr<TokenProvider> tokens_;
};

} // namespace

Expected<std::unique_ptr<IObjectStore>> make_gcs_object_store(GcsOptions options) {
    if (options.bucket.empty()) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "Bucket name cannot be empty"});
    }
    auto tokens = TokenProvider::from_file(options.credentials_file);
    if (!tokens) {
        return tl::unexpected(tokens.error());
    }
    return std::unique_ptr<IObjectStore>(
        std::make_unique<GcsObjectStore>(std::move(options), std::move(*tokens)));
}

} // namespace storage
} // namespace lore
