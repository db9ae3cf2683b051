#include <sandforge/core/http_client.hpp>
#include <sandforge/core/logger.hpp>
#include <sandforge/core/utils.hpp>
#include <sandforge/core/json.hpp>

#include <curl/curl.h>

namespace sandforge {

namespace {

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t write_header(char* buffer, size_t size, size_t nitems, void* userdata) {
    std::map<std::string, std::string>* headers =
        static_cast<std::map<std::string, std::string>*>(userdata);
    std::string line(buffer, size * nitems);
    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string key = trim(line.substr(0, colon));
        std::string value = trim(line.substr(colon + 1));
        if (!key.empty()) {
            (*headers)[key] = value;
        }
    }
    return size * nitems;
}

} // namespace

std::string HttpResponse::header(const std::string& name) const {
    std::string wanted = to_lower(name);
    for (std::map<std::string, std::string>::const_iterator it = headers.begin();
         it != headers.end(); ++it) {
        if (to_lower(it->first) == wanted) {
            return it->second;
        }
    }
    return "";
}

std::string HttpResponse::error_message() const {
    if (status_code == 0) {
        return error.empty() ? "no response" : error;
    }
    try {
        Json parsed = Json::parse(body);
        if (parsed.is_object()) {
            if (parsed.contains("message") && parsed["message"].is_string()) {
                return parsed["message"].get<std::string>();
            }
            if (parsed.contains("error")) {
                const Json& err = parsed["error"];
                if (err.is_string()) {
                    return err.get<std::string>();
                }
                if (err.is_object() && err.contains("message") && err["message"].is_string()) {
                    return err["message"].get<std::string>();
                }
            }
        }
    } catch (const std::exception&) {
        // Plain-text body
    }
    std::string text = trim(body);
    if (!text.empty()) {
        return truncate_safe(text, 500);
    }
    return "HTTP " + std::to_string(status_code);
}

HttpClient::HttpClient()
    : curl_(curl_easy_init())
    , timeout_ms_(60000)
    , connect_timeout_ms_(10000)
    , user_agent_("sandforge/1.0")
{}

HttpClient::~HttpClient() {
    if (curl_) {
        curl_easy_cleanup(static_cast<CURL*>(curl_));
        curl_ = nullptr;
    }
}

HttpResponse HttpClient::get(const std::string& url,
                             const std::map<std::string, std::string>& headers,
                             const std::string& proxy) {
    return request("GET", url, "", headers, proxy);
}

HttpResponse HttpClient::post_json(const std::string& url,
                                   const std::string& body,
                                   const std::map<std::string, std::string>& headers) {
    std::map<std::string, std::string> all = headers;
    if (all.find("Content-Type") == all.end()) {
        all["Content-Type"] = "application/json";
    }
    return request("POST", url, body, all);
}

HttpResponse HttpClient::del(const std::string& url,
                             const std::map<std::string, std::string>& headers) {
    return request("DELETE", url, "", headers);
}

HttpResponse HttpClient::request(const std::string& method,
                                 const std::string& url,
                                 const std::string& body,
                                 const std::map<std::string, std::string>& headers,
                                 const std::string& proxy,
                                 long timeout_ms) {
    HttpResponse response;

    CURL* curl = static_cast<CURL*>(curl_);
    if (!curl) {
        response.error = "curl_easy_init failed";
        return response;
    }
    curl_easy_reset(curl);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, write_header);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

    if (!unix_socket_.empty()) {
        curl_easy_setopt(curl, CURLOPT_UNIX_SOCKET_PATH, unix_socket_.c_str());
    }
    if (!proxy.empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, proxy.c_str());
    }

    long effective_timeout = timeout_ms > 0 ? timeout_ms : timeout_ms_;
    if (effective_timeout > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, effective_timeout);
    }
    if (connect_timeout_ms_ > 0) {
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, connect_timeout_ms_);
    }

    if (method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else {
        if (method != "POST") {
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
        }
        if (!body.empty() || method == "POST") {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
        }
    }

    struct curl_slist* header_list = nullptr;
    for (std::map<std::string, std::string>::const_iterator it = headers.begin();
         it != headers.end(); ++it) {
        std::string line = it->first + ": " + it->second;
        header_list = curl_slist_append(header_list, line.c_str());
    }
    // Suppress "Expect: 100-continue" on large bodies
    header_list = curl_slist_append(header_list, "Expect:");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);

    CURLcode rc = curl_easy_perform(curl);
    if (rc == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    } else {
        response.error = curl_easy_strerror(rc);
        response.timed_out = (rc == CURLE_OPERATION_TIMEDOUT);
        LOG_DEBUG("%s %s failed: %s", method.c_str(), url.c_str(), response.error.c_str());
    }

    curl_slist_free_all(header_list);
    return response;
}

std::string HttpClient::url_encode(const std::string& value) {
    CURL* curl = curl_easy_init();
    if (!curl) return value;
    char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
    std::string out = escaped ? escaped : value;
    if (escaped) curl_free(escaped);
    curl_easy_cleanup(curl);
    return out;
}

} // namespace sandforge
