#ifndef PRIVACYGUARD_DETECT_HTTP_NER_BACKEND_HPP
#define PRIVACYGUARD_DETECT_HTTP_NER_BACKEND_HPP

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include <curl/curl.h>
#include "detect/ner_backend.hpp"
#include "util/json.hpp"
#include "util/logger.hpp"

namespace privacyguard {
namespace detect {

/*
  HttpNerBackend
  --------------------------------
  Runs a token-classification model behind an HTTP inference endpoint.

  Request:   POST <endpoint>   {"inputs":"<text>"}
  Response:  [{"entity_group":"PER","score":0.998,"word":"John Doe","start":8,"end":16}, ...]

  That is the shape of a Hugging Face NER pipeline with
  aggregation_strategy="simple". Offsets are Python string indices, i.e.
  codepoints. An object body such as {"error":"..."} is reported as a failure.

   - libcurl does the transport; curl_global_init runs once per process.
   - Each infer() uses its own easy handle, so concurrent calls are safe.
   - Transport errors, non-2xx statuses and bodies that do not parse throw
     std::runtime_error. No retries.
   - You must link against libcurl (-lcurl).
*/

class HttpNerBackend : public NerBackend
{
public:
    HttpNerBackend(const std::string &endpoint, long timeoutSeconds = 30)
        : m_endpoint(endpoint), m_timeoutSeconds(timeoutSeconds)
    {
        initCurl();
    }

    std::vector<RawEntity> infer(const std::string &text) const override
    {
        const std::string body = "{\"inputs\":" + util::json::quote(text) + "}";
        std::string response;
        long status = post(body, response);
        if (status < 200 || status >= 300) {
            throw std::runtime_error("HttpNerBackend: " + m_endpoint + " answered HTTP " +
                                     std::to_string(status));
        }
        return parseEntities(response);
    }

    OffsetUnit offsetUnit() const override { return OffsetUnit::Codepoint; }

    std::string describe() const override { return "http:" + m_endpoint; }

    /**
     * @brief Decode an inference response body into raw entities.
     *        Entities use "entity_group", or "entity" when not aggregated.
     * @throw std::runtime_error (JsonError) on malformed bodies or missing fields.
     */
    static std::vector<RawEntity> parseEntities(const std::string &response)
    {
        std::string::size_type first = response.find_first_not_of(" \t\r\n");
        if (first != std::string::npos && response[first] == '{') {
            util::json::Reader reader(response);
            reader.skipWhitespace();
            auto obj = reader.readFlatObject(true);
            auto it = obj.find("error");
            throw std::runtime_error("HttpNerBackend: inference error: " +
                                     (it != obj.end() ? it->second : std::string("unexpected object")));
        }

        std::vector<RawEntity> entities;
        for (const auto &obj : util::json::parseObjectArray(response)) {
            RawEntity entity;
            entity.label = field(obj, "entity_group", "entity");
            entity.start = toOffset(field(obj, "start"));
            entity.end = toOffset(field(obj, "end"));
            auto score = obj.find("score");
            if (score != obj.end()) {
                entity.score = toScore(score->second);
            }
            entities.push_back(std::move(entity));
        }
        return entities;
    }

private:
    static void initCurl()
    {
        static std::once_flag once;
        std::call_once(once, [] {
            if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
                throw std::runtime_error("HttpNerBackend: curl_global_init failed");
            }
        });
    }

    static std::string field(const util::json::FlatObject &obj, const std::string &key,
                             const std::string &fallbackKey = std::string())
    {
        auto it = obj.find(key);
        if (it == obj.end() && !fallbackKey.empty()) {
            it = obj.find(fallbackKey);
        }
        if (it == obj.end()) {
            throw std::runtime_error("HttpNerBackend: entity without '" + key + "'");
        }
        return it->second;
    }

    static size_t toOffset(const std::string &raw)
    {
        size_t idx = 0;
        unsigned long long v = 0;
        try {
            v = std::stoull(raw, &idx, 10);
        } catch (const std::logic_error &) {
            idx = 0;
        }
        if (idx == 0 || idx != raw.size() || raw[0] == '-') {
            throw std::runtime_error("HttpNerBackend: bad offset '" + raw + "'");
        }
        return static_cast<size_t>(v);
    }

    static double toScore(const std::string &raw)
    {
        try {
            size_t idx = 0;
            double v = std::stod(raw, &idx);
            if (idx == raw.size()) {
                return v;
            }
        } catch (const std::logic_error &) {
        }
        throw std::runtime_error("HttpNerBackend: bad score '" + raw + "'");
    }

    // POST body as JSON; returns the HTTP status, fills responseOut.
    long post(const std::string &body, std::string &responseOut) const
    {
        std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
        if (!curl) {
            throw std::runtime_error("HttpNerBackend: curl_easy_init failed");
        }

        std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(nullptr, &curl_slist_free_all);
        headers.reset(curl_slist_append(headers.release(), "Content-Type: application/json"));
        headers.reset(curl_slist_append(headers.release(), "Expect:"));

        curl_easy_setopt(curl.get(), CURLOPT_URL, m_endpoint.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, m_timeoutSeconds);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &responseOut);

        CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            util::logger::error("[HttpNerBackend] request to " + m_endpoint + " failed: " +
                                curl_easy_strerror(res));
            throw std::runtime_error(std::string("HttpNerBackend: ") + curl_easy_strerror(res));
        }

        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
        return status;
    }

    static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
    {
        if (!userdata) return 0;
        std::string &resp = *static_cast<std::string*>(userdata);
        size_t total = size * nmemb;
        resp.append(ptr, total);
        return total;
    }

    std::string m_endpoint;
    long m_timeoutSeconds;
};

} // namespace detect
} // namespace privacyguard

#endif // PRIVACYGUARD_DETECT_HTTP_NER_BACKEND_HPP
