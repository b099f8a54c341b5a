#include "thinkara/Config.h"
#include "thinkara/Errors.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace Thinkara {

namespace {

/// Прочитать ключ если он есть, иначе оставить значение по умолчанию
template<typename T>
void readKey(const json& section, const char* key, T& target) {
    auto it = section.find(key);
    if (it != section.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

const json* findSection(const json& root, const char* name) {
    auto it = root.find(name);
    if (it == root.end() || it->is_null()) {
        return nullptr;
    }
    if (!it->is_object()) {
        throw ValidationError(std::string("Config section '") + name + "' must be an object");
    }
    return &(*it);
}

} // namespace

PipelineConfig PipelineConfig::fromJson(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("Config must be a JSON object");
    }

    PipelineConfig config;

    try {
        if (const json* fetch = findSection(j, "fetch")) {
            readKey(*fetch, "timeoutMs", config.fetch.timeoutMs);
            readKey(*fetch, "userAgent", config.fetch.userAgent);
            readKey(*fetch, "accept", config.fetch.accept);
            readKey(*fetch, "followRedirects", config.fetch.followRedirects);
            readKey(*fetch, "maxBodyBytes", config.fetch.maxBodyBytes);

            auto proxies = fetch->find("proxies");
            if (proxies != fetch->end() && !proxies->is_null()) {
                if (!proxies->is_array()) {
                    throw ValidationError("Config 'fetch.proxies' must be an array");
                }
                config.fetch.proxies.clear();
                for (const auto& p : *proxies) {
                    ProxyEndpoint endpoint;
                    endpoint.prefix = p.at("prefix").get<std::string>();
                    endpoint.label = p.value("label", endpoint.prefix);
                    config.fetch.proxies.push_back(std::move(endpoint));
                }
            }

            if (config.fetch.timeoutMs <= 0) {
                throw ValidationError("Config 'fetch.timeoutMs' must be positive");
            }
        }

        if (const json* article = findSection(j, "article")) {
            readKey(*article, "wordsPerMinute", config.article.wordsPerMinute);
            readKey(*article, "excerptLength", config.article.excerptLength);
            readKey(*article, "minParagraphChars", config.article.minParagraphChars);

            std::string format;
            readKey(*article, "contentFormat", format);
            if (!format.empty()) {
                config.article.contentFormat = contentFormatFromString(format);
            }

            if (config.article.wordsPerMinute <= 0) {
                throw ValidationError("Config 'article.wordsPerMinute' must be positive");
            }
        }

        if (const json* pdf = findSection(j, "pdf")) {
            readKey(*pdf, "minTextChars", config.pdf.minTextChars);
            readKey(*pdf, "ocrScale", config.pdf.ocrScale);
            readKey(*pdf, "ocrLanguage", config.pdf.ocrLanguage);
            readKey(*pdf, "tessdataPath", config.pdf.tessdataPath);
            readKey(*pdf, "maxPages", config.pdf.maxPages);

            if (config.pdf.ocrScale <= 0.0) {
                throw ValidationError("Config 'pdf.ocrScale' must be positive");
            }
        }

        if (const json* epub = findSection(j, "epub")) {
            readKey(*epub, "wordsPerMinute", config.epub.wordsPerMinute);
        }
    } catch (const json::exception& e) {
        throw ValidationError(std::string("Invalid config value: ") + e.what());
    }

    return config;
}

PipelineConfig PipelineConfig::fromJsonString(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        throw ValidationError("Config is not valid JSON");
    }
    return fromJson(j);
}

PipelineConfig PipelineConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ValidationError("Cannot open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    spdlog::debug("Loading pipeline config from '{}'", path);
    return fromJsonString(buffer.str());
}

json PipelineConfig::toJson() const {
    json proxies = json::array();
    for (const auto& p : fetch.proxies) {
        proxies.push_back({{"label", p.label}, {"prefix", p.prefix}});
    }

    json j;
    j["fetch"] = {
        {"timeoutMs", fetch.timeoutMs},
        {"userAgent", fetch.userAgent},
        {"accept", fetch.accept},
        {"proxies", proxies},
        {"followRedirects", fetch.followRedirects},
        {"maxBodyBytes", fetch.maxBodyBytes}
    };
    j["article"] = {
        {"wordsPerMinute", article.wordsPerMinute},
        {"excerptLength", article.excerptLength},
        {"contentFormat", contentFormatToString(article.contentFormat)},
        {"minParagraphChars", article.minParagraphChars}
    };
    j["pdf"] = {
        {"minTextChars", pdf.minTextChars},
        {"ocrScale", pdf.ocrScale},
        {"ocrLanguage", pdf.ocrLanguage},
        {"tessdataPath", pdf.tessdataPath},
        {"maxPages", pdf.maxPages}
    };
    j["epub"] = {
        {"wordsPerMinute", epub.wordsPerMinute}
    };
    return j;
}

} // namespace Thinkara
