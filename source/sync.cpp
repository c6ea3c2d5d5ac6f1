#include "iman/sync.hpp"
#include "iman/errors.hpp"
#include "iman/filesystem.hpp"
#include "iman/layout.hpp"
#include "iman/logger.hpp"
#include "iman/util.hpp"
#include "mini/json.hpp"
#include <tinyxml2.h>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <initializer_list>
#include <iterator>

namespace iman {

namespace {

std::string valToString(const mini::Value& v) {
    if (v.type == mini::Value::Type::String) return v.str;
    if (v.type == mini::Value::Type::Number) {
        if (v.integral) return std::to_string(v.number);
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%g", v.real);
        return buf;
    }
    return {};
}

const mini::Value* findAny(const mini::Object& o, std::initializer_list<const char*> keys) {
    for (const char* k : keys) {
        auto it = o.find(k);
        if (it != o.end() && it->second.type != mini::Value::Type::Null) return &it->second;
    }
    return nullptr;
}

// Whole, non-negative byte counts only; 1e3 passes, 1.5 and 1e30 do not.
bool parseSize(const mini::Value& v, uint64_t& out) {
    if (v.isNumber()) {
        if (v.integral) {
            if (v.number < 0) return false;
            out = static_cast<uint64_t>(v.number);
            return true;
        }
        if (!std::isfinite(v.real) || v.real < 0 || v.real >= 18446744073709551616.0 ||
            std::floor(v.real) != v.real)
            return false;
        out = static_cast<uint64_t>(v.real);
        return true;
    }
    if (v.isString()) {
        const std::string s = util::trim(v.str);
        if (s.empty() || s.front() == '-') return false;
        char* end = nullptr;
        errno = 0;
        unsigned long long n = std::strtoull(s.c_str(), &end, 10);
        if (end == s.c_str() || *end != '\0' || errno == ERANGE) return false;
        out = static_cast<uint64_t>(n);
        return true;
    }
    return false;
}

int64_t parsePublished(const mini::Value& v) {
    if (v.isNumber()) return v.integral && v.number > 0 ? v.number : 0;
    if (v.isString()) {
        int64_t ts = 0;
        if (util::parseIsoTimestamp(v.str, ts)) return ts;
        const std::string s = util::trim(v.str);
        char* end = nullptr;
        errno = 0;
        long long n = std::strtoll(s.c_str(), &end, 10);
        if (!s.empty() && end && *end == '\0' && errno != ERANGE && n > 0) return n;
    }
    return 0;
}

std::string absolutize(const std::string& link, const std::string& baseUrl) {
    if (link.empty() || baseUrl.empty() || link.find("://") != std::string::npos) return link;
    return resolveUrl(baseUrl, link);
}

mini::Value stringValue(const char* text) {
    mini::Value v;
    v.type = mini::Value::Type::String;
    if (text) v.str = util::trim(text);
    return v;
}

bool looksLikeXml(const std::string& body) {
    size_t i = 0;
    if (body.compare(0, 3, "\xEF\xBB\xBF") == 0) i = 3;
    while (i < body.size() && std::isspace(static_cast<unsigned char>(body[i]))) i++;
    return i < body.size() && body[i] == '<';
}

// <game_list><game><name>..</name><lang>ru</lang>..</game></game_list>
// Each <game> becomes an object of its child element texts. Repeated <lang>
// elements and a <langs> wrapper are collected into "languages".
bool collectXmlRecords(const std::string& body, std::vector<mini::Object>& records, std::string& err) {
    tinyxml2::XMLDocument doc;
    if (doc.Parse(body.data(), body.size()) != tinyxml2::XML_SUCCESS) {
        err = std::string("Failed to parse index XML: ") + doc.ErrorStr();
        return false;
    }
    const tinyxml2::XMLElement* list = doc.FirstChildElement("game_list");
    if (!list) {
        err = "Malformed index: missing game_list element";
        return false;
    }
    for (const auto* e = list->FirstChildElement("game"); e; e = e->NextSiblingElement("game")) {
        mini::Object o;
        mini::Value langs;
        langs.type = mini::Value::Type::Array;
        for (const auto* f = e->FirstChildElement(); f; f = f->NextSiblingElement()) {
            const std::string key = f->Name();
            if (key == "langs" || key == "languages") {
                for (const auto* l = f->FirstChildElement(); l; l = l->NextSiblingElement())
                    langs.array.push_back(stringValue(l->GetText()));
            } else if (key == "lang") {
                for (const auto& l : util::splitList(f->GetText() ? f->GetText() : "", ','))
                    langs.array.push_back(stringValue(l.c_str()));
            } else {
                o[key] = stringValue(f->GetText());
            }
        }
        if (!langs.array.empty()) o["languages"] = std::move(langs);
        records.push_back(std::move(o));
    }
    return true;
}

// Top-level array of objects, or an object holding a "games" array. Entries
// that are not objects are counted as dropped.
bool collectJsonRecords(const std::string& body, std::vector<mini::Object>& records, size_t& dropped,
                        std::string& err) {
    mini::Value root;
    if (!mini::parse(body, root)) {
        err = "Failed to parse index JSON";
        return false;
    }
    mini::Array* arr = nullptr;
    if (root.isArray()) {
        arr = &root.array;
    } else if (root.isObject()) {
        auto it = root.object.find("games");
        if (it == root.object.end() || !it->second.isArray()) {
            err = "Malformed index: missing games array";
            return false;
        }
        arr = &it->second.array;
    } else {
        err = "Malformed index: expected array or object";
        return false;
    }
    for (auto& v : *arr) {
        if (!v.isObject()) {
            dropped++;
            continue;
        }
        records.push_back(std::move(v.object));
    }
    return true;
}

bool recordToGame(const mini::Object& o, const std::string& repositoryName, const std::string& baseUrl, Game& g) {
    g.repositoryName = repositoryName;

    if (const auto* n = findAny(o, {"name"})) g.name = util::trim(valToString(*n));
    if (const auto* u = findAny(o, {"url", "download_url"}); u && u->isString())
        g.downloadUrl = absolutize(util::trim(u->str), baseUrl);
    const auto* sizeVal = findAny(o, {"size", "size_bytes"});
    bool sizeOk = sizeVal && parseSize(*sizeVal, g.sizeBytes);

    if (g.name.empty() || g.downloadUrl.empty() || !sizeOk) {
        logDebug("Dropping record without name/url/size in " + repositoryName +
                 (g.name.empty() ? std::string() : (": " + g.name)), "SYNC");
        return false;
    }

    if (const auto* t = findAny(o, {"title"}); t && t->isString()) g.title = t->str;
    if (g.title.empty()) g.title = g.name;
    if (const auto* d = findAny(o, {"description"}); d && d->isString()) g.description = d->str;
    if (const auto* ver = findAny(o, {"version"})) g.version = valToString(*ver);
    if (const auto* du = findAny(o, {"descurl", "description_url"}); du && du->isString())
        g.descriptionUrl = absolutize(util::trim(du->str), baseUrl);
    if (const auto* img = findAny(o, {"image", "image_url"}); img && img->isString())
        g.imageUrl = absolutize(util::trim(img->str), baseUrl);
    if (const auto* date = findAny(o, {"date", "published_at"})) g.publishedAt = parsePublished(*date);

    if (const auto* langs = findAny(o, {"languages"}); langs && langs->isArray()) {
        for (const auto& l : langs->array) {
            if (l.isString() && !util::trim(l.str).empty()) g.languages.push_back(util::trim(l.str));
        }
    } else if (const auto* lang = findAny(o, {"lang", "langs"}); lang && lang->isString()) {
        g.languages = util::splitList(lang->str, ',');
    }
    return true;
}

} // namespace

bool parseRepositoryIndex(const std::string& body,
                          const std::string& repositoryName,
                          std::vector<Game>& outGames,
                          size_t& outDropped,
                          std::string& err,
                          const std::string& baseUrl)
{
    outGames.clear();
    outDropped = 0;

    std::vector<mini::Object> records;
    const bool parsed = looksLikeXml(body) ? collectXmlRecords(body, records, err)
                                           : collectJsonRecords(body, records, outDropped, err);
    if (!parsed) return false;

    for (const auto& o : records) {
        Game g;
        if (!recordToGame(o, repositoryName, baseUrl, g)) {
            outDropped++;
            continue;
        }
        outGames.push_back(std::move(g));
    }
    return true;
}

SyncResult syncAll(const std::vector<Repository>& repositories, const Config& cfg, const HttpGetFn& fetch) {
    SyncResult result;
    auto catalog = std::make_shared<Catalog>();
    const bool cacheEnabled = !cfg.dataPath.empty();
    GameLayout layout(cfg.dataPath);

    for (const auto& repo : repositories) {
        logInfo("Syncing repository " + repo.name + " (" + repo.url + ")", "SYNC");
        std::string body, err;
        if (!fetchToString(fetch, repo.url, cfg.httpTimeoutSeconds, body, err)) {
            ErrorInfo cause = classifyError(err, ErrorCategory::Network);
            logError("Repository " + repo.name + " failed: " + err, "SYNC");
            result.errors.push_back(SyncError{repo.name, cause});
            continue;
        }

        std::vector<Game> games;
        size_t dropped = 0;
        if (!parseRepositoryIndex(body, repo.name, games, dropped, err, repo.url)) {
            ErrorInfo cause = makeError(ErrorCategory::Parse, ErrorCode::ParseFailure, err,
                                        "Repository index is malformed.");
            logError("Repository " + repo.name + " index rejected: " + err, "SYNC");
            result.errors.push_back(SyncError{repo.name, cause});
            continue;
        }
        if (dropped > 0) logWarn("Repository " + repo.name + ": dropped " + std::to_string(dropped) + " invalid records", "SYNC");
        logInfo("Repository " + repo.name + ": " + std::to_string(games.size()) + " games", "SYNC");

        if (cacheEnabled) {
            std::string cacheErr;
            if (!writeFileAtomic(layout.indexCachePath(repo.name), body, cacheErr))
                logWarn("Index cache write failed for " + repo.name + ": " + cacheErr, "SYNC");
        }

        catalog->games.insert(catalog->games.end(),
                              std::make_move_iterator(games.begin()),
                              std::make_move_iterator(games.end()));
        result.succeeded++;
    }

    result.catalog = std::move(catalog);
    return result;
}

bool hasCachedIndex(const std::vector<Repository>& repositories, const GameLayout& layout) {
    for (const auto& repo : repositories) {
        if (isRegularFile(layout.indexCachePath(repo.name))) return true;
    }
    return false;
}

std::shared_ptr<const Catalog> loadCachedCatalog(const std::vector<Repository>& repositories,
                                                 const GameLayout& layout) {
    auto catalog = std::make_shared<Catalog>();
    bool any = false;
    for (const auto& repo : repositories) {
        const std::string path = layout.indexCachePath(repo.name);
        if (!isRegularFile(path)) continue;
        std::string body, err;
        if (!readFile(path, body, err)) {
            logWarn("Index cache unreadable: " + err, "SYNC");
            continue;
        }
        std::vector<Game> games;
        size_t dropped = 0;
        if (!parseRepositoryIndex(body, repo.name, games, dropped, err, repo.url)) {
            logWarn("Index cache for " + repo.name + " ignored: " + err, "SYNC");
            continue;
        }
        any = true;
        catalog->games.insert(catalog->games.end(),
                              std::make_move_iterator(games.begin()),
                              std::make_move_iterator(games.end()));
    }
    if (!any) return nullptr;
    return catalog;
}

void CatalogStore::publish(std::shared_ptr<const Catalog> catalog) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = std::move(catalog);
}

std::shared_ptr<const Catalog> CatalogStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

bool CatalogStore::hasAnySyncedData() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_ != nullptr;
}

} // namespace iman
