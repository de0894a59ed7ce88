#pragma once

#include <functional>
#include <memory>
#include <string>

#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <drogon/HttpTypes.h>

#include "core/error.hpp"
#include "matching/match_engine.hpp"
#include "util/logger.hpp"

namespace asmhom {

using HttpCallback = std::function<void(const drogon::HttpResponsePtr&)>;

// HTTP REST API controller.
// Translates HTTP requests to MatchEngine calls and results to JSON.
class HttpController {
public:
    HttpController(std::shared_ptr<const MatchEngine> engine,
                   std::string temp_root,
                   Logger logger);

    // Register HTTP routes with Drogon. Must be called before app().run().
    void register_routes(const std::string& path_prefix);

    // GET /api/v1/health
    void health(const drogon::HttpRequestPtr& req, HttpCallback&& callback);

    // GET /api/v1/info
    void info(const drogon::HttpRequestPtr& req, HttpCallback&& callback);

    // GET /api/v1/namespace
    void list_namespaces(const drogon::HttpRequestPtr& req, HttpCallback&& callback);

    // GET /api/v1/namespace/{id}
    void get_namespace(const drogon::HttpRequestPtr& req, HttpCallback&& callback,
                       const std::string& id);

    // POST /api/v1/namespace/{id,id,...}/search?max=N&notstrict
    // Request body: the query sketch file.
    void search(const drogon::HttpRequestPtr& req, HttpCallback&& callback,
                const std::string& ids);

    // HTTP status for a failed engine call: 404 for unknown namespaces,
    // 400 for other user errors, 500 otherwise.
    static drogon::HttpStatusCode status_for(const Error& err);

private:
    std::shared_ptr<const MatchEngine> engine_;
    std::string temp_root_;
    Logger logger_;

    static drogon::HttpResponsePtr make_error_response(
        drogon::HttpStatusCode status, const std::string& message);
    static drogon::HttpResponsePtr make_error_response(const Error& err);
};

} // namespace asmhom
