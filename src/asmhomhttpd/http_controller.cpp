#include "asmhomhttpd/http_controller.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <thread>
#include <vector>

#include <drogon/HttpAppFramework.h>
#include <json/json.h>

#include "core/config.hpp"
#include "core/version.hpp"
#include "io/result_writer.hpp"
#include "util/cli_parser.hpp"
#include "util/temp_dir.hpp"

namespace asmhom {

HttpController::HttpController(std::shared_ptr<const MatchEngine> engine,
                               std::string temp_root,
                               Logger logger)
    : engine_(std::move(engine)), temp_root_(std::move(temp_root)), logger_(logger) {}

void HttpController::register_routes(const std::string& path_prefix) {
    std::string prefix = path_prefix;
    if (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }

    auto self = this;

    drogon::app().registerHandler(
        prefix + "/api/v1/health",
        [self](const drogon::HttpRequestPtr& req, HttpCallback&& callback) {
            self->health(req, std::move(callback));
        },
        {drogon::Get});

    drogon::app().registerHandler(
        prefix + "/api/v1/info",
        [self](const drogon::HttpRequestPtr& req, HttpCallback&& callback) {
            self->info(req, std::move(callback));
        },
        {drogon::Get});

    drogon::app().registerHandler(
        prefix + "/api/v1/namespace",
        [self](const drogon::HttpRequestPtr& req, HttpCallback&& callback) {
            self->list_namespaces(req, std::move(callback));
        },
        {drogon::Get});

    drogon::app().registerHandler(
        prefix + "/api/v1/namespace/{1}",
        [self](const drogon::HttpRequestPtr& req, HttpCallback&& callback,
               const std::string& id) {
            self->get_namespace(req, std::move(callback), id);
        },
        {drogon::Get});

    drogon::app().registerHandler(
        prefix + "/api/v1/namespace/{1}/search",
        [self](const drogon::HttpRequestPtr& req, HttpCallback&& callback,
               const std::string& ids) {
            self->search(req, std::move(callback), ids);
        },
        {drogon::Post});
}

void HttpController::health(const drogon::HttpRequestPtr& /*req*/,
                            HttpCallback&& callback) {
    Json::Value result;
    result["status"] = "ok";
    callback(drogon::HttpResponse::newHttpJsonResponse(std::move(result)));
}

void HttpController::info(const drogon::HttpRequestPtr& /*req*/,
                          HttpCallback&& callback) {
    Json::Value result;
    result["servname"] = "asmhom";
    result["version"] = ASMHOM_VERSION;
    result["servertime"] = static_cast<Json::Int64>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());

    Json::Value impls(Json::arrayValue);
    for (const auto& name : engine_->registry().names()) {
        impls.append(name);
    }
    result["implementations"] = std::move(impls);
    callback(drogon::HttpResponse::newHttpJsonResponse(std::move(result)));
}

void HttpController::list_namespaces(const drogon::HttpRequestPtr& /*req*/,
                                     HttpCallback&& callback) {
    std::vector<Namespace> namespaces;
    Error err;
    if (!engine_->get_namespaces(namespaces, err)) {
        logger_.error("list namespaces failed: %s", err.message.c_str());
        callback(make_error_response(err));
        return;
    }
    Json::Value arr(Json::arrayValue);
    for (const auto& ns : namespaces) {
        arr.append(namespace_to_json(ns));
    }
    callback(drogon::HttpResponse::newHttpJsonResponse(std::move(arr)));
}

void HttpController::get_namespace(const drogon::HttpRequestPtr& /*req*/,
                                   HttpCallback&& callback,
                                   const std::string& id) {
    Namespace ns;
    Error err;
    if (!engine_->get_namespace(id, ns, err)) {
        if (!is_user_error(err.kind)) {
            logger_.error("get namespace %s failed: %s", id.c_str(), err.message.c_str());
        }
        callback(make_error_response(err));
        return;
    }
    callback(drogon::HttpResponse::newHttpJsonResponse(namespace_to_json(ns)));
}

void HttpController::search(const drogon::HttpRequestPtr& req,
                            HttpCallback&& callback,
                            const std::string& ids) {
    MatchRequest mreq;
    mreq.namespace_ids = split_list(ids);
    if (mreq.namespace_ids.empty()) {
        callback(make_error_response(drogon::k400BadRequest, "No namespace IDs provided"));
        return;
    }

    const std::string& max_str = req->getParameter("max");
    if (!max_str.empty()) {
        char* end = nullptr;
        long v = std::strtol(max_str.c_str(), &end, 10);
        if (*end != '\0') {
            callback(make_error_response(drogon::k400BadRequest,
                                         "Illegal value for max: " + max_str));
            return;
        }
        // out of range values fall back to the default in the engine
        mreq.return_count = (v < -1000000 || v > 1000000) ? 0 : static_cast<int>(v);
    }
    mreq.strict = req->getParameters().count("notstrict") == 0;

    std::string body(req->body());
    if (body.empty()) {
        callback(make_error_response(drogon::k400BadRequest,
                                     "Missing query sketch in request body"));
        return;
    }

    // Offload blocking engine work to a worker thread.
    // Drogon event loop threads must not be blocked.
    auto engine = engine_;
    auto temp_root = temp_root_;
    auto logger = logger_;
    auto cb = std::make_shared<HttpCallback>(std::move(callback));

    std::thread([engine, temp_root, logger, mreq = std::move(mreq),
                 body = std::move(body), cb]() mutable {
        // Name the upload with the extension the namespaces' implementation
        // expects; mixed implementations are rejected by the engine anyway.
        std::string ext;
        {
            std::vector<Namespace> namespaces;
            Error err;
            if (!engine->get_namespaces(mreq.namespace_ids, namespaces, err)) {
                if (!is_user_error(err.kind)) {
                    logger.error("namespace lookup failed: %s", err.message.c_str());
                }
                (*cb)(make_error_response(err));
                return;
            }
            std::optional<std::string> e;
            if (engine->expected_file_extension(
                    namespaces.front().sketch_db.implementation, e, err) && e) {
                ext = *e;
            }
        }

        ScopedTempDir upload_dir;
        std::string temp_err;
        if (!upload_dir.create(temp_root, "asmhom_upload_", temp_err)) {
            logger.error("Cannot create upload directory: %s", temp_err.c_str());
            (*cb)(make_error_response(drogon::k500InternalServerError,
                                      "Internal server error"));
            return;
        }
        mreq.query_path = upload_dir.path() + "/query" + ext;
        {
            std::ofstream out(mreq.query_path, std::ios::binary);
            out.write(body.data(), static_cast<std::streamsize>(body.size()));
            if (!out) {
                logger.error("Cannot write upload to %s", mreq.query_path.c_str());
                (*cb)(make_error_response(drogon::k500InternalServerError,
                                          "Internal server error"));
                return;
            }
        }

        SequenceMatches matches;
        Error err;
        if (!engine->measure_distance(mreq, matches, err)) {
            (*cb)(make_error_response(err));
            return;
        }
        (*cb)(drogon::HttpResponse::newHttpJsonResponse(matches_to_json(matches)));
    }).detach();
}

drogon::HttpStatusCode HttpController::status_for(const Error& err) {
    if (err.kind == ErrorKind::kNoSuchNamespace) return drogon::k404NotFound;
    if (is_user_error(err.kind)) return drogon::k400BadRequest;
    return drogon::k500InternalServerError;
}

drogon::HttpResponsePtr HttpController::make_error_response(
    drogon::HttpStatusCode status, const std::string& message) {
    Json::Value body;
    body["error"] = message;
    auto resp = drogon::HttpResponse::newHttpJsonResponse(std::move(body));
    resp->setStatusCode(status);
    return resp;
}

drogon::HttpResponsePtr HttpController::make_error_response(const Error& err) {
    if (!is_user_error(err.kind)) {
        // detail was logged where the failure occurred
        return make_error_response(drogon::k500InternalServerError,
                                   "Internal server error");
    }
    auto resp = make_error_response(status_for(err), err.message);
    return resp;
}

} // namespace asmhom
