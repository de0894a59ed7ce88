#include "test_util.hpp"
#include "match_test_fixture.hpp"
#include "asmhomhttpd/http_controller.hpp"

#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>

using namespace asmhom;
using namespace match_fixture;

static std::string g_test_dir;
static std::string g_temp_root;

struct Server {
    std::shared_ptr<FakeState> state;
    std::unique_ptr<HttpController> controller;
};

static Server make_server() {
    Server s;
    s.state = std::make_shared<FakeState>();
    s.state->hits["ns1"] = {{"a", 0.3}, {"b", 0.1}};
    s.state->fallback_sketch = make_query_sketch(sized_params(21, 1000));

    auto store = std::make_shared<InMemoryStore>();
    store->add_namespace(make_namespace("ns1", "fake", sized_params(21, 1000)));
    store->add_namespace(make_namespace("ns_k31", "fake", sized_params(31, 1000)));
    for (const char* id : {"a", "b"}) store->add_sequence("ns1", "load1", make_sequence(id));

    auto registry = std::make_shared<CapabilityRegistry>();
    Error err;
    CHECK(registry->add(std::make_shared<FakeProvider>(s.state), err));

    auto engine = std::make_shared<MatchEngine>(store, registry, g_temp_root,
                                                Logger(Logger::kError));
    s.controller = std::make_unique<HttpController>(engine, g_temp_root,
                                                    Logger(Logger::kError));
    return s;
}

// Run a search and wait for the worker thread's response.
static drogon::HttpResponsePtr run_search(HttpController& ctl, const std::string& ids,
                                          const std::string& body,
                                          const std::string& max = "",
                                          bool notstrict = false) {
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Post);
    req->setBody(body);
    if (!max.empty()) req->setParameter("max", max);
    if (notstrict) req->setParameter("notstrict", "");

    auto done = std::make_shared<std::promise<drogon::HttpResponsePtr>>();
    auto future = done->get_future();
    ctl.search(req, [done](const drogon::HttpResponsePtr& resp) { done->set_value(resp); },
               ids);
    if (future.wait_for(std::chrono::seconds(30)) != std::future_status::ready) {
        return nullptr;
    }
    return future.get();
}

static bool temp_root_drains() {
    for (int i = 0; i < 100; i++) {
        if (std::filesystem::is_empty(g_temp_root)) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return false;
}

static void test_health_and_info() {
    std::fprintf(stderr, "-- test_health_and_info\n");

    Server s = make_server();
    auto req = drogon::HttpRequest::newHttpRequest();

    drogon::HttpResponsePtr resp;
    s.controller->health(req, [&](const drogon::HttpResponsePtr& r) { resp = r; });
    CHECK(resp != nullptr);
    if (!resp) return;
    CHECK(resp->getStatusCode() == drogon::k200OK);
    CHECK_STR_EQ((*resp->getJsonObject())["status"].asString(), "ok");

    resp.reset();
    s.controller->info(req, [&](const drogon::HttpResponsePtr& r) { resp = r; });
    CHECK(resp != nullptr);
    if (!resp) return;
    const Json::Value& v = *resp->getJsonObject();
    CHECK_STR_EQ(v["servname"].asString(), "asmhom");
    CHECK(v["servertime"].asInt64() > 0);
    CHECK_EQ(v["implementations"].size(), 1u);
    CHECK_STR_EQ(v["implementations"][0].asString(), "fake");
}

static void test_namespace_routes() {
    std::fprintf(stderr, "-- test_namespace_routes\n");

    Server s = make_server();
    auto req = drogon::HttpRequest::newHttpRequest();
    drogon::HttpResponsePtr resp;

    s.controller->list_namespaces(req, [&](const drogon::HttpResponsePtr& r) { resp = r; });
    CHECK(resp != nullptr);
    if (!resp) return;
    CHECK(resp->getStatusCode() == drogon::k200OK);
    CHECK_EQ(resp->getJsonObject()->size(), 2u);

    resp.reset();
    s.controller->get_namespace(req, [&](const drogon::HttpResponsePtr& r) { resp = r; },
                                "ns1");
    CHECK(resp != nullptr);
    if (!resp) return;
    CHECK_STR_EQ((*resp->getJsonObject())["id"].asString(), "ns1");
    CHECK_EQ((*resp->getJsonObject())["kmersize"].asInt(), 21);

    resp.reset();
    s.controller->get_namespace(req, [&](const drogon::HttpResponsePtr& r) { resp = r; },
                                "nope");
    CHECK(resp != nullptr);
    if (resp) CHECK(resp->getStatusCode() == drogon::k404NotFound);

    resp.reset();
    s.controller->get_namespace(req, [&](const drogon::HttpResponsePtr& r) { resp = r; },
                                "bad-id");
    CHECK(resp != nullptr);
    if (resp) CHECK(resp->getStatusCode() == drogon::k400BadRequest);
}

static void test_search_success() {
    std::fprintf(stderr, "-- test_search_success\n");

    Server s = make_server();
    auto resp = run_search(*s.controller, "ns1", "sketch-bytes", "1");
    CHECK(resp != nullptr);
    if (!resp) return;
    CHECK(resp->getStatusCode() == drogon::k200OK);
    const Json::Value& v = *resp->getJsonObject();
    CHECK_STR_EQ(v["impl"].asString(), "fake");
    CHECK_EQ(v["distances"].size(), 1u);
    CHECK_STR_EQ(v["distances"][0]["sequenceid"].asString(), "b");

    CHECK_EQ(s.state->last_count, 1);
    CHECK(s.state->last_strict);
    CHECK_STR_EQ(s.state->last_loaded_bytes, "sketch-bytes");
    CHECK_EQ(s.state->loaded_locations.size(), 1u);
    if (!s.state->loaded_locations.empty()) {
        const std::string& loc = s.state->loaded_locations[0];
        CHECK(loc.size() > 3 && loc.compare(loc.size() - 3, 3, ".fk") == 0);
    }
    CHECK(temp_root_drains());
}

static void test_search_parameters() {
    std::fprintf(stderr, "-- test_search_parameters\n");

    Server s = make_server();
    auto resp = run_search(*s.controller, "ns1", "x", "", true);
    CHECK(resp != nullptr);
    if (resp) CHECK(resp->getStatusCode() == drogon::k200OK);
    CHECK(!s.state->last_strict);
    CHECK_EQ(s.state->last_count, 10);

    resp = run_search(*s.controller, "ns1", "x", "5000");
    CHECK(resp != nullptr);
    CHECK_EQ(s.state->last_count, 10);

    resp = run_search(*s.controller, "ns1", "x", "ten");
    CHECK(resp != nullptr);
    if (resp) CHECK(resp->getStatusCode() == drogon::k400BadRequest);
}

static void test_search_errors() {
    std::fprintf(stderr, "-- test_search_errors\n");

    Server s = make_server();

    auto resp = run_search(*s.controller, "ns1", "");
    CHECK(resp != nullptr);
    if (resp) CHECK(resp->getStatusCode() == drogon::k400BadRequest);

    resp = run_search(*s.controller, ",", "x");
    CHECK(resp != nullptr);
    if (resp) CHECK(resp->getStatusCode() == drogon::k400BadRequest);

    resp = run_search(*s.controller, "ns1,missing", "x");
    CHECK(resp != nullptr);
    if (resp) CHECK(resp->getStatusCode() == drogon::k404NotFound);

    resp = run_search(*s.controller, "ns1,ns_k31", "x");
    CHECK(resp != nullptr);
    if (resp) {
        CHECK(resp->getStatusCode() == drogon::k400BadRequest);
        CHECK_CONTAINS((*resp->getJsonObject())["error"].asString(), "ns_k31");
    }

    s.state->fail_compute = true;
    resp = run_search(*s.controller, "ns1", "x");
    CHECK(resp != nullptr);
    if (resp) {
        CHECK(resp->getStatusCode() == drogon::k500InternalServerError);
        CHECK_STR_EQ((*resp->getJsonObject())["error"].asString(), "Internal server error");
    }
    CHECK(temp_root_drains());
}

static void test_status_mapping() {
    std::fprintf(stderr, "-- test_status_mapping\n");

    CHECK(HttpController::status_for(make_error(ErrorKind::kNoSuchNamespace, "")) ==
          drogon::k404NotFound);
    CHECK(HttpController::status_for(make_error(ErrorKind::kInvalidSketch, "")) ==
          drogon::k400BadRequest);
    CHECK(HttpController::status_for(make_error(ErrorKind::kIncompatibleNamespaces, "")) ==
          drogon::k400BadRequest);
    CHECK(HttpController::status_for(make_error(ErrorKind::kDataCorruption, "")) ==
          drogon::k500InternalServerError);
    CHECK(HttpController::status_for(make_error(ErrorKind::kMisconfigured, "")) ==
          drogon::k500InternalServerError);
}

int main() {
    g_test_dir = "/tmp/asmhom_http_controller_test";
    g_temp_root = g_test_dir + "/tmp";
    std::filesystem::remove_all(g_test_dir);
    std::filesystem::create_directories(g_temp_root);

    test_health_and_info();
    test_namespace_routes();
    test_search_success();
    test_search_parameters();
    test_search_errors();
    test_status_mapping();

    std::filesystem::remove_all(g_test_dir);

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
