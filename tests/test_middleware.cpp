#include <gtest/gtest.h>

#include <memory>

#include "cluster_cpp/middleware.hpp"

using namespace cluster_cpp;

namespace {

    class TagInterceptor : public RequestInterceptor {
       public:
        void prepare(Request& req, const UrlComponents& url) const override {
            req.headers["X-Node"] = url.host + ":" + url.port;
        }
    };

    Request make_request() {
        return Request{HttpMethod::Get, "http://node1:9200/", {}, std::nullopt};
    }

    const UrlComponents kUrl{false, "node1", "9200", "/"};

}  // namespace

TEST(MiddlewareTest, Base64) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
}

TEST(MiddlewareTest, BasicAuthSetsAuthorization) {
    BasicAuthInterceptor auth("user", "secret");
    Request req = make_request();
    auth.prepare(req, kUrl);
    EXPECT_EQ(req.headers["Authorization"], "Basic dXNlcjpzZWNyZXQ=");
}

TEST(MiddlewareTest, DefaultHeadersDoNotOverridePerRequestHeaders) {
    DefaultHeadersInterceptor defaults(
        {{"X-Opaque-Id", "default"}, {"Accept", "application/json"}});
    Request req = make_request();
    req.headers["X-Opaque-Id"] = "mine";
    defaults.prepare(req, kUrl);
    EXPECT_EQ(req.headers["X-Opaque-Id"], "mine");
    EXPECT_EQ(req.headers["Accept"], "application/json");
}

TEST(MiddlewareTest, ApplyInterceptorsRunsInOrderAndSkipsNull) {
    InterceptorList list{std::make_shared<TagInterceptor>(), nullptr,
                         std::make_shared<BasicAuthInterceptor>("a", "b")};
    Request req = make_request();
    apply_interceptors(list, req, kUrl);
    EXPECT_EQ(req.headers["X-Node"], "node1:9200");
    EXPECT_EQ(req.headers["Authorization"], "Basic YTpi");
}
