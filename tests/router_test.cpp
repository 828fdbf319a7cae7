#include "waypoint/routing/Router.hpp"
#include "waypoint/routing/RoutingError.hpp"

#include "TestRoutes.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>

using namespace waypoint::routing;
using namespace waypoint::test;

class RouterTest : public ::testing::Test {
protected:
    Router router{referenceRecords()};
};

TEST_F(RouterTest, GetUriForRouteWithoutPlaceholders) {
    EXPECT_EQ(router.getUri("home", {}), "/");
}

TEST_F(RouterTest, GetUriSubstitutesParameters) {
    EXPECT_EQ(router.getUri("user", {{"id", "101"}}), "/user/101");
}

TEST_F(RouterTest, GetUriRejectsValueFailingRequirement) {
    try {
        router.getUri("user", {{"id", "abc"}});
        FAIL() << "expected RoutingError";
    } catch (const RoutingError& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::parameterDoesNotMatchRequirement);
        EXPECT_EQ(ex.subject(), "id");
        EXPECT_EQ(ex.value(), "abc");
        EXPECT_EQ(ex.pattern(), "^[0-9]+");
    }
}

TEST_F(RouterTest, GetUriRequirementMustCoverWholeValue) {
    EXPECT_THROW(router.getUri("user", {{"id", "101abc"}}), RoutingError);
}

TEST_F(RouterTest, GetUriUnknownRoute) {
    try {
        router.getUri("nonexistent", {});
        FAIL() << "expected RoutingError";
    } catch (const RoutingError& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::routeNotFound);
        EXPECT_EQ(ex.subject(), "nonexistent");
    }
}

TEST_F(RouterTest, GetUriMissingParameter) {
    try {
        router.getUri("user", {{"uid", "1"}});
        FAIL() << "expected RoutingError";
    } catch (const RoutingError& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::missingParameter);
        EXPECT_EQ(ex.subject(), "id");
    }
}

TEST_F(RouterTest, GetUriIgnoresExtraParameters) {
    Parameters shared{{"id", "7"}, {"page", "2"}, {"lang", "en"}};
    EXPECT_EQ(router.getUri("home", shared), "/");
    EXPECT_EQ(router.getUri("user", shared), "/user/7");
}

TEST_F(RouterTest, GetRouteHome) {
    const Route* route = router.getRoute("/", "get");
    ASSERT_NE(route, nullptr);
    EXPECT_EQ(route->name(), "home");
    EXPECT_EQ(route->methods(), (std::set<std::string>{"get"}));
    EXPECT_EQ(route->middleware(), "");
    EXPECT_EQ(route->controller(), "home_controller::index");
}

TEST_F(RouterTest, GetRouteMethodIsCaseInsensitive) {
    const Route* route = router.getRoute("/user/101", "DELETE");
    ASSERT_NE(route, nullptr);
    EXPECT_EQ(route->name(), "user");
}

TEST_F(RouterTest, GetRouteDisallowedMethodIsNotFound) {
    EXPECT_EQ(router.getRoute("/user/101", "patch"), nullptr);
}

TEST_F(RouterTest, GetRouteUnknownPath) {
    EXPECT_EQ(router.getRoute("/user/abc", "get"), nullptr);
    EXPECT_EQ(router.getRoute("/missing", "get"), nullptr);
    EXPECT_EQ(router.getRoute("/x", "get"), nullptr);
}

TEST_F(RouterTest, MatchReportsPlaceholderValues) {
    auto found = router.match("/user/42", "put");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->route->name(), "user");
    EXPECT_EQ(found->parameters.at("id"), "42");
    EXPECT_TRUE(found->language.empty());
}

TEST_F(RouterTest, RoundTripThroughGetUriAndMatch) {
    Parameters params{{"id", "2048"}};
    auto uri = router.getUri("user", params);
    for (const auto& method : router.table().findByName("user")->methods()) {
        auto found = router.match(uri, method);
        ASSERT_TRUE(found.has_value()) << method;
        EXPECT_EQ(found->route->name(), "user");
        EXPECT_EQ(found->parameters, params);
    }
}

TEST_F(RouterTest, RepeatedCallsAreIdempotent) {
    const Route* first = router.getRoute("/user/5", "get");
    const Route* second = router.getRoute("/user/5", "get");
    EXPECT_EQ(first, second);
    EXPECT_EQ(router.getUri("user", {{"id", "5"}}), router.getUri("user", {{"id", "5"}}));
}

TEST_F(RouterTest, ResolveDistinguishesMethodNotAllowed) {
    auto resolution = router.resolve("/user/101", "patch");
    EXPECT_EQ(resolution.status, ResolveStatus::methodNotAllowed);
    EXPECT_FALSE(resolution.match.has_value());
    EXPECT_EQ(resolution.allowedMethods, (std::set<std::string>{"delete", "get", "post", "put"}));

    auto missing = router.resolve("/nowhere", "get");
    EXPECT_EQ(missing.status, ResolveStatus::notFound);
    EXPECT_TRUE(missing.allowedMethods.empty());

    auto hit = router.resolve("/user/101", "GET");
    ASSERT_EQ(hit.status, ResolveStatus::matched);
    EXPECT_EQ(hit.match->route->name(), "user");
    EXPECT_TRUE(hit.allowedMethods.empty());
}

TEST(RouterPrecedenceTest, EarlierDeclarationWins) {
    auto specific = makeRecord("user_me", "/user/me");
    auto general = makeRecord("user_show", "/user/{id}");
    Router router({specific, general});
    EXPECT_EQ(router.getRoute("/user/me", "get")->name(), "user_me");
    EXPECT_EQ(router.getRoute("/user/7", "get")->name(), "user_show");

    Router reversed({general, specific});
    EXPECT_EQ(reversed.getRoute("/user/me", "get")->name(), "user_show");
}

TEST(RouterPrecedenceTest, MethodMismatchFallsThroughToLaterRoute) {
    Router router({makeRecord("read", "/item/{id}", "get"), makeRecord("write", "/item/{id}", "post, put")});
    EXPECT_EQ(router.getRoute("/item/1", "get")->name(), "read");
    EXPECT_EQ(router.getRoute("/item/1", "post")->name(), "write");

    auto resolution = router.resolve("/item/1", "delete");
    EXPECT_EQ(resolution.status, ResolveStatus::methodNotAllowed);
    EXPECT_EQ(resolution.allowedMethods, (std::set<std::string>{"get", "post", "put"}));
}

TEST(RouterLanguageTest, MatchResolvesLanguagePlaceholder) {
    auto record = makeRecord("blog", "/{lang}/blog/{slug}");
    record.requirements = {{"lang", "en|es"}};
    record.language = "lang";
    Router router({record});

    auto found = router.match("/es/blog/hola", "get");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->language, "es");
    EXPECT_EQ(found->parameters.at("slug"), "hola");
    EXPECT_FALSE(router.match("/fr/blog/salut", "get").has_value());
    EXPECT_EQ(router.getUri("blog", {{"lang", "en"}, {"slug", "hi"}}), "/en/blog/hi");
}

TEST(RouterRequirementTest, AnchoredAlternationRoundTrips) {
    auto record = makeRecord("blog", "/{lang}/blog", "get, post");
    record.requirements = {{"lang", "^en$|^es$"}};
    Router router({record});

    for (const std::string lang : {"en", "es"}) {
        auto uri = router.getUri("blog", {{"lang", lang}});
        EXPECT_EQ(uri, "/" + lang + "/blog");
        auto found = router.match(uri, "post");
        ASSERT_TRUE(found.has_value()) << uri;
        EXPECT_EQ(found->route->name(), "blog");
        EXPECT_EQ(found->parameters.at("lang"), lang);
    }
    EXPECT_THROW(router.getUri("blog", {{"lang", "fr"}}), RoutingError);
    EXPECT_EQ(router.getRoute("/fr/blog", "get"), nullptr);
}

TEST(RouterRequirementTest, TrailingAnchorRoundTrips) {
    auto record = makeRecord("order", "/order/{id}/items");
    record.requirements = {{"id", "^[0-9]+$"}};
    Router router({record});

    auto uri = router.getUri("order", {{"id", "77"}});
    EXPECT_EQ(uri, "/order/77/items");
    ASSERT_NE(router.getRoute(uri, "get"), nullptr);
    EXPECT_EQ(router.match(uri, "get")->parameters.at("id"), "77");
    EXPECT_THROW(router.getUri("order", {{"id", "7a"}}), RoutingError);
}

TEST(RouterConstructionTest, InvalidInputYieldsNoRouter) {
    auto bad = makeRecord("bad", "/x/{id}");
    bad.requirements = {{"id", "[unterminated"}};
    std::vector<RouteRecord> records{makeRecord("ok", "/"), bad};
    EXPECT_THROW(Router{records}, RoutingError);
}

TEST(RouterConstructionTest, FromSourceLoadsYaml) {
    auto router = Router::fromSource(WAYPOINT_TEST_DATA_DIR "/routes.yaml");
    EXPECT_EQ(router.table().size(), 2u);
    EXPECT_EQ(router.getUri("user", {{"id", "101"}}), "/user/101");
    ASSERT_NE(router.getRoute("/", "get"), nullptr);
    EXPECT_EQ(router.getRoute("/", "get")->name(), "home");
}
