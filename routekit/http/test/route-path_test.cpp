#include "routekit/route-path.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>

namespace routekit {

TEST(RoutePath, ValidPaths) {
  for (std::string_view path : {"a", "users", "users/", "user_profile", "Users2", "_", "0", "api/v2/users",
                                "api/v2/users/", "a/b/c/d/e/f", "UPPER/lower/123/"}) {
    EXPECT_TRUE(IsRoutePathValid(path)) << path;
  }
}

TEST(RoutePath, EmptyPathIsInvalid) { EXPECT_FALSE(IsRoutePathValid("")); }

TEST(RoutePath, SlashesOnlyAreInvalid) {
  for (std::string_view path : {"/", "//", "///"}) {
    EXPECT_FALSE(IsRoutePathValid(path)) << path;
  }
}

TEST(RoutePath, LeadingSlashIsInvalid) {
  EXPECT_FALSE(IsRoutePathValid("/users"));
  EXPECT_FALSE(IsRoutePathValid("/users/"));
}

TEST(RoutePath, EmptySegmentIsInvalid) {
  EXPECT_FALSE(IsRoutePathValid("users//profile"));
  EXPECT_FALSE(IsRoutePathValid("users//"));
}

TEST(RoutePath, NonWordCharactersAreInvalid) {
  for (std::string_view path : {"user-profile", "a b", "users/{id}", "users/:id", "users.json", "users?x=1",
                                "users/*", "caf\xC3\xA9", " users", "users ", "users\\profile"}) {
    EXPECT_FALSE(IsRoutePathValid(path)) << path;
  }
}

TEST(RoutePath, NormalizeAppendsMissingSlash) {
  EXPECT_EQ(NormalizeRoutePath("users"), "users/");
  EXPECT_EQ(NormalizeRoutePath("api/v2/users"), "api/v2/users/");
}

TEST(RoutePath, NormalizeKeepsExistingSlash) {
  EXPECT_EQ(NormalizeRoutePath("users/"), "users/");
  EXPECT_EQ(NormalizeRoutePath("api/v2/"), "api/v2/");
}

TEST(RoutePath, NormalizeIsIdempotent) {
  for (std::string_view path : {"a", "a/", "api/v2/users", "api/v2/users/"}) {
    const std::string once = NormalizeRoutePath(path);
    EXPECT_EQ(NormalizeRoutePath(once), once) << path;
  }
}

TEST(RoutePath, PrependBasePathConcatenates) {
  EXPECT_EQ(PrependBasePath("/users/", "profile/"), "/users/profile/");
  EXPECT_EQ(PrependBasePath("", "profile/"), "profile/");
  // no slash is added nor removed
  EXPECT_EQ(PrependBasePath("/api", "profile/"), "/apiprofile/");
}

}  // namespace routekit
