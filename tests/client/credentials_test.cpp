#include <gtest/gtest.h>
#include "syncwatch/client/credentials.hpp"

#include <cstdlib>

using namespace syncwatch::client;

TEST(StaticCredentialProvider, EmptyTokenMeansNoCredential) {
    StaticCredentialProvider provider("");
    EXPECT_FALSE(provider.bearer_token().has_value());

    provider.set_token("secret");
    EXPECT_EQ(provider.bearer_token(), "secret");

    provider.clear();
    EXPECT_FALSE(provider.bearer_token().has_value());
}

TEST(EnvironmentCredentialProvider, ReadsVariableOnEveryCall) {
    const char* variable = "SYNCWATCH_TEST_TOKEN";
    ::unsetenv(variable);

    EnvironmentCredentialProvider provider(variable);
    EXPECT_FALSE(provider.bearer_token().has_value());

    ::setenv(variable, "first", 1);
    EXPECT_EQ(provider.bearer_token(), "first");

    ::setenv(variable, "second", 1);
    EXPECT_EQ(provider.bearer_token(), "second");

    ::setenv(variable, "", 1);
    EXPECT_FALSE(provider.bearer_token().has_value());

    ::unsetenv(variable);
}
