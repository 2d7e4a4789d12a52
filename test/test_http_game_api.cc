#include <gtest/gtest.h>
#include "../src/HttpGameApi.hh"

namespace
{
    ErrorKind kindOf(int status, const string &body)
    {
        try
        {
            HttpGameApi::classifyResponse(status, body);
        }
        catch (const GameApiError &e)
        {
            return e.kind();
        }
        return ErrorKind::None;
    }
}

TEST(HttpGameApiTest, SuccessAndAlreadyDone)
{
    EXPECT_EQ(HttpGameApi::classifyResponse(200, R"({"retcode":0,"message":"OK","data":{}})"), ApiOutcome::Success);
    EXPECT_EQ(HttpGameApi::classifyResponse(200, R"({"retcode":-5003,"message":"already signed"})"), ApiOutcome::AlreadyDone);
    EXPECT_EQ(HttpGameApi::classifyResponse(200, R"({"retcode":0,"data":{"is_done":true}})"), ApiOutcome::AlreadyDone);
}

TEST(HttpGameApiTest, ErrorClassification)
{
    EXPECT_EQ(kindOf(200, R"({"retcode":-100,"message":"login"})"), ErrorKind::AuthError);
    EXPECT_EQ(kindOf(200, R"({"retcode":10001})"), ErrorKind::AuthError);
    EXPECT_EQ(kindOf(200, R"({"retcode":-110})"), ErrorKind::RateLimited);
    EXPECT_EQ(kindOf(429, ""), ErrorKind::RateLimited);
    EXPECT_EQ(kindOf(503, "busy"), ErrorKind::NetworkError);
    EXPECT_EQ(kindOf(403, ""), ErrorKind::AuthError);
    EXPECT_EQ(kindOf(200, "<html>"), ErrorKind::UnknownAPIError);
    EXPECT_EQ(kindOf(200, R"({"retcode":-1,"message":"??"})"), ErrorKind::UnknownAPIError);
}

TEST(HttpGameApiTest, VerificationGateCarriesChallenge)
{
    const string body = R"({"retcode":0,"data":{"risk_code":375,"gt":"gt-key","challenge":"ch-1"}})";

    try
    {
        HttpGameApi::classifyResponse(200, body);
        FAIL() << "expected a verification gate";
    }
    catch (const GameApiError &e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::VerificationRequired);
        ASSERT_TRUE(e.challenge().has_value());
        EXPECT_EQ(e.challenge()->gt, "gt-key");
        EXPECT_EQ(e.challenge()->challenge, "ch-1");
        EXPECT_EQ(e.challenge()->payload, body);
    }

    EXPECT_EQ(kindOf(200, R"({"retcode":1034,"data":{"gt":"g","challenge":"c"}})"), ErrorKind::VerificationRequired);
}

TEST(HttpGameApiTest, MissingMissionEndpointIsUnknown)
{
    GameEndpoint endpoint;
    endpoint.baseUrl = "http://127.0.0.1:1";
    endpoint.signPath = "/sign";

    HttpGameApi api(endpoint, chrono::milliseconds(100));
    Account account;
    account.id = "a";

    try
    {
        api.performMission(account, "StarRail", TaskKind::Share, nullptr);
        FAIL() << "expected GameApiError";
    }
    catch (const GameApiError &e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::UnknownAPIError);
    }
}
