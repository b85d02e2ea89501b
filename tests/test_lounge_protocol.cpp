#include "doctest.h"

#include "tvlink/lounge/lounge_protocol.h"

#include <string>

using namespace tvlink;
using namespace tvlink::lounge;

namespace {

bool contains(const std::string& hay, const std::string& needle)
{
    return hay.find(needle) != std::string::npos;
}

ScreenCredentials sample_creds()
{
    ScreenCredentials c;
    c.screenId = "abc";
    c.loungeToken = "tok";
    c.screenName = "Living Room";
    return c;
}

} // namespace

TEST_CASE("parse_pairing_response: complete screen")
{
    ScreenCredentials out;
    std::string err;
    const StatusCode st = parse_pairing_response(
        R"({"screen":{"screenId":"abc","loungeToken":"tok","screenName":"Living Room"}})", out, err);

    REQUIRE(st == StatusCode::Ok);
    CHECK(out.screenId == "abc");
    CHECK(out.loungeToken == "tok");
    CHECK(out.screenName == "Living Room");
    CHECK(err.empty());
}

TEST_CASE("parse_pairing_response: screen name is optional")
{
    ScreenCredentials out;
    std::string err;
    REQUIRE(parse_pairing_response(R"({"screen":{"screenId":"abc","loungeToken":"tok"}})", out, err) ==
            StatusCode::Ok);
    CHECK(out.screenName.empty());
}

TEST_CASE("parse_pairing_response: failures")
{
    ScreenCredentials out;
    std::string err;

    CHECK(parse_pairing_response("not json", out, err) == StatusCode::ProtocolError);
    CHECK(contains(err, "failed to parse"));

    CHECK(parse_pairing_response(R"({"error":"bad code"})", out, err) == StatusCode::ProtocolError);
    CHECK(contains(err, "missing screen"));

    CHECK(parse_pairing_response(R"({"screen":{"screenId":"abc"}})", out, err) == StatusCode::ProtocolError);
    CHECK(contains(err, "screenId or loungeToken"));

    CHECK(parse_pairing_response(R"({"screen":{"screenId":"","loungeToken":"tok"}})", out, err) ==
          StatusCode::ProtocolError);
}

TEST_CASE("parse_bind_response: SID and gsessionid")
{
    ChannelIds ids;
    REQUIRE(parse_bind_response("[\"c\",\"SID123\",\"\",8]\n[\"S\",\"GS456\"]", ids) == StatusCode::Ok);
    CHECK(ids.sid == "SID123");
    CHECK(ids.gsessionId == "GS456");
}

TEST_CASE("parse_bind_response: chunked body without gsessionid")
{
    ChannelIds ids;
    const std::string body = "42\n[[0,[\"c\",\"XYZ\",\"\",8]],[1,[\"noop\"]]]\n";
    REQUIRE(parse_bind_response(body, ids) == StatusCode::Ok);
    CHECK(ids.sid == "XYZ");
    CHECK(ids.gsessionId.empty());
}

TEST_CASE("parse_bind_response: missing SID is an error")
{
    ChannelIds ids;
    CHECK(parse_bind_response("[\"S\",\"GS456\"]", ids) == StatusCode::ProtocolError);
    CHECK(parse_bind_response("", ids) == StatusCode::ProtocolError);
    CHECK(parse_bind_response("[\"c\",\"\"]", ids) == StatusCode::ProtocolError);
}

TEST_CASE("parse_poll_event_id: highest tuple id wins")
{
    std::uint32_t id = 0;
    REQUIRE(parse_poll_event_id("[[5,[\"a\"]],[7,[\"b\"]]]", id));
    CHECK(id == 7);

    REQUIRE(parse_poll_event_id("[[9,[\"a\"]],[3,[\"b\"]]]", id));
    CHECK(id == 9);
}

TEST_CASE("parse_poll_event_id: chunks with length prefixes and whitespace")
{
    const std::string body =
        "54\n"
        "[[12,[\"nowPlaying\",{}]],\n"
        " [ 13 ,[\"onStateChange\",{\"state\":\"1\"}]]]\n"
        "20\n"
        "[[14,[\"noop\"]]]\n";
    std::uint32_t id = 0;
    REQUIRE(parse_poll_event_id(body, id));
    CHECK(id == 14);
}

TEST_CASE("parse_poll_event_id: brackets inside payloads are ignored")
{
    // The [99,...] lives in a string and the [50,...] is nested in a payload.
    const std::string body = "[[4,[\"x\",\"[[99,\\\"]\"]],[5,[\"y\",[50,1]]]]";
    std::uint32_t id = 0;
    REQUIRE(parse_poll_event_id(body, id));
    CHECK(id == 5);
}

TEST_CASE("parse_poll_event_id: nothing found leaves value untouched")
{
    std::uint32_t id = 77;
    CHECK_FALSE(parse_poll_event_id("", id));
    CHECK_FALSE(parse_poll_event_id("[\"noop\"]", id));
    CHECK_FALSE(parse_poll_event_id("[[\"c\",\"SID\"]]", id));
    CHECK(id == 77);
}

TEST_CASE("build_pairing_request")
{
    ClientIdentity who;
    const auto req = build_pairing_request(who, "123 456");
    CHECK(req.method == net::HttpMethod::Get);
    CHECK(req.url == "https://www.youtube.com/api/lounge/pairing/get_screen?pairing_code=123+456");
}

TEST_CASE("build_bind_request")
{
    ClientIdentity who;
    who.baseUrl = "http://localhost:9000/api/lounge/";
    who.clientName = "My Remote";

    const auto req = build_bind_request(who, sample_creds(), 3);
    CHECK(req.method == net::HttpMethod::Post);
    CHECK(req.url ==
          "http://localhost:9000/api/lounge/bc/bind?device=REMOTE_CONTROL&name=My+Remote"
          "&id=abc&loungeIdToken=tok&VER=8&RID=3");
    CHECK(req.body == "count=0");
    REQUIRE(req.headers.size() == 1);
    CHECK(req.headers[0].first == "Content-Type");
    CHECK(req.headers[0].second == "application/x-www-form-urlencoded");
}

TEST_CASE("build_command_request: addVideo and setVideo")
{
    ClientIdentity who;
    ChannelIds ch{"SID123", "GS456"};
    ChannelCounters counters;
    counters.rid = 4;
    counters.aid = 7;
    counters.ofs = 2;

    const auto add = build_command_request(who, sample_creds(), ch, counters, LoungeCommand::AddVideo, "dQw4w9WgXcQ");
    CHECK(contains(add.url, "&RID=4&SID=SID123&AID=7&gsessionid=GS456"));
    CHECK(add.body == "count=1&ofs=2&req0__sc=addVideo&req0_videoId=dQw4w9WgXcQ");

    const auto play = build_command_request(who, sample_creds(), ch, counters, LoungeCommand::SetVideo, "dQw4w9WgXcQ");
    CHECK(play.body == "count=1&ofs=2&req0__sc=setVideo&req0_videoId=dQw4w9WgXcQ&req0_currentTime=0");
}

TEST_CASE("build_command_request: empty gsessionid is omitted")
{
    ClientIdentity who;
    ChannelIds ch{"SID123", ""};
    const auto req = build_command_request(who, sample_creds(), ch, ChannelCounters{}, LoungeCommand::AddVideo, "v");
    CHECK_FALSE(contains(req.url, "gsessionid"));
}

TEST_CASE("build_poll_request")
{
    ClientIdentity who;
    ChannelIds ch{"SID123", "GS456"};
    const auto req = build_poll_request(who, sample_creds(), ch, 7);
    CHECK(req.method == net::HttpMethod::Get);
    CHECK(contains(req.url, "/bc/bind?"));
    CHECK(contains(req.url, "SID=SID123&AID=7&gsessionid=GS456"));
    CHECK(contains(req.url, "&CI=0&TYPE=xmlhttp&RID=rpc"));
}

TEST_CASE("status names")
{
    CHECK(std::string(to_string(LoungeStatus::Connected)) == "connected");
    CHECK(std::string(to_string(LoungeStatus::Disconnected)) == "disconnected");
    CHECK(std::string(to_string(LoungeStatus::Connecting)) == "connecting");
    CHECK(std::string(to_string(LoungeStatus::Error)) == "error");
}
