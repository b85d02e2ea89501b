#include "doctest.h"

#include "tvlink/net/form_encoding.h"

using namespace tvlink::net;

TEST_CASE("url_escape: form rules")
{
    CHECK(url_escape("abcXYZ019-_.~") == "abcXYZ019-_.~");
    CHECK(url_escape("a b") == "a+b");
    CHECK(url_escape("a&b=c") == "a%26b%3Dc");
    CHECK(url_escape("[\"x\"]") == "%5B%22x%22%5D");
    CHECK(url_escape("\xC3\xA9") == "%C3%A9");
    CHECK(url_escape("") == "");
}

TEST_CASE("form_encode keeps insertion order")
{
    FormParams p{{"count", "1"}, {"ofs", "0"}, {"req0__sc", "addVideo"}};
    CHECK(form_encode(p) == "count=1&ofs=0&req0__sc=addVideo");
    CHECK(form_encode({}) == "");
}

TEST_CASE("form_set replaces in place or appends")
{
    FormParams p{{"a", "1"}, {"b", "2"}};
    form_set(p, "a", "x y");
    form_set(p, "c", "3");
    CHECK(form_encode(p) == "a=x+y&b=2&c=3");
}
