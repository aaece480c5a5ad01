#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>
#include "../../src/parser/text_parser.h"

using namespace spidercore;

namespace {

struct RecordingListener {
    std::vector<FoundUrl> found;

    UrlListener callback() {
        return [this](const FoundUrl& url) { found.push_back(url); };
    }

    std::vector<std::string> urls() const {
        std::vector<std::string> result;
        for (const auto& url : found) {
            result.push_back(url.url);
        }
        return result;
    }
};

std::string body(const std::vector<std::string>& lines) {
    std::string result;
    for (const auto& line : lines) {
        if (!result.empty()) result += "\n";
        result += line;
    }
    return result;
}

Resource text_resource(const std::string& content, const std::string& content_type = "text/xyz; charset=UTF-8") {
    return Resource("http://example.com/", content_type, content);
}

void test_can_parse() {
    TextParser parser;
    const std::string root = "/";

    bool threw = false;
    try {
        parser.can_parse(nullptr, &root, false);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    Resource text = text_resource("");
    assert(parser.can_parse(&text, &root, false));
    assert(parser.can_parse(&text, nullptr, false));
    assert(!parser.can_parse(&text, &root, true));

    Resource html = text_resource("", "text/html; charset=UTF-8");
    assert(!parser.can_parse(&html, &root, false));

    Resource upper_html = text_resource("", "Text/HTML");
    assert(!parser.can_parse(&upper_html, &root, false));

    Resource other = text_resource("", "application/xyz");
    assert(!parser.can_parse(&other, &root, false));

    Resource untyped = text_resource("", "");
    assert(!parser.can_parse(&untyped, &root, false));

    Resource plain = text_resource("", "text/plain");
    assert(parser.can_parse(&plain, &root, false));
}

void test_parse_requires_resource() {
    TextParser parser;
    bool threw = false;
    try {
        parser.parse(nullptr, "", 0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

void test_never_completely_parsed() {
    TextParser parser;
    Resource resource = text_resource("Non Empty Body...");
    assert(!parser.parse(&resource, resource.body, 0));
}

void test_no_urls() {
    TextParser parser;
    RecordingListener listener;
    parser.add_listener(listener.callback());

    Resource resource = text_resource(body({
        "Body with no HTTP/S URLs",
        " ://example.com/ ",
        "More text...  ftp://ftp.example.com/ ",
        "Even more text... //noscheme.example.com ",
    }));
    assert(!parser.parse(&resource, resource.body, 0));
    assert(listener.found.empty());
}

void test_finds_delimited_urls() {
    TextParser parser;
    RecordingListener listener;
    parser.add_listener(listener.callback());

    Resource resource = text_resource(body({
        "Body with HTTP/S URLs",
        " - http://plaincomment.example.com some text not part of URL",
        "- \"https://plaincomment.example.com/z.php?x=y\" more text not part of URL",
        "- 'http://plaincomment.example.com/c.pl?x=y' even more text not part of URL",
        "- <https://plaincomment.example.com/d.asp?x=y> ...",
        "- http://plaincomment.example.com/e/e1/e2.html?x=y#stop fragment should be ignored",
        "- (https://plaincomment.example.com/surrounded/with/parenthesis) parenthesis should not be included",
        "- [https://plaincomment.example.com/surrounded/with/brackets] brackets should not be included",
        "- {https://plaincomment.example.com/surrounded/with/curly/brackets} curly brackets should not be included",
        "- mixed case URLs HtTpS://ExAmPlE.CoM/path/ should also be found",
    }));

    assert(!parser.parse(&resource, resource.body, 0));

    const std::vector<std::string> expected = {
        "http://plaincomment.example.com/",
        "https://plaincomment.example.com/z.php?x=y",
        "http://plaincomment.example.com/c.pl?x=y",
        "https://plaincomment.example.com/d.asp?x=y",
        "http://plaincomment.example.com/e/e1/e2.html?x=y",
        "https://plaincomment.example.com/surrounded/with/parenthesis",
        "https://plaincomment.example.com/surrounded/with/brackets",
        "https://plaincomment.example.com/surrounded/with/curly/brackets",
        "https://example.com/path/",
    };
    assert(listener.found.size() == 9);
    assert(listener.urls() == expected);
    for (const auto& found : listener.found) {
        assert(found.depth == 1);
        assert(found.source_url == "http://example.com/");
    }
}

void test_fan_out_to_every_listener() {
    TextParser parser;
    RecordingListener first;
    RecordingListener second;
    parser.add_listener(first.callback());
    parser.add_listener(second.callback());
    assert(parser.listener_count() == 2);

    Resource resource = text_resource("see http://a.example.com/1 and http://b.example.com/2");
    parser.parse(&resource, resource.body, 3);

    const std::vector<std::string> expected = {"http://a.example.com/1", "http://b.example.com/2"};
    assert(first.urls() == expected);
    assert(second.urls() == expected);
    assert(first.found[0].depth == 4);
}

void test_find_text_urls() {
    std::vector<std::string> found;
    auto collect = [&found](const std::string& url) { found.push_back(url); };

    // Path and query keep their case
    assert(find_text_urls("HTTP://Host.Example.com/MixedCase/Path?Q=V", collect) == 1);
    assert(found.back() == "http://host.example.com/MixedCase/Path?Q=V");

    // Userinfo and port survive, only the host is folded
    assert(find_text_urls("x https://User@HOST.example.com:8443?a=b y", collect) == 1);
    assert(found.back() == "https://User@host.example.com:8443/?a=b");

    // Without an opening delimiter the closing characters are part of the match
    assert(find_text_urls("go to http://example.com/a) now", collect) == 1);
    assert(found.back() == "http://example.com/a)");

    // An anchor with no host is skipped
    found.clear();
    assert(find_text_urls("http:// and 'http://' and https://#frag", collect) == 0);
    assert(found.empty());

    // The whole body is consumed to the end
    assert(find_text_urls("https://example.com/end", collect) == 1);
    assert(found.back() == "https://example.com/end");

    assert(find_text_urls("", collect) == 0);
}

} // namespace

int main() {
    test_can_parse();
    test_parse_requires_resource();
    test_never_completely_parsed();
    test_no_urls();
    test_finds_delimited_urls();
    test_fan_out_to_every_listener();
    test_find_text_urls();
    return 0;
}
