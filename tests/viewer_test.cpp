#include "log_reader.hpp"
#include "page_renderer.hpp"
#include "test_support.hpp"
#include "viewer_server.hpp"
#include <gtest/gtest.h>

using namespace testing_support;

TEST(LogReaderTest, TailReturnsLastLines) {
    TempDir dir;
    write_file(dir.file("connection.log"), "one\ntwo\nthree\nfour\n");
    LogReader reader(dir.file("connection.log"));

    auto lines = reader.tail(2);

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "three");
    EXPECT_EQ(lines[1], "four");
    EXPECT_EQ(reader.tail(100).size(), 4u);
}

TEST(LogReaderTest, MissingFileIsEmpty) {
    TempDir dir;
    LogReader reader(dir.file("absent.log"));

    EXPECT_TRUE(reader.tail(10).empty());
}

TEST(LogReaderTest, ClearTruncatesAndCreates) {
    TempDir dir;
    write_file(dir.file("connection.log"), "old entry\n");
    LogReader existing(dir.file("connection.log"));

    ASSERT_TRUE(existing.clear());
    EXPECT_EQ(read_file(dir.file("connection.log")), "");

    LogReader fresh(dir.file("sub/new.log"));
    ASSERT_TRUE(fresh.clear());
    EXPECT_TRUE(std::filesystem::exists(dir.file("sub/new.log")));
}

TEST(PageRendererTest, EscapesHtml) {
    EXPECT_EQ(html_escape("<b>\"Tom\" & 'Jerry'</b>"),
              "&lt;b&gt;&quot;Tom&quot; &amp; &#39;Jerry&#39;&lt;/b&gt;");
}

TEST(PageRendererTest, PageCarriesBadgesLogAndRefresh) {
    PageModel model;
    model.title = "Home <Link>";
    model.log_lines = {"2025-01-01 00:00:00 (-) Alert: <down>"};
    model.log_line_limit = 100;
    model.log_path = "/var/log/connection.log";
    model.status.internet = make_badge(SignalState::Warning);
    model.status.dns = make_badge(SignalState::Up);
    model.refresh_seconds = 60;

    auto html = render_index_page(model);

    EXPECT_NE(html.find("<title>Home &lt;Link&gt;</title>"), std::string::npos);
    EXPECT_NE(html.find("content=\"60\""), std::string::npos);
    EXPECT_NE(html.find("status-warning\">Internet: Degraded"), std::string::npos);
    EXPECT_NE(html.find("status-up\">DNS: Up"), std::string::npos);
    EXPECT_NE(html.find("Alert: &lt;down&gt;"), std::string::npos);
    EXPECT_NE(html.find("action=\"/clear-log\""), std::string::npos);
}

TEST(ViewerServerTest, AllowListAdmitsEveryoneWhenEmpty) {
    EXPECT_TRUE(ViewerServer::is_allowed({}, "203.0.113.9"));
}

TEST(ViewerServerTest, AllowListRejectsUnknownAddresses) {
    std::vector<std::string> allowed = {"127.0.0.1", "192.168.1.10"};

    EXPECT_TRUE(ViewerServer::is_allowed(allowed, "192.168.1.10"));
    EXPECT_FALSE(ViewerServer::is_allowed(allowed, "192.168.1.11"));
}
