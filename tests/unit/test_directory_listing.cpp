#include <gtest/gtest.h>
#include <set>
#include "../../src/utils/html/directory_listing.hpp"

using namespace Fetchium::Utils::Html;

TEST(DirectoryListingTest, ReleaseListingLinks) {
    std::string html = R"html(
        <html><body>
        <h1>Index of /pub/firefox/releases/</h1>
        <table>
            <tr><th>Type</th><th>Name</th></tr>
            <tr><td>Dir</td><td><a href="/pub/firefox/">..</a></td></tr>
            <tr><td>Dir</td><td><a href="/pub/firefox/releases/98.0/">98.0/</a></td></tr>
            <tr><td>Dir</td><td><a href="/pub/firefox/releases/115.3.1esr/">115.3.1esr/</a></td></tr>
            <tr><td>Dir</td><td><a class="no-href">orphan</a></td></tr>
        </table>
        </body></html>
    )html";
    auto links = DirectoryListing::entries(html);

    ASSERT_EQ(links.size(), 3u);
    EXPECT_EQ(links[0], "/pub/firefox/");
    EXPECT_EQ(links[1], "/pub/firefox/releases/98.0/");
    EXPECT_EQ(links[2], "/pub/firefox/releases/115.3.1esr/");
}

TEST(DirectoryListingTest, CaseInsensitiveTags) {
    std::string html  = "<A HREF='/pub/firefox/releases/99.0/'>99.0/</A>";
    auto        links = DirectoryListing::entries(html);
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0], "/pub/firefox/releases/99.0/");
}

TEST(DirectoryListingTest, CommentedLinksIgnored) {
    std::string html = R"html(
        <!-- <a href="/pub/firefox/releases/1.0/">1.0/</a> -->
        <a href="/pub/firefox/releases/2.0/">2.0/</a>
        <link rel="stylesheet" href="/style.css">
    )html";
    auto links = DirectoryListing::entries(html);
    std::set<std::string> link_set(links.begin(), links.end());

    EXPECT_FALSE(link_set.count("/pub/firefox/releases/1.0/"));
    EXPECT_TRUE(link_set.count("/pub/firefox/releases/2.0/"));
    EXPECT_FALSE(link_set.count("/style.css"));
}

TEST(DirectoryListingTest, MalformedHtml) {
    auto links = DirectoryListing::entries("<div><a href='/a/'>Unclosed<p>nested<a href=\"/b/\"\" >x</a>");
    EXPECT_GE(links.size(), 1u);
    EXPECT_TRUE(DirectoryListing::entries("").empty());
}

TEST(DirectoryListingTest, LargeListing) {
    std::string html = "<html><body><pre>";
    for (int i = 1; i <= 1000; ++i)
        html += "<a href='" + std::to_string(i) + ".0/'>" + std::to_string(i) + ".0/</a>\n";
    html += "</pre></body></html>";

    auto links = DirectoryListing::entries(html);
    ASSERT_EQ(links.size(), 1000u);
    EXPECT_EQ(links.back(), "1000.0/");
}

TEST(DirectoryListingTest, NestingStress) {
    std::string html;
    for (int i = 0; i < 1000; ++i)
        html += "<div>";
    html += "<a href='/leaf/'>Leaf</a>";
    for (int i = 0; i < 1000; ++i)
        html += "</div>";

    auto links = DirectoryListing::entries(html);
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0], "/leaf/");
}

TEST(DirectoryListingTest, SortAndFragmentLinksSkipped) {
    std::string html = R"html(
        <a href="?C=N;O=D">Name</a><a href="?C=M;O=A">Last modified</a>
        <a href="#top">top</a>
        <a href="  /pub/firefox/releases/128.0/ ">128.0/</a>
        <a href="">empty</a>
    )html";
    auto links = DirectoryListing::entries(html);
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0], "/pub/firefox/releases/128.0/");
}
