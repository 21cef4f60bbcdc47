/*
 * PhishShape - Compression-Distance Phishing Classifier
 * Copyright (C) 2026 ShadowStrike Security
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include <gtest/gtest.h>
#include "../../../src/Detection/ResourceSignature.hpp"

#include <string>
#include <vector>

using namespace PhishShape::Detection;

// ============================================================================
// TEST FIXTURE
// ============================================================================
class ResourceSignatureTest : public ::testing::Test {
protected:
    static constexpr const char* kLoginPage = R"(<html><head>
<link rel="stylesheet" href="/css/main.css">
<link rel="icon" href="/favicon.ico">
<LINK REL="preload" HREF='/fonts/a.woff2'>
<script src="https://www.cdn.example/jquery.js?ver=1"></script>
<script>var x = 1;</script>
<style>body { background: url('/img/bg.png'); } .x { background: url(/img/x.png) }</style>
</head><body><img src=" /img/logo.png "><iframe src="https://track.example/frame"></iframe>
<img alt="no source"><video src="movie.mp4"></video></body></html>)";
};

// ============================================================================
// URL SPLITTING AND RESOLUTION
// ============================================================================
TEST_F(ResourceSignatureTest, SplitUrl_AllComponents) {
    const auto p = SplitUrl("https://user@host:8080/p/a?q=1#f");
    EXPECT_EQ(p.scheme, "https");
    EXPECT_TRUE(p.hasAuthority);
    EXPECT_EQ(p.authority, "user@host:8080");
    EXPECT_EQ(p.path, "/p/a");
    EXPECT_EQ(p.query, "q=1");
    EXPECT_EQ(p.fragment, "f");
}

TEST_F(ResourceSignatureTest, SplitUrl_RelativePath_NoAuthority) {
    const auto p = SplitUrl("img/logo.png");
    EXPECT_TRUE(p.scheme.empty());
    EXPECT_FALSE(p.hasAuthority);
    EXPECT_EQ(p.path, "img/logo.png");
}

TEST_F(ResourceSignatureTest, ResolveUrl_ReferenceResolutionExamples) {
    const std::string base = "http://a/b/c/d;p?q";
    EXPECT_EQ(ResolveUrl(base, "g"), "http://a/b/c/g");
    EXPECT_EQ(ResolveUrl(base, "./g"), "http://a/b/c/g");
    EXPECT_EQ(ResolveUrl(base, "g/"), "http://a/b/c/g/");
    EXPECT_EQ(ResolveUrl(base, "/g"), "http://a/g");
    EXPECT_EQ(ResolveUrl(base, "//g"), "http://g");
    EXPECT_EQ(ResolveUrl(base, "?y"), "http://a/b/c/d;p?y");
    EXPECT_EQ(ResolveUrl(base, "g?y#s"), "http://a/b/c/g?y#s");
    EXPECT_EQ(ResolveUrl(base, "."), "http://a/b/c/");
    EXPECT_EQ(ResolveUrl(base, ".."), "http://a/b/");
    EXPECT_EQ(ResolveUrl(base, "../g"), "http://a/b/g");
    EXPECT_EQ(ResolveUrl(base, "../../../g"), "http://a/g");
    EXPECT_EQ(ResolveUrl(base, "/./g"), "http://a/g");
    EXPECT_EQ(ResolveUrl(base, ""), "http://a/b/c/d;p?q");
}

TEST_F(ResourceSignatureTest, ResolveUrl_AbsoluteReference_Unchanged) {
    EXPECT_EQ(ResolveUrl("https://bank.example/", "https://cdn.example/a/./b.js"), "https://cdn.example/a/b.js");
}

TEST_F(ResourceSignatureTest, ResolveUrl_BaseWithoutPath_RootsReference) {
    EXPECT_EQ(ResolveUrl("https://bank.example", "app.js"), "https://bank.example/app.js");
}

// ============================================================================
// NORMALIZATION
// ============================================================================
TEST_F(ResourceSignatureTest, NormalizeResourceUrl_SkipsEmptyDataAndBlob) {
    EXPECT_EQ(NormalizeResourceUrl(""), "");
    EXPECT_EQ(NormalizeResourceUrl("data:image/png;base64,iVBORw0KGgo="), "");
    EXPECT_EQ(NormalizeResourceUrl("blob:https://bank.example/1234"), "");
}

TEST_F(ResourceSignatureTest, NormalizeResourceUrl_Absolute_HostAndPathWithoutWww) {
    EXPECT_EQ(NormalizeResourceUrl("https://www.cdn.example/lib.js?v=3#x"), "cdn.example/lib.js");
    EXPECT_EQ(NormalizeResourceUrl("http://static.example/a/b.css"), "static.example/a/b.css");
}

TEST_F(ResourceSignatureTest, NormalizeResourceUrl_ProtocolRelative_GetsHttps) {
    EXPECT_EQ(NormalizeResourceUrl("//cdn.example/a.js?x=1"), "https://cdn.example/a.js");
}

TEST_F(ResourceSignatureTest, NormalizeResourceUrl_RelativeWithBase_Resolved) {
    const std::string base = "https://www.bank.example/login/index.html";
    EXPECT_EQ(NormalizeResourceUrl("/static/app.js", base), "bank.example/static/app.js");
    EXPECT_EQ(NormalizeResourceUrl("img/logo.png", base), "bank.example/login/img/logo.png");
    EXPECT_EQ(NormalizeResourceUrl("../css/site.css", "https://bank.example/a/b/page"),
              "bank.example/a/css/site.css");
}

TEST_F(ResourceSignatureTest, NormalizeResourceUrl_RelativeWithoutBase_PathOnly) {
    EXPECT_EQ(NormalizeResourceUrl("img/logo.png?v=2"), "img/logo.png");
}

// ============================================================================
// EXTRACTION
// ============================================================================
TEST_F(ResourceSignatureTest, ExtractResourceReferences_DocumentOrderThenStyles) {
    const auto refs = ExtractResourceReferences(kLoginPage);

    const std::vector<std::string> expected{
        "/css/main.css",
        "/fonts/a.woff2",
        "https://www.cdn.example/jquery.js?ver=1",
        "/img/logo.png",
        "https://track.example/frame",
        "movie.mp4",
        "/img/bg.png",
        "/img/x.png"
    };
    EXPECT_EQ(refs, expected);
}

TEST_F(ResourceSignatureTest, ExtractResourceReferences_LinkWithoutResourceRel_Ignored) {
    const auto refs = ExtractResourceReferences(
        R"(<link rel="canonical" href="/home"><link href="/orphan.css"><link rel="dns-prefetch" href="//cdn.example">)");
    EXPECT_EQ(refs, (std::vector<std::string>{ "//cdn.example" }));
}

TEST_F(ResourceSignatureTest, ExtractResourceReferences_FirstAttributeWins) {
    const auto refs = ExtractResourceReferences(R"(<img src="/first.png" src="/second.png">)");
    EXPECT_EQ(refs, (std::vector<std::string>{ "/first.png" }));
}

TEST_F(ResourceSignatureTest, ExtractResourceReferences_DataSrcNotConfusedWithSrc) {
    const auto refs = ExtractResourceReferences(R"(<img data-src="/lazy.png" src="/real.png">)");
    EXPECT_EQ(refs, (std::vector<std::string>{ "/real.png" }));
}

TEST_F(ResourceSignatureTest, ExtractResourceReferences_NoResources_Empty) {
    EXPECT_TRUE(ExtractResourceReferences("<html><body><p>hello</p></body></html>").empty());
}

TEST_F(ResourceSignatureTest, ExtractResourceReferences_MegabyteDataUri_Handled) {
    const std::string html = "<img src=\"data:image/png;base64," + std::string(1024 * 1024, 'A') +
                             "\"><script src=\"/a.js\"></script>";

    const auto refs = ExtractResourceReferences(html);
    ASSERT_EQ(refs.size(), 2u);
    EXPECT_EQ(refs[1], "/a.js");

    const auto bytes = ExtractResourceSignature(html, "https://example.com/");
    EXPECT_EQ(std::string(bytes.begin(), bytes.end()), "example.com/a.js");
}

TEST_F(ResourceSignatureTest, ExtractResourceReferences_LargeStyleBlock_Handled) {
    const std::string html = "<style>" + std::string(200 * 1024, ' ') +
                             ".hero { background: url(\"/bg.png\") }</style><img src=\"/logo.png\">";

    const auto refs = ExtractResourceReferences(html);
    EXPECT_EQ(refs, (std::vector<std::string>{ "/logo.png", "/bg.png" }));
}

TEST_F(ResourceSignatureTest, ExtractResourceReferences_LongUnquotedValue_Handled) {
    const std::string path = "/" + std::string(300 * 1024, 'p') + ".js";
    const auto refs = ExtractResourceReferences("<script src=" + path + "></script>");

    ASSERT_EQ(refs.size(), 1u);
    EXPECT_EQ(refs[0], path);
    EXPECT_EQ(NormalizeResourceUrl(refs[0], "https://example.com/"), "example.com" + path);
}

TEST_F(ResourceSignatureTest, ExtractResourceReferences_UnterminatedTag_Stops) {
    const auto refs = ExtractResourceReferences(R"(<img src="/ok.png"><img src="/broken.png)");
    EXPECT_EQ(refs, (std::vector<std::string>{ "/ok.png" }));
}

TEST_F(ResourceSignatureTest, ExtractResourceReferences_QuotedGreaterThan_StaysInValue) {
    const auto refs = ExtractResourceReferences(R"(<img alt="a > b" src="/after.png">)");
    EXPECT_EQ(refs, (std::vector<std::string>{ "/after.png" }));
}

TEST_F(ResourceSignatureTest, ExtractResourceReferences_SimilarTagNames_Ignored) {
    const auto refs = ExtractResourceReferences(R"(<imgx src="/no.png"><scripts src="/no.js"><img src="/yes.png">)");
    EXPECT_EQ(refs, (std::vector<std::string>{ "/yes.png" }));
}

// ============================================================================
// SIGNATURE
// ============================================================================
TEST_F(ResourceSignatureTest, BuildResourceSignature_SortedDedupedSpaceJoined) {
    const std::vector<std::string> refs{ "/b.js", "/a.js?x=1", "data:xyz", "", "/a.js" };
    EXPECT_EQ(BuildResourceSignature(refs), "/a.js /b.js");
}

TEST_F(ResourceSignatureTest, ExtractResourceSignature_LoginPage) {
    const auto bytes = ExtractResourceSignature(kLoginPage, "https://www.bank.example/login/");
    const std::string signature(bytes.begin(), bytes.end());

    EXPECT_EQ(signature,
              "bank.example/css/main.css "
              "bank.example/fonts/a.woff2 "
              "bank.example/img/bg.png "
              "bank.example/img/logo.png "
              "bank.example/img/x.png "
              "bank.example/login/movie.mp4 "
              "cdn.example/jquery.js "
              "track.example/frame");
}

TEST_F(ResourceSignatureTest, ExtractResourceSignature_NoResources_Empty) {
    EXPECT_TRUE(ExtractResourceSignature("<p>plain</p>").empty());
}
