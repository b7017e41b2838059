#include <algorithm>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <jsbox/libraries.h>

#include "utils.h"

namespace {

constexpr char kTrustedLib[] = "https://cdnjs.cloudflare.com/ajax/libs/lodash.js/4.17.21/lodash.min.js";
constexpr char kUntrustedLib[] = "https://libs.example.org/chart-4.4.0.min.js";

size_t Count(const std::string& text, const std::string& needle) {
  size_t ret = 0;
  for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
    ret++;
  }
  return ret;
}

class LibraryManagerTest : public ::testing::Test {
 protected:
  MemoryStore store;
  FakeFetcher fetcher;
  std::vector<TrustRequest> trust_requests;
  std::vector<std::string> events;

  LibraryManager::Listener GetListener() {
    LibraryManager::Listener listener;
    listener.OnTrustRequest = [this](const TrustRequest& req) { trust_requests.push_back(req); };
    listener.OnLibraryAdded = [this](const Library& lib) { events.push_back("added " + lib.name); };
    listener.OnLibraryRemoved = [this](const Library& lib) { events.push_back("removed " + lib.name); };
    listener.OnOriginAdded = [this](const std::string& x) { events.push_back("trusted " + x); };
    listener.OnOriginRemoved = [this](const std::string& x) { events.push_back("untrusted " + x); };
    listener.OnCleared = [this]() { events.push_back("cleared"); };
    return listener;
  }
  std::unique_ptr<LibraryManager> Make() {
    return std::make_unique<LibraryManager>(store, fetcher, TestLogger("libraries"), GetListener());
  }
};

} // namespace

TEST_F(LibraryManagerTest, DefaultOrigins) {
  auto manager = Make();
  EXPECT_EQ(manager->GetTrustedOrigins(), kDefaultOrigins);
  for (auto& i : kDefaultOrigins) {
    EXPECT_TRUE(manager->IsOriginTrusted(i));
    EXPECT_TRUE(LibraryManager::IsDefaultOrigin(i));
  }
  EXPECT_FALSE(manager->IsOriginTrusted("libs.example.org"));
  auto stats = manager->GetStats();
  EXPECT_EQ(stats.library_count, 0);
  EXPECT_EQ(stats.origin_count, kDefaultOrigins.size());
  EXPECT_EQ(stats.custom_origin_count, 0);
}

TEST_F(LibraryManagerTest, ValidateReference) {
  auto manager = Make();
  auto check = manager->ValidateReference("");
  EXPECT_FALSE(check.valid);
  EXPECT_EQ(check.error, "URL is required");
  check = manager->ValidateReference("lodash.js");
  EXPECT_FALSE(check.valid);
  EXPECT_EQ(check.error, "Invalid URL format");
  check = manager->ValidateReference("https://cdnjs.cloudflare.com/style.css");
  EXPECT_FALSE(check.valid);
  EXPECT_EQ(check.error, "URL must point to a JavaScript file (.js)");
  check = manager->ValidateReference(kTrustedLib);
  EXPECT_TRUE(check.valid);
  EXPECT_EQ(check.origin, "cdnjs.cloudflare.com");
  EXPECT_TRUE(check.origin_trusted);
  EXPECT_FALSE(check.needs_approval);
  for (auto url : {"file://cdnjs.cloudflare.com/x/lib.js", "ftp://cdnjs.cloudflare.com/lib.js",
                   "gopher://unpkg.com/a.js", "http://unpkg.com/a.js"}) {
    check = manager->ValidateReference(url);
    EXPECT_FALSE(check.valid) << url;
    EXPECT_FALSE(check.origin_trusted) << url;
    EXPECT_EQ(check.error, "URL must use https") << url;
  }
  check = manager->ValidateReference(kUntrustedLib);
  EXPECT_TRUE(check.valid);
  EXPECT_EQ(check.origin, "libs.example.org");
  EXPECT_FALSE(check.origin_trusted);
  EXPECT_TRUE(check.needs_approval);
}

TEST_F(LibraryManagerTest, AddTrusted) {
  auto manager = Make();
  auto res = manager->AddReference(kTrustedLib);
  ASSERT_TRUE(res.success);
  EXPECT_FALSE(res.needs_approval);
  EXPECT_EQ(res.library.name, "Lodash");
  EXPECT_EQ(res.library.url, kTrustedLib);
  EXPECT_EQ(res.library.origin, "cdnjs.cloudflare.com");
  EXPECT_EQ(res.library.id.rfind("lib_", 0), 0);
  EXPECT_EQ(res.library.id.substr(res.library.id.rfind('_')), "_1");
  EXPECT_EQ(res.library.added_at.back(), 'Z');
  EXPECT_EQ(manager->GetLibraries().size(), 1);
  EXPECT_EQ(events, std::vector<std::string>{"added Lodash"});

  auto dup = manager->AddReference(kTrustedLib, "Another name");
  EXPECT_FALSE(dup.success);
  EXPECT_EQ(dup.error, "Library already added");
  EXPECT_EQ(manager->GetLibraries().size(), 1);
  EXPECT_EQ(events, std::vector<std::string>{"added Lodash"});

  auto named = manager->AddReference("https://unpkg.com/react@18/umd/react.production.min.js", "React");
  ASSERT_TRUE(named.success);
  EXPECT_EQ(named.library.name, "React");
  EXPECT_NE(named.library.id, res.library.id);
}

TEST_F(LibraryManagerTest, NonHttpsReferenceIsNeverAdded) {
  auto manager = Make();
  const std::string url = "file://cdnjs.cloudflare.com/etc/passwd.js";
  fetcher.Serve(url, "leaked");
  auto res = manager->AddReference(url);
  EXPECT_FALSE(res.success);
  EXPECT_FALSE(res.needs_approval);
  EXPECT_EQ(res.error, "URL must use https");
  EXPECT_TRUE(manager->GetLibraries().empty());
  EXPECT_TRUE(trust_requests.empty());
  EXPECT_TRUE(events.empty());
  EXPECT_EQ(manager->BuildBundle(), "");
  EXPECT_EQ(fetcher.Calls(url), 0);
}

TEST_F(LibraryManagerTest, TrustFlow) {
  auto manager = Make();
  auto res = manager->AddReference(kUntrustedLib);
  EXPECT_FALSE(res.success);
  EXPECT_TRUE(res.needs_approval);
  EXPECT_EQ(res.origin, "libs.example.org");
  ASSERT_EQ(trust_requests.size(), 1);
  EXPECT_EQ(trust_requests[0].origin, "libs.example.org");
  EXPECT_EQ(trust_requests[0].url, kUntrustedLib);
  EXPECT_EQ(trust_requests[0].name, "Chart");
  EXPECT_TRUE(manager->GetLibraries().empty());
  EXPECT_FALSE(manager->IsOriginTrusted("libs.example.org"));

  ASSERT_TRUE(manager->AddOrigin("Libs.Example.ORG"));
  EXPECT_TRUE(manager->IsOriginTrusted("libs.example.org"));
  res = manager->AddReference(kUntrustedLib);
  EXPECT_TRUE(res.success);
  EXPECT_EQ(trust_requests.size(), 1);
  EXPECT_EQ(manager->GetStats().custom_origin_count, 1);
  EXPECT_EQ(events, (std::vector<std::string>{"trusted libs.example.org", "added Chart"}));
}

TEST_F(LibraryManagerTest, Origins) {
  auto manager = Make();
  EXPECT_FALSE(manager->AddOrigin("not a host"));
  EXPECT_FALSE(manager->AddOrigin("https://evil.com"));
  EXPECT_FALSE(manager->AddOrigin("unpkg.com"));
  ASSERT_TRUE(manager->AddOrigin("cdn.example.com"));
  EXPECT_FALSE(manager->AddOrigin("cdn.example.com"));
  EXPECT_EQ(manager->GetTrustedOrigins().back(), "cdn.example.com");

  EXPECT_FALSE(manager->RemoveOrigin("unpkg.com"));
  EXPECT_TRUE(manager->IsOriginTrusted("unpkg.com"));
  EXPECT_FALSE(manager->RemoveOrigin("never.example.com"));
  EXPECT_TRUE(manager->RemoveOrigin("CDN.example.com"));
  EXPECT_FALSE(manager->IsOriginTrusted("cdn.example.com"));
  EXPECT_EQ(manager->GetTrustedOrigins(), kDefaultOrigins);
}

TEST_F(LibraryManagerTest, RemoveReference) {
  auto manager = Make();
  auto res = manager->AddReference(kTrustedLib);
  ASSERT_TRUE(res.success);
  EXPECT_FALSE(manager->RemoveReference("lib_unknown"));
  EXPECT_TRUE(manager->RemoveReference(res.library.id));
  EXPECT_TRUE(manager->GetLibraries().empty());
  EXPECT_FALSE(manager->RemoveReference(res.library.id));
  EXPECT_EQ(events.back(), "removed Lodash");
}

TEST_F(LibraryManagerTest, Persistence) {
  std::string id;
  {
    auto manager = Make();
    ASSERT_TRUE(manager->AddOrigin("libs.example.org"));
    auto res = manager->AddReference(kUntrustedLib);
    ASSERT_TRUE(res.success);
    id = res.library.id;
    ASSERT_TRUE(manager->AddReference(kTrustedLib).success);
  }
  // built-in origins are never written out
  auto origins = nlohmann::json::parse(*store.Get(kOriginsKey));
  EXPECT_EQ(origins, nlohmann::json::array({"libs.example.org"}));

  auto manager = Make();
  auto libs = manager->GetLibraries();
  ASSERT_EQ(libs.size(), 2);
  EXPECT_EQ(libs[0].id, id);
  EXPECT_EQ(libs[0].url, kUntrustedLib);
  EXPECT_EQ(libs[1].url, kTrustedLib);
  EXPECT_TRUE(manager->IsOriginTrusted("libs.example.org"));
  EXPECT_EQ(manager->GetTrustedOrigins().size(), kDefaultOrigins.size() + 1);
  EXPECT_TRUE(manager->IsPersistent());
}

TEST_F(LibraryManagerTest, CorruptState) {
  ASSERT_TRUE(store.Set(kLibrariesKey, "{not json"));
  ASSERT_TRUE(store.Set(kOriginsKey, R"({"a": 1})"));
  auto manager = Make();
  EXPECT_TRUE(manager->GetLibraries().empty());
  EXPECT_EQ(manager->GetTrustedOrigins(), kDefaultOrigins);

  ASSERT_TRUE(store.Set(kLibrariesKey,
      R"([{"id":"x","url":"not a url"},5,{"url":"file://unpkg.com/etc/b.js","origin":"unpkg.com"},)"
      R"({"url":"https://unpkg.com/a.js","origin":"cdnjs.cloudflare.com"}])"));
  ASSERT_TRUE(store.Set(kOriginsKey, R"(["good.example.com", 3, "bad host", "unpkg.com"])"));
  manager = Make();
  ASSERT_EQ(manager->GetLibraries().size(), 1);
  EXPECT_EQ(manager->GetLibraries()[0].name, "A");
  EXPECT_EQ(manager->GetLibraries()[0].origin, "unpkg.com");
  EXPECT_FALSE(manager->GetLibraries()[0].id.empty());
  EXPECT_EQ(manager->GetTrustedOrigins().size(), kDefaultOrigins.size() + 1);
  EXPECT_TRUE(manager->IsOriginTrusted("good.example.com"));
}

TEST_F(LibraryManagerTest, WriteFailureKeepsMemoryState) {
  auto manager = Make();
  store.fail_writes = true;
  ASSERT_TRUE(manager->AddReference(kTrustedLib).success);
  EXPECT_FALSE(manager->IsPersistent());
  EXPECT_EQ(manager->GetLibraries().size(), 1);
  store.fail_writes = false;
  ASSERT_TRUE(manager->AddOrigin("cdn.example.com"));
  // no more writes once persistence is lost
  EXPECT_EQ(store.write_count, 0);
  EXPECT_TRUE(manager->IsOriginTrusted("cdn.example.com"));
}

TEST_F(LibraryManagerTest, Clear) {
  auto manager = Make();
  ASSERT_TRUE(manager->AddOrigin("cdn.example.com"));
  ASSERT_TRUE(manager->AddReference(kTrustedLib).success);
  manager->Clear();
  EXPECT_TRUE(manager->GetLibraries().empty());
  EXPECT_EQ(manager->GetTrustedOrigins(), kDefaultOrigins);
  EXPECT_FALSE(store.Get(kLibrariesKey));
  EXPECT_FALSE(store.Get(kOriginsKey));
  EXPECT_EQ(events.back(), "cleared");
  manager = Make();
  EXPECT_TRUE(manager->GetLibraries().empty());
}

TEST_F(LibraryManagerTest, PolicyListsEveryOriginOnce) {
  auto manager = Make();
  ASSERT_TRUE(manager->AddOrigin("cdn.example.com"));
  std::string policy = manager->BuildPolicy();
  EXPECT_EQ(policy.rfind("script-src 'self' 'unsafe-inline' 'unsafe-eval' ", 0), 0);
  EXPECT_EQ(Count(policy, "'self'"), 1);
  for (auto& i : manager->GetTrustedOrigins()) {
    EXPECT_EQ(Count(policy, "https://" + i), 1) << i;
  }
  EXPECT_NE(policy.find("https://cdn.example.com; connect-src 'none'"), std::string::npos);
}

TEST_F(LibraryManagerTest, BundleEmpty) {
  auto manager = Make();
  EXPECT_EQ(manager->BuildBundle(), "");
}

TEST_F(LibraryManagerTest, Bundle) {
  auto manager = Make();
  const std::string other = "https://unpkg.com/missing.js";
  fetcher.Serve(kTrustedLib, "var _ = {}; /* not a */ comment */");
  fetcher.Fail(other, "Timed out");
  ASSERT_TRUE(manager->AddReference(kTrustedLib).success);
  ASSERT_TRUE(manager->AddReference(other).success);

  std::string bundle = manager->BuildBundle();
  EXPECT_NE(bundle.find("/* Library: Lodash */\n/* Source: "), std::string::npos);
  EXPECT_NE(bundle.find("/* Library: Missing - FAILED TO LOAD */\n/* Error: Timed out */"),
            std::string::npos);
  EXPECT_LT(bundle.find("Lodash"), bundle.find("Missing"));

  // both elements must survive as JSON array members
  size_t pos = 0;
  std::vector<nlohmann::json> elements;
  while ((pos = bundle.find("\n{", pos)) != std::string::npos) {
    size_t end = bundle.find("},\n", pos);
    ASSERT_NE(end, std::string::npos);
    elements.push_back(nlohmann::json::parse(bundle.substr(pos + 1, end - pos)));
    pos = end;
  }
  ASSERT_EQ(elements.size(), 2);
  EXPECT_EQ(elements[0]["name"], "Lodash");
  EXPECT_EQ(elements[0]["code"], "var _ = {}; /* not a */ comment */");
  EXPECT_EQ(elements[0]["source"], kTrustedLib);
  EXPECT_TRUE(elements[0].contains("fetched"));
  EXPECT_EQ(elements[1]["name"], "Missing");
  EXPECT_EQ(elements[1]["error"], "Timed out");
  EXPECT_FALSE(elements[1].contains("code"));
}

TEST_F(LibraryManagerTest, BundleCache) {
  auto manager = Make();
  fetcher.Serve(kTrustedLib, "var x = 1;");
  ASSERT_TRUE(manager->AddReference(kTrustedLib).success);
  std::string first = manager->BuildBundle();
  EXPECT_EQ(manager->BuildBundle(), first);
  EXPECT_EQ(fetcher.Calls(kTrustedLib), 1);
  manager->ClearCache();
  fetcher.Serve(kTrustedLib, "var x = 2;");
  EXPECT_NE(manager->BuildBundle().find("var x = 2;"), std::string::npos);
  EXPECT_EQ(fetcher.Calls(kTrustedLib), 2);
}

TEST_F(LibraryManagerTest, FailedFetchIsRetried) {
  auto manager = Make();
  fetcher.Fail(kTrustedLib, "HTTP 503");
  ASSERT_TRUE(manager->AddReference(kTrustedLib).success);
  EXPECT_NE(manager->BuildBundle().find("FAILED TO LOAD"), std::string::npos);
  fetcher.Serve(kTrustedLib, "var ok = true;");
  EXPECT_NE(manager->BuildBundle().find("var ok = true;"), std::string::npos);
  EXPECT_EQ(fetcher.Calls(kTrustedLib), 2);
}
