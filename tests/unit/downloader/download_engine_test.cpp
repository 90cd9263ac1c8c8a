#include <gtest/gtest.h>
#include <webget/downloader/downloader.hpp>

#include "common/test_helpers.h"
#include "fake_http.h"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;
using namespace webget::downloader;
using namespace std::chrono_literals;
using webget::tests::FakeDiskWriter;
using webget::tests::FakeHttpAdapter;
using webget::tests::FakeResponse;

namespace {

constexpr const char* kLastModified = "Sun, 06 Nov 1994 08:49:37 GMT";
constexpr std::int64_t kLastModifiedEpoch = 784111777;

std::int64_t mtimeEpochSeconds(const fs::path& p) {
    const auto sys = std::chrono::file_clock::to_sys(fs::last_write_time(p));
    return std::chrono::duration_cast<std::chrono::seconds>(sys.time_since_epoch()).count();
}

FakeResponse okResponse(std::string body) {
    FakeResponse r;
    r.headers = {{"Content-Length", std::to_string(body.size())}, {"Last-Modified", kLastModified}};
    r.body = std::move(body);
    return r;
}

} // namespace

class DownloadEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = webget::tests::make_temp_dir("webget_engine_");
        dest_ = root_ / "out";
        temp_ = root_ / "tmp";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    DownloadRequest request(const std::string& url) {
        DownloadRequest r;
        r.uri = url;
        r.destinationDir = dest_;
        r.tempDir = temp_;
        r.identityCandidates = {"Browser/1.0", "Crawler/2.0"};
        r.extraHeaders = {{"Accept", "*/*"}};
        return r;
    }

    std::unique_ptr<IDownloadEngine> engine(FakeHttpAdapter& http) {
        auto d = std::make_unique<FakeDiskWriter>();
        disk_ = d.get();
        return makeDownloadEngineWithDependencies(http, cfg_, std::move(d), clock_.fn());
    }

    fs::path root_;
    fs::path dest_;
    fs::path temp_;
    DownloaderConfig cfg_;
    webget::tests::FakeClock clock_;
    FakeDiskWriter* disk_{nullptr};
};

TEST_F(DownloadEngineTest, DownloadsIntoDestination) {
    auto http = FakeHttpAdapter::always(okResponse("hello world"));
    auto eng = engine(http);

    auto r = eng->download(request("https://h/files/hello.txt"));
    ASSERT_TRUE(r.ok()) << r.error().message;

    const auto& res = r.value();
    EXPECT_EQ(res.finalPath, dest_ / "hello.txt");
    EXPECT_EQ(res.bytesWritten, 11u);
    EXPECT_TRUE(res.sizeWasKnown);
    EXPECT_TRUE(res.sizeMatched);
    EXPECT_EQ(webget::tests::read_file(res.finalPath), "hello world");
    EXPECT_EQ(fs::file_size(res.finalPath), res.bytesWritten);

    // Temp file renamed away, never left behind
    EXPECT_EQ(webget::tests::count_files(temp_), 0u);
    ASSERT_EQ(disk_->createdTemps.size(), 1u);
    EXPECT_NE(disk_->createdTemps[0], res.finalPath);
    EXPECT_EQ(disk_->createdTemps[0].extension(), ".tmp");
    EXPECT_EQ(disk_->createdTemps[0].parent_path(), temp_);

    // Timestamp applied
    ASSERT_TRUE(res.lastModifiedApplied.has_value());
    EXPECT_EQ(mtimeEpochSeconds(res.finalPath), kLastModifiedEpoch);

    // Marker cleared when not blocking
    ASSERT_EQ(disk_->provenanceCalls.size(), 1u);
    EXPECT_FALSE(disk_->provenanceCalls[0].untrusted);
}

TEST_F(DownloadEngineTest, BlockFileMarksUntrusted) {
    FakeResponse resp = okResponse("x");
    resp.effectiveUrl = "https://cdn/x.bin";
    auto http = FakeHttpAdapter::always(resp);
    auto eng = engine(http);

    auto req = request("https://h/x.bin");
    req.blockFile = true;
    auto r = eng->download(req);
    ASSERT_TRUE(r.ok()) << r.error().message;
    ASSERT_EQ(disk_->provenanceCalls.size(), 1u);
    EXPECT_TRUE(disk_->provenanceCalls[0].untrusted);
    EXPECT_EQ(disk_->provenanceCalls[0].sourceUrl, "https://cdn/x.bin");
    EXPECT_EQ(disk_->provenanceCalls[0].file, dest_ / "x.bin");
}

TEST_F(DownloadEngineTest, IgnoreDateKeepsLocalTime) {
    auto http = FakeHttpAdapter::always(okResponse("data"));
    auto eng = engine(http);

    auto req = request("https://h/d.bin");
    req.ignoreDate = true;
    auto r = eng->download(req);
    ASSERT_TRUE(r.ok());
    EXPECT_FALSE(r.value().lastModifiedApplied.has_value());
    EXPECT_TRUE(disk_->mtimeCalls.empty());
    // Well after 1994: the filesystem-assigned time
    EXPECT_GT(mtimeEpochSeconds(r.value().finalPath), kLastModifiedEpoch + 365LL * 24 * 3600);
}

TEST_F(DownloadEngineTest, NoLastModifiedLeavesTimeAlone) {
    FakeResponse resp;
    resp.body = "abc";
    auto http = FakeHttpAdapter::always(resp);
    auto eng = engine(http);

    auto r = eng->download(request("https://h/a.bin"));
    ASSERT_TRUE(r.ok());
    EXPECT_FALSE(r.value().lastModifiedApplied.has_value());
    EXPECT_FALSE(r.value().sizeWasKnown);
    EXPECT_TRUE(r.value().sizeMatched);
    EXPECT_TRUE(disk_->mtimeCalls.empty());
}

TEST_F(DownloadEngineTest, ResolutionFailureCreatesNothing) {
    auto http = FakeHttpAdapter::always(FakeResponse{403, "Forbidden"});
    auto eng = engine(http);

    auto r = eng->download(request("https://h/secret.bin"));
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::Resolution);
    ASSERT_TRUE(r.error().httpStatus.has_value());
    EXPECT_EQ(*r.error().httpStatus, 403);
    EXPECT_EQ(r.error().reason, "Forbidden");
    EXPECT_TRUE(http.streamAttempts.empty());
    EXPECT_FALSE(fs::exists(dest_));
    EXPECT_FALSE(fs::exists(temp_));
}

TEST_F(DownloadEngineTest, NoFileName) {
    auto http = FakeHttpAdapter::always(okResponse("x"));
    auto eng = engine(http);

    auto r = eng->download(request("https://h/"));
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::NoFileName);
    EXPECT_TRUE(http.streamAttempts.empty());
}

TEST_F(DownloadEngineTest, ExplicitNameIsTrimmedAndUsed) {
    FakeResponse resp = okResponse("x");
    resp.headers.push_back({"Content-Disposition", "attachment; filename=\"server.bin\""});
    auto http = FakeHttpAdapter::always(resp);
    auto eng = engine(http);

    auto req = request("https://h/");
    req.explicitFileName = "  custom.bin ";
    auto r = eng->download(req);
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(r.value().finalPath, dest_ / "custom.bin");
}

TEST_F(DownloadEngineTest, ExplicitNameWithPathIsRejected) {
    auto http = FakeHttpAdapter::always(okResponse("x"));
    auto eng = engine(http);

    for (const char* name : {"../escape.bin", "sub/dir.bin", "..", "a\\b.bin"}) {
        auto req = request("https://h/file.bin");
        req.explicitFileName = name;
        auto r = eng->download(req);
        ASSERT_FALSE(r.ok()) << name;
        EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument) << name;
    }
    EXPECT_TRUE(http.headAttempts.empty());
    EXPECT_TRUE(http.streamAttempts.empty());
    EXPECT_FALSE(fs::exists(dest_));
    EXPECT_FALSE(fs::exists(root_ / "escape.bin"));
}

TEST_F(DownloadEngineTest, NoClobberOpensNoStream) {
    webget::tests::write_file(dest_ / "keep.txt", "original");
    auto http = FakeHttpAdapter::always(okResponse("replacement"));
    auto eng = engine(http);

    auto req = request("https://h/keep.txt");
    req.noClobber = true;
    auto r = eng->download(req);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::Clobber);
    EXPECT_TRUE(http.streamAttempts.empty());
    EXPECT_EQ(webget::tests::read_file(dest_ / "keep.txt"), "original");
    EXPECT_FALSE(fs::exists(temp_));
}

TEST_F(DownloadEngineTest, OverwriteIsIdempotent) {
    std::string body = "first";
    FakeHttpAdapter http([&body](const HttpAttempt&) { return okResponse(body); });
    auto eng = engine(http);

    auto first = eng->download(request("https://h/same.txt"));
    ASSERT_TRUE(first.ok());
    body = "second version";
    auto second = eng->download(request("https://h/same.txt"));
    ASSERT_TRUE(second.ok());

    EXPECT_EQ(webget::tests::read_file(dest_ / "same.txt"), "second version");
    EXPECT_EQ(webget::tests::count_files(dest_), 1u);
    EXPECT_EQ(webget::tests::count_files(temp_), 0u);
}

TEST_F(DownloadEngineTest, StreamIdentityFallback) {
    auto http = FakeHttpAdapter::always(okResponse("payload"));
    http.setStreamResponder([](const HttpAttempt& a) {
        if (a.identity == "Browser/1.0")
            return FakeResponse{403, "Forbidden"};
        return okResponse("payload");
    });
    auto eng = engine(http);

    auto r = eng->download(request("https://h/p.bin"));
    ASSERT_TRUE(r.ok()) << r.error().message;
    ASSERT_EQ(http.streamAttempts.size(), 2u);
    EXPECT_EQ(http.streamAttempts[0].identity, "Browser/1.0");
    EXPECT_EQ(http.streamAttempts[1].identity, "Crawler/2.0");
    for (const auto& a : http.streamAttempts) {
        ASSERT_EQ(a.headers.size(), 1u);
        EXPECT_EQ(a.headers[0].name, "Accept");
    }
}

TEST_F(DownloadEngineTest, StreamUnavailable) {
    auto http = FakeHttpAdapter::always(okResponse("payload"));
    http.setStreamResponder(
        [](const HttpAttempt&) { return FakeResponse{503, "Service Unavailable"}; });
    auto eng = engine(http);

    auto r = eng->download(request("https://h/p.bin"));
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::StreamUnavailable);
    EXPECT_EQ(http.streamAttempts.size(), 2u);
    EXPECT_FALSE(fs::exists(dest_ / "p.bin"));
}

TEST_F(DownloadEngineTest, DirectoryCreateFailure) {
    auto http = FakeHttpAdapter::always(okResponse("payload"));
    auto eng = engine(http);
    disk_->failEnsure.insert(dest_);

    auto r = eng->download(request("https://h/p.bin"));
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::DirectoryCreate);
}

TEST_F(DownloadEngineTest, TempFileFailure) {
    auto http = FakeHttpAdapter::always(okResponse("payload"));
    auto eng = engine(http);
    disk_->failCreateTemp = true;

    auto r = eng->download(request("https://h/p.bin"));
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::TempFile);
    EXPECT_FALSE(fs::exists(dest_ / "p.bin"));
}

TEST_F(DownloadEngineTest, TransferFailureRemovesTempByDefault) {
    FakeResponse resp = okResponse("0123456789");
    resp.failAfterBytes = 5;
    auto http = FakeHttpAdapter::always(resp);
    auto eng = engine(http);

    auto r = eng->download(request("https://h/t.bin"));
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::Transfer);
    EXPECT_FALSE(fs::exists(dest_ / "t.bin"));
    EXPECT_EQ(webget::tests::count_files(temp_), 0u);
    EXPECT_EQ(disk_->cleanedUp.size(), 1u);
}

TEST_F(DownloadEngineTest, TransferFailureKeepsPartialOnRequest) {
    FakeResponse resp = okResponse("0123456789");
    resp.failAfterBytes = 5;
    auto http = FakeHttpAdapter::always(resp);
    auto eng = engine(http);

    auto req = request("https://h/t.bin");
    req.keepPartialOnFailure = true;
    auto r = eng->download(req);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::Transfer);
    EXPECT_FALSE(fs::exists(dest_ / "t.bin"));
    ASSERT_EQ(disk_->createdTemps.size(), 1u);
    EXPECT_TRUE(disk_->cleanedUp.empty());
    EXPECT_EQ(webget::tests::read_file(disk_->createdTemps[0]), "01234");
}

TEST_F(DownloadEngineTest, FinalizeFailureLeavesTempAndDestination) {
    webget::tests::write_file(dest_ / "f.bin", "old");
    auto http = FakeHttpAdapter::always(okResponse("new content"));
    auto eng = engine(http);
    disk_->failMove = true;

    auto r = eng->download(request("https://h/f.bin"));
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::Finalize);
    EXPECT_EQ(webget::tests::read_file(dest_ / "f.bin"), "old");
    ASSERT_EQ(disk_->createdTemps.size(), 1u);
    EXPECT_EQ(webget::tests::read_file(disk_->createdTemps[0]), "new content");
}

TEST_F(DownloadEngineTest, SizeMismatchIsObservationOnly) {
    FakeResponse resp = okResponse("short");
    resp.headers[0].value = "100";
    auto http = FakeHttpAdapter::always(resp);
    auto eng = engine(http);

    auto r = eng->download(request("https://h/s.bin"));
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r.value().sizeWasKnown);
    EXPECT_FALSE(r.value().sizeMatched);
    ASSERT_TRUE(r.value().declaredSizeBytes.has_value());
    EXPECT_EQ(*r.value().declaredSizeBytes, 100u);
    EXPECT_EQ(r.value().bytesWritten, 5u);
}

TEST_F(DownloadEngineTest, ProgressIsThrottled) {
    auto http = FakeHttpAdapter::always(okResponse(std::string(1 << 20, 'x')));
    http.maxReadBytes = 1024;
    http.onRead = [this]() { clock_.advance(10ms); };
    auto eng = engine(http);

    std::vector<ProgressEvent> events;
    auto r = eng->download(request("https://h/big.bin"),
                           [&events](const ProgressEvent& ev) { events.push_back(ev); });
    ASSERT_TRUE(r.ok());

    std::vector<ProgressEvent> downloading;
    for (const auto& ev : events) {
        if (ev.stage == ProgressStage::Downloading)
            downloading.push_back(ev);
    }
    // ~1025 reads at 10 ms each is about 10.25 s of transfer
    ASSERT_FALSE(downloading.empty());
    EXPECT_LE(downloading.size(), 42u);
    for (size_t i = 1; i < downloading.size(); ++i) {
        EXPECT_GE(downloading[i].timestamp - downloading[i - 1].timestamp, 250ms);
        EXPECT_GE(downloading[i].downloadedBytes, downloading[i - 1].downloadedBytes);
    }
    EXPECT_EQ(downloading.front().activity, "Downloading big.bin");
    ASSERT_TRUE(downloading.front().percentage.has_value());
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().stage, ProgressStage::Finalizing);
    EXPECT_EQ(events.back().downloadedBytes, 1u << 20);
}

TEST_F(DownloadEngineTest, FastTransferEmitsNoDownloadingEvent) {
    auto http = FakeHttpAdapter::always(okResponse(std::string(4096, 'x')));
    auto eng = engine(http);

    std::vector<ProgressEvent> events;
    auto r = eng->download(request("https://h/small.bin"),
                           [&events](const ProgressEvent& ev) { events.push_back(ev); });
    ASSERT_TRUE(r.ok());
    for (const auto& ev : events) {
        EXPECT_NE(ev.stage, ProgressStage::Downloading);
    }
}

TEST_F(DownloadEngineTest, ProgressDisabled) {
    auto http = FakeHttpAdapter::always(okResponse(std::string(1 << 16, 'x')));
    http.maxReadBytes = 1024;
    http.onRead = [this]() { clock_.advance(100ms); };
    auto eng = engine(http);

    int calls = 0;
    auto req = request("https://h/quiet.bin");
    req.reportProgress = false;
    auto r = eng->download(req, [&calls](const ProgressEvent&) { ++calls; });
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(calls, 0);
}

TEST_F(DownloadEngineTest, UnknownSizeProgressIsIndeterminate) {
    FakeResponse resp;
    resp.body = std::string(8192, 'y');
    auto http = FakeHttpAdapter::always(resp);
    http.maxReadBytes = 1024;
    http.onRead = [this]() { clock_.advance(300ms); };
    auto eng = engine(http);

    std::vector<ProgressEvent> events;
    auto r = eng->download(request("https://h/u.bin"),
                           [&events](const ProgressEvent& ev) { events.push_back(ev); });
    ASSERT_TRUE(r.ok());
    bool sawDownloading = false;
    for (const auto& ev : events) {
        if (ev.stage != ProgressStage::Downloading)
            continue;
        sawDownloading = true;
        EXPECT_FALSE(ev.percentage.has_value());
        EXPECT_FALSE(ev.totalBytes.has_value());
    }
    EXPECT_TRUE(sawDownloading);
}

TEST_F(DownloadEngineTest, BatchContinuesAfterFailure) {
    FakeHttpAdapter http([](const HttpAttempt& a) {
        if (a.url.find("missing") != std::string::npos)
            return FakeResponse{404, "Not Found"};
        return okResponse("ok");
    });
    auto eng = engine(http);

    auto results = eng->downloadMany({request("https://h/missing.bin"), request("https://h/a.bin"),
                                      request("https://h/b.bin")});
    ASSERT_EQ(results.size(), 3u);
    EXPECT_FALSE(results[0].ok());
    EXPECT_EQ(results[0].error().code, ErrorCode::Resolution);
    ASSERT_TRUE(results[1].ok());
    ASSERT_TRUE(results[2].ok());
    EXPECT_EQ(results[1].value().finalPath, dest_ / "a.bin");
    EXPECT_EQ(results[2].value().finalPath, dest_ / "b.bin");
}

TEST_F(DownloadEngineTest, HeadersDoNotLeakAcrossItems) {
    auto http = FakeHttpAdapter::always(okResponse("z"));
    auto eng = engine(http);

    auto first = request("https://h/one.bin");
    first.extraHeaders.push_back({"X-Item", "one"});
    first.identityCandidates = {"Agent/One"};
    auto second = request("https://h/two.bin");

    auto results = eng->downloadMany({first, second});
    ASSERT_TRUE(results[0].ok());
    ASSERT_TRUE(results[1].ok());

    for (const auto* attempts : {&http.headAttempts, &http.streamAttempts}) {
        for (const auto& a : *attempts) {
            if (a.url.find("two.bin") == std::string::npos)
                continue;
            EXPECT_NE(a.identity, "Agent/One");
            for (const auto& h : a.headers) {
                EXPECT_NE(h.name, "X-Item");
            }
        }
    }
}

TEST_F(DownloadEngineTest, EmptyUrlIsInvalid) {
    auto http = FakeHttpAdapter::always(okResponse("z"));
    auto eng = engine(http);
    auto r = eng->download(request(""));
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    EXPECT_TRUE(http.headAttempts.empty());
}

TEST(DownloadEngineConfig, ZeroChunkFallsBackToDefault) {
    auto http = FakeHttpAdapter::always(FakeResponse{});
    DownloaderConfig cfg;
    cfg.copyChunkBytes = 0;
    auto eng = makeDownloadEngine(http, cfg);
    EXPECT_EQ(eng->config().copyChunkBytes, kDefaultCopyChunkBytes);
    EXPECT_EQ(eng->config().progressInterval, 250ms);
}
