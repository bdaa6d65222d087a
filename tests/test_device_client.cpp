// =============================================================================
// DeviceClient facade against a scripted loopback receiver
// =============================================================================
#include <gtest/gtest.h>
#include "aircast/device_client.hpp"
#include "aircast/errors.hpp"
#include "fake_device.hpp"

#include <curl/curl.h>

#include <filesystem>
#include <fstream>

using namespace aircast;
using namespace aircast::testing;
namespace fs = std::filesystem;

namespace {

ClientOptions fast_options() {
    ClientOptions opts;
    opts.timeout = std::chrono::milliseconds(2000);
    opts.event_poll_interval = std::chrono::milliseconds(50);
    return opts;
}

long http_status(const std::string &url) {
    long status = 0;
    CURL *curl = curl_easy_init();
    if (!curl) return status;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 5L);
    if (curl_easy_perform(curl) == CURLE_OK) curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_cleanup(curl);
    return status;
}

class DeviceClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("aircast-client-" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir_);
        std::ofstream(dir_ / "a b.mp4") << "video";
        std::ofstream(dir_ / "airplay.m3u8") << "#EXTM3U\n";
        std::ofstream(dir_ / "airplay.ts") << "ts";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
    FakeDevice fake_;
};

} // namespace

TEST_F(DeviceClientTest, ConnectFailureIsConnectionError) {
    std::uint16_t port;
    {
        FakeDevice gone;
        port = gone.port();
    }
    EXPECT_THROW({ DeviceClient client(Device("127.0.0.1", port), fast_options()); }, ConnectionError);
}

TEST_F(DeviceClientTest, ForwardsControlOperations) {
    DeviceClient client(fake_.device(), fast_options());

    EXPECT_TRUE(client.play("http://example.com/a.mp4"));
    EXPECT_TRUE(client.rate(1.0));
    EXPECT_TRUE(client.stop());
    EXPECT_FALSE(client.playback_info().has_value());

    auto requests = fake_.requests();
    ASSERT_EQ(requests.size(), 4u);
    EXPECT_EQ(requests[0].rfind("POST /play ", 0), 0u);
    EXPECT_EQ(requests[1].rfind("POST /rate?value=1.0 ", 0), 0u);
    EXPECT_EQ(requests[2].rfind("POST /stop ", 0), 0u);
    EXPECT_EQ(requests[3].rfind("GET /playback-info ", 0), 0u);
}

TEST_F(DeviceClientTest, ServeReturnsEncodedUrlOnControlInterface) {
    DeviceClient client(fake_.device(), fast_options());

    std::string url = client.serve((dir_ / "a b.mp4").string());
    EXPECT_EQ(url.rfind("http://127.0.0.1:", 0), 0u);
    EXPECT_EQ(url.substr(url.size() - 10), "/a%20b.mp4");
    EXPECT_EQ(http_status(url), 200);
}

TEST_F(DeviceClientTest, ServeSeveralFilesFromOneServer) {
    DeviceClient client(fake_.device(), fast_options());

    auto urls = client.serve(std::vector<std::string>{(dir_ / "airplay.m3u8").string(), (dir_ / "airplay.ts").string()});
    ASSERT_EQ(urls.size(), 2u);
    EXPECT_EQ(urls[0].substr(0, urls[0].rfind('/')), urls[1].substr(0, urls[1].rfind('/')));
    EXPECT_EQ(http_status(urls[0]), 200);
    EXPECT_EQ(http_status(urls[1]), 200);
}

TEST_F(DeviceClientTest, ServeRejectsDirectories) {
    DeviceClient client(fake_.device(), fast_options());
    EXPECT_THROW(client.serve(dir_.string()), std::invalid_argument);
}

TEST_F(DeviceClientTest, EventsStartLazily) {
    DeviceClient client(fake_.device(), fast_options());
    EXPECT_FALSE(fake_.upgraded());

    fake_.push_event(event_request("photo", "playing"));
    fake_.push_event(event_request("video", "stopped"));

    auto ev = client.next_event(true);
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(find_string(*ev, "state"), std::optional<std::string>("stopped"));
    EXPECT_TRUE(fake_.upgraded());

    client.stop_events();
    std::size_t remaining = 0;
    for (const Event &e : client.events(false)) {
        (void)e;
        ++remaining;
    }
    EXPECT_EQ(remaining, 0u);
}

TEST_F(DeviceClientTest, SeekThenReadBack) {
    fake_.on_request([](const std::string &request) {
        if (request.rfind("POST /scrub", 0) == 0) return empty_response();
        return body_response("text/parameters", "duration: 60.0\nposition: 30.0\n");
    });
    DeviceClient client(fake_.device(), fast_options());

    PlaybackPosition pos = client.scrub(30.0);
    EXPECT_DOUBLE_EQ(pos.duration, 60.0);
    EXPECT_DOUBLE_EQ(pos.position, 30.0);
    EXPECT_EQ(fake_.requests().size(), 2u);
}
