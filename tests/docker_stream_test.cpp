#include "engine/docker_engine.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace kivybot::engine {
namespace {

std::string Frame(unsigned char stream, const std::string& payload) {
    std::string frame(8, '\0');
    frame[0] = static_cast<char>(stream);
    frame[4] = static_cast<char>((payload.size() >> 24) & 0xff);
    frame[5] = static_cast<char>((payload.size() >> 16) & 0xff);
    frame[6] = static_cast<char>((payload.size() >> 8) & 0xff);
    frame[7] = static_cast<char>(payload.size() & 0xff);
    return frame + payload;
}

class Collector {
public:
    LineHandler Handler() {
        return [this](const std::string& line) { lines.push_back(line); };
    }

    std::vector<std::string> lines;
};

TEST(LineSplitterTest, JoinsPartialChunksAndTrims) {
    Collector collector;
    LineSplitter splitter(collector.Handler());
    const std::string first = "  hello wor";
    const std::string second = "ld  \r\n\n   \nlast";
    splitter.Feed(first.data(), first.size());
    EXPECT_TRUE(collector.lines.empty());
    splitter.Feed(second.data(), second.size());
    ASSERT_EQ(collector.lines.size(), 1u);
    EXPECT_EQ(collector.lines[0], "hello world");
    splitter.Flush();
    ASSERT_EQ(collector.lines.size(), 2u);
    EXPECT_EQ(collector.lines[1], "last");
}

TEST(RawStreamDemuxerTest, DecodesFramesSplitAcrossChunks) {
    Collector collector;
    RawStreamDemuxer demuxer(collector.Handler());
    const auto data = Frame(1, "out line\n") + Frame(2, "err line\n");
    demuxer.Feed(data.data(), 5);
    demuxer.Feed(data.data() + 5, 10);
    demuxer.Feed(data.data() + 15, data.size() - 15);
    demuxer.Finish();
    ASSERT_EQ(collector.lines.size(), 2u);
    EXPECT_EQ(collector.lines[0], "out line");
    EXPECT_EQ(collector.lines[1], "err line");
}

TEST(RawStreamDemuxerTest, StdoutAndStderrKeepSeparatePartials) {
    Collector collector;
    RawStreamDemuxer demuxer(collector.Handler());
    const auto data = Frame(1, "std") + Frame(2, "err\n") + Frame(1, "out\n");
    demuxer.Feed(data.data(), data.size());
    demuxer.Finish();
    ASSERT_EQ(collector.lines.size(), 2u);
    EXPECT_EQ(collector.lines[0], "err");
    EXPECT_EQ(collector.lines[1], "stdout");
}

TEST(RawStreamDemuxerTest, FallsBackToRawText) {
    Collector collector;
    RawStreamDemuxer demuxer(collector.Handler());
    const std::string data = "plain output\nsecond";
    demuxer.Feed(data.data(), data.size());
    demuxer.Finish();
    ASSERT_EQ(collector.lines.size(), 2u);
    EXPECT_EQ(collector.lines[0], "plain output");
    EXPECT_EQ(collector.lines[1], "second");
}

TEST(RawStreamDemuxerTest, ShortRawOutputIsFlushed) {
    Collector collector;
    RawStreamDemuxer demuxer(collector.Handler());
    demuxer.Feed("ok", 2);
    demuxer.Finish();
    ASSERT_EQ(collector.lines.size(), 1u);
    EXPECT_EQ(collector.lines[0], "ok");
}

TEST(BuildCreateBodyTest, CarriesHardening) {
    ContainerSpec spec;
    spec.image = "kivy-renderer:prewarmed";
    spec.cmd = {"sh", "-c", "true"};
    spec.env = {"DISPLAY=:99"};
    spec.labels = {{"app", "doctor-kivy"}};
    spec.memory_bytes = 512LL * 1024 * 1024;
    spec.cpu_quota = 50000;
    spec.network_disabled = true;
    spec.tmpfs = {{"/tmp", "rw,size=80m,noexec,nosuid,nodev"}};
    spec.ulimits = {{"fsize", 100, 100}};
    spec.security_opt = {"no-new-privileges"};
    spec.binds = {{"/host/runs/job", "/work", false}};

    const auto body = BuildCreateBody(spec);
    EXPECT_EQ(body["Image"], "kivy-renderer:prewarmed");
    EXPECT_EQ(body["Tty"], false);
    EXPECT_EQ(body["NetworkDisabled"], true);
    EXPECT_EQ(body["Labels"]["app"], "doctor-kivy");
    EXPECT_EQ(body["Cmd"].size(), 3u);

    const auto& host = body["HostConfig"];
    EXPECT_EQ(host["Memory"], 512LL * 1024 * 1024);
    EXPECT_EQ(host["CpuQuota"], 50000);
    EXPECT_EQ(host["NetworkMode"], "none");
    EXPECT_EQ(host["Tmpfs"]["/tmp"], "rw,size=80m,noexec,nosuid,nodev");
    EXPECT_EQ(host["Ulimits"][0]["Name"], "fsize");
    EXPECT_EQ(host["SecurityOpt"][0], "no-new-privileges");
    EXPECT_EQ(host["Binds"][0], "/host/runs/job:/work:rw");
    EXPECT_EQ(host["AutoRemove"], false);
}

TEST(BuildCreateBodyTest, OmitsUnsetFields) {
    ContainerSpec spec;
    spec.image = "img";
    spec.network_disabled = false;
    const auto body = BuildCreateBody(spec);
    EXPECT_FALSE(body.contains("Cmd"));
    EXPECT_FALSE(body.contains("NetworkDisabled"));
    EXPECT_FALSE(body["HostConfig"].contains("NetworkMode"));
    EXPECT_FALSE(body["HostConfig"].contains("Binds"));
}

TEST(UrlEncodeTest, EscapesReservedCharacters) {
    EXPECT_EQ(UrlEncode("/work/kivy_screenshot.png"), "/work/kivy_screenshot.png");
    EXPECT_EQ(UrlEncode("{\"label\":[\"a=b\"]}"), "%7B%22label%22%3A%5B%22a%3Db%22%5D%7D");
    EXPECT_EQ(UrlEncode("a b"), "a%20b");
}

}  // namespace
}  // namespace kivybot::engine
