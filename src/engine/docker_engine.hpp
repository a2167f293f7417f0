#pragma once

#include <cstddef>
#include <string>

#include <boost/asio/any_io_executor.hpp>
#include <boost/beast/http/verb.hpp>

#include "config/config_schema.hpp"
#include "engine/engine.hpp"
#include "nlohmann/json.hpp"

namespace kivybot::engine {

// Splits a byte stream into trimmed, non-empty lines.
class LineSplitter {
public:
    explicit LineSplitter(LineHandler on_line);

    void Feed(const char* data, std::size_t size);
    void Flush();

private:
    void Emit(const std::string& line);

    LineHandler on_line_;
    std::string partial_;
};

// Decodes the engine's multiplexed output framing (8-byte header: stream id, 3 zero
// bytes, big-endian payload length). Falls back to raw passthrough when the first
// bytes are not a frame header, as with TTY-attached output.
class RawStreamDemuxer {
public:
    explicit RawStreamDemuxer(LineHandler on_line);

    void Feed(const char* data, std::size_t size);
    void Finish();

private:
    enum class Mode {
        kUnknown,
        kFramed,
        kRaw
    };

    Mode mode_ = Mode::kUnknown;
    std::string pending_;
    LineSplitter stdout_lines_;
    LineSplitter stderr_lines_;
};

nlohmann::json BuildCreateBody(const ContainerSpec& spec);
std::string UrlEncode(const std::string& value);

class DockerEngine : public Engine {
public:
    DockerEngine(boost::asio::any_io_executor executor, const config::EngineConfig& config);

    void Ping(const CallOptions& options, Yield yield) override;

    std::string CreateContainer(const ContainerSpec& spec, const CallOptions& options, Yield yield) override;
    void StartContainer(const std::string& id, const CallOptions& options, Yield yield) override;
    void StopContainer(const std::string& id, int grace_seconds, const CallOptions& options, Yield yield) override;
    void KillContainer(const std::string& id, const CallOptions& options, Yield yield) override;
    void RemoveContainer(const std::string& id, bool force, const CallOptions& options, Yield yield) override;
    std::vector<ContainerSummary> ListContainers(const std::map<std::string, std::string>& labels,
                                                 const CallOptions& options,
                                                 Yield yield) override;

    void PutArchive(const std::string& id,
                    const std::string& dest_dir,
                    const std::string& tar,
                    const CallOptions& options,
                    Yield yield) override;
    std::optional<std::string> GetArchive(const std::string& id,
                                          const std::string& path,
                                          const CallOptions& options,
                                          Yield yield) override;

    ExecResult Exec(const std::string& id,
                    const ExecSpec& spec,
                    const LineHandler& on_line,
                    const CallOptions& options,
                    Yield yield) override;

    void FollowLogs(const std::string& id,
                    const LineHandler& on_line,
                    const CallOptions& options,
                    Yield yield) override;

    void Close() override;

private:
    struct Reply {
        unsigned status = 0;
        std::string body;
    };

    Reply Request(boost::beast::http::verb verb,
                  const std::string& target,
                  const std::string& body,
                  const std::string& content_type,
                  const CallOptions& options,
                  Yield yield);
    void Stream(boost::beast::http::verb verb,
                const std::string& target,
                const std::string& body,
                const LineHandler& on_line,
                const CallOptions& options,
                Yield yield);
    std::string Versioned(const std::string& target) const;
    void EnsureOpen() const;

    boost::asio::any_io_executor executor_;
    std::string socket_path_;
    std::string api_version_;
    bool closed_ = false;
};

}  // namespace kivybot::engine
