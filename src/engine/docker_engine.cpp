#include "engine/docker_engine.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

#include <boost/asio/local/stream_protocol.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "utils/logging.hpp"

namespace kivybot::engine {
namespace {

namespace beast = boost::beast;
namespace http = boost::beast::http;
using LocalProtocol = boost::asio::local::stream_protocol;
using LocalStream = beast::basic_stream<LocalProtocol>;

constexpr std::uint64_t kMaxReplyBytes = 256ULL * 1024 * 1024;
constexpr std::size_t kFrameHeader = 8;

[[noreturn]] void Fail(const beast::error_code& ec, const std::string& stage, const CallOptions& options) {
    if (options.cancel && options.cancel->IsCancelled()) {
        throw OperationCancelled(options.cancel->Reason());
    }
    if (ec == beast::error::timeout) {
        throw EngineError("engine " + stage + " timed out");
    }
    throw EngineError("engine " + stage + " failed: " + ec.message());
}

std::string ErrorMessage(const std::string& body) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_object() && json.contains("message") && json["message"].is_string()) {
        return json["message"].get<std::string>();
    }
    return body;
}

void ExpectStatus(unsigned status, std::initializer_list<unsigned> accepted,
                  const std::string& what, const std::string& body) {
    for (const auto code : accepted) {
        if (status == code) {
            return;
        }
    }
    throw EngineError(what + " returned HTTP " + std::to_string(status) + ": " + ErrorMessage(body),
                      static_cast<int>(status));
}

nlohmann::json ParseBody(const std::string& body, const std::string& what) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded()) {
        throw EngineError(what + " returned malformed JSON");
    }
    return json;
}

nlohmann::json LabelFilter(const std::map<std::string, std::string>& labels) {
    nlohmann::json filter = nlohmann::json::array();
    for (const auto& [key, value] : labels) {
        filter.push_back(key + "=" + value);
    }
    return {{"label", filter}};
}

}  // namespace

LineSplitter::LineSplitter(LineHandler on_line)
    : on_line_(std::move(on_line)) {}

void LineSplitter::Feed(const char* data, std::size_t size) {
    partial_.append(data, size);
    std::size_t start = 0;
    while (true) {
        const auto newline = partial_.find('\n', start);
        if (newline == std::string::npos) {
            break;
        }
        Emit(partial_.substr(start, newline - start));
        start = newline + 1;
    }
    partial_.erase(0, start);
}

void LineSplitter::Flush() {
    if (!partial_.empty()) {
        Emit(partial_);
        partial_.clear();
    }
}

void LineSplitter::Emit(const std::string& line) {
    std::size_t begin = 0;
    std::size_t end = line.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(line[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(line[end - 1]))) {
        --end;
    }
    if (end > begin && on_line_) {
        on_line_(line.substr(begin, end - begin));
    }
}

RawStreamDemuxer::RawStreamDemuxer(LineHandler on_line)
    : stdout_lines_(on_line)
    , stderr_lines_(std::move(on_line)) {}

void RawStreamDemuxer::Feed(const char* data, std::size_t size) {
    if (mode_ == Mode::kRaw) {
        stdout_lines_.Feed(data, size);
        return;
    }
    pending_.append(data, size);
    if (mode_ == Mode::kUnknown) {
        if (pending_.size() < 4) {
            return;
        }
        const auto stream_id = static_cast<unsigned char>(pending_[0]);
        const bool framed = stream_id <= 2 && pending_[1] == '\0' && pending_[2] == '\0' && pending_[3] == '\0';
        mode_ = framed ? Mode::kFramed : Mode::kRaw;
        if (mode_ == Mode::kRaw) {
            stdout_lines_.Feed(pending_.data(), pending_.size());
            pending_.clear();
            return;
        }
    }
    std::size_t pos = 0;
    while (pending_.size() - pos >= kFrameHeader) {
        const auto* header = reinterpret_cast<const unsigned char*>(pending_.data() + pos);
        const std::size_t length = (static_cast<std::size_t>(header[4]) << 24)
                                 | (static_cast<std::size_t>(header[5]) << 16)
                                 | (static_cast<std::size_t>(header[6]) << 8)
                                 | static_cast<std::size_t>(header[7]);
        if (pending_.size() - pos - kFrameHeader < length) {
            break;
        }
        const char* payload = pending_.data() + pos + kFrameHeader;
        if (header[0] == 2) {
            stderr_lines_.Feed(payload, length);
        } else {
            stdout_lines_.Feed(payload, length);
        }
        pos += kFrameHeader + length;
    }
    pending_.erase(0, pos);
}

void RawStreamDemuxer::Finish() {
    if (mode_ == Mode::kUnknown && !pending_.empty()) {
        stdout_lines_.Feed(pending_.data(), pending_.size());
        pending_.clear();
    }
    stdout_lines_.Flush();
    stderr_lines_.Flush();
}

nlohmann::json BuildCreateBody(const ContainerSpec& spec) {
    nlohmann::json host = {
        {"AutoRemove", spec.auto_remove},
        {"ReadonlyRootfs", false}
    };
    if (spec.memory_bytes > 0) {
        host["Memory"] = spec.memory_bytes;
    }
    if (spec.cpu_quota > 0) {
        host["CpuQuota"] = spec.cpu_quota;
    }
    if (spec.network_disabled) {
        host["NetworkMode"] = "none";
    }
    if (!spec.tmpfs.empty()) {
        nlohmann::json tmpfs = nlohmann::json::object();
        for (const auto& [path, options] : spec.tmpfs) {
            tmpfs[path] = options;
        }
        host["Tmpfs"] = tmpfs;
    }
    if (!spec.ulimits.empty()) {
        nlohmann::json ulimits = nlohmann::json::array();
        for (const auto& limit : spec.ulimits) {
            ulimits.push_back({{"Name", limit.name}, {"Soft", limit.soft}, {"Hard", limit.hard}});
        }
        host["Ulimits"] = ulimits;
    }
    if (!spec.security_opt.empty()) {
        host["SecurityOpt"] = spec.security_opt;
    }
    if (!spec.binds.empty()) {
        nlohmann::json binds = nlohmann::json::array();
        for (const auto& mount : spec.binds) {
            binds.push_back(mount.host_path + ":" + mount.container_path + (mount.read_only ? ":ro" : ":rw"));
        }
        host["Binds"] = binds;
    }

    nlohmann::json body = {
        {"Image", spec.image},
        {"Tty", false},
        {"AttachStdout", true},
        {"AttachStderr", true},
        {"HostConfig", host}
    };
    if (!spec.cmd.empty()) {
        body["Cmd"] = spec.cmd;
    }
    if (!spec.env.empty()) {
        body["Env"] = spec.env;
    }
    if (!spec.working_dir.empty()) {
        body["WorkingDir"] = spec.working_dir;
    }
    if (!spec.labels.empty()) {
        nlohmann::json labels = nlohmann::json::object();
        for (const auto& [key, value] : spec.labels) {
            labels[key] = value;
        }
        body["Labels"] = labels;
    }
    if (spec.network_disabled) {
        body["NetworkDisabled"] = true;
    }
    return body;
}

std::string UrlEncode(const std::string& value) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

DockerEngine::DockerEngine(boost::asio::any_io_executor executor, const config::EngineConfig& config)
    : executor_(std::move(executor))
    , socket_path_(config.socket_path)
    , api_version_(config.api_version) {}

std::string DockerEngine::Versioned(const std::string& target) const {
    if (api_version_.empty()) {
        return target;
    }
    return "/" + api_version_ + target;
}

void DockerEngine::EnsureOpen() const {
    if (closed_) {
        throw EngineError("engine connection closed");
    }
}

DockerEngine::Reply DockerEngine::Request(http::verb verb,
                                          const std::string& target,
                                          const std::string& body,
                                          const std::string& content_type,
                                          const CallOptions& options,
                                          Yield yield) {
    EnsureOpen();
    if (options.cancel) {
        options.cancel->ThrowIfCancelled();
    }
    LocalStream stream(executor_);
    CancellationRegistration registration(options.cancel, [&stream]() {
        stream.cancel();
    });

    beast::error_code ec;
    stream.expires_after(options.timeout);
    stream.async_connect(LocalProtocol::endpoint(socket_path_), yield[ec]);
    if (ec) {
        Fail(ec, "connect", options);
    }

    http::request<http::string_body> request{verb, Versioned(target), 11};
    request.set(http::field::host, "docker");
    request.set(http::field::user_agent, "kivybot");
    if (!content_type.empty()) {
        request.set(http::field::content_type, content_type);
    }
    request.body() = body;
    request.prepare_payload();

    http::async_write(stream, request, yield[ec]);
    if (ec) {
        Fail(ec, "write " + target, options);
    }

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(kMaxReplyBytes);
    http::async_read(stream, buffer, parser, yield[ec]);
    if (ec) {
        Fail(ec, "read " + target, options);
    }

    stream.socket().shutdown(LocalProtocol::socket::shutdown_both, ec);
    Reply reply;
    reply.status = parser.get().result_int();
    reply.body = std::move(parser.get().body());
    return reply;
}

void DockerEngine::Stream(http::verb verb,
                          const std::string& target,
                          const std::string& body,
                          const LineHandler& on_line,
                          const CallOptions& options,
                          Yield yield) {
    EnsureOpen();
    if (options.cancel) {
        options.cancel->ThrowIfCancelled();
    }
    LocalStream stream(executor_);
    CancellationRegistration registration(options.cancel, [&stream]() {
        stream.cancel();
    });

    beast::error_code ec;
    stream.expires_after(options.timeout);
    stream.async_connect(LocalProtocol::endpoint(socket_path_), yield[ec]);
    if (ec) {
        Fail(ec, "connect", options);
    }

    http::request<http::string_body> request{verb, Versioned(target), 11};
    request.set(http::field::host, "docker");
    request.set(http::field::user_agent, "kivybot");
    if (!body.empty()) {
        request.set(http::field::content_type, "application/json");
    }
    request.body() = body;
    request.prepare_payload();
    http::async_write(stream, request, yield[ec]);
    if (ec) {
        Fail(ec, "write " + target, options);
    }

    beast::flat_buffer buffer;
    http::response_parser<http::buffer_body> parser;
    parser.body_limit(boost::none);
    http::async_read_header(stream, buffer, parser, yield[ec]);
    if (ec) {
        Fail(ec, "read header " + target, options);
    }
    const auto status = parser.get().result_int();
    if (status != 200 && status != 101) {
        throw EngineError(target + " returned HTTP " + std::to_string(status), static_cast<int>(status));
    }

    RawStreamDemuxer demuxer(on_line);
    char chunk[8192];
    while (!parser.is_done()) {
        parser.get().body().data = chunk;
        parser.get().body().size = sizeof(chunk);
        http::async_read(stream, buffer, parser, yield[ec]);
        if (ec == http::error::need_buffer) {
            ec = {};
        }
        const auto received = sizeof(chunk) - parser.get().body().size;
        if (received > 0) {
            demuxer.Feed(chunk, received);
        }
        if (ec == http::error::end_of_stream || ec == boost::asio::error::eof) {
            break;
        }
        if (ec) {
            demuxer.Finish();
            Fail(ec, "stream " + target, options);
        }
    }
    demuxer.Finish();
}

void DockerEngine::Ping(const CallOptions& options, Yield yield) {
    const auto reply = Request(http::verb::get, "/version", "", "", options, yield);
    ExpectStatus(reply.status, {200}, "version", reply.body);
}

std::string DockerEngine::CreateContainer(const ContainerSpec& spec, const CallOptions& options, Yield yield) {
    std::string target = "/containers/create";
    if (!spec.name.empty()) {
        target += "?name=" + UrlEncode(spec.name);
    }
    const auto reply = Request(http::verb::post, target, BuildCreateBody(spec).dump(),
                               "application/json", options, yield);
    ExpectStatus(reply.status, {201}, "create container", reply.body);
    const auto json = ParseBody(reply.body, "create container");
    if (!json.contains("Id") || !json["Id"].is_string()) {
        throw EngineError("create container returned no Id");
    }
    return json["Id"].get<std::string>();
}

void DockerEngine::StartContainer(const std::string& id, const CallOptions& options, Yield yield) {
    const auto reply = Request(http::verb::post, "/containers/" + id + "/start", "", "", options, yield);
    ExpectStatus(reply.status, {204, 304}, "start container", reply.body);
}

void DockerEngine::StopContainer(const std::string& id, int grace_seconds, const CallOptions& options, Yield yield) {
    const auto reply = Request(http::verb::post,
                               "/containers/" + id + "/stop?t=" + std::to_string(grace_seconds),
                               "", "", options, yield);
    ExpectStatus(reply.status, {204, 304}, "stop container", reply.body);
}

void DockerEngine::KillContainer(const std::string& id, const CallOptions& options, Yield yield) {
    const auto reply = Request(http::verb::post, "/containers/" + id + "/kill", "", "", options, yield);
    ExpectStatus(reply.status, {204}, "kill container", reply.body);
}

void DockerEngine::RemoveContainer(const std::string& id, bool force, const CallOptions& options, Yield yield) {
    const auto reply = Request(http::verb::delete_,
                               "/containers/" + id + "?v=true&force=" + (force ? "true" : "false"),
                               "", "", options, yield);
    ExpectStatus(reply.status, {204, 404}, "remove container", reply.body);
}

std::vector<ContainerSummary> DockerEngine::ListContainers(const std::map<std::string, std::string>& labels,
                                                           const CallOptions& options,
                                                           Yield yield) {
    const auto target = "/containers/json?all=true&filters=" + UrlEncode(LabelFilter(labels).dump());
    const auto reply = Request(http::verb::get, target, "", "", options, yield);
    ExpectStatus(reply.status, {200}, "list containers", reply.body);
    const auto json = ParseBody(reply.body, "list containers");
    std::vector<ContainerSummary> containers;
    if (!json.is_array()) {
        return containers;
    }
    for (const auto& item : json) {
        ContainerSummary summary;
        summary.id = item.value("Id", "");
        summary.state = item.value("State", "");
        if (item.contains("Names") && item["Names"].is_array()) {
            for (const auto& name : item["Names"]) {
                if (name.is_string()) {
                    summary.names.push_back(name.get<std::string>());
                }
            }
        }
        if (item.contains("Labels") && item["Labels"].is_object()) {
            for (const auto& label : item["Labels"].items()) {
                if (label.value().is_string()) {
                    summary.labels[label.key()] = label.value().get<std::string>();
                }
            }
        }
        if (!summary.id.empty()) {
            containers.push_back(std::move(summary));
        }
    }
    return containers;
}

void DockerEngine::PutArchive(const std::string& id,
                              const std::string& dest_dir,
                              const std::string& tar,
                              const CallOptions& options,
                              Yield yield) {
    const auto reply = Request(http::verb::put,
                               "/containers/" + id + "/archive?path=" + UrlEncode(dest_dir),
                               tar, "application/x-tar", options, yield);
    ExpectStatus(reply.status, {200}, "put archive", reply.body);
}

std::optional<std::string> DockerEngine::GetArchive(const std::string& id,
                                                    const std::string& path,
                                                    const CallOptions& options,
                                                    Yield yield) {
    auto reply = Request(http::verb::get,
                         "/containers/" + id + "/archive?path=" + UrlEncode(path),
                         "", "", options, yield);
    if (reply.status == 404) {
        return std::nullopt;
    }
    ExpectStatus(reply.status, {200}, "get archive", reply.body);
    return std::move(reply.body);
}

ExecResult DockerEngine::Exec(const std::string& id,
                              const ExecSpec& spec,
                              const LineHandler& on_line,
                              const CallOptions& options,
                              Yield yield) {
    nlohmann::json create = {
        {"AttachStdout", true},
        {"AttachStderr", true},
        {"Tty", false},
        {"Cmd", spec.cmd}
    };
    if (!spec.env.empty()) {
        create["Env"] = spec.env;
    }
    if (!spec.working_dir.empty()) {
        create["WorkingDir"] = spec.working_dir;
    }
    const auto created = Request(http::verb::post, "/containers/" + id + "/exec",
                                 create.dump(), "application/json", options, yield);
    ExpectStatus(created.status, {201}, "create exec", created.body);
    const auto exec_id = ParseBody(created.body, "create exec").value("Id", "");
    if (exec_id.empty()) {
        throw EngineError("create exec returned no Id");
    }

    const nlohmann::json start = {{"Detach", false}, {"Tty", false}};
    Stream(http::verb::post, "/exec/" + exec_id + "/start", start.dump(), on_line, options, yield);

    ExecResult result;
    const auto inspected = Request(http::verb::get, "/exec/" + exec_id + "/json", "", "", options, yield);
    if (inspected.status == 200) {
        const auto json = ParseBody(inspected.body, "inspect exec");
        if (json.contains("ExitCode") && json["ExitCode"].is_number_integer()) {
            result.exit_code = json["ExitCode"].get<int>();
        }
    } else {
        utils::LogWarn("engine", "inspect exec returned HTTP " + std::to_string(inspected.status));
    }
    return result;
}

void DockerEngine::FollowLogs(const std::string& id,
                              const LineHandler& on_line,
                              const CallOptions& options,
                              Yield yield) {
    Stream(http::verb::get, "/containers/" + id + "/logs?follow=true&stdout=true&stderr=true",
           "", on_line, options, yield);
}

void DockerEngine::Close() {
    closed_ = true;
}

}  // namespace kivybot::engine
