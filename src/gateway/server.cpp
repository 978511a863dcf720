#include "tallykeep/gateway/server.hpp"

#include "tallykeep/common/fs.hpp"
#include "tallykeep/common/json_util.hpp"
#include "tallykeep/health/health.hpp"
#include "tallykeep/observability/global.hpp"
#include "tallykeep/usage/snapshot_json.hpp"

#include <openssl/crypto.h>
#include <openssl/sha.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <sstream>
#include <string_view>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace tallykeep::gateway {

namespace {

constexpr std::size_t kMaxBodySize = 256 * 1024;
constexpr int kListenBacklog = 64;
constexpr std::int64_t kMaxTokensPerField = 1'000'000'000'000;
// Each recv waits at most kClientRecvTimeout; a request must be complete
// within kClientDeadline of the accept.
constexpr std::chrono::milliseconds kClientRecvTimeout{1000};
constexpr std::chrono::seconds kClientDeadline{5};

void set_receive_timeout(const int fd, const std::chrono::milliseconds timeout) {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
    observability::record_warning("gateway", std::string("SO_RCVTIMEO failed: ") +
                                                 std::strerror(errno));
  }
}

std::string header_lookup(const HttpRequest &request, const std::string &key) {
  const auto it = request.headers.find(common::to_lower(key));
  if (it == request.headers.end()) {
    return "";
  }
  return it->second;
}

std::array<unsigned char, SHA256_DIGEST_LENGTH> sha256(const std::string &text) {
  std::array<unsigned char, SHA256_DIGEST_LENGTH> digest{};
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest.data());
  return digest;
}

std::string to_hex(const std::array<unsigned char, SHA256_DIGEST_LENGTH> &digest) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(digest.size() * 2);
  for (const unsigned char c : digest) {
    out.push_back(kHex[c >> 4]);
    out.push_back(kHex[c & 0x0f]);
  }
  return out;
}

std::string status_text(const int status) {
  switch (status) {
  case 200:
    return "OK";
  case 400:
    return "Bad Request";
  case 401:
    return "Unauthorized";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 413:
    return "Payload Too Large";
  case 500:
    return "Internal Server Error";
  default:
    return "OK";
  }
}

HttpResponse make_json_response(const int status, const std::string &body) {
  HttpResponse response;
  response.status = status;
  response.content_type = "application/json";
  response.body = body;
  return response;
}

HttpResponse make_error(const int status, const std::string &error) {
  return make_json_response(status, "{\"error\":" + common::json_quote(error) + "}");
}

common::Status read_string_field(const common::JsonFlatMap &fields, const std::string &key,
                                 std::string &out) {
  const auto it = fields.find(key);
  if (it == fields.end() || common::json_is_null(it->second)) {
    return common::Status::success();
  }
  auto parsed = common::json_to_string(it->second);
  if (!parsed.has_value()) {
    return common::Status::error(key + " must be a string");
  }
  out = std::move(*parsed);
  return common::Status::success();
}

common::Status read_token_field(const common::JsonFlatMap &fields, const std::string &key,
                                std::int64_t &out) {
  const auto it = fields.find(key);
  if (it == fields.end() || common::json_is_null(it->second)) {
    return common::Status::success();
  }
  const auto parsed = common::json_to_int(it->second);
  if (!parsed.has_value() || *parsed < 0 || *parsed > kMaxTokensPerField) {
    return common::Status::error(key + " must be an integer between 0 and " +
                                 std::to_string(kMaxTokensPerField));
  }
  out = *parsed;
  return common::Status::success();
}

} // namespace

common::Result<HttpRequest> parse_http_request(const std::string &raw) {
  const auto header_end = raw.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    return common::Result<HttpRequest>::failure("incomplete request");
  }

  std::istringstream head_stream(raw.substr(0, header_end));
  std::string line;
  if (!std::getline(head_stream, line)) {
    return common::Result<HttpRequest>::failure("missing request line");
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }

  std::istringstream request_line(line);
  HttpRequest request;
  std::string http_version;
  if (!(request_line >> request.method >> request.raw_path >> http_version)) {
    return common::Result<HttpRequest>::failure("invalid request line");
  }

  while (std::getline(head_stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    const auto colon = line.find(':');
    if (line.empty() || colon == std::string::npos) {
      continue;
    }
    request.headers[common::to_lower(common::trim(line.substr(0, colon)))] =
        common::trim(line.substr(colon + 1));
  }

  request.body = raw.substr(header_end + 4);
  request.path = request.raw_path.substr(0, request.raw_path.find('?'));
  return common::Result<HttpRequest>::success(std::move(request));
}

std::string render_http_response(const HttpResponse &response) {
  std::ostringstream out;
  out << "HTTP/1.1 " << response.status << " " << status_text(response.status) << "\r\n";
  out << "Content-Type: " << response.content_type << "\r\n";
  out << "Content-Length: " << response.body.size() << "\r\n";
  out << "Connection: close\r\n";
  for (const auto &[key, value] : response.headers) {
    out << key << ": " << value << "\r\n";
  }
  out << "\r\n" << response.body;
  return out.str();
}

GatewayServer::GatewayServer(GatewayOptions options, usage::UsageStatistics &statistics)
    : options_(std::move(options)), statistics_(statistics) {
  if (!options_.local_password.empty()) {
    password_hash_ = to_hex(sha256(options_.local_password));
    keepalive_ =
        std::make_unique<KeepAliveMonitor>(options_.keepalive_timeout, options_.on_keepalive_idle);
  }
}

GatewayServer::~GatewayServer() { stop(); }

common::Status GatewayServer::start() {
  if (running_) {
    return common::Status::error("gateway already running");
  }
  health::mark_component_starting(kGatewayComponent);

  listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
  if (listen_fd_ < 0) {
    return common::Status::error("failed to create listen socket");
  }

  int reuse = 1;
  setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(options_.port);
  const std::string host = options_.host == "localhost" ? "127.0.0.1" : options_.host;
  if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("invalid bind host: " + options_.host);
  }

  if (bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    const std::string msg = std::strerror(errno);
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("bind failed: " + msg);
  }

  if (listen(listen_fd_, kListenBacklog) != 0) {
    const std::string msg = std::strerror(errno);
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("listen failed: " + msg);
  }

  sockaddr_in actual{};
  socklen_t actual_len = sizeof(actual);
  if (getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&actual), &actual_len) == 0) {
    bound_port_ = ntohs(actual.sin_port);
  } else {
    bound_port_ = options_.port;
  }

  running_ = true;
  accept_thread_ = std::thread([this]() { accept_loop(); });
  if (keepalive_ != nullptr) {
    keepalive_->start();
  }
  health::mark_component_ok(kGatewayComponent);
  return common::Status::success();
}

void GatewayServer::stop() {
  if (keepalive_ != nullptr) {
    keepalive_->stop();
  }
  if (!running_) {
    return;
  }
  running_ = false;
  if (listen_fd_ >= 0) {
    shutdown(listen_fd_, SHUT_RDWR);
    close(listen_fd_);
    listen_fd_ = -1;
  }
  {
    // Wakes a handler blocked in recv on an idle client.
    std::lock_guard<std::mutex> lock(client_mutex_);
    if (client_fd_ >= 0) {
      shutdown(client_fd_, SHUT_RDWR);
    }
  }
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  health::mark_component_stopped(kGatewayComponent);
}

HttpResponse GatewayServer::dispatch(const HttpRequest &request) {
  if (request.path == "/health") {
    return request.method == "GET" ? handle_health(request)
                                   : make_error(405, "method_not_allowed");
  }
  if (request.path == "/v0/usage") {
    if (request.method == "GET") {
      return handle_usage_get(request);
    }
    if (request.method == "POST") {
      return handle_usage_post(request);
    }
    return make_error(405, "method_not_allowed");
  }
  if (request.path == "/keep-alive" && keepalive_ != nullptr) {
    return request.method == "GET" ? handle_keepalive(request)
                                   : make_error(405, "method_not_allowed");
  }
  return make_error(404, "not found");
}

HttpResponse GatewayServer::handle_health(const HttpRequest &) const {
  const auto snapshot = health::snapshot();
  std::ostringstream body;
  body << "{\"status\":" << common::json_quote(snapshot.overall())
       << ",\"health\":" << health::snapshot_json() << "}";
  return make_json_response(200, body.str());
}

HttpResponse GatewayServer::handle_usage_get(const HttpRequest &) const {
  const auto snapshot = statistics_.snapshot();
  std::ostringstream body;
  body << "{\"usage\":" << usage::snapshot_to_json(snapshot)
       << ",\"failed_requests\":" << snapshot.failure_count << "}";
  return make_json_response(200, body.str());
}

HttpResponse GatewayServer::handle_usage_post(const HttpRequest &request) {
  auto valid = common::json_validate(request.body);
  if (!valid.ok()) {
    return make_error(400, "invalid_json");
  }
  if (request.body[common::json_skip_ws(request.body, 0)] != '{') {
    return make_error(400, "expected_object");
  }
  if (!statistics_.enabled()) {
    return make_json_response(200, R"({"status":"disabled"})");
  }

  const auto fields = common::json_parse_flat(request.body);

  usage::UsageRecord record;
  for (const auto &[key, target] : std::array<std::pair<const char *, std::string *>, 4>{
           {{"api", &record.api},
            {"model", &record.model},
            {"source", &record.source},
            {"auth_index", &record.auth_index}}}) {
    auto status = read_string_field(fields, key, *target);
    if (!status.ok()) {
      return make_error(400, status.error());
    }
  }
  if (const auto it = fields.find("failed");
      it != fields.end() && !common::json_is_null(it->second)) {
    const auto failed = common::json_to_bool(it->second);
    if (!failed.has_value()) {
      return make_error(400, "failed must be a boolean");
    }
    record.failed = *failed;
  }

  for (const auto &[key, target] :
       std::array<std::pair<const char *, std::int64_t *>, 5>{
           {{"input_tokens", &record.tokens.input_tokens},
            {"output_tokens", &record.tokens.output_tokens},
            {"reasoning_tokens", &record.tokens.reasoning_tokens},
            {"cached_tokens", &record.tokens.cached_tokens},
            {"total_tokens", &record.tokens.total_tokens}}}) {
    auto status = read_token_field(fields, key, *target);
    if (!status.ok()) {
      return make_error(400, status.error());
    }
  }

  statistics_.record(record);
  const auto tokens =
      record.tokens.total_tokens != 0
          ? record.tokens.total_tokens
          : usage::saturating_add(
                usage::saturating_add(record.tokens.input_tokens, record.tokens.output_tokens),
                record.tokens.reasoning_tokens);
  observability::record_tokens_used(static_cast<std::uint64_t>(tokens));
  return make_json_response(200, R"({"status":"recorded"})");
}

HttpResponse GatewayServer::handle_keepalive(const HttpRequest &request) {
  if (!authorized(request)) {
    return make_error(401, "unauthorized");
  }
  keepalive_->touch();
  return make_json_response(200, R"({"status":"ok"})");
}

bool GatewayServer::authorized(const HttpRequest &request) const {
  std::string presented = header_lookup(request, "x-local-password");
  if (presented.empty()) {
    constexpr std::string_view prefix = "Bearer ";
    const std::string authorization = header_lookup(request, "authorization");
    if (authorization.rfind(prefix.data(), 0) == 0) {
      presented = common::trim(authorization.substr(prefix.size()));
    }
  }
  if (presented.empty()) {
    return false;
  }
  // Comparing fixed-size digests keeps the comparison length-independent.
  const std::string presented_hash = to_hex(sha256(presented));
  return presented_hash.size() == password_hash_.size() &&
         CRYPTO_memcmp(presented_hash.data(), password_hash_.data(), password_hash_.size()) == 0;
}

void GatewayServer::accept_loop() {
  while (running_) {
    sockaddr_in client_addr{};
    socklen_t len = sizeof(client_addr);
    const int client = accept(listen_fd_, reinterpret_cast<sockaddr *>(&client_addr), &len);
    if (client < 0) {
      if (!running_) {
        break;
      }
      continue;
    }
    {
      std::lock_guard<std::mutex> lock(client_mutex_);
      if (!running_) {
        close(client);
        break;
      }
      client_fd_ = client;
    }
    set_receive_timeout(client, kClientRecvTimeout);
    handle_client(client);
    {
      std::lock_guard<std::mutex> lock(client_mutex_);
      client_fd_ = -1;
    }
    close(client);
  }
}

void GatewayServer::handle_client(const int client_fd) {
  std::string raw;
  raw.reserve(4096);
  std::array<char, 4096> buf{};

  std::size_t content_length = 0;
  bool header_parsed = false;
  const auto deadline = std::chrono::steady_clock::now() + kClientDeadline;
  while (raw.size() < (kMaxBodySize + 8192)) {
    if (!running_ || std::chrono::steady_clock::now() >= deadline) {
      return;
    }
    const ssize_t n = recv(client_fd, buf.data(), buf.size(), 0);
    if (n <= 0) {
      break;
    }
    raw.append(buf.data(), static_cast<std::size_t>(n));

    const auto header_end = raw.find("\r\n\r\n");
    if (header_end == std::string::npos) {
      continue;
    }
    if (!header_parsed) {
      header_parsed = true;
      auto parsed = parse_http_request(raw.substr(0, header_end + 4));
      if (parsed.ok()) {
        const auto length = common::json_to_int(header_lookup(parsed.value(), "content-length"));
        content_length = length.has_value() && *length > 0 ? static_cast<std::size_t>(*length) : 0;
      }
      if (content_length > kMaxBodySize) {
        const auto text = render_http_response(make_error(413, "request_too_large"));
        send(client_fd, text.data(), text.size(), MSG_NOSIGNAL);
        return;
      }
    }
    if (raw.size() >= header_end + 4 + content_length) {
      break;
    }
  }

  auto parsed = parse_http_request(raw);
  const HttpResponse response =
      parsed.ok() ? dispatch(parsed.value()) : make_error(400, "invalid_request");
  const std::string text = render_http_response(response);
  send(client_fd, text.data(), text.size(), MSG_NOSIGNAL);
}

} // namespace tallykeep::gateway
