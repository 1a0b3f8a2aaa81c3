#include "herd_cache/resp.hpp"

#include <stdexcept>

namespace herd_cache {
namespace {
constexpr int kMaxDepth = 8;
constexpr long long kMaxBulk = 512LL * 1024 * 1024;
constexpr long long kMaxElements = 1 << 20;

bool parse_ll(const std::string& s, long long& out) {
  if (s.empty()) return false;
  try {
    std::size_t idx = 0;
    out = std::stoll(s, &idx);
    return idx == s.size();
  } catch (const std::exception&) {
    return false;
  }
}
} // namespace

void RespReplyParser::feed(const std::string& data) { buffer_ += data; }

void RespReplyParser::reset() {
  buffer_.clear();
  malformed_ = false;
}

std::optional<RespReply> RespReplyParser::next_reply() {
  if (malformed_ || buffer_.empty()) return std::nullopt;
  std::size_t pos = 0;
  RespReply reply;
  switch (parse(pos, reply, 0)) {
    case Status::Incomplete:
      return std::nullopt;
    case Status::Malformed:
      malformed_ = true;
      return std::nullopt;
    case Status::Ok:
      break;
  }
  buffer_.erase(0, pos);
  return reply;
}

RespReplyParser::Status RespReplyParser::parse_line(std::size_t& pos, std::string& line) const {
  auto crlf = buffer_.find("\r\n", pos);
  if (crlf == std::string::npos) return Status::Incomplete;
  line = buffer_.substr(pos, crlf - pos);
  pos = crlf + 2;
  return Status::Ok;
}

RespReplyParser::Status RespReplyParser::parse(std::size_t& pos, RespReply& out, int depth) const {
  if (depth > kMaxDepth) return Status::Malformed;
  if (pos >= buffer_.size()) return Status::Incomplete;
  const char kind = buffer_[pos];
  std::size_t p = pos + 1;
  std::string line;
  if (auto s = parse_line(p, line); s != Status::Ok) return s;

  switch (kind) {
    case '+':
      out.type = RespReply::Type::Simple;
      out.str = line;
      break;
    case '-':
      out.type = RespReply::Type::Error;
      out.str = line;
      break;
    case ':':
      out.type = RespReply::Type::Integer;
      if (!parse_ll(line, out.integer)) return Status::Malformed;
      break;
    case '$': {
      long long len = 0;
      if (!parse_ll(line, len) || len < -1 || len > kMaxBulk) return Status::Malformed;
      if (len == -1) {
        out.type = RespReply::Type::Null;
        break;
      }
      const std::size_t data_end = p + static_cast<std::size_t>(len);
      if (data_end + 2 > buffer_.size()) return Status::Incomplete;
      if (buffer_.compare(data_end, 2, "\r\n") != 0) return Status::Malformed;
      out.type = RespReply::Type::Bulk;
      out.str = buffer_.substr(p, static_cast<std::size_t>(len));
      p = data_end + 2;
      break;
    }
    case '*': {
      long long n = 0;
      if (!parse_ll(line, n) || n < -1 || n > kMaxElements) return Status::Malformed;
      if (n == -1) {
        out.type = RespReply::Type::Null;
        break;
      }
      out.type = RespReply::Type::Array;
      out.elements.clear();
      out.elements.reserve(static_cast<std::size_t>(n));
      for (long long i = 0; i < n; ++i) {
        RespReply child;
        if (auto s = parse(p, child, depth + 1); s != Status::Ok) return s;
        out.elements.push_back(std::move(child));
      }
      break;
    }
    default:
      return Status::Malformed;
  }
  pos = p;
  return Status::Ok;
}

std::string resp_command(const std::vector<std::string>& args) {
  std::string out = "*" + std::to_string(args.size()) + "\r\n";
  for (const auto& a : args) out += "$" + std::to_string(a.size()) + "\r\n" + a + "\r\n";
  return out;
}

} // namespace herd_cache
