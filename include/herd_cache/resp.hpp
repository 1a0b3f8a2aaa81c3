#pragma once

#include <optional>
#include <string>
#include <vector>

namespace herd_cache {

struct RespReply {
  enum class Type { Simple, Error, Integer, Bulk, Null, Array };

  Type type{Type::Null};
  std::string str;
  long long integer{0};
  std::vector<RespReply> elements;

  bool is_error() const { return type == Type::Error; }
  bool is_null() const { return type == Type::Null; }
};

class RespReplyParser {
public:
  void feed(const std::string& data);
  // nullopt until a whole reply is buffered. Once malformed() turns true the
  // stream cannot be resynchronized and the connection must be dropped.
  std::optional<RespReply> next_reply();
  bool malformed() const { return malformed_; }
  void reset();

private:
  enum class Status { Ok, Incomplete, Malformed };
  Status parse(std::size_t& pos, RespReply& out, int depth) const;
  Status parse_line(std::size_t& pos, std::string& line) const;
  std::string buffer_;
  bool malformed_{false};
};

std::string resp_command(const std::vector<std::string>& args);

} // namespace herd_cache
