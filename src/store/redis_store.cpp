#include "herd_cache/redis_store.hpp"

#include "herd_cache/codec.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <stdexcept>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

namespace herd_cache {
namespace {

// Keys: record. Args: now, new lockUntil, new owner, min physical ttl (ms).
// Returns {exists, value, lockUntil, lockOwner, acquired}.
constexpr const char *kReadAndLockScript = R"(
local v = redis.call('HGET', KEYS[1], 'value')
local lu = redis.call('HGET', KEYS[1], 'lockUntil')
local lo = redis.call('HGET', KEYS[1], 'lockOwner')
local ex = redis.call('EXISTS', KEYS[1])
if ex == 0 or lu == false or tonumber(lu) <= tonumber(ARGV[1]) then
  redis.call('HSET', KEYS[1], 'lockUntil', ARGV[2], 'lockOwner', ARGV[3])
  if redis.call('PTTL', KEYS[1]) < tonumber(ARGV[4]) then
    redis.call('PEXPIRE', KEYS[1], ARGV[4])
  end
  return {ex, v, lu, lo, 1}
end
return {ex, v, lu, lo, 0})";

// Args: encoded value, owner, lockUntil, physical ttl (ms).
constexpr const char *kWriteResultScript = R"(
if redis.call('HGET', KEYS[1], 'lockOwner') ~= ARGV[2] then
  return 0
end
redis.call('HSET', KEYS[1], 'value', ARGV[1], 'lockUntil', ARGV[3])
redis.call('HDEL', KEYS[1], 'lockOwner')
redis.call('PEXPIRE', KEYS[1], ARGV[4])
return 1)";

// Args: owner, now.
constexpr const char *kReleaseScript = R"(
if redis.call('HGET', KEYS[1], 'lockOwner') ~= ARGV[1] then
  return 0
end
redis.call('HSET', KEYS[1], 'lockUntil', ARGV[2])
redis.call('HDEL', KEYS[1], 'lockOwner')
return 1)";

// Args: now, retain (ms). Returns 0 absent, 1 tagged, 2 live lock kept.
constexpr const char *kTagDeletedScript = R"(
if redis.call('EXISTS', KEYS[1]) == 0 then
  return 0
end
local lu = redis.call('HGET', KEYS[1], 'lockUntil')
local lo = redis.call('HGET', KEYS[1], 'lockOwner')
if lo ~= false and lu ~= false and tonumber(lu) > tonumber(ARGV[1]) then
  return 2
end
redis.call('HSET', KEYS[1], 'lockUntil', ARGV[1])
redis.call('HDEL', KEYS[1], 'lockOwner')
local keep = tonumber(ARGV[2])
if keep > 0 then
  local t = redis.call('PTTL', KEYS[1])
  if t < 0 or t > keep then
    redis.call('PEXPIRE', KEYS[1], keep)
  end
end
return 1)";

constexpr const char *kScripts[] = {kReadAndLockScript, kWriteResultScript,
                                    kReleaseScript, kTagDeletedScript};

std::string ms_arg(TimePoint tp) { return std::to_string(to_epoch_ms(tp)); }

std::string ms_arg(std::chrono::milliseconds d) {
  return std::to_string(std::max<std::int64_t>(1, d.count()));
}

bool parse_i64(const std::string &s, std::int64_t &out) {
  try {
    std::size_t idx = 0;
    out = std::stoll(s, &idx);
    return idx == s.size();
  } catch (const std::exception &) {
    return false;
  }
}

bool expect_integer(const RespReply &r, std::string *err) {
  if (r.type == RespReply::Type::Integer)
    return true;
  if (err)
    *err = "unexpected script reply";
  return false;
}

} // namespace

RedisStore::RedisStore(RedisStoreConfig cfg) : cfg_(std::move(cfg)) {}

RedisStore::~RedisStore() { disconnect(); }

bool RedisStore::connect(std::string *err) {
  std::lock_guard<std::mutex> lk(mu_);
  return ensure_connected(err);
}

bool RedisStore::ping(std::string *err) {
  std::lock_guard<std::mutex> lk(mu_);
  RespReply r;
  if (!roundtrip({"PING"}, &r, err))
    return false;
  if (r.type != RespReply::Type::Simple || r.str != "PONG") {
    if (err)
      *err = "unexpected PING reply";
    return false;
  }
  return true;
}

bool RedisStore::read_and_lock(const std::string &key, TimePoint now,
                               const std::string &new_owner,
                               TimePoint new_lock_until,
                               std::chrono::milliseconds lock_physical_ttl,
                               LockRead *out, std::string *err) {
  RespReply r;
  if (!eval(Script::ReadAndLock, key,
            {ms_arg(now), ms_arg(new_lock_until), new_owner,
             ms_arg(lock_physical_ttl)},
            &r, err))
    return false;
  if (r.type != RespReply::Type::Array || r.elements.size() != 5 ||
      r.elements[0].type != RespReply::Type::Integer ||
      r.elements[4].type != RespReply::Type::Integer) {
    if (err)
      *err = "unexpected read_and_lock reply";
    return false;
  }

  LockRead result;
  auto &rec = result.record;
  rec.exists = r.elements[0].integer != 0;
  const auto &v = r.elements[1];
  if (v.type == RespReply::Type::Bulk) {
    std::string codec_err;
    if (!decode_cached_value(v.str, &rec.value, &codec_err)) {
      if (err)
        *err = "corrupt value for " + key + ": " + codec_err;
      return false;
    }
    rec.has_value = true;
  }
  const auto &lu = r.elements[2];
  if (lu.type == RespReply::Type::Bulk) {
    std::int64_t ms = 0;
    if (!parse_i64(lu.str, ms)) {
      if (err)
        *err = "corrupt lockUntil for " + key;
      return false;
    }
    rec.lock_until = from_epoch_ms(ms);
  }
  if (r.elements[3].type == RespReply::Type::Bulk)
    rec.lock_owner = r.elements[3].str;
  result.acquired = r.elements[4].integer == 1;
  if (out)
    *out = std::move(result);
  return true;
}

bool RedisStore::write_result(const std::string &key, const std::string &owner,
                              const std::optional<Bytes> &value,
                              TimePoint lock_until,
                              std::chrono::milliseconds physical_ttl,
                              WriteOutcome *out, std::string *err) {
  RespReply r;
  if (!eval(Script::WriteResult, key,
            {encode_cached_value(value), owner, ms_arg(lock_until),
             ms_arg(physical_ttl)},
            &r, err))
    return false;
  if (!expect_integer(r, err))
    return false;
  if (out)
    *out = r.integer == 1 ? WriteOutcome::Written : WriteOutcome::Stale;
  return true;
}

bool RedisStore::release(const std::string &key, const std::string &owner,
                         TimePoint now, WriteOutcome *out, std::string *err) {
  RespReply r;
  if (!eval(Script::Release, key, {owner, ms_arg(now)}, &r, err))
    return false;
  if (!expect_integer(r, err))
    return false;
  if (out)
    *out = r.integer == 1 ? WriteOutcome::Written : WriteOutcome::Stale;
  return true;
}

bool RedisStore::tag_deleted(const std::string &key, TimePoint now,
                             std::chrono::milliseconds retain, TagOutcome *out,
                             std::string *err) {
  RespReply r;
  if (!eval(Script::TagDeleted, key,
            {ms_arg(now), std::to_string(retain.count())}, &r, err))
    return false;
  if (!expect_integer(r, err))
    return false;
  if (out) {
    if (r.integer == 0)
      *out = TagOutcome::Absent;
    else if (r.integer == 2)
      *out = TagOutcome::LockHeld;
    else
      *out = TagOutcome::Tagged;
  }
  return true;
}

bool RedisStore::eval(Script script, const std::string &key,
                      const std::vector<std::string> &args, RespReply *out,
                      std::string *err) {
  std::lock_guard<std::mutex> lk(mu_);
  const auto idx = static_cast<std::size_t>(script);
  if (sha_[idx].empty() && !load_script(script, err))
    return false;

  std::vector<std::string> cmd{"EVALSHA", sha_[idx], "1", cfg_.key_prefix + key};
  cmd.insert(cmd.end(), args.begin(), args.end());
  if (!roundtrip(cmd, out, err))
    return false;

  // The server forgets scripts on restart or SCRIPT FLUSH.
  if (out->is_error() && out->str.rfind("NOSCRIPT", 0) == 0) {
    if (!load_script(script, err))
      return false;
    cmd[1] = sha_[idx];
    if (!roundtrip(cmd, out, err))
      return false;
  }
  if (out->is_error()) {
    if (err)
      *err = out->str;
    return false;
  }
  return true;
}

bool RedisStore::load_script(Script script, std::string *err) {
  const auto idx = static_cast<std::size_t>(script);
  RespReply r;
  if (!roundtrip({"SCRIPT", "LOAD", kScripts[idx]}, &r, err))
    return false;
  if (r.type != RespReply::Type::Bulk) {
    if (err)
      *err = r.is_error() ? r.str : "unexpected SCRIPT LOAD reply";
    return false;
  }
  sha_[idx] = r.str;
  return true;
}

bool RedisStore::roundtrip(const std::vector<std::string> &args,
                           RespReply *out, std::string *err) {
  if (!ensure_connected(err))
    return false;

  const auto req = resp_command(args);
  std::size_t sent = 0;
  while (sent < req.size()) {
    ssize_t w = send(fd_, req.data() + sent, req.size() - sent, MSG_NOSIGNAL);
    if (w <= 0) {
      if (err)
        *err = std::string("send failed: ") + std::strerror(errno);
      disconnect();
      return false;
    }
    sent += static_cast<std::size_t>(w);
  }

  while (true) {
    auto reply = parser_.next_reply();
    if (reply.has_value()) {
      *out = std::move(*reply);
      return true;
    }
    if (parser_.malformed()) {
      if (err)
        *err = "malformed RESP reply";
      disconnect();
      return false;
    }
    char buf[4096];
    ssize_t r = recv(fd_, buf, sizeof(buf), 0);
    if (r <= 0) {
      if (err)
        *err = r == 0 ? std::string("connection closed by server")
                      : std::string("recv failed: ") + std::strerror(errno);
      disconnect();
      return false;
    }
    parser_.feed(std::string(buf, static_cast<std::size_t>(r)));
  }
}

bool RedisStore::ensure_connected(std::string *err) {
  if (fd_ >= 0)
    return true;

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *res = nullptr;
  const auto port = std::to_string(cfg_.port);
  int rc = getaddrinfo(cfg_.host.c_str(), port.c_str(), &hints, &res);
  if (rc != 0) {
    if (err)
      *err = std::string("resolve failed: ") + gai_strerror(rc);
    return false;
  }

  std::string last_error = "connect failed";
  for (addrinfo *ai = res; ai != nullptr; ai = ai->ai_next) {
    int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0)
      continue;
    timeval tv{cfg_.io_timeout_ms / 1000, (cfg_.io_timeout_ms % 1000) * 1000};
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      fd_ = fd;
      break;
    }
    last_error = std::string("connect failed: ") + std::strerror(errno);
    close(fd);
  }
  freeaddrinfo(res);
  if (fd_ < 0) {
    if (err)
      *err = last_error;
    return false;
  }
  parser_.reset();
  return true;
}

void RedisStore::disconnect() {
  if (fd_ >= 0)
    close(fd_);
  fd_ = -1;
  parser_.reset();
}

} // namespace herd_cache
