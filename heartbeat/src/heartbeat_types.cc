// Copyright (c) 2025 <Your Name>
#include "heartbeat/heartbeat_types.hpp"

#include <string>
#include <vector>

#include "heartbeat/conn.hpp"

namespace heartbeat {

namespace {

void AppendBe16(std::vector<uint8_t>* out, uint16_t v) {
  out->push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
  out->push_back(static_cast<uint8_t>(v & 0xFF));
}

void AppendBe32(std::vector<uint8_t>* out, uint32_t v) {
  for (int shift = 24; shift >= 0; shift -= 8) {
    out->push_back(static_cast<uint8_t>((v >> shift) & 0xFF));
  }
}

void AppendBe64(std::vector<uint8_t>* out, uint64_t v) {
  for (int shift = 56; shift >= 0; shift -= 8) {
    out->push_back(static_cast<uint8_t>((v >> shift) & 0xFF));
  }
}

uint16_t ReadBe16(const uint8_t* p) {
  return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

uint32_t ReadBe32(const uint8_t* p) {
  return (static_cast<uint32_t>(p[0]) << 24) |
         (static_cast<uint32_t>(p[1]) << 16) |
         (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

uint64_t ReadBe64(const uint8_t* p) {
  return (static_cast<uint64_t>(ReadBe32(p)) << 32) | ReadBe32(p + 4);
}

struct HeaderFields {
  Frame::Kind kind;
  uint64_t seq;
  uint16_t name_len;
  uint32_t body_len;
};

bool ParseHeader(const uint8_t* p, HeaderFields* out, std::string* err) {
  if (ReadBe32(p) != Frame::kMagic) {
    if (err) *err = "bad frame magic";
    return false;
  }
  if (p[4] != Frame::kVersion) {
    if (err) *err = "unsupported frame version " + std::to_string(p[4]);
    return false;
  }
  if (p[5] > static_cast<uint8_t>(Frame::Kind::kResponse)) {
    if (err) *err = "unknown frame kind " + std::to_string(p[5]);
    return false;
  }
  out->kind = static_cast<Frame::Kind>(p[5]);
  out->seq = ReadBe64(p + 8);
  out->name_len = ReadBe16(p + 16);
  out->body_len = ReadBe32(p + 18);
  if (out->body_len > Frame::kMaxBodySize) {
    if (err) *err = "frame body too large (" + std::to_string(out->body_len) +
                    " bytes)";
    return false;
  }
  return true;
}

}  // namespace

std::vector<uint8_t> Frame::Serialize(const Frame& f) {
  std::vector<uint8_t> out;
  out.reserve(kHeaderSize + f.name.size() + f.body.size());
  AppendBe32(&out, kMagic);
  out.push_back(kVersion);
  out.push_back(static_cast<uint8_t>(f.kind));
  out.push_back(0);
  out.push_back(0);
  AppendBe64(&out, f.seq);
  AppendBe16(&out, static_cast<uint16_t>(f.name.size()));
  AppendBe32(&out, static_cast<uint32_t>(f.body.size()));
  out.insert(out.end(), f.name.begin(), f.name.end());
  out.insert(out.end(), f.body.begin(), f.body.end());
  return out;
}

bool Frame::Parse(const uint8_t* data, size_t len, Frame* out) {
  if (!data || !out || len < kHeaderSize) return false;
  HeaderFields h{};
  if (!ParseHeader(data, &h, nullptr)) return false;
  if (len != kHeaderSize + h.name_len + h.body_len) return false;
  const uint8_t* name = data + kHeaderSize;
  const uint8_t* body = name + h.name_len;
  out->kind = h.kind;
  out->seq = h.seq;
  out->name.assign(reinterpret_cast<const char*>(name), h.name_len);
  out->body.assign(body, body + h.body_len);
  return true;
}

std::vector<uint8_t> PingRequest::Serialize(const PingRequest& r) {
  std::vector<uint8_t> out;
  out.reserve(26 + r.addr.size());
  AppendBe64(&out, static_cast<uint64_t>(r.offset.offset));
  AppendBe64(&out, static_cast<uint64_t>(r.offset.error));
  AppendBe64(&out, static_cast<uint64_t>(r.offset.measured_at));
  AppendBe16(&out, static_cast<uint16_t>(r.addr.size()));
  out.insert(out.end(), r.addr.begin(), r.addr.end());
  return out;
}

bool PingRequest::Parse(const std::vector<uint8_t>& body, PingRequest* out) {
  if (!out || body.size() < 26) return false;
  const uint8_t* p = body.data();
  const uint16_t addr_len = ReadBe16(p + 24);
  if (body.size() != 26u + addr_len) return false;
  out->offset.offset = static_cast<int64_t>(ReadBe64(p));
  out->offset.error = static_cast<int64_t>(ReadBe64(p + 8));
  out->offset.measured_at = static_cast<int64_t>(ReadBe64(p + 16));
  out->addr.assign(reinterpret_cast<const char*>(p + 26), addr_len);
  return true;
}

std::vector<uint8_t> PingResponse::Serialize(const PingResponse& r) {
  std::vector<uint8_t> out;
  out.reserve(8);
  AppendBe64(&out, static_cast<uint64_t>(r.server_time));
  return out;
}

bool PingResponse::Parse(const std::vector<uint8_t>& body,
                         PingResponse* out) {
  if (!out || body.size() != 8) return false;
  out->server_time = static_cast<int64_t>(ReadBe64(body.data()));
  return true;
}

bool ReadFrame(Conn* conn, Frame* out, std::string* err) {
  uint8_t header[Frame::kHeaderSize];
  if (!conn->ReadFull(header, sizeof(header))) {
    if (err) *err = conn->GetLastError();
    return false;
  }
  HeaderFields h{};
  if (!ParseHeader(header, &h, err)) return false;

  std::vector<uint8_t> rest(static_cast<size_t>(h.name_len) + h.body_len);
  if (!rest.empty() && !conn->ReadFull(rest.data(), rest.size())) {
    if (err) *err = conn->GetLastError();
    return false;
  }
  out->kind = h.kind;
  out->seq = h.seq;
  out->name.assign(rest.begin(), rest.begin() + h.name_len);
  out->body.assign(rest.begin() + h.name_len, rest.end());
  return true;
}

bool WriteFrame(Conn* conn, const Frame& frame, std::string* err) {
  if (frame.name.size() > 0xFFFF || frame.body.size() > Frame::kMaxBodySize) {
    if (err) *err = "frame too large";
    return false;
  }
  if (!conn->Write(Frame::Serialize(frame))) {
    if (err) *err = conn->GetLastError();
    return false;
  }
  return true;
}

}  // namespace heartbeat
