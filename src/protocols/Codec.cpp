/* @file Codec.cpp
 * @brief envelope <-> JSON datagram
 *
 * © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <string_view>

// Hearo headers
#include "protocols/Codec.hpp"

using nlohmann::json;

namespace hearo {
  namespace protocols {

    namespace {

      constexpr std::string_view kSchemaPrefix = "hearo.ipc/";

      json headerJson(MessageKind kind, const Header& h) {
        return json{ { "schema", schemaOf(kind) }, { "v", h.version }, { "id", h.id },
                     { "ts", h.timestamp } };
      }

      json errorJson(const std::optional<ErrorInfo>& err) {
        if (!err)
          return nullptr;
        return json{ { "code", err->code }, { "message", err->message } };
      }

      void fail(std::string* reason, const std::string& why) {
        if (reason)
          *reason = why;
      }

      std::optional<MessageKind> kindFromSchema(std::string_view schema) {
        if (schema.starts_with(kSchemaPrefix))
          schema.remove_prefix(kSchemaPrefix.size());
        if (schema == "event")
          return MessageKind::Event;
        if (schema == "cmd")
          return MessageKind::Command;
        if (schema == "ack")
          return MessageKind::Ack;
        if (schema == "result")
          return MessageKind::Result;
        return std::nullopt;
      }

      Header readHeader(const json& j) {
        Header h;
        if (auto it = j.find("id"); it != j.end() && it->is_string())
          h.id = it->get<std::string>();
        if (auto it = j.find("ts"); it != j.end() && it->is_number())
          h.timestamp = it->get<std::int64_t>();
        if (auto it = j.find("v"); it != j.end() && it->is_number_integer())
          h.version = it->get<int>();
        return h;
      }

      // missing or null payload reads as {}; anything but an object is malformed
      bool readPayload(const json& j, json& out) {
        auto it = j.find("payload");
        if (it == j.end() || it->is_null()) {
          out = json::object();
          return true;
        }
        if (!it->is_object())
          return false;
        out = *it;
        return true;
      }

      std::optional<ErrorInfo> readError(const json& j) {
        auto it = j.find("error");
        if (it == j.end() || it->is_null())
          return std::nullopt;
        if (it->is_string())
          return ErrorInfo{ "ERROR", it->get<std::string>() };
        if (it->is_object()) {
          ErrorInfo e;
          e.code = it->value("code", std::string{ "ERROR" });
          e.message = it->value("message", std::string{});
          return e;
        }
        return ErrorInfo{ "ERROR", it->dump() };
      }

      std::optional<std::string> readCorrelation(const json& j) {
        for (const char* key : { "corr", "in-reply-to", "correlates_to" }) {
          auto it = j.find(key);
          if (it != j.end() && it->is_string())
            return it->get<std::string>();
        }
        return std::nullopt;
      }

    } // namespace

    std::string toWire(const Message& msg) {
      json j = headerJson(kindOf(msg), headerOf(msg));

      if (const auto* ev = std::get_if<Event>(&msg)) {
        j["event"] = ev->name;
        j["payload"] = ev->payload;
      } else if (const auto* cmd = std::get_if<Command>(&msg)) {
        j["cmd"] = cmd->name;
        j["payload"] = cmd->payload;
        j["reply"] = cmd->replyEndpoint;
        j["timeout_ms"] = cmd->timeoutMs;
        if (!cmd->origin.empty())
          j["origin"] = cmd->origin;
      } else if (const auto* ack = std::get_if<Ack>(&msg)) {
        j["corr"] = ack->correlatesTo;
        j["ok"] = ack->ok;
        j["error"] = errorJson(ack->error);
      } else if (const auto* res = std::get_if<Result>(&msg)) {
        j["corr"] = res->correlatesTo;
        j["ok"] = res->ok;
        j["payload"] = res->payload;
        j["error"] = errorJson(res->error);
      }
      return j.dump();
    }

    std::optional<Message> fromWire(const std::string& raw, std::string* reason) {
      json j = json::parse(raw, nullptr, false);
      if (j.is_discarded()) {
        fail(reason, "invalid JSON");
        return std::nullopt;
      }
      if (!j.is_object()) {
        fail(reason, "envelope is not a JSON object");
        return std::nullopt;
      }

      auto schemaIt = j.find("schema");
      if (schemaIt == j.end() || !schemaIt->is_string()) {
        fail(reason, "missing schema");
        return std::nullopt;
      }
      auto kind = kindFromSchema(schemaIt->get_ref<const std::string&>());
      if (!kind) {
        fail(reason, "unknown schema '" + schemaIt->get<std::string>() + "'");
        return std::nullopt;
      }

      try {
        switch (*kind) {
        case MessageKind::Event: {
          Event ev;
          ev.header = readHeader(j);
          auto it = j.find("event");
          if (it == j.end() || !it->is_string()) {
            fail(reason, "event without name");
            return std::nullopt;
          }
          ev.name = it->get<std::string>();
          if (!readPayload(j, ev.payload)) {
            fail(reason, "event payload is not an object");
            return std::nullopt;
          }
          return Message{ std::move(ev) };
        }
        case MessageKind::Command: {
          Command cmd;
          cmd.header = readHeader(j);
          auto it = j.find("cmd");
          if (it == j.end() || !it->is_string()) {
            fail(reason, "command without name");
            return std::nullopt;
          }
          cmd.name = it->get<std::string>();
          if (!readPayload(j, cmd.payload)) {
            fail(reason, "command payload is not an object");
            return std::nullopt;
          }
          if (auto r = j.find("reply"); r != j.end() && r->is_string())
            cmd.replyEndpoint = r->get<std::string>();
          if (auto t = j.find("timeout_ms"); t != j.end() && t->is_number_integer())
            cmd.timeoutMs = t->get<std::int64_t>();
          if (auto o = j.find("origin"); o != j.end() && o->is_string())
            cmd.origin = o->get<std::string>();
          return Message{ std::move(cmd) };
        }
        case MessageKind::Ack:
        case MessageKind::Result: {
          auto corr = readCorrelation(j);
          auto okIt = j.find("ok");
          if (!corr || okIt == j.end() || !okIt->is_boolean()) {
            fail(reason, "reply without correlation id or ok flag");
            return std::nullopt;
          }
          if (*kind == MessageKind::Ack) {
            Ack ack;
            ack.header = readHeader(j);
            ack.correlatesTo = *corr;
            ack.ok = okIt->get<bool>();
            ack.error = readError(j);
            return Message{ std::move(ack) };
          }
          Result res;
          res.header = readHeader(j);
          res.correlatesTo = *corr;
          res.ok = okIt->get<bool>();
          res.error = readError(j);
          if (!readPayload(j, res.payload)) {
            fail(reason, "result payload is not an object");
            return std::nullopt;
          }
          return Message{ std::move(res) };
        }
        }
      } catch (const json::exception& e) {
        fail(reason, std::string("malformed envelope: ") + e.what());
        return std::nullopt;
      }
      return std::nullopt;
    }

  } // namespace protocols
} // namespace hearo
