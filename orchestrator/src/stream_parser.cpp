#include <squad/orchestrator/stream_parser.hpp>

#include <cereal/external/rapidjson/document.h>

namespace squad::orchestrator {

  namespace {

    std::optional<std::string> get_string(const rapidjson::Value& obj, const char* name)
    {
      auto it = obj.FindMember(name);
      if (it == obj.MemberEnd() || !it->value.IsString()) {
        return std::nullopt;
      }
      return std::string{it->value.GetString(), it->value.GetStringLength()};
    }

    // Text is either a plain "content" string or the text blocks of message.content.
    void extract_content(const rapidjson::Value& obj, StreamMessage& msg)
    {
      if (auto content = get_string(obj, "content"); content.has_value()) {
        msg.text = std::move(content);
        return;
      }

      auto message = obj.FindMember("message");
      if (message == obj.MemberEnd() || !message->value.IsObject()) {
        return;
      }
      auto blocks = message->value.FindMember("content");
      if (blocks == message->value.MemberEnd()) {
        return;
      }

      if (blocks->value.IsString()) {
        msg.text = std::string{blocks->value.GetString(), blocks->value.GetStringLength()};
        return;
      }
      if (!blocks->value.IsArray()) {
        return;
      }

      std::string text;
      bool found_text = false;
      for (const auto& block : blocks->value.GetArray()) {

        if (!block.IsObject()) {
          continue;
        }
        auto block_type = get_string(block, "type");
        if (block_type == "text") {
          if (auto value = get_string(block, "text"); value.has_value()) {
            text += *value;
            found_text = true;
          }
        } else if (block_type == "tool_use" && !msg.tool_name.has_value()) {
          msg.tool_name = get_string(block, "name");
        }
      }

      if (found_text) {
        msg.text = std::move(text);
      }
    }

  } // namespace

  std::vector<std::string> LineSplitter::feed(std::string_view data)
  {
    std::vector<std::string> lines;

    size_t pos = 0;
    while (pos < data.size()) {

      size_t end = data.find('\n', pos);
      if (end == std::string_view::npos) {
        _partial.append(data.substr(pos));
        break;
      }

      _partial.append(data.substr(pos, end - pos));
      if (!_partial.empty() && _partial.back() == '\r') {
        _partial.pop_back();
      }
      lines.push_back(std::move(_partial));
      _partial.clear();
      pos = end + 1;
    }

    while (_partial.size() > MAX_LINE_LENGTH) {
      lines.push_back(_partial.substr(0, MAX_LINE_LENGTH));
      _partial.erase(0, MAX_LINE_LENGTH);
    }

    return lines;
  }

  std::optional<std::string> LineSplitter::flush()
  {
    if (_partial.empty()) {
      return std::nullopt;
    }
    std::string rest = std::move(_partial);
    _partial.clear();
    return rest;
  }

  std::optional<StreamMessage> parse_stream_line(std::string_view line)
  {
    size_t begin = line.find_first_not_of(" \t\r");
    if (begin == std::string_view::npos || line[begin] != '{') {
      return std::nullopt;
    }

    rapidjson::Document doc;
    doc.Parse(line.data() + begin, line.size() - begin);
    if (doc.HasParseError() || !doc.IsObject()) {
      return std::nullopt;
    }

    auto type = get_string(doc, "type");
    if (!type.has_value()) {
      return std::nullopt;
    }

    StreamMessage msg;
    msg.type = std::move(*type);
    msg.subtype = get_string(doc, "subtype");
    msg.session_id = get_string(doc, "session_id");

    auto cost = doc.FindMember("cost_usd");
    if (cost != doc.MemberEnd() && cost->value.IsNumber()) {
      msg.cost_usd = cost->value.GetDouble();
    }

    auto is_error = doc.FindMember("is_error");
    if (is_error != doc.MemberEnd() && is_error->value.IsBool()) {
      msg.is_error = is_error->value.GetBool();
    }
    if (msg.type == "error") {
      msg.is_error = true;
    }

    extract_content(doc, msg);
    if (!msg.text.has_value() && msg.type == "result") {
      msg.text = get_string(doc, "result");
    }
    if (!msg.text.has_value() && msg.type == "error") {
      msg.text = get_string(doc, "error");
    }

    return msg;
  }

  bool is_input_request(const StreamMessage& msg)
  {
    return msg.type == "input_request";
  }

  OutputChunk to_chunk(const StreamMessage& msg, std::string_view line)
  {
    if (msg.is_error) {
      return make_chunk(
          OutputStream::STDOUT, ChunkKind::ERROR, msg.text.value_or(std::string{line})
      );
    }

    if (msg.type == "result") {
      return make_chunk(
          OutputStream::STDOUT, ChunkKind::RESULT, msg.text.value_or(std::string{line})
      );
    }

    if (msg.type == "system") {
      return make_chunk(
          OutputStream::STDOUT, ChunkKind::SYSTEM,
          msg.text.value_or(msg.subtype.value_or(msg.type))
      );
    }

    if (msg.text.has_value()) {
      return make_chunk(OutputStream::STDOUT, ChunkKind::TEXT, *msg.text);
    }

    if (msg.tool_name.has_value()) {
      return make_chunk(OutputStream::STDOUT, ChunkKind::TOOL_USE, "Using tool: " + *msg.tool_name);
    }

    return make_chunk(OutputStream::STDOUT, ChunkKind::RAW, std::string{line});
  }

} // namespace squad::orchestrator
