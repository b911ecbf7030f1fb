#ifndef SQUAD_ORCHESTRATOR_STREAM_PARSER_HPP
#define SQUAD_ORCHESTRATOR_STREAM_PARSER_HPP

#include <squad/orchestrator/output.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace squad::orchestrator {

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Splits a byte stream into lines, keeping incomplete lines between calls.
  ////////////////////////////////////////////////////////////////////////////////
  class LineSplitter {
  public:
    // Lines longer than this are emitted in pieces.
    static constexpr size_t MAX_LINE_LENGTH = 1024 * 1024;

    std::vector<std::string> feed(std::string_view data);

    // Returns the unterminated remainder, if any.
    std::optional<std::string> flush();

  private:
    std::string _partial;
  };

  // One structured line of the worker's stream-json output.
  struct StreamMessage {
    std::string type;
    std::optional<std::string> subtype;
    std::optional<std::string> session_id;
    std::optional<double> cost_usd;
    std::optional<std::string> text;
    std::optional<std::string> tool_name;
    bool is_error = false;
  };

  // Returns std::nullopt for empty lines, malformed JSON, or objects without a type.
  std::optional<StreamMessage> parse_stream_line(std::string_view line);

  bool is_input_request(const StreamMessage& msg);

  OutputChunk to_chunk(const StreamMessage& msg, std::string_view line);

} // namespace squad::orchestrator

#endif
