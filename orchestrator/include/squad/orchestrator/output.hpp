#ifndef SQUAD_ORCHESTRATOR_OUTPUT_HPP
#define SQUAD_ORCHESTRATOR_OUTPUT_HPP

#include <squad/orchestrator/ring_buffer.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace squad::orchestrator {

  enum class OutputStream { STDOUT = 0, STDERR, SYSTEM };

  enum class ChunkKind { TEXT = 0, TOOL_USE, RESULT, ERROR, RAW, SYSTEM };

  std::string to_string(OutputStream stream);
  std::string to_string(ChunkKind kind);

  struct OutputChunk {
    std::chrono::system_clock::time_point timestamp;
    OutputStream stream;
    ChunkKind kind;
    std::string content;
  };

  OutputChunk make_chunk(OutputStream stream, ChunkKind kind, std::string content);

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Bounded replay log of one process's output with live subscriptions.
  ///
  /// Appends and subscriber notifications happen under one mutex, so a new
  /// subscriber observes the backlog followed by every later chunk exactly once,
  /// in emission order. Callbacks must not call back into the same log.
  /// A chunk is stored before subscribers are notified; a subscriber whose
  /// callback throws is removed without affecting the others.
  ////////////////////////////////////////////////////////////////////////////////
  class OutputLog {
  public:
    using callback_t = std::function<void(const OutputChunk&)>;
    using completion_t = std::function<void()>;

    explicit OutputLog(size_t capacity);

    void append(OutputChunk&& chunk);

    // Marks the end of the stream; further appends are dropped.
    void close();

    int subscribe(callback_t callback, completion_t on_complete = nullptr);
    bool unsubscribe(int id);

    std::vector<OutputChunk> snapshot() const;
    size_t size() const;
    size_t capacity() const;
    size_t total() const;
    bool closed() const;

  private:
    struct Subscriber {
      callback_t callback;
      completion_t on_complete;
    };

    mutable std::mutex _mutex;
    RingBuffer<OutputChunk> _buffer;
    std::map<int, Subscriber> _subscribers;
    int _next_id = 0;
    bool _closed = false;
  };

} // namespace squad::orchestrator

#endif
