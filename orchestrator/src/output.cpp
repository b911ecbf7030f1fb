#include <squad/orchestrator/output.hpp>

#include <spdlog/spdlog.h>

namespace squad::orchestrator {

  std::string to_string(OutputStream stream)
  {
    switch (stream) {
    case OutputStream::STDOUT:
      return "stdout";
    case OutputStream::STDERR:
      return "stderr";
    case OutputStream::SYSTEM:
      return "system";
    }
    return "unknown";
  }

  std::string to_string(ChunkKind kind)
  {
    switch (kind) {
    case ChunkKind::TEXT:
      return "text";
    case ChunkKind::TOOL_USE:
      return "tool_use";
    case ChunkKind::RESULT:
      return "result";
    case ChunkKind::ERROR:
      return "error";
    case ChunkKind::RAW:
      return "raw";
    case ChunkKind::SYSTEM:
      return "system";
    }
    return "unknown";
  }

  OutputChunk make_chunk(OutputStream stream, ChunkKind kind, std::string content)
  {
    return OutputChunk{std::chrono::system_clock::now(), stream, kind, std::move(content)};
  }

  OutputLog::OutputLog(size_t capacity) : _buffer(capacity) {}

  void OutputLog::append(OutputChunk&& chunk)
  {
    std::lock_guard<std::mutex> lock{_mutex};
    if (_closed) {
      return;
    }

    _buffer.push(chunk);

    // A failing subscriber is dropped; the chunk stays in the backlog for everyone else.
    for (auto it = _subscribers.begin(); it != _subscribers.end();) {
      try {
        it->second.callback(chunk);
        ++it;
      } catch (std::exception& exc) {
        spdlog::error("Output subscriber {} failed and was removed: {}", it->first, exc.what());
        it = _subscribers.erase(it);
      }
    }
  }

  void OutputLog::close()
  {
    std::lock_guard<std::mutex> lock{_mutex};
    if (_closed) {
      return;
    }
    _closed = true;

    for (auto& [id, sub] : _subscribers) {
      if (!sub.on_complete) {
        continue;
      }
      try {
        sub.on_complete();
      } catch (std::exception& exc) {
        spdlog::error("Completion callback of output subscriber {} failed: {}", id, exc.what());
      }
    }
    _subscribers.clear();
  }

  int OutputLog::subscribe(callback_t callback, completion_t on_complete)
  {
    std::lock_guard<std::mutex> lock{_mutex};

    _buffer.for_each([&callback](const OutputChunk& chunk) { callback(chunk); });

    int id = _next_id++;
    if (_closed) {
      if (on_complete) {
        on_complete();
      }
      return id;
    }

    _subscribers.emplace(id, Subscriber{std::move(callback), std::move(on_complete)});
    return id;
  }

  bool OutputLog::unsubscribe(int id)
  {
    std::lock_guard<std::mutex> lock{_mutex};
    return _subscribers.erase(id) > 0;
  }

  std::vector<OutputChunk> OutputLog::snapshot() const
  {
    std::lock_guard<std::mutex> lock{_mutex};
    return _buffer.snapshot();
  }

  size_t OutputLog::size() const
  {
    std::lock_guard<std::mutex> lock{_mutex};
    return _buffer.size();
  }

  size_t OutputLog::capacity() const
  {
    std::lock_guard<std::mutex> lock{_mutex};
    return _buffer.capacity();
  }

  size_t OutputLog::total() const
  {
    std::lock_guard<std::mutex> lock{_mutex};
    return _buffer.total_pushed();
  }

  bool OutputLog::closed() const
  {
    std::lock_guard<std::mutex> lock{_mutex};
    return _closed;
  }

} // namespace squad::orchestrator
