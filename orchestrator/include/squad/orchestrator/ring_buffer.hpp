#ifndef SQUAD_ORCHESTRATOR_RING_BUFFER_HPP
#define SQUAD_ORCHESTRATOR_RING_BUFFER_HPP

#include <squad/common/exceptions.hpp>

#include <cstddef>
#include <vector>

namespace squad::orchestrator {

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Fixed-capacity FIFO that overwrites its oldest entry when full.
  /// Not synchronized.
  ////////////////////////////////////////////////////////////////////////////////
  template <typename T>
  class RingBuffer {
  public:
    explicit RingBuffer(size_t capacity) : _capacity(capacity)
    {
      if (capacity == 0) {
        throw common::InvalidConfigurationError{"Ring buffer capacity must be positive"};
      }
      _elements.reserve(capacity);
    }

    void push(T&& value)
    {
      if (_elements.size() < _capacity) {
        _elements.push_back(std::move(value));
      } else {
        _elements[_head] = std::move(value);
        _head = (_head + 1) % _capacity;
      }
      ++_total;
    }

    void push(const T& value)
    {
      T copy{value};
      push(std::move(copy));
    }

    // Contents from the oldest to the newest element.
    std::vector<T> snapshot() const
    {
      std::vector<T> result;
      result.reserve(_elements.size());
      for (size_t i = 0; i < _elements.size(); ++i) {
        result.push_back(_elements[(_head + i) % _elements.size()]);
      }
      return result;
    }

    template <typename F>
    void for_each(F&& func) const
    {
      for (size_t i = 0; i < _elements.size(); ++i) {
        func(_elements[(_head + i) % _elements.size()]);
      }
    }

    size_t size() const
    {
      return _elements.size();
    }

    size_t capacity() const
    {
      return _capacity;
    }

    bool empty() const
    {
      return _elements.empty();
    }

    // Number of elements ever pushed, including the evicted ones.
    size_t total_pushed() const
    {
      return _total;
    }

    void clear()
    {
      _elements.clear();
      _head = 0;
    }

  private:
    size_t _capacity;
    size_t _head = 0;
    size_t _total = 0;
    std::vector<T> _elements;
  };

} // namespace squad::orchestrator

#endif
