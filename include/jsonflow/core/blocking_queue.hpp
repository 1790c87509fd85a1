// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonflow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <stdexcept>

namespace jsonflow
{
namespace core
{

/// \brief Outcome of a timed dequeue.
enum class DequeueStatus
{
  Item,    ///< An item was removed
  Timeout, ///< Nothing arrived within the timeout
  Closed   ///< The queue is closed and drained
};

/// \brief Thread-safe blocking queue with bounded capacity
///
/// Hands fragments from a producer thread (the text generator) to the single
/// drive loop. When the queue is full, queue() blocks; when it is empty,
/// dequeue() blocks. close() wakes every waiter: producers then fail to queue,
/// consumers drain what is left and then observe the close.
///
/// \code
///   BlockingQueue<std::string> queue(64);
///
///   // Producer
///   if (!queue.queue(std::move(fragment))) {
///     // consumer went away
///   }
///
///   // Consumer
///   std::string fragment;
///   while (queue.dequeue(fragment)) { ... }
/// \endcode
template <typename T> class BlockingQueue
{
public:
  /// \throws std::invalid_argument if maxSize is 0
  explicit BlockingQueue(std::size_t maxSize = 1024) : _maxSize(maxSize)
  {
    if (maxSize == 0)
    {
      throw std::invalid_argument("BlockingQueue maxSize must be greater than 0");
    }
  }

  ~BlockingQueue() { close(); }

  BlockingQueue(const BlockingQueue &) = delete;
  BlockingQueue &operator=(const BlockingQueue &) = delete;

  /// \brief Add an item, blocking while the queue is full.
  /// \return false if the queue is closed
  bool queue(T item)
  {
    std::unique_lock<std::mutex> lock(_mutex);
    _condNotFull.wait(lock, [this]() { return _queue.size() < _maxSize || _closed; });
    if (_closed)
    {
      return false;
    }

    _queue.push_back(std::move(item));
    lock.unlock();
    _condNotEmpty.notify_one();
    return true;
  }

  /// \brief Remove an item, blocking until one is available.
  /// \return false if the queue is closed and empty
  bool dequeue(T &out)
  {
    std::unique_lock<std::mutex> lock(_mutex);
    _condNotEmpty.wait(lock, [this]() { return !_queue.empty() || _closed; });
    if (_queue.empty())
    {
      return false;
    }

    out = std::move(_queue.front());
    _queue.pop_front();
    lock.unlock();
    _condNotFull.notify_one();
    return true;
  }

  /// \brief Remove an item, waiting at most \p timeout.
  DequeueStatus dequeue(T &out, std::chrono::milliseconds timeout)
  {
    std::unique_lock<std::mutex> lock(_mutex);
    bool ready =
      _condNotEmpty.wait_for(lock, timeout, [this]() { return !_queue.empty() || _closed; });
    if (!ready)
    {
      return DequeueStatus::Timeout;
    }
    if (_queue.empty())
    {
      return DequeueStatus::Closed;
    }

    out = std::move(_queue.front());
    _queue.pop_front();
    lock.unlock();
    _condNotFull.notify_one();
    return DequeueStatus::Item;
  }

  /// \brief Close the queue and wake all waiting threads
  void close()
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_closed)
      {
        return;
      }
      _closed = true;
    }
    _condNotEmpty.notify_all();
    _condNotFull.notify_all();
  }

  /// \brief Drops queued items without closing.
  void clear()
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _queue.clear();
    }
    _condNotFull.notify_all();
  }

  bool isClosed() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _closed;
  }

  std::size_t size() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _queue.size();
  }

  std::size_t capacity() const { return _maxSize; }

private:
  mutable std::mutex _mutex;
  std::condition_variable _condNotEmpty;
  std::condition_variable _condNotFull;
  std::deque<T> _queue;
  const std::size_t _maxSize;
  bool _closed{false};
};

} // namespace core
} // namespace jsonflow
