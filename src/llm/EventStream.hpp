// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

namespace zesbe
{

/// @brief Producer side of an EventStream, handed to the worker thread.
class EventSink
{
  public:
    struct Channel;

    explicit EventSink(std::shared_ptr<Channel> channel);

    /// @brief Queues an event for the consumer.
    ///
    /// Events after the terminal one are discarded.
    /// @return false once the stream is terminated, telling the producer to stop.
    auto push(StreamEvent event) -> bool;

    /// @brief Returns true once a terminal event has been queued.
    [[nodiscard]] auto terminated() const -> bool;

  private:
    std::shared_ptr<Channel> _channel;
};

/// @brief A lazy, finite, non-restartable sequence of stream events.
///
/// A worker thread runs the producer and pushes events; the consumer pulls
/// them with next(). The sequence always ends with exactly one StreamDone or
/// StreamError. Destroying the stream requests the producer to stop and joins
/// the worker thread.
class EventStream
{
  public:
    /// @brief Produces events into the sink until done or until the stop token fires.
    using Producer = std::function<void(EventSink& sink, std::stop_token stopToken)>;

    /// @brief Starts the worker thread running @p producer.
    explicit EventStream(Producer producer);
    ~EventStream();

    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    /// @brief Creates a stream replaying a fixed list of events.
    ///
    /// A terminal event is appended if the list has none.
    [[nodiscard]] static auto fromEvents(std::vector<StreamEvent> events) -> std::unique_ptr<EventStream>;

    /// @brief Waits for the next event.
    /// @param stopToken Interrupts the wait when stop is requested.
    /// @return The next event, or std::nullopt after the terminal event or on interruption.
    [[nodiscard]] auto next(std::stop_token stopToken = {}) -> std::optional<StreamEvent>;

    /// @brief Asks the producer to stop. The stream then ends with a Cancelled error.
    void cancel();

  private:
    std::shared_ptr<EventSink::Channel> _channel;
    bool _finished = false;
    std::jthread _worker; // last member: joined before the channel goes away
};

} // namespace zesbe
