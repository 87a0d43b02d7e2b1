// SPDX-License-Identifier: Apache-2.0
#include "EventStream.hpp"

#include <core/Log.hpp>

#include <exception>

namespace zesbe
{

struct EventSink::Channel
{
    std::mutex mutex;
    std::condition_variable_any cv;
    std::deque<StreamEvent> queue;
    bool terminated = false;
};

EventSink::EventSink(std::shared_ptr<Channel> channel): _channel(std::move(channel))
{
}

auto EventSink::push(StreamEvent event) -> bool
{
    {
        auto lock = std::lock_guard(_channel->mutex);
        if (_channel->terminated)
            return false;
        _channel->terminated = isTerminal(event);
        _channel->queue.push_back(std::move(event));
    }
    _channel->cv.notify_all();
    return true;
}

auto EventSink::terminated() const -> bool
{
    auto lock = std::lock_guard(_channel->mutex);
    return _channel->terminated;
}

EventStream::EventStream(Producer producer): _channel(std::make_shared<EventSink::Channel>())
{
    _worker = std::jthread([channel = _channel, producer = std::move(producer)](std::stop_token stopToken) {
        auto sink = EventSink(channel);
        try
        {
            producer(sink, stopToken);
        }
        catch (const std::exception& e)
        {
            log::error("Stream producer failed: {}", e.what());
            sink.push(StreamError { .error = Error {
                                        .code = ErrorCode::Unknown, .message = e.what(), .httpStatus = 0 } });
        }

        if (!sink.terminated())
        {
            if (stopToken.stop_requested())
                sink.push(StreamError { .error = Error { .code = ErrorCode::Cancelled,
                                                         .message = "Stream cancelled",
                                                         .httpStatus = 0 } });
            else
                sink.push(StreamError { .error = Error { .code = ErrorCode::ProtocolError,
                                                         .message = "Stream ended without completion",
                                                         .httpStatus = 0 } });
        }
    });
}

EventStream::~EventStream()
{
    cancel();
}

auto EventStream::fromEvents(std::vector<StreamEvent> events) -> std::unique_ptr<EventStream>
{
    return std::make_unique<EventStream>([events = std::move(events)](EventSink& sink, std::stop_token) {
        for (const auto& event: events)
        {
            if (!sink.push(event))
                return;
        }
        sink.push(StreamDone {});
    });
}

auto EventStream::next(std::stop_token stopToken) -> std::optional<StreamEvent>
{
    if (_finished)
        return std::nullopt;

    auto lock = std::unique_lock(_channel->mutex);
    if (!_channel->cv.wait(lock, stopToken, [this] { return !_channel->queue.empty(); }))
        return std::nullopt;

    auto event = std::move(_channel->queue.front());
    _channel->queue.pop_front();
    _finished = isTerminal(event);
    return event;
}

void EventStream::cancel()
{
    _worker.request_stop();
}

} // namespace zesbe
