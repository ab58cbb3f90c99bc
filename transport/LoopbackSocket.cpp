#include "transport/LoopbackSocket.h"
#include <algorithm>
#include <chrono>
#include <cstring>

namespace transport
{

LoopbackSocketPair::LoopbackSocketPair(const size_t maxQueuedDatagrams)
    : _maxQueuedDatagrams(maxQueuedDatagrams),
      _dropped{0, 0}
{
    _sides[0] = std::make_unique<Side>(*this, 0);
    _sides[1] = std::make_unique<Side>(*this, 1);
}

void LoopbackSocketPair::setDropFilter(const size_t side, DropFilter filter)
{
    std::lock_guard<std::mutex> lock(_mutex);
    _dropFilters[side & 1] = std::move(filter);
}

uint64_t LoopbackSocketPair::getDroppedCount(const size_t side) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _dropped[side & 1];
}

int LoopbackSocketPair::Side::receive(void* buffer, const size_t size, const uint64_t timeoutNs)
{
    std::unique_lock<std::mutex> lock(_pair._mutex);
    auto& queue = _pair._queues[_index];
    _pair._condition.wait_for(lock, std::chrono::nanoseconds(timeoutNs), [&queue]() {
        return queue.closed || !queue.datagrams.empty();
    });

    if (queue.closed)
    {
        return -1;
    }
    if (queue.datagrams.empty())
    {
        return 0;
    }

    auto datagram = std::move(queue.datagrams.front());
    queue.datagrams.pop_front();
    const size_t length = std::min(size, datagram.size());
    std::memcpy(buffer, datagram.data(), length);
    return static_cast<int>(length);
}

int LoopbackSocketPair::Side::send(const void* data, const size_t length)
{
    std::lock_guard<std::mutex> lock(_pair._mutex);
    if (_pair._queues[_index].closed)
    {
        return -1;
    }

    auto* bytes = reinterpret_cast<const uint8_t*>(data);
    auto& filter = _pair._dropFilters[_index];
    auto& peerQueue = _pair._queues[1 - _index];
    if ((filter && filter(bytes, length)) || peerQueue.closed ||
        peerQueue.datagrams.size() >= _pair._maxQueuedDatagrams)
    {
        ++_pair._dropped[_index];
        return static_cast<int>(length);
    }

    peerQueue.datagrams.emplace_back(bytes, bytes + length);
    _pair._condition.notify_all();
    return static_cast<int>(length);
}

void LoopbackSocketPair::Side::close()
{
    std::lock_guard<std::mutex> lock(_pair._mutex);
    _pair._queues[_index].closed = true;
    _pair._queues[_index].datagrams.clear();
    _pair._condition.notify_all();
}

bool LoopbackSocketPair::Side::isOpen() const
{
    std::lock_guard<std::mutex> lock(_pair._mutex);
    return !_pair._queues[_index].closed;
}

} // namespace transport
