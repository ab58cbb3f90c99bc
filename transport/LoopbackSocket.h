#pragma once

#include "transport/DatagramSocket.h"
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace transport
{

/**
 * In-memory datagram link. Each side has an inbound queue and sending on one side posts to the other.
 * A drop filter can be installed per side to emulate loss on the datagrams it sends.
 */
class LoopbackSocketPair
{
public:
    // return true to drop the datagram
    using DropFilter = std::function<bool(const uint8_t* data, size_t length)>;

    explicit LoopbackSocketPair(size_t maxQueuedDatagrams = 4096);

    DatagramSocket& first() { return *_sides[0]; }
    DatagramSocket& second() { return *_sides[1]; }

    void setDropFilter(size_t side, DropFilter filter);
    uint64_t getDroppedCount(size_t side) const;

private:
    struct Queue
    {
        std::deque<std::vector<uint8_t>> datagrams;
        bool closed = false;
    };

    class Side : public DatagramSocket
    {
    public:
        Side(LoopbackSocketPair& pair, size_t index) : _pair(pair), _index(index) {}

        int receive(void* buffer, size_t size, uint64_t timeoutNs) override;
        int send(const void* data, size_t length) override;
        void close() override;
        bool isOpen() const override;

    private:
        LoopbackSocketPair& _pair;
        const size_t _index;
    };

    const size_t _maxQueuedDatagrams;
    mutable std::mutex _mutex;
    std::condition_variable _condition;
    Queue _queues[2];
    DropFilter _dropFilters[2];
    uint64_t _dropped[2];
    std::unique_ptr<Side> _sides[2];
};

} // namespace transport
