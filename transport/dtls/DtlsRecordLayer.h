#pragma once

#include "crypto/ReplayWindow.h"
#include "logger/Logger.h"
#include "transport/dtls/DtlsCipherSuite.h"
#include "transport/dtls/DtlsProtocol.h"
#include <cstdint>
#include <map>
#include <memory>
#include <vector>

namespace transport
{
class DtlsWriteListener;
}

namespace dtls
{

// Collects handshake fragments per message_seq until [0, length) is covered.
// Completed messages are released strictly in message_seq order.
class HandshakeReassembler
{
public:
    static constexpr uint32_t MAX_MESSAGE_SIZE = 64 * 1024;
    // messages further ahead of the next expected one are dropped and left to retransmission
    static constexpr uint16_t MAX_MESSAGES_AHEAD = 16;

    HandshakeReassembler() : _nextSeq(0) {}

    // false if the fragment is inconsistent with earlier fragments of the same message or the message
    // exceeds MAX_MESSAGE_SIZE
    bool addFragment(const HandshakeFragmentHeader& header, const uint8_t* data);
    size_t getPendingCount() const { return _messages.size(); }
    bool pop(HandshakeMessage& message);

    uint16_t getNextSeq() const { return _nextSeq; }
    void reset(uint16_t nextSeq);

private:
    struct PartialMessage
    {
        HandshakeType type = HELLO_REQUEST;
        std::vector<uint8_t> body;
        std::vector<bool> received;
        size_t receivedCount = 0;
    };

    uint16_t _nextSeq;
    std::map<uint16_t, PartialMessage> _messages;
};

/**
 * DTLS 1.2 record layer. Frames handshake messages, ChangeCipherSpec, alerts and application data into
 * records and packs them into datagrams of at most mtu bytes. Each epoch has its own 48 bit sequence
 * number, cipher and replay window. Records of a newer read epoch than the active one are held back
 * until activateReadCipher.
 */
class DtlsRecordLayer
{
public:
    class IEvents
    {
    public:
        virtual void onDtlsHandshakeMessage(const HandshakeMessage& message, uint16_t epoch) = 0;
        // a fragment of a message already delivered
        virtual void onDtlsHandshakeRetransmission(uint16_t messageSeq, uint16_t epoch) = 0;
        virtual void onDtlsChangeCipherSpec(uint16_t epoch) = 0;
        virtual void onDtlsAlert(AlertLevel level, AlertDescription description) = 0;
        virtual void onDtlsApplicationData(const uint8_t* data, size_t length) = 0;
    };

    DtlsRecordLayer(const logger::LoggableId& loggableId,
        transport::DtlsWriteListener& writer,
        IEvents& listener,
        size_t mtu);

    bool writeHandshake(const HandshakeMessage& message);
    // written in the given epoch, for flight retransmission
    bool writeHandshake(const HandshakeMessage& message, uint16_t epoch);
    // writes the record in the current epoch and switches writing to the pending cipher
    bool writeChangeCipherSpec();
    bool writeChangeCipherSpec(uint16_t epoch);
    bool writeApplicationData(const void* data, size_t length);
    bool writeAlert(AlertLevel level, AlertDescription description);
    // sends the records collected so far as one datagram
    void flush();

    // returns NO_ALERT unless the datagram carries a fatal violation
    AlertDescription onRecordsReceived(const void* data, size_t length);

    void setPendingCipher(std::unique_ptr<RecordCipher> writeCipher, std::unique_ptr<RecordCipher> readCipher);
    bool activateWriteCipher();
    bool activateReadCipher();

    uint16_t getWriteEpoch() const { return _writeEpoch; }
    uint16_t getReadEpoch() const { return _readEpoch; }
    uint64_t getNextWriteSequence(uint16_t epoch) const;
    size_t getMaxApplicationDataSize() const;

    HandshakeReassembler& getReassembler() { return _reassembler; }
    void setMtu(size_t mtu) { _mtu = mtu; }

    static constexpr size_t MAX_PLAINTEXT_SIZE = 16384;
    static constexpr size_t MAX_HELD_RECORDS = 32;

private:
    struct WriteEpoch
    {
        std::unique_ptr<RecordCipher> cipher;
        uint64_t nextSequence = 0;
    };

    struct ReadEpoch
    {
        ReadEpoch() : replayWindow(64, MAX_SEQUENCE_NUMBER) {}

        std::unique_ptr<RecordCipher> cipher;
        crypto::ReplayWindow replayWindow;
    };

    bool writeRecord(ContentType type, uint16_t epoch, const uint8_t* data, size_t length);
    AlertDescription processRecord(const RecordHeader& header, const uint8_t* fragment);
    AlertDescription deliver(const RecordHeader& header, const uint8_t* data, size_t length);
    AlertDescription processHandshake(uint16_t epoch, const uint8_t* data, size_t length);
    size_t cipherOverhead(uint16_t epoch) const;

    logger::LoggableId _loggableId;
    transport::DtlsWriteListener& _writer;
    IEvents& _listener;
    size_t _mtu;

    uint16_t _writeEpoch;
    uint16_t _readEpoch;
    std::map<uint16_t, WriteEpoch> _writeEpochs;
    std::map<uint16_t, ReadEpoch> _readEpochs;
    std::unique_ptr<RecordCipher> _pendingWriteCipher;
    std::unique_ptr<RecordCipher> _pendingReadCipher;

    struct HeldRecord
    {
        RecordHeader header;
        std::vector<uint8_t> fragment;
    };
    std::vector<HeldRecord> _heldRecords;

    HandshakeReassembler _reassembler;
    std::vector<uint8_t> _datagram;
};

} // namespace dtls
