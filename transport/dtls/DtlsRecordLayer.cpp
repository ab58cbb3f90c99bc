#include "transport/dtls/DtlsRecordLayer.h"
#include "transport/dtls/DtlsWriteListener.h"
#include <algorithm>
#include <cinttypes>

namespace dtls
{

bool HandshakeReassembler::addFragment(const HandshakeFragmentHeader& header, const uint8_t* data)
{
    if (header.length > MAX_MESSAGE_SIZE)
    {
        return false;
    }

    const uint16_t ahead = header.messageSeq - _nextSeq;
    if (static_cast<int16_t>(ahead) < 0 || ahead >= MAX_MESSAGES_AHEAD)
    {
        return true;
    }

    auto it = _messages.find(header.messageSeq);
    if (it == _messages.end())
    {
        PartialMessage partial;
        partial.type = header.type;
        partial.body.resize(header.length);
        partial.received.resize(header.length, false);
        it = _messages.emplace(header.messageSeq, std::move(partial)).first;
    }

    auto& partial = it->second;
    if (partial.type != header.type || partial.body.size() != header.length)
    {
        return false;
    }

    for (uint32_t i = 0; i < header.fragmentLength; ++i)
    {
        const auto offset = header.fragmentOffset + i;
        if (!partial.received[offset])
        {
            partial.body[offset] = data[i];
            partial.received[offset] = true;
            ++partial.receivedCount;
        }
    }
    return true;
}

bool HandshakeReassembler::pop(HandshakeMessage& message)
{
    auto it = _messages.find(_nextSeq);
    if (it == _messages.end() || it->second.receivedCount != it->second.body.size())
    {
        return false;
    }

    message.type = it->second.type;
    message.messageSeq = _nextSeq;
    message.body = std::move(it->second.body);
    _messages.erase(it);
    ++_nextSeq;
    return true;
}

void HandshakeReassembler::reset(uint16_t nextSeq)
{
    _nextSeq = nextSeq;
    _messages.clear();
}

DtlsRecordLayer::DtlsRecordLayer(const logger::LoggableId& loggableId,
    transport::DtlsWriteListener& writer,
    IEvents& listener,
    size_t mtu)
    : _loggableId(loggableId),
      _writer(writer),
      _listener(listener),
      _mtu(mtu),
      _writeEpoch(0),
      _readEpoch(0)
{
    _writeEpochs[0];
    _readEpochs[0];
}

size_t DtlsRecordLayer::cipherOverhead(uint16_t epoch) const
{
    auto it = _writeEpochs.find(epoch);
    if (it == _writeEpochs.end() || !it->second.cipher)
    {
        return 0;
    }
    return it->second.cipher->overhead();
}

uint64_t DtlsRecordLayer::getNextWriteSequence(uint16_t epoch) const
{
    auto it = _writeEpochs.find(epoch);
    return it == _writeEpochs.end() ? 0 : it->second.nextSequence;
}

size_t DtlsRecordLayer::getMaxApplicationDataSize() const
{
    return std::min(MAX_PLAINTEXT_SIZE, _mtu - RECORD_HEADER_SIZE - cipherOverhead(_writeEpoch));
}

bool DtlsRecordLayer::writeRecord(ContentType type, uint16_t epoch, const uint8_t* data, size_t length)
{
    auto it = _writeEpochs.find(epoch);
    if (it == _writeEpochs.end())
    {
        logger::error("no write state for epoch %u", _loggableId.c_str(), epoch);
        return false;
    }

    auto& writeState = it->second;
    if (writeState.nextSequence > MAX_SEQUENCE_NUMBER)
    {
        logger::error("sequence number exhausted in epoch %u", _loggableId.c_str(), epoch);
        return false;
    }

    RecordHeader header;
    header.contentType = type;
    header.epoch = epoch;
    header.sequenceNumber = writeState.nextSequence;
    header.length = length;

    std::vector<uint8_t> fragment;
    if (writeState.cipher)
    {
        if (!writeState.cipher->encrypt(header, data, length, fragment))
        {
            logger::error("failed to protect %s record", _loggableId.c_str(), toString(type));
            return false;
        }
        header.length = fragment.size();
    }
    else
    {
        fragment.assign(data, data + length);
    }
    ++writeState.nextSequence;

    if (!_datagram.empty() && _datagram.size() + RECORD_HEADER_SIZE + fragment.size() > _mtu)
    {
        flush();
    }

    utils::ByteWriter writer(_datagram);
    header.write(writer);
    writer.writeBytes(fragment);
    return true;
}

bool DtlsRecordLayer::writeHandshake(const HandshakeMessage& message)
{
    return writeHandshake(message, _writeEpoch);
}

bool DtlsRecordLayer::writeHandshake(const HandshakeMessage& message, uint16_t epoch)
{
    const size_t overhead = RECORD_HEADER_SIZE + HANDSHAKE_HEADER_SIZE + cipherOverhead(epoch);
    if (_mtu <= overhead)
    {
        return false;
    }
    const size_t maxFragment = _mtu - overhead;

    HandshakeFragmentHeader header;
    header.type = message.type;
    header.length = message.body.size();
    header.messageSeq = message.messageSeq;

    size_t offset = 0;
    do
    {
        header.fragmentOffset = offset;
        header.fragmentLength = std::min(maxFragment, message.body.size() - offset);

        std::vector<uint8_t> fragment;
        utils::ByteWriter writer(fragment);
        header.write(writer);
        writer.writeBytes(message.body.data() + offset, header.fragmentLength);
        if (!writeRecord(HANDSHAKE, epoch, fragment.data(), fragment.size()))
        {
            return false;
        }
        offset += header.fragmentLength;
    } while (offset < message.body.size());

    return true;
}

bool DtlsRecordLayer::writeChangeCipherSpec()
{
    if (!writeChangeCipherSpec(_writeEpoch))
    {
        return false;
    }
    return activateWriteCipher();
}

bool DtlsRecordLayer::writeChangeCipherSpec(uint16_t epoch)
{
    const uint8_t message = 1;
    return writeRecord(CHANGE_CIPHER_SPEC, epoch, &message, 1);
}

bool DtlsRecordLayer::writeApplicationData(const void* data, size_t length)
{
    if (length > MAX_PLAINTEXT_SIZE)
    {
        return false;
    }
    return writeRecord(APPLICATION_DATA, _writeEpoch, reinterpret_cast<const uint8_t*>(data), length);
}

bool DtlsRecordLayer::writeAlert(AlertLevel level, AlertDescription description)
{
    const uint8_t alert[] = {level, description};
    return writeRecord(ALERT, _writeEpoch, alert, sizeof(alert));
}

void DtlsRecordLayer::flush()
{
    if (_datagram.empty())
    {
        return;
    }

    _writer.sendDtls(reinterpret_cast<const char*>(_datagram.data()), _datagram.size());
    _datagram.clear();
}

void DtlsRecordLayer::setPendingCipher(std::unique_ptr<RecordCipher> writeCipher,
    std::unique_ptr<RecordCipher> readCipher)
{
    _pendingWriteCipher = std::move(writeCipher);
    _pendingReadCipher = std::move(readCipher);
}

bool DtlsRecordLayer::activateWriteCipher()
{
    if (!_pendingWriteCipher)
    {
        logger::warn("no pending write cipher", _loggableId.c_str());
        return false;
    }

    ++_writeEpoch;
    _writeEpochs[_writeEpoch].cipher = std::move(_pendingWriteCipher);
    return true;
}

bool DtlsRecordLayer::activateReadCipher()
{
    if (!_pendingReadCipher)
    {
        logger::warn("no pending read cipher", _loggableId.c_str());
        return false;
    }

    ++_readEpoch;
    _readEpochs[_readEpoch].cipher = std::move(_pendingReadCipher);

    auto held = std::move(_heldRecords);
    _heldRecords.clear();
    for (auto& record : held)
    {
        const auto alert = processRecord(record.header, record.fragment.data());
        if (alert != NO_ALERT)
        {
            logger::warn("held record failed %s", _loggableId.c_str(), toString(alert));
        }
    }
    return true;
}

AlertDescription DtlsRecordLayer::onRecordsReceived(const void* data, size_t length)
{
    utils::ByteReader reader(data, length);
    while (!reader.empty())
    {
        RecordHeader header;
        if (!header.read(reader))
        {
            logger::debug("truncated record header", _loggableId.c_str());
            return NO_ALERT;
        }

        const uint8_t* fragment = reader.take(header.length);
        if (!fragment)
        {
            logger::debug("truncated record, %u bytes missing", _loggableId.c_str(), header.length);
            return NO_ALERT;
        }

        if (header.version != DTLSv12 && header.version != DTLSv10)
        {
            logger::debug("record version 0x%04x dropped", _loggableId.c_str(), header.version);
            continue;
        }

        const auto alert = processRecord(header, fragment);
        if (alert != NO_ALERT)
        {
            return alert;
        }
    }
    return NO_ALERT;
}

// Invalid records are silently discarded, rfc6347 4.1.2.7
AlertDescription DtlsRecordLayer::processRecord(const RecordHeader& header, const uint8_t* fragment)
{
    if (header.epoch > _readEpoch)
    {
        if (header.epoch == _readEpoch + 1 && _heldRecords.size() < MAX_HELD_RECORDS)
        {
            _heldRecords.push_back(HeldRecord{header, std::vector<uint8_t>(fragment, fragment + header.length)});
        }
        return NO_ALERT;
    }

    auto it = _readEpochs.find(header.epoch);
    if (it == _readEpochs.end())
    {
        return NO_ALERT;
    }

    auto& readState = it->second;
    if (!readState.replayWindow.check(header.sequenceNumber))
    {
        logger::debug("replayed record epoch %u seq %" PRIu64,
            _loggableId.c_str(),
            header.epoch,
            header.sequenceNumber);
        return NO_ALERT;
    }

    if (readState.cipher)
    {
        std::vector<uint8_t> plaintext;
        if (!readState.cipher->decrypt(header, fragment, header.length, plaintext))
        {
            logger::debug("record failed authentication, epoch %u", _loggableId.c_str(), header.epoch);
            return NO_ALERT;
        }
        if (plaintext.size() > MAX_PLAINTEXT_SIZE)
        {
            return RECORD_OVERFLOW;
        }
        readState.replayWindow.accept(header.sequenceNumber);
        return deliver(header, plaintext.data(), plaintext.size());
    }

    readState.replayWindow.accept(header.sequenceNumber);
    return deliver(header, fragment, header.length);
}

AlertDescription DtlsRecordLayer::deliver(const RecordHeader& header, const uint8_t* data, size_t length)
{
    switch (header.contentType)
    {
    case HANDSHAKE:
        return processHandshake(header.epoch, data, length);
    case CHANGE_CIPHER_SPEC:
        if (length != 1 || data[0] != 1)
        {
            return DECODE_ERROR;
        }
        _listener.onDtlsChangeCipherSpec(header.epoch);
        return NO_ALERT;
    case ALERT:
        if (length != 2)
        {
            return DECODE_ERROR;
        }
        _listener.onDtlsAlert(static_cast<AlertLevel>(data[0]), static_cast<AlertDescription>(data[1]));
        return NO_ALERT;
    case APPLICATION_DATA:
        if (header.epoch == 0)
        {
            logger::debug("unprotected application data dropped", _loggableId.c_str());
            return NO_ALERT;
        }
        _listener.onDtlsApplicationData(data, length);
        return NO_ALERT;
    default:
        logger::debug("unknown content type %u dropped", _loggableId.c_str(), header.contentType);
        return NO_ALERT;
    }
}

AlertDescription DtlsRecordLayer::processHandshake(uint16_t epoch, const uint8_t* data, size_t length)
{
    utils::ByteReader reader(data, length);
    while (!reader.empty())
    {
        HandshakeFragmentHeader header;
        if (!header.read(reader))
        {
            return DECODE_ERROR;
        }
        const uint8_t* body = reader.take(header.fragmentLength);
        if (!body)
        {
            return DECODE_ERROR;
        }

        if (static_cast<int16_t>(header.messageSeq - _reassembler.getNextSeq()) < 0)
        {
            _listener.onDtlsHandshakeRetransmission(header.messageSeq, epoch);
            continue;
        }

        if (header.length > HandshakeReassembler::MAX_MESSAGE_SIZE)
        {
            logger::warn("handshake message of %u bytes refused", _loggableId.c_str(), header.length);
            return HANDSHAKE_FAILURE;
        }

        if (!_reassembler.addFragment(header, body))
        {
            return ILLEGAL_PARAMETER;
        }

        HandshakeMessage message;
        while (_reassembler.pop(message))
        {
            _listener.onDtlsHandshakeMessage(message, epoch);
        }
    }
    return NO_ALERT;
}

} // namespace dtls
