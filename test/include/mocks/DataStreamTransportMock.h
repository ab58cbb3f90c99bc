#pragma once

#include "webrtc/DataStreamTransport.h"
#include "webrtc/WebRtcDataStream.h"
#include <gmock/gmock.h>

namespace test
{

struct DataStreamTransportMock : public webrtc::DataStreamTransport
{
    MOCK_METHOD(bool, openSctpStream, (uint16_t streamId), (override));
    MOCK_METHOD(bool,
        sendSctp,
        (uint16_t streamId, uint32_t protocolId, const void* data, size_t length),
        (override));
    MOCK_METHOD(bool,
        setSctpReliability,
        (uint16_t streamId, sctp::SctpAssociation::Reliability reliability, uint32_t value, bool unordered),
        (override));
    MOCK_METHOD(bool, resetSctpStream, (uint16_t streamId), (override));
    MOCK_METHOD(size_t, getBufferedAmount, (uint16_t streamId), (const, override));
    MOCK_METHOD(void, setBufferedAmountLowThreshold, (uint16_t streamId, size_t threshold), (override));
};

struct WebRtcDataStreamListenerMock : public webrtc::WebRtcDataStream::Listener
{
    MOCK_METHOD(void, onWebRtcDataStreamOpen, (webrtc::WebRtcDataStream & stream), (override));
    MOCK_METHOD(void,
        onWebRtcData,
        (webrtc::WebRtcDataStream & stream, uint32_t payloadProtocol, const void* data, size_t length, bool isString),
        (override));
    MOCK_METHOD(void, onWebRtcDataStreamClosed, (webrtc::WebRtcDataStream & stream), (override));
};

} // namespace test
