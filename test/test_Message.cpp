#include <gtest/gtest.h>
#include "gavel/Crypto.hpp"
#include "gavel/Errors.hpp"
#include "gavel/Serialization.hpp"
#include "gavel/net/Message.hpp"
#include <stdexcept>
#include <string>
#include <vector>

using namespace gavel;
using namespace gavel::net;

// -----------------------
// HELPER FUNCTION
// -----------------------
Message makeMessage(RequestType t = RequestType::GET_METRICS, const std::string& payloadStr = "abc") {
    Message msg;
    msg.type = t;
    msg.payload = std::vector<uint8_t>(payloadStr.begin(), payloadStr.end());
    return msg;
}

// -----------------------
// ENDIANNESS / CRC32
// -----------------------
TEST(EndiannessTest, WritesMostSignificantByteFirst) {
    ByteWriter writer;
    writer.writeU32(0x12345678u);
    writer.writeU64(0x0102030405060708ull);

    std::vector<uint8_t> expected = {0x12, 0x34, 0x56, 0x78,
                                     0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08};
    EXPECT_EQ(writer.data(), expected);

    EXPECT_EQ(getU32(expected.data()), 0x12345678u);
    EXPECT_EQ(getU64(expected.data() + 4), 0x0102030405060708ull);
}

TEST(EndiannessTest, HeaderMagicIsBigEndianOnTheWire) {
    std::vector<uint8_t> data = serializeMessage(makeMessage());
    EXPECT_EQ(data[0], static_cast<uint8_t>(NETWORK_MAGIC >> 24));
    EXPECT_EQ(data[3], static_cast<uint8_t>(NETWORK_MAGIC & 0xFF));
    // Longitud del payload "abc" en los 8 bytes tras magic, version y tipo
    EXPECT_EQ(data[13], 3u);
    EXPECT_EQ(data[6], 0u);
}

TEST(CRC32Test, KnownValue) {
    const std::string data = "123456789";
    EXPECT_EQ(crc32_buf(data.data(), data.size()), 0xCBF43926u);
}

TEST(ByteReaderTest, RejectsShortInput) {
    std::vector<uint8_t> data = {0x00, 0x01};
    ByteReader reader(data);
    EXPECT_THROW(reader.readU32(), std::runtime_error);
}

TEST(ByteReaderTest, StringsAreLengthPrefixed) {
    ByteWriter writer;
    writer.writeString("gavel");
    writer.writeBool(true);
    std::vector<uint8_t> data = writer.take();
    ASSERT_EQ(data.size(), 4u + 5u + 1u);

    ByteReader reader(data);
    EXPECT_EQ(reader.readString(), "gavel");
    EXPECT_TRUE(reader.readBool());
    EXPECT_TRUE(reader.atEnd());
}

// -----------------------
// FRAMING
// -----------------------
TEST(SerializationTest, SerializeDeserializeHeader) {
    Message msg = makeMessage(RequestType::PLACE_BID, "hello");
    std::vector<uint8_t> data = serializeMessage(msg);
    ASSERT_EQ(data.size(), MESSAGE_HEADER_SIZE + 5 + CHECKSUM_SIZE);

    Message header;
    uint64_t payloadLen = 0;
    ASSERT_TRUE(parseMessageHeader(data, header, payloadLen));
    EXPECT_EQ(header.magic, NETWORK_MAGIC);
    EXPECT_EQ(header.version, PROTOCOL_VERSION);
    EXPECT_EQ(header.type, RequestType::PLACE_BID);
    EXPECT_EQ(payloadLen, 5u);
}

TEST(SerializationTest, SerializeDeserializeFullMessage) {
    Message msg = makeMessage(RequestType::GET_EVENTS, "payload");
    Message parsed;
    ASSERT_TRUE(parseFullMessage(serializeMessage(msg), parsed));
    EXPECT_EQ(parsed.type, RequestType::GET_EVENTS);
    EXPECT_EQ(parsed.payload, msg.payload);
}

TEST(SerializationTest, DetectCorruption) {
    std::vector<uint8_t> data = serializeMessage(makeMessage());
    data[MESSAGE_HEADER_SIZE] ^= 0xFF;

    Message parsed;
    EXPECT_FALSE(parseFullMessage(data, parsed));
}

TEST(SerializationTest, RejectsBadHeaderFields) {
    std::vector<uint8_t> data = serializeMessage(makeMessage());
    Message header;
    uint64_t payloadLen = 0;

    std::vector<uint8_t> badMagic = data;
    badMagic[0] ^= 0x01;
    EXPECT_FALSE(parseMessageHeader(badMagic, header, payloadLen));

    std::vector<uint8_t> badVersion = data;
    badVersion[4] = PROTOCOL_VERSION + 1;
    EXPECT_FALSE(parseMessageHeader(badVersion, header, payloadLen));

    std::vector<uint8_t> badType = data;
    badType[5] = 50;
    EXPECT_FALSE(parseMessageHeader(badType, header, payloadLen));

    std::vector<uint8_t> shortHeader(data.begin(), data.begin() + 6);
    EXPECT_FALSE(parseMessageHeader(shortHeader, header, payloadLen));
}

TEST(SerializationTest, RejectsTrailingBytes) {
    std::vector<uint8_t> data = serializeMessage(makeMessage());
    data.push_back(0x00);

    Message parsed;
    EXPECT_FALSE(parseFullMessage(data, parsed));
}

TEST(SerializationTest, OversizedPayloadThrows) {
    Message msg;
    msg.payload.assign(MAX_PAYLOAD_SIZE + 1, 0);
    EXPECT_THROW(serializeMessage(msg), std::runtime_error);
}

TEST(RequestTypeToStringTest, KnownTypes) {
    EXPECT_EQ(requestTypeToString(RequestType::CREATE_AUCTION), "CREATE_AUCTION");
    EXPECT_EQ(requestTypeToString(RequestType::GET_EVENTS), "GET_EVENTS");
    EXPECT_EQ(requestTypeToString(RequestType::DISCONNECT), "DISCONNECT");
    EXPECT_TRUE(isValidRequestType(12));
    EXPECT_FALSE(isValidRequestType(13));
    EXPECT_FALSE(isValidRequestType(0));
}

// -----------------------
// SIGNED REQUESTS / RESPONSES
// -----------------------
TEST(SignedRequestTest, EnvelopeCarriesVerifiableSignature) {
    ASSERT_TRUE(Crypto::initialize());
    std::vector<uint8_t> privateKey, publicKey;
    ASSERT_TRUE(Crypto::generateKeyPair(privateKey, publicKey));

    std::vector<uint8_t> body = {0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x07};
    Message msg = makeSignedRequest(RequestType::END_AUCTION, 42, body, privateKey, publicKey);
    EXPECT_EQ(msg.type, RequestType::END_AUCTION);

    SignedRequest decoded;
    ASSERT_TRUE(decodeRequest(msg.payload, decoded));
    EXPECT_EQ(decoded.publicKey, publicKey);
    EXPECT_EQ(decoded.nonce, 42u);
    EXPECT_EQ(decoded.body, body);
    EXPECT_TRUE(Crypto::verifySignature(publicKey, signingPayload(RequestType::END_AUCTION, 42, body),
                                        decoded.signature));

    // La firma cubre el tipo: otro tipo no verifica
    EXPECT_FALSE(Crypto::verifySignature(publicKey, signingPayload(RequestType::CANCEL_AUCTION, 42, body),
                                         decoded.signature));
}

TEST(SignedRequestTest, ShortEnvelopeRejected) {
    SignedRequest decoded;
    EXPECT_FALSE(decodeRequest(std::vector<uint8_t>(PUBLIC_KEY_SIZE + 8 + SIGNATURE_SIZE - 1, 0), decoded));

    SignedRequest bad;
    bad.publicKey.assign(10, 0);
    bad.signature.assign(SIGNATURE_SIZE, 0);
    EXPECT_THROW(encodeRequest(bad), std::invalid_argument);
}

TEST(ResponseTest, EncodeDecode) {
    Response response;
    response.status = static_cast<uint8_t>(ErrorCode::BidTooLow);
    response.message = "bid too low";
    response.result = {0x01, 0x02};

    Message msg = makeResponseMessage(response);
    EXPECT_EQ(msg.type, RequestType::RESPONSE);

    Response decoded;
    ASSERT_TRUE(decodeResponse(msg.payload, decoded));
    EXPECT_EQ(decoded.status, response.status);
    EXPECT_EQ(decoded.message, "bid too low");
    EXPECT_EQ(decoded.result, response.result);
}

TEST(ResponseTest, UnknownStatusRejected) {
    Response response;
    response.status = 77;
    Response decoded;
    EXPECT_FALSE(decodeResponse(encodeResponse(response), decoded));
}
