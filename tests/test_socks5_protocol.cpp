#include <cstring>
#include <vector>

#include <arpa/inet.h>
#include <gtest/gtest.h>
#include <sys/socket.h>
#include <unistd.h>

#include "Errors.h"
#include "Socks5Protocol.h"
#include "utils.h"

namespace {

// Feeds raw bytes to the decoders through a socketpair.
class Socks5Decode : public ::testing::Test {
protected:
    void SetUp() override {
        int fds[2];
        ASSERT_EQ(0, socketpair(AF_UNIX, SOCK_STREAM, 0, fds));
        reader_.reset(fds[0]);
        writer_.reset(fds[1]);
    }

    void feed(const std::vector<uint8_t>& bytes, bool close_after = false) {
        ASSERT_TRUE(send_all(writer_.get(), bytes.data(), bytes.size()));
        if (close_after) {
            writer_.reset();
        }
    }

    Socket reader_;
    Socket writer_;
};

} // namespace

TEST_F(Socks5Decode, Greeting) {
    feed({0x05, 0x02, 0x00, 0x02});
    Greeting greeting;
    ASSERT_EQ(read_greeting(reader_.get(), greeting), IoStatus::OK);
    EXPECT_EQ(greeting.version, 5);
    EXPECT_EQ(greeting.methods, (std::vector<uint8_t>{0x00, 0x02}));
}

TEST_F(Socks5Decode, GreetingWithoutMethods) {
    feed({0x05, 0x00});
    Greeting greeting;
    ASSERT_EQ(read_greeting(reader_.get(), greeting), IoStatus::OK);
    EXPECT_TRUE(greeting.methods.empty());
    EXPECT_EQ(select_auth_method(greeting.methods), AuthMethod::NO_ACCEPTABLE);
}

TEST_F(Socks5Decode, GreetingWrongVersionHasNoReply) {
    feed({0x04, 0x01, 0x00});
    Greeting greeting;
    try {
        read_greeting(reader_.get(), greeting);
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_FALSE(e.has_reply());
    }
}

TEST_F(Socks5Decode, GreetingTruncated) {
    feed({0x05, 0x03, 0x00}, true);
    Greeting greeting;
    EXPECT_EQ(read_greeting(reader_.get(), greeting), IoStatus::CLOSED);
}

TEST_F(Socks5Decode, RequestIpv4) {
    feed({0x05, 0x01, 0x00, 0x01, 192, 168, 1, 20, 0x01, 0xbb});
    Request request;
    ASSERT_EQ(read_request(reader_.get(), request), IoStatus::OK);
    EXPECT_EQ(request.command, static_cast<uint8_t>(Command::CONNECT));
    EXPECT_EQ(request.address_type, AddressType::IPV4);
    EXPECT_EQ(request.host, "192.168.1.20");
    EXPECT_EQ(request.port, 443);
}

TEST_F(Socks5Decode, RequestDomainAcceptsAnyReservedByte) {
    std::vector<uint8_t> bytes = {0x05, 0x01, 0x7f, 0x03, 11};
    const char* host = "example.com";
    bytes.insert(bytes.end(), host, host + 11);
    bytes.push_back(0x00);
    bytes.push_back(0x50);
    feed(bytes);
    Request request;
    ASSERT_EQ(read_request(reader_.get(), request), IoStatus::OK);
    EXPECT_EQ(request.reserved, 0x7f);
    EXPECT_EQ(request.address_type, AddressType::DOMAIN);
    EXPECT_EQ(request.host, "example.com");
    EXPECT_EQ(request.port, 80);
}

TEST_F(Socks5Decode, RequestLongestDomain) {
    std::vector<uint8_t> bytes = {0x05, 0x01, 0x00, 0x03, 255};
    bytes.insert(bytes.end(), 255, 'a');
    bytes.push_back(0x1f);
    bytes.push_back(0x90);
    feed(bytes);
    Request request;
    ASSERT_EQ(read_request(reader_.get(), request), IoStatus::OK);
    EXPECT_EQ(request.host, std::string(255, 'a'));
    EXPECT_EQ(request.port, 8080);
}

TEST_F(Socks5Decode, RequestIpv6) {
    std::vector<uint8_t> bytes = {0x05, 0x01, 0x00, 0x04};
    in6_addr addr{};
    inet_pton(AF_INET6, "2001:db8::1", &addr);
    const auto* raw = reinterpret_cast<const uint8_t*>(&addr);
    bytes.insert(bytes.end(), raw, raw + 16);
    bytes.push_back(0x00);
    bytes.push_back(0x16);
    feed(bytes);
    Request request;
    ASSERT_EQ(read_request(reader_.get(), request), IoStatus::OK);
    EXPECT_EQ(request.address_type, AddressType::IPV6);
    EXPECT_EQ(request.host, "2001:db8::1");
    EXPECT_EQ(request.port, 22);
}

TEST_F(Socks5Decode, RequestBindIsDecoded) {
    feed({0x05, 0x02, 0x00, 0x01, 10, 0, 0, 1, 0x00, 0x15});
    Request request;
    ASSERT_EQ(read_request(reader_.get(), request), IoStatus::OK);
    EXPECT_EQ(request.command, static_cast<uint8_t>(Command::BIND));
}

TEST_F(Socks5Decode, RequestUnknownAddressType) {
    feed({0x05, 0x01, 0x00, 0x09});
    Request request;
    try {
        read_request(reader_.get(), request);
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        ASSERT_TRUE(e.has_reply());
        EXPECT_EQ(e.reply(), ReplyCode::ADDRESS_TYPE_NOT_SUPPORTED);
    }
}

TEST_F(Socks5Decode, RequestWrongVersion) {
    feed({0x04, 0x01, 0x00, 0x01, 1, 2, 3, 4, 0, 80});
    Request request;
    try {
        read_request(reader_.get(), request);
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        ASSERT_TRUE(e.has_reply());
        EXPECT_EQ(e.reply(), ReplyCode::GENERAL_FAILURE);
    }
}

TEST_F(Socks5Decode, RequestEmptyDomain) {
    feed({0x05, 0x01, 0x00, 0x03, 0x00, 0x00, 0x50});
    Request request;
    EXPECT_THROW(read_request(reader_.get(), request), ProtocolError);
}

TEST(Socks5Encode, MethodSelection) {
    EXPECT_EQ(encode_method_selection(AuthMethod::NO_AUTH), (std::vector<uint8_t>{0x05, 0x00}));
    EXPECT_EQ(encode_method_selection(AuthMethod::NO_ACCEPTABLE), (std::vector<uint8_t>{0x05, 0xff}));
}

TEST(Socks5Encode, NoAuthPreferredWhenOffered) {
    EXPECT_EQ(select_auth_method({0x02, 0x01, 0x00}), AuthMethod::NO_AUTH);
    EXPECT_EQ(select_auth_method({0x02}), AuthMethod::NO_ACCEPTABLE);
}

TEST(Socks5Encode, FailureReplyHasZeroAddress) {
    EXPECT_EQ(encode_reply(ReplyCode::COMMAND_NOT_SUPPORTED),
              (std::vector<uint8_t>{0x05, 0x07, 0x00, 0x01, 0, 0, 0, 0, 0, 0}));
    EXPECT_EQ(encode_reply(ReplyCode::HOST_UNREACHABLE)[1], 0x04);
}

TEST(Socks5Encode, SuccessReplyCarriesBoundAddress) {
    sockaddr_storage bound{};
    auto* sin = reinterpret_cast<sockaddr_in*>(&bound);
    sin->sin_family = AF_INET;
    sin->sin_port = htons(40000);
    inet_pton(AF_INET, "192.168.1.5", &sin->sin_addr);
    EXPECT_EQ(encode_reply(ReplyCode::SUCCEEDED, &bound),
              (std::vector<uint8_t>{0x05, 0x00, 0x00, 0x01, 192, 168, 1, 5, 0x9c, 0x40}));
}

TEST(Socks5Encode, SuccessReplyIpv6) {
    sockaddr_storage bound{};
    auto* sin6 = reinterpret_cast<sockaddr_in6*>(&bound);
    sin6->sin6_family = AF_INET6;
    sin6->sin6_port = htons(443);
    inet_pton(AF_INET6, "::1", &sin6->sin6_addr);
    std::vector<uint8_t> reply = encode_reply(ReplyCode::SUCCEEDED, &bound);
    ASSERT_EQ(reply.size(), 22u);
    EXPECT_EQ(reply[3], 0x04);
    EXPECT_EQ(reply[19], 0x01);
    EXPECT_EQ(reply[20], 0x01);
    EXPECT_EQ(reply[21], 0xbb);
}

TEST(Socks5Encode, ReplyNames) {
    EXPECT_STREQ(reply_code_name(ReplyCode::CONNECTION_REFUSED), "connection refused");
    EXPECT_STREQ(reply_code_name(ReplyCode::ADDRESS_TYPE_NOT_SUPPORTED), "address type not supported");
}
