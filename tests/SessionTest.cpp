#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <sstream>
#include <string>
#include "Crypto.hpp"
#include "Receiver.hpp"
#include "Sender.hpp"
#include "TestHelpers.hpp"
#include "Transport.hpp"

using namespace filepush;
using filepush::test::TempDir;
using filepush::test::randomBytes;
using filepush::test::readFile;

namespace {

const Endpoint kLoopback{"127.0.0.1", 0};

template <typename Fn>
ErrorCode codeOf(Fn&& fn) {
    try {
        fn();
    }
    catch (const TransferError& e) {
        return e.code();
    }
    return ErrorCode::None;
}

SenderOptions senderTo(uint16_t port) {
    SenderOptions options;
    options.remote = Endpoint{"127.0.0.1", port};
    return options;
}

ReceiverOptions receiverInto(const TempDir& dir) {
    ReceiverOptions options;
    options.local = kLoopback;
    options.destination = dir.path();
    return options;
}

// Scripted receiver side: accepts the connection and answers the
// capability, size and name steps with ACKs.
Connection acceptAndAckHeaders(Listener& listener, std::string* name = nullptr) {
    Connection peer = listener.accept();
    Transport::recvCapabilities(peer);
    Transport::sendAck(peer);
    Transport::recvSize(peer);
    Transport::sendAck(peer);
    std::string received = Transport::recvName(peer);
    if (name) *name = received;
    Transport::sendAck(peer);
    return peer;
}

// Scripted sender side: connects and announces a single file.
Connection connectAndSendHeaders(uint16_t port, uint64_t size, const std::string& name) {
    Connection peer = NetworkStack::connect(Endpoint{"127.0.0.1", port});
    Transport::sendCapabilities(peer, CapabilitySet{Capability::SingleFile, Capability::NoTimeout});
    EXPECT_TRUE(Transport::recvAck(peer));
    Transport::sendSize(peer, size);
    EXPECT_TRUE(Transport::recvAck(peer));
    Transport::sendName(peer, name);
    EXPECT_TRUE(Transport::recvAck(peer));
    return peer;
}

}

TEST(SessionTest, SingleFileWireScenario) {
    TempDir dir;
    auto path = dir.write("a.txt", "hello world");

    Listener listener = NetworkStack::listen(kLoopback);
    Sender sender(senderTo(listener.localPort()));
    sender.addFile(path);
    auto session = std::async(std::launch::async, [&sender] { return sender.run(); });

    Connection peer = listener.accept();

    uint8_t caps = 0;
    Transport::recvBuffer(peer, &caps, 1);
    EXPECT_EQ(caps, 0x11);
    Transport::sendAck(peer);

    Utils::SizeField size;
    Transport::recvBuffer(peer, size.data(), size.size());
    EXPECT_EQ(size, Utils::encodeSize(11));
    Transport::sendAck(peer);

    Utils::NameField name;
    Transport::recvBuffer(peer, name.data(), name.size());
    EXPECT_EQ(name, Utils::padName("a.txt"));
    Transport::sendAck(peer);

    std::ostringstream payload;
    Digest digest = Transport::recvExact(peer, payload, 11);
    EXPECT_EQ(payload.str(), "hello world");
    EXPECT_EQ(Crypto::toHex(digest),
              "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
    Transport::sendDigest(peer, digest);

    EXPECT_TRUE(Transport::recvAck(peer));

    // Batch ends with a half-close, not a zero size record
    uint8_t byte;
    EXPECT_EQ(peer.recvSome(&byte, 1), 0u);

    SessionReport report = session.get();
    ASSERT_EQ(report.size(), 1u);
    EXPECT_EQ(report[0].name, "a.txt");
    EXPECT_EQ(report[0].size, 11u);
    EXPECT_EQ(report[0].digest, digest);
}

TEST(SessionTest, SingleFileEndToEnd) {
    TempDir in, out;
    auto path = in.write("a.txt", "hello world");

    Receiver receiver(receiverInto(out));
    uint16_t port = receiver.listen();
    auto received = std::async(std::launch::async, [&receiver] { return receiver.run(); });

    Sender sender(senderTo(port));
    sender.addFile(path);
    SessionReport sent = sender.run();
    SessionReport got = received.get();

    ASSERT_EQ(sent.size(), 1u);
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0].name, "a.txt");
    EXPECT_EQ(got[0].digest, sent[0].digest);
    EXPECT_EQ(readFile(out.path() / "a.txt"), "hello world");
    EXPECT_EQ(receiver.capabilities(),
              (CapabilitySet{Capability::SingleFile, Capability::NoTimeout}));
}

TEST(SessionTest, MultipleFilesWithTimeout) {
    TempDir in, out;
    const std::string big = randomBytes(1024 * 1024 + 123);
    const std::string small = "second file\n";
    auto bigPath = in.write("big.bin", big);
    auto smallPath = in.write("small.txt", small);

    ReceiverOptions ropts = receiverInto(out);
    ropts.timeout = std::chrono::seconds(10);
    Receiver receiver(ropts);
    uint16_t port = receiver.listen();
    auto received = std::async(std::launch::async, [&receiver] { return receiver.run(); });

    SenderOptions sopts = senderTo(port);
    sopts.useTimeout = true;
    sopts.timeout = std::chrono::seconds(10);
    Sender sender(sopts);
    sender.addFile(bigPath);
    sender.addFile(smallPath);
    EXPECT_EQ(sender.capabilities().encode(), 0x06);

    SessionReport sent = sender.run();
    SessionReport got = received.get();

    ASSERT_EQ(got.size(), 2u);
    EXPECT_EQ(got[0].name, "big.bin");
    EXPECT_EQ(got[1].name, "small.txt");
    EXPECT_EQ(got[0].digest, Crypto::sha256(big));
    EXPECT_EQ(got[0].digest, sent[0].digest);
    EXPECT_EQ(got[1].digest, sent[1].digest);
    EXPECT_EQ(readFile(out.path() / "big.bin"), big);
    EXPECT_EQ(readFile(out.path() / "small.txt"), small);
    EXPECT_TRUE(receiver.capabilities().has(Capability::Timeout));
}

TEST(SessionTest, ZeroFilesEndsAfterNegotiation) {
    TempDir out;
    Receiver receiver(receiverInto(out));
    uint16_t port = receiver.listen();
    auto received = std::async(std::launch::async, [&receiver] { return receiver.run(); });

    Sender sender(senderTo(port));
    EXPECT_TRUE(sender.run().empty());
    EXPECT_TRUE(received.get().empty());
    EXPECT_EQ(receiver.capabilities(),
              (CapabilitySet{Capability::MultiFiles, Capability::NoTimeout}));
}

TEST(SessionTest, MaximumLengthNameEndToEnd) {
    TempDir in, out;
    auto path = in.write("source.txt", "payload");
    const std::string longName(255, 'x');

    Receiver receiver(receiverInto(out));
    uint16_t port = receiver.listen();
    auto received = std::async(std::launch::async, [&receiver] { return receiver.run(); });

    Sender sender(senderTo(port));
    sender.addFile(path, longName);
    sender.run();

    SessionReport got = received.get();
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0].name, longName);
    EXPECT_EQ(readFile(out.path() / longName), "payload");
}

TEST(SessionTest, ExistingDestinationIsReplaced) {
    TempDir in, out;
    auto path = in.write("a.txt", "new");
    out.write("a.txt", "old content that is longer");

    Receiver receiver(receiverInto(out));
    uint16_t port = receiver.listen();
    auto received = std::async(std::launch::async, [&receiver] { return receiver.run(); });

    Sender sender(senderTo(port));
    sender.addFile(path);
    sender.run();
    received.get();

    EXPECT_EQ(readFile(out.path() / "a.txt"), "new");
}

TEST(SessionTest, SenderDetectsCorruptedPayload) {
    TempDir dir;
    const std::string content = randomBytes(50000, 3);
    auto path = dir.write("data.bin", content);

    Listener listener = NetworkStack::listen(kLoopback);
    Sender sender(senderTo(listener.localPort()));
    sender.addFile(path);
    auto session = std::async(std::launch::async, [&sender] { return sender.run(); });

    Connection peer = acceptAndAckHeaders(listener);
    std::ostringstream sink;
    Transport::recvExact(peer, sink, content.size());

    // One bit flipped somewhere in transit
    std::string corrupted = sink.str();
    corrupted[12345] ^= 0x10;
    Transport::sendDigest(peer, Crypto::sha256(corrupted));

    EXPECT_EQ(codeOf([&] { session.get(); }), ErrorCode::IntegrityMismatch);
    // No final ACK follows a mismatch
    EXPECT_FALSE(Transport::recvAck(peer));
}

TEST(SessionTest, SenderReportsPeerLossMidPayload) {
    TempDir dir;
    auto path = dir.write("large.bin", std::string(32 * 1024 * 1024, 'z'));

    Listener listener = NetworkStack::listen(kLoopback);
    Sender sender(senderTo(listener.localPort()));
    sender.addFile(path);
    auto session = std::async(std::launch::async, [&sender] { return sender.run(); });

    {
        Connection peer = acceptAndAckHeaders(listener);
        uint8_t some[1000];
        Transport::recvBuffer(peer, some, sizeof(some));
    }

    EXPECT_EQ(codeOf([&] { session.get(); }), ErrorCode::ConnectionBroken);
}

TEST(SessionTest, SenderAbortsOnRejectedCapabilities) {
    TempDir dir;
    auto path = dir.write("a.txt", "hello world");

    Listener listener = NetworkStack::listen(kLoopback);
    Sender sender(senderTo(listener.localPort()));
    sender.addFile(path);
    auto session = std::async(std::launch::async, [&sender] { return sender.run(); });

    Connection peer = listener.accept();
    Transport::recvCapabilities(peer);
    const uint8_t nack = 0x00;
    Transport::sendBuffer(peer, &nack, 1);

    EXPECT_EQ(codeOf([&] { session.get(); }), ErrorCode::AckRejected);
}

TEST(SessionTest, ReceiverReportsPeerLossMidPayload) {
    TempDir out;
    Receiver receiver(receiverInto(out));
    uint16_t port = receiver.listen();
    auto received = std::async(std::launch::async, [&receiver] { return receiver.run(); });

    {
        Connection peer = connectAndSendHeaders(port, 100, "cut.bin");
        const uint8_t partial[5] = {'a', 'b', 'c', 'd', 'e'};
        Transport::sendBuffer(peer, partial, sizeof(partial));
    }

    EXPECT_EQ(codeOf([&] { received.get(); }), ErrorCode::ConnectionBroken);
    // Partial data stays on disk
    EXPECT_EQ(readFile(out.path() / "cut.bin"), "abcde");
}

TEST(SessionTest, ReceiverRequiresFinalAck) {
    TempDir out;
    Receiver receiver(receiverInto(out));
    uint16_t port = receiver.listen();
    auto received = std::async(std::launch::async, [&receiver] { return receiver.run(); });

    Connection peer = connectAndSendHeaders(port, 5, "partial.bin");
    const uint8_t payload[5] = {'a', 'b', 'c', 'd', 'e'};
    Transport::sendBuffer(peer, payload, sizeof(payload));
    EXPECT_EQ(Transport::recvDigest(peer), Crypto::sha256("abcde"));
    const uint8_t nack = 0x00;
    Transport::sendBuffer(peer, &nack, 1);

    EXPECT_EQ(codeOf([&] { received.get(); }), ErrorCode::AckRejected);
    EXPECT_EQ(readFile(out.path() / "partial.bin"), "abcde");
}

TEST(SessionTest, ReceiverRejectsPathInName) {
    TempDir out;
    Receiver receiver(receiverInto(out));
    uint16_t port = receiver.listen();
    auto received = std::async(std::launch::async, [&receiver] { return receiver.run(); });

    Connection peer = NetworkStack::connect(Endpoint{"127.0.0.1", port});
    Transport::sendCapabilities(peer, CapabilitySet{Capability::SingleFile, Capability::NoTimeout});
    EXPECT_TRUE(Transport::recvAck(peer));
    Transport::sendSize(peer, 4);
    EXPECT_TRUE(Transport::recvAck(peer));
    Transport::sendName(peer, "../evil.txt");

    EXPECT_EQ(codeOf([&] { received.get(); }), ErrorCode::ProtocolDecodeFailure);
}

TEST(SessionTest, ReceiverTimesOutWhenNegotiated) {
    TempDir out;
    ReceiverOptions options = receiverInto(out);
    options.timeout = std::chrono::milliseconds(200);
    Receiver receiver(options);
    uint16_t port = receiver.listen();
    auto received = std::async(std::launch::async, [&receiver] { return receiver.run(); });

    Connection peer = NetworkStack::connect(Endpoint{"127.0.0.1", port});
    Transport::sendCapabilities(peer, CapabilitySet{Capability::SingleFile, Capability::Timeout});
    EXPECT_TRUE(Transport::recvAck(peer));
    Transport::sendSize(peer, 10);
    EXPECT_TRUE(Transport::recvAck(peer));
    // Stall inside the name field
    const uint8_t fragment[3] = {'a', 'b', 'c'};
    Transport::sendBuffer(peer, fragment, sizeof(fragment));

    EXPECT_EQ(codeOf([&] { received.get(); }), ErrorCode::Timeout);
}

TEST(SessionTest, PreflightRejectsOversizeNameWithoutConnecting) {
    TempDir dir;
    auto path = dir.write("a.txt", "hello world");

    // Nothing listens on port 1; a connection attempt would fail with NetworkError
    Sender sender(senderTo(1));
    sender.addFile(path, std::string(256, 'n'));
    EXPECT_EQ(codeOf([&] { sender.run(); }), ErrorCode::NameTooLong);
}

TEST(SessionTest, PreflightRejectsMalformedWireName) {
    TempDir dir;
    auto path = dir.write("a.txt", "hello world");

    for (const std::string& name : {std::string("sub/x.txt"), std::string("\xff\xfe.bin"),
                                    std::string(".."), std::string("\xc3")}) {
        // Port 1: reaching the network would fail with NetworkError instead
        Sender sender(senderTo(1));
        sender.addFile(path, name);
        EXPECT_EQ(codeOf([&] { sender.run(); }), ErrorCode::InvalidParameter)
            << "wire name of " << name.size() << " bytes";
    }
}

TEST(SessionTest, PreflightChecksEveryFileFirst) {
    TempDir dir;
    auto good = dir.write("good.txt", "ok");
    auto empty = dir.write("empty.txt", "");

    Sender missing(senderTo(1));
    missing.addFile(good);
    missing.addFile(dir.path() / "absent.txt");
    EXPECT_EQ(codeOf([&] { missing.run(); }), ErrorCode::FileNotFound);

    Sender directory(senderTo(1));
    directory.addFile(dir.path());
    EXPECT_EQ(codeOf([&] { directory.run(); }), ErrorCode::NotARegularFile);

    Sender zero(senderTo(1));
    zero.addFile(empty);
    EXPECT_EQ(codeOf([&] { zero.run(); }), ErrorCode::InvalidParameter);
}

TEST(SessionTest, RefusedConnectionIsNetworkError) {
    TempDir dir;
    auto path = dir.write("a.txt", "hello world");

    uint16_t port;
    {
        Listener closed = NetworkStack::listen(kLoopback);
        port = closed.localPort();
    }

    Sender sender(senderTo(port));
    sender.addFile(path);
    EXPECT_EQ(codeOf([&] { sender.run(); }), ErrorCode::NetworkError);
}
