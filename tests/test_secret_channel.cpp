#include "test_support.hpp"
#include <managers/secret_channel.hpp>
#include <atomic>
#include <chrono>
#include <thread>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace std::chrono_literals;

// Open the FIFO for reading (blocks until the writer opens) and read to EOF.
static std::string read_fifo(const fs::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) return "<open failed>";
    std::string out;
    char buf[256];
    ssize_t n;
    while ((n = ::read(fd, buf, sizeof(buf))) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
    ::close(fd);
    return out;
}

class SecretChannelTest : public ScratchTest {
protected:
    fs::path node;

    void SetUp() override {
        ScratchTest::SetUp();
        node = test_dir / "env";
    }
};

TEST_F(SecretChannelTest, CreateMakesPrivateFifo) {
    auto ch = SecretChannel::create(node, 0600);
    ASSERT_TRUE(ch.is_ok()) << ch.error;
    EXPECT_TRUE(ch.value.is_open());

    struct stat st;
    ASSERT_EQ(lstat(node.c_str(), &st), 0);
    EXPECT_TRUE(S_ISFIFO(st.st_mode));
    EXPECT_EQ(st.st_mode & 07777, 0600u);
}

TEST_F(SecretChannelTest, ExistingNodeIsChannelExists) {
    write_file(node, "stale");
    auto ch = SecretChannel::create(node, 0600);
    ASSERT_TRUE(ch.is_err());
    EXPECT_EQ(ch.code, ErrorCode::ChannelExists);
    EXPECT_EQ(read_file(node), "stale");
}

TEST_F(SecretChannelTest, DestructorUnlinksNode) {
    {
        auto ch = SecretChannel::create(node, 0600);
        ASSERT_TRUE(ch.is_ok());
        EXPECT_TRUE(fs::exists(fs::symlink_status(node)));
    }
    EXPECT_FALSE(fs::exists(fs::symlink_status(node)));
}

TEST_F(SecretChannelTest, CloseIsIdempotent) {
    auto ch = SecretChannel::create(node, 0600);
    ASSERT_TRUE(ch.is_ok());
    EXPECT_TRUE(ch.value.close().is_ok());
    EXPECT_FALSE(ch.value.is_open());
    EXPECT_TRUE(ch.value.close().is_ok());
}

TEST_F(SecretChannelTest, ReaderReceivesWholeSecretThenEof) {
    auto ch = SecretChannel::create(node, 0600);
    ASSERT_TRUE(ch.is_ok());

    std::string received;
    std::thread reader([&] { received = read_fifo(node); });

    Secret secret(std::string("vault-password\nline two"));
    auto r = ch.value.write_once(secret, 5s);
    reader.join();

    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(received, "vault-password\nline two");
}

TEST_F(SecretChannelTest, LargeSecretStreamsPastPipeBuffer) {
    auto ch = SecretChannel::create(node, 0600);
    ASSERT_TRUE(ch.is_ok());

    std::string payload(256 * 1024, 'x');
    payload.back() = 'y';
    std::string received;
    std::thread reader([&] { received = read_fifo(node); });

    auto r = ch.value.write_once(Secret(payload), 10s);
    reader.join();

    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(received.size(), payload.size());
    EXPECT_EQ(received, payload);
}

TEST_F(SecretChannelTest, NoReaderTimesOut) {
    auto ch = SecretChannel::create(node, 0600);
    ASSERT_TRUE(ch.is_ok());

    auto start = std::chrono::steady_clock::now();
    auto r = ch.value.write_once(Secret(std::string("s3cret")), 200ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::Timeout);
    EXPECT_GE(elapsed, 200ms);
    EXPECT_LT(elapsed, 5s);
    EXPECT_EQ(r.error.find("s3cret"), std::string::npos);
}

TEST_F(SecretChannelTest, SecondWriteRefused) {
    auto ch = SecretChannel::create(node, 0600);
    ASSERT_TRUE(ch.is_ok());

    std::thread reader([&] { read_fifo(node); });
    ASSERT_TRUE(ch.value.write_once(Secret(std::string("once")), 5s).is_ok());
    reader.join();

    auto again = ch.value.write_once(Secret(std::string("twice")), 100ms);
    ASSERT_TRUE(again.is_err());
    EXPECT_EQ(again.code, ErrorCode::ChannelExists);
}

TEST_F(SecretChannelTest, ReaderSeesEofAfterDelivery) {
    auto ch = SecretChannel::create(node, 0600);
    ASSERT_TRUE(ch.is_ok());

    // A reader that is already attached gets the payload, then EOF
    int keep = ::open(node.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    ASSERT_GE(keep, 0);
    ASSERT_TRUE(ch.value.write_once(Secret(std::string("first")), 5s).is_ok());

    char buf[16];
    ssize_t n = ::read(keep, buf, sizeof(buf));
    EXPECT_EQ(std::string(buf, n > 0 ? static_cast<size_t>(n) : 0), "first");
    EXPECT_EQ(::read(keep, buf, sizeof(buf)), 0);
    ::close(keep);
}

TEST_F(SecretChannelTest, RemovedNodeIsNoReader) {
    auto ch = SecretChannel::create(node, 0600);
    ASSERT_TRUE(ch.is_ok());

    std::thread remover([&] {
        std::this_thread::sleep_for(100ms);
        fs::remove(node);
    });
    auto r = ch.value.write_once(Secret(std::string("payload")), 5s);
    remover.join();

    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::NoReader);
}

TEST_F(SecretChannelTest, CancelStopsTheWait) {
    auto ch = SecretChannel::create(node, 0600);
    ASSERT_TRUE(ch.is_ok());

    std::atomic<bool> cancel{false};
    std::thread canceler([&] {
        std::this_thread::sleep_for(100ms);
        cancel.store(true);
    });
    auto r = ch.value.write_once(Secret(std::string("payload")), 5s, &cancel);
    canceler.join();

    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::Canceled);
}

TEST_F(SecretChannelTest, ReaderClosingEarlyIsNoReader) {
    auto ch = SecretChannel::create(node, 0600);
    ASSERT_TRUE(ch.is_ok());

    // Attach, read a little, and leave before the payload is drained
    std::thread reader([&] {
        int fd = ::open(node.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) return;
        char buf[16];
        ssize_t n = ::read(fd, buf, sizeof(buf));
        (void)n;
        ::close(fd);
    });

    std::string payload(1024 * 1024, 'p');
    auto r = ch.value.write_once(Secret(payload), 5s);
    reader.join();

    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::NoReader);
}

TEST_F(SecretChannelTest, SecondReaderAfterDeliveryGetsNothing) {
    auto ch = SecretChannel::create(node, 0600);
    ASSERT_TRUE(ch.is_ok());

    std::string first;
    std::thread reader([&] { first = read_fifo(node); });
    ASSERT_TRUE(ch.value.write_once(Secret(std::string("only-once")), 5s).is_ok());
    reader.join();
    ASSERT_EQ(first, "only-once");

    // The node is still there until close(); a fresh reader finds no
    // writer and no data
    int fd = ::open(node.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    ASSERT_GE(fd, 0);
    char buf[16];
    EXPECT_EQ(::read(fd, buf, sizeof(buf)), 0);
    ::close(fd);
}
