#include "gtest/gtest.h"
#include "test_utils.h"
#include "escpos/io/ConsoleDriver.hpp"
#include "escpos/io/FileDriver.hpp"
#include "escpos/io/NetworkDriver.hpp"
#include "escpos/printer/Printer.hpp"
#include "escpos/types/Error.hpp"

#include <boost/asio.hpp>

#include <array>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

using namespace escpos;
using boost::asio::ip::tcp;

namespace fs = std::filesystem;

class DriverTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempPath = fs::temp_directory_path() /
                   ("escpos_driver_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + ".bin");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(tempPath, ec);
    }

    static Command readFile(const fs::path &path) {
        std::ifstream in(path, std::ios::binary);
        return Command(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    fs::path tempPath;
};

TEST_F(DriverTest, ConsoleWritesRawBytes) {
    std::ostringstream out;
    io::ConsoleDriver driver(out);
    const auto result = driver.write({0x1B, 0x40, 'A'});
    EXPECT_TRUE(result.isSuccess());
    EXPECT_EQ(result.bytes, 3u);
    EXPECT_TRUE(driver.flush().isSuccess());
    EXPECT_EQ(out.str(), std::string("\x1B@A"));
}

TEST_F(DriverTest, ConsoleCannotRead) {
    std::ostringstream out;
    io::ConsoleDriver driver(out);
    std::vector<uint8_t> buffer(1);
    EXPECT_TRUE(driver.read(buffer).isError());
}

TEST_F(DriverTest, FileReceivesPrintedBatch) {
    {
        auto driver = std::make_shared<io::FileDriver>(tempPath.string());
        printer::Printer printer(driver, std::make_shared<Protocol>());
        printer.init().write("ok").cut().print();
        EXPECT_EQ(driver->path(), tempPath.string());
    }
    EXPECT_EQ(readFile(tempPath), test::bytes({0x1B, 0x40, 'o', 'k', 0x1D, 0x56, 0x41, 0x00}));
}

TEST_F(DriverTest, FileIsTruncatedOnOpen) {
    {
        io::FileDriver first(tempPath.string());
        ASSERT_TRUE(first.write({1, 2, 3, 4}).isSuccess());
    }
    {
        io::FileDriver second(tempPath.string());
        ASSERT_TRUE(second.write({9}).isSuccess());
        ASSERT_TRUE(second.flush().isSuccess());
    }
    EXPECT_EQ(readFile(tempPath), test::bytes({9}));
}

TEST_F(DriverTest, FileOpenFailureThrows) {
    const auto missing = tempPath / "no" / "such" / "dir.bin";
    EXPECT_THROW(io::FileDriver(missing.string()), types::TransportException);
}

TEST_F(DriverTest, NetworkRoundTrip) {
    boost::asio::io_context io;
    tcp::acceptor acceptor(io, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    const auto port = acceptor.local_endpoint().port();

    io::NetworkDriver driver("127.0.0.1", port, 200);
    tcp::socket peer(io);
    acceptor.accept(peer);

    ASSERT_TRUE(driver.write({0x10, 0x04, 0x01, 0x00}).isSuccess());
    ASSERT_TRUE(driver.flush().isSuccess());

    std::array<uint8_t, 4> received{};
    boost::asio::read(peer, boost::asio::buffer(received));
    EXPECT_EQ(Command(received.begin(), received.end()), test::bytes({0x10, 0x04, 0x01, 0x00}));

    const std::array<uint8_t, 1> answer = {0x12};
    boost::asio::write(peer, boost::asio::buffer(answer));

    std::vector<uint8_t> buffer(1);
    const auto result = driver.read(buffer);
    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.bytes, 1u);
    EXPECT_EQ(buffer[0], 0x12);
}

TEST_F(DriverTest, NetworkReadTimesOut) {
    boost::asio::io_context io;
    tcp::acceptor acceptor(io, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));

    io::NetworkDriver driver("127.0.0.1", acceptor.local_endpoint().port(), 50);
    tcp::socket peer(io);
    acceptor.accept(peer);

    std::vector<uint8_t> buffer(1);
    EXPECT_TRUE(driver.read(buffer).isTimeout());
}

TEST_F(DriverTest, NetworkConnectFailureThrows) {
    uint16_t port = 0;
    {
        boost::asio::io_context io;
        tcp::acceptor acceptor(io, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        port = acceptor.local_endpoint().port();
    }
    EXPECT_THROW(io::NetworkDriver("127.0.0.1", port), types::TransportException);
}
