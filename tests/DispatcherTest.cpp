#include "Dispatcher.hpp"
#include "Errors.hpp"
#include "RecordingIO.hpp"
#include "TestServer.hpp"

#include <gtest/gtest.h>

#include <boost/asio.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/shared_ptr.hpp>

#include <stdexcept>
#include <string>

namespace {

typedef boost::shared_ptr<boost::asio::io_service> IoServicePtr;

std::string
ClosedAddress(IoServicePtr &_io_service)
{
    boost::asio::ip::tcp::acceptor _acceptor(
            *_io_service,
            boost::asio::ip::tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
    return "127.0.0.1:" + boost::lexical_cast<std::string>(_acceptor.local_endpoint().port());
}

} // namespace

TEST(DispatcherTest, ParsesModeNames)
{
    DispatchMode _mode = BOUNDED_DISPATCH;

    EXPECT_TRUE(ParseDispatchMode("pooled", _mode));
    EXPECT_EQ(POOLED_DISPATCH, _mode);
    EXPECT_TRUE(ParseDispatchMode("bounded", _mode));
    EXPECT_EQ(BOUNDED_DISPATCH, _mode);
    EXPECT_FALSE(ParseDispatchMode("round-robin", _mode));
    EXPECT_EQ(BOUNDED_DISPATCH, _mode);

    EXPECT_STREQ("pooled", DispatchModeName(POOLED_DISPATCH));
    EXPECT_STREQ("bounded", DispatchModeName(BOUNDED_DISPATCH));
}

TEST(DispatcherTest, Defaults)
{
    DispatchConfig _config = DefaultDispatchConfig();
    EXPECT_EQ(POOLED_DISPATCH, _config.mode);
    EXPECT_EQ(4u, _config.connections);
    EXPECT_EQ(1024u, _config.queue_capacity);
    EXPECT_EQ(256u, _config.max_in_flight);
}

TEST(DispatcherTest, ConnectFailureIsFatal)
{
    IoServicePtr _io_service(new boost::asio::io_service);
    DispatchConfig _config = DefaultDispatchConfig();
    _config.address = ClosedAddress(_io_service);

    _config.mode = POOLED_DISPATCH;
    EXPECT_THROW(Dispatcher::Connect(_io_service, _config), ConnectError);

    _config.mode = BOUNDED_DISPATCH;
    EXPECT_THROW(Dispatcher::Connect(_io_service, _config), ConnectError);

    _config.address = "no port here";
    EXPECT_THROW(Dispatcher::Connect(_io_service, _config), ConnectError);
}

TEST(DispatcherTest, ControlConnectionStaysOutOfPool)
{
    RecordingIOPtr _control(new RecordingIO);
    RecordingIOPtr _worker(new RecordingIO);
    _control->QueueReply("SIZE 320 240");

    std::vector<CommandIOPtr> _ios(1, _worker);
    Dispatcher _dispatcher(PooledSenderPtr(new PooledSender(_ios, 4, 1)), _control);

    EXPECT_EQ(POOLED_DISPATCH, _dispatcher.Mode());
    EXPECT_EQ(MakeVec2(320, 240), _dispatcher.QuerySize());

    for (unsigned i = 0; i < 10; ++i)
        _dispatcher.Submit(SetPixelCommand(MakeVec2(i, 0), MakeRgb(1, 2, 3)));
    _dispatcher.Finish();

    EXPECT_EQ(10u, _dispatcher.SentCount());
    EXPECT_EQ(10u, _worker->Sent().size());
    ASSERT_EQ(1u, _control->Sent().size());
    EXPECT_EQ("SIZE", _control->Sent()[0]);
}

TEST(DispatcherTest, SizeQueryErrorsPropagate)
{
    RecordingIOPtr _io(new RecordingIO);
    _io->QueueReply("SIZE 320");

    Dispatcher _dispatcher(BoundedSenderPtr(new BoundedSender(_io, 4, 1)));
    EXPECT_EQ(BOUNDED_DISPATCH, _dispatcher.Mode());
    EXPECT_THROW(_dispatcher.QuerySize(), ProtocolError);

    _io->FailNext(1);
    EXPECT_THROW(_dispatcher.QuerySize(), IoError);
}

TEST(DispatcherTest, ConnectsOverLoopback)
{
    TestServer _server(MakeVec2(7, 9));
    IoServicePtr _io_service(new boost::asio::io_service);

    DispatchConfig _config = DefaultDispatchConfig();
    _config.address = _server.Address();
    _config.connections = 3;

    DispatcherPtr _dispatcher = Dispatcher::Connect(_io_service, _config);
    EXPECT_EQ(3u, _dispatcher->ConnectionCount());
    EXPECT_EQ(MakeVec2(7, 9), _dispatcher->QuerySize());
    EXPECT_TRUE(_server.WaitForAccepted(4));
    _dispatcher->Finish();
}

TEST(DispatcherTest, RejectsMissingParts)
{
    EXPECT_THROW(Dispatcher(PooledSenderPtr(), CommandIOPtr(new RecordingIO)),
                 std::invalid_argument);
    EXPECT_THROW({ Dispatcher _dispatcher((BoundedSenderPtr())); }, std::invalid_argument);
}
