#pragma once
#include "BroadcastRouter.hpp"
#include "Session.hpp"
#include <asio.hpp>
#include <atomic>
#include <deque>
#include <memory>
#include <string>

using namespace std;

// Line transport for one player. Reads, writes and teardown all run on the
// connection's strand; push_line and close may be called from any thread.
class TcpSession : public Outbox, public enable_shared_from_this<TcpSession>
{
public:
    using tcp = asio::ip::tcp;

    static constexpr size_t MAX_LINE = 4096;

    TcpSession(tcp::socket s, SessionId id, Services& svc, size_t outq_limit);
    void start();

    bool push_line(string s) override;
    void close() override;

private:
    void read_line();
    bool handle(const string& line);
    bool queue(string s);
    void prompt();
    void write_more();
    void close_after_flush();
    void on_close();

private:
    tcp::socket sock;
    asio::strand<asio::any_io_executor> strand_;
    asio::streambuf buf{ MAX_LINE };
    deque<string> writeQueue;

    SessionId id_;
    Services& svc_;
    unique_ptr<Session> session_;
    string peer_;

    size_t limit_;
    atomic<size_t> pending_{ 0 };
    atomic<bool> closed_{ false };
    bool closing_ = false;
    bool discarding_ = false; // inside an over-long line, drop up to its newline
};
