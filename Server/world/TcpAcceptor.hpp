#pragma once
#include "Session.hpp"
#include <asio.hpp>
#include <atomic>
#include <memory>

class TcpAcceptor
{
public:
    // Throws asio::system_error when the port cannot be bound.
    TcpAcceptor(asio::io_context& io, unsigned short port, Services& svc, size_t outq_limit);

    void stop();
    unsigned short port() const { return port_; }

private:
    void accept();

    asio::ip::tcp::acceptor acc_;
    Services& svc_;
    size_t outq_limit_;
    unsigned short port_;
    atomic<SessionId> next_id_{ 1 };
};
