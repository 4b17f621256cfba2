#include "TcpAcceptor.hpp"
#include "TcpSession.hpp"
#include "../common/common.hpp"
#include <asio.hpp>

using asio::ip::tcp;
using namespace std;

TcpAcceptor::TcpAcceptor(asio::io_context& io, unsigned short port, Services& svc, size_t outq_limit)
    : acc_(io, tcp::endpoint(tcp::v4(), port)), svc_(svc), outq_limit_(outq_limit)
    , port_(acc_.local_endpoint().port())
{
    accept();
    common::log("SERVER", "listening on TCP " + to_string(port_));
}

void TcpAcceptor::stop()
{
    asio::post(acc_.get_executor(), [this]
        {
            error_code ignore;
            acc_.close(ignore);
        });
}

void TcpAcceptor::accept()
{
    acc_.async_accept([this](error_code ec, tcp::socket s)
        {
            if (ec == asio::error::operation_aborted)
                return;
            if (!ec)
                make_shared<TcpSession>(move(s), next_id_++, svc_, outq_limit_)->start();
            else
                common::warn("SERVER", "accept failed: " + ec.message());
            accept();
        });
}
