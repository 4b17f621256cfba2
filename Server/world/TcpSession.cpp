#include "TcpSession.hpp"
#include "../common/common.hpp"
#include <istream>
#include <utility>

using asio::ip::tcp;
using namespace std;

TcpSession::TcpSession(tcp::socket s, SessionId id, Services& svc, size_t outq_limit)
	: sock(move(s))
	, strand_(asio::make_strand(sock.get_executor()))
	, id_(id)
	, svc_(svc)
	, limit_(outq_limit)
{
	error_code ec;
	auto ep = sock.remote_endpoint(ec);
	peer_ = ec ? "unknown" : ep.address().to_string() + ":" + to_string(ep.port());
}

void TcpSession::start()
{
	session_ = make_unique<Session>(id_, svc_, weak_from_this());
	asio::post(strand_, [this, self = shared_from_this()]
		{
			common::log("SESSION", "session " + to_string(id_) + " connected from " + peer_);
			session_->open();
			prompt();
			read_line();
		});
}

void TcpSession::read_line()
{
	auto self = shared_from_this();
	asio::async_read_until(sock, buf, '\n',
		asio::bind_executor(strand_, [this, self](error_code ec, size_t)
			{
				if (ec == asio::error::not_found)
				{
					// buffer full without a newline
					buf.consume(buf.size());
					if (!discarding_)
					{
						discarding_ = true;
						common::warn("SESSION", "session " + to_string(id_) + " sent an over-long line, dropped");
						if (!push_line("Line too long (limit " + to_string(MAX_LINE) + " bytes), ignored."))
						{
							on_close();
							return;
						}
					}
					read_line();
					return;
				}
				if (ec)
				{
					on_close();
					return;
				}
				istream is(&buf);
				string line;
				getline(is, line);
				if (discarding_)
				{
					discarding_ = false;
					prompt();
					read_line();
					return;
				}
				if (!line.empty() && line.back() == '\r')
					line.pop_back();

				if (handle(line))
					read_line();
			}));
}

// false once the session has asked to close
bool TcpSession::handle(const string& line)
{
	if (!session_->on_line(line))
	{
		close_after_flush();
		return false;
	}
	prompt();
	return !closed_;
}

void TcpSession::prompt()
{
	if (closed_)
		return;
	if (!queue("> "))
	{
		common::warn("SESSION", "session " + to_string(id_) + " output queue full, closing");
		on_close();
	}
}

bool TcpSession::push_line(string s)
{
	s.push_back('\n');
	return queue(move(s));
}

bool TcpSession::queue(string s)
{
	if (closed_)
		return false;
	if (++pending_ > limit_)
	{
		--pending_;
		return false;
	}

	asio::post(strand_, [this, self = shared_from_this(), s = move(s)]() mutable
		{
			if (closed_)
			{
				--pending_;
				return;
			}
			writeQueue.emplace_back(move(s));
			if (writeQueue.size() == 1)
				write_more();
		});
	return true;
}

void TcpSession::write_more()
{
	auto self = shared_from_this();
	asio::async_write(sock, asio::buffer(writeQueue.front()),
		asio::bind_executor(strand_, [this, self](error_code ec, size_t)
			{
				if (ec)
				{
					common::warn("SESSION", "write to session " + to_string(id_) + " failed: " + ec.message());
					on_close();
					return;
				}
				writeQueue.pop_front();
				--pending_;
				if (!writeQueue.empty())
					write_more();
				else if (closing_)
					on_close();
			}));
}

void TcpSession::close()
{
	asio::post(strand_, [this, self = shared_from_this()]
		{
			on_close();
		});
}

// Lines pushed while handling the last input are still posted to the strand;
// queue behind them so they reach writeQueue first.
void TcpSession::close_after_flush()
{
	asio::post(strand_, [this, self = shared_from_this()]
		{
			closing_ = true;
			if (writeQueue.empty())
				on_close();
		});
}

void TcpSession::on_close()
{
	if (closed_.exchange(true))
		return;

	error_code ignore;
	sock.shutdown(tcp::socket::shutdown_both, ignore);
	sock.close(ignore);
	pending_ -= writeQueue.size();
	writeQueue.clear();

	session_->on_disconnect();
	common::log("SESSION", "session " + to_string(id_) + " closed (" + peer_ + ")");
}
