#include "port.hpp"

#include "codec.hpp"

namespace tessera::ipc
{

// ─── SocketPort ──────────────────────────────────────────────────────────────

SocketPort::SocketPort(std::unique_ptr<Connection> conn) : conn_(std::move(conn)) {}

bool SocketPort::send(const Message& msg)
{
    if (!conn_ || !conn_->is_open())
        return false;
    if (!conn_->send(msg))
    {
        conn_->close();
        return false;
    }
    return true;
}

std::optional<Message> SocketPort::poll()
{
    if (!conn_ || !conn_->is_open() || !conn_->wait_readable(0))
        return std::nullopt;

    auto msg = conn_->recv();
    if (!msg)
        conn_->close();   // EOF or framing error
    return msg;
}

bool SocketPort::is_open() const
{
    return conn_ && conn_->is_open();
}

void SocketPort::close()
{
    if (conn_)
        conn_->close();
}

// ─── LoopbackPort ────────────────────────────────────────────────────────────

LoopbackPort::LoopbackPort(std::shared_ptr<Channel> channel, int side)
    : channel_(std::move(channel)), side_(side)
{
}

std::pair<std::unique_ptr<LoopbackPort>, std::unique_ptr<LoopbackPort>> LoopbackPort::make_pair()
{
    auto channel = std::make_shared<Channel>();
    return {std::unique_ptr<LoopbackPort>(new LoopbackPort(channel, 0)),
            std::unique_ptr<LoopbackPort>(new LoopbackPort(channel, 1))};
}

bool LoopbackPort::send(const Message& msg)
{
    if (channel_->closed)
        return false;
    channel_->queue[1 - side_].push_back(encode_message(msg));
    return true;
}

std::optional<Message> LoopbackPort::poll()
{
    auto& inbox = channel_->queue[side_];
    if (inbox.empty())
        return std::nullopt;
    auto wire = std::move(inbox.front());
    inbox.pop_front();
    return decode_message(wire);
}

bool LoopbackPort::is_open() const
{
    return !channel_->closed;
}

void LoopbackPort::close()
{
    channel_->closed = true;
}

size_t LoopbackPort::pending() const
{
    return channel_->queue[side_].size();
}

}   // namespace tessera::ipc
