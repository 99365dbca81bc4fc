#pragma once

#include "message.hpp"
#include "transport.hpp"

#include <deque>
#include <memory>
#include <optional>
#include <utility>

namespace tessera::ipc
{

// One end of a message channel.  Both processes run a single-threaded
// loop that drains their port with poll(); nothing here blocks except
// SocketPort::poll when a partial frame is in flight.
class MessagePort
{
   public:
    virtual ~MessagePort() = default;

    virtual bool send(const Message& msg) = 0;

    // Next pending message, or nullopt if none is waiting.  A closed or
    // broken port also yields nullopt; check is_open().
    virtual std::optional<Message> poll() = 0;

    virtual bool is_open() const = 0;
    virtual void close()         = 0;
};

// MessagePort over a Unix-domain socket Connection.
class SocketPort : public MessagePort
{
   public:
    explicit SocketPort(std::unique_ptr<Connection> conn);

    bool                   send(const Message& msg) override;
    std::optional<Message> poll() override;
    bool                   is_open() const override;
    void                   close() override;

    int fd() const { return conn_ ? conn_->fd() : -1; }

   private:
    std::unique_ptr<Connection> conn_;
};

// In-process channel.  Messages are serialized and parsed on the way
// through so both ends see exactly what the socket would deliver.
class LoopbackPort : public MessagePort
{
   public:
    bool                   send(const Message& msg) override;
    std::optional<Message> poll() override;
    bool                   is_open() const override;
    void                   close() override;

    size_t pending() const;

    // Two connected ends.
    static std::pair<std::unique_ptr<LoopbackPort>, std::unique_ptr<LoopbackPort>> make_pair();

   private:
    struct Channel
    {
        std::deque<std::vector<uint8_t>> queue[2];
        bool                             closed = false;
    };

    LoopbackPort(std::shared_ptr<Channel> channel, int side);

    std::shared_ptr<Channel> channel_;
    int                      side_ = 0;
};

}   // namespace tessera::ipc
