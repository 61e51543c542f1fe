#pragma once

#include <utility>  // must precede boost/asio/awaitable.hpp (Boost 1.74 uses std::exchange without it)
#include <boost/asio/awaitable.hpp>
#include <core/model/message.h>
#include <functional>
#include <string>

namespace peerdrop::core {

// Ordered, reliable message transport between exactly two endpoints
class MessageChannel {
public:
    using MessageHandler = std::function<void(Message)>;
    using OpenHandler = std::function<void()>;
    using CloseHandler = std::function<void()>;
    using ErrorHandler = std::function<void(const std::string&)>;

    virtual ~MessageChannel() = default;

    virtual bool IsOpen() const = 0;

    // Completes once the transport accepted the message,
    // throws boost::system::system_error on transport failure
    virtual boost::asio::awaitable<void> Send(const Message& message) = 0;

    virtual void Close() = 0;

    void set_message_handler(MessageHandler handler) { on_message_ = std::move(handler); }
    void set_open_handler(OpenHandler handler) { on_open_ = std::move(handler); }
    void set_close_handler(CloseHandler handler) { on_close_ = std::move(handler); }
    void set_error_handler(ErrorHandler handler) { on_error_ = std::move(handler); }

    void ClearHandlers() {
        on_message_ = nullptr;
        on_open_ = nullptr;
        on_close_ = nullptr;
        on_error_ = nullptr;
    }

protected:
    void emitMessage(Message message) {
        if (on_message_) {
            on_message_(std::move(message));
        }
    }
    void emitOpen() {
        if (on_open_) {
            on_open_();
        }
    }
    void emitClose() {
        if (on_close_) {
            on_close_();
        }
    }
    void emitError(const std::string& detail) {
        if (on_error_) {
            on_error_(detail);
        }
    }

private:
    MessageHandler on_message_;
    OpenHandler on_open_;
    CloseHandler on_close_;
    ErrorHandler on_error_;
};

} // namespace peerdrop::core
