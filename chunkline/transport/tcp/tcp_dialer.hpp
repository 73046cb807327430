#pragma once
#include <chunkline/transport/dialer.hpp>
#include <chunkline/transport/transport.hpp>
#include <string>

#include <chunkline/transport/event_watcher/event_watcher.hpp>

using chunkline::io::EventWatcher;

// Non-blocking connect to "host:port".
class TcpDialer : public IDialer {
public:
    explicit TcpDialer(const std::string& address,
                       EventWatcher& ew);
    ~TcpDialer() override;

    void onConnected(F<void(std::unique_ptr<ITransport>)> cb) override { on_connected_ = std::move(cb); }
    void onFailure(F<void(int)> cb) override { on_failure_ = std::move(cb); }
    void dial() override;
    void cancel() override;

    [[nodiscard]] const std::string& address() const noexcept { return address_; }

private:
    void onWritable();
    void fail(int err);

    std::string address_;
    EventWatcher& ew_;
    int fd_ = -1;

    F<void(std::unique_ptr<ITransport>)> on_connected_ = [](auto) {};
    F<void(int)> on_failure_ = [](int) {};
};
